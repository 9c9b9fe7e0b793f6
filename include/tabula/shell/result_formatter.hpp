#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tabula::shell {

inline constexpr std::size_t kMinimumColumnWidth = 3U;

// Renders a pipe table:
//   | id  | name  |
//   | --- | ----- |
//   | 1   | Alice |
// Column width is the longest of the header and the trimmed cells, never less
// than kMinimumColumnWidth. Cells are trimmed and left aligned.
[[nodiscard]] std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                                    const std::vector<std::vector<std::string>>& rows);

[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines);

}  // namespace tabula::shell
