#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tabula::executor {

[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

// A cell is NULL when, after trimming, it is empty or spells "null" in any case.
[[nodiscard]] bool is_null_cell(std::string_view cell) noexcept;

// Strict 32-bit signed parse of the whole text; an optional leading sign is allowed.
[[nodiscard]] std::optional<std::int32_t> parse_int32(std::string_view text) noexcept;

// Ordering value used by '<', '>' and Int sort keys; unparsable text orders as 0.
[[nodiscard]] std::int32_t int32_or_zero(std::string_view text) noexcept;

[[nodiscard]] bool is_quoted(std::string_view text) noexcept;

// Removes one pair of matching ' or " delimiters and collapses doubled quotes.
[[nodiscard]] std::string unquote(std::string_view text);

// Canonical stored form of a caller-supplied literal: trimmed, an unquoted NULL
// becomes the empty sentinel, quoted text loses its quotes.
[[nodiscard]] std::string normalize_cell(std::string_view literal);

}  // namespace tabula::executor
