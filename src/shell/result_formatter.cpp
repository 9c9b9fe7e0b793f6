#include "tabula/shell/result_formatter.hpp"

#include "tabula/executor/cell_format.hpp"

#include <algorithm>
#include <string_view>

namespace tabula::shell {

std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                      const std::vector<std::vector<std::string>>& rows)
{
    const std::size_t column_count = headers.size();
    std::vector<std::size_t> widths(column_count, 0U);
    for (std::size_t i = 0U; i < column_count; ++i) {
        widths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0U; i < column_count && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], executor::trim(row[i]).size());
        }
    }
    for (auto& width : widths) {
        width = std::max(width, kMinimumColumnWidth);
    }

    auto make_line = [&](const std::vector<std::string>& fields, bool trim_fields) {
        std::string line{"|"};
        for (std::size_t i = 0U; i < column_count; ++i) {
            std::string_view field = i < fields.size() ? std::string_view{fields[i]} : std::string_view{};
            if (trim_fields) {
                field = executor::trim(field);
            }
            line.push_back(' ');
            line.append(field);
            if (field.size() < widths[i]) {
                line.append(widths[i] - field.size(), ' ');
            }
            line.append(" |");
        }
        return line;
    };

    std::vector<std::string> lines;
    lines.reserve(rows.size() + 2U);
    lines.push_back(make_line(headers, false));

    std::string separator{"|"};
    for (std::size_t i = 0U; i < column_count; ++i) {
        separator.push_back(' ');
        separator.append(widths[i], '-');
        separator.append(" |");
    }
    lines.push_back(std::move(separator));

    for (const auto& row : rows) {
        lines.push_back(make_line(row, true));
    }

    return lines;
}

std::string join_lines(const std::vector<std::string>& lines)
{
    std::string joined;
    for (std::size_t i = 0U; i < lines.size(); ++i) {
        if (i > 0U) {
            joined.push_back('\n');
        }
        joined.append(lines[i]);
    }
    return joined;
}

}  // namespace tabula::shell
