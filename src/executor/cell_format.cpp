#include "tabula/executor/cell_format.hpp"

#include "tabula/catalog/catalog_schema.hpp"

#include <cctype>
#include <charconv>

namespace tabula::executor {

std::string_view trim(std::string_view text) noexcept
{
    std::size_t begin = 0U;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool is_null_cell(std::string_view cell) noexcept
{
    const auto trimmed = trim(cell);
    return trimmed.empty() || catalog::iequals(trimmed, "null");
}

std::optional<std::int32_t> parse_int32(std::string_view text) noexcept
{
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1U);
        if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
            return std::nullopt;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }

    std::int32_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::int32_t int32_or_zero(std::string_view text) noexcept
{
    return parse_int32(trim(text)).value_or(0);
}

bool is_quoted(std::string_view text) noexcept
{
    if (text.size() < 2U) {
        return false;
    }
    const char front = text.front();
    return (front == '\'' || front == '"') && text.back() == front;
}

std::string unquote(std::string_view text)
{
    if (!is_quoted(text)) {
        return std::string{text};
    }

    const char delimiter = text.front();
    const auto body = text.substr(1U, text.size() - 2U);
    std::string result;
    result.reserve(body.size());
    for (std::size_t index = 0U; index < body.size(); ++index) {
        const char ch = body[index];
        if (ch == delimiter && index + 1U < body.size() && body[index + 1U] == delimiter) {
            ++index;
        }
        result.push_back(ch);
    }
    return result;
}

std::string normalize_cell(std::string_view literal)
{
    const auto trimmed = trim(literal);
    if (is_quoted(trimmed)) {
        return unquote(trimmed);
    }
    if (catalog::iequals(trimmed, "null")) {
        return {};
    }
    return std::string{trimmed};
}

}  // namespace tabula::executor
