#include "tabula/shell/command_history.hpp"

#include "tabula/catalog/catalog_schema.hpp"
#include "tabula/executor/cell_format.hpp"

#include <charconv>

namespace tabula::shell {

namespace {

std::optional<std::size_t> parse_recall_index(std::string_view digits)
{
    if (digits.empty()) {
        return std::nullopt;
    }
    std::size_t value = 0U;
    const auto* first = digits.data();
    const auto* last = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::string_view without_terminator(std::string_view command) noexcept
{
    if (!command.empty() && command.back() == ';') {
        command.remove_suffix(1U);
    }
    return executor::trim(command);
}

}  // namespace

CommandHistory::CommandHistory(std::size_t max_size)
    : max_size_{max_size == 0U ? 1U : max_size}
{
}

bool CommandHistory::is_recall_command(std::string_view command)
{
    const auto trimmed = executor::trim(command);
    if (trimmed == "!!") {
        return true;
    }
    return trimmed.size() > 1U && trimmed.front() == '!' && parse_recall_index(trimmed.substr(1U)).has_value();
}

void CommandHistory::add(std::string_view command)
{
    const auto trimmed = executor::trim(command);
    if (trimmed.empty()) {
        return;
    }
    if (catalog::iequals(trimmed, "history") || catalog::iequals(trimmed, "history;") || is_recall_command(trimmed)) {
        return;
    }

    std::string stored{trimmed};
    if (stored.back() != ';' && !catalog::iequals(stored, "exit")) {
        stored.push_back(';');
    }

    if (!commands_.empty() && without_terminator(commands_.back()) == without_terminator(stored)) {
        reset_cursor();
        return;
    }

    if (commands_.size() >= max_size_) {
        commands_.pop_front();
    }
    commands_.push_back(std::move(stored));
    reset_cursor();
}

std::optional<std::string> CommandHistory::resolve_recall(std::string_view command) const
{
    const auto trimmed = executor::trim(command);
    if (trimmed == "!!") {
        if (commands_.empty()) {
            return std::nullopt;
        }
        return commands_.back();
    }
    if (trimmed.size() < 2U || trimmed.front() != '!') {
        return std::nullopt;
    }
    const auto index = parse_recall_index(trimmed.substr(1U));
    if (!index || *index == 0U) {
        return std::nullopt;
    }
    return command_at(*index - 1U);
}

std::optional<std::string> CommandHistory::command_at(std::size_t index) const
{
    if (index >= commands_.size()) {
        return std::nullopt;
    }
    return commands_[index];
}

std::optional<std::string> CommandHistory::previous()
{
    if (cursor_ == 0U) {
        return std::nullopt;
    }
    --cursor_;
    return commands_[cursor_];
}

std::optional<std::string> CommandHistory::next()
{
    if (cursor_ + 1U >= commands_.size()) {
        cursor_ = commands_.size();
        return std::nullopt;
    }
    ++cursor_;
    return commands_[cursor_];
}

void CommandHistory::reset_cursor() noexcept
{
    cursor_ = commands_.size();
}

void CommandHistory::clear() noexcept
{
    commands_.clear();
    cursor_ = 0U;
}

}  // namespace tabula::shell
