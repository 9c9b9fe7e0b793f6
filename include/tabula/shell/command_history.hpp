#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace tabula::shell {

// Bounded list of executed commands with "!!" / "!N" recall and a browse
// cursor. Stored commands always end with ';' (except "exit").
class CommandHistory final {
public:
    static constexpr std::size_t kDefaultCapacity = 100U;

    explicit CommandHistory(std::size_t max_size = kDefaultCapacity);

    // Ignores blank input, "history" and recall commands. A command equal to
    // the newest entry (ignoring a trailing ';') is not stored twice. The oldest
    // entry is evicted when the history is full.
    void add(std::string_view command);

    [[nodiscard]] static bool is_recall_command(std::string_view command);

    // "!!" yields the newest entry, "!N" the N-th entry counting from 1.
    [[nodiscard]] std::optional<std::string> resolve_recall(std::string_view command) const;

    // Zero-based lookup of a complete, executable command.
    [[nodiscard]] std::optional<std::string> command_at(std::size_t index) const;

    // The cursor rests on the entry last returned. Stepping past the newest
    // entry leaves it one past the end, where previous() starts again.
    [[nodiscard]] std::optional<std::string> previous();
    [[nodiscard]] std::optional<std::string> next();
    void reset_cursor() noexcept;

    void clear() noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return commands_.size(); }
    [[nodiscard]] bool empty() const noexcept { return commands_.empty(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return max_size_; }
    [[nodiscard]] const std::deque<std::string>& entries() const noexcept { return commands_; }

private:
    std::deque<std::string> commands_{};
    std::size_t max_size_ = kDefaultCapacity;
    std::size_t cursor_ = 0U;
};

}  // namespace tabula::shell
