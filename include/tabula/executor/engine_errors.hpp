#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace tabula::executor {

enum class EngineErrc {
    Success = 0,
    TableNotFound,
    TableExists,
    ColumnNotFound,
    ColumnCountMismatch,
    MissingValue,
    TypeMismatch,
    ValueTooLong,
    DuplicateKey,
    ConditionParseError,
    InvalidDefinition,
    SnapshotIoError,
    SnapshotFormatError
};

const std::error_category& engine_error_category() noexcept;
std::error_code make_error_code(EngineErrc value) noexcept;

// Error code plus the user-facing message naming the offending table, column
// or value. A default-constructed status means success.
struct EngineStatus final {
    std::error_code error{};
    std::string message{};

    [[nodiscard]] bool ok() const noexcept { return !error; }
    explicit operator bool() const noexcept { return ok(); }
};

[[nodiscard]] EngineStatus make_status(EngineErrc code, std::string message);

template <typename T>
struct EngineResult final {
    std::optional<T> value{};
    EngineStatus status{};

    [[nodiscard]] bool success() const noexcept { return value.has_value() && status.ok(); }

    static EngineResult ok(T result)
    {
        EngineResult outcome{};
        outcome.value = std::move(result);
        return outcome;
    }

    static EngineResult failure(EngineStatus failure_status)
    {
        EngineResult outcome{};
        outcome.status = std::move(failure_status);
        return outcome;
    }
};

// Result of a statement that touches rows. On failure rows_affected still
// reports the rows applied before the failing one.
struct MutationResult final {
    std::size_t rows_affected = 0U;
    EngineStatus status{};

    [[nodiscard]] bool success() const noexcept { return status.ok(); }
};

}  // namespace tabula::executor

namespace std {

template <>
struct is_error_code_enum<tabula::executor::EngineErrc> : true_type {
};

}  // namespace std
