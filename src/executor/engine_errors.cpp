#include "tabula/executor/engine_errors.hpp"

namespace tabula::executor {

namespace {

class EngineErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "tabula.engine";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<EngineErrc>(condition)) {
        case EngineErrc::Success:
            return "success";
        case EngineErrc::TableNotFound:
            return "table not found";
        case EngineErrc::TableExists:
            return "table already exists";
        case EngineErrc::ColumnNotFound:
            return "column not found";
        case EngineErrc::ColumnCountMismatch:
            return "column count mismatch";
        case EngineErrc::MissingValue:
            return "missing value for not null column";
        case EngineErrc::TypeMismatch:
            return "type mismatch";
        case EngineErrc::ValueTooLong:
            return "value too long";
        case EngineErrc::DuplicateKey:
            return "duplicate primary key";
        case EngineErrc::ConditionParseError:
            return "invalid condition";
        case EngineErrc::InvalidDefinition:
            return "invalid table definition";
        case EngineErrc::SnapshotIoError:
            return "snapshot i/o error";
        case EngineErrc::SnapshotFormatError:
            return "malformed snapshot";
        default:
            return "unknown engine error";
        }
    }
};

const EngineErrorCategory kCategory{};

}  // namespace

const std::error_category& engine_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(EngineErrc value) noexcept
{
    return {static_cast<int>(value), engine_error_category()};
}

EngineStatus make_status(EngineErrc code, std::string message)
{
    EngineStatus status{};
    status.error = make_error_code(code);
    status.message = message.empty() ? status.error.message() : std::move(message);
    return status;
}

}  // namespace tabula::executor
