#pragma once

#include "tabula/shell/shell_engine.hpp"

#include <string>

namespace tabula::tools {

// One JSON object per command, without a trailing newline (JSON Lines).
[[nodiscard]] std::string format_shell_command_log_json(const tabula::shell::CommandMetrics& metrics);

}  // namespace tabula::tools
