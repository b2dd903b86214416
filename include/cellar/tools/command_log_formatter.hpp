#pragma once

#include "cellar/shell/shell_engine.hpp"

#include <string>

namespace cellar::tools {

[[nodiscard]] std::string format_command_log_json(const cellar::shell::CommandMetrics& metrics);

}  // namespace cellar::tools
