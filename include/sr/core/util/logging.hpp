// File: include/sr/core/util/logging.hpp
#pragma once

#include "sr/core/config.hpp"
#include "sr/core/status.hpp"

namespace sr {

// Installs the process-wide spdlog default logger:
//   - colored console sink (always)
//   - plain file sink when cfg.file is set (appends)
// Unknown levels are rejected rather than silently mapped to "info".
Status init_logging(const LoggingConfig& cfg);

}  // namespace sr
