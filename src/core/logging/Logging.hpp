#pragma once

#include "config.hpp"

namespace b2core {

/**
 * @brief Installs the process-wide default spdlog logger.
 *
 * Console sink always; a rotating file sink (5MB, 3 files) when `cfg.file` is set.
 * Library code only ever logs through the default logger, so an application that
 * never calls this keeps spdlog's stock console logger.
 *
 * @throws spdlog::spdlog_ex if the log file cannot be opened.
 */
void setup_logging(const LoggingConfig& cfg);

}  // namespace b2core
