#pragma once
/*
 * Log
 *
 * Purpose: install the default spdlog logger for the form.
 * Note: the form owns the terminal, so records go to the file named by TTYFORM_LOG
 *       and are dropped when it is unset. Level from TTYFORM_LOG_LEVEL.
 */
#include <string>
#include <spdlog/spdlog.h>

spdlog::level::level_enum parse_log_level(const std::string& name);
// Falls back to dropping records and returns false when the log file cannot be opened.
bool init_logging(std::string& msg);
