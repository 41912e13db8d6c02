#include "log.hpp"
#include <cstdlib>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include "config.hpp"

spdlog::level::level_enum parse_log_level(const std::string& name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "warn")  return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "off")   return spdlog::level::off;
  return spdlog::level::info;
}

bool init_logging(std::string& msg) {
  const char* path = std::getenv(TF_LOG_FILE_ENV);
  const char* level = std::getenv(TF_LOG_LEVEL_ENV);

  std::shared_ptr<spdlog::logger> logger;
  if (path && *path) {
    try {
      auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
      logger = std::make_shared<spdlog::logger>("ttyform", sink);
    } catch (const spdlog::spdlog_ex& e) {
      msg = std::string("cannot open log file: ") + e.what();
    }
  }
  if (!logger) logger = std::make_shared<spdlog::logger>("ttyform", std::make_shared<spdlog::sinks::null_sink_mt>());

  spdlog::set_default_logger(logger);
  spdlog::set_level(parse_log_level(level ? level : TF_DEFAULT_LOG_LEVEL));
  spdlog::flush_on(spdlog::level::warn);
  return msg.empty();
}
