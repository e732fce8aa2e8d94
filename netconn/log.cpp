#include "netconn/log.hpp"

#include <mutex>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace netconn::log {

namespace {

std::mutex& StorageMutex() {
  static std::mutex mtx;
  return mtx;
}

std::shared_ptr<spdlog::logger>& Storage() {
  static std::shared_ptr<spdlog::logger> storage;
  return storage;
}

}  // namespace

std::shared_ptr<spdlog::logger> Logger() {
  std::lock_guard<std::mutex> lock(StorageMutex());
  auto& storage = Storage();
  if (!storage) {
    if (auto named = spdlog::get(NETCONN_LOGGER_NAME)) {
      storage = std::move(named);
    } else {
      auto created = spdlog::stdout_color_mt(NETCONN_LOGGER_NAME);
      created->set_level(spdlog::level::info);
      created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
      storage = std::move(created);
    }
  }
  return storage;
}

void SetLogger(std::shared_ptr<spdlog::logger> logger) {
  std::lock_guard<std::mutex> lock(StorageMutex());
  Storage() = std::move(logger);
}

void SetLevel(spdlog::level::level_enum level) { Logger()->set_level(level); }

}  // namespace netconn::log
