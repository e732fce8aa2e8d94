#ifndef NETCONN_LOG_HPP
#define NETCONN_LOG_HPP

#include <memory>

#include <spdlog/spdlog.h>

#ifndef NETCONN_LOGGER_NAME
#define NETCONN_LOGGER_NAME "netconn"
#endif

namespace netconn::log {

// Logger used by the library. Created on first use as a colored stdout
// logger named NETCONN_LOGGER_NAME unless one was installed with SetLogger.
std::shared_ptr<spdlog::logger> Logger();

// Replace the library logger. Passing nullptr reverts to the default.
void SetLogger(std::shared_ptr<spdlog::logger> logger);

// Adjust the level of the current logger
void SetLevel(spdlog::level::level_enum level);

}  // namespace netconn::log

#define NETCONN_LOG_TRACE(...) ::netconn::log::Logger()->trace(__VA_ARGS__)
#define NETCONN_LOG_DEBUG(...) ::netconn::log::Logger()->debug(__VA_ARGS__)
#define NETCONN_LOG_INFO(...) ::netconn::log::Logger()->info(__VA_ARGS__)
#define NETCONN_LOG_WARN(...) ::netconn::log::Logger()->warn(__VA_ARGS__)
#define NETCONN_LOG_ERROR(...) ::netconn::log::Logger()->error(__VA_ARGS__)

#endif  // NETCONN_LOG_HPP
