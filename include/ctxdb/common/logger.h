#ifndef CTXDB_COMMON_LOGGER_H_
#define CTXDB_COMMON_LOGGER_H_

#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace ctxdb {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    // Maps "trace", "debug", "info", "warn", "error", "critical", "off"
    static std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name);
};

} // namespace common
} // namespace ctxdb

// Macros for convenient logging
#define CTXDB_TRACE(...) spdlog::trace(__VA_ARGS__)
#define CTXDB_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define CTXDB_INFO(...)  spdlog::info(__VA_ARGS__)
#define CTXDB_WARN(...)  spdlog::warn(__VA_ARGS__)
#define CTXDB_ERROR(...) spdlog::error(__VA_ARGS__)
#define CTXDB_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // CTXDB_COMMON_LOGGER_H_
