#pragma once
#include <exgroup/log/logger.h>

#include <cstdio>
#include <source_location>

/*
 * 日志库改自 https://github.com/gabime/spdlog
 */

namespace exgroup {

template <typename... Args>
void print_error(fmt::format_string<Args...> fmt, Args &&...args) {
    try {
        log_buf_t buf;
        fmt::vformat_to(fmt::appender(buf), fmt::string_view(fmt), fmt::make_format_args(args...));
        write_console({buf.data(), buf.size()}, stderr);
    } catch (const std::exception &e) {
        write_console(e.what(), stderr);
    }
}

// 读取 toml 格式的日志配置，失败时保留原来的 logger
EXGROUP_API bool load_log_config(const std::string &utf8_path);

EXGROUP_API void register_logger(logger_ptr new_logger);

EXGROUP_API void initialize_logger(logger_ptr new_logger);

EXGROUP_API logger_ptr find_logger(const std::string &name);

EXGROUP_API void drop_logger(const std::string &name);

EXGROUP_API void drop_all_loggers();

EXGROUP_API logger_ptr default_logger();

EXGROUP_API void set_default_logger(logger_ptr new_default_logger);

EXGROUP_API void set_log_level(log_level level);

EXGROUP_API void set_log_levels(log_levels levels, const log_level *global_level = nullptr);

EXGROUP_API void set_log_formatter(std::unique_ptr<log_formatter> formatter);

EXGROUP_API void set_log_pattern(const std::string_view &pattern, log_time_type time_type = log_time_type::local);

EXGROUP_API void log_flush();

namespace detail {

template <typename... Args>
void log_default(const std::source_location &source, log_level level, const fmt::format_string<Args...> &fmt,
                 Args &&...args) {
    if (const auto ptr = default_logger()) {
        ptr->log(source, level, fmt, std::forward<Args>(args)...);
    }
}

}  // namespace detail

template <typename... Args>
struct log {
    log(log_level level, const fmt::format_string<Args...> &fmt, Args &&...args,
        const std::source_location &source = std::source_location::current()) {
        detail::log_default(source, level, fmt, std::forward<Args>(args)...);
    }

    log(const logger_ptr &ptr, log_level level, const fmt::format_string<Args...> &fmt, Args &&...args,
        const std::source_location &source = std::source_location::current()) {
        ptr->log(source, level, fmt, std::forward<Args>(args)...);
    }
};

template <typename... Args>
log(log_level level, const fmt::format_string<Args...> &fmt, Args &&...args) -> log<Args...>;

template <typename... Args>
log(const logger_ptr &ptr, log_level level, const fmt::format_string<Args...> &fmt, Args &&...args) -> log<Args...>;

// exgroup::error("...") exgroup::warn(ptr, "...") 等，自动带上调用位置
#define EXGROUP_LOG_FACADE(name, level)                                                                 \
    template <typename... Args>                                                                         \
    struct name {                                                                                       \
        explicit name(const fmt::format_string<Args...> &fmt, Args &&...args,                           \
                      const std::source_location &source = std::source_location::current()) {          \
            detail::log_default(source, level, fmt, std::forward<Args>(args)...);                       \
        }                                                                                               \
                                                                                                        \
        name(const logger_ptr &ptr, const fmt::format_string<Args...> &fmt, Args &&...args,             \
             const std::source_location &source = std::source_location::current()) {                   \
            ptr->log(source, level, fmt, std::forward<Args>(args)...);                                  \
        }                                                                                               \
    };                                                                                                  \
                                                                                                        \
    template <typename... Args>                                                                         \
    name(const fmt::format_string<Args...> &fmt, Args &&...args) -> name<Args...>;                      \
                                                                                                        \
    template <typename... Args>                                                                         \
    name(const logger_ptr &ptr, const fmt::format_string<Args...> &fmt, Args &&...args) -> name<Args...>;

EXGROUP_LOG_FACADE(critical, log_level::critical)
EXGROUP_LOG_FACADE(error, log_level::error)
EXGROUP_LOG_FACADE(warn, log_level::warn)
EXGROUP_LOG_FACADE(info, log_level::info)
EXGROUP_LOG_FACADE(debug, log_level::debug)
EXGROUP_LOG_FACADE(trace, log_level::trace)

#undef EXGROUP_LOG_FACADE

}  // namespace exgroup
