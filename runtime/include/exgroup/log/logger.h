#pragma once
#include <exgroup/config.h>
#include <exgroup/log/formatter.h>
#include <exgroup/log/types.h>

#include <cstdio>
#include <exception>
#include <ranges>
#include <source_location>
#include <string>
#include <vector>

namespace exgroup {

EXGROUP_API void write_console(const std::string_view &strv, FILE *file);

class logger {
  public:
    // Logger with range on appenders
    template <std::ranges::range Range>
    logger(const std::string_view &name, const Range &range)
        : name_(name), appenders_(std::ranges::begin(range), std::ranges::end(range)) {}

    // Logger with single appender
    EXGROUP_API logger(const std::string_view &name, log_appender_ptr appender);

    EXGROUP_NON_COPYABLE(logger)

    ~logger() noexcept = default;

    EXGROUP_API void set_level(log_level level);

    [[nodiscard]] log_level level() const { return level_.load(std::memory_order::relaxed); }

    [[nodiscard]] EXGROUP_API bool should_log(log_level level) const;

    [[nodiscard]] const std::string &name() const { return name_; }

    [[nodiscard]] const std::vector<log_appender_ptr> &appenders() const { return appenders_; }

    EXGROUP_API void set_formatter(std::unique_ptr<log_formatter> formatter);

    EXGROUP_API void set_pattern(const std::string_view &pattern, log_time_type time_type = log_time_type::local);

    EXGROUP_API void flush() const;

    EXGROUP_API void log(const std::source_location &source, log_level level, const log_buf_t &buf) const;

    template <typename... Args>
    void log(const std::source_location &source, log_level level, const fmt::format_string<Args...> &fmt,
             Args &&...args) const {
        if (!should_log(level)) return;

        try {
            log_buf_t buf;
            fmt::vformat_to(fmt::appender(buf), fmt::string_view(fmt), fmt::make_format_args(args...));
            log(source, level, buf);
        } catch (const std::exception &e) {
            // 日志失败不能影响调用方
            write_console(e.what(), stderr);
            write_console("\n", stderr);
        }
    }

    template <typename... Args>
    void error(const std::source_location &source, const fmt::format_string<Args...> &fmt, Args &&...args) const {
        return log(source, log_level::error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(const std::source_location &source, const fmt::format_string<Args...> &fmt, Args &&...args) const {
        return log(source, log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(const std::source_location &source, const fmt::format_string<Args...> &fmt, Args &&...args) const {
        return log(source, log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(const std::source_location &source, const fmt::format_string<Args...> &fmt, Args &&...args) const {
        return log(source, log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void trace(const std::source_location &source, const fmt::format_string<Args...> &fmt, Args &&...args) const {
        return log(source, log_level::trace, fmt, std::forward<Args>(args)...);
    }

  private:
    std::string name_;
    atomic_log_level level_{log_level::trace};
    std::vector<log_appender_ptr> appenders_;
};

}  // namespace exgroup
