#pragma once
#include <exgroup/log/logger.h>

#include <atomic>
#include <mutex>
#include <unordered_map>

namespace exgroup {

// 进程内所有 logger 的注册表，写日志在调用线程同步完成
class log_system {
  protected:
    log_system();

  public:
    EXGROUP_NON_COPYABLE(log_system)

    EXGROUP_API ~log_system() noexcept;

    EXGROUP_API static log_system& instance();

    EXGROUP_API void register_logger(logger_ptr new_logger);

    EXGROUP_API void initialize_logger(logger_ptr new_logger);

    EXGROUP_API logger_ptr find(const std::string& name);

    EXGROUP_API void drop(const std::string& name);

    EXGROUP_API void drop_all();

    EXGROUP_API logger_ptr default_logger() const;

    EXGROUP_API void set_default(logger_ptr new_default_logger);

    EXGROUP_API void set_level(log_level level);

    EXGROUP_API void set_levels(log_levels levels, const log_level* global_level = nullptr);

    EXGROUP_API void set_formatter(std::unique_ptr<log_formatter> formatter);

    EXGROUP_API void set_pattern(const std::string_view& pattern, log_time_type time_type = log_time_type::local);

    EXGROUP_API void flush();

  private:
    void insert_loggers(logger_ptr ptr);

    std::mutex loggers_mutex_;
    std::unordered_map<std::string, logger_ptr> loggers_;
    log_levels log_levels_;
    std::unique_ptr<log_formatter> formatter_;
    log_level global_level_{log_level::trace};
    std::atomic<logger_ptr> default_logger_;
};

}  // namespace exgroup
