#include <exgroup/log/appender.h>
#include <exgroup/log/console_appender.h>
#include <exgroup/log/log.h>
#include <exgroup/log/log_system.h>
#include <exgroup/utils/os.h>

namespace exgroup {

log_system::log_system() : formatter_(std::make_unique<log_formatter>()) {
#if defined(_WIN32)
    os::open_virtual_terminal();
#endif
    auto ptr = std::make_shared<logger>("", std::make_shared<stdout_appender>());
    loggers_.emplace("", ptr);
    default_logger_.store(std::move(ptr), std::memory_order::relaxed);
}

log_system::~log_system() noexcept {
    // 退出前刷新所有 appender
    std::lock_guard lock(loggers_mutex_);
    for (const auto& [name, ptr] : loggers_) {
        ptr->flush();
    }
}

log_system& log_system::instance() {
    static log_system system;
    return system;
}

void log_system::register_logger(logger_ptr new_logger) {
    std::lock_guard lock(loggers_mutex_);
    insert_loggers(std::move(new_logger));
}

void log_system::initialize_logger(logger_ptr new_logger) {
    std::lock_guard lock(loggers_mutex_);
    new_logger->set_formatter(formatter_->clone());

    if (const auto it = log_levels_.find(new_logger->name()); it != log_levels_.end()) {
        new_logger->set_level(it->second);
    } else {
        new_logger->set_level(global_level_);
    }

    insert_loggers(std::move(new_logger));
}

logger_ptr log_system::find(const std::string& name) {
    std::lock_guard lock(loggers_mutex_);
    if (const auto it = loggers_.find(name); it != loggers_.end()) {
        return it->second;
    }
    return {};
}

void log_system::drop(const std::string& name) {
    {
        std::lock_guard lock(loggers_mutex_);
        loggers_.erase(name);
    }

    const auto current = default_logger_.load(std::memory_order::relaxed);
    if (current && current->name() == name) {
        default_logger_.store({}, std::memory_order::relaxed);
    }
}

void log_system::drop_all() {
    {
        std::lock_guard lock(loggers_mutex_);
        loggers_.clear();
    }
    default_logger_.store({}, std::memory_order::relaxed);
}

logger_ptr log_system::default_logger() const { return default_logger_.load(std::memory_order::relaxed); }

void log_system::set_default(logger_ptr new_default_logger) {
    const auto old = default_logger_.load(std::memory_order::relaxed);
    {
        std::lock_guard lock(loggers_mutex_);
        if (old) {
            loggers_.erase(old->name());
        }
        if (new_default_logger) {
            insert_loggers(new_default_logger);
        }
    }

    default_logger_.store(std::move(new_default_logger), std::memory_order::relaxed);
}

void log_system::set_level(log_level level) {
    std::lock_guard lock(loggers_mutex_);
    global_level_ = level;
    for (const auto& val : loggers_ | std::views::values) {
        val->set_level(level);
    }
}

void log_system::set_levels(log_levels levels, const log_level* global_level) {
    std::lock_guard lock(loggers_mutex_);

    log_levels_ = std::move(levels);
    if (global_level) {
        global_level_ = *global_level;
    }

    for (const auto& [name, ptr] : loggers_) {
        if (const auto it = log_levels_.find(name); it != log_levels_.end()) {
            ptr->set_level(it->second);
        } else if (global_level) {
            ptr->set_level(global_level_);
        }
    }
}

void log_system::set_formatter(std::unique_ptr<log_formatter> formatter) {
    std::lock_guard lock(loggers_mutex_);
    formatter_ = std::move(formatter);
    for (const auto& val : loggers_ | std::views::values) {
        val->set_formatter(formatter_->clone());
    }
}

void log_system::set_pattern(const std::string_view& pattern, log_time_type time_type) {
    set_formatter(std::make_unique<log_formatter>(pattern, time_type));
}

void log_system::flush() {
    std::lock_guard lock(loggers_mutex_);
    for (const auto& val : loggers_ | std::views::values) {
        val->flush();
    }
}

void log_system::insert_loggers(logger_ptr ptr) {
    const auto& name = ptr->name();
    if (const auto it = loggers_.find(name); it != loggers_.end()) {
        print_error("replace logger with name '{}'\n", name);
        it->second = std::move(ptr);
    } else {
        loggers_.emplace(name, std::move(ptr));
    }
}

}  // namespace exgroup
