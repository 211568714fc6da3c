#include <exgroup/log/console_appender.h>
#include <exgroup/log/log.h>
#include <exgroup/log/log_system.h>

#include <cerrno>
#include <exgroup/utils/toml_types.hpp>
#include <filesystem>
#include <fstream>

namespace exgroup {

// pattern = ["%v", "utc"]
static bool read_pattern_and_time_type(std::string& pattern, log_time_type& time_type, const toml_table_t& table) {
    const auto it = table.find("pattern");
    if (it == table.end() || !it->second.is_array()) {
        return false;
    }

    const auto& arr = it->second.as_array();
    if (arr.empty() || !arr.front().is_string()) {
        return false;
    }

    std::string temp = arr.front().as_string();
    if (temp.empty()) {
        return false;
    }

    pattern = std::move(temp);
    if (arr.size() > 1 && arr[1].is_string()) {
        const std::string tp = arr[1].as_string();
        time_type = log_time_from_string_view(tp);
    }

    return true;
}

static bool read_table_value(std::string& value, const std::string& key, const toml_table_t& table) {
    const auto it = table.find(key);
    if (it == table.end() || !it->second.is_string()) {
        return false;
    }

    value = it->second.as_string();
    return true;
}

struct logger_settings {
    std::string pattern;
    log_time_type time_type{log_time_type::local};
    log_level level{log_level::trace};
};

static void read_level(log_level& level, const toml_table_t& table) {
    std::string temp;
    if (read_table_value(temp, "level", table) && !temp.empty()) {
        level = log_level_from_string_view(temp);
    }
}

static log_appender_ptr create_appender_custom(const logger_settings& logger_config, const toml_table_t& table) {
    logger_settings custom_config = logger_config;
    read_pattern_and_time_type(custom_config.pattern, custom_config.time_type, table);
    read_level(custom_config.level, table);

    std::string type;
    if (!read_table_value(type, "type", table)) {
        return {};
    }

    log_appender_ptr appender;
    if (type == "stdout") {
        appender = std::make_shared<stdout_appender>();
    } else if (type == "stderr") {
        appender = std::make_shared<stderr_appender>();
    } else {
        print_error("load_log_config unknown appender type '{}'\n", type);
        return {};
    }

    if (!custom_config.pattern.empty()) {
        appender->set_pattern(custom_config.pattern, custom_config.time_type);
    }
    appender->set_level(custom_config.level);

    return appender;
}

static logger_ptr create_logger_custom(const logger_settings& global, const std::string& name, const toml_table_t& table) {
    logger_settings custom_config = global;
    read_pattern_and_time_type(custom_config.pattern, custom_config.time_type, table);
    read_level(custom_config.level, table);

    const auto it = table.find("appenders");
    if (it == table.end() || !it->second.is_array()) {
        return {};
    }

    std::vector<log_appender_ptr> appenders;
    for (const auto& val : it->second.as_array()) {
        if (!val.is_table()) {
            continue;
        }

        if (auto appender = create_appender_custom(custom_config, val.as_table())) {
            appenders.emplace_back(std::move(appender));
        }
    }

    if (appenders.empty()) {
        return {};
    }

    auto ptr = std::make_shared<logger>(name, appenders);
    ptr->set_level(custom_config.level);

    return ptr;
}

bool load_log_config(const std::string& utf8_path) {
    try {
        const std::filesystem::path path(reinterpret_cast<const char8_t*>(utf8_path.c_str()));
        std::ifstream ifs(path, std::ios_base::binary | std::ios_base::in);
        if (!ifs.is_open()) {
            print_error("load_log_config open config {} fail,{}\n", utf8_path, std::generic_category().message(errno));
            return false;
        }

        const auto config = toml::parse(ifs, utf8_path);
        const auto& root = config.as_table();

        auto& system = log_system::instance();
        system.drop_all();

        // 读取 全局 配置
        logger_settings global;
        read_pattern_and_time_type(global.pattern, global.time_type, root);
        if (!global.pattern.empty()) {
            system.set_pattern(global.pattern, global.time_type);
        }
        read_level(global.level, root);
        system.set_levels({}, &global.level);

        std::string default_log;
        read_table_value(default_log, "default", root);

        // 读取自定义logger配置
        for (const auto& [key, value] : root) {
            if (!value.is_table()) {
                continue;
            }

            auto custom = create_logger_custom(global, key, value.as_table());
            if (!custom) {
                continue;
            }

            if (key == default_log) {
                system.set_default(std::move(custom));
            } else {
                system.register_logger(std::move(custom));
            }
        }

        if (!system.default_logger()) {
            auto fallback = std::make_shared<logger>("", std::make_shared<stdout_appender>());
            if (!global.pattern.empty()) {
                fallback->set_pattern(global.pattern, global.time_type);
            }
            fallback->set_level(global.level);
            system.set_default(std::move(fallback));
        }
        return true;
    } catch (const std::exception& exception) {
        print_error("load_log_config {} fail,\n{}\n", utf8_path, exception.what());
        return false;
    }
}

void register_logger(logger_ptr new_logger) { return log_system::instance().register_logger(std::move(new_logger)); }

void initialize_logger(logger_ptr new_logger) { return log_system::instance().initialize_logger(std::move(new_logger)); }

logger_ptr find_logger(const std::string& name) { return log_system::instance().find(name); }

void drop_logger(const std::string& name) { return log_system::instance().drop(name); }

void drop_all_loggers() { return log_system::instance().drop_all(); }

logger_ptr default_logger() { return log_system::instance().default_logger(); }

void set_default_logger(logger_ptr new_default_logger) {
    return log_system::instance().set_default(std::move(new_default_logger));
}

void set_log_level(log_level level) { return log_system::instance().set_level(level); }

void set_log_levels(log_levels levels, const log_level* global_level) {
    return log_system::instance().set_levels(std::move(levels), global_level);
}

void set_log_formatter(std::unique_ptr<log_formatter> formatter) {
    return log_system::instance().set_formatter(std::move(formatter));
}

void set_log_pattern(const std::string_view& pattern, log_time_type time_type) {
    return log_system::instance().set_pattern(pattern, time_type);
}

void log_flush() { return log_system::instance().flush(); }

}  // namespace exgroup
