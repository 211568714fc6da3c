#include <exgroup/log/types.h>

#include <array>

namespace exgroup {

using namespace std::string_view_literals;

static constexpr std::array level_names{"off"sv, "critical"sv, "error"sv, "warn"sv, "info"sv, "debug"sv, "trace"sv};

static constexpr std::array level_short_names{"O"sv, "C"sv, "E"sv, "W"sv, "I"sv, "D"sv, "T"sv};

std::string_view to_string_view(log_level level) noexcept {
    const auto index = static_cast<size_t>(level);
    return index < level_names.size() ? level_names[index] : ""sv;
}

std::string_view to_string_view_short(log_level level) noexcept {
    const auto index = static_cast<size_t>(level);
    return index < level_short_names.size() ? level_short_names[index] : ""sv;
}

log_level log_level_from_string_view(const std::string_view& strv) noexcept {
    if (strv.empty()) {
        return log_level::trace;
    }

    // 只判断第一个字符
    switch (strv[0]) {
        case 'o':
        case 'O':
            return log_level::off;

        case 'c':
        case 'C':
            return log_level::critical;

        case 'e':
        case 'E':
            return log_level::error;

        case 'w':
        case 'W':
            return log_level::warn;

        case 'i':
        case 'I':
            return log_level::info;

        case 'd':
        case 'D':
            return log_level::debug;

        default:
            return log_level::trace;
    }
}

log_time_type log_time_from_string_view(const std::string_view& strv) noexcept {
    if (!strv.empty() && (strv[0] == 'u' || strv[0] == 'U')) {
        return log_time_type::utc;
    }

    return log_time_type::local;
}

}  // namespace exgroup
