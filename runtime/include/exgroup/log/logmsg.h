#pragma once
#include <exgroup/log/types.h>

#include <source_location>

namespace exgroup {

struct log_message {  // NOLINT(cppcoreguidelines-pro-type-member-init)
    const logger* ptr{nullptr};
    log_level level{log_level::off};
    log_clock_point point;
    int32_t tid;
    std::source_location source;
    std::string_view payload;

    // 颜色范围，由 %^ %$ 在格式化时写入
    mutable size_t color_start{0};
    mutable size_t color_stop{0};
};

}  // namespace exgroup
