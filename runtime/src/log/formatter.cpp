#include <exgroup/log/formatter.h>
#include <fmt/chrono.h>

#include <algorithm>
#include <cctype>
#include <exgroup/log/default_flags.hpp>

namespace exgroup {

constexpr std::string_view default_eol = "\n";

log_formatter::log_formatter() : log_formatter(log_time_type::local) {}

log_formatter::log_formatter(log_time_type tp) : time_type_(tp), need_localtime_(true) {
    formatters_.emplace_back(std::make_unique<default_flag>());
}

log_formatter::log_formatter(const std::string_view& pattern) : log_formatter(pattern, log_time_type::local) {}

log_formatter::log_formatter(const std::string_view& pattern, log_time_type tp) : time_type_(tp), need_localtime_(false) {
    set_pattern(pattern);
}

// "%-8l" "%=10n" "%5!v"
static log_padding handle_padding(std::string_view::const_iterator& it, const std::string_view::const_iterator& end) {
    if (it == end) {
        return {};
    }

    log_padding::pad_side side = log_padding::pad_side::left;
    if (*it == '-') {
        side = log_padding::pad_side::right;
        ++it;
    } else if (*it == '=') {
        side = log_padding::pad_side::center;
        ++it;
    }

    if (it == end || !std::isdigit(static_cast<unsigned char>(*it))) {
        return {};
    }

    size_t width = 0;
    for (; it != end && std::isdigit(static_cast<unsigned char>(*it)); ++it) {
        width = width * 10 + static_cast<size_t>(*it - '0');
    }

    bool truncate = false;
    if (it != end && *it == '!') {
        truncate = true;
        ++it;
    }

    return {(std::min)(width, padding_spaces.size()), side, truncate, true};
}

template <scoped_padder_type Padder>
void log_formatter::handle_flag(char flag, log_padding padding) {
    // 自定义flag
    if (const auto it = custom_flags_.find(flag); it != custom_flags_.end()) {
        formatters_.emplace_back(it->second(padding));
        return;
    }

    switch (flag) {
        case 'n':  // logger 名字
            formatters_.emplace_back(std::make_unique<text_flag<Padder, name_text>>(padding));
            break;

        case 'l':
            formatters_.emplace_back(std::make_unique<text_flag<Padder, level_text>>(padding));
            break;

        case 'L':
            formatters_.emplace_back(std::make_unique<text_flag<Padder, short_level_text>>(padding));
            break;

        case 'v':  // 日志内容
            formatters_.emplace_back(std::make_unique<text_flag<Padder, payload_text>>(padding));
            break;

        case 't':
            formatters_.emplace_back(std::make_unique<number_flag<Padder, tid_number>>(padding));
            break;

        case 'P':
            formatters_.emplace_back(std::make_unique<number_flag<Padder, pid_number>>(padding));
            break;

        case 'Y':
            formatters_.emplace_back(std::make_unique<tm_field_flag<Padder, &std::tm::tm_year, 1900, 4>>(padding));
            need_localtime_ = true;
            break;

        case 'm':
            formatters_.emplace_back(std::make_unique<tm_field_flag<Padder, &std::tm::tm_mon, 1, 2>>(padding));
            need_localtime_ = true;
            break;

        case 'd':
            formatters_.emplace_back(std::make_unique<tm_field_flag<Padder, &std::tm::tm_mday, 0, 2>>(padding));
            need_localtime_ = true;
            break;

        case 'H':
            formatters_.emplace_back(std::make_unique<tm_field_flag<Padder, &std::tm::tm_hour, 0, 2>>(padding));
            need_localtime_ = true;
            break;

        case 'M':
            formatters_.emplace_back(std::make_unique<tm_field_flag<Padder, &std::tm::tm_min, 0, 2>>(padding));
            need_localtime_ = true;
            break;

        case 'S':
            formatters_.emplace_back(std::make_unique<tm_field_flag<Padder, &std::tm::tm_sec, 0, 2>>(padding));
            need_localtime_ = true;
            break;

        case 'e':
            formatters_.emplace_back(std::make_unique<millis_flag<Padder>>(padding));
            break;

        case '^':
            formatters_.emplace_back(std::make_unique<color_start_flag>(padding));
            break;

        case '$':
            formatters_.emplace_back(std::make_unique<color_stop_flag>(padding));
            break;

        case '@':  // filename:line
            formatters_.emplace_back(std::make_unique<source_location_flag<Padder>>(padding));
            break;

        case 's':
            formatters_.emplace_back(std::make_unique<text_flag<Padder, short_filename_text>>(padding));
            break;

        case 'g':
            formatters_.emplace_back(std::make_unique<text_flag<Padder, full_filename_text>>(padding));
            break;

        case '#':
            formatters_.emplace_back(std::make_unique<number_flag<Padder, line_number>>(padding));
            break;

        case '!':
            formatters_.emplace_back(std::make_unique<text_flag<Padder, function_text>>(padding));
            break;

        case '%':
            formatters_.emplace_back(std::make_unique<aggregate_flag>("%"));
            break;

        default: {  // 未知的flag原样输出
            auto unknown_flag = std::make_unique<aggregate_flag>();
            unknown_flag->add_ch('%');
            unknown_flag->add_ch(flag);
            formatters_.emplace_back(std::move(unknown_flag));
            break;
        }
    }
}

void log_formatter::set_pattern(const std::string_view& pattern) {
    const auto end = pattern.end();
    aggregate_flag user_chars;
    formatters_.clear();
    need_localtime_ = false;
    for (auto it = pattern.begin(); it != end; ++it) {
        if (*it != '%') {
            user_chars.add_ch(*it);
            continue;
        }

        if (!user_chars.empty()) {
            formatters_.emplace_back(user_chars.clone());
            user_chars.clear();
        }

        const auto padding = handle_padding(++it, end);
        if (it == end) {
            break;
        }

        if (padding.enabled) {
            handle_flag<scoped_padder>(*it, padding);
        } else {
            handle_flag<null_scoped_padder>(*it, padding);
        }
    }

    if (!user_chars.empty()) {
        formatters_.emplace_back(user_chars.clone());
    }
}

void log_formatter::format(const log_message& msg, log_buf_t& dest) {
    if (need_localtime_) {
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(msg.point.time_since_epoch());
        if (secs != last_log_secs_) {
            cached_tm_ = time_type_ == log_time_type::local ? fmt::localtime(log_clock::to_time_t(msg.point))
                                                            : fmt::gmtime(log_clock::to_time_t(msg.point));
            last_log_secs_ = secs;
        }
    }

    for (const auto& f : formatters_) {
        f->format(msg, cached_tm_, dest);
    }

    dest.append(default_eol);
}

std::unique_ptr<log_formatter> log_formatter::clone() const {
    auto cloned = std::make_unique<log_formatter>("", time_type_);
    cloned->need_localtime_ = need_localtime_;
    cloned->custom_flags_ = custom_flags_;
    cloned->formatters_.reserve(formatters_.size());
    for (const auto& flag : formatters_) {
        cloned->formatters_.emplace_back(flag->clone());
    }
    return cloned;
}

log_formatter& log_formatter::add_custom_flag(char ch, create_flag_func_t func) {
    custom_flags_[ch] = std::move(func);
    return *this;
}

}  // namespace exgroup
