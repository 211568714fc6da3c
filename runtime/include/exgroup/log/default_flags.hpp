#pragma once
#include <exgroup/log/flag.h>
#include <exgroup/log/logger.h>
#include <exgroup/log/logmsg.h>
#include <exgroup/utils/os.h>

#include <string>

namespace exgroup {

inline constexpr std::string_view padding_spaces = "                                                                ";

class scoped_padder {  // NOLINT(cppcoreguidelines-special-member-functions)
  public:
    scoped_padder(size_t wrapped_size, const log_padding &info, log_buf_t &dest) : info_(info), dest_(dest) {
        remaining_pad_ = static_cast<int32_t>(info.width) - static_cast<int32_t>(wrapped_size);
        if (remaining_pad_ <= 0) {
            return;
        }

        if (info_.side == log_padding::pad_side::left) {
            dest_.append(padding_spaces.substr(0, remaining_pad_));
            remaining_pad_ = 0;
        } else if (info_.side == log_padding::pad_side::center) {
            const auto half_pad = remaining_pad_ / 2;
            dest_.append(padding_spaces.substr(0, half_pad));
            remaining_pad_ = half_pad + (remaining_pad_ & 1);
        }
    }

    ~scoped_padder() {
        if (remaining_pad_ >= 0) {
            dest_.append(padding_spaces.substr(0, remaining_pad_));
        } else if (info_.truncate) {
            dest_.resize(static_cast<size_t>(static_cast<int32_t>(dest_.size()) + remaining_pad_));
        }
    }

    static int count_digits(uint64_t num) { return fmt::detail::count_digits(num); }

  private:
    const log_padding &info_;
    log_buf_t &dest_;
    int32_t remaining_pad_;
};

struct null_scoped_padder {
    null_scoped_padder(size_t, const log_padding &, log_buf_t &) {}

    static int count_digits(uint64_t) { return 0; }
};

namespace detail {

inline void pad2(int n, log_buf_t &dest) {
    if (n >= 0 && n < 100) {
        dest.push_back(static_cast<char>('0' + n / 10));
        dest.push_back(static_cast<char>('0' + n % 10));
    } else {
        fmt::format_to(std::back_inserter(dest), "{:02}", n);
    }
}

inline void pad3(int n, log_buf_t &dest) {
    if (n >= 0 && n < 1000) {
        dest.push_back(static_cast<char>('0' + n / 100));
        dest.push_back(static_cast<char>('0' + n / 10 % 10));
        dest.push_back(static_cast<char>('0' + n % 10));
    } else {
        dest.append(fmt::format_int(n));
    }
}

inline std::string_view short_filename(std::string_view file_name) {
    if (const auto pos = file_name.find_last_of("/\\"); pos != std::string_view::npos) {
        return file_name.substr(pos + 1);
    }
    return file_name;
}

}  // namespace detail

// 文本类 flag 的公共实现，Text 负责取出要写入的文本
template <scoped_padder_type ScopedPadder, typename Text>
class text_flag final : public log_flag {
  public:
    explicit text_flag(const log_padding &pad) : log_flag(pad) {}

    EXGROUP_NON_COPYABLE(text_flag)

    ~text_flag() noexcept override = default;

    [[nodiscard]] std::unique_ptr<log_flag> clone() const override { return std::make_unique<text_flag>(pad_); }

    void format(const log_message &msg, const std::tm &, log_buf_t &dest) override {
        const std::string_view strv = Text{}(msg);
        ScopedPadder p(strv.size(), pad_, dest);
        dest.append(strv);
    }
};

struct name_text {
    std::string_view operator()(const log_message &msg) const { return msg.ptr ? msg.ptr->name() : std::string_view{}; }
};

struct level_text {
    std::string_view operator()(const log_message &msg) const { return to_string_view(msg.level); }
};

struct short_level_text {
    std::string_view operator()(const log_message &msg) const { return to_string_view_short(msg.level); }
};

struct payload_text {
    std::string_view operator()(const log_message &msg) const { return msg.payload; }
};

struct short_filename_text {
    std::string_view operator()(const log_message &msg) const { return detail::short_filename(msg.source.file_name()); }
};

struct full_filename_text {
    std::string_view operator()(const log_message &msg) const { return msg.source.file_name(); }
};

struct function_text {
    std::string_view operator()(const log_message &msg) const { return msg.source.function_name(); }
};

// 整数类 flag "%t" "%P" "%#"
template <scoped_padder_type ScopedPadder, typename Number>
class number_flag final : public log_flag {
  public:
    explicit number_flag(const log_padding &pad) : log_flag(pad) {}

    EXGROUP_NON_COPYABLE(number_flag)

    ~number_flag() noexcept override = default;

    [[nodiscard]] std::unique_ptr<log_flag> clone() const override { return std::make_unique<number_flag>(pad_); }

    void format(const log_message &msg, const std::tm &, log_buf_t &dest) override {
        const auto value = static_cast<uint64_t>(Number{}(msg));
        ScopedPadder p(static_cast<size_t>(ScopedPadder::count_digits(value)), pad_, dest);
        dest.append(fmt::format_int(value));
    }
};

struct tid_number {
    int64_t operator()(const log_message &msg) const { return msg.tid; }
};

struct pid_number {
    int64_t operator()(const log_message &) const { return os::pid(); }
};

struct line_number {
    int64_t operator()(const log_message &msg) const { return msg.source.line(); }
};

// 日期时间字段 "%Y" "%m" "%d" "%H" "%M" "%S"
template <scoped_padder_type ScopedPadder, int std::tm::*Field, int Offset, int Width>
class tm_field_flag final : public log_flag {
  public:
    explicit tm_field_flag(const log_padding &pad) : log_flag(pad) {}

    EXGROUP_NON_COPYABLE(tm_field_flag)

    ~tm_field_flag() noexcept override = default;

    [[nodiscard]] std::unique_ptr<log_flag> clone() const override { return std::make_unique<tm_field_flag>(pad_); }

    void format(const log_message &, const std::tm &tm_time, log_buf_t &dest) override {
        const auto value = tm_time.*Field + Offset;
        ScopedPadder p(Width, pad_, dest);
        if constexpr (Width == 2) {
            detail::pad2(value, dest);
        } else {
            dest.append(fmt::format_int(value));
        }
    }
};

// 毫秒 flag "%e"
template <scoped_padder_type ScopedPadder>
class millis_flag final : public log_flag {
  public:
    explicit millis_flag(const log_padding &pad) : log_flag(pad) {}

    EXGROUP_NON_COPYABLE(millis_flag)

    ~millis_flag() noexcept override = default;

    [[nodiscard]] std::unique_ptr<log_flag> clone() const override { return std::make_unique<millis_flag>(pad_); }

    void format(const log_message &msg, const std::tm &, log_buf_t &dest) override {
        using std::chrono::duration_cast;
        const auto duration = msg.point.time_since_epoch();
        const auto millis = duration_cast<std::chrono::milliseconds>(duration) -
                            duration_cast<std::chrono::milliseconds>(duration_cast<std::chrono::seconds>(duration));
        ScopedPadder p(3, pad_, dest);
        detail::pad3(static_cast<int>(millis.count()), dest);
    }
};

// 代码位置 flag "%@"
template <scoped_padder_type ScopedPadder>
class source_location_flag final : public log_flag {
  public:
    explicit source_location_flag(const log_padding &pad) : log_flag(pad) {}

    EXGROUP_NON_COPYABLE(source_location_flag)

    ~source_location_flag() noexcept override = default;

    [[nodiscard]] std::unique_ptr<log_flag> clone() const override { return std::make_unique<source_location_flag>(pad_); }

    void format(const log_message &msg, const std::tm &, log_buf_t &dest) override {
        const std::string_view file_name = msg.source.file_name();
        if (file_name.empty()) {
            ScopedPadder p(0, pad_, dest);
            return;
        }

        const auto line = msg.source.line();
        const auto text_size = pad_.enabled ? file_name.size() + ScopedPadder::count_digits(line) + 1 : 0;
        ScopedPadder p(text_size, pad_, dest);
        dest.append(file_name);
        dest.push_back(':');
        dest.append(fmt::format_int(line));
    }
};

// 颜色范围 "%^" "%$"
class color_start_flag final : public log_flag {
  public:
    explicit color_start_flag(const log_padding &pad) : log_flag(pad) {}

    EXGROUP_NON_COPYABLE(color_start_flag)

    ~color_start_flag() noexcept override = default;

    [[nodiscard]] std::unique_ptr<log_flag> clone() const override { return std::make_unique<color_start_flag>(pad_); }

    void format(const log_message &msg, const std::tm &, log_buf_t &dest) override { msg.color_start = dest.size(); }
};

class color_stop_flag final : public log_flag {
  public:
    explicit color_stop_flag(const log_padding &pad) : log_flag(pad) {}

    EXGROUP_NON_COPYABLE(color_stop_flag)

    ~color_stop_flag() noexcept override = default;

    [[nodiscard]] std::unique_ptr<log_flag> clone() const override { return std::make_unique<color_stop_flag>(pad_); }

    void format(const log_message &msg, const std::tm &, log_buf_t &dest) override { msg.color_stop = dest.size(); }
};

// 非格式化标记的普通字符
class aggregate_flag final : public log_flag {
  public:
    aggregate_flag() = default;

    explicit aggregate_flag(std::string str) : str_(std::move(str)) {}

    EXGROUP_NON_COPYABLE(aggregate_flag)

    ~aggregate_flag() noexcept override = default;

    void add_ch(char ch) { str_ += ch; }

    [[nodiscard]] std::unique_ptr<log_flag> clone() const override { return std::make_unique<aggregate_flag>(str_); }

    void format(const log_message &, const std::tm &, log_buf_t &dest) override { dest.append(str_); }

    void clear() noexcept { return str_.clear(); }

    [[nodiscard]] bool empty() const noexcept { return str_.empty(); }

  private:
    std::string str_;
};

// 没有设置 pattern 时的默认格式
// [2024-01-01 12:00:00.000] [name] [level] [file.cpp:10] message
class default_flag final : public log_flag {
  public:
    default_flag() = default;

    EXGROUP_NON_COPYABLE(default_flag)

    ~default_flag() noexcept override = default;

    [[nodiscard]] std::unique_ptr<log_flag> clone() const override { return std::make_unique<default_flag>(); }

    void format(const log_message &msg, const std::tm &tm_time, log_buf_t &dest) override {
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(msg.point.time_since_epoch());
        if (cache_timestamp_ != secs || cached_datetime_.size() == 0) {
            cached_datetime_.clear();
            fmt::format_to(std::back_inserter(cached_datetime_), "[{}-", tm_time.tm_year + 1900);
            detail::pad2(tm_time.tm_mon + 1, cached_datetime_);
            cached_datetime_.push_back('-');
            detail::pad2(tm_time.tm_mday, cached_datetime_);
            cached_datetime_.push_back(' ');
            detail::pad2(tm_time.tm_hour, cached_datetime_);
            cached_datetime_.push_back(':');
            detail::pad2(tm_time.tm_min, cached_datetime_);
            cached_datetime_.push_back(':');
            detail::pad2(tm_time.tm_sec, cached_datetime_);
            cached_datetime_.push_back('.');
            cache_timestamp_ = secs;
        }
        dest.append(cached_datetime_);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(msg.point.time_since_epoch()) -
                            std::chrono::duration_cast<std::chrono::milliseconds>(secs);
        detail::pad3(static_cast<int>(millis.count()), dest);
        dest.append(std::string_view("] "));

        if (msg.ptr && !msg.ptr->name().empty()) {
            fmt::format_to(std::back_inserter(dest), "[{}] ", msg.ptr->name());
        }

        dest.push_back('[');
        msg.color_start = dest.size();
        dest.append(to_string_view(msg.level));
        msg.color_stop = dest.size();
        dest.append(std::string_view("] "));

        if (const std::string_view file_name = msg.source.file_name(); !file_name.empty()) {
            fmt::format_to(std::back_inserter(dest), "[{}:{}] ", detail::short_filename(file_name), msg.source.line());
        }

        dest.append(msg.payload);
    }

  private:
    std::chrono::seconds cache_timestamp_{0};
    log_buf_t cached_datetime_;
};

}  // namespace exgroup
