#pragma once
#include <exgroup/group/error_kind.h>

#include <stdexcept>
#include <string>

// 与 std::runtime_error 平级的错误类型
struct named_error : std::exception {
    explicit named_error(std::string what) : what_(std::move(what)) {}

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

  private:
    std::string what_;
};

struct lookup_error : named_error {
    using named_error::named_error;
};

struct key_error : lookup_error {
    using lookup_error::lookup_error;
};

struct index_error : lookup_error {
    using lookup_error::lookup_error;
};

struct value_error : named_error {
    using named_error::named_error;
};

struct type_error : named_error {
    using named_error::named_error;
};

// 没有注册，按最近的已注册基类 key_error 识别
struct missing_key_error : key_error {
    using key_error::key_error;
};

inline void register_test_kinds() {
    exgroup::register_error_kind<lookup_error>("lookup_error");
    exgroup::register_error_kind<key_error, lookup_error>("key_error");
    exgroup::register_error_kind<index_error, lookup_error>("index_error");
    exgroup::register_error_kind<value_error>("value_error");
    exgroup::register_error_kind<type_error>("type_error");
}
