#pragma once
#include <exgroup/config.h>

#include <string>
#include <system_error>

namespace exgroup {

enum class group_errors {
    // 特化参数不是已注册的错误类型，或者对已特化的类型再次特化
    invalid_specialization = 1,
    // 成员为空
    empty_specialization,
    // 成员不是可识别的异常
    invalid_member,
    // sources 与 exceptions 数量不一致
    source_count_mismatch,
};

EXGROUP_API const std::error_category& get_group_category();

}  // namespace exgroup

template <>
struct std::is_error_code_enum<exgroup::group_errors> {
    static constexpr bool value = true;
};

namespace exgroup {

inline std::error_code make_error_code(group_errors e) { return {static_cast<int>(e), get_group_category()}; }

class invalid_specialization final : public std::system_error {
  public:
    explicit invalid_specialization(const std::string& detail)
        : std::system_error(group_errors::invalid_specialization, detail) {}
};

class empty_specialization_error final : public std::system_error {
  public:
    explicit empty_specialization_error(const std::string& detail)
        : std::system_error(group_errors::empty_specialization, detail) {}
};

class invalid_member_error final : public std::system_error {
  public:
    invalid_member_error(size_t index, const std::string& detail)
        : std::system_error(group_errors::invalid_member, detail), index_(index) {}

    // 出错成员在 exceptions 中的位置
    [[nodiscard]] size_t index() const noexcept { return index_; }

  private:
    size_t index_;
};

class source_count_mismatch_error final : public std::system_error {
  public:
    EXGROUP_API source_count_mismatch_error(size_t sources, size_t exceptions);

    [[nodiscard]] size_t sources() const noexcept { return sources_; }

    [[nodiscard]] size_t exceptions() const noexcept { return exceptions_; }

  private:
    size_t sources_;
    size_t exceptions_;
};

}  // namespace exgroup
