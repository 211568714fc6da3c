#pragma once
#include <exgroup/config.h>
#include <exgroup/error.h>
#include <exgroup/group/error_kind.h>
#include <exgroup/group/specialization.h>
#include <fmt/format.h>

#include <exception>
#include <functional>
#include <optional>
#include <source_location>
#include <string>
#include <vector>

namespace exgroup {

struct group_split;

/**
 * 并行产生的多个异常的集合，例如多个子任务同时失败。
 *
 * 构造时根据成员的运行时类型得到精确的特化形状 kind()，
 * catch 的一方用 matches(filter) 判断是否处理这个 group：
 *
 *   catch (const exgroup::exception_group& group) {
 *       if (!group.matches(filter)) throw;
 *       ...
 *   }
 */
class exception_group : public std::exception {
  public:
    /**
     * @param message 整体的描述
     * @param exceptions 成员异常，必须是 std::exception 且不能是 exception_group
     * @param sources 每个成员的来源描述，与 exceptions 一一对应
     * @throw empty_specialization_error exceptions 为空
     * @throw invalid_member_error 成员不是可识别的异常
     * @throw source_count_mismatch_error sources 与 exceptions 数量不同
     */
    EXGROUP_API static exception_group create(std::string message, std::vector<std::exception_ptr> exceptions,
                                              std::vector<std::string> sources,
                                              const std::source_location &origin = std::source_location::current());

    // 通过指定的形状构造；through 已特化时成员必须匹配它，否则抛出 invalid_specialization
    EXGROUP_API static exception_group create(const specialization_ptr &through, std::string message,
                                              std::vector<std::exception_ptr> exceptions, std::vector<std::string> sources,
                                              const std::source_location &origin = std::source_location::current());

    EXGROUP_COPYABLE_DEFAULT(exception_group)

    ~exception_group() noexcept override = default;

    // 各成员的描述，以 ", " 连接
    [[nodiscard]] const char *what() const noexcept override { return rendered_.c_str(); }

    [[nodiscard]] const std::string &message() const noexcept { return message_; }

    [[nodiscard]] const std::vector<std::exception_ptr> &exceptions() const noexcept { return exceptions_; }

    [[nodiscard]] const std::vector<std::string> &sources() const noexcept { return sources_; }

    [[nodiscard]] const std::vector<const error_kind *> &member_kinds() const noexcept { return member_kinds_; }

    [[nodiscard]] const specialization_ptr &kind() const noexcept { return kind_; }

    [[nodiscard]] bool matches(const specialization_ptr &filter) const noexcept { return exgroup::matches(filter, kind_); }

    // <exception_group: std::invalid_argument('A'), std::runtime_error('B')>
    [[nodiscard]] EXGROUP_API std::string to_string() const;

    // 成员相同的新 group，并复制 cause、context、suppress_context
    [[nodiscard]] EXGROUP_API exception_group copy() const;

    /**
     * 按成员类型拆分成两个 group，成员和 sources 保持原来的顺序。
     * 成员的类型是 kinds 中任意一个的子类型时归入 match，其余归入 rest；
     * 没有成员的一侧为空。两侧都是同一家族的新 group，并复制 message、origin 和异常链。
     * @throw invalid_specialization kinds 中有空指针
     */
    [[nodiscard]] EXGROUP_API group_split split(const std::vector<const error_kind *> &kinds) const;

    // 同 split，由 predicate 判断成员是否归入 match，predicate 抛出的异常直接传给调用方
    [[nodiscard]] EXGROUP_API group_split split_if(const std::function<bool(const std::exception &)> &predicate) const;

    [[nodiscard]] const std::exception_ptr &cause() const noexcept { return cause_; }

    // 同 raise ... from cause，会把 suppress_context 置为 true
    void set_cause(std::exception_ptr cause) noexcept {
        cause_ = std::move(cause);
        suppress_context_ = true;
    }

    [[nodiscard]] const std::exception_ptr &context() const noexcept { return context_; }

    void set_context(std::exception_ptr context) noexcept { context_ = std::move(context); }

    [[nodiscard]] bool suppress_context() const noexcept { return suppress_context_; }

    void set_suppress_context(bool suppress) noexcept { suppress_context_ = suppress; }

    // 调用 create 的位置
    [[nodiscard]] const std::source_location &origin() const noexcept { return origin_; }

  private:
    [[nodiscard]] group_split split_by(const std::vector<bool> &selected) const;

    exception_group(std::string message, std::vector<std::exception_ptr> exceptions, std::vector<std::string> sources,
                    const std::source_location &origin);

    std::string message_;
    std::vector<std::exception_ptr> exceptions_;
    std::vector<std::string> sources_;
    std::vector<const error_kind *> member_kinds_;
    specialization_ptr kind_;
    std::string rendered_;
    std::exception_ptr cause_;
    std::exception_ptr context_;
    bool suppress_context_{false};
    std::source_location origin_;
};

struct group_split {
    std::optional<exception_group> match;
    std::optional<exception_group> rest;
};

}  // namespace exgroup

template <>
struct fmt::formatter<exgroup::exception_group> : fmt::formatter<std::string_view> {
    auto format(const exgroup::exception_group &group, format_context &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(group.to_string(), ctx);
    }
};
