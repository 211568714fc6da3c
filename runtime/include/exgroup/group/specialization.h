#pragma once
#include <exgroup/config.h>
#include <exgroup/group/error_kind.h>
#include <fmt/format.h>

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace exgroup {

class specialization;

using specialization_ptr = std::shared_ptr<const specialization>;

namespace detail {
class family_state;
}  // namespace detail

// 特化参数里的 "..."：允许被匹配的 group 含有额外的成员类型
struct open_marker_t {
    explicit constexpr open_marker_t() = default;
};

inline constexpr open_marker_t open_marker{};

// 特化的一个参数：错误类型、open_marker 或类型名（"..." 等同 open_marker）
class spec_arg {
  public:
    spec_arg(const error_kind &kind) noexcept : value_(&kind) {}  // NOLINT(google-explicit-constructor)

    spec_arg(const error_kind *kind) noexcept : value_(kind) {}  // NOLINT(google-explicit-constructor)

    spec_arg(open_marker_t marker) noexcept : value_(marker) {}  // NOLINT(google-explicit-constructor)

    spec_arg(std::string_view name) : value_(std::string(name)) {}  // NOLINT(google-explicit-constructor)

    spec_arg(const char *name) : value_(std::string(name)) {}  // NOLINT(google-explicit-constructor)

    EXGROUP_COPYABLE_DEFAULT(spec_arg)

    ~spec_arg() noexcept = default;

    [[nodiscard]] const std::variant<const error_kind *, open_marker_t, std::string> &value() const noexcept {
        return value_;
    }

  private:
    std::variant<const error_kind *, open_marker_t, std::string> value_;
};

/**
 * 一个 group 家族的特化形状 (base, members, inclusive)。
 * 同一家族内相同的 (members, inclusive) 只会存在一个对象，可以直接比较指针。
 * 家族只弱引用缓存中的形状，最后一个引用释放时从缓存中移除。
 */
class specialization : public std::enable_shared_from_this<specialization> {
    struct private_tag {};

  public:
    struct cache_key {
        std::vector<uint32_t> ids;
        bool inclusive{false};

        auto operator<=>(const cache_key &) const = default;
    };

    specialization(private_tag, std::shared_ptr<detail::family_state> family, std::vector<const error_kind *> members,
                   bool inclusive);

    EXGROUP_NON_COPYABLE(specialization)

    EXGROUP_API ~specialization() noexcept;

    [[nodiscard]] bool same_base(const specialization &other) const noexcept { return family_ == other.family_; }

    [[nodiscard]] EXGROUP_API const std::string &base_name() const noexcept;

    // 按 id 排序且去重
    [[nodiscard]] const std::vector<const error_kind *> &members() const noexcept { return members_; }

    [[nodiscard]] bool inclusive() const noexcept { return inclusive_; }

    // 只有家族的根没有成员
    [[nodiscard]] bool is_specialized() const noexcept { return !members_.empty(); }

    // exception_group[std::out_of_range, std::runtime_error, ...]
    [[nodiscard]] const std::string &name() const noexcept { return name_; }

    // cls[A, B, ...]，已特化的形状不能再特化
    [[nodiscard]] EXGROUP_API specialization_ptr specialize(std::initializer_list<spec_arg> args) const;

    [[nodiscard]] EXGROUP_API specialization_ptr specialize(const std::vector<spec_arg> &args) const;

    // 同一家族中成员为 members 的形状，缓存中没有时创建
    [[nodiscard]] EXGROUP_API specialization_ptr get_or_create(std::vector<const error_kind *> members,
                                                               bool inclusive) const;

  private:
    friend class group_family;
    friend class detail::family_state;

    std::shared_ptr<detail::family_state> family_;
    std::vector<const error_kind *> members_;
    bool inclusive_;
    cache_key key_;
    std::string name_;
};

/**
 * filter 是否接受 value：
 * 同一对象或 filter 未特化时接受；不同家族不接受；
 * filter 的每个成员都要被 value 的某个成员（协变）满足；
 * 非 inclusive 时 value 的每个成员也都要落在 filter 的某个成员之下。
 */
[[nodiscard]] EXGROUP_API bool matches(const specialization &filter, const specialization &value) noexcept;

[[nodiscard]] inline bool matches(const specialization_ptr &filter, const specialization_ptr &value) noexcept {
    return filter && value && matches(*filter, *value);
}

// group 的根类型，不同家族之间互不匹配
class group_family {
  public:
    EXGROUP_API explicit group_family(std::string name);

    EXGROUP_NON_COPYABLE(group_family)

    EXGROUP_API ~group_family() noexcept;

    // 名为 exception_group 的默认家族
    EXGROUP_API static group_family &default_family();

    [[nodiscard]] EXGROUP_API const std::string &name() const noexcept;

    [[nodiscard]] const specialization_ptr &root() const noexcept { return root_; }

    [[nodiscard]] specialization_ptr specialize(std::initializer_list<spec_arg> args) const {
        return root_->specialize(args);
    }

    [[nodiscard]] specialization_ptr specialize(const std::vector<spec_arg> &args) const { return root_->specialize(args); }

    [[nodiscard]] specialization_ptr get_or_create(std::vector<const error_kind *> members, bool inclusive) const {
        return root_->get_or_create(std::move(members), inclusive);
    }

    // 缓存中的条目数量，形状释放后其条目随之移除
    [[nodiscard]] EXGROUP_API size_t cache_size() const;

  private:
    std::shared_ptr<detail::family_state> state_;
    specialization_ptr root_;
};

}  // namespace exgroup

template <>
struct fmt::formatter<exgroup::specialization> : fmt::formatter<std::string_view> {
    auto format(const exgroup::specialization &spec, format_context &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(spec.name(), ctx);
    }
};
