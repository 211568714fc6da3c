#pragma once
#include <exgroup/config.h>
#include <exgroup/error.h>
#include <fmt/format.h>

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace exgroup {

// 一个异常类的名义类型，父类型构成以 std::exception 为根的 DAG
class error_kind {
  public:
    using probe_t = bool (*)(const std::exception &) noexcept;

    EXGROUP_API error_kind(uint32_t id, std::string name, std::vector<const error_kind *> parents, probe_t probe);

    EXGROUP_NON_COPYABLE(error_kind)

    ~error_kind() noexcept = default;

    // 注册顺序，父类型的 id 总是小于子类型
    [[nodiscard]] uint32_t id() const noexcept { return id_; }

    [[nodiscard]] const std::string &name() const noexcept { return name_; }

    [[nodiscard]] const std::vector<const error_kind *> &parents() const noexcept { return parents_; }

    // 自反、传递
    [[nodiscard]] EXGROUP_API bool is_subtype_of(const error_kind &other) const noexcept;

    // e 是否是该类型或其派生类型的对象
    [[nodiscard]] bool accepts(const std::exception &e) const noexcept { return probe_(e); }

  private:
    uint32_t id_;
    std::string name_;
    std::vector<const error_kind *> parents_;
    probe_t probe_;
};

class error_kind_registry {
  protected:
    error_kind_registry();

  public:
    EXGROUP_NON_COPYABLE(error_kind_registry)

    ~error_kind_registry() noexcept = default;

    EXGROUP_API static error_kind_registry &instance();

    /**
     * 注册异常类 T，Parents 是 T 的直接基类且必须已注册。
     * 没有给出 Parents 时父类型为 std::exception。
     * 重复注册同一个类返回已有的类型。
     */
    template <typename T, typename... Parents>
    const error_kind &add(std::string_view name) {
        static_assert(std::is_base_of_v<std::exception, T>, "error kind must derive from std::exception");
        static_assert((std::is_base_of_v<Parents, T> && ...), "parent kind must be a base of the error kind");
        return add_kind(typeid(T), name, {std::type_index(typeid(Parents))...}, &probe<T>);
    }

    template <typename T>
    [[nodiscard]] const error_kind *find() const {
        return find(std::type_index(typeid(T)));
    }

    [[nodiscard]] EXGROUP_API const error_kind *find(std::type_index type) const;

    [[nodiscard]] EXGROUP_API const error_kind *find(std::string_view name) const;

    // 未注册时抛出 invalid_specialization
    template <typename T>
    [[nodiscard]] const error_kind &get() const {
        if (const auto *kind = find<T>()) {
            return *kind;
        }
        throw_unregistered(typeid(T));
    }

    /**
     * 运行时类型：已注册的精确类型，否则为 id 最大的可接受类型。
     * 空指针、非 std::exception 对象、嵌套的 exception_group 返回 nullptr。
     * what 不为空时写入异常的 what()；type_name 不为空时写入对象实际类型的名字，
     * 已注册的类型用注册的名字。
     */
    [[nodiscard]] EXGROUP_API const error_kind *classify(const std::exception_ptr &ptr, std::string *what = nullptr,
                                                         std::string *type_name = nullptr) const;

    [[nodiscard]] EXGROUP_API const error_kind &classify(const std::exception &e) const;

    [[nodiscard]] const error_kind &root() const noexcept { return *root_; }

    [[nodiscard]] EXGROUP_API size_t size() const;

  private:
    template <typename T>
    static bool probe(const std::exception &e) noexcept {
        return dynamic_cast<const T *>(&e) != nullptr;
    }

    EXGROUP_API const error_kind &add_kind(std::type_index type, std::string_view name, std::vector<std::type_index> parents,
                                           error_kind::probe_t probe);

    [[noreturn]] EXGROUP_API static void throw_unregistered(const std::type_info &type);

    mutable std::mutex mtx_;
    std::vector<std::unique_ptr<error_kind>> kinds_;
    std::unordered_map<std::type_index, const error_kind *> by_type_;
    std::unordered_map<std::string, const error_kind *> by_name_;
    const error_kind *root_{nullptr};
};

template <typename T, typename... Parents>
const error_kind &register_error_kind(std::string_view name) {
    return error_kind_registry::instance().add<T, Parents...>(name);
}

template <typename T>
const error_kind &kind_of() {
    return error_kind_registry::instance().get<T>();
}

}  // namespace exgroup

template <>
struct fmt::formatter<exgroup::error_kind> : fmt::formatter<std::string_view> {
    auto format(const exgroup::error_kind &kind, format_context &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(kind.name(), ctx);
    }
};
