#include <exgroup/group/error_kind.h>
#include <exgroup/group/exception_group.h>
#include <exgroup/log/log.h>
#include <exgroup/utils/os.h>

#include <algorithm>
#include <functional>
#include <new>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <variant>

namespace exgroup {

error_kind::error_kind(uint32_t id, std::string name, std::vector<const error_kind*> parents, probe_t probe)
    : id_(id), name_(std::move(name)), parents_(std::move(parents)), probe_(probe) {}

bool error_kind::is_subtype_of(const error_kind& other) const noexcept {
    if (this == &other) {
        return true;
    }

    // 父类型先注册，id 更大的不可能是祖先
    if (other.id_ > id_) {
        return false;
    }

    return std::any_of(parents_.begin(), parents_.end(),
                       [&other](const error_kind* parent) { return parent->is_subtype_of(other); });
}

error_kind_registry::error_kind_registry() {
    add<std::exception>("std::exception");

    add<std::logic_error, std::exception>("std::logic_error");
    add<std::invalid_argument, std::logic_error>("std::invalid_argument");
    add<std::domain_error, std::logic_error>("std::domain_error");
    add<std::length_error, std::logic_error>("std::length_error");
    add<std::out_of_range, std::logic_error>("std::out_of_range");

    add<std::runtime_error, std::exception>("std::runtime_error");
    add<std::range_error, std::runtime_error>("std::range_error");
    add<std::overflow_error, std::runtime_error>("std::overflow_error");
    add<std::underflow_error, std::runtime_error>("std::underflow_error");
    add<std::system_error, std::runtime_error>("std::system_error");

    add<std::bad_alloc, std::exception>("std::bad_alloc");
    add<std::bad_cast, std::exception>("std::bad_cast");
    add<std::bad_optional_access, std::exception>("std::bad_optional_access");
    add<std::bad_variant_access, std::exception>("std::bad_variant_access");
    add<std::bad_function_call, std::exception>("std::bad_function_call");
}

error_kind_registry& error_kind_registry::instance() {
    static error_kind_registry registry;
    return registry;
}

const error_kind& error_kind_registry::add_kind(std::type_index type, std::string_view name,
                                                std::vector<std::type_index> parents, error_kind::probe_t probe) {
    const error_kind* added = nullptr;
    {
        std::lock_guard lock(mtx_);
        if (const auto it = by_type_.find(type); it != by_type_.end()) {
            return *it->second;
        }

        std::string key(name);
        if (key.empty() || key == "...") {
            throw invalid_specialization(fmt::format("'{}' is not a valid error kind name", key));
        }

        if (by_name_.contains(key)) {
            throw invalid_specialization(fmt::format("error kind name '{}' is already registered", key));
        }

        std::vector<const error_kind*> parent_kinds;
        parent_kinds.reserve(parents.size() + 1);
        for (const auto& parent : parents) {
            const auto it = by_type_.find(parent);
            if (it == by_type_.end()) {
                throw invalid_specialization(
                    fmt::format("parent {} of error kind '{}' is not registered", parent.name(), key));
            }
            parent_kinds.emplace_back(it->second);
        }

        if (parent_kinds.empty() && root_) {
            parent_kinds.emplace_back(root_);
        }

        const auto id = static_cast<uint32_t>(kinds_.size());
        auto& kind = kinds_.emplace_back(std::make_unique<error_kind>(id, key, std::move(parent_kinds), probe));
        by_type_.emplace(type, kind.get());
        by_name_.emplace(std::move(key), kind.get());
        if (!root_) {
            root_ = kind.get();
        }
        added = kind.get();
    }

    trace("error kind {} registered", *added);
    return *added;
}

const error_kind* error_kind_registry::find(std::type_index type) const {
    std::lock_guard lock(mtx_);
    if (const auto it = by_type_.find(type); it != by_type_.end()) {
        return it->second;
    }
    return nullptr;
}

const error_kind* error_kind_registry::find(std::string_view name) const {
    std::lock_guard lock(mtx_);
    if (const auto it = by_name_.find(std::string(name)); it != by_name_.end()) {
        return it->second;
    }
    return nullptr;
}

const error_kind* error_kind_registry::classify(const std::exception_ptr& ptr, std::string* what,
                                               std::string* type_name) const {
    if (!ptr) {
        return nullptr;
    }

    try {
        std::rethrow_exception(ptr);
    } catch (const exception_group&) {
        // 不支持嵌套的 group
        return nullptr;
    } catch (const std::exception& e) {
        if (what) {
            *what = e.what();
        }
        const auto& kind = classify(e);
        if (type_name) {
            *type_name = find(std::type_index(typeid(e))) ? kind.name() : os::type_name(typeid(e));
        }
        return &kind;
    } catch (...) {
        // 不是 std::exception，不是可识别的异常
        return nullptr;
    }
}

const error_kind& error_kind_registry::classify(const std::exception& e) const {
    std::lock_guard lock(mtx_);
    if (const auto it = by_type_.find(std::type_index(typeid(e))); it != by_type_.end()) {
        return *it->second;
    }

    // 未注册的派生类，取最具体的已注册基类；root 总能接受
    for (auto it = kinds_.rbegin(); it != kinds_.rend(); ++it) {
        if ((*it)->accepts(e)) {
            return **it;
        }
    }
    return *root_;
}

size_t error_kind_registry::size() const {
    std::lock_guard lock(mtx_);
    return kinds_.size();
}

void error_kind_registry::throw_unregistered(const std::type_info& type) {
    throw invalid_specialization(fmt::format("{} is not a registered error kind", type.name()));
}

}  // namespace exgroup
