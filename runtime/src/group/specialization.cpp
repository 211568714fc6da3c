#include <exgroup/group/specialization.h>
#include <exgroup/log/log.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <map>
#include <mutex>

namespace exgroup {

namespace detail {

class family_state : public std::enable_shared_from_this<family_state> {
  public:
    explicit family_state(std::string name) : name_(std::move(name)) {}

    EXGROUP_NON_COPYABLE(family_state)

    ~family_state() noexcept = default;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    specialization_ptr make_root() {
        auto root = std::make_shared<specialization>(specialization::private_tag{}, shared_from_this(),
                                                     std::vector<const error_kind*>{}, true);
        std::lock_guard lock(mtx_);
        root_ = root;
        return root;
    }

    specialization_ptr get_or_create(std::vector<const error_kind*> members, bool inclusive) {
        if (std::any_of(members.begin(), members.end(), [](const error_kind* kind) { return kind == nullptr; })) {
            throw invalid_specialization(fmt::format("{} expected registered error kinds, got a null kind", name_));
        }

        std::sort(members.begin(), members.end(), [](const error_kind* l, const error_kind* r) { return l->id() < r->id(); });
        members.erase(std::unique(members.begin(), members.end()), members.end());

        if (members.empty()) {
            if (!inclusive) {
                throw invalid_specialization(fmt::format("{} requires at least one error kind to specialize", name_));
            }
            // cls[...] 就是 cls 本身
            if (auto root = lock_root()) {
                return root;
            }
            return make_root();
        }

        specialization::cache_key key{{}, inclusive};
        key.ids.reserve(members.size());
        for (const auto* kind : members) {
            key.ids.push_back(kind->id());
        }

        // 需在锁释放之后析构，析构函数会再次加锁
        specialization_ptr created;
        {
            std::lock_guard lock(mtx_);
            auto& entry = cache_[key];
            if (auto cached = entry.lock()) {
                return cached;
            }

            created = std::make_shared<specialization>(specialization::private_tag{}, shared_from_this(), std::move(members),
                                                       inclusive);
            entry = created;
        }

        trace("specialization {} created", *created);
        return created;
    }

    // 形状析构时调用；条目已被新形状替换时保留
    void forget(const specialization::cache_key& key, const std::string& name) noexcept {
        bool erased = false;
        {
            std::lock_guard lock(mtx_);
            if (const auto it = cache_.find(key); it != cache_.end() && it->second.expired()) {
                cache_.erase(it);
                erased = true;
            }
        }

        if (erased) {
            trace("specialization {} reclaimed", name);
        }
    }

    // 包括已过期但还没被 forget 移除的条目
    [[nodiscard]] size_t cache_size() const {
        std::lock_guard lock(mtx_);
        return cache_.size();
    }

  private:
    specialization_ptr lock_root() {
        std::lock_guard lock(mtx_);
        return root_.lock();
    }

    std::string name_;
    mutable std::mutex mtx_;
    std::weak_ptr<const specialization> root_;
    std::map<specialization::cache_key, std::weak_ptr<const specialization>> cache_;
};

}  // namespace detail

static std::string make_specialization_name(const std::string& base, const std::vector<const error_kind*>& members,
                                            bool inclusive) {
    if (members.empty()) {
        return base;
    }

    std::vector<std::string_view> names;
    names.reserve(members.size() + 1);
    for (const auto* kind : members) {
        names.emplace_back(kind->name());
    }
    if (inclusive) {
        names.emplace_back("...");
    }
    return fmt::format("{}[{}]", base, fmt::join(names, ", "));
}

specialization::specialization(private_tag, std::shared_ptr<detail::family_state> family,
                               std::vector<const error_kind*> members, bool inclusive)
    : family_(std::move(family)),
      members_(std::move(members)),
      inclusive_(inclusive),
      key_{{}, inclusive},
      name_(make_specialization_name(family_->name(), members_, inclusive)) {
    key_.ids.reserve(members_.size());
    for (const auto* kind : members_) {
        key_.ids.push_back(kind->id());
    }
}

specialization::~specialization() noexcept {
    if (is_specialized()) {
        family_->forget(key_, name_);
    }
}

const std::string& specialization::base_name() const noexcept { return family_->name(); }

specialization_ptr specialization::specialize(std::initializer_list<spec_arg> args) const {
    return specialize(std::vector<spec_arg>(args));
}

specialization_ptr specialization::specialize(const std::vector<spec_arg>& args) const {
    if (is_specialized()) {
        throw invalid_specialization(fmt::format("cannot specialize already specialized '{}'", name_));
    }

    std::vector<const error_kind*> kinds;
    kinds.reserve(args.size());
    bool inclusive = false;
    for (const auto& arg : args) {
        const auto& value = arg.value();
        if (std::holds_alternative<open_marker_t>(value)) {
            inclusive = true;
        } else if (const auto* kind = std::get_if<const error_kind*>(&value)) {
            if (!*kind) {
                throw invalid_specialization(fmt::format("{} expected error kinds, got a null kind", name_));
            }
            kinds.push_back(*kind);
        } else {
            const auto& name = std::get<std::string>(value);
            if (name == "...") {
                inclusive = true;
            } else if (const auto* found = error_kind_registry::instance().find(name)) {
                kinds.push_back(found);
            } else {
                throw invalid_specialization(fmt::format("{} expected error kinds, '{}' is not registered", name_, name));
            }
        }
    }

    if (kinds.empty() && !inclusive) {
        throw invalid_specialization(fmt::format("{} requires at least one error kind to specialize", name_));
    }

    return get_or_create(std::move(kinds), inclusive);
}

specialization_ptr specialization::get_or_create(std::vector<const error_kind*> members, bool inclusive) const {
    return family_->get_or_create(std::move(members), inclusive);
}

bool matches(const specialization& filter, const specialization& value) noexcept {
    if (&filter == &value) {
        return true;
    }

    if (!filter.same_base(value)) {
        return false;
    }

    // except exception_group: 接受该家族的所有特化
    if (!filter.is_specialized()) {
        return true;
    }

    const auto& required = filter.members();
    const auto& present = value.members();

    // 协变：value 成员是 filter 成员的子类型即满足；一个成员可以同时满足多个要求
    const bool covered = std::all_of(required.begin(), required.end(), [&present](const error_kind* r) {
        return std::any_of(present.begin(), present.end(), [r](const error_kind* v) { return v->is_subtype_of(*r); });
    });
    if (!covered) {
        return false;
    }

    if (filter.inclusive()) {
        return true;
    }

    // 不能数个数：[key_error, lookup_error] 的两个成员都落在 lookup_error 之下
    return std::all_of(present.begin(), present.end(), [&required](const error_kind* v) {
        return std::any_of(required.begin(), required.end(), [v](const error_kind* r) { return v->is_subtype_of(*r); });
    });
}

group_family::group_family(std::string name) : state_(std::make_shared<detail::family_state>(std::move(name))) {
    root_ = state_->make_root();
    trace("group family {} created", state_->name());
}

group_family::~group_family() noexcept = default;

group_family& group_family::default_family() {
    static group_family family("exception_group");
    return family;
}

const std::string& group_family::name() const noexcept { return state_->name(); }

size_t group_family::cache_size() const { return state_->cache_size(); }

}  // namespace exgroup
