#include <exgroup/group/exception_group.h>
#include <exgroup/log/log.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace exgroup {

// 单引号内的文本，转义 \ 和 '
static std::string escape_quoted(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (const char ch : text) {
        if (ch == '\\' || ch == '\'') {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

exception_group::exception_group(std::string message, std::vector<std::exception_ptr> exceptions,
                                 std::vector<std::string> sources, const std::source_location& origin)
    : message_(std::move(message)), exceptions_(std::move(exceptions)), sources_(std::move(sources)), origin_(origin) {}

exception_group exception_group::create(std::string message, std::vector<std::exception_ptr> exceptions,
                                        std::vector<std::string> sources, const std::source_location& origin) {
    return create(group_family::default_family().root(), std::move(message), std::move(exceptions), std::move(sources),
                  origin);
}

exception_group exception_group::create(const specialization_ptr& through, std::string message,
                                        std::vector<std::exception_ptr> exceptions, std::vector<std::string> sources,
                                        const std::source_location& origin) {
    if (!through) {
        throw invalid_specialization("exception_group created through a null specialization");
    }

    // 不论是否通过特化构造，空的 group 都不允许
    if (exceptions.empty()) {
        debug("{} rejected empty exceptions, message '{}'", *through, message);
        if (through->is_specialized()) {
            throw empty_specialization_error(fmt::format(
                "specialisation of {} does not match empty exceptions; Note: Do not 'throw {}'", *through, *through));
        }
        throw empty_specialization_error(fmt::format("{} requires at least one exception", *through));
    }

    // 先构造原始的 group，再计算并设置它的 kind
    exception_group group(std::move(message), std::move(exceptions), std::move(sources), origin);

    std::vector<std::string> descriptions;
    descriptions.reserve(group.exceptions_.size());
    group.member_kinds_.reserve(group.exceptions_.size());
    for (size_t i = 0; i < group.exceptions_.size(); ++i) {
        std::string what;
        std::string type_name;
        const auto* kind = error_kind_registry::instance().classify(group.exceptions_[i], &what, &type_name);
        if (!kind) {
            debug("{} rejected member {}, message '{}'", *through, i, group.message_);
            throw invalid_member_error(i, fmt::format("expected an exception object, exceptions[{}] is not one", i));
        }
        group.member_kinds_.push_back(kind);
        descriptions.emplace_back(fmt::format("{}('{}')", type_name, escape_quoted(what)));
    }

    if (group.sources_.size() != group.exceptions_.size()) {
        debug("{} rejected {} sources for {} exceptions", *through, group.sources_.size(), group.exceptions_.size());
        throw source_count_mismatch_error(group.sources_.size(), group.exceptions_.size());
    }

    group.kind_ = through->get_or_create(group.member_kinds_, false);
    if (through->is_specialized() && !exgroup::matches(*through, *group.kind_)) {
        throw invalid_specialization(fmt::format("members {} do not match {}", *group.kind_, *through));
    }

    group.rendered_ = fmt::format("{}", fmt::join(descriptions, ", "));
    return group;
}

std::string exception_group::to_string() const { return fmt::format("<{}: {}>", kind_->base_name(), rendered_); }

exception_group exception_group::copy() const {
    auto group = create(kind_, message_, exceptions_, sources_, origin_);
    // set_cause 会改写 suppress_context，所以最后复制
    group.set_cause(cause_);
    group.set_context(context_);
    group.set_suppress_context(suppress_context_);
    return group;
}

group_split exception_group::split(const std::vector<const error_kind*>& kinds) const {
    if (std::any_of(kinds.begin(), kinds.end(), [](const error_kind* kind) { return kind == nullptr; })) {
        throw invalid_specialization(fmt::format("{} cannot split by a null kind", kind_->base_name()));
    }

    std::vector<bool> selected;
    selected.reserve(member_kinds_.size());
    for (const auto* member : member_kinds_) {
        selected.push_back(
            std::any_of(kinds.begin(), kinds.end(), [member](const error_kind* kind) { return member->is_subtype_of(*kind); }));
    }
    return split_by(selected);
}

group_split exception_group::split_if(const std::function<bool(const std::exception&)>& predicate) const {
    std::vector<bool> selected;
    selected.reserve(exceptions_.size());
    for (const auto& ptr : exceptions_) {
        // 成员在构造时已确认是 std::exception
        try {
            std::rethrow_exception(ptr);
        } catch (const std::exception& e) {
            selected.push_back(predicate(e));
        }
    }
    return split_by(selected);
}

group_split exception_group::split_by(const std::vector<bool>& selected) const {
    std::vector<std::exception_ptr> matched;
    std::vector<std::string> matched_sources;
    std::vector<std::exception_ptr> remaining;
    std::vector<std::string> remaining_sources;
    for (size_t i = 0; i < exceptions_.size(); ++i) {
        if (selected[i]) {
            matched.push_back(exceptions_[i]);
            matched_sources.push_back(sources_[i]);
        } else {
            remaining.push_back(exceptions_[i]);
            remaining_sources.push_back(sources_[i]);
        }
    }

    // 拆出的 group 属于同一家族，异常链与原 group 相同
    const auto root = kind_->get_or_create({}, true);
    const auto derive = [&](std::vector<std::exception_ptr>& exceptions,
                            std::vector<std::string>& sources) -> std::optional<exception_group> {
        if (exceptions.empty()) {
            return std::nullopt;
        }

        auto group = create(root, message_, std::move(exceptions), std::move(sources), origin_);
        group.set_cause(cause_);
        group.set_context(context_);
        group.set_suppress_context(suppress_context_);
        return group;
    };

    group_split result{derive(matched, matched_sources), derive(remaining, remaining_sources)};
    trace("{} split into {} matched and {} remaining", *kind_, result.match ? result.match->exceptions().size() : 0,
          result.rest ? result.rest->exceptions().size() : 0);
    return result;
}

}  // namespace exgroup
