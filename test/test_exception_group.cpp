#include <exgroup/group/exception_group.h>
#include <gtest/gtest.h>

#include "test_kinds.h"

using namespace exgroup;

namespace {

exception_group make_group() {
    return exception_group::create("many failures",
                                   {std::make_exception_ptr(value_error("bad value")),
                                    std::make_exception_ptr(std::domain_error("division by zero"))},
                                   {"worker 1", "worker 2"});
}

// 模拟 catch 一侧：不匹配时重新抛出
bool dispatch(const exception_group& group, const specialization_ptr& filter) {
    try {
        throw group;
    } catch (const exception_group& caught) {
        if (!caught.matches(filter)) {
            return false;
        }
        return caught.exceptions().size() == group.exceptions().size();
    }
}

}  // namespace

TEST(exception_group, create) {
    const auto group = make_group();
    EXPECT_EQ(group.message(), "many failures");
    ASSERT_EQ(group.exceptions().size(), 2);
    ASSERT_EQ(group.sources().size(), 2);
    EXPECT_EQ(group.sources()[1], "worker 2");
    ASSERT_EQ(group.member_kinds().size(), 2);
    EXPECT_EQ(group.member_kinds()[0], &kind_of<value_error>());
    EXPECT_EQ(group.member_kinds()[1], &kind_of<std::domain_error>());

    const auto& kind = group.kind();
    ASSERT_TRUE(kind);
    EXPECT_FALSE(kind->inclusive());
    EXPECT_EQ(kind, group_family::default_family().specialize({kind_of<std::domain_error>(), kind_of<value_error>()}));
    EXPECT_NE(std::string_view(group.origin().file_name()).find("test_exception_group.cpp"), std::string_view::npos);

    EXPECT_FALSE(group.cause());
    EXPECT_FALSE(group.context());
    EXPECT_FALSE(group.suppress_context());

    try {
        std::rethrow_exception(group.exceptions()[0]);
    } catch (const value_error& e) {
        EXPECT_STREQ(e.what(), "bad value");
    }
}

TEST(exception_group, same_kind_for_equal_member_sets) {
    const auto a = make_group();
    const auto b = exception_group::create("other order",
                                           {std::make_exception_ptr(std::domain_error("x")),
                                            std::make_exception_ptr(value_error("y")),
                                            std::make_exception_ptr(value_error("z"))},
                                           {"a", "b", "c"});
    EXPECT_EQ(a.kind(), b.kind());

    // 未注册的派生类按 key_error 计
    const auto c = exception_group::create("missing", {std::make_exception_ptr(missing_key_error("k"))}, {"lookup"});
    EXPECT_EQ(c.kind(), group_family::default_family().specialize({kind_of<key_error>()}));
}

TEST(exception_group, invalid_member) {
    try {
        (void)exception_group::create("bad",
                                      {std::make_exception_ptr(value_error("ok")),
                                       std::make_exception_ptr(std::string("not an error"))},
                                      {"a", "b"});
        FAIL() << "expected invalid_member_error";
    } catch (const invalid_member_error& e) {
        EXPECT_EQ(e.index(), 1);
        EXPECT_EQ(e.code(), group_errors::invalid_member);
    }

    EXPECT_THROW((void)exception_group::create("null", {std::exception_ptr()}, {"a"}), invalid_member_error);

    // 不支持嵌套
    const auto inner = make_group();
    EXPECT_THROW((void)exception_group::create("nested", {std::make_exception_ptr(inner)}, {"a"}), invalid_member_error);
}

TEST(exception_group, source_count_mismatch) {
    try {
        (void)exception_group::create("mismatch",
                                      {std::make_exception_ptr(value_error("a")),
                                       std::make_exception_ptr(type_error("b"))},
                                      {"only one"});
        FAIL() << "expected source_count_mismatch_error";
    } catch (const source_count_mismatch_error& e) {
        EXPECT_EQ(e.sources(), 1);
        EXPECT_EQ(e.exceptions(), 2);
        EXPECT_EQ(e.code(), group_errors::source_count_mismatch);
        EXPECT_NE(std::string(e.what()).find("different number of sources (1) and exceptions (2)"), std::string::npos);
    }
}

TEST(exception_group, empty) {
    EXPECT_THROW((void)exception_group::create("empty", {}, {}), empty_specialization_error);

    const auto spec = group_family::default_family().specialize({kind_of<value_error>()});
    try {
        (void)exception_group::create(spec, "empty", {}, {});
        FAIL() << "expected empty_specialization_error";
    } catch (const empty_specialization_error& e) {
        EXPECT_EQ(e.code(), group_errors::empty_specialization);
    }
}

TEST(exception_group, create_through_shape) {
    const auto& family = group_family::default_family();
    const auto lookups = family.specialize({kind_of<lookup_error>(), open_marker});

    const auto group = exception_group::create(
        lookups, "lookups", {std::make_exception_ptr(key_error("k")), std::make_exception_ptr(value_error("v"))},
        {"a", "b"});
    EXPECT_EQ(group.kind(), family.specialize({kind_of<key_error>(), kind_of<value_error>()}));
    EXPECT_TRUE(group.matches(lookups));

    EXPECT_THROW((void)exception_group::create(lookups, "no lookup", {std::make_exception_ptr(value_error("v"))}, {"a"}),
                 invalid_specialization);
    EXPECT_THROW((void)exception_group::create(specialization_ptr(), "null", {std::make_exception_ptr(value_error("v"))},
                                               {"a"}),
                 invalid_specialization);

    // 其他家族的 group 不会被默认家族的过滤器接受
    const group_family other("task_group");
    const auto foreign = exception_group::create(other.root(), "foreign", {std::make_exception_ptr(key_error("k"))}, {"a"});
    EXPECT_EQ(foreign.kind()->base_name(), "task_group");
    EXPECT_FALSE(foreign.matches(family.root()));
    EXPECT_FALSE(foreign.matches(lookups));
    EXPECT_TRUE(foreign.matches(other.root()));
}

TEST(exception_group, catch_emulation) {
    const auto& family = group_family::default_family();
    const auto group = make_group();

    EXPECT_TRUE(dispatch(group, family.root()));
    EXPECT_TRUE(dispatch(group, family.specialize({kind_of<std::domain_error>(), kind_of<value_error>()})));
    EXPECT_TRUE(dispatch(group, family.specialize({kind_of<value_error>(), kind_of<std::logic_error>()})));
    EXPECT_FALSE(dispatch(group, family.specialize({kind_of<std::runtime_error>(), kind_of<std::logic_error>()})));
    EXPECT_TRUE(dispatch(group, family.specialize({kind_of<value_error>(), open_marker})));
    EXPECT_FALSE(dispatch(group, family.specialize({kind_of<value_error>()})));
    EXPECT_FALSE(dispatch(group, family.specialize({kind_of<type_error>(), open_marker})));

    // 只处理 runtime_error 的过滤器不接受还含有 key_error 的 group
    const auto mixed = exception_group::create(
        "mixed", {std::make_exception_ptr(key_error("k")), std::make_exception_ptr(std::runtime_error("r"))}, {"a", "b"});
    EXPECT_FALSE(dispatch(mixed, family.specialize({kind_of<std::runtime_error>()})));
    EXPECT_TRUE(dispatch(mixed, family.specialize({kind_of<std::runtime_error>(), open_marker})));
}

TEST(exception_group, render) {
    const auto group = make_group();
    EXPECT_STREQ(group.what(), "value_error('bad value'), std::domain_error('division by zero')");
    EXPECT_EQ(group.to_string(), "<exception_group: value_error('bad value'), std::domain_error('division by zero')>");
    EXPECT_EQ(fmt::format("{}", group), group.to_string());

    // 未注册的类型显示实际类型名，kind 仍按 key_error 计
    const auto quoted = exception_group::create(
        "quoted", {std::make_exception_ptr(missing_key_error("it's")), std::make_exception_ptr(value_error("a\\b"))},
        {"a", "b"});
    EXPECT_STREQ(quoted.what(), "missing_key_error('it\\'s'), value_error('a\\\\b')");
    EXPECT_EQ(quoted.member_kinds()[0], &kind_of<key_error>());
}

TEST(exception_group, split) {
    auto group = exception_group::create("jobs failed",
                                         {std::make_exception_ptr(value_error("v")),
                                          std::make_exception_ptr(key_error("k")),
                                          std::make_exception_ptr(std::domain_error("d")),
                                          std::make_exception_ptr(index_error("i"))},
                                         {"a", "b", "c", "d"});
    const auto cause = std::make_exception_ptr(std::runtime_error("cause"));
    group.set_cause(cause);
    group.set_suppress_context(false);

    const auto [match, rest] = group.split({&kind_of<lookup_error>()});
    ASSERT_TRUE(match);
    ASSERT_TRUE(rest);
    EXPECT_EQ(match->sources(), (std::vector<std::string>{"b", "d"}));
    EXPECT_EQ(match->exceptions()[0], group.exceptions()[1]);
    EXPECT_EQ(match->kind(), group_family::default_family().specialize({kind_of<key_error>(), kind_of<index_error>()}));
    EXPECT_EQ(match->message(), "jobs failed");
    EXPECT_EQ(match->cause(), cause);
    EXPECT_FALSE(match->suppress_context());
    EXPECT_EQ(match->origin().line(), group.origin().line());

    EXPECT_EQ(rest->sources(), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(rest->exceptions()[1], group.exceptions()[2]);
    EXPECT_EQ(rest->kind(), group_family::default_family().specialize({kind_of<value_error>(), kind_of<std::domain_error>()}));
    EXPECT_EQ(rest->cause(), cause);

    const auto none = group.split({&kind_of<std::overflow_error>()});
    EXPECT_FALSE(none.match);
    ASSERT_TRUE(none.rest);
    EXPECT_EQ(none.rest->kind(), group.kind());
    EXPECT_EQ(none.rest->sources(), group.sources());

    const auto all = group.split({&kind_of<std::exception>()});
    ASSERT_TRUE(all.match);
    EXPECT_FALSE(all.rest);

    EXPECT_THROW((void)group.split({nullptr}), invalid_specialization);
}

TEST(exception_group, split_if) {
    const group_family tasks("task_group");
    const auto group = exception_group::create(
        tasks.root(), "tasks", {std::make_exception_ptr(value_error("retry")), std::make_exception_ptr(value_error("fatal"))},
        {"a", "b"});

    const auto [retry, other] =
        group.split_if([](const std::exception& e) { return std::string_view(e.what()) == "retry"; });
    ASSERT_TRUE(retry);
    ASSERT_TRUE(other);
    EXPECT_EQ(retry->sources(), std::vector<std::string>{"a"});
    EXPECT_EQ(other->sources(), std::vector<std::string>{"b"});
    EXPECT_EQ(retry->kind()->base_name(), "task_group");
    EXPECT_EQ(retry->kind(), other->kind());

    EXPECT_THROW((void)group.split_if([](const std::exception&) -> bool { throw std::out_of_range("predicate"); }),
                 std::out_of_range);
}

TEST(exception_group, copy) {
    auto group = make_group();
    const auto cause = std::make_exception_ptr(std::runtime_error("cause"));
    const auto context = std::make_exception_ptr(std::overflow_error("context"));
    group.set_context(context);
    group.set_cause(cause);
    EXPECT_TRUE(group.suppress_context());

    const auto copied = group.copy();
    EXPECT_EQ(copied.message(), group.message());
    EXPECT_EQ(copied.exceptions(), group.exceptions());
    EXPECT_EQ(copied.sources(), group.sources());
    EXPECT_EQ(copied.kind(), group.kind());
    EXPECT_EQ(copied.cause(), cause);
    EXPECT_EQ(copied.context(), context);
    EXPECT_TRUE(copied.suppress_context());
    EXPECT_EQ(copied.origin().line(), group.origin().line());
    EXPECT_STREQ(copied.what(), group.what());

    // set_cause 之后手动关闭 suppress_context，复制后保持 false
    group.set_suppress_context(false);
    const auto unsuppressed = group.copy();
    EXPECT_EQ(unsuppressed.cause(), cause);
    EXPECT_FALSE(unsuppressed.suppress_context());
}
