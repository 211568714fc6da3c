#include <exgroup/group/specialization.h>
#include <gtest/gtest.h>

#include <thread>

#include "test_kinds.h"

using namespace exgroup;

namespace {

const group_family& family() { return group_family::default_family(); }

}  // namespace

TEST(specialization, root) {
    const auto& root = family().root();
    ASSERT_TRUE(root);
    EXPECT_FALSE(root->is_specialized());
    EXPECT_TRUE(root->inclusive());
    EXPECT_EQ(root->name(), "exception_group");
    EXPECT_EQ(root->base_name(), "exception_group");
    EXPECT_EQ(family().name(), "exception_group");

    EXPECT_EQ(family().specialize({open_marker}), root);
    EXPECT_EQ(family().specialize({"..."}), root);
    EXPECT_EQ(family().get_or_create({}, true), root);
}

TEST(specialization, identity) {
    const auto a = family().specialize({kind_of<std::out_of_range>(), kind_of<std::runtime_error>()});
    const auto b = family().specialize({kind_of<std::runtime_error>(), kind_of<std::out_of_range>()});
    const auto c = family().specialize({"std::out_of_range", "std::runtime_error", "std::out_of_range"});
    const auto d = family().get_or_create({&kind_of<std::runtime_error>(), &kind_of<std::out_of_range>()}, false);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
    EXPECT_EQ(a, d);
    EXPECT_EQ(a->name(), "exception_group[std::out_of_range, std::runtime_error]");
    EXPECT_EQ(fmt::format("{}", *a), a->name());
    ASSERT_EQ(a->members().size(), 2);
    EXPECT_EQ(a->members()[0], &kind_of<std::out_of_range>());
    EXPECT_FALSE(a->inclusive());

    const auto open = family().specialize({kind_of<std::out_of_range>(), open_marker, kind_of<std::runtime_error>()});
    EXPECT_NE(open, a);
    EXPECT_TRUE(open->inclusive());
    EXPECT_EQ(open->name(), "exception_group[std::out_of_range, std::runtime_error, ...]");
    EXPECT_EQ(open, family().specialize({"std::runtime_error", "std::out_of_range", "..."}));
}

TEST(specialization, reclaim) {
    const group_family scratch("scratch_group");
    EXPECT_EQ(scratch.cache_size(), 0);
    {
        const auto a = scratch.specialize({kind_of<value_error>()});
        const auto b = scratch.specialize({kind_of<value_error>(), open_marker});
        EXPECT_EQ(scratch.cache_size(), 2);
        EXPECT_EQ(a->base_name(), "scratch_group");
    }
    EXPECT_EQ(scratch.cache_size(), 0);

    const auto first = scratch.specialize({kind_of<type_error>()});
    EXPECT_EQ(scratch.specialize({kind_of<type_error>()}), first);
    EXPECT_EQ(scratch.cache_size(), 1);

    // 条目移除后再次请求会创建新的形状并重新登记
    {
        const auto again = scratch.specialize({kind_of<value_error>()});
        EXPECT_EQ(again->name(), "scratch_group[value_error]");
        EXPECT_EQ(scratch.cache_size(), 2);
    }
    EXPECT_EQ(scratch.cache_size(), 1);
}

TEST(specialization, specialize_errors) {
    const auto spec = family().specialize({kind_of<value_error>()});
    EXPECT_THROW((void)spec->specialize({kind_of<type_error>()}), invalid_specialization);
    EXPECT_THROW((void)family().specialize({"no_such_error"}), invalid_specialization);
    EXPECT_THROW((void)family().specialize({static_cast<const error_kind*>(nullptr)}), invalid_specialization);
    EXPECT_THROW((void)family().specialize(std::vector<spec_arg>{}), invalid_specialization);
    EXPECT_THROW((void)family().get_or_create({}, false), invalid_specialization);
    EXPECT_THROW((void)family().get_or_create({nullptr}, true), invalid_specialization);
}

TEST(specialization, concurrent_create) {
    const group_family scratch("concurrent_group");
    constexpr int count = 8;
    std::vector<specialization_ptr> results(count);
    std::vector<std::thread> threads;
    threads.reserve(count);
    for (int i = 0; i < count; ++i) {
        threads.emplace_back([&scratch, &results, i] {
            for (int j = 0; j < 100; ++j) {
                results[i] = scratch.specialize({kind_of<key_error>(), kind_of<index_error>()});
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& result : results) {
        EXPECT_EQ(result, results.front());
    }
    EXPECT_EQ(scratch.cache_size(), 1);
}

TEST(matches, reflexive_and_base) {
    const group_family other("other_group");
    const auto spec = family().specialize({kind_of<value_error>()});
    const auto foreign = other.specialize({kind_of<value_error>()});

    EXPECT_TRUE(matches(spec, spec));
    EXPECT_TRUE(matches(family().root(), family().root()));
    EXPECT_FALSE(matches(spec, foreign));
    EXPECT_FALSE(matches(other.root(), spec));
    EXPECT_FALSE(matches(family().root(), foreign));
    EXPECT_FALSE(matches(spec, specialization_ptr()));
}

TEST(matches, unspecialized_filter) {
    const auto& root = family().root();
    EXPECT_TRUE(matches(root, family().specialize({kind_of<value_error>()})));
    EXPECT_TRUE(matches(root, family().specialize({kind_of<key_error>(), kind_of<std::domain_error>()})));
    EXPECT_FALSE(matches(family().specialize({kind_of<value_error>()}), root));
}

TEST(matches, covariance) {
    const auto value = family().specialize({kind_of<key_error>()});
    EXPECT_TRUE(matches(family().specialize({kind_of<lookup_error>()}), value));
    EXPECT_TRUE(matches(family().specialize({kind_of<lookup_error>(), open_marker}), value));
    EXPECT_TRUE(matches(family().specialize({kind_of<std::exception>()}), value));
    EXPECT_FALSE(matches(family().specialize({kind_of<index_error>()}), value));
    // 不是逆变
    EXPECT_FALSE(matches(value, family().specialize({kind_of<lookup_error>()})));
}

TEST(matches, multiple_members) {
    const auto value = family().specialize({kind_of<key_error>(), kind_of<std::runtime_error>()});
    EXPECT_TRUE(matches(family().specialize({kind_of<lookup_error>(), kind_of<std::runtime_error>()}), value));
    // 过于具体：runtime_error 之外还有 key_error
    EXPECT_FALSE(matches(family().specialize({kind_of<std::runtime_error>()}), value));
    EXPECT_FALSE(matches(family().specialize({kind_of<lookup_error>()}), value));
    EXPECT_TRUE(matches(family().specialize({kind_of<std::exception>()}), value));
    EXPECT_TRUE(matches(family().specialize({kind_of<lookup_error>(), open_marker}), value));

    // 两个成员同时落在同一个要求之下
    const auto lookups = family().specialize({kind_of<key_error>(), kind_of<index_error>()});
    EXPECT_TRUE(matches(family().specialize({kind_of<lookup_error>()}), lookups));
    EXPECT_FALSE(matches(family().specialize({kind_of<lookup_error>(), kind_of<value_error>()}), lookups));
}

TEST(matches, exactness) {
    const auto value = family().specialize({kind_of<value_error>(), kind_of<std::domain_error>()});
    EXPECT_FALSE(matches(family().specialize({kind_of<value_error>()}), value));
    EXPECT_FALSE(matches(family().specialize({kind_of<std::domain_error>()}), value));
    EXPECT_TRUE(matches(family().specialize({kind_of<std::domain_error>(), kind_of<value_error>()}), value));
    EXPECT_FALSE(matches(family().specialize({kind_of<value_error>(), kind_of<std::domain_error>(),
                                              kind_of<type_error>()}),
                         value));
}

TEST(matches, exact_member_set) {
    const auto value = family().specialize({kind_of<key_error>(), kind_of<std::runtime_error>(), kind_of<type_error>()});
    EXPECT_FALSE(matches(family().specialize({kind_of<key_error>(), kind_of<std::runtime_error>()}), value));
    EXPECT_TRUE(matches(family().specialize({kind_of<key_error>(), kind_of<std::runtime_error>(), open_marker}), value));
    EXPECT_TRUE(matches(
        family().specialize({kind_of<key_error>(), kind_of<std::runtime_error>(), kind_of<type_error>()}), value));
}

TEST(matches, inclusive) {
    const auto value = family().specialize({kind_of<value_error>(), kind_of<std::domain_error>()});
    EXPECT_TRUE(matches(family().specialize({kind_of<value_error>(), open_marker}), value));
    EXPECT_TRUE(matches(family().specialize({kind_of<std::domain_error>(), "..."}), value));
    EXPECT_FALSE(matches(family().specialize({kind_of<type_error>(), open_marker}), value));

    // 被匹配的一方是 inclusive 也只看成员
    const auto open_value = family().specialize({kind_of<value_error>(), open_marker});
    EXPECT_TRUE(matches(family().specialize({kind_of<value_error>()}), open_value));
}
