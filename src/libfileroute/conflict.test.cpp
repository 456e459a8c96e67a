#include "test.hpp"

#include <gtest/gtest.h>

using fileroute::error_kind;
using fileroute::segment;
using fileroute::segment_kind;
using fileroute::test::declare;
using fileroute::test::failure;

namespace {
    auto path(std::string_view pattern) -> std::vector<segment> {
        auto result = std::vector<segment>();

        auto slash = pattern.find('/', 1);
        auto component = pattern.substr(1, slash - 1);

        while (!component.empty()) {
            auto kind = segment_kind::static_segment;

            if (component.starts_with(':')) kind = segment_kind::dynamic;
            if (component.starts_with('*')) kind = segment_kind::catch_all;

            if (kind != segment_kind::static_segment) {
                component = component.substr(1);
            }

            result.push_back({kind, std::string(component)});

            if (slash == std::string_view::npos) break;

            pattern = pattern.substr(slash);
            slash = pattern.find('/', 1);
            component = pattern.substr(1, slash - 1);
        }

        return result;
    }

    auto precedes(std::string_view a, std::string_view b) -> bool {
        return fileroute::compare_precedence(path(a), path(b)) < 0;
    }
}

TEST(Precedence, StaticBeforeDynamicBeforeCatchAll) {
    EXPECT_TRUE(precedes("/users/me", "/users/:id"));
    EXPECT_TRUE(precedes("/users/:id", "/users/*rest"));
    EXPECT_TRUE(precedes("/users/me", "/users/*rest"));
    EXPECT_FALSE(precedes("/users/:id", "/users/me"));
}

TEST(Precedence, EvaluatedLeftToRight) {
    EXPECT_TRUE(precedes("/a/:x", "/:y/b"));
    EXPECT_TRUE(precedes("/users/:id/*rest", "/users/*rest"));
    EXPECT_TRUE(precedes("/posts/new/:draft", "/posts/:id/edit"));
}

TEST(Precedence, PrefixFirst) {
    EXPECT_TRUE(precedes("/", "/users"));
    EXPECT_TRUE(precedes("/users", "/users/:id"));
}

TEST(Precedence, ParameterNamesIgnored) {
    EXPECT_EQ(
        std::strong_ordering::equal,
        fileroute::compare_precedence(path("/:id"), path("/:uid"))
    );
}

TEST(Shape, DynamicNamesErased) {
    EXPECT_EQ("/users/:", fileroute::shape(path("/users/:id")));
    EXPECT_EQ("/posts/*", fileroute::shape(path("/posts/*slug")));
    EXPECT_EQ("/", fileroute::shape({}));
}

TEST(Conflict, DuplicateRouteNamesBothSources) {
    const auto diagnostics = failure({
        declare("users/[id].get.rs"),
        declare("users/[uid].get.rs")
    });

    ASSERT_EQ(1, diagnostics.size());

    const auto& diag = diagnostics.front();
    EXPECT_EQ(error_kind::duplicate_route, diag.kind);
    EXPECT_NE(std::string::npos, diag.message.find("users/[id].get.rs"));
    EXPECT_NE(std::string::npos, diag.message.find("users/[uid].get.rs"));
}

TEST(Conflict, DuplicateLiteralPath) {
    const auto diagnostics = failure({
        declare("users.get.rs"),
        declare("users/index.get.rs")
    });

    ASSERT_EQ(1, diagnostics.size());
    EXPECT_EQ(error_kind::duplicate_route, diagnostics.front().kind);
}

TEST(Conflict, DirectoryAndFileParameters) {
    const auto diagnostics = failure({
        declare("users/[id].get.rs"),
        declare("users/[key]/index.get.rs")
    });

    ASSERT_EQ(1, diagnostics.size());
    EXPECT_EQ(error_kind::duplicate_route, diagnostics.front().kind);
}

TEST(Conflict, SameShapeDifferentMethods) {
    EXPECT_TRUE(failure({
        declare("users/[id].get.rs"),
        declare("users/[id].delete.rs"),
        declare("users/[id].put.rs")
    }).empty());
}

TEST(Conflict, CatchAllClosesPosition) {
    const auto diagnostics = failure({
        declare("posts/[...slug].get.rs"),
        declare("posts/[id].get.rs")
    });

    ASSERT_EQ(1, diagnostics.size());
    EXPECT_EQ(error_kind::path_conflict, diagnostics.front().kind);
    EXPECT_EQ("posts/[id].get.rs", diagnostics.front().path);
}

TEST(Conflict, CatchAllAndStaticSibling) {
    const auto diagnostics = failure({
        declare("posts/[...slug].get.rs"),
        declare("posts/latest.get.rs"),
        declare("posts/[id].get.rs")
    });

    ASSERT_EQ(2, diagnostics.size());

    for (const auto& diag : diagnostics) {
        EXPECT_EQ(error_kind::path_conflict, diag.kind);
    }
}

TEST(Conflict, CatchAllAllowsOtherMethodsAndDeeperRoutes) {
    EXPECT_TRUE(failure({
        declare("posts/index.get.rs"),
        declare("posts/[...slug].get.rs"),
        declare("posts/[id].delete.rs"),
        declare("posts/archive/[year].get.rs")
    }).empty());
}

TEST(Conflict, AmbiguousParameterName) {
    const auto diagnostics = failure({
        declare("users/[id]/posts/[id].get.rs")
    });

    ASSERT_EQ(1, diagnostics.size());
    EXPECT_EQ(error_kind::ambiguous_parameter_name, diagnostics.front().kind);
    EXPECT_EQ("users/[id]/posts/[id].get.rs", diagnostics.front().path);
}

TEST(Conflict, CollectsEveryConflict) {
    const auto diagnostics = failure({
        declare("a/[x]/[x].get.rs"),
        declare("b.get.rs"),
        declare("b/index.get.rs"),
        declare("c/[...rest].get.rs"),
        declare("c/[id].get.rs")
    });

    ASSERT_EQ(3, diagnostics.size());
    EXPECT_EQ(error_kind::ambiguous_parameter_name, diagnostics[0].kind);
    EXPECT_EQ(error_kind::duplicate_route, diagnostics[1].kind);
    EXPECT_EQ(error_kind::path_conflict, diagnostics[2].kind);
}
