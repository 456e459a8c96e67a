#include "test.hpp"

#include <gtest/gtest.h>

using fileroute::method;
using fileroute::test::declare;
using fileroute::test::resolve;

namespace {
    auto patterns(const fileroute::route_table& table)
        -> std::vector<std::string>
    {
        auto result = std::vector<std::string>();

        for (const auto& route : table) {
            result.push_back(fmt::to_string(route));
        }

        return result;
    }
}

TEST(Assembler, DynamicSegment) {
    const auto table = resolve({declare("users/[id].get.rs")});

    ASSERT_EQ(1, table.size());
    EXPECT_EQ("/users/:id", table[0].pattern);
    EXPECT_EQ(method::get, table[0].method);
    EXPECT_EQ(std::vector<std::string> {"id"}, table[0].params);
    EXPECT_EQ("users/[id].get.rs", table[0].handler);
}

TEST(Assembler, CatchAllSegment) {
    const auto table = resolve({declare("posts/[...slug].get.rs")});

    ASSERT_EQ(1, table.size());
    EXPECT_EQ("/posts/*slug", table[0].pattern);
    EXPECT_EQ(std::vector<std::string> {"slug"}, table[0].params);
}

TEST(Assembler, IndexMapsToScopePath) {
    const auto table = resolve({
        declare("index.get.rs"),
        declare("users/index.post.rs")
    });

    EXPECT_EQ(
        (std::vector<std::string> {"GET /", "POST /users"}),
        patterns(table)
    );
}

TEST(Assembler, OrderedByPrecedence) {
    const auto table = resolve({
        declare("users/[...rest].post.rs"),
        declare("users/[id].delete.rs"),
        declare("users/[id]/posts.get.rs"),
        declare("users/me.get.rs"),
        declare("users/index.get.rs"),
        declare("users/[id].get.rs"),
        declare("index.get.rs")
    });

    EXPECT_EQ(
        (std::vector<std::string> {
            "GET /",
            "GET /users",
            "GET /users/me",
            "GET /users/:id",
            "DELETE /users/:id",
            "GET /users/:id/posts",
            "POST /users/*rest"
        }),
        patterns(table)
    );
}

TEST(Assembler, ParamsInPathOrder) {
    const auto table = resolve({
        declare("orgs/[org]/repos/[repo]/files/[...path].get.rs")
    });

    ASSERT_EQ(1, table.size());
    EXPECT_EQ("/orgs/:org/repos/:repo/files/*path", table[0].pattern);
    EXPECT_EQ(
        (std::vector<std::string> {"org", "repo", "path"}),
        table[0].params
    );
}

TEST(Assembler, HandlerReferencePassedThrough) {
    auto decl = declare("users.get.rs");
    decl.handler = "list_users";

    const auto table = resolve({decl});

    ASSERT_EQ(1, table.size());
    EXPECT_EQ("list_users", table[0].handler);
    EXPECT_EQ("users.get.rs", table[0].source);
}

TEST(Assembler, Summary) {
    const auto table = resolve({
        declare("_middleware.rs"),
        declare("api/_middleware.rs"),
        declare("api/users.get.rs"),
        declare("health.get.rs")
    });

    EXPECT_EQ(
        (std::vector<fileroute::route_summary> {
            {method::get, "/api/users", 2},
            {method::get, "/health", 1}
        }),
        table.summary()
    );
}

TEST(Assembler, ToString) {
    const auto table = resolve({
        declare("_middleware.rs"),
        declare("api/_middleware.rs"),
        declare("api/users.post.rs"),
        declare("index.get.rs")
    });

    EXPECT_EQ(
        "GET     /           /\n"
        "POST    /api/users  / -> /api\n",
        table.to_string()
    );
}

TEST(Assembler, JSON) {
    const auto table = resolve({
        declare("_middleware.rs", fileroute::middleware_mode::overlay, "log"),
        declare("users/[id].get.rs")
    });

    const auto json = nlohmann::json(table);
    const auto& route = json.at("routes").at(0);

    EXPECT_EQ("/users/:id", route.at("pattern").get<std::string>());
    EXPECT_EQ("GET", route.at("method").get<std::string>());
    EXPECT_EQ("id", route.at("params").at(0).get<std::string>());
    const auto& middleware = route.at("middleware").at(0);

    EXPECT_EQ("log", middleware.at("transform").get<std::string>());
    EXPECT_EQ("overlay", middleware.at("mode").get<std::string>());
    EXPECT_EQ("/", middleware.at("scope").get<std::string>());
}
