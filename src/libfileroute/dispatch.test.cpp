#include "test.hpp"

#include <gtest/gtest.h>

using fileroute::method;
using fileroute::middleware_mode;
using fileroute::test::declare;

namespace {
    using handler = std::function<std::string(const fileroute::path_params&)>;
    using registry = fileroute::registry<handler>;

    auto wrap(std::string name) -> registry::transform {
        return [name = std::move(name)](handler next) -> handler {
            return [name, next = std::move(next)](
                const fileroute::path_params& params
            ) {
                return name + "(" + next(params) + ")";
            };
        };
    }

    auto reply(std::string text) -> handler {
        return [text = std::move(text)](const fileroute::path_params& params) {
            auto result = text;

            for (const auto& [key, value] : params) {
                result += fmt::format(" {}={}", key, value);
            }

            return result;
        };
    }

    auto declarations() -> std::vector<fileroute::declaration> {
        auto result = std::vector<fileroute::declaration> {
            declare("_middleware.rs", middleware_mode::overlay, "log"),
            declare("api/_middleware.rs", middleware_mode::overlay, "auth"),
            declare("api/public/_middleware.rs", middleware_mode::override, "cors"),
            declare("index.get.rs"),
            declare("api/users/[id].get.rs"),
            declare("api/public/status.get.rs")
        };

        for (auto& decl : result) decl.handler = decl.source;

        return result;
    }

    auto callables() -> registry {
        auto result = registry();

        result
            .handler("index.get.rs", reply("home"))
            .handler("api/users/[id].get.rs", reply("user"))
            .handler("api/public/status.get.rs", reply("status"))
            .middleware("log", wrap("log"))
            .middleware("auth", wrap("auth"))
            .middleware("cors", wrap("cors"));

        return result;
    }
}

TEST(Dispatch, ComposeRootOutermost) {
    const auto chain = fileroute::middleware_chain {
        {.scope = "/", .transform = "log"},
        {.scope = "/api", .transform = "auth"}
    };

    const auto composed = fileroute::compose(chain, reply("ok"), callables());

    EXPECT_EQ("log(auth(ok))", composed({}));
}

TEST(Dispatch, ComposeMissingTransform) {
    const auto chain = fileroute::middleware_chain {
        {.scope = "/", .transform = "metrics", .source = "_middleware.rs"}
    };

    EXPECT_THROW(
        fileroute::compose(chain, reply("ok"), callables()),
        fileroute::error
    );
}

TEST(Dispatch, FindBindsComposedHandler) {
    const auto table = fileroute::dispatch_table<handler>(
        fileroute::test::resolve(declarations()),
        callables()
    );

    const auto user = table.find(method::get, "/api/users/7");
    ASSERT_TRUE(user);
    EXPECT_EQ("log(auth(user id=7))", (*user->handler)(user->match.params));

    const auto status = table.find(method::get, "/api/public/status");
    ASSERT_TRUE(status);
    EXPECT_EQ("cors(status)", (*status->handler)(status->match.params));

    const auto home = table.find(method::get, "/");
    ASSERT_TRUE(home);
    EXPECT_EQ("log(home)", (*home->handler)(home->match.params));

    EXPECT_FALSE(table.find(method::post, "/"));
    EXPECT_EQ(
        std::vector<method> {method::get},
        table.allowed("/api/users/7")
    );
}

TEST(Dispatch, MissingHandler) {
    auto incomplete = callables();
    incomplete.handlers.erase("index.get.rs");

    EXPECT_THROW(
        fileroute::dispatch_table<handler>(
            fileroute::test::resolve(declarations()),
            incomplete
        ),
        fileroute::error
    );
}

TEST(Dispatch, MissingMiddleware) {
    auto incomplete = callables();
    incomplete.transforms.erase("auth");

    EXPECT_THROW(
        fileroute::dispatch_table<handler>(
            fileroute::test::resolve(declarations()),
            incomplete
        ),
        fileroute::error
    );
}
