#pragma once

#include "matcher.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fileroute {
    /// Callables a transport registers under the opaque references carried
    /// by the table.
    template <typename Handler>
    struct registry {
        using transform = std::function<Handler(Handler)>;

        std::unordered_map<std::string, Handler> handlers;
        std::unordered_map<std::string, transform> transforms;

        auto handler(std::string name, Handler h) -> registry& {
            handlers.insert_or_assign(std::move(name), std::move(h));
            return *this;
        }

        auto middleware(std::string name, transform t) -> registry& {
            transforms.insert_or_assign(std::move(name), std::move(t));
            return *this;
        }
    };

    /// Wraps a handler in a chain. The last entry is applied first so the
    /// entry nearest the root ends up outermost.
    template <typename Handler>
    auto compose(
        const middleware_chain& chain,
        Handler handler,
        const registry<Handler>& callables
    ) -> Handler {
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            const auto transform = callables.transforms.find(it->transform);

            if (transform == callables.transforms.end()) {
                throw error(
                    "No middleware registered as '{}' (declared by '{}')",
                    it->transform,
                    it->source
                );
            }

            handler = transform->second(std::move(handler));
        }

        return handler;
    }

    template <typename Handler>
    struct bound_match {
        const Handler* handler;
        fileroute::match match;
    };

    /// A route table with every entry bound to its composed handler.
    template <typename Handler>
    class dispatch_table {
        route_table routes;
        std::vector<Handler> handlers;
    public:
        dispatch_table(
            route_table&& routes,
            const registry<Handler>& callables
        ) :
            routes(std::forward<route_table>(routes))
        {
            handlers.reserve(this->routes.size());

            for (const auto& route : this->routes) {
                const auto handler = callables.handlers.find(route.handler);

                if (handler == callables.handlers.end()) {
                    throw error(
                        "No handler registered as '{}' for {}",
                        route.handler,
                        route
                    );
                }

                handlers.push_back(
                    compose(route.middleware, handler->second, callables)
                );
            }
        }

        auto allowed(std::string_view path) const -> std::vector<method> {
            return matcher(routes).allowed(path);
        }

        auto find(method m, std::string_view path) const
            -> std::optional<bound_match<Handler>>
        {
            auto result = matcher(routes).find(m, path);
            if (!result) return std::nullopt;

            const auto* handler = &handlers[result->index];

            return bound_match<Handler> {
                .handler = handler,
                .match = std::move(*result)
            };
        }

        auto table() const noexcept -> const route_table& {
            return routes;
        }
    };
}
