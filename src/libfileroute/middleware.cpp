#include <fileroute/middleware.hpp>

#include <fmt/ranges.h>
#include <timber/timber>

namespace fileroute {
    namespace {
        auto walk(
            const scope_node& node,
            std::vector<segment>& prefix,
            const middleware_chain& inherited,
            std::vector<scoped_route>& routes
        ) -> void {
            const auto chain = fold(
                inherited,
                node.middleware(),
                format_pattern(prefix)
            );

            for (const auto& route : node.routes()) {
                auto segments = prefix;
                if (route.leaf) segments.push_back(*route.leaf);

                TIMBER_TRACE(
                    "{} {} inherits {}",
                    route.method,
                    format_pattern(segments),
                    to_string(chain)
                );

                routes.push_back(scoped_route {
                    .segments = std::move(segments),
                    .route = route,
                    .chain = chain
                });
            }

            for (const auto& [name, child] : node.children()) {
                prefix.push_back(*child->path_segment());
                walk(*child, prefix, chain, routes);
                prefix.pop_back();
            }
        }
    }

    auto fold(
        middleware_chain chain,
        const std::optional<middleware_spec>& spec,
        std::string_view scope
    ) -> middleware_chain {
        if (!spec) return chain;

        if (spec->mode == middleware_mode::override) chain.clear();

        chain.push_back(middleware_ref {
            .scope = std::string(scope),
            .transform = spec->transform,
            .mode = spec->mode,
            .source = spec->source
        });

        return chain;
    }

    auto resolve_middleware(const scope_node& root)
        -> std::vector<scoped_route>
    {
        auto routes = std::vector<scoped_route>();
        auto prefix = std::vector<segment>();

        routes.reserve(root.route_count());
        walk(root, prefix, middleware_chain(), routes);

        return routes;
    }

    auto to_string(const middleware_chain& chain) -> std::string {
        if (chain.empty()) return "(none)";

        auto scopes = std::vector<std::string_view>();
        scopes.reserve(chain.size());

        for (const auto& ref : chain) scopes.push_back(ref.scope);

        return fmt::format("{}", fmt::join(scopes, " -> "));
    }
}
