#pragma once

#include "scope.hpp"

#include <string>
#include <vector>

namespace fileroute {
    struct middleware_ref {
        std::string scope;
        std::string transform;
        middleware_mode mode = middleware_mode::overlay;
        std::string source;

        auto operator==(const middleware_ref& other) const -> bool = default;
    };

    /// Ordered root to leaf; entries nearer the root wrap outermost.
    using middleware_chain = std::vector<middleware_ref>;

    /// A route with its full path and the chain it inherits.
    struct scoped_route {
        std::vector<segment> segments;
        route_descriptor route;
        middleware_chain chain;
    };

    /// One step of the root to leaf fold. Overlay appends the scope's
    /// transform to the inherited chain; override replaces the chain with
    /// the transform alone; a scope without middleware passes it through.
    auto fold(
        middleware_chain chain,
        const std::optional<middleware_spec>& spec,
        std::string_view scope
    ) -> middleware_chain;

    /// Computes the effective chain of every route in the tree. Routes come
    /// out in tree order: a scope's own routes before its children's.
    auto resolve_middleware(const scope_node& root) -> std::vector<scoped_route>;

    /// Lists the scopes of a chain, such as "/ -> /api".
    auto to_string(const middleware_chain& chain) -> std::string;
}
