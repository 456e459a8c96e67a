#include <fileroute/assembler.hpp>
#include <fileroute/conflict.hpp>

#include <algorithm>
#include <timber/timber>
#include <tuple>

namespace fileroute {
    auto resolve_route(const scoped_route& entry) -> resolved_route {
        auto params = std::vector<std::string>();

        for (const auto& seg : entry.segments) {
            if (seg.is_param()) params.push_back(seg.name);
        }

        return resolved_route {
            .pattern = format_pattern(entry.segments),
            .method = entry.route.method,
            .segments = entry.segments,
            .params = std::move(params),
            .middleware = entry.chain,
            .handler = entry.route.handler,
            .source = entry.route.source
        };
    }

    auto dispatch_order(const resolved_route& a, const resolved_route& b)
        -> bool
    {
        const auto precedence = compare_precedence(a.segments, b.segments);
        if (precedence != 0) return precedence < 0;

        return
            std::tie(a.pattern, a.method, a.source) <
            std::tie(b.pattern, b.method, b.source);
    }

    auto assemble(std::span<const scoped_route> routes) -> route_table {
        auto entries = std::vector<resolved_route>();
        entries.reserve(routes.size());

        for (const auto& entry : routes) {
            entries.push_back(resolve_route(entry));
        }

        std::sort(entries.begin(), entries.end(), dispatch_order);

        for (const auto& route : entries) {
            TIMBER_DEBUG(
                "{} -> {} ({} middleware)",
                route,
                route.handler,
                route.middleware.size()
            );
        }

        return route_table(std::move(entries));
    }
}
