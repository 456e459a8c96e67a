#pragma once

#include "route.hpp"

#include <span>

namespace fileroute {
    auto resolve_route(const scoped_route& entry) -> resolved_route;

    /// Strict weak ordering of the emitted table: path precedence first,
    /// then pattern text, method and source, so that equal input always
    /// produces the same order.
    auto dispatch_order(const resolved_route& a, const resolved_route& b)
        -> bool;

    auto assemble(std::span<const scoped_route> routes) -> route_table;
}
