#pragma once

#include "middleware.hpp"

#include <compare>
#include <span>
#include <string>

namespace fileroute {
    /// Orders paths for first-match dispatch. Walking left to right, static
    /// segments come before dynamic ones and dynamic before catch-all;
    /// differing literals compare lexicographically and a path that is a
    /// prefix of another comes first.
    auto compare_precedence(
        std::span<const segment> a,
        std::span<const segment> b
    ) -> std::strong_ordering;

    /// Reduces a path to its segment kinds: '/users/:id' and '/users/:uid'
    /// share the shape '/users/:'.
    auto shape(std::span<const segment> segments) -> std::string;

    auto find_conflicts(std::span<const scoped_route> routes)
        -> std::vector<diagnostic>;

    /// Throws a build_failure of the validate stage listing every
    /// duplicate route, catch-all conflict and reused parameter name.
    auto check_conflicts(std::span<const scoped_route> routes) -> void;
}
