#pragma once

#include "descriptor.hpp"

#include <fmt/format.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fileroute {
    class scope_node {
        std::optional<segment> seg;
        std::vector<route_descriptor> declared;
        std::optional<middleware_spec> spec;
        std::map<std::string, std::unique_ptr<scope_node>> nodes;

        auto format_to(
            std::back_insert_iterator<fmt::memory_buffer>& out,
            int level
        ) const -> void;
    public:
        scope_node() = default;

        explicit scope_node(segment&& seg);

        auto child(std::string_view name) const -> const scope_node*;

        auto children() const noexcept
            -> const std::map<std::string, std::unique_ptr<scope_node>>&;

        /// Returns the named child, creating it for the given segment when
        /// it does not exist yet.
        auto emplace_child(std::string_view name, const segment& seg)
            -> scope_node&;

        auto add_route(route_descriptor&& route) -> void;

        auto middleware() const noexcept
            -> const std::optional<middleware_spec>&;

        /// Counts the middleware declarations in this subtree.
        auto middleware_count() const noexcept -> std::size_t;

        /// Throws declaration_error if this node already has middleware.
        auto set_middleware(middleware_spec&& spec) -> void;

        /// Removes every subtree that holds no routes. Returns whether this
        /// node itself is left without routes.
        auto prune() -> bool;

        auto route_count() const noexcept -> std::size_t;

        auto routes() const noexcept -> const std::vector<route_descriptor>&;

        auto path_segment() const noexcept -> const std::optional<segment>&;

        auto to_string() const -> std::string;
    };

    /// Assembles parsed declarations into a scope tree, visiting them in
    /// lexicographic order. Duplicate middleware declarations are reported
    /// together as a build_failure of the build stage.
    auto build_scope_tree(std::vector<parsed_declaration>&& declarations)
        -> scope_node;
}
