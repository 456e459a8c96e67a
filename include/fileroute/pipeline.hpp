#pragma once

#include "route.hpp"

#include <span>

namespace fileroute {
    /// Runs the parse and build stages. The first stage that fails throws a
    /// build_failure holding every diagnostic of that stage.
    auto build_tree(
        std::span<const declaration> declarations,
        const options& opts
    ) -> scope_node;

    /// Resolves middleware, validates and assembles an existing tree.
    /// Conflicts throw a build_failure of the validate stage.
    auto resolve(const scope_node& tree) -> route_table;

    /// Runs every stage in order; no table is produced if any fails.
    auto resolve(std::span<const declaration> declarations, const options& opts)
        -> route_table;

    /// Resolves the declarations found under opts.root_directory.
    auto resolve(const options& opts) -> route_table;
}
