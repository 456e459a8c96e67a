#include <fileroute/assembler.hpp>
#include <fileroute/conflict.hpp>
#include <fileroute/pipeline.hpp>
#include <fileroute/source.hpp>

#include <timber/timber>

namespace fileroute {
    namespace {
        auto report(const build_failure& failure) -> void {
            for (const auto& diag : failure.diagnostics()) {
                TIMBER_ERROR("{}", diag);
            }

            TIMBER_ERROR("{}", failure.what());
        }
    }

    auto build_tree(
        std::span<const declaration> declarations,
        const options& opts
    ) -> scope_node {
        TIMBER_DEBUG("Resolving {} route declarations", declarations.size());

        try {
            auto tree = build_scope_tree(
                parse_declarations(declarations, opts)
            );

            TIMBER_TRACE("Scope tree:\n{}", tree.to_string());

            return tree;
        }
        catch (const build_failure& failure) {
            report(failure);
            throw;
        }
    }

    auto resolve(const scope_node& tree) -> route_table {
        try {
            const auto routes = resolve_middleware(tree);
            check_conflicts(routes);

            auto table = assemble(routes);

            TIMBER_INFO(
                "Resolved {} route{} under {} middleware scope{}",
                table.size(),
                table.size() == 1 ? "" : "s",
                tree.middleware_count(),
                tree.middleware_count() == 1 ? "" : "s"
            );

            return table;
        }
        catch (const build_failure& failure) {
            report(failure);
            throw;
        }
    }

    auto resolve(std::span<const declaration> declarations, const options& opts)
        -> route_table
    {
        return resolve(build_tree(declarations, opts));
    }

    auto resolve(const options& opts) -> route_table {
        const auto declarations = directory_source(opts);
        return resolve(declarations, opts);
    }
}
