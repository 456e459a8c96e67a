#include <fileroute/scope.hpp>

#include <algorithm>
#include <timber/timber>
#include <tuple>

namespace fileroute {
    scope_node::scope_node(segment&& seg) :
        seg(std::forward<segment>(seg))
    {}

    auto scope_node::add_route(route_descriptor&& route) -> void {
        declared.push_back(std::forward<route_descriptor>(route));
    }

    auto scope_node::child(std::string_view name) const -> const scope_node* {
        const auto result = nodes.find(std::string(name));

        if (result == nodes.end()) return nullptr;
        return result->second.get();
    }

    auto scope_node::children() const noexcept
        -> const std::map<std::string, std::unique_ptr<scope_node>>&
    {
        return nodes;
    }

    auto scope_node::emplace_child(std::string_view name, const segment& seg)
        -> scope_node&
    {
        auto& node = nodes[std::string(name)];

        if (!node) node = std::make_unique<scope_node>(segment(seg));
        return *node;
    }

    auto scope_node::format_to(
        std::back_insert_iterator<fmt::memory_buffer>& out,
        int level
    ) const -> void {
        const auto indent = level * 2;
        for (auto i = 0; i < indent; ++i) fmt::format_to(out, " ");

        fmt::format_to(out, "{}", seg ? fmt::to_string(*seg) : "/");

        if (spec) {
            fmt::format_to(out, " [{} {}]", spec->mode, spec->transform);
        }

        fmt::format_to(out, "\n");

        for (const auto& route : declared) {
            for (auto i = 0; i < indent + 2; ++i) fmt::format_to(out, " ");

            fmt::format_to(
                out,
                "{} {}\n",
                route.method,
                route.leaf ? fmt::to_string(*route.leaf) : "(index)"
            );
        }

        for (const auto& [name, node] : nodes) node->format_to(out, level + 1);
    }

    auto scope_node::middleware() const noexcept
        -> const std::optional<middleware_spec>&
    {
        return spec;
    }

    auto scope_node::middleware_count() const noexcept -> std::size_t {
        auto count = std::size_t(spec ? 1 : 0);

        for (const auto& [name, node] : nodes) {
            count += node->middleware_count();
        }

        return count;
    }

    auto scope_node::path_segment() const noexcept
        -> const std::optional<segment>&
    {
        return seg;
    }

    auto scope_node::prune() -> bool {
        std::erase_if(nodes, [](auto& entry) {
            return entry.second->prune();
        });

        return declared.empty() && nodes.empty();
    }

    auto scope_node::route_count() const noexcept -> std::size_t {
        auto count = declared.size();

        for (const auto& [name, node] : nodes) count += node->route_count();

        return count;
    }

    auto scope_node::routes() const noexcept
        -> const std::vector<route_descriptor>&
    {
        return declared;
    }

    auto scope_node::set_middleware(middleware_spec&& spec) -> void {
        if (this->spec) {
            throw declaration_error({
                .kind = error_kind::duplicate_middleware,
                .path = spec.source,
                .message = fmt::format(
                    "scope already has middleware declared by '{}'",
                    this->spec->source
                )
            });
        }

        this->spec = std::forward<middleware_spec>(spec);
    }

    auto scope_node::to_string() const -> std::string {
        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        format_to(out, 0);

        return fmt::to_string(buffer);
    }

    auto build_scope_tree(std::vector<parsed_declaration>&& declarations)
        -> scope_node
    {
        std::sort(
            declarations.begin(),
            declarations.end(),
            [](const parsed_declaration& a, const parsed_declaration& b) {
                return
                    std::tie(a.directory, a.name) <
                    std::tie(b.directory, b.name);
            }
        );

        auto root = scope_node();
        auto diagnostics = std::vector<diagnostic>();

        for (auto& decl : declarations) {
            auto* node = &root;

            for (auto i = 0ul; i < decl.directory.size(); ++i) {
                node = &node->emplace_child(decl.directory[i], decl.scope[i]);
            }

            if (auto* route = std::get_if<route_descriptor>(&decl.value)) {
                node->add_route(std::move(*route));
                continue;
            }

            try {
                node->set_middleware(
                    std::move(std::get<middleware_spec>(decl.value))
                );
            }
            catch (const declaration_error& ex) {
                diagnostics.push_back(ex.diagnostic());
            }
        }

        if (!diagnostics.empty()) {
            throw build_failure(build_stage::build, std::move(diagnostics));
        }

        root.prune();

        TIMBER_DEBUG(
            "Scope tree holds {} route{}",
            root.route_count(),
            root.route_count() == 1 ? "" : "s"
        );

        return root;
    }
}
