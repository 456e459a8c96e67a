#include <fileroute/descriptor.hpp>

#include <fmt/format.h>
#include <timber/timber>

namespace fileroute {
    namespace {
        auto is_param_char(char c) noexcept -> bool {
            return
                (c >= 'a' && c <= 'z') ||
                (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') ||
                c == '_';
        }

        auto valid_param(std::string_view name) noexcept -> bool {
            if (name.empty()) return false;

            for (const auto c : name) {
                if (!is_param_char(c)) return false;
            }

            return true;
        }

        [[noreturn]]
        auto invalid(const declaration& decl, std::string&& message) -> void {
            throw declaration_error({
                .kind = error_kind::invalid_file_name,
                .path = decl.source,
                .message = std::move(message)
            });
        }
    }

    auto segment::is_param() const noexcept -> bool {
        return kind != segment_kind::static_segment;
    }

    auto to_string(middleware_mode mode) noexcept -> std::string_view {
        switch (mode) {
            case middleware_mode::overlay: return "overlay";
            case middleware_mode::override: return "override";
        }

        return "unknown";
    }

    auto declares_middleware(
        std::string_view name,
        const options& opts
    ) noexcept -> bool {
        const auto& marker = opts.middleware_marker;

        if (!name.starts_with(marker)) return false;
        if (name.size() == marker.size()) return true;

        return name[marker.size()] == '.';
    }

    auto parse_segment(std::string_view name) -> std::optional<segment> {
        if (name.empty()) return std::nullopt;

        if (name.front() == '[') {
            if (name.size() < 3 || name.back() != ']') return std::nullopt;

            auto inner = name.substr(1, name.size() - 2);
            auto kind = segment_kind::dynamic;

            if (inner.starts_with("...")) {
                inner = inner.substr(3);
                kind = segment_kind::catch_all;
            }

            if (!valid_param(inner)) return std::nullopt;

            return segment {
                .kind = kind,
                .name = std::string(inner)
            };
        }

        for (const auto c : name) {
            if (c == '[' || c == ']' || c == ':' || c == '*' || c == '/') {
                return std::nullopt;
            }
        }

        return segment {
            .kind = segment_kind::static_segment,
            .name = std::string(name)
        };
    }

    auto parse_declaration(
        const declaration& decl,
        const options& opts
    ) -> parsed_declaration {
        auto result = parsed_declaration {
            .directory = decl.directory,
            .name = decl.name
        };

        for (const auto& component : decl.directory) {
            auto seg = parse_segment(component);

            if (!seg) {
                invalid(decl, fmt::format(
                    "directory name '{}' is not a valid path segment",
                    component
                ));
            }

            result.scope.push_back(std::move(*seg));
        }

        const auto name_view = std::string_view(decl.name);

        if (declares_middleware(name_view, opts)) {
            const auto suffix = name_view.substr(opts.middleware_marker.size());

            if (suffix == ".") {
                invalid(decl, fmt::format(
                    "'{}' has an empty extension",
                    decl.name
                ));
            }

            if (suffix.find('.', 1) != std::string_view::npos) {
                invalid(decl, fmt::format(
                    "'{}' declarations take no method suffix",
                    opts.middleware_marker
                ));
            }

            result.value = middleware_spec {
                .mode = decl.mode,
                .transform = decl.transform.empty() ?
                    decl.source : decl.transform,
                .source = decl.source
            };

            return result;
        }

        // The method and extension are the last two dot-separated tokens.
        // Anything before them is the route name, dots included.
        auto name = name_view;
        auto method_token = std::string_view();

        if (const auto ext = name.rfind('.'); ext != std::string_view::npos) {
            if (ext + 1 == name.size()) {
                invalid(decl, fmt::format(
                    "'{}' has an empty extension",
                    decl.name
                ));
            }

            name = name.substr(0, ext);

            const auto dot = name.rfind('.');

            if (dot != std::string_view::npos) {
                method_token = name.substr(dot + 1);
                name = name.substr(0, dot);

                if (name.empty() || method_token.empty()) {
                    invalid(decl, fmt::format(
                        "'{}' contains an empty name component",
                        decl.name
                    ));
                }
            }
        }

        if (method_token.empty() && name != opts.index_name) {
            invalid(decl, fmt::format(
                "'{}' does not match <name>.<method>.<ext>",
                decl.name
            ));
        }

        auto route = route_descriptor {
            .source = decl.source,
            .handler = decl.handler.empty() ? decl.source : decl.handler
        };

        if (!method_token.empty()) {
            const auto m = parse_method(method_token, opts.aliases);

            if (!m) {
                throw declaration_error({
                    .kind = error_kind::unknown_method,
                    .path = decl.source,
                    .message = fmt::format(
                        "unknown HTTP method '{}'",
                        method_token
                    )
                });
            }

            route.method = *m;
        }

        if (name != opts.index_name) {
            auto leaf = parse_segment(name);

            if (!leaf) {
                invalid(decl, fmt::format(
                    "'{}' is not a valid path segment",
                    name
                ));
            }

            route.leaf = std::move(*leaf);
        }

        for (auto i = 0ul; i < result.scope.size(); ++i) {
            const auto is_last =
                !route.leaf && i + 1 == result.scope.size();

            if (result.scope[i].kind == segment_kind::catch_all && !is_last) {
                invalid(decl, fmt::format(
                    "catch-all segment '{}' must be the last path segment",
                    decl.directory[i]
                ));
            }
        }

        TIMBER_TRACE(
            "{} declares {} {}",
            decl.source,
            route.method,
            route.leaf ? fmt::to_string(*route.leaf) : "(index)"
        );

        result.value = std::move(route);
        return result;
    }

    auto parse_declarations(
        std::span<const declaration> declarations,
        const options& opts
    ) -> std::vector<parsed_declaration> {
        auto result = std::vector<parsed_declaration>();
        auto diagnostics = std::vector<diagnostic>();

        result.reserve(declarations.size());

        for (const auto& decl : declarations) {
            try {
                result.push_back(parse_declaration(decl, opts));
            }
            catch (const declaration_error& ex) {
                diagnostics.push_back(ex.diagnostic());
            }
        }

        if (!diagnostics.empty()) {
            throw build_failure(build_stage::parse, std::move(diagnostics));
        }

        return result;
    }

    auto format_pattern(std::span<const segment> segments) -> std::string {
        if (segments.empty()) return "/";

        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        for (const auto& seg : segments) fmt::format_to(out, "/{}", seg);

        return fmt::to_string(buffer);
    }
}
