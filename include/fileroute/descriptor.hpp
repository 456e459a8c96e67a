#pragma once

#include "error.hpp"
#include "method.hpp"
#include "options.hpp"

#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace fileroute {
    enum class segment_kind {
        static_segment,
        dynamic,
        catch_all
    };

    struct segment {
        segment_kind kind = segment_kind::static_segment;
        std::string name;

        auto operator==(const segment& other) const -> bool = default;

        auto is_param() const noexcept -> bool;
    };

    enum class middleware_mode {
        overlay,
        override
    };

    auto to_string(middleware_mode mode) noexcept -> std::string_view;

    /// One entry of the input collection: a name found at some position of
    /// the declared hierarchy. Handler and transform references are opaque
    /// and default to the source location.
    struct declaration {
        std::vector<std::string> directory;
        std::string name;
        std::string source;
        std::string handler;
        middleware_mode mode = middleware_mode::overlay;
        std::string transform;
    };

    struct route_descriptor {
        std::optional<segment> leaf;
        fileroute::method method = fileroute::method::get;
        std::string source;
        std::string handler;
    };

    struct middleware_spec {
        middleware_mode mode = middleware_mode::overlay;
        std::string transform;
        std::string source;
    };

    struct parsed_declaration {
        std::vector<std::string> directory;
        std::vector<segment> scope;
        std::string name;
        std::variant<route_descriptor, middleware_spec> value;
    };

    auto declares_middleware(
        std::string_view name,
        const options& opts
    ) noexcept -> bool;

    /// Returns std::nullopt for names that are not a valid path segment.
    auto parse_segment(std::string_view name) -> std::optional<segment>;

    /// Throws declaration_error describing the first problem found.
    auto parse_declaration(
        const declaration& decl,
        const options& opts
    ) -> parsed_declaration;

    /// Parses every declaration, reporting all failures together as a
    /// build_failure of the parse stage.
    auto parse_declarations(
        std::span<const declaration> declarations,
        const options& opts
    ) -> std::vector<parsed_declaration>;

    auto format_pattern(std::span<const segment> segments) -> std::string;
}

template <>
struct fmt::formatter<fileroute::middleware_mode> :
    formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(fileroute::middleware_mode mode, FormatContext& ctx) const {
        return formatter<std::string_view>::format(
            fileroute::to_string(mode),
            ctx
        );
    }
};

template <>
struct fmt::formatter<fileroute::segment> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const fileroute::segment& seg, FormatContext& ctx) const {
        auto prefix = std::string_view();

        switch (seg.kind) {
            case fileroute::segment_kind::static_segment: prefix = ""; break;
            case fileroute::segment_kind::dynamic: prefix = ":"; break;
            case fileroute::segment_kind::catch_all: prefix = "*"; break;
        }

        return formatter<std::string_view>::format(
            fmt::format("{}{}", prefix, seg.name),
            ctx
        );
    }
};
