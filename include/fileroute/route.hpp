#pragma once

#include "middleware.hpp"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fileroute {
    struct resolved_route {
        std::string pattern;
        fileroute::method method = fileroute::method::get;
        std::vector<segment> segments;
        std::vector<std::string> params;
        middleware_chain middleware;
        std::string handler;
        std::string source;
    };

    struct route_summary {
        fileroute::method method = fileroute::method::get;
        std::string path;
        std::size_t middleware = 0;

        auto operator==(const route_summary& other) const -> bool = default;
    };

    /// The assembled dispatch table. Entries are sorted by dispatch
    /// precedence and never change after construction, so one table may be
    /// read from any number of threads.
    class route_table {
        std::vector<resolved_route> entries;
    public:
        using const_iterator = std::vector<resolved_route>::const_iterator;

        route_table() = default;

        explicit route_table(std::vector<resolved_route>&& entries);

        auto operator[](std::size_t index) const -> const resolved_route&;

        auto begin() const noexcept -> const_iterator;

        auto empty() const noexcept -> bool;

        auto end() const noexcept -> const_iterator;

        auto size() const noexcept -> std::size_t;

        auto summary() const -> std::vector<route_summary>;

        /// One line per route: method, pattern and middleware chain.
        auto to_string() const -> std::string;
    };

    auto to_json(nlohmann::json& json, const middleware_ref& ref) -> void;

    auto to_json(nlohmann::json& json, const resolved_route& route) -> void;

    auto to_json(nlohmann::json& json, const route_table& table) -> void;
}

template <>
struct fmt::formatter<fileroute::resolved_route> :
    formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const fileroute::resolved_route& route, FormatContext& ctx)
        const
    {
        return formatter<std::string_view>::format(
            fmt::format("{} {}", route.method, route.pattern),
            ctx
        );
    }
};
