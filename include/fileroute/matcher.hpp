#pragma once

#include "route.hpp"

#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fileroute {
    using path_params = std::unordered_map<std::string_view, std::string_view>;

    struct match {
        const resolved_route* route;
        std::size_t index;
        path_params params;
    };

    /// Binds the segments of a request path against a route. A trailing
    /// slash is ignored; catch-all segments take one or more components.
    auto matches(
        const resolved_route& route,
        std::string_view path,
        path_params& params
    ) -> bool;

    /// First-match lookup over an assembled table. The matcher only reads
    /// the table, which must outlive it.
    class matcher {
        const route_table* table;
    public:
        explicit matcher(const route_table& table);

        /// Methods of every route matching the path, in enumeration order.
        auto allowed(std::string_view path) const -> std::vector<method>;

        auto find(method m, std::string_view path) const
            -> std::optional<match>;
    };
}
