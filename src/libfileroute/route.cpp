#include <fileroute/route.hpp>

#include <algorithm>
#include <fmt/format.h>

namespace fileroute {
    route_table::route_table(std::vector<resolved_route>&& entries) :
        entries(std::forward<std::vector<resolved_route>>(entries))
    {}

    auto route_table::operator[](std::size_t index) const
        -> const resolved_route&
    {
        return entries.at(index);
    }

    auto route_table::begin() const noexcept -> const_iterator {
        return entries.begin();
    }

    auto route_table::empty() const noexcept -> bool {
        return entries.empty();
    }

    auto route_table::end() const noexcept -> const_iterator {
        return entries.end();
    }

    auto route_table::size() const noexcept -> std::size_t {
        return entries.size();
    }

    auto route_table::summary() const -> std::vector<route_summary> {
        auto result = std::vector<route_summary>();
        result.reserve(entries.size());

        for (const auto& route : entries) {
            result.push_back({
                .method = route.method,
                .path = route.pattern,
                .middleware = route.middleware.size()
            });
        }

        return result;
    }

    auto route_table::to_string() const -> std::string {
        auto width = std::size_t(1);
        for (const auto& route : entries) {
            width = std::max(width, route.pattern.size());
        }

        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        for (const auto& route : entries) {
            fmt::format_to(
                out,
                "{:<7} {:<{}}  {}\n",
                route.method,
                route.pattern,
                width,
                fileroute::to_string(route.middleware)
            );
        }

        return fmt::to_string(buffer);
    }

    auto to_json(nlohmann::json& json, const middleware_ref& ref) -> void {
        json = nlohmann::json {
            {"scope", ref.scope},
            {"transform", ref.transform},
            {"mode", std::string(to_string(ref.mode))},
            {"source", ref.source}
        };
    }

    auto to_json(nlohmann::json& json, const resolved_route& route) -> void {
        json = nlohmann::json {
            {"pattern", route.pattern},
            {"method", std::string(to_string(route.method))},
            {"params", route.params},
            {"middleware", route.middleware},
            {"handler", route.handler},
            {"source", route.source}
        };
    }

    auto to_json(nlohmann::json& json, const route_table& table) -> void {
        auto routes = nlohmann::json::array();

        for (const auto& route : table) {
            routes.push_back(nlohmann::json(route));
        }

        json = nlohmann::json {{"routes", std::move(routes)}};
    }
}
