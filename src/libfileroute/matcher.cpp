#include <fileroute/matcher.hpp>

#include <algorithm>

namespace fileroute {
    auto matches(
        const resolved_route& route,
        std::string_view path,
        path_params& params
    ) -> bool {
        if (path.size() > 1 && path.ends_with('/')) {
            path = {path.begin(), path.end() - 1};
        }

        if (path.starts_with('/')) path = path.substr(1);

        for (const auto& seg : route.segments) {
            if (path.empty()) return false;

            if (seg.kind == segment_kind::catch_all) {
                params.insert({seg.name, path});
                return true;
            }

            const auto slash = path.find('/');
            const auto component = path.substr(0, slash);

            if (component.empty()) return false;

            if (seg.kind == segment_kind::static_segment) {
                if (component != seg.name) return false;
            }
            else params.insert({seg.name, component});

            path = slash != std::string_view::npos ?
                path.substr(slash + 1) : std::string_view();
        }

        return path.empty();
    }

    matcher::matcher(const route_table& table) : table(&table) {}

    auto matcher::allowed(std::string_view path) const -> std::vector<method> {
        auto result = std::vector<method>();

        for (const auto& route : *table) {
            auto params = path_params();

            if (matches(route, path, params)) result.push_back(route.method);
        }

        std::sort(result.begin(), result.end());
        result.erase(std::unique(result.begin(), result.end()), result.end());

        return result;
    }

    auto matcher::find(method m, std::string_view path) const
        -> std::optional<match>
    {
        for (auto i = 0ul; i < table->size(); ++i) {
            const auto& route = (*table)[i];
            if (route.method != m) continue;

            auto params = path_params();

            if (matches(route, path, params)) {
                return match {
                    .route = &route,
                    .index = i,
                    .params = std::move(params)
                };
            }
        }

        return std::nullopt;
    }
}
