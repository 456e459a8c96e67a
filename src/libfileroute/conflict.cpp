#include <fileroute/conflict.hpp>

#include <algorithm>
#include <fmt/format.h>
#include <map>
#include <set>
#include <timber/timber>

namespace fileroute {
    namespace {
        auto rank(segment_kind kind) noexcept -> int {
            switch (kind) {
                case segment_kind::static_segment: return 0;
                case segment_kind::dynamic: return 1;
                case segment_kind::catch_all: return 2;
            }

            return 3;
        }

        auto check_params(
            const scoped_route& entry,
            std::vector<diagnostic>& diagnostics
        ) -> void {
            auto seen = std::set<std::string_view>();
            auto reported = std::set<std::string_view>();

            for (const auto& seg : entry.segments) {
                if (!seg.is_param()) continue;
                if (seen.insert(seg.name).second) continue;
                if (!reported.insert(seg.name).second) continue;

                diagnostics.push_back({
                    .kind = error_kind::ambiguous_parameter_name,
                    .path = entry.route.source,
                    .message = fmt::format(
                        "parameter '{}' appears more than once in {}",
                        seg.name,
                        format_pattern(entry.segments)
                    )
                });
            }
        }

        auto describe(const scoped_route& entry) -> std::string {
            return fmt::format(
                "{} {}",
                entry.route.method,
                format_pattern(entry.segments)
            );
        }
    }

    auto compare_precedence(
        std::span<const segment> a,
        std::span<const segment> b
    ) -> std::strong_ordering {
        const auto size = std::min(a.size(), b.size());

        for (auto i = 0ul; i < size; ++i) {
            const auto& left = a[i];
            const auto& right = b[i];

            const auto kind = rank(left.kind) <=> rank(right.kind);
            if (kind != 0) return kind;

            if (left.kind == segment_kind::static_segment) {
                if (const auto cmp = left.name <=> right.name; cmp != 0) {
                    return cmp;
                }
            }
        }

        return a.size() <=> b.size();
    }

    auto shape(std::span<const segment> segments) -> std::string {
        if (segments.empty()) return "/";

        auto result = std::string();

        for (const auto& seg : segments) {
            result += '/';

            switch (seg.kind) {
                case segment_kind::static_segment: result += seg.name; break;
                case segment_kind::dynamic: result += ':'; break;
                case segment_kind::catch_all: result += '*'; break;
            }
        }

        return result;
    }

    auto find_conflicts(std::span<const scoped_route> routes)
        -> std::vector<diagnostic>
    {
        auto diagnostics = std::vector<diagnostic>();

        // Keyed by method and full shape.
        auto shapes =
            std::map<std::pair<method, std::string>, const scoped_route*>();

        // Keyed by method and the shape of the enclosing directory.
        auto catch_alls = std::map<
            std::pair<method, std::string>,
            std::vector<const scoped_route*>
        >();
        auto finals = std::map<
            std::pair<method, std::string>,
            std::vector<const scoped_route*>
        >();

        for (const auto& entry : routes) {
            check_params(entry, diagnostics);

            const auto m = entry.route.method;
            auto full = std::pair(m, shape(entry.segments));
            const auto [it, inserted] =
                shapes.try_emplace(std::move(full), &entry);

            if (!inserted) {
                const auto& first = *it->second;

                diagnostics.push_back({
                    .kind = error_kind::duplicate_route,
                    .path = entry.route.source,
                    .message = fmt::format(
                        "{} duplicates {}: declared by '{}' and '{}'",
                        describe(entry),
                        describe(first),
                        first.route.source,
                        entry.route.source
                    )
                });

                continue;
            }

            if (entry.segments.empty()) continue;

            const auto parent = std::span(entry.segments).first(
                entry.segments.size() - 1
            );
            auto key = std::pair(m, shape(parent));

            if (entry.segments.back().kind == segment_kind::catch_all) {
                catch_alls[std::move(key)].push_back(&entry);
            }
            else finals[std::move(key)].push_back(&entry);
        }

        for (const auto& [key, wildcards] : catch_alls) {
            const auto siblings = finals.find(key);
            if (siblings == finals.end()) continue;

            for (const auto* wildcard : wildcards) {
                for (const auto* sibling : siblings->second) {
                    diagnostics.push_back({
                        .kind = error_kind::path_conflict,
                        .path = sibling->route.source,
                        .message = fmt::format(
                            "{} shares its position with catch-all {} "
                            "declared by '{}'",
                            describe(*sibling),
                            describe(*wildcard),
                            wildcard->route.source
                        )
                    });
                }
            }
        }

        return diagnostics;
    }

    auto check_conflicts(std::span<const scoped_route> routes) -> void {
        auto diagnostics = find_conflicts(routes);

        if (!diagnostics.empty()) {
            throw build_failure(build_stage::validate, std::move(diagnostics));
        }

        TIMBER_DEBUG("No conflicts among {} routes", routes.size());
    }
}
