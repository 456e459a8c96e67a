#pragma once

#include <fileroute/fileroute>

namespace fileroute::test {
    /// Declares "api/users/[id].get.rs" the way a directory walk would.
    inline auto declare(
        std::string_view path,
        middleware_mode mode = middleware_mode::overlay,
        std::string transform = {}
    ) -> declaration {
        auto result = declaration {
            .source = std::string(path),
            .mode = mode,
            .transform = std::move(transform)
        };

        auto slash = path.find('/');

        while (slash != std::string_view::npos) {
            result.directory.emplace_back(path.substr(0, slash));
            path = path.substr(slash + 1);
            slash = path.find('/');
        }

        result.name = std::string(path);
        return result;
    }

    inline auto resolve(const std::vector<declaration>& declarations)
        -> route_table
    {
        return fileroute::resolve(declarations, options());
    }

    /// Runs the pipeline and returns the diagnostics it fails with.
    inline auto failure(const std::vector<declaration>& declarations)
        -> std::vector<diagnostic>
    {
        try {
            resolve(declarations);
        }
        catch (const build_failure& failure) {
            const auto diagnostics = failure.diagnostics();
            return {diagnostics.begin(), diagnostics.end()};
        }

        return {};
    }
}
