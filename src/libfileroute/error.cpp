#include <fileroute/error.hpp>

#include <algorithm>

namespace fileroute {
    auto to_string(error_kind kind) noexcept -> std::string_view {
        switch (kind) {
            case error_kind::unknown_method:
                return "ParseError::UnknownMethod";
            case error_kind::invalid_file_name:
                return "ParseError::InvalidFileName";
            case error_kind::duplicate_middleware:
                return "BuildError::DuplicateMiddleware";
            case error_kind::duplicate_route:
                return "BuildError::DuplicateRoute";
            case error_kind::path_conflict:
                return "BuildError::PathConflict";
            case error_kind::ambiguous_parameter_name:
                return "BuildError::AmbiguousParameterName";
        }

        return "UnknownError";
    }

    auto to_string(build_stage stage) noexcept -> std::string_view {
        switch (stage) {
            case build_stage::parse: return "parse";
            case build_stage::build: return "build";
            case build_stage::validate: return "validate";
        }

        return "unknown";
    }

    declaration_error::declaration_error(fileroute::diagnostic&& diagnostic) :
        error("{}: {}", diagnostic.path, diagnostic.message),
        diag(std::forward<fileroute::diagnostic>(diagnostic))
    {}

    auto declaration_error::diagnostic() const noexcept
        -> const fileroute::diagnostic&
    {
        return diag;
    }

    build_failure::build_failure(
        build_stage stage,
        std::vector<fileroute::diagnostic>&& diagnostics
    ) :
        error(
            "Route {} stage failed with {} error{}",
            stage,
            diagnostics.size(),
            diagnostics.size() == 1 ? "" : "s"
        ),
        failed(stage),
        list(std::forward<std::vector<fileroute::diagnostic>>(diagnostics))
    {}

    auto build_failure::contains(error_kind kind) const noexcept -> bool {
        return std::any_of(list.begin(), list.end(), [kind](const auto& diag) {
            return diag.kind == kind;
        });
    }

    auto build_failure::diagnostics() const noexcept
        -> std::span<const fileroute::diagnostic>
    {
        return list;
    }

    auto build_failure::stage() const noexcept -> build_stage {
        return failed;
    }
}
