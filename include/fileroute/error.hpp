#pragma once

#include <fmt/core.h>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fileroute {
    enum class error_kind {
        unknown_method,
        invalid_file_name,
        duplicate_middleware,
        duplicate_route,
        path_conflict,
        ambiguous_parameter_name
    };

    auto to_string(error_kind kind) noexcept -> std::string_view;

    struct diagnostic {
        error_kind kind;
        std::string path;
        std::string message;

        auto operator==(const diagnostic& other) const -> bool = default;
    };

    class error : public std::runtime_error {
        static auto format_message(
            fmt::string_view format,
            fmt::format_args args
        ) -> std::string {
            return fmt::vformat(format, args);
        }
    public:
        error(std::string_view what) : runtime_error(std::string(what)) {}

        template <typename... T>
        error(fmt::format_string<T...> format, T&&... args) :
            runtime_error(format_message(
                format,
                fmt::make_format_args(args...)
            ))
        {}
    };

    /// Raised by single-declaration checks; stages collect these into a
    /// build_failure.
    class declaration_error : public error {
        fileroute::diagnostic diag;
    public:
        declaration_error(fileroute::diagnostic&& diagnostic);

        auto diagnostic() const noexcept -> const fileroute::diagnostic&;
    };

    enum class build_stage {
        parse,
        build,
        validate
    };

    auto to_string(build_stage stage) noexcept -> std::string_view;

    class build_failure : public error {
        build_stage failed;
        std::vector<fileroute::diagnostic> list;
    public:
        build_failure(
            build_stage stage,
            std::vector<fileroute::diagnostic>&& diagnostics
        );

        auto contains(error_kind kind) const noexcept -> bool;

        auto diagnostics() const noexcept
            -> std::span<const fileroute::diagnostic>;

        auto stage() const noexcept -> build_stage;
    };
}

template <>
struct fmt::formatter<fileroute::error_kind> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(fileroute::error_kind kind, FormatContext& ctx) const {
        return formatter<std::string_view>::format(
            fileroute::to_string(kind),
            ctx
        );
    }
};

template <>
struct fmt::formatter<fileroute::build_stage> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(fileroute::build_stage stage, FormatContext& ctx) const {
        return formatter<std::string_view>::format(
            fileroute::to_string(stage),
            ctx
        );
    }
};

template <>
struct fmt::formatter<fileroute::diagnostic> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const fileroute::diagnostic& diag, FormatContext& ctx) const {
        return formatter<std::string_view>::format(
            fmt::format(
                "{}: {}: {}",
                fileroute::to_string(diag.kind),
                diag.path,
                diag.message
            ),
            ctx
        );
    }
};
