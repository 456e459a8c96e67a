#pragma once

#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fileroute {
    enum class method {
        get,
        head,
        post,
        put,
        del,
        patch,
        options,
        connect,
        trace
    };

    /// Maps additional lower case tokens (such as "remove") onto a verb.
    using method_aliases = std::unordered_map<std::string, method>;

    auto parse_method(std::string_view token) -> std::optional<method>;

    auto parse_method(
        std::string_view token,
        const method_aliases& aliases
    ) -> std::optional<method>;

    auto to_string(method m) noexcept -> std::string_view;
}

template <>
struct fmt::formatter<fileroute::method> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(fileroute::method m, FormatContext& ctx) const {
        return formatter<std::string_view>::format(fileroute::to_string(m), ctx);
    }
};
