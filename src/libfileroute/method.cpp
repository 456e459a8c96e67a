#include <fileroute/method.hpp>

#include <array>
#include <cctype>
#include <utility>

namespace fileroute {
    namespace {
        constexpr auto verbs = std::array {
            std::pair { std::string_view("get"), method::get },
            std::pair { std::string_view("head"), method::head },
            std::pair { std::string_view("post"), method::post },
            std::pair { std::string_view("put"), method::put },
            std::pair { std::string_view("delete"), method::del },
            std::pair { std::string_view("patch"), method::patch },
            std::pair { std::string_view("options"), method::options },
            std::pair { std::string_view("connect"), method::connect },
            std::pair { std::string_view("trace"), method::trace }
        };

        auto lower(std::string_view token) -> std::string {
            auto result = std::string(token);

            for (auto& c : result) {
                c = std::tolower(static_cast<unsigned char>(c));
            }

            return result;
        }
    }

    auto parse_method(std::string_view token) -> std::optional<method> {
        const auto key = lower(token);

        for (const auto& [name, m] : verbs) {
            if (name == key) return m;
        }

        return std::nullopt;
    }

    auto parse_method(
        std::string_view token,
        const method_aliases& aliases
    ) -> std::optional<method> {
        if (const auto m = parse_method(token)) return m;

        const auto key = lower(token);

        for (const auto& [alias, m] : aliases) {
            if (lower(alias) == key) return m;
        }

        return std::nullopt;
    }

    auto to_string(method m) noexcept -> std::string_view {
        switch (m) {
            case method::get: return "GET";
            case method::head: return "HEAD";
            case method::post: return "POST";
            case method::put: return "PUT";
            case method::del: return "DELETE";
            case method::patch: return "PATCH";
            case method::options: return "OPTIONS";
            case method::connect: return "CONNECT";
            case method::trace: return "TRACE";
        }

        return "UNKNOWN";
    }
}
