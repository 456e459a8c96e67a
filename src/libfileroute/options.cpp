#include <fileroute/error.hpp>
#include <fileroute/options.hpp>

#include <fstream>

namespace fileroute {
    auto read_options(const std::filesystem::path& file) -> options {
        auto stream = std::ifstream(file);
        if (!stream) {
            throw error("Failed to open config file '{}'", file.string());
        }

        try {
            return nlohmann::json::parse(stream).get<options>();
        }
        catch (const nlohmann::json::exception& ex) {
            throw error("Invalid config file '{}': {}", file.string(), ex.what());
        }
    }

    auto from_json(const nlohmann::json& json, options& opts) -> void {
        if (json.contains("root_directory")) {
            opts.root_directory =
                json.at("root_directory").get<std::string>();
        }

        if (json.contains("method_aliases")) {
            for (const auto& [alias, verb] : json.at("method_aliases").items()) {
                const auto name = verb.get<std::string>();
                const auto m = parse_method(name);

                if (!m) {
                    throw error(
                        "Method alias '{}' refers to unknown method '{}'",
                        alias,
                        name
                    );
                }

                opts.aliases.insert_or_assign(alias, *m);
            }
        }

        if (json.contains("middleware_marker")) {
            opts.middleware_marker =
                json.at("middleware_marker").get<std::string>();
        }

        if (json.contains("index_name")) {
            opts.index_name = json.at("index_name").get<std::string>();
        }

        if (json.contains("override_marker")) {
            opts.override_marker =
                json.at("override_marker").get<std::string>();
        }
    }

    auto to_json(nlohmann::json& json, const options& opts) -> void {
        auto aliases = nlohmann::json::object();

        for (const auto& [alias, m] : opts.aliases) {
            aliases[alias] = std::string(to_string(m));
        }

        json = nlohmann::json {
            {"root_directory", opts.root_directory.string()},
            {"method_aliases", aliases},
            {"middleware_marker", opts.middleware_marker},
            {"index_name", opts.index_name},
            {"override_marker", opts.override_marker}
        };
    }
}
