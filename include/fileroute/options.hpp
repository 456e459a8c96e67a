#pragma once

#include "method.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace fileroute {
    struct options {
        std::filesystem::path root_directory = "routes";
        method_aliases aliases;
        std::string middleware_marker = "_middleware";
        std::string index_name = "index";

        /// Text whose presence in a middleware file selects override mode.
        /// Only the directory source reads file contents.
        std::string override_marker = "override_parent";
    };

    auto read_options(const std::filesystem::path& file) -> options;

    auto from_json(const nlohmann::json& json, options& opts) -> void;

    auto to_json(nlohmann::json& json, const options& opts) -> void;
}
