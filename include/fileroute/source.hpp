#pragma once

#include "descriptor.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string_view>
#include <vector>

namespace fileroute {
    /// Walks opts.root_directory in lexicographic order. Hidden entries are
    /// skipped; every other file becomes one declaration whose source and
    /// handler are its path relative to the root.
    auto directory_source(const options& opts) -> std::vector<declaration>;

    auto parse_manifest(std::string_view text) -> std::vector<declaration>;

    auto read_manifest(const std::filesystem::path& file)
        -> std::vector<declaration>;

    /// Reads {"path": "api/[id].get.rs", "handler": ..., "mode": ...,
    /// "transform": ...}; only "path" is required.
    auto from_json(const nlohmann::json& json, declaration& decl) -> void;

    auto to_json(nlohmann::json& json, const declaration& decl) -> void;
}
