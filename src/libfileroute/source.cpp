#include <fileroute/source.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <timber/timber>

namespace fs = std::filesystem;

namespace fileroute {
    namespace {
        auto read_file(const fs::path& file) -> std::string {
            auto stream = std::ifstream(file, std::ios::binary);
            if (!stream) {
                throw error("Failed to open '{}'", file.string());
            }

            return std::string(
                std::istreambuf_iterator<char>(stream),
                std::istreambuf_iterator<char>()
            );
        }

        auto sorted_entries(const fs::path& directory)
            -> std::vector<fs::directory_entry>
        {
            auto ec = std::error_code();
            auto it = fs::directory_iterator(directory, ec);

            if (ec) {
                throw error(
                    "Failed to read directory '{}': {}",
                    directory.string(),
                    ec.message()
                );
            }

            auto entries = std::vector<fs::directory_entry>(
                begin(it),
                end(it)
            );

            std::sort(
                entries.begin(),
                entries.end(),
                [](const fs::directory_entry& a, const fs::directory_entry& b) {
                    return a.path().filename() < b.path().filename();
                }
            );

            return entries;
        }

        auto walk(
            const fs::path& directory,
            std::vector<std::string>& components,
            const options& opts,
            std::vector<declaration>& declarations
        ) -> void {
            for (const auto& entry : sorted_entries(directory)) {
                const auto name = entry.path().filename().string();

                if (name.starts_with('.')) {
                    TIMBER_TRACE(
                        "Skipping hidden entry {}",
                        entry.path().string()
                    );
                    continue;
                }

                if (entry.is_directory()) {
                    components.push_back(name);
                    walk(entry.path(), components, opts, declarations);
                    components.pop_back();
                    continue;
                }

                auto source = fs::path();
                for (const auto& component : components) source /= component;
                source /= name;

                auto decl = declaration {
                    .directory = components,
                    .name = name,
                    .source = source.generic_string()
                };

                if (declares_middleware(name, opts)) {
                    const auto contents = read_file(entry.path());

                    if (
                        !opts.override_marker.empty() &&
                        contents.find(opts.override_marker) != std::string::npos
                    ) decl.mode = middleware_mode::override;
                }

                declarations.push_back(std::move(decl));
            }
        }
    }

    auto directory_source(const options& opts) -> std::vector<declaration> {
        const auto& root = opts.root_directory;

        if (!fs::is_directory(root)) {
            throw error("Routes directory not found: {}", root.string());
        }

        auto declarations = std::vector<declaration>();
        auto components = std::vector<std::string>();

        walk(root, components, opts, declarations);

        TIMBER_DEBUG(
            "Found {} declarations under {}",
            declarations.size(),
            root.string()
        );

        return declarations;
    }

    auto parse_manifest(std::string_view text) -> std::vector<declaration> {
        try {
            const auto json = nlohmann::json::parse(text);

            return json.at("declarations").get<std::vector<declaration>>();
        }
        catch (const nlohmann::json::exception& ex) {
            throw error("Invalid route manifest: {}", ex.what());
        }
    }

    auto read_manifest(const fs::path& file) -> std::vector<declaration> {
        return parse_manifest(read_file(file));
    }

    auto from_json(const nlohmann::json& json, declaration& decl) -> void {
        const auto path = fs::path(json.at("path").get<std::string>());

        decl.directory.clear();
        for (const auto& component : path.parent_path()) {
            const auto str = component.generic_string();
            if (!str.empty() && str != "/") decl.directory.push_back(str);
        }

        decl.name = path.filename().string();
        decl.source = path.generic_string();
        decl.handler = json.value("handler", std::string());
        decl.transform = json.value("transform", std::string());

        const auto mode = json.value("mode", std::string("overlay"));

        if (mode == "overlay") decl.mode = middleware_mode::overlay;
        else if (mode == "override") decl.mode = middleware_mode::override;
        else {
            throw error(
                "Unknown middleware mode '{}' for '{}'",
                mode,
                decl.source
            );
        }
    }

    auto to_json(nlohmann::json& json, const declaration& decl) -> void {
        auto path = fs::path();
        for (const auto& component : decl.directory) path /= component;
        path /= decl.name;

        json = nlohmann::json {
            {"path", path.generic_string()},
            {"mode", std::string(to_string(decl.mode))}
        };

        if (!decl.handler.empty()) json["handler"] = decl.handler;
        if (!decl.transform.empty()) json["transform"] = decl.transform;
    }
}
