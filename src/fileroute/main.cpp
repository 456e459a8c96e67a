#include <fileroute/fileroute>

#include <cstdlib>
#include <fmt/format.h>
#include <optional>
#include <string_view>

namespace {
    struct arguments {
        std::optional<std::filesystem::path> config;
        std::optional<std::filesystem::path> manifest;
        std::optional<std::filesystem::path> root;
        bool json = false;
        bool tree = false;
    };

    [[noreturn]]
    auto usage(int status) -> void {
        fmt::print(status == 0 ? stdout : stderr, R"(fileroute: resolve a routes directory into a dispatch table

Usage:
  fileroute [options] [<routes-dir>]

Options:
  -c, --config <file>      JSON options (root_directory, method_aliases,
                           middleware_marker, index_name, override_marker)
  -m, --manifest <file>    Read declarations from a JSON manifest instead of
                           walking the routes directory
  --json                   Print the table as JSON
  --tree                   Print the scope tree before the table
  -h, --help               Show this help
)");
        std::exit(status);
    }

    auto value(int argc, char** argv, int& i) -> std::string_view {
        if (i + 1 >= argc) {
            fmt::print(stderr, "Missing value for {}\n", argv[i]);
            usage(EXIT_FAILURE);
        }

        return argv[++i];
    }

    auto parse_args(int argc, char** argv) -> arguments {
        auto args = arguments();

        for (auto i = 1; i < argc; ++i) {
            const auto arg = std::string_view(argv[i]);

            if (arg == "-h" || arg == "--help") usage(EXIT_SUCCESS);
            else if (arg == "-c" || arg == "--config") {
                args.config = value(argc, argv, i);
            }
            else if (arg == "-m" || arg == "--manifest") {
                args.manifest = value(argc, argv, i);
            }
            else if (arg == "--json") args.json = true;
            else if (arg == "--tree") args.tree = true;
            else if (!arg.starts_with('-') && !args.root) args.root = arg;
            else {
                fmt::print(stderr, "Unknown argument: {}\n", arg);
                usage(EXIT_FAILURE);
            }
        }

        return args;
    }

    auto run(const arguments& args) -> void {
        auto opts = args.config ?
            fileroute::read_options(*args.config) : fileroute::options();

        if (args.root) opts.root_directory = *args.root;

        const auto declarations = args.manifest ?
            fileroute::read_manifest(*args.manifest) :
            fileroute::directory_source(opts);

        const auto tree = fileroute::build_tree(declarations, opts);
        if (args.tree) fmt::print("{}\n", tree.to_string());

        const auto table = fileroute::resolve(tree);

        if (args.json) {
            fmt::print("{}\n", nlohmann::json(table).dump(4));
            return;
        }

        fmt::print("{}", table.to_string());
    }
}

auto main(int argc, char** argv) -> int {
    const auto args = parse_args(argc, argv);

    try {
        run(args);
    }
    catch (const fileroute::build_failure& failure) {
        for (const auto& diag : failure.diagnostics()) {
            fmt::print(stderr, "{}\n", diag);
        }

        fmt::print(stderr, "{}\n", failure.what());
        return EXIT_FAILURE;
    }
    catch (const std::exception& ex) {
        fmt::print(stderr, "{}\n", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
