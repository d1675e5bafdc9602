/**
 * @file tagreg.cpp
 * @brief Build-time tool: resolve tags against a store and generate headers
 *
 * Usage:
 *   tagreg [options] type NAME...
 *   tagreg [options] tag STRING...
 *   tagreg [options] find type|tag KEY
 *   tagreg [options] list
 *   tagreg [options] check
 *   tagreg [options] gen -o OUT [--namespace NS] [--include HDR]...
 *                        [--type NAME]... [--tag [NAME=]STRING]...
 *   tagreg init [FILE]
 *
 * Options:
 *   --config FILE     settings file (default: ./tagreg.conf if present)
 *   --store FILE      tag store (overrides config and TAGREG_STORE)
 *   --scheme S        auto | qualified | legacy
 *   -v, --verbose     log every newly minted identifier
 *
 * Any failure prints "tagreg: error: ..." and exits non-zero so the build stops.
 */

#include <tagreg/codegen.hpp>
#include <tagreg/registry.hpp>
#include <tagreg/registry_error.hpp>
#include <tagreg/store_format.hpp>

#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tagreg;

namespace {

constexpr int EXIT_USAGE = 2;

void printUsage(std::ostream& out) {
    out << "usage: tagreg [--config FILE] [--store FILE] [--scheme auto|qualified|legacy] [-v]\n"
        << "              COMMAND [ARGS]\n"
        << "\n"
        << "commands:\n"
        << "  type NAME...          resolve type tags\n"
        << "  tag STRING...         resolve custom tags\n"
        << "  find type|tag KEY     look up without minting (exit 1 if absent)\n"
        << "  list                  print every entry\n"
        << "  check                 validate the store\n"
        << "  gen -o OUT [--namespace NS] [--include HDR]... [--type NAME]...\n"
        << "      [--tag [NAME=]STRING]...\n"
        << "                        write a header embedding the identifiers\n"
        << "  init [FILE]           write a default config file\n";
}

struct Options {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> storePath;
    std::optional<KeyScheme> scheme;
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string requireValue(int& i, int argc, char* argv[]) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
        throw UsageError(flag + " needs a value");
    }
    return argv[++i];
}

Options parseArgs(int argc, char* argv[]) {
    Options opts;
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            opts.configPath = requireValue(i, argc, argv);
        } else if (arg == "--store") {
            opts.storePath = requireValue(i, argc, argv);
        } else if (arg == "--scheme") {
            auto value = requireValue(i, argc, argv);
            opts.scheme = parseScheme(value);
            if (!opts.scheme) {
                throw UsageError("unknown scheme '" + value + "'");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.command = "help";
            return opts;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option " + arg);
        } else {
            break;
        }
    }

    if (i >= argc) {
        throw UsageError("missing command");
    }
    opts.command = argv[i++];
    for (; i < argc; ++i) {
        opts.args.emplace_back(argv[i]);
    }
    return opts;
}

RegistryConfig buildConfig(const Options& opts) {
    RegistryConfig config;
    if (opts.configPath) {
        if (!std::filesystem::exists(*opts.configPath)) {
            throw UsageError("config file " + opts.configPath->string() + " not found");
        }
        config = RegistryConfig::fromFile(*opts.configPath);
    } else if (std::filesystem::exists(RegistryConfig::DEFAULT_CONFIG_NAME)) {
        config = RegistryConfig::fromFile(RegistryConfig::DEFAULT_CONFIG_NAME);
    }

    config.applyEnvironment();

    if (opts.storePath) config.storePath = *opts.storePath;
    if (opts.scheme) config.keyScheme = *opts.scheme;
    if (opts.verbose) config.verbose = true;
    return config;
}

// ============================================================================
// Commands
// ============================================================================

int cmdResolve(Registry& registry, TagNamespace ns, const std::vector<std::string>& args) {
    if (args.empty()) {
        throw UsageError(std::string(namespaceName(ns)) + ": nothing to resolve");
    }
    for (const auto& key : args) {
        Uuid id = (ns == TagNamespace::Type) ? registry.resolveType(key) : registry.resolveTag(key);
        std::cout << id.toString() << "  " << key << "\n";
    }
    return 0;
}

int cmdFind(Registry& registry, const std::vector<std::string>& args) {
    if (args.size() != 2 || (args[0] != "type" && args[0] != "tag")) {
        throw UsageError("find: expected 'type NAME' or 'tag STRING'");
    }
    auto found = (args[0] == "type") ? registry.findType(args[1])
                                     : registry.find(TagNamespace::Custom, args[1]);
    if (!found) {
        return 1;
    }
    std::cout << found->toString() << "\n";
    return 0;
}

int cmdList(Registry& registry) {
    RegistryState state = registry.load();
    for (auto ns : {TagNamespace::Type, TagNamespace::Custom}) {
        for (const auto& [key, id] : state.table(ns)) {
            std::cout << id.toString() << "  " << namespaceName(ns) << "  " << key << "\n";
        }
    }
    return 0;
}

int cmdCheck(Registry& registry) {
    RegistryState state = registry.load();
    auto duplicates = state.duplicateIdentifiers();
    for (const auto& [id, keys] : duplicates) {
        std::cerr << "tagreg: identifier " << id.toString() << " is shared by:";
        for (const auto& key : keys) {
            std::cerr << " " << key;
        }
        std::cerr << "\n";
    }

    auto scheme = registry.effectiveScheme(state);
    std::cout << registry.store().path().string() << ": "
              << state.table(TagNamespace::Type).size() << " type tags, "
              << state.table(TagNamespace::Custom).size() << " custom tags, "
              << schemeName(scheme) << " keys\n";
    return duplicates.empty() ? 0 : 1;
}

int cmdGen(Registry& registry, const std::vector<std::string>& args) {
    HeaderGenerator generator;
    std::optional<std::filesystem::path> output;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw UsageError("gen: " + arg + " needs a value");
            }
            return args[++i];
        };

        if (arg == "-o" || arg == "--output") {
            output = value();
        } else if (arg == "--namespace") {
            generator.setNamespace(value());
        } else if (arg == "--include") {
            generator.addInclude(value());
        } else if (arg == "--type") {
            generator.addType(value());
        } else if (arg == "--tag") {
            generator.addTag(value());
        } else {
            throw UsageError("gen: unexpected argument " + arg);
        }
    }

    if (!output) {
        throw UsageError("gen: missing -o OUT");
    }

    if (generator.writeTo(*output, registry) && registry.config().verbose) {
        std::cerr << "[tagreg] wrote " << output->string() << "\n";
    }
    return 0;
}

int cmdInit(const std::vector<std::string>& args) {
    std::filesystem::path path = args.empty() ? RegistryConfig::DEFAULT_CONFIG_NAME : args[0];
    if (!RegistryConfig::writeDefaults(path)) {
        std::cerr << "tagreg: error: " << path.string() << " exists or can't be written\n";
        return 1;
    }
    std::cout << "wrote " << path.string() << "\n";
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        Options opts = parseArgs(argc, argv);
        if (opts.command == "help") {
            printUsage(std::cout);
            return 0;
        }
        if (opts.command == "init") {
            return cmdInit(opts.args);
        }

        Registry registry(buildConfig(opts));

        if (opts.command == "type") return cmdResolve(registry, TagNamespace::Type, opts.args);
        if (opts.command == "tag") return cmdResolve(registry, TagNamespace::Custom, opts.args);
        if (opts.command == "find") return cmdFind(registry, opts.args);
        if (opts.command == "list") return cmdList(registry);
        if (opts.command == "check") return cmdCheck(registry);
        if (opts.command == "gen") return cmdGen(registry, opts.args);

        throw UsageError("unknown command '" + opts.command + "'");
    } catch (const UsageError& e) {
        std::cerr << "tagreg: " << e.what() << "\n\n";
        printUsage(std::cerr);
        return EXIT_USAGE;
    } catch (const RegistryError& e) {
        std::cerr << "tagreg: error: " << e.what();
        if (!e.key().empty()) {
            std::cerr << " [key: " << e.key() << "]";
        }
        std::cerr << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "tagreg: error: " << e.what() << "\n";
        return 1;
    }
}
