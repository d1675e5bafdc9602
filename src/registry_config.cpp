#include "tagreg/registry_config.hpp"
#include "tagreg/config_file.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace tagreg {

namespace {

KeyScheme schemeOrThrow(std::string_view text, std::string_view origin) {
    auto scheme = parseScheme(text);
    if (!scheme) {
        throw std::invalid_argument(std::string(origin) + ": unknown key scheme '" +
                                    std::string(text) + "' (expected auto, qualified or legacy)");
    }
    return *scheme;
}

int64_t intOrThrow(const ConfigFile& file, std::string_view key, int64_t defaultVal, int64_t minVal) {
    auto text = file.raw(key);
    if (!text) {
        return defaultVal;
    }
    auto value = ConfigFile::parseInt(*text);
    if (!value || *value < minVal) {
        throw std::invalid_argument(file.path().string() + ": invalid " + std::string(key) +
                                    " '" + *text + "'");
    }
    return *value;
}

}  // anonymous namespace

RegistryConfig RegistryConfig::fromFile(const std::filesystem::path& configPath) {
    RegistryConfig config;

    ConfigFile file;
    if (!file.load(configPath)) {
        return config;
    }

    auto store = file.getString("store.path");
    if (!store.empty()) {
        std::filesystem::path storePath(store);
        if (storePath.is_relative()) {
            storePath = configPath.parent_path() / storePath;
        }
        config.storePath = storePath.lexically_normal();
    }

    if (auto scheme = file.raw("store.key_scheme")) {
        config.keyScheme = schemeOrThrow(*scheme, configPath.string());
    }

    config.lockTimeout = std::chrono::milliseconds(intOrThrow(file, "lock.timeout_ms", 30000, 0));
    config.maxMintAttempts = static_cast<int>(intOrThrow(file, "mint.max_attempts", 8, 1));

    if (auto logging = file.raw("debug.logging")) {
        auto value = ConfigFile::parseBool(*logging);
        if (!value) {
            throw std::invalid_argument(configPath.string() + ": invalid debug.logging '" +
                                        *logging + "'");
        }
        config.verbose = *value;
    }

    return config;
}

void RegistryConfig::applyEnvironment() {
    if (const char* store = std::getenv("TAGREG_STORE"); store && *store) {
        storePath = store;
    }
    if (const char* scheme = std::getenv("TAGREG_KEY_SCHEME"); scheme && *scheme) {
        keyScheme = schemeOrThrow(scheme, "TAGREG_KEY_SCHEME");
    }
}

bool RegistryConfig::writeDefaults(const std::filesystem::path& configPath) {
    ConfigFile file;
    if (file.load(configPath)) {
        return false;  // never clobber an existing config
    }

    file.setHeader(
        "# tagreg configuration\n"
        "#\n"
        "# store.key_scheme: auto | qualified | legacy\n"
        "#   qualified  type tags keyed by fully-qualified name (geo::Point)\n"
        "#   legacy     type tags keyed by bare name (::Point); distinct types\n"
        "#              sharing a name get the same identifier\n"
        "#   auto       use what the store records\n");

    RegistryConfig defaults;
    file.set("store.path", defaults.storePath.string());
    file.set("store.key_scheme", schemeName(defaults.keyScheme));
    file.set("lock.timeout_ms", static_cast<int64_t>(defaults.lockTimeout.count()));
    file.set("mint.max_attempts", static_cast<int64_t>(defaults.maxMintAttempts));
    file.set("debug.logging", defaults.verbose);
    return file.saveAs(configPath);
}

}  // namespace tagreg
