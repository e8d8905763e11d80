#include <gitsnip/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <limits>

namespace gitsnip {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SnipError{SnipError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["dir"].value<std::string>()) {
            if (v->empty()) {
                return SnipError{SnipError::Config, "cache.dir must not be empty"};
            }
            cfg.snippets_dir = *v;
            cfg.snippets_dir_set = true;
        }
        if (auto v = (*cache)["extension"].value<std::string>()) {
            if (!v->empty() && v->find('-') != std::string::npos) {
                return SnipError{SnipError::Config,
                    "cache.extension '" + *v + "' must not contain '-'",
                    "the commit id is read from the last '-' segment of a snippet name"};
            }
            cfg.extension = *v;
            cfg.extension_set = true;
        }
    }

    // [git] section
    if (auto git = doc["git"].as_table()) {
        if (auto v = (*git)["timeout"].value<int64_t>()) {
            if (*v <= 0) {
                return SnipError{SnipError::Config,
                    "git.timeout must be positive, got " + std::to_string(*v)};
            }
            if (*v > std::numeric_limits<int>::max()) {
                return SnipError{SnipError::Config,
                    "git.timeout " + std::to_string(*v) + " is too large",
                    "use a value of at most " +
                        std::to_string(std::numeric_limits<int>::max()) + " seconds"};
            }
            cfg.timeout_seconds = static_cast<int>(*v);
            cfg.timeout_set = true;
        }
    }

    // [workspace] section
    if (auto ws = doc["workspace"].as_table()) {
        if (auto v = (*ws)["keep"].value<bool>()) {
            cfg.keep_workspace = *v;
            cfg.keep_workspace_set = true;
        }
        if (auto v = (*ws)["scratch-dir"].value<std::string>()) {
            cfg.scratch_dir = *v;
            cfg.scratch_dir_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.log_level)) {
                return SnipError{SnipError::Config,
                    "unknown log level '" + *v + "'",
                    "use one of trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SnipError{SnipError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        SnipError err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.snippets_dir_set) {
        snippets_dir = other.snippets_dir;
        snippets_dir_set = true;
    }
    if (other.extension_set) {
        extension = other.extension;
        extension_set = true;
    }
    if (other.timeout_set) {
        timeout_seconds = other.timeout_seconds;
        timeout_set = true;
    }
    if (other.keep_workspace_set) {
        keep_workspace = other.keep_workspace;
        keep_workspace_set = true;
    }
    if (other.scratch_dir_set) {
        scratch_dir = other.scratch_dir;
        scratch_dir_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.gitsnip/config.toml";
}

} // namespace gitsnip
