#pragma once

#include <gitsnip/result.hpp>
#include <gitsnip/log.hpp>
#include <optional>
#include <string>

namespace gitsnip {

// Layered configuration: global > project > command line
// Lower layers override higher layers, field by field.
struct Config {
    std::string snippets_dir = ".snippets";
    std::string extension;
    int timeout_seconds = 120;
    bool keep_workspace = false;
    std::string scratch_dir;        // empty = system temp dir
    log::Level log_level = log::Info;

    // Track which fields were explicitly set (for merge)
    bool snippets_dir_set = false;
    bool extension_set = false;
    bool timeout_set = false;
    bool keep_workspace_set = false;
    bool scratch_dir_set = false;
    bool log_level_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // Build effective config from layers: global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);
};

// ~/.gitsnip/config.toml, or "" if HOME is unset
std::string global_config_path();

// Per-project file looked up in the working directory
inline const char* project_config_name() { return ".gitsnip.toml"; }

} // namespace gitsnip
