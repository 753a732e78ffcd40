#pragma once

#include <weft/log.hpp>
#include <weft/result.hpp>
#include <optional>
#include <string>

namespace weft {

struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

// Options for the token dump driver
struct DumpConfig {
    bool positions = true;
    bool comments = true;
};

// Layered configuration: global < local (local wins)
struct Config {
    LogConfig logging;
    DumpConfig dump;
    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool dump_positions_set = false;
    bool dump_comments_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly-set values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push explicitly-set [log] values into weft::log
    void apply_logging() const;
};

// Discover the global config file path: ~/.weft/config.toml
std::string global_config_path();

} // namespace weft
