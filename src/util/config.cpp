#include <weft/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace weft {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return WeftError{WeftError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto tbl = doc["log"].as_table()) {
        if (auto v = (*tbl)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.logging.level)) {
                return WeftError{WeftError::Config,
                    "unknown log level '" + *v + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
        if (auto v = (*tbl)["color"].value<bool>()) {
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    // [dump] section
    if (auto tbl = doc["dump"].as_table()) {
        if (auto v = (*tbl)["positions"].value<bool>()) {
            cfg.dump.positions = *v;
            cfg.dump_positions_set = true;
        }
        if (auto v = (*tbl)["comments"].value<bool>()) {
            cfg.dump.comments = *v;
            cfg.dump_comments_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return WeftError{WeftError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        r.error().file = path;
    }
    return r;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
    if (other.dump_positions_set) {
        dump.positions = other.dump.positions;
        dump_positions_set = true;
    }
    if (other.dump_comments_set) {
        dump.comments = other.dump.comments;
        dump_comments_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    if (log_level_set) log::set_level(logging.level);
    if (log_color_set) log::set_color_enabled(logging.color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.weft/config.toml";
}

} // namespace weft
