#include <svi/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace svi {

static Result<MissingPolicy> parse_missing_policy(const std::string& s) {
    if (s == "fail") return Result<MissingPolicy>::ok(MissingPolicy::Fail);
    if (s == "keep") return Result<MissingPolicy>::ok(MissingPolicy::Keep);
    return SviError{SviError::Config,
        "unknown on-missing policy '" + s + "'",
        "expected \"fail\" or \"keep\""};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SviError{SviError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [interpolate] section
    if (auto section = doc["interpolate"].as_table()) {
        if (auto v = (*section)["style"].value<std::string>()) {
            auto style = parse_style(*v);
            SVI_TRY(style);
            cfg.interp.style = style.value();
            cfg.style_set = true;
        }
        if (auto v = (*section)["on-missing"].value<std::string>()) {
            auto policy = parse_missing_policy(*v);
            SVI_TRY(policy);
            cfg.interp.on_missing = policy.value();
            cfg.on_missing_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.log_level)) {
                return SviError{SviError::Config,
                    "unknown log level '" + *v + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    // [variables] section: string values only. The key goes into the error
    // message, the value never does.
    if (auto vars = doc["variables"].as_table()) {
        for (const auto& [key, val] : *vars) {
            std::string k(key);
            if (auto s = val.value<std::string>()) {
                cfg.variables[k] = std::string(*s);
            } else {
                return SviError{SviError::Config,
                    "variable '" + k + "' must be a string"};
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SviError{SviError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) cfg.error().file = path;
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.style_set) {
        interp.style = other.interp.style;
        style_set = true;
    }
    if (other.on_missing_set) {
        interp.on_missing = other.interp.on_missing;
        on_missing_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }

    for (const auto& [k, v] : other.variables) {
        variables[k] = v;
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
    if (log_level_set) log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.svi/config.toml";
}

} // namespace svi
