#pragma once

#include <svi/interpolate.hpp>
#include <svi/log.hpp>
#include <svi/result.hpp>
#include <string>
#include <optional>

namespace svi {

// Layered configuration: global < local (local wins).
struct Config {
    InterpolateOptions interp;
    log::Level log_level = log::Info;
    bool log_color = false;
    Variables variables;

    // Track which fields were explicitly set (for merge)
    bool style_set = false;
    bool on_missing_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    const InterpolateOptions& options() const { return interp; }

    // Push log level/color into the global logger
    void apply_logging() const;
};

// Discover the global config file path: ~/.svi/config.toml
std::string global_config_path();

} // namespace svi
