// demo_interpolate.cpp
//
// Two-stage interpolation of a MongoDB connection string, followed by
// redaction of the secrets before anything is logged.  Run it with:
//
//     ./svi_demo                 # built-in variables
//     ./svi_demo config.toml     # variables and options from a TOML file
//
// The first pass only knows the address and keeps the other placeholders;
// the second pass fills in the credentials and must resolve everything.

#include <svi/config.hpp>
#include <svi/interpolate.hpp>
#include <svi/log.hpp>
#include <svi/redact.hpp>

#include <iostream>
#include <string>

using namespace svi;

// The connection string template, written with the configured delimiters so
// a curly-brace config still resolves every placeholder.
static std::string connection_template(DelimiterStyle style) {
    Delimiters d = delimiters(style);
    auto var = [&d](const char* name) { return d.opener() + name + d.closer(); };
    return "mongodb://" + var("MONGO_USERNAME") + ":" + var("MONGO_PASSWORD") +
           "@" + var("MONGO_ADDRESS");
}

// Load the credentials, either from the file named on the command line or
// from the built-in defaults.
Result<Config> load_config(int argc, char** argv) {
    if (argc >= 2) {
        return Config::load(argv[1]);
    }
    Config cfg;
    cfg.variables = {
        {"MONGO_USERNAME", "mongo_user_123"},
        {"MONGO_PASSWORD", "mongo_pass_321"},
    };
    return Result<Config>::ok(std::move(cfg));
}

Result<std::string> run(int argc, char** argv) {
    auto cfg = load_config(argc, argv);
    SVI_TRY(cfg);
    cfg.value().apply_logging();

    const std::string input = connection_template(cfg.value().options().style);
    std::cout << "input: " << input << "\n";

    Variables address{{"MONGO_ADDRESS", "localhost:27017"}};
    InterpolateOptions first_pass = cfg.value().options();
    first_pass.on_missing = MissingPolicy::Keep;

    auto partial = interpolate(input, address, first_pass);
    SVI_TRY(partial);
    log::info("first pass: %s", partial.value().output.c_str());

    InterpolateOptions second_pass = cfg.value().options();
    second_pass.on_missing = MissingPolicy::Fail;

    auto full = interpolate(partial.value().output, cfg.value().variables, second_pass);
    SVI_TRY(full);

    // From here on the logger masks every substituted credential.
    log::set_redactor(Redactor(full.value().replacers));
    log::info("second pass: %s", full.value().output.c_str());

    return Result<std::string>::ok(redact(full.value().output, full.value().replacers));
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        log::error("interpolation failed");
        std::cerr << "\n" << result.error().format() << "\n";
        return 1;
    }

    std::cout << "sanitized: " << result.value() << "\n";
    return 0;
}
