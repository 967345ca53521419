#include <toolhost/config/config_loader.hpp>

#include <toolhost/core/log.hpp>
#include <toolhost/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace toolhost {

namespace {

Error MakeConfigError(const std::string& message, const std::string& target = "") {
    return Error{"ConfigLoader", target, std::nullopt, message,
                 ErrorCategory::Config};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string path(file_path);
    AppConfig config;

    try {
        const auto root = YAML::LoadFile(path);

        // -- Server --
        if (const auto server = root["server"]) {
            if (server["workers"]) {
                config.server.workers = server["workers"].as<int>();
            }
        }

        // -- Fetch --
        if (const auto fetch = root["fetch"]) {
            if (fetch["connect_timeout"]) {
                config.fetch.connect_timeout_seconds = fetch["connect_timeout"].as<int>();
            }
            if (fetch["read_timeout"]) {
                config.fetch.read_timeout_seconds = fetch["read_timeout"].as<int>();
            }
            if (fetch["follow_redirects"]) {
                config.fetch.follow_redirects = fetch["follow_redirects"].as<bool>();
            }
            if (fetch["verify_tls"]) {
                config.fetch.verify_tls = fetch["verify_tls"].as<bool>();
            }
            if (fetch["user_agent"]) {
                config.fetch.user_agent = fetch["user_agent"].as<std::string>();
            }
        }

        // -- Log --
        if (const auto log = root["log"]) {
            if (log["level"]) {
                config.log.level = log["level"].as<std::string>();
            }
            if (log["file"]) {
                config.log.file = log["file"].as<std::string>();
            }
            if (log["color"]) {
                config.log.color = log["color"].as<bool>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what()),
                            path));
    }

    LogDebug("config", "loaded " + path);
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv) {
    // -v is verbosity here, so only --help comes from argparse.
    argparse::ArgumentParser program("toolhost", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "MCP tool server on stdio: echo, HTTP fetch and filesystem tools.");

    CliOverrides cli;

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--workers")
        .help("Threads executing tool calls (0: handle inline)")
        .scan<'i', int>();

    // Fetch
    program.add_argument("--connect-timeout")
        .help("HTTP connect timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--read-timeout")
        .help("HTTP read timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--no-follow-redirects")
        .help("Do not follow HTTP redirects")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--user-agent")
        .help("User-Agent header for fetch requests");

    // Logging
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Write JSON-lines logs to this file instead of stderr");
    program.add_argument("-v", "--verbose")
        .help("More logging (-v: info, -vv: debug)")
        .action([&cli](const auto&) { ++cli.verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOverrides, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    if (auto val = program.present("--config")) {
        cli.config_path = *val;
    }
    if (auto val = program.present<int>("--workers")) {
        cli.workers = *val;
    }
    if (auto val = program.present<int>("--connect-timeout")) {
        cli.connect_timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--read-timeout")) {
        cli.read_timeout_seconds = *val;
    }
    cli.no_follow_redirects = program.get<bool>("--no-follow-redirects");
    cli.insecure = program.get<bool>("--insecure");
    if (auto val = program.present("--user-agent")) {
        cli.user_agent = *val;
    }
    if (auto val = program.present("--log-level")) {
        cli.log_level = *val;
    }
    if (auto val = program.present("--log-file")) {
        cli.log_file = *val;
    }
    cli.no_color = program.get<bool>("--no-color");
    cli.show_version = program.get<bool>("--version");

    return Result<CliOverrides, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const CliOverrides& cli_overrides) {
    AppConfig merged = yaml_base;

    if (cli_overrides.workers) {
        merged.server.workers = *cli_overrides.workers;
    }

    if (cli_overrides.connect_timeout_seconds) {
        merged.fetch.connect_timeout_seconds = *cli_overrides.connect_timeout_seconds;
    }
    if (cli_overrides.read_timeout_seconds) {
        merged.fetch.read_timeout_seconds = *cli_overrides.read_timeout_seconds;
    }
    if (cli_overrides.no_follow_redirects) {
        merged.fetch.follow_redirects = false;
    }
    if (cli_overrides.insecure) {
        merged.fetch.verify_tls = false;
    }
    if (cli_overrides.user_agent) {
        merged.fetch.user_agent = *cli_overrides.user_agent;
    }

    if (cli_overrides.log_level) {
        merged.log.level = *cli_overrides.log_level;
    } else if (cli_overrides.verbosity >= 2) {
        merged.log.level = "debug";
    } else if (cli_overrides.verbosity == 1) {
        merged.log.level = "info";
    }
    if (cli_overrides.log_file) {
        merged.log.file = cli_overrides.log_file;
    }
    if (cli_overrides.no_color) {
        merged.log.color = false;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.workers < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Workers must not be negative, got " +
                            std::to_string(config.server.workers)));
    }
    if (config.fetch.connect_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Connect timeout must be positive, got " +
                            std::to_string(config.fetch.connect_timeout_seconds)));
    }
    if (config.fetch.read_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Read timeout must be positive, got " +
                            std::to_string(config.fetch.read_timeout_seconds)));
    }
    if (!ParseLogLevel(config.log.level)) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log level: " + config.log.level));
    }
    if (config.log.file && config.log.file->empty()) {
        return Result<void, Error>::Err(MakeConfigError("Log file path is empty"));
    }
    return Result<void, Error>::Ok();
}

} // namespace toolhost
