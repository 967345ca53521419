#pragma once

#include <optional>
#include <string>

namespace toolhost {

struct ServerConfig {
    int workers = 4;
};

struct FetchConfig {
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 30;
    bool follow_redirects = true;
    bool verify_tls = true;
    std::string user_agent;       // empty: "toolhost/<version>"
};

struct LogConfig {
    std::string level = "warn";   // debug|info|warn|error
    std::optional<std::string> file;
    bool color = true;
};

struct AppConfig {
    ServerConfig server;
    FetchConfig fetch;
    LogConfig log;
};

// Values given on the command line. Anything left unset keeps the value
// from the YAML file (or the default).
struct CliOverrides {
    std::optional<std::string> config_path;
    std::optional<int> workers;
    std::optional<int> connect_timeout_seconds;
    std::optional<int> read_timeout_seconds;
    bool no_follow_redirects = false;
    bool insecure = false;
    std::optional<std::string> user_agent;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    int verbosity = 0;            // -v: info, -vv: debug
    bool no_color = false;
    bool show_version = false;
};

} // namespace toolhost
