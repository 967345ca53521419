#include <toolhost/config/config_loader.hpp>
#include <toolhost/core/log.hpp>
#include <toolhost/core/terminal.hpp>
#include <toolhost/core/version.hpp>
#include <toolhost/http/http_client.hpp>
#include <toolhost/mcp/mcp_server.hpp>
#include <toolhost/mcp/tool_service.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess  = 0;
constexpr int kExitConfig   = 2;
constexpr int kExitInternal = 99;

// Config problems are reported before the logger exists.
int Fail(const toolhost::Error& error, int code) {
    std::cerr << "toolhost: " << error.ToString() << "\n";
    return code;
}

toolhost::HttpClientOptions ToHttpClientOptions(const toolhost::FetchConfig& fetch) {
    toolhost::HttpClientOptions opts;
    opts.connect_timeout = std::chrono::seconds(fetch.connect_timeout_seconds);
    opts.read_timeout = std::chrono::seconds(fetch.read_timeout_seconds);
    opts.follow_redirects = fetch.follow_redirects;
    opts.verify_tls = fetch.verify_tls;
    opts.user_agent = fetch.user_agent;
    return opts;
}

bool InitLogging(const toolhost::LogConfig& log) {
    using namespace toolhost;

    const auto level = ParseLogLevel(log.level).value_or(LogLevel::Warn);
    if (log.file) {
        auto file = std::make_unique<std::ofstream>(*log.file, std::ios::app);
        if (!*file) {
            std::cerr << "toolhost: cannot open log file " << *log.file << "\n";
            return false;
        }
        InitGlobalLogger(std::make_unique<JsonSink>(std::move(file)), level);
        return true;
    }

    // NO_COLOR env var (https://no-color.org/).
    const bool use_color = log.color && !NoColorEnvSet() && IsStderrTty();
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), level);
    return true;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace toolhost;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return Fail(cli.Error(), kExitConfig);
    }
    const auto& overrides = cli.Value();

    if (overrides.show_version) {
        std::cout << "toolhost " << kVersion << "\n";
        return kExitSuccess;
    }

    AppConfig base;
    if (overrides.config_path) {
        auto yaml = LoadFromYaml(*overrides.config_path);
        if (yaml.IsErr()) {
            return Fail(yaml.Error(), kExitConfig);
        }
        base = std::move(yaml).Value();
    }

    const auto config = MergeConfigs(base, overrides);
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Fail(valid.Error(), kExitConfig);
    }

    if (!InitLogging(config.log)) {
        return kExitConfig;
    }
    LogInfo("config", "toolhost " + std::string(kVersion) + ", log level " +
                          config.log.level);

    auto service = ToolService::Create(
        std::make_unique<HttpClient>(ToHttpClientOptions(config.fetch)));
    if (service.IsErr()) {
        LogError("mcp", service.Error().ToString());
        return Fail(service.Error(), kExitInternal);
    }

    McpServerOptions server_options;
    server_options.workers = static_cast<std::size_t>(config.server.workers);

    // Blocks until EOF on stdin.
    McpServer server(*service.Value(), std::cin, std::cout, server_options);
    server.Run();

    return kExitSuccess;
}
