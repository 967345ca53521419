#pragma once

#include <httplib.h>

#include <string>
#include <thread>

namespace toolhost {
namespace testing {

// RAII wrapper: binds an httplib::Server to a free loopback port, serves it
// on a background thread and stops it on destruction.
class LocalServer {
public:
    explicit LocalServer(httplib::Server& svr) : svr_(svr) {
        // Let the OS pick a free port by binding to 0.
        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~LocalServer() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

    [[nodiscard]] int Port() const noexcept { return port_; }

    [[nodiscard]] std::string Url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    httplib::Server& svr_;
    int port_ = 0;
    std::thread thread_;
};

} // namespace testing
} // namespace toolhost
