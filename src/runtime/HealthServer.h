#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

#include "RuntimeSnapshot.h"

struct HttpResponse {
    int status = 200;
    std::string body;
};

// Minimal read-only HTTP/1.1 endpoint on 127.0.0.1:
//   GET /v1/health  service status
//   GET /v1/info    the latest RuntimeSnapshot
class HealthServer {
public:
    static constexpr const char* SERVICE_NAME = "debug_runtime";
    static constexpr const char* VERSION = "0.1.0";
    static constexpr int POLL_INTERVAL_MS = 200;
    // Longest wait for a connected client's request
    static constexpr int CLIENT_TIMEOUT_MS = 2000;

    explicit HealthServer(const RuntimeSnapshot& snapshot) : snapshot_(snapshot) {}
    ~HealthServer();

    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

    // Binds and starts the accept thread; false when the port cannot be bound
    bool start(uint16_t port);
    void stop();

    bool running() const { return running_.load(); }
    uint16_t port() const { return port_; }

    // Routing without sockets; the request line's method and path only
    HttpResponse handle(const std::string& method, const std::string& path) const;

    static std::string healthJson();
    static std::string infoJson(const RuntimeStats& stats);

private:
    void serve();
    void respond(int client) const;

    const RuntimeSnapshot& snapshot_;
    int listenFd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

// Current UTC time as 2026-01-01T12:00:00Z
std::string iso8601Now();
