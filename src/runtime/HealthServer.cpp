#include "HealthServer.h"

#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/time.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <sstream>

using json = nlohmann::json;

namespace {

const char* reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
    }
    return "Internal Server Error";
}

}  // namespace

std::string iso8601Now() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

HealthServer::~HealthServer() {
    stop();
}

std::string HealthServer::healthJson() {
    return json{{"status", "ok"}, {"service", SERVICE_NAME}, {"version", VERSION}, {"timestamp", iso8601Now()}}.dump();
}

std::string HealthServer::infoJson(const RuntimeStats& stats) {
    return json{{"mission", stats.mission},
                {"frame", stats.frame},
                {"elapsed_seconds", stats.elapsedSeconds},
                {"entity_count", stats.entityCount},
                {"player", {{"position", {stats.playerPosition.x, stats.playerPosition.y, stats.playerPosition.z}}}}}
        .dump();
}

HttpResponse HealthServer::handle(const std::string& method, const std::string& path) const {
    std::string route = path.substr(0, path.find('?'));
    bool known = route == "/v1/health" || route == "/v1/info";
    if (!known) {
        return {404, json{{"error", "not found"}}.dump()};
    }
    if (method != "GET") {
        return {405, json{{"error", "method not allowed"}}.dump()};
    }
    if (route == "/v1/health") {
        return {200, healthJson()};
    }
    return {200, infoJson(snapshot_.read())};
}

bool HealthServer::start(uint16_t port) {
    listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listenFd_ < 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HealthServer: socket() failed: %s", std::strerror(errno));
        return false;
    }
    int reuse = 1;
    ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0 ||
        ::listen(listenFd_, 8) < 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HealthServer: cannot listen on 127.0.0.1:%u: %s",
                     port, std::strerror(errno));
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }

    socklen_t length = sizeof(address);
    ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&address), &length);
    port_ = ntohs(address.sin_port);
    running_ = true;
    thread_ = std::thread(&HealthServer::serve, this);
    SDL_Log("HealthServer: Listening on http://127.0.0.1:%u", port_);
    return true;
}

void HealthServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }
    SDL_Log("HealthServer: Stopped");
}

void HealthServer::serve() {
    // Poll with a timeout so stop() is noticed without closing the socket under accept()
    while (running_) {
        pollfd fd{listenFd_, POLLIN, 0};
        int ready = ::poll(&fd, 1, POLL_INTERVAL_MS);
        if (ready <= 0) {
            continue;
        }
        int client = ::accept(listenFd_, nullptr, nullptr);
        if (client < 0) {
            continue;
        }
        respond(client);
        ::close(client);
    }
}

void HealthServer::respond(int client) const {
    // A client that connects and never writes must not hold up the loop or stop()
    timeval sendTimeout{CLIENT_TIMEOUT_MS / 1000, (CLIENT_TIMEOUT_MS % 1000) * 1000};
    if (::setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &sendTimeout, sizeof(sendTimeout)) < 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "HealthServer: SO_SNDTIMEO failed: %s", std::strerror(errno));
    }
    int waited = 0;
    while (true) {
        pollfd fd{client, POLLIN, 0};
        int ready = ::poll(&fd, 1, POLL_INTERVAL_MS);
        if (ready > 0) {
            break;
        }
        waited += POLL_INTERVAL_MS;
        if (ready < 0 || !running_ || waited >= CLIENT_TIMEOUT_MS) {
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "HealthServer: dropping idle client");
            return;
        }
    }

    char buffer[4096];
    ssize_t received = ::recv(client, buffer, sizeof(buffer) - 1, 0);
    HttpResponse response;
    if (received <= 0) {
        return;
    }
    buffer[received] = '\0';

    std::istringstream request(buffer);
    std::string method, path, version;
    if (!(request >> method >> path >> version)) {
        response = {400, json{{"error", "bad request"}}.dump()};
    } else {
        response = handle(method, path);
    }

    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << ' ' << reasonPhrase(response.status) << "\r\n"
        << "Content-Type: application/json\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << response.body;
    const std::string data = out.str();
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(client, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "HealthServer: client went away mid-response");
            return;
        }
        sent += static_cast<size_t>(n);
    }
}
