#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <string>

#include "HealthServer.h"
#include "RuntimeConfig.h"
#include "RuntimeSnapshot.h"

using json = nlohmann::json;

TEST_SUITE("MissionArgument") {
    TEST_CASE("bare name uses the map default spawn") {
        auto arg = parseMissionArgument("earth");
        REQUIRE(arg.has_value());
        CHECK(arg->mission == "earth");
        CHECK(arg->spawn.kind == SpawnLocation::Kind::MapDefault);
    }

    TEST_CASE("explicit default") {
        auto arg = parseMissionArgument("medsci1:default");
        REQUIRE(arg.has_value());
        CHECK(arg->mission == "medsci1");
        CHECK(arg->spawn.kind == SpawnLocation::Kind::MapDefault);
    }

    TEST_CASE("coordinates") {
        auto arg = parseMissionArgument("eng1:1.5,-2,30");
        REQUIRE(arg.has_value());
        CHECK(arg->spawn.kind == SpawnLocation::Kind::Position);
        CHECK(arg->spawn.position.x == doctest::Approx(1.5f));
        CHECK(arg->spawn.position.y == doctest::Approx(-2.0f));
        CHECK(arg->spawn.position.z == doctest::Approx(30.0f));
    }

    TEST_CASE("malformed arguments are rejected") {
        CHECK_FALSE(parseMissionArgument("").has_value());
        CHECK_FALSE(parseMissionArgument(":default").has_value());
        CHECK_FALSE(parseMissionArgument("earth:1,2").has_value());
        CHECK_FALSE(parseMissionArgument("earth:1,b,3").has_value());
    }
}

TEST_SUITE("CommandLine") {
    TEST_CASE("defaults") {
        auto cl = parseCommandLine({});
        CHECK(cl.ok());
        CHECK_FALSE(cl.showHelp);
        CHECK(cl.config.mission == "earth");
        CHECK(cl.config.port == 8080);
        CHECK(cl.config.ticks == 0);
    }

    TEST_CASE("flags") {
        auto cl = parseCommandLine({"--mission", "medsci2:0,0,0", "--port", "9001", "--ticks", "12",
                                    "--experimental", "gui,ragdoll", "--debug-draw", "--verbose",
                                    "--save-file", "save.json"});
        REQUIRE(cl.ok());
        CHECK(cl.config.mission == "medsci2");
        CHECK(cl.config.spawn.kind == SpawnLocation::Kind::Position);
        CHECK(cl.config.port == 9001);
        CHECK(cl.config.ticks == 12);
        CHECK(cl.config.experimental.count("gui") == 1);
        CHECK(cl.config.experimental.count("ragdoll") == 1);
        CHECK(cl.config.debugDraw);
        CHECK_FALSE(cl.config.debugPhysics);
        CHECK(cl.config.verbose);
        REQUIRE(cl.config.saveFile.has_value());
        CHECK(*cl.config.saveFile == "save.json");
    }

    TEST_CASE("help") {
        CHECK(parseCommandLine({"-h"}).showHelp);
        CHECK(parseCommandLine({"--help"}).showHelp);
    }

    TEST_CASE("errors") {
        CHECK_FALSE(parseCommandLine({"--bogus"}).ok());
        CHECK_FALSE(parseCommandLine({"--port"}).ok());
        CHECK_FALSE(parseCommandLine({"--port", "70000"}).ok());
        CHECK_FALSE(parseCommandLine({"--ticks", "-3"}).ok());
        CHECK_FALSE(parseCommandLine({"--mission", ":x"}).ok());
        CHECK_FALSE(parseCommandLine({"--config", "/nonexistent/darkcore.json"}).ok());
    }

    TEST_CASE("config json merge") {
        RuntimeConfig config;
        CHECK(config.mergeFromJson(R"({"asset_root": "/data", "tick_rate_hz": 60, "experimental": ["gui"]})"));
        CHECK(config.assetRoot == "/data");
        CHECK(config.tickRateHz == doctest::Approx(60.0f));
        CHECK(config.port == 8080);
        CHECK(config.experimental.count("gui") == 1);

        CHECK_FALSE(config.mergeFromJson("{not json"));
        CHECK(config.assetRoot == "/data");
    }
}

TEST_SUITE("HealthServer") {
    TEST_CASE("routing") {
        RuntimeSnapshot snapshot;
        HealthServer server(snapshot);

        CHECK(server.handle("GET", "/").status == 404);
        CHECK(server.handle("GET", "/v2/health").status == 404);
        CHECK(server.handle("POST", "/v1/health").status == 405);
        CHECK(server.handle("DELETE", "/v1/info").status == 405);

        auto health = server.handle("GET", "/v1/health?verbose=1");
        CHECK(health.status == 200);
        json body = json::parse(health.body);
        CHECK(body["status"] == "ok");
        CHECK(body["service"] == HealthServer::SERVICE_NAME);
        CHECK(body["timestamp"].get<std::string>().back() == 'Z');
    }

    TEST_CASE("info reflects the latest snapshot") {
        RuntimeSnapshot snapshot;
        HealthServer server(snapshot);
        snapshot.publish(RuntimeStats{"earth", 42, 1.4, 17, glm::vec3(1.0f, 2.0f, 3.0f)});

        auto info = server.handle("GET", "/v1/info");
        REQUIRE(info.status == 200);
        json body = json::parse(info.body);
        CHECK(body["mission"] == "earth");
        CHECK(body["frame"] == 42);
        CHECK(body["entity_count"] == 17);
        CHECK(body["player"]["position"][2].get<float>() == doctest::Approx(3.0f));
    }

    TEST_CASE("not running until started") {
        RuntimeSnapshot snapshot;
        HealthServer server(snapshot);
        CHECK_FALSE(server.running());
        server.stop();
        CHECK_FALSE(server.running());
    }

    TEST_CASE("an idle client does not block stop or later requests") {
        RuntimeSnapshot snapshot;
        HealthServer server(snapshot);
        REQUIRE(server.start(0));

        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_port = htons(server.port());
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

        // Connects and never sends a request
        int idle = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(idle >= 0);
        REQUIRE(::connect(idle, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0);

        int client = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(client >= 0);
        REQUIRE(::connect(client, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0);
        const std::string request = "GET /v1/health HTTP/1.1\r\nHost: localhost\r\n\r\n";
        REQUIRE(::send(client, request.data(), request.size(), 0) == static_cast<ssize_t>(request.size()));

        std::string reply;
        char buffer[1024];
        ssize_t n;
        while ((n = ::recv(client, buffer, sizeof(buffer), 0)) > 0) {
            reply.append(buffer, static_cast<size_t>(n));
        }
        CHECK(reply.rfind("HTTP/1.1 200 OK", 0) == 0);
        ::close(client);

        // A second idle client is in the queue while stop() runs
        int lingering = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(lingering >= 0);
        REQUIRE(::connect(lingering, reinterpret_cast<sockaddr*>(&address), sizeof(address)) == 0);

        const auto before = std::chrono::steady_clock::now();
        server.stop();
        const auto elapsed = std::chrono::steady_clock::now() - before;
        CHECK(elapsed < std::chrono::milliseconds(HealthServer::CLIENT_TIMEOUT_MS + 1000));
        CHECK_FALSE(server.running());

        ::close(idle);
        ::close(lingering);
    }
}
