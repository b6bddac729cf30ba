#include <catch2/catch_test_macros.hpp>

#include "FleetFakes.hpp"
#include "LoopbackServer.hpp"
#include "core/types/Errors.hpp"
#include "core/types/Uuid.hpp"
#include "fleet/FleetSyncCoordinator.hpp"
#include "infrastructure/api/HostJson.hpp"
#include "infrastructure/database/HostStore.hpp"
#include "infrastructure/identity/LocalNode.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/PeerClient.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>

using namespace signfleet::core;
using namespace signfleet::infra;
using namespace signfleet::fleet;
using namespace signfleet::test;
using namespace std::chrono_literals;

namespace {

/// Serves a fixed /api/version reply.
class VersionPeer {
public:
    explicit VersionPeer(nlohmann::json reply) : reply_(std::move(reply)) {
        server_.router().add(HttpMethod::GET, "/api/version",
                             [this](const ApiRequest&, ApiResponse& response) {
                                 response.setJson(reply_);
                             });
        port_ = server_.start();
    }

    uint16_t port() const { return port_; }

private:
    nlohmann::json reply_;
    LoopbackServer server_;
    uint16_t port_{0};
};

} // namespace

TEST_CASE("PeerClient identity", "[PeerClient][Network]") {
    SECTION("A well-formed reply") {
        VersionPeer peer({{"id", "peer-1"}, {"version", "2.1.0"}, {"hostname", "lobby"}});
        PeerClient client(peer.port(), 2s, 2s);

        auto identity = client.fetchIdentity("127.0.0.1", CancellationToken{});
        REQUIRE(identity.id == "peer-1");
        REQUIRE(identity.version == "2.1.0");
        REQUIRE(identity.hostname == "lobby");
    }

    SECTION("Missing fields take defaults") {
        VersionPeer peer({{"status", "ok"}});
        PeerClient client(peer.port(), 2s, 2s);

        auto identity = client.fetchIdentity("127.0.0.1", CancellationToken{});
        REQUIRE(identity.id.empty());
        REQUIRE(identity.version == "unknown");
    }

    SECTION("A non-string id is reported as an unusable peer") {
        VersionPeer peer({{"id", 42}, {"version", "2.1.0"}});
        PeerClient client(peer.port(), 2s, 2s);
        REQUIRE_THROWS_AS(client.fetchIdentity("127.0.0.1", CancellationToken{}),
                          PeerUnreachableError);
    }

    SECTION("A non-string version too") {
        VersionPeer peer({{"id", "peer-1"}, {"version", nlohmann::json::array({2, 1})}});
        PeerClient client(peer.port(), 2s, 2s);
        REQUIRE_THROWS_AS(client.fetchIdentity("127.0.0.1", CancellationToken{}),
                          PeerUnreachableError);
    }

    SECTION("A reply that is not an object") {
        VersionPeer peer(nlohmann::json::array({"peer-1"}));
        PeerClient client(peer.port(), 2s, 2s);
        REQUIRE_THROWS_AS(client.fetchIdentity("127.0.0.1", CancellationToken{}),
                          PeerUnreachableError);
    }
}

TEST_CASE("PeerClient self-description", "[PeerClient][Network]") {
    LoopbackServer server;
    server.router().add(HttpMethod::GET, "/api/host/local",
                        [](const ApiRequest&, ApiResponse& response) {
                            Host self = Host::withDefaults("10.0.0.9");
                            self.id = "peer-9";
                            self.hostname = "gym";
                            response.setJson(hostToJson(self));
                        });
    auto port = server.start();
    PeerClient client(port, 2s, 2s);

    auto remote = client.fetchSelfDescription("127.0.0.1", CancellationToken{});
    REQUIRE(remote.id == "peer-9");
    REQUIRE(remote.hostname == "gym");

    PeerClient closed(closedLoopbackPort(), 1s, 1s);
    REQUIRE_THROWS_AS(closed.fetchSelfDescription("127.0.0.1", CancellationToken{}),
                      PeerUnreachableError);
}

TEST_CASE("A peer with a garbled version reply still gets a placeholder",
          "[PeerClient][FleetSyncCoordinator][Network]") {
    // Serves /api/version only; /api/host/local answers 404
    VersionPeer peer({{"id", 42}, {"version", "2.1.0"}});

    auto dir = std::filesystem::temp_directory_path() / "signfleet_peerclient_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    {
        AsioContext workers(2);
        workers.start();
        HostStore store(dir / "hosts.db");
        LocalNode node(dir, "10.0.0.100", 8080, []() { return std::vector<NetworkInterface>{}; });
        FakeProber prober;
        FakeScanner scanner;
        PeerClient peers(peer.port(), 2s, 2s);
        FleetSyncConfig config;
        config.managementPort = peer.port();

        {
            FleetSyncCoordinator coordinator(store, prober, scanner, peers, node, workers, config);
            auto resolution =
                coordinator.resolveCandidate({"127.0.0.1", peer.port()}, CancellationToken{});
            REQUIRE(resolution == Resolution::Created);
            REQUIRE(coordinator.waitIdle(5s));
        }

        auto stored = store.getByIp("127.0.0.1");
        REQUIRE(stored.nickname == "Discovered Host");
        REQUIRE(isUuid(stored.id));
        workers.stop();
    }
    std::filesystem::remove_all(dir);
}
