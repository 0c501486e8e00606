// Rendezvous service: request validation and the stream protocol
#include <catch2/catch_test_macros.hpp>
#include "infra/mock_host.hpp"
#include "infra/stream_client.hpp"
#include "network/asio_host.hpp"
#include "network/protocol.hpp"
#include "rendezvous/rendezvous_service.hpp"
#include "util/error.hpp"
#include "util/time.hpp"

using namespace rdvp::rendezvous;
using json = nlohmann::json;
using rdvp::crypto::GenerateKey;
using rdvp::crypto::KeyType;
using rdvp::crypto::PeerId;
using rdvp::network::MockHost;

namespace {

std::string NewPeerId() {
    return PeerId::FromPublicKey(GenerateKey(KeyType::Ed25519).GetPublic()).ToString();
}

json RegisterRequest(const std::string& ns, const std::string& peer,
                     json addrs = json::array({"/ip4/10.0.0.1/tcp/4001"})) {
    return {{"type", "REGISTER"}, {"ns", ns}, {"peer", {{"id", peer}, {"addrs", addrs}}}};
}

} // namespace

TEST_CASE("RendezvousService - REGISTER validation", "[rendezvous][service]") {
    rdvp::util::MockTimeScope mock(1000000);
    MockHost host;
    auto store = RegistrationStore::Open(MEMORY_URN);
    RendezvousService service(host, *store);
    REQUIRE(host.HasHandler(rdvp::protocol::RENDEZVOUS_ID));

    std::string peer = NewPeerId();

    SECTION("Accepted with the default ttl") {
        auto reply = service.HandleRequest(RegisterRequest("chat", peer));
        REQUIRE(reply.has_value());
        REQUIRE((*reply)["type"] == "REGISTER_RESPONSE");
        REQUIRE((*reply)["status"] == "OK");
        REQUIRE((*reply)["ttl"] == DEFAULT_TTL);
        REQUIRE(store->CountRegistrations(peer) == 1);
    }

    SECTION("Explicit ttl and ttl zero") {
        json request = RegisterRequest("chat", peer);
        request["ttl"] = 60;
        REQUIRE((*service.HandleRequest(request))["ttl"] == 60);
        request["ttl"] = 0;
        REQUIRE((*service.HandleRequest(request))["ttl"] == DEFAULT_TTL);
    }

    SECTION("Invalid ttl") {
        json request = RegisterRequest("chat", peer);
        request["ttl"] = MAX_TTL + 1;
        REQUIRE((*service.HandleRequest(request))["status"] == "E_INVALID_TTL");
        request["ttl"] = -5;
        REQUIRE((*service.HandleRequest(request))["status"] == "E_INVALID_TTL");
        request["ttl"] = "soon";
        REQUIRE((*service.HandleRequest(request))["status"] == "E_INVALID_TTL");
        REQUIRE(store->CountRegistrations(peer) == 0);
    }

    SECTION("Invalid namespace") {
        REQUIRE((*service.HandleRequest(RegisterRequest("", peer)))["status"] ==
                "E_INVALID_NAMESPACE");
        REQUIRE((*service.HandleRequest(RegisterRequest(std::string(MAX_NAMESPACE_LENGTH + 1, 'n'),
                                                        peer)))["status"] == "E_INVALID_NAMESPACE");
        json request = RegisterRequest("chat", peer);
        request["ns"] = 42;
        REQUIRE((*service.HandleRequest(request))["status"] == "E_INVALID_NAMESPACE");
    }

    SECTION("Invalid peer info") {
        REQUIRE((*service.HandleRequest(RegisterRequest("chat", "bogus")))["status"] ==
                "E_INVALID_PEER_INFO");
        REQUIRE((*service.HandleRequest(RegisterRequest("chat", peer, json::array())))["status"] ==
                "E_INVALID_PEER_INFO");
        REQUIRE((*service.HandleRequest(RegisterRequest("chat", peer, json::array({"garbage"}))))
                    ["status"] == "E_INVALID_PEER_INFO");

        json too_long = json::array();
        for (int i = 0; i < 100; ++i) too_long.push_back("/ip4/10.0.0.1/tcp/4001");
        REQUIRE((*service.HandleRequest(RegisterRequest("chat", peer, too_long)))["status"] ==
                "E_INVALID_PEER_INFO");

        json no_peer = {{"type", "REGISTER"}, {"ns", "chat"}};
        REQUIRE((*service.HandleRequest(no_peer))["status"] == "E_INVALID_PEER_INFO");
    }

    SECTION("Registration cap per peer") {
        for (size_t i = 0; i < MAX_REGISTRATIONS; ++i) {
            store->Register(peer, "ns" + std::to_string(i), {"/ip4/10.0.0.1/tcp/4001"}, 60);
        }
        REQUIRE((*service.HandleRequest(RegisterRequest("one-more", peer)))["status"] ==
                "E_NOT_AUTHORIZED");
    }

    SECTION("Closed store is unavailable") {
        store->Close();
        REQUIRE((*service.HandleRequest(RegisterRequest("chat", peer)))["status"] ==
                "E_UNAVAILABLE");
        json discover = {{"type", "DISCOVER"}, {"ns", "chat"}};
        REQUIRE((*service.HandleRequest(discover))["status"] == "E_UNAVAILABLE");
    }

    SECTION("Unknown type is an error") {
        REQUIRE_THROWS_AS(service.HandleRequest({{"type", "PING"}}), rdvp::util::Error);
        REQUIRE_THROWS_AS(service.HandleRequest(json::array()), rdvp::util::Error);
    }
}

TEST_CASE("RendezvousService - DISCOVER and UNREGISTER", "[rendezvous][service]") {
    rdvp::util::MockTimeScope mock(1000000);
    MockHost host;
    auto store = RegistrationStore::Open(MEMORY_URN);
    RendezvousService service(host, *store);

    std::string alice = NewPeerId();
    std::string bob = NewPeerId();
    json request = RegisterRequest("chat", alice);
    request["ttl"] = 100;
    service.HandleRequest(request);
    service.HandleRequest(RegisterRequest("chat", bob));

    SECTION("Discover returns registrations with remaining ttl") {
        rdvp::util::MockTimeScope later(1000040);
        auto reply = service.HandleRequest({{"type", "DISCOVER"}, {"ns", "chat"}});
        REQUIRE((*reply)["status"] == "OK");
        auto regs = (*reply)["registrations"];
        REQUIRE(regs.size() == 2);
        REQUIRE(regs[0]["peer"]["id"] == alice);
        REQUIRE(regs[0]["peer"]["addrs"][0] == "/ip4/10.0.0.1/tcp/4001");
        REQUIRE(regs[0]["ttl"] == 60);
        REQUIRE(regs[0]["ns"] == "chat");
    }

    SECTION("Limit and cookie") {
        auto first = service.HandleRequest({{"type", "DISCOVER"}, {"ns", "chat"}, {"limit", 1}});
        REQUIRE((*first)["registrations"].size() == 1);
        auto second = service.HandleRequest(
            {{"type", "DISCOVER"}, {"ns", "chat"}, {"limit", 1}, {"cookie", (*first)["cookie"]}});
        REQUIRE((*second)["registrations"].size() == 1);
        REQUIRE((*second)["registrations"][0]["peer"]["id"] == bob);
    }

    SECTION("Bad cookie") {
        auto reply = service.HandleRequest({{"type", "DISCOVER"}, {"ns", "chat"}, {"cookie", "xyz"}});
        REQUIRE((*reply)["status"] == "E_INVALID_COOKIE");
        REQUIRE((*reply)["registrations"].empty());
    }

    SECTION("Unregister has no reply") {
        auto reply = service.HandleRequest({{"type", "UNREGISTER"}, {"ns", "chat"}, {"peer", alice}});
        REQUIRE_FALSE(reply.has_value());
        REQUIRE(store->CountRegistrations(alice) == 0);
        REQUIRE(store->CountRegistrations(bob) == 1);
    }

    SECTION("Unregister with an invalid peer is ignored") {
        REQUIRE_FALSE(service.HandleRequest({{"type", "UNREGISTER"}, {"ns", "chat"}, {"peer", "x"}})
                          .has_value());
        REQUIRE(store->CountRegistrations(alice) == 1);
    }
}

TEST_CASE("RendezvousService - stream handling", "[rendezvous][service]") {
    MockHost host;
    auto store = RegistrationStore::Open(MEMORY_URN);
    RendezvousService service(host, *store);

    SECTION("Malformed JSON closes the stream") {
        auto stream = host.OpenStream(rdvp::protocol::RENDEZVOUS_ID);
        stream->SimulateReceive("{oops");
        REQUIRE_FALSE(stream->is_open());
    }

    SECTION("Unknown type closes the stream") {
        auto stream = host.OpenStream(rdvp::protocol::RENDEZVOUS_ID);
        stream->SimulateReceive(json{{"type", "PING"}}.dump());
        REQUIRE_FALSE(stream->is_open());
        REQUIRE(stream->sent().empty());
    }

    SECTION("Close removes the handler and closes streams") {
        auto stream = host.OpenStream(rdvp::protocol::RENDEZVOUS_ID);
        service.Close();
        REQUIRE_FALSE(host.HasHandler(rdvp::protocol::RENDEZVOUS_ID));
        REQUIRE_FALSE(stream->is_open());
    }
}

TEST_CASE("RendezvousService - register, discover, unregister over TCP", "[rendezvous][service]") {
    rdvp::network::HostOptions options;
    options.listen_addrs = {*rdvp::network::Multiaddr::Parse("/ip4/127.0.0.1/tcp/0")};
    options.enable_nat_service = false;
    options.enable_relay_hop = false;
    auto host = rdvp::network::AsioHost::Create(GenerateKey(KeyType::Ed25519), options);
    auto store = RegistrationStore::Open(MEMORY_URN);
    auto service = std::make_unique<RendezvousService>(*host, *store);
    uint16_t port = rdvp::network::TcpPort(*host);

    std::string peer = NewPeerId();

    rdvp::network::StreamClient client;
    REQUIRE(client.Open(port, rdvp::protocol::RENDEZVOUS_ID));

    client.SendJson(RegisterRequest("topic", peer));
    auto registered = client.ReceiveJson();
    REQUIRE(registered.has_value());
    REQUIRE((*registered)["status"] == "OK");

    rdvp::network::StreamClient other;
    REQUIRE(other.Open(port, rdvp::protocol::RENDEZVOUS_ID));
    other.SendJson({{"type", "DISCOVER"}, {"ns", "topic"}});
    auto found = other.ReceiveJson();
    REQUIRE(found.has_value());
    REQUIRE((*found)["registrations"].size() == 1);
    REQUIRE((*found)["registrations"][0]["peer"]["id"] == peer);

    client.SendJson({{"type", "UNREGISTER"}, {"ns", "topic"}, {"peer", peer}});
    // UNREGISTER has no reply; a following DISCOVER on the same stream orders after it
    client.SendJson({{"type", "DISCOVER"}, {"ns", "topic"}});
    auto after = client.ReceiveJson();
    REQUIRE(after.has_value());
    REQUIRE((*after)["registrations"].empty());

    // Host first: no stream callback may run once the service is gone
    host->Close();
    service.reset();
}
