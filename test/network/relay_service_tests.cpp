// Relay hop service: reservations, circuits and limits
#include <catch2/catch_test_macros.hpp>
#include "infra/mock_host.hpp"
#include "infra/stream_client.hpp"
#include "network/asio_host.hpp"
#include "network/protocol.hpp"
#include "network/relay_service.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>

using namespace rdvp::network;
using json = nlohmann::json;
using rdvp::crypto::GenerateKey;
using rdvp::crypto::KeyType;
using rdvp::crypto::PeerId;

namespace {

std::string NewPeerId() {
    return PeerId::FromPublicKey(GenerateKey(KeyType::Ed25519).GetPublic()).ToString();
}

json LastJson(const MockStream& stream) {
    auto sent = stream.sent();
    REQUIRE_FALSE(sent.empty());
    return json::parse(sent.back());
}

} // namespace

TEST_CASE("RelayService - control messages", "[network][relay]") {
    MockHost host;
    RelayService relay(host, rdvp::util::LogManager::GetLogger("network"));
    REQUIRE(host.HasHandler(rdvp::protocol::RELAY_HOP_ID));

    std::string peer = NewPeerId();

    SECTION("RESERVE keeps the stream") {
        auto stream = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        stream->SimulateReceive(json{{"type", "RESERVE"}, {"peer", peer}}.dump());
        REQUIRE(LastJson(*stream)["status"] == "OK");
        REQUIRE(relay.reservation_count() == 1);

        stream->Close();
        REQUIRE(relay.reservation_count() == 0);
    }

    SECTION("A new reservation for the same peer replaces the old stream") {
        auto first = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        auto second = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        first->SimulateReceive(json{{"type", "RESERVE"}, {"peer", peer}}.dump());
        second->SimulateReceive(json{{"type", "RESERVE"}, {"peer", peer}}.dump());
        REQUIRE_FALSE(first->is_open());
        REQUIRE(second->is_open());
        REQUIRE(relay.reservation_count() == 1);
    }

    SECTION("CONNECT without a reservation") {
        auto stream = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        stream->SimulateReceive(json{{"type", "CONNECT"}, {"peer", peer}}.dump());
        REQUIRE(LastJson(*stream)["status"] == "E_NO_RESERVATION");
    }

    SECTION("CONNECT to its own reservation") {
        auto stream = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        stream->SimulateReceive(json{{"type", "RESERVE"}, {"peer", peer}}.dump());
        stream->SimulateReceive(json{{"type", "CONNECT"}, {"peer", peer}}.dump());
        REQUIRE(LastJson(*stream)["status"] == "E_MALFORMED_MESSAGE");
    }

    SECTION("Malformed requests") {
        auto stream = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        stream->SimulateReceive("{not json");
        REQUIRE(LastJson(*stream)["status"] == "E_MALFORMED_MESSAGE");
        stream->SimulateReceive(json{{"type", "HOP"}}.dump());
        REQUIRE(LastJson(*stream)["status"] == "E_MALFORMED_MESSAGE");
        stream->SimulateReceive(json{{"type", "RESERVE"}, {"peer", "bogus"}}.dump());
        REQUIRE(LastJson(*stream)["status"] == "E_MALFORMED_MESSAGE");
        stream->SimulateReceive(json::array({1, 2}).dump());
        REQUIRE(LastJson(*stream)["status"] == "E_MALFORMED_MESSAGE");
        REQUIRE(stream->is_open());
    }

    SECTION("Reservation limit") {
        std::vector<std::shared_ptr<MockStream>> streams;
        for (size_t i = 0; i < RelayService::MAX_RESERVATIONS; ++i) {
            auto s = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
            s->SimulateReceive(json{{"type", "RESERVE"}, {"peer", NewPeerId()}}.dump());
            streams.push_back(s);
        }
        REQUIRE(relay.reservation_count() == RelayService::MAX_RESERVATIONS);

        auto extra = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        extra->SimulateReceive(json{{"type", "RESERVE"}, {"peer", peer}}.dump());
        REQUIRE(LastJson(*extra)["status"] == "E_RESOURCE_LIMIT_EXCEEDED");
    }

    SECTION("Splice forwards raw frames and closes both ends") {
        auto target = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        auto initiator = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        target->SimulateReceive(json{{"type", "RESERVE"}, {"peer", peer}}.dump());
        initiator->SimulateReceive(json{{"type", "CONNECT"}, {"peer", peer}}.dump());

        REQUIRE(LastJson(*initiator)["status"] == "OK");
        REQUIRE(LastJson(*target)["type"] == "CONNECT");
        REQUIRE(relay.circuit_count() == 1);
        REQUIRE(relay.reservation_count() == 0);

        initiator->SimulateReceive("not json at all");
        REQUIRE(target->sent().back() == "not json at all");
        target->SimulateReceive("reply");
        REQUIRE(initiator->sent().back() == "reply");

        initiator->Close();
        REQUIRE_FALSE(target->is_open());
        REQUIRE(relay.circuit_count() == 0);
    }

    SECTION("STATUS reports counts") {
        auto reserved = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        reserved->SimulateReceive(json{{"type", "RESERVE"}, {"peer", peer}}.dump());

        auto stream = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        stream->SimulateReceive(json{{"type", "STATUS"}}.dump());
        json reply = LastJson(*stream);
        REQUIRE(reply["status"] == "OK");
        REQUIRE(reply["reservations"] == 1);
        REQUIRE(reply["circuits"] == 0);
    }

    SECTION("Close removes the handler and closes streams") {
        auto stream = host.OpenStream(rdvp::protocol::RELAY_HOP_ID);
        relay.Close();
        REQUIRE_FALSE(host.HasHandler(rdvp::protocol::RELAY_HOP_ID));
        REQUIRE_FALSE(stream->is_open());
        relay.Close();
    }
}

TEST_CASE("RelayService - circuit over TCP", "[network][relay]") {
    HostOptions options;
    options.listen_addrs = {*Multiaddr::Parse("/ip4/127.0.0.1/tcp/0")};
    options.enable_nat_service = false;
    options.enable_relay_hop = true;
    auto host = AsioHost::Create(GenerateKey(KeyType::Ed25519), options);
    uint16_t port = TcpPort(*host);
    std::string peer = NewPeerId();

    StreamClient target;
    REQUIRE(target.Open(port, rdvp::protocol::RELAY_HOP_ID));
    target.SendJson({{"type", "RESERVE"}, {"peer", peer}});
    auto reserved = target.ReceiveJson();
    REQUIRE(reserved.has_value());
    REQUIRE((*reserved)["status"] == "OK");

    StreamClient initiator;
    REQUIRE(initiator.Open(port, rdvp::protocol::RELAY_HOP_ID));
    initiator.SendJson({{"type", "CONNECT"}, {"peer", peer}});
    auto connected = initiator.ReceiveJson();
    REQUIRE(connected.has_value());
    REQUIRE((*connected)["status"] == "OK");

    auto notice = target.ReceiveJson();
    REQUIRE(notice.has_value());
    REQUIRE((*notice)["type"] == "CONNECT");
    REQUIRE((*notice)["from"].get<std::string>().rfind("/ip4/127.0.0.1/tcp/", 0) == 0);

    initiator.Send("ping");
    REQUIRE(target.Receive() == "ping");
    target.Send("pong");
    REQUIRE(initiator.Receive() == "pong");

    target.Close();
    REQUIRE(initiator.WaitClosed());

    host->Close();
}
