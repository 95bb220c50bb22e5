// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// UdpTransport over loopback

#include <catch2/catch_test_macros.hpp>

#include "infra/test_io_context.hpp"
#include "network/errors.hpp"
#include "network/udp_transport.hpp"

#include <random>
#include <string>

#include <asio.hpp>

using namespace meshwire::network;
using meshwire::test::Inbox;
using meshwire::test::TestIoContext;
using json = nlohmann::json;

namespace {

struct Received {
    Package pkg;
    Address sender;
};

Package MakeRequest(const std::string& type, std::optional<json> payload, uint16_t advertised_port,
                    std::optional<SessionId> session = std::nullopt) {
    PackageMetadata metadata;
    metadata.advertised_port = advertised_port;
    metadata.session_id = session;
    metadata.stage = session ? PackageStage::REQUEST : PackageStage::INACTIVE;
    return Package(Message("T", type, std::move(payload)).Serialize(), metadata);
}

std::string RandomText(size_t n) {
    static const char* digits = "0123456789abcdef";
    std::mt19937 rng(7);
    std::string out(n, '0');
    for (auto& c : out) {
        c = digits[rng() % 16];
    }
    return out;
}

PackageCallback Recorder(Inbox<Received>& inbox) {
    return [&inbox](const Package& pkg, const Address& sender) -> std::optional<Message> {
        inbox.Push(Received{pkg, sender});
        if (pkg.metadata.stage == PackageStage::REQUEST && pkg.message.type == "PING") {
            return Message("T", "PING", json("PONG"));
        }
        return std::nullopt;
    };
}

Address Loopback(uint16_t port) {
    return Address("127.0.0.1", port);
}

// Write raw bytes to a UDP port from a throwaway socket
void SendRaw(uint16_t port, const std::vector<uint8_t>& bytes) {
    asio::io_context raw_io;
    asio::ip::udp::socket raw(raw_io);
    raw.open(asio::ip::udp::v4());
    raw.send_to(asio::buffer(bytes), asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"), port));
}

}  // namespace

TEST_CASE("UdpTransport: Listen binds an ephemeral port", "[network][transport][udp]") {
    TestIoContext io;
    auto t = std::make_shared<UdpTransport>(io.get(), UdpTransport::Config{});
    Inbox<Received> inbox;

    REQUIRE(t->Listen(0, Recorder(inbox)));
    CHECK(t->listening_port() != 0);
    CHECK(t->advertised_port() == t->listening_port());
    CHECK(t->kind() == TransportKind::UDP);
    CHECK(t->max_package_size() == meshwire::protocol::DEFAULT_UDP_MAX_PACKAGE_SIZE);
    CHECK_FALSE(t->Listen(0, Recorder(inbox)));

    t->Stop();
    CHECK_NOTHROW(t->Stop());
}

TEST_CASE("UdpTransport: request and reply over loopback", "[network][transport][udp]") {
    TestIoContext io;
    auto server = std::make_shared<UdpTransport>(io.get(), UdpTransport::Config{});
    auto client = std::make_shared<UdpTransport>(io.get(), UdpTransport::Config{});
    Inbox<Received> server_inbox;
    Inbox<Received> client_inbox;
    REQUIRE(server->Listen(0, Recorder(server_inbox)));
    REQUIRE(client->Listen(0, Recorder(client_inbox)));

    client->Send(Loopback(server->listening_port()), MakeRequest("PING", json("x"), client->advertised_port(), 21));

    REQUIRE(server_inbox.WaitForCount(1));
    auto request = server_inbox.Items().front();
    // Datagrams leave from the send socket; the sender is known by its advertised port
    CHECK(request.sender == Loopback(client->listening_port()));
    auto nyms = server->peers().Lookup(request.sender);
    REQUIRE(nyms);
    CHECK(nyms->ephemeral.port != client->listening_port());

    REQUIRE(client_inbox.WaitForCount(1));
    auto reply = client_inbox.Items().front();
    CHECK(reply.pkg.metadata.stage == PackageStage::RESPONSE);
    CHECK(reply.pkg.metadata.session_id == SessionId{21});
    CHECK(reply.pkg.message.Deserialize().payload == json("PONG"));
    CHECK(reply.sender == Loopback(server->listening_port()));

    client->Stop();
    server->Stop();
}

TEST_CASE("UdpTransport: bad datagrams are dropped", "[network][transport][udp]") {
    TestIoContext io;
    auto server = std::make_shared<UdpTransport>(io.get(), UdpTransport::Config{});
    Inbox<Received> server_inbox;
    REQUIRE(server->Listen(0, Recorder(server_inbox)));

    SECTION("Oversized datagram") {
        SendRaw(server->listening_port(), std::vector<uint8_t>(4000, 0x11));
    }

    SECTION("Garbage of legal size") {
        SendRaw(server->listening_port(), std::vector<uint8_t>(100, 0x22));
    }

    SECTION("Empty datagram") {
        SendRaw(server->listening_port(), {});
    }

    CHECK_FALSE(server_inbox.WaitForCount(1, std::chrono::milliseconds(200)));

    // The receive loop is still armed
    auto client = std::make_shared<UdpTransport>(io.get(), UdpTransport::Config{});
    client->Send(Loopback(server->listening_port()), MakeRequest("NOTE", json(1), 5000));
    REQUIRE(server_inbox.WaitForCount(1));
    CHECK(server_inbox.Items().front().pkg.message.Deserialize().payload == json(1));

    client->Stop();
    server->Stop();
}

TEST_CASE("UdpTransport: size limit", "[network][transport][udp]") {
    TestIoContext io;
    auto t = std::make_shared<UdpTransport>(io.get(), UdpTransport::Config{});

    SECTION("Send refuses packages above the limit") {
        try {
            t->Send(Loopback(9), MakeRequest("BLOB", json(RandomText(4096)), 1000));
            FAIL("expected PackageTooLargeError");
        } catch (const PackageTooLargeError& e) {
            CHECK(e.limit() == meshwire::protocol::DEFAULT_UDP_MAX_PACKAGE_SIZE);
        }
    }

    SECTION("Receiver with a smaller limit drops the datagram") {
        UdpTransport::Config small;
        small.max_package_size = 128;
        auto server = std::make_shared<UdpTransport>(io.get(), small);
        Inbox<Received> inbox;
        REQUIRE(server->Listen(0, Recorder(inbox)));

        t->Send(Loopback(server->listening_port()), MakeRequest("BLOB", json(RandomText(600)), 1000));
        CHECK_FALSE(inbox.WaitForCount(1, std::chrono::milliseconds(200)));

        t->Send(Loopback(server->listening_port()), MakeRequest("NOTE", json(2), 1000));
        CHECK(inbox.WaitForCount(1));
        server->Stop();
    }

    t->Stop();
}

TEST_CASE("UdpTransport: unresolvable recipient is not an error", "[network][transport][udp]") {
    TestIoContext io;
    auto t = std::make_shared<UdpTransport>(io.get(), UdpTransport::Config{});
    CHECK_NOTHROW(t->Send(Address("host.invalid", 1), MakeRequest("NOTE", json(1), 1000)));
    CHECK_NOTHROW(t->Send(Address("::1", 1), MakeRequest("NOTE", json(1), 1000)));
    t->Stop();
}
