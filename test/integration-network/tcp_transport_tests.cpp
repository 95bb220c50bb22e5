// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// TcpTransport over loopback

#include <catch2/catch_test_macros.hpp>

#include "infra/test_access.hpp"
#include "infra/test_io_context.hpp"
#include "network/errors.hpp"
#include "network/tcp_transport.hpp"

#include <atomic>
#include <random>
#include <string>
#include <thread>

#include <asio.hpp>

using namespace meshwire::network;
using meshwire::test::Inbox;
using meshwire::test::TcpTransportTestAccess;
using meshwire::test::TestIoContext;
using meshwire::test::WaitFor;
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
    std::mt19937 rng(99);
    std::string out(n, '0');
    for (auto& c : out) {
        c = digits[rng() % 16];
    }
    return out;
}

std::shared_ptr<TcpTransport> MakeTransport(asio::io_context& io, TcpTransport::Config config = {}) {
    return std::make_shared<TcpTransport>(io, config);
}

// Records every package; answers PING requests with PONG
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

}  // namespace

TEST_CASE("TcpTransport: Listen binds an ephemeral port", "[network][transport][tcp]") {
    TestIoContext io;
    auto t = MakeTransport(io.get());
    Inbox<Received> inbox;

    CHECK(t->listening_port() == 0);
    REQUIRE(t->Listen(0, Recorder(inbox)));
    CHECK(t->listening_port() != 0);
    CHECK(t->advertised_port() == t->listening_port());
    CHECK(t->kind() == TransportKind::TCP);

    SECTION("Second Listen is refused") {
        CHECK_FALSE(t->Listen(0, Recorder(inbox)));
    }

    SECTION("Port already in use") {
        auto other = MakeTransport(io.get());
        Inbox<Received> other_inbox;
        CHECK_FALSE(other->Listen(t->listening_port(), Recorder(other_inbox)));
        other->Stop();
    }

    t->Stop();
}

TEST_CASE("TcpTransport: request and reply over loopback", "[network][transport][tcp]") {
    TestIoContext io;
    auto server = MakeTransport(io.get());
    auto client = MakeTransport(io.get());
    Inbox<Received> server_inbox;
    Inbox<Received> client_inbox;
    REQUIRE(server->Listen(0, Recorder(server_inbox)));
    REQUIRE(client->Listen(0, Recorder(client_inbox)));

    client->Send(Loopback(server->listening_port()), MakeRequest("PING", json("x"), client->advertised_port(), 7));

    REQUIRE(server_inbox.WaitForCount(1));
    auto request = server_inbox.Items().front();
    CHECK(request.pkg.message.Deserialize().payload == json("x"));
    // The ephemeral source port is remapped to the advertised listening port
    CHECK(request.sender == Loopback(client->listening_port()));
    CHECK(server->peers().EphemeralFor(request.sender).has_value());

    REQUIRE(client_inbox.WaitForCount(1));
    auto reply = client_inbox.Items().front();
    CHECK(reply.pkg.metadata.stage == PackageStage::RESPONSE);
    CHECK(reply.pkg.metadata.session_id == SessionId{7});
    CHECK(reply.pkg.message.Deserialize().payload == json("PONG"));
    CHECK(reply.sender == Loopback(server->listening_port()));

    // The reply travelled back over the inbound connection
    CHECK(server->outbound_count() == 0);
    CHECK(client->outbound_count() == 1);

    client->Stop();
    server->Stop();
}

TEST_CASE("TcpTransport: advertised port override", "[network][transport][tcp]") {
    TestIoContext io;
    TcpTransport::Config config;
    config.advertised_port = 4242;
    auto server = MakeTransport(io.get(), config);
    auto client = MakeTransport(io.get());
    Inbox<Received> server_inbox;
    Inbox<Received> client_inbox;
    REQUIRE(server->Listen(0, Recorder(server_inbox)));
    REQUIRE(client->Listen(0, Recorder(client_inbox)));
    CHECK(server->advertised_port() == 4242);

    client->Send(Loopback(server->listening_port()), MakeRequest("PING", std::nullopt, client->advertised_port(), 1));

    REQUIRE(client_inbox.WaitForCount(1));
    CHECK(client_inbox.Items().front().sender == Loopback(4242));

    client->Stop();
    server->Stop();
}

TEST_CASE("TcpTransport: uncorrelated packages are not answered", "[network][transport][tcp]") {
    TestIoContext io;
    auto server = MakeTransport(io.get());
    auto client = MakeTransport(io.get());
    Inbox<Received> server_inbox;
    Inbox<Received> client_inbox;

    // Answers everything, but only correlated packages can carry a reply
    REQUIRE(server->Listen(0, [&server_inbox](const Package& pkg, const Address& sender) -> std::optional<Message> {
        server_inbox.Push(Received{pkg, sender});
        return Message("T", "ACK", json(true));
    }));
    REQUIRE(client->Listen(0, Recorder(client_inbox)));

    client->Send(Loopback(server->listening_port()), MakeRequest("NOTE", json(1), client->advertised_port()));

    REQUIRE(server_inbox.WaitForCount(1));
    CHECK(server_inbox.Items().front().pkg.metadata.stage == PackageStage::INACTIVE);
    CHECK_FALSE(client_inbox.WaitForCount(1, std::chrono::milliseconds(200)));

    client->Stop();
    server->Stop();
}

TEST_CASE("TcpTransport: connections are reused", "[network][transport][tcp]") {
    TestIoContext io;
    auto server = MakeTransport(io.get());
    auto client = MakeTransport(io.get());
    Inbox<Received> server_inbox;
    Inbox<Received> client_inbox;
    REQUIRE(server->Listen(0, Recorder(server_inbox)));
    REQUIRE(client->Listen(0, Recorder(client_inbox)));

    const Address dest = Loopback(server->listening_port());
    for (int i = 0; i < 5; ++i) {
        client->Send(dest, MakeRequest("NOTE", json(i), client->advertised_port()));
    }

    REQUIRE(server_inbox.WaitForCount(5));
    CHECK(client->outbound_count() == 1);
    CHECK(server->inbound_count() == 1);
    CHECK(TcpTransportTestAccess::Outbound(*client, dest) != nullptr);
    auto ephemeral = server->peers().EphemeralFor(Loopback(client->listening_port()));
    REQUIRE(ephemeral);
    CHECK(TcpTransportTestAccess::Inbound(*server, *ephemeral) != nullptr);

    // Frames on one connection arrive in order
    auto items = server_inbox.Items();
    for (int i = 0; i < 5; ++i) {
        CHECK(items[i].pkg.message.Deserialize().payload == json(i));
    }

    SECTION("Server reaches the client through the inbound connection") {
        server->Send(Loopback(client->listening_port()), MakeRequest("NOTE", json("back"), server->advertised_port()));
        REQUIRE(client_inbox.WaitForCount(1));
        CHECK(server->outbound_count() == 0);
    }

    client->Stop();
    server->Stop();
}

TEST_CASE("TcpTransport: bad frames close only their connection", "[network][transport][tcp]") {
    TestIoContext io;
    auto server = MakeTransport(io.get());
    Inbox<Received> server_inbox;
    REQUIRE(server->Listen(0, Recorder(server_inbox)));

    asio::io_context raw_io;
    asio::ip::tcp::socket raw(raw_io);
    raw.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server->listening_port()));
    REQUIRE(WaitFor([&]() { return server->inbound_count() == 1; }));

    SECTION("Length above the limit") {
        std::vector<uint8_t> header{0xFF, 0xFF, 0xFF, 0xFF};
        asio::write(raw, asio::buffer(header));
    }

    SECTION("Zero length") {
        std::vector<uint8_t> header{0, 0, 0, 0};
        asio::write(raw, asio::buffer(header));
    }

    SECTION("Body that is not a package") {
        std::vector<uint8_t> body(64, 0x5A);
        asio::write(raw, asio::buffer(EncodeFrame(body)));
    }

    CHECK(WaitFor([&]() { return server->inbound_count() == 0; }));
    CHECK(server_inbox.Count() == 0);

    // The listener keeps accepting well-behaved peers
    auto client = MakeTransport(io.get());
    Inbox<Received> client_inbox;
    REQUIRE(client->Listen(0, Recorder(client_inbox)));
    client->Send(Loopback(server->listening_port()), MakeRequest("PING", json(1), client->advertised_port(), 3));
    CHECK(client_inbox.WaitForCount(1));

    asio::error_code ec;
    raw.close(ec);
    client->Stop();
    server->Stop();
}

TEST_CASE("TcpTransport: frames survive arbitrary fragmentation", "[network][transport][tcp]") {
    TestIoContext io;
    auto server = MakeTransport(io.get());
    Inbox<Received> server_inbox;
    REQUIRE(server->Listen(0, Recorder(server_inbox)));

    asio::io_context raw_io;
    asio::ip::tcp::socket raw(raw_io);
    raw.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server->listening_port()));

    auto frame = [](int n) {
        return EncodeFrame(
            EncodePackage(MakeRequest("NOTE", json(n), 7000), meshwire::protocol::DEFAULT_TCP_MAX_PACKAGE_SIZE));
    };

    SECTION("One byte at a time") {
        for (uint8_t b : frame(1)) {
            asio::write(raw, asio::buffer(&b, 1));
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
        REQUIRE(server_inbox.WaitForCount(1));
    }

    SECTION("Split inside the header") {
        auto bytes = frame(1);
        asio::write(raw, asio::buffer(bytes.data(), 2));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        asio::write(raw, asio::buffer(bytes.data() + 2, bytes.size() - 2));
        REQUIRE(server_inbox.WaitForCount(1));
    }

    SECTION("Several frames in one write") {
        std::vector<uint8_t> bytes;
        for (int i = 1; i <= 3; ++i) {
            auto f = frame(i);
            bytes.insert(bytes.end(), f.begin(), f.end());
        }
        asio::write(raw, asio::buffer(bytes));
        REQUIRE(server_inbox.WaitForCount(3));
        CHECK(server_inbox.Items()[2].pkg.message.Deserialize().payload == json(3));
    }

    CHECK(server_inbox.Items().front().pkg.message.Deserialize().payload == json(1));
    CHECK(server_inbox.Items().front().sender == Loopback(7000));
    CHECK(server->inbound_count() == 1);

    asio::error_code ec;
    raw.close(ec);
    server->Stop();
}

TEST_CASE("TcpTransport: size limit is enforced before writing", "[network][transport][tcp]") {
    TestIoContext io;
    TcpTransport::Config config;
    config.max_package_size = 256;
    auto t = MakeTransport(io.get(), config);

    auto big = MakeRequest("BLOB", json(RandomText(4096)), 1000);
    CHECK_THROWS_AS(t->Send(Loopback(1), big), PackageTooLargeError);
    CHECK(t->outbound_count() == 0);

    CHECK_NOTHROW(t->Send(Loopback(1), MakeRequest("SMALL", json(1), 1000)));
    t->Stop();
}

TEST_CASE("TcpTransport: receiver drops frames above its own limit", "[network][transport][tcp]") {
    TestIoContext io;
    TcpTransport::Config small;
    small.max_package_size = 256;
    auto server = MakeTransport(io.get(), small);
    auto client = MakeTransport(io.get());
    Inbox<Received> server_inbox;
    Inbox<Received> client_inbox;
    REQUIRE(server->Listen(0, Recorder(server_inbox)));
    REQUIRE(client->Listen(0, Recorder(client_inbox)));

    const Address dest = Loopback(server->listening_port());
    client->Send(dest, MakeRequest("BLOB", json(RandomText(2048)), client->advertised_port()));
    CHECK_FALSE(server_inbox.WaitForCount(1, std::chrono::milliseconds(300)));

    // The sender redials after the connection is dropped
    REQUIRE(WaitFor([&]() { return client->outbound_count() == 0; }));
    client->Send(dest, MakeRequest("NOTE", json(1), client->advertised_port()));
    CHECK(server_inbox.WaitForCount(1));

    client->Stop();
    server->Stop();
}

TEST_CASE("TcpTransport: unreachable peer", "[network][transport][tcp]") {
    TestIoContext io;
    auto scratch = MakeTransport(io.get());
    Inbox<Received> inbox;
    REQUIRE(scratch->Listen(0, Recorder(inbox)));
    const uint16_t closed_port = scratch->listening_port();
    scratch->Stop();

    TcpTransport::Config config;
    config.connect_timeout = std::chrono::milliseconds(500);
    auto t = MakeTransport(io.get(), config);

    CHECK_NOTHROW(t->Send(Loopback(closed_port), MakeRequest("NOTE", json(1), 1000)));
    CHECK(WaitFor([&]() { return t->outbound_count() == 0; }));
    t->Stop();
}

TEST_CASE("TcpTransport: Stop is idempotent", "[network][transport][tcp]") {
    TestIoContext io;
    auto server = MakeTransport(io.get());
    auto client = MakeTransport(io.get());
    Inbox<Received> server_inbox;
    Inbox<Received> client_inbox;
    REQUIRE(server->Listen(0, Recorder(server_inbox)));
    REQUIRE(client->Listen(0, Recorder(client_inbox)));

    client->Send(Loopback(server->listening_port()), MakeRequest("NOTE", json(1), client->advertised_port()));
    REQUIRE(server_inbox.WaitForCount(1));

    client->Stop();
    CHECK_NOTHROW(client->Stop());
    CHECK(client->outbound_count() == 0);
    CHECK(WaitFor([&]() { return server->inbound_count() == 0; }));

    // Sends after Stop are dropped silently
    CHECK_NOTHROW(client->Send(Loopback(server->listening_port()), MakeRequest("NOTE", json(2), 0)));
    CHECK_FALSE(server_inbox.WaitForCount(2, std::chrono::milliseconds(200)));

    server->Stop();
}

TEST_CASE("TcpTransport: closed inbound connections forget their nym", "[network][transport][tcp]") {
    TestIoContext io;
    auto server = MakeTransport(io.get());
    Inbox<Received> server_inbox;
    REQUIRE(server->Listen(0, Recorder(server_inbox)));

    // Each round reconnects from a fresh source port under the same advertised port
    for (int round = 0; round < 5; ++round) {
        auto client = MakeTransport(io.get());
        client->Send(Loopback(server->listening_port()), MakeRequest("NOTE", json(round), 7100));
        REQUIRE(server_inbox.WaitForCount(static_cast<size_t>(round) + 1));
        CHECK(server->peers().Lookup(Loopback(7100)).has_value());

        client->Stop();
        REQUIRE(WaitFor([&]() { return server->inbound_count() == 0; }));
        CHECK(server->peers().size() == 0);
    }

    server->Stop();
}

TEST_CASE("TcpTransport: Stop races with incoming connections", "[network][transport][tcp]") {
    TestIoContext io;

    for (int round = 0; round < 20; ++round) {
        auto server = MakeTransport(io.get());
        Inbox<Received> inbox;
        REQUIRE(server->Listen(0, Recorder(inbox)));
        const uint16_t port = server->listening_port();

        std::atomic<bool> done{false};
        std::thread dialer([&]() {
            asio::io_context raw_io;
            while (!done) {
                asio::ip::tcp::socket raw(raw_io);
                asio::error_code ec;
                raw.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
                raw.close(ec);
            }
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(round % 5));
        server->Stop();
        CHECK(server->listening_port() == 0);
        CHECK_FALSE(server->Listen(0, Recorder(inbox)));

        done = true;
        dialer.join();
        CHECK(WaitFor([&]() { return server->inbound_count() == 0; }));
    }
}
