// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// UdpTransport and KadcastNode over real loopback sockets

#include <catch2/catch_test_macros.hpp>

#include "network/kadcast_node.hpp"
#include "network/message.hpp"
#include "routing/node_id.hpp"
#include "transport/chunk_codec.hpp"
#include "transport/udp_transport.hpp"

#include <asio/executor_work_guard.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace kadcast;
using namespace kadcast::transport;
using namespace std::chrono_literals;

namespace {

// io_context + thread for tests
class TestIoContext {
public:
    TestIoContext()
        : io_context_(std::make_shared<asio::io_context>()),
          work_guard_(asio::make_work_guard(*io_context_)),
          thread_([this]() { io_context_->run(); }) {}

    ~TestIoContext() {
        work_guard_.reset();
        io_context_->stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    asio::io_context& get() { return *io_context_; }
    std::shared_ptr<asio::io_context> shared() { return io_context_; }

private:
    std::shared_ptr<asio::io_context> io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread thread_;
};

Endpoint Loopback(uint16_t port = 0) {
    return Endpoint(asio::ip::make_address("127.0.0.1"), port);
}

// Collects received datagrams and lets the test wait for them.
struct Inbox {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::pair<Endpoint, std::vector<uint8_t>>> datagrams;

    ReceiveCallback callback() {
        return [this](const Endpoint& from, const uint8_t* data, size_t size) {
            std::lock_guard<std::mutex> lock(mutex);
            datagrams.emplace_back(from, std::vector<uint8_t>(data, data + size));
            cv.notify_all();
        };
    }

    bool wait_for(size_t count, std::chrono::milliseconds timeout = 5s) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&]() { return datagrams.size() >= count; });
    }
};

template <typename Predicate>
bool WaitUntil(Predicate predicate, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

message::Header HeaderFor(const Endpoint& ep) {
    return message::Header{routing::MakeBinaryId(ep), ep.port()};
}

DatagramPtr Frame(std::vector<uint8_t> bytes) {
    return std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
}

}  // namespace

TEST_CASE("UdpTransport: lifecycle", "[transport][udp]") {
    TestIoContext io;
    auto t = std::make_shared<UdpTransport>(io.get(), Loopback());

    REQUIRE_FALSE(t->is_running());
    REQUIRE(t->start());
    REQUIRE(t->is_running());
    REQUIRE(t->local_endpoint().port() != 0);

    // A second start is refused.
    REQUIRE_FALSE(t->start());

    t->stop();
    t->stop();
    REQUIRE_FALSE(t->is_running());

    auto data = std::make_shared<const std::vector<uint8_t>>(std::vector<uint8_t>{1, 2, 3});
    REQUIRE_FALSE(t->send_to(Loopback(9), data));
}

TEST_CASE("UdpTransport: datagrams arrive with their source", "[transport][udp]") {
    TestIoContext io;
    auto a = std::make_shared<UdpTransport>(io.get(), Loopback());
    auto b = std::make_shared<UdpTransport>(io.get(), Loopback());
    Inbox inbox;
    b->set_receive_callback(inbox.callback());
    REQUIRE(a->start());
    REQUIRE(b->start());

    SECTION("Single datagram") {
        const std::vector<uint8_t> payload = {0xCA, 0xFE, 0x00, 0x01};
        REQUIRE(a->send_to(b->local_endpoint(), std::make_shared<const std::vector<uint8_t>>(payload)));
        REQUIRE(inbox.wait_for(1));
        std::lock_guard<std::mutex> lock(inbox.mutex);
        REQUIRE(inbox.datagrams[0].second == payload);
        REQUIRE(inbox.datagrams[0].first == a->local_endpoint());
    }

    SECTION("One buffer queued to many destinations") {
        auto c = std::make_shared<UdpTransport>(io.get(), Loopback());
        Inbox inbox_c;
        c->set_receive_callback(inbox_c.callback());
        REQUIRE(c->start());

        auto frame = std::make_shared<const std::vector<uint8_t>>(std::vector<uint8_t>(1300, 0x11));
        for (int i = 0; i < 20; ++i) {
            REQUIRE(a->send_to(b->local_endpoint(), frame));
            REQUIRE(a->send_to(c->local_endpoint(), frame));
        }
        REQUIRE(inbox.wait_for(20));
        REQUIRE(inbox_c.wait_for(20));
        REQUIRE(a->datagrams_sent() == 40);
        c->stop();
    }

    a->stop();
    b->stop();
}

TEST_CASE("KadcastNode: io_threads == 0 needs an external io_context", "[node][udp]") {
    network::NodeConfig config;
    config.public_address = Loopback(42350);
    config.io_threads = 0;
    REQUIRE_THROWS_AS(network::KadcastNode(config), std::invalid_argument);
}

TEST_CASE("KadcastNode: broadcast over loopback", "[node][udp]") {
    TestIoContext io;

    network::NodeConfig seed_config;
    seed_config.public_address = Loopback(42361);
    seed_config.io_threads = 2;
    network::KadcastNode seed(seed_config);

    // Driven by the test's io_context.
    network::NodeConfig joiner_config;
    joiner_config.public_address = Loopback(42362);
    joiner_config.io_threads = 0;
    joiner_config.bootstrap_nodes = {seed_config.public_address};
    network::KadcastNode joiner(joiner_config, nullptr, io.shared());

    REQUIRE(seed.start());
    REQUIRE(joiner.start());

    REQUIRE(WaitUntil([&]() {
        return seed.routing_table().has_peer(joiner.identity().id) && joiner.routing_table().has_peer(seed.identity().id);
    }));

    std::vector<uint8_t> payload(20000);
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i * 7);
    }

    REQUIRE(seed.broadcast(payload) == network::BroadcastResult::Success);
    auto received = joiner.incoming_broadcasts().next(5s);
    REQUIRE(received.has_value());
    REQUIRE(received->payload == payload);
    REQUIRE(received->source == seed_config.public_address);

    REQUIRE(joiner.broadcast(std::vector<uint8_t>{1, 2, 3}) == network::BroadcastResult::Success);
    auto back = seed.incoming_broadcasts().next(5s);
    REQUIRE(back.has_value());
    REQUIRE(back->payload == std::vector<uint8_t>{1, 2, 3});

    joiner.stop();
    seed.stop();
    REQUIRE_FALSE(seed.is_running());

    SECTION("Restart after stop") {
        REQUIRE(seed.start());
        REQUIRE(seed.is_running());
        seed.stop();
    }
}

TEST_CASE("KadcastNode: sweeps run on an external io_context", "[node][udp]") {
    TestIoContext io;

    network::NodeConfig config;
    config.public_address = Loopback(42371);
    config.io_threads = 0;
    config.sweep_interval = 50ms;
    config.codec.reassembly_timeout = 200ms;
    network::KadcastNode node(config, nullptr, io.shared());
    REQUIRE(node.start());

    auto sender = std::make_shared<UdpTransport>(io.get(), Loopback());
    REQUIRE(sender->start());

    // First chunk of a four-symbol message; the rest never comes.
    transport::ChunkEncoder encoder(config.codec);
    transport::MessageId id{};
    id.fill(0x5A);
    auto chunks = encoder.encode(id, std::vector<uint8_t>(encoder.symbol_size() * 4, 0x33));
    REQUIRE(chunks.has_value());
    message::BroadcastMessage broadcast;
    broadcast.chunk = chunks->front();
    REQUIRE(sender->send_to(config.public_address,
                            Frame(message::Encode(message::Envelope{HeaderFor(sender->local_endpoint()), broadcast}))));

    REQUIRE(WaitUntil([&]() { return node.stats().datagrams_received == 1; }));
    REQUIRE(WaitUntil([&]() { return node.stats().decode_timeouts == 1; }));
    REQUIRE(node.report()["pending_reassemblies"].get<size_t>() == 0);

    node.stop();
    sender->stop();
}

TEST_CASE("KadcastNode: destroyed while datagrams are arriving", "[node][udp]") {
    auto io_context = std::make_shared<asio::io_context>();
    auto work_guard = asio::make_work_guard(*io_context);
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([io_context]() { io_context->run(); });
    }

    auto sender = std::make_shared<UdpTransport>(*io_context, Loopback());
    REQUIRE(sender->start());
    const auto ping =
        Frame(message::Encode(message::Envelope{HeaderFor(sender->local_endpoint()), message::PingMessage{}}));

    for (uint16_t round = 0; round < 5; ++round) {
        network::NodeConfig config;
        config.public_address = Loopback(static_cast<uint16_t>(42380 + round));
        config.io_threads = 0;
        config.sweep_interval = 1ms;
        auto node = std::make_unique<network::KadcastNode>(config, nullptr, io_context);
        REQUIRE(node->start());

        std::atomic<bool> flooding{true};
        std::thread flood([&]() {
            while (flooding && sender->send_to(config.public_address, ping)) {
                std::this_thread::sleep_for(50us);
            }
        });

        REQUIRE(WaitUntil([&]() { return node->stats().datagrams_received >= 20; }));
        node.reset();

        flooding = false;
        flood.join();
    }

    sender->stop();
    work_guard.reset();
    io_context->stop();
    for (auto& thread : threads) {
        thread.join();
    }
}
