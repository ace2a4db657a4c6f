// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/broadcast_stream.hpp"
#include "network/config.hpp"
#include "network/diffusion_engine.hpp"
#include "network/discovery_manager.hpp"
#include "network/seen_cache.hpp"
#include "routing/routing_table.hpp"
#include "transport/chunk_codec.hpp"
#include "transport/transport.hpp"
#include "util/callback_gate.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>

namespace kadcast {
namespace network {

enum class BroadcastResult {
  Success,
  NotRunning,
  PayloadTooLarge,
};

/**
 * KadcastNode - one participant of the broadcast overlay
 *
 * Wires the routing table, chunk codec, diffusion engine and discovery
 * manager to a datagram transport, and runs the periodic sweeps:
 *   - sweep timer (sweep_interval): SeenCache expiry and reassembly timeouts
 *   - maintenance timer (discovery.ping_interval): probes, bucket refresh,
 *     removal of silent peers
 *
 * The io_context is either owned (io_threads worker threads are spawned by
 * start()) or supplied by the caller, who then runs it. Timers are armed on
 * whichever io_context is in use. Inbound datagrams are handled on whichever
 * io thread the transport delivers them, concurrently.
 *
 * Delivered broadcasts go to incoming_broadcasts() and, when set, to the
 * listener. The stream is closed when the node is destroyed. The destructor
 * waits for io callbacks already running, so it must not be called from the
 * listener.
 */
class KadcastNode {
public:
  using Listener = std::function<void(const ReceivedBroadcast&)>;
  using TimePoint = std::chrono::steady_clock::time_point;

  struct Stats {
    uint64_t datagrams_received{0};
    uint64_t malformed_packets{0};
    uint64_t spoofed_headers{0};
    uint64_t decode_timeouts{0};
    uint64_t duplicates{0};
    uint64_t broadcasts_originated{0};
    uint64_t broadcasts_delivered{0};
    uint64_t frames_sent{0};
    uint64_t send_failures{0};
    uint64_t pings_sent{0};
    uint64_t probes_timed_out{0};
  };

  // Throws std::invalid_argument if the configuration is inconsistent.
  // transport == nullptr creates a UdpTransport on the listen address.
  explicit KadcastNode(const NodeConfig& config, std::shared_ptr<transport::DatagramTransport> transport = nullptr,
                       std::shared_ptr<asio::io_context> external_io_context = nullptr);
  ~KadcastNode();

  KadcastNode(const KadcastNode&) = delete;
  KadcastNode& operator=(const KadcastNode&) = delete;

  // Returns false if already running or the transport cannot bind.
  bool start();

  /**
   * Stop the node: timers cancelled, transport closed, io threads joined.
   * Idempotent; may block until in-flight handlers finish.
   */
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  BroadcastResult broadcast(std::span<const uint8_t> payload);

  // Forward a received broadcast (for auto_propagate == false).
  BroadcastResult propagate(const ReceivedBroadcast& received);

  // Ask seed nodes for peers. Also done by start() with config.bootstrap_nodes.
  void bootstrap(const std::vector<asio::ip::udp::endpoint>& seeds);

  BroadcastStream& incoming_broadcasts() { return incoming_; }

  // Called synchronously on the io thread that completed the message.
  void set_listener(Listener listener);

  const routing::BinaryId& identity() const { return identity_; }
  const NodeConfig& config() const { return config_; }
  asio::ip::udp::endpoint local_endpoint() const { return transport_->local_endpoint(); }

  routing::RoutingTable& routing_table() { return routing_table_; }
  const routing::RoutingTable& routing_table() const { return routing_table_; }

  nlohmann::json report() const;
  Stats stats() const;

  // Test-only: run periodic work that timers would otherwise trigger.
  // These methods are intentionally public but should only be used in tests.
  void run_maintenance_for_test(TimePoint now = util::GetSteadyTime());
  size_t sweep_for_test(TimePoint now = util::GetSteadyTime());

private:
  void on_datagram(const asio::ip::udp::endpoint& from, const uint8_t* data, size_t size);
  void on_send_failure(const asio::ip::udp::endpoint& to);
  void deliver(ReceivedBroadcast received);

  size_t run_sweep(TimePoint now);
  void schedule_next_sweep();
  void schedule_next_maintenance();

  NodeConfig config_;
  routing::BinaryId identity_;
  message::Header local_header_;

  std::atomic<bool> running_{false};
  mutable std::mutex start_stop_mutex_;

  std::shared_ptr<asio::io_context> io_context_;
  bool external_io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;
  std::mutex timer_mutex_;  // guards the timers against concurrent rearm and cancel
  std::unique_ptr<asio::steady_timer> sweep_timer_;
  std::unique_ptr<asio::steady_timer> maintenance_timer_;
  std::shared_ptr<util::CallbackGate> callback_gate_{std::make_shared<util::CallbackGate>()};

  std::shared_ptr<transport::DatagramTransport> transport_;

  routing::RoutingTable routing_table_;
  SeenCache seen_cache_;
  transport::ChunkEncoder encoder_;
  transport::ChunkDecoder decoder_;
  std::unique_ptr<DiffusionEngine> diffusion_;
  std::unique_ptr<DiscoveryManager> discovery_;

  BroadcastStream incoming_;
  mutable std::mutex listener_mutex_;
  Listener listener_;

  std::atomic<uint64_t> datagrams_received_{0};
  std::atomic<uint64_t> malformed_packets_{0};
  std::atomic<uint64_t> spoofed_headers_{0};
  std::atomic<uint64_t> decode_timeouts_{0};
  std::atomic<uint64_t> transport_send_failures_{0};
};

}  // namespace network
}  // namespace kadcast
