// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/kadcast_node.hpp"

#include "transport/udp_transport.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <stdexcept>
#include <variant>

namespace kadcast {
namespace network {

namespace {

const NodeConfig& Validated(const NodeConfig& config) {
  config.Validate();
  return config;
}

std::shared_ptr<transport::DatagramTransport> MakeTransport(std::shared_ptr<transport::DatagramTransport> injected,
                                                            asio::io_context& io_context, const NodeConfig& config) {
  if (injected) {
    return injected;
  }
  return std::make_shared<transport::UdpTransport>(io_context, config.effective_listen_address(), config.transport);
}

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

KadcastNode::KadcastNode(const NodeConfig& config, std::shared_ptr<transport::DatagramTransport> transport,
                         std::shared_ptr<asio::io_context> external_io_context)
    : config_(Validated(config)),
      identity_(routing::MakeBinaryId(config_.public_address)),
      local_header_{identity_, config_.public_address.port()},
      io_context_(external_io_context ? external_io_context : std::make_shared<asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      transport_(MakeTransport(std::move(transport), *io_context_, config_)),
      routing_table_(identity_, config_.bucket),
      seen_cache_(config_.diffusion.seen_cache_ttl, config_.diffusion.max_seen_entries),
      encoder_(config_.codec),
      decoder_(config_.codec) {
  if (!external_io_context_ && config_.io_threads == 0 &&
      std::dynamic_pointer_cast<transport::UdpTransport>(transport_)) {
    // Nobody would ever run the socket's io_context.
    throw std::invalid_argument("KadcastNode: io_threads == 0 requires an external io_context");
  }

  diffusion_ = std::make_unique<DiffusionEngine>(local_header_, routing_table_, seen_cache_, encoder_, *transport_,
                                                 config_.diffusion);
  discovery_ = std::make_unique<DiscoveryManager>(local_header_, routing_table_, *transport_, config_.discovery,
                                                  config_.bucket);

  diffusion_->set_delivery_callback([this](ReceivedBroadcast received) { deliver(std::move(received)); });
  transport_->set_receive_callback(
      [this, gate = callback_gate_](const asio::ip::udp::endpoint& from, const uint8_t* data, size_t size) {
        util::CallbackGate::Pass pass(*gate);
        if (pass) {
          on_datagram(from, data, size);
        }
      });
  transport_->set_send_error_callback([this, gate = callback_gate_](const asio::ip::udp::endpoint& to) {
    util::CallbackGate::Pass pass(*gate);
    if (pass) {
      on_send_failure(to);
    }
  });

  LOG_NET_INFO("kadcast node {} for {} (external_io_context: {})", routing::ToHex(identity_.id),
               util::FormatEndpoint(config_.public_address), external_io_context_ ? "yes" : "no");
}

KadcastNode::~KadcastNode() {
  stop();
  // Handlers still queued on an external io_context must not reach us, and
  // those already running must finish first.
  callback_gate_->close();
  transport_->set_receive_callback(nullptr);
  transport_->set_send_error_callback(nullptr);
  diffusion_->set_delivery_callback(nullptr);
  incoming_.close();
}

bool KadcastNode::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  if (!transport_->start()) {
    LOG_NET_ERROR("failed to start transport on {}", util::FormatEndpoint(config_.effective_listen_address()));
    return false;
  }
  running_.store(true, std::memory_order_release);

  // An owned io_context without threads is never run; tests drive it through
  // the *_for_test hooks instead.
  if (external_io_context_ || config_.io_threads > 0) {
    {
      std::lock_guard<std::mutex> timer_lock(timer_mutex_);
      if (!sweep_timer_) {
        sweep_timer_ = std::make_unique<asio::steady_timer>(*io_context_);
      }
      if (!maintenance_timer_) {
        maintenance_timer_ = std::make_unique<asio::steady_timer>(*io_context_);
      }
    }
    schedule_next_sweep();
    schedule_next_maintenance();
  }

  if (config_.io_threads > 0 && !external_io_context_) {
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        asio::make_work_guard(*io_context_));
    for (size_t i = 0; i < config_.io_threads; ++i) {
      io_threads_.emplace_back([this]() { io_context_->run(); });
    }
  }

  LOG_NET_INFO("kadcast node {} listening on {}", routing::ToHex(identity_.id),
               util::FormatEndpoint(transport_->local_endpoint()));

  if (!config_.bootstrap_nodes.empty()) {
    discovery_->Bootstrap(config_.bootstrap_nodes);
  }
  return true;
}

void KadcastNode::stop() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  // New datagrams and timer callbacks see this and bail out.
  running_.store(false, std::memory_order_release);

  {
    std::lock_guard<std::mutex> timer_lock(timer_mutex_);
    if (sweep_timer_) {
      sweep_timer_->cancel();
    }
    if (maintenance_timer_) {
      maintenance_timer_->cancel();
    }
  }

  transport_->stop();

  if (!external_io_context_) {
    io_context_->stop();
    if (work_guard_) {
      work_guard_.reset();
    }
    for (auto& thread : io_threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    io_threads_.clear();

    // Run what stop() left queued (the socket close among it) so a later
    // start() finds the transport in a clean state.
    io_context_->restart();
    io_context_->poll();
    io_context_->restart();

    std::lock_guard<std::mutex> timer_lock(timer_mutex_);
    sweep_timer_.reset();
    maintenance_timer_.reset();
  }

  LOG_NET_INFO("kadcast node {} stopped", routing::ToHex(identity_.id));
}

BroadcastResult KadcastNode::broadcast(std::span<const uint8_t> payload) {
  if (!running_.load(std::memory_order_acquire)) {
    return BroadcastResult::NotRunning;
  }
  if (!diffusion_->Originate(payload)) {
    return BroadcastResult::PayloadTooLarge;
  }
  return BroadcastResult::Success;
}

BroadcastResult KadcastNode::propagate(const ReceivedBroadcast& received) {
  if (!running_.load(std::memory_order_acquire)) {
    return BroadcastResult::NotRunning;
  }
  if (!diffusion_->Propagate(received)) {
    return BroadcastResult::PayloadTooLarge;
  }
  return BroadcastResult::Success;
}

void KadcastNode::bootstrap(const std::vector<asio::ip::udp::endpoint>& seeds) {
  discovery_->Bootstrap(seeds);
}

void KadcastNode::set_listener(Listener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listener_ = std::move(listener);
}

void KadcastNode::deliver(ReceivedBroadcast received) {
  Listener listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(received);
  }
  incoming_.push(std::move(received));
}

void KadcastNode::on_datagram(const asio::ip::udp::endpoint& from, const uint8_t* data, size_t size) {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  datagrams_received_.fetch_add(1, std::memory_order_relaxed);

  auto envelope = message::Decode(data, size);
  if (!envelope) {
    malformed_packets_.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_DEBUG_RL("malformed datagram ({} bytes) from {}", size, util::FormatEndpoint(from));
    return;
  }

  const auto& header = envelope->header;
  if (header.sender.id == identity_.id) {
    return;
  }

  // The id must be the one derived from the address the datagram came from.
  if (routing::ComputeNodeId(from.address(), header.sender_port) != header.sender.id) {
    spoofed_headers_.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_WARN_RL("header id {} does not match source {} (port {})", routing::ToHex(header.sender.id),
                    util::FormatEndpoint(from), header.sender_port);
    return;
  }

  const asio::ip::udp::endpoint advertised(from.address(), header.sender_port);
  if (!discovery_->OnMessage(header, advertised)) {
    spoofed_headers_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  std::visit(Overloaded{
                 [&](const message::PingMessage&) { discovery_->HandlePing(advertised); },
                 [](const message::PongMessage&) {},
                 [&](const message::FindNodesMessage& m) { discovery_->HandleFindNodes(header, m, advertised); },
                 [&](const message::NodesMessage& m) { discovery_->HandleNodes(m); },
                 [&](const message::BroadcastMessage& m) {
                   auto result = decoder_.on_chunk(m.chunk, m.height);
                   switch (result.status) {
                     case transport::ChunkStatus::MALFORMED:
                       malformed_packets_.fetch_add(1, std::memory_order_relaxed);
                       LOG_NET_DEBUG_RL("inconsistent chunk from {}", util::FormatEndpoint(advertised));
                       break;
                     case transport::ChunkStatus::COMPLETED:
                       if (result.message) {
                         diffusion_->HandleDecoded(std::move(*result.message), advertised);
                       }
                       break;
                     case transport::ChunkStatus::ACCEPTED:
                     case transport::ChunkStatus::IGNORED:
                       break;
                   }
                 },
             },
             envelope->payload);
}

void KadcastNode::on_send_failure(const asio::ip::udp::endpoint& to) {
  transport_send_failures_.fetch_add(1, std::memory_order_relaxed);
  discovery_->OnSendFailure(to);
}

size_t KadcastNode::run_sweep(TimePoint now) {
  const size_t seen_expired = seen_cache_.sweep(now);
  const size_t timed_out = decoder_.sweep(now);
  if (timed_out > 0) {
    decode_timeouts_.fetch_add(timed_out, std::memory_order_relaxed);
    LOG_NET_DEBUG("gave up on {} incomplete broadcasts", timed_out);
  }
  LOG_NET_TRACE("sweep: {} seen entries expired, {} reassemblies pending", seen_expired, decoder_.pending_messages());
  return timed_out;
}

void KadcastNode::schedule_next_sweep() {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (!running_.load(std::memory_order_acquire) || !sweep_timer_) {
    return;
  }

  sweep_timer_->expires_after(config_.sweep_interval);
  sweep_timer_->async_wait([this, gate = callback_gate_](const asio::error_code& ec) {
    util::CallbackGate::Pass pass(*gate);
    if (pass && !ec && running_.load(std::memory_order_acquire)) {
      run_sweep(util::GetSteadyTime());
      schedule_next_sweep();
    }
  });
}

void KadcastNode::schedule_next_maintenance() {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (!running_.load(std::memory_order_acquire) || !maintenance_timer_) {
    return;
  }

  maintenance_timer_->expires_after(config_.discovery.ping_interval);
  maintenance_timer_->async_wait([this, gate = callback_gate_](const asio::error_code& ec) {
    util::CallbackGate::Pass pass(*gate);
    if (pass && !ec && running_.load(std::memory_order_acquire)) {
      discovery_->RunMaintenance(util::GetSteadyTime());
      schedule_next_maintenance();
    }
  });
}

void KadcastNode::run_maintenance_for_test(TimePoint now) {
  discovery_->RunMaintenance(now);
}

size_t KadcastNode::sweep_for_test(TimePoint now) {
  return run_sweep(now);
}

KadcastNode::Stats KadcastNode::stats() const {
  const auto diffusion = diffusion_->GetStats();
  const auto discovery = discovery_->GetStats();

  Stats stats;
  stats.datagrams_received = datagrams_received_.load(std::memory_order_relaxed);
  stats.malformed_packets = malformed_packets_.load(std::memory_order_relaxed);
  stats.spoofed_headers = spoofed_headers_.load(std::memory_order_relaxed);
  stats.decode_timeouts = decode_timeouts_.load(std::memory_order_relaxed);
  stats.duplicates = diffusion.duplicates;
  stats.broadcasts_originated = diffusion.originated;
  stats.broadcasts_delivered = diffusion.delivered;
  stats.frames_sent = diffusion.frames_sent;
  stats.send_failures = diffusion.send_failures + transport_send_failures_.load(std::memory_order_relaxed);
  stats.pings_sent = discovery.pings_sent;
  stats.probes_timed_out = discovery.probes_timed_out;
  return stats;
}

nlohmann::json KadcastNode::report() const {
  const auto s = stats();
  return {
      {"id", routing::ToHex(identity_.id)},
      {"public_address", util::FormatEndpoint(config_.public_address)},
      {"running", is_running()},
      {"pending_reassemblies", decoder_.pending_messages()},
      {"seen_messages", seen_cache_.size()},
      {"routing_table", routing_table_.report()},
      {"stats",
       {
           {"datagrams_received", s.datagrams_received},
           {"malformed_packets", s.malformed_packets},
           {"spoofed_headers", s.spoofed_headers},
           {"decode_timeouts", s.decode_timeouts},
           {"duplicates", s.duplicates},
           {"broadcasts_originated", s.broadcasts_originated},
           {"broadcasts_delivered", s.broadcasts_delivered},
           {"frames_sent", s.frames_sent},
           {"send_failures", s.send_failures},
           {"pings_sent", s.pings_sent},
           {"probes_timed_out", s.probes_timed_out},
       }},
  };
}

}  // namespace network
}  // namespace kadcast
