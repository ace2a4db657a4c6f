// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include "transport/transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

#include <asio.hpp>
#include <asio/any_io_executor.hpp>
#include <asio/strand.hpp>

namespace kadcast {
namespace transport {

struct TransportConfig {
  unsigned send_retry_count = protocol::DEFAULT_SEND_RETRY_COUNT;
  std::chrono::milliseconds send_retry_interval = protocol::DEFAULT_SEND_RETRY_INTERVAL;
  // SO_RCVBUF; unset keeps the OS default
  std::optional<size_t> recv_buffer_size;
  std::optional<size_t> send_buffer_size;
};

/**
 * UdpTransport - asio implementation of DatagramTransport
 *
 * One socket bound to the listen endpoint. Every socket operation runs on
 * strand_. Received datagrams are copied out of the read buffer and handed
 * to the callback through asio::post on the io_context, so decoding and
 * diffusion of different datagrams proceed in parallel on the io threads
 * while the strand goes straight back to reading.
 *
 * Uses an external io_context; the caller runs it.
 */
class UdpTransport : public DatagramTransport, public std::enable_shared_from_this<UdpTransport> {
public:
  UdpTransport(asio::io_context& io_context, const Endpoint& listen_endpoint, const TransportConfig& config = {});
  ~UdpTransport() override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  bool start() override;
  void stop() override;
  bool is_running() const override { return running_.load(std::memory_order_acquire); }

  bool send_to(const Endpoint& to, DatagramPtr data) override;

  void set_receive_callback(ReceiveCallback callback) override;
  void set_send_error_callback(SendErrorCallback callback) override;

  // Bound endpoint (actual port when listening on port 0)
  Endpoint local_endpoint() const override;

  uint64_t datagrams_sent() const { return datagrams_sent_.load(std::memory_order_relaxed); }
  uint64_t datagrams_received() const { return datagrams_received_.load(std::memory_order_relaxed); }

private:
  // Strand-serialized internals (must be called on strand_)
  void start_receive_impl();
  void send_impl(const Endpoint& to, DatagramPtr data, unsigned attempt);
  void close_impl();

  void report_send_failure(const Endpoint& to);

  asio::io_context& io_context_;
  asio::ip::udp::socket socket_;
  asio::strand<asio::any_io_executor> strand_;
  Endpoint listen_endpoint_;
  Endpoint bound_endpoint_;
  TransportConfig config_;

  std::atomic<bool> running_{false};

  mutable std::mutex callback_mutex_;
  ReceiveCallback receive_callback_;
  SendErrorCallback send_error_callback_;

  // Read buffer and sender slot (accessed only on strand_)
  std::vector<uint8_t> recv_buffer_;
  Endpoint recv_from_;

  std::atomic<uint64_t> datagrams_sent_{0};
  std::atomic<uint64_t> datagrams_received_{0};
};

}  // namespace transport
}  // namespace kadcast
