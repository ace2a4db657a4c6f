// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include <asio/ip/udp.hpp>

namespace kadcast {
namespace transport {

using Endpoint = asio::ip::udp::endpoint;

// Datagrams are immutable once handed to the transport, so one encoded frame
// can be queued for many destinations without copying.
using DatagramPtr = std::shared_ptr<const std::vector<uint8_t>>;

using ReceiveCallback = std::function<void(const Endpoint& from, const uint8_t* data, size_t size)>;
using SendErrorCallback = std::function<void(const Endpoint& to)>;

/**
 * DatagramTransport - abstract unreliable datagram transport
 *
 * UdpTransport is the production implementation; tests plug in an in-memory
 * network. Implementations may invoke the receive callback from any thread,
 * concurrently.
 */
class DatagramTransport {
public:
  virtual ~DatagramTransport() = default;

  // Bind and start receiving. Returns false if the endpoint cannot be bound.
  virtual bool start() = 0;

  // Close the socket. Pending sends are abandoned. Idempotent.
  virtual void stop() = 0;

  virtual bool is_running() const = 0;

  // Queue a datagram. Returns false if the transport is not running.
  // Delivery failures surface through the send error callback.
  virtual bool send_to(const Endpoint& to, DatagramPtr data) = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_send_error_callback(SendErrorCallback callback) = 0;

  virtual Endpoint local_endpoint() const = 0;
};

}  // namespace transport
}  // namespace kadcast
