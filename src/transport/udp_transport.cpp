// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "transport/udp_transport.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"

namespace kadcast {
namespace transport {

UdpTransport::UdpTransport(asio::io_context& io_context, const Endpoint& listen_endpoint,
                           const TransportConfig& config)
    : io_context_(io_context),
      socket_(io_context),
      strand_(asio::make_strand(io_context.get_executor())),
      listen_endpoint_(listen_endpoint),
      bound_endpoint_(listen_endpoint),
      config_(config),
      recv_buffer_(protocol::MAX_DATAGRAM_SIZE) {}

UdpTransport::~UdpTransport() {
  running_.store(false, std::memory_order_release);
  // By now the io threads are gone; closing here is single-threaded.
  asio::error_code ec;
  socket_.close(ec);
}

bool UdpTransport::start() {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  asio::error_code ec;
  socket_.open(listen_endpoint_.protocol(), ec);
  if (!ec) {
    socket_.set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec && config_.recv_buffer_size) {
    socket_.set_option(asio::socket_base::receive_buffer_size(static_cast<int>(*config_.recv_buffer_size)), ec);
  }
  if (!ec && config_.send_buffer_size) {
    socket_.set_option(asio::socket_base::send_buffer_size(static_cast<int>(*config_.send_buffer_size)), ec);
  }
  if (!ec) {
    socket_.bind(listen_endpoint_, ec);
  }
  if (ec) {
    LOG_TRANSPORT_ERROR("failed to bind udp socket on {}: {}", util::FormatEndpoint(listen_endpoint_), ec.message());
    asio::error_code ignored;
    socket_.close(ignored);
    return false;
  }

  bound_endpoint_ = socket_.local_endpoint(ec);
  if (ec) {
    bound_endpoint_ = listen_endpoint_;
  }
  running_.store(true, std::memory_order_release);
  LOG_TRANSPORT_INFO("listening on udp {}", util::FormatEndpoint(bound_endpoint_));

  asio::post(strand_, [self = shared_from_this()]() { self->start_receive_impl(); });
  return true;
}

void UdpTransport::stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  asio::post(strand_, [self = shared_from_this()]() { self->close_impl(); });
}

void UdpTransport::close_impl() {
  asio::error_code ec;
  socket_.cancel(ec);
  socket_.close(ec);
  LOG_TRANSPORT_DEBUG("udp socket on {} closed", util::FormatEndpoint(bound_endpoint_));
}

void UdpTransport::set_receive_callback(ReceiveCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  receive_callback_ = std::move(callback);
}

void UdpTransport::set_send_error_callback(SendErrorCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  send_error_callback_ = std::move(callback);
}

Endpoint UdpTransport::local_endpoint() const {
  return bound_endpoint_;
}

void UdpTransport::start_receive_impl() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  auto handler = [self = shared_from_this()](const asio::error_code& ec, size_t bytes) {
    if (ec == asio::error::operation_aborted || !self->running_.load(std::memory_order_acquire)) {
      return;
    }
    if (ec) {
      // ICMP errors from earlier sends show up here on some platforms.
      LOG_TRANSPORT_TRACE("udp receive error: {}", ec.message());
      self->start_receive_impl();
      return;
    }

    self->datagrams_received_.fetch_add(1, std::memory_order_relaxed);
    auto datagram = std::make_shared<std::vector<uint8_t>>(self->recv_buffer_.begin(),
                                                           self->recv_buffer_.begin() + static_cast<std::ptrdiff_t>(bytes));
    const Endpoint from = self->recv_from_;

    asio::post(self->io_context_, [self, from, datagram]() {
      ReceiveCallback callback;
      {
        std::lock_guard<std::mutex> lock(self->callback_mutex_);
        callback = self->receive_callback_;
      }
      if (!callback) {
        return;
      }
      try {
        callback(from, datagram->data(), datagram->size());
      } catch (const std::exception& e) {
        LOG_TRANSPORT_WARN_RL("exception handling datagram from {}: {}", util::FormatEndpoint(from), e.what());
      }
    });

    self->start_receive_impl();
  };

  socket_.async_receive_from(asio::buffer(recv_buffer_), recv_from_, asio::bind_executor(strand_, handler));
}

bool UdpTransport::send_to(const Endpoint& to, DatagramPtr data) {
  if (!running_.load(std::memory_order_acquire) || !data) {
    return false;
  }
  asio::post(strand_, [self = shared_from_this(), to, data = std::move(data)]() mutable {
    self->send_impl(to, std::move(data), 0);
  });
  return true;
}

void UdpTransport::send_impl(const Endpoint& to, DatagramPtr data, unsigned attempt) {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  auto handler = [self = shared_from_this(), to, data, attempt](const asio::error_code& ec, size_t) {
    if (ec == asio::error::operation_aborted || !self->running_.load(std::memory_order_acquire)) {
      return;
    }
    if (!ec) {
      self->datagrams_sent_.fetch_add(1, std::memory_order_relaxed);
      return;
    }

    if (attempt < self->config_.send_retry_count) {
      LOG_TRANSPORT_TRACE("send to {} failed ({}), retry {}/{}", util::FormatEndpoint(to), ec.message(), attempt + 1,
                          self->config_.send_retry_count);
      auto timer = std::make_shared<asio::steady_timer>(self->io_context_, self->config_.send_retry_interval);
      timer->async_wait(asio::bind_executor(self->strand_, [self, timer, to, data, attempt](const asio::error_code& wait_ec) {
        if (!wait_ec) {
          self->send_impl(to, data, attempt + 1);
        }
      }));
      return;
    }

    LOG_TRANSPORT_DEBUG_RL("giving up on send to {} after {} attempts: {}", util::FormatEndpoint(to), attempt + 1,
                           ec.message());
    self->report_send_failure(to);
  };

  socket_.async_send_to(asio::buffer(*data), to, asio::bind_executor(strand_, handler));
}

void UdpTransport::report_send_failure(const Endpoint& to) {
  SendErrorCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = send_error_callback_;
  }
  if (callback) {
    callback(to);
  }
}

}  // namespace transport
}  // namespace kadcast
