// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/asio_host.hpp"
#include "network/relay_service.hpp"
#include "util/error.hpp"
#include <future>

namespace rdvp {
namespace network {

namespace {

std::string EndpointToMultiaddr(const boost::asio::ip::tcp::endpoint &ep) {
  auto address = ep.address();
  if (address.is_v6() && address.to_v6().is_v4_mapped()) {
    address = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped,
                                               address.to_v6());
  }
  return std::string(address.is_v4() ? "/ip4/" : "/ip6/") + address.to_string() +
         "/tcp/" + std::to_string(ep.port());
}

} // anonymous namespace

// ============================================================================
// AsioStream
// ============================================================================

std::atomic<uint64_t> AsioStream::next_id_{1};

std::shared_ptr<AsioStream>
AsioStream::Accept(boost::asio::io_context &io_context,
                   boost::asio::ip::tcp::socket socket, HandlerLookup lookup,
                   ClosedHook on_closed, std::shared_ptr<spdlog::logger> logger) {
  auto stream = std::shared_ptr<AsioStream>(new AsioStream(
      io_context, std::move(lookup), std::move(on_closed), std::move(logger)));
  stream->socket_ = std::move(socket);
  stream->open_ = true;

  boost::system::error_code ec;
  auto remote_ep = stream->socket_.remote_endpoint(ec);
  stream->remote_addr_ = ec ? "unknown" : EndpointToMultiaddr(remote_ep);
  return stream;
}

AsioStream::AsioStream(boost::asio::io_context &io_context,
                       HandlerLookup lookup, ClosedHook on_closed,
                       std::shared_ptr<spdlog::logger> logger)
    : io_context_(io_context), socket_(io_context),
      strand_(io_context.get_executor()),
      negotiation_timer_(std::make_unique<boost::asio::steady_timer>(io_context)),
      logger_(std::move(logger)), id_(next_id_++), lookup_(std::move(lookup)),
      on_closed_(std::move(on_closed)) {}

// Cleanup happens in close_impl() while the object is still shared; do not
// log here, the logger may already be gone during shutdown
AsioStream::~AsioStream() = default;

void AsioStream::Start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_) {
      return;
    }

    self->negotiation_timer_->expires_after(
        std::chrono::seconds(protocol::NEGOTIATION_TIMEOUT_SEC));
    self->negotiation_timer_->async_wait(boost::asio::bind_executor(
        self->strand_, [self](const boost::system::error_code &ec) {
          if (ec || !self->open_ || self->phase_ == Phase::Open) {
            return;
          }
          self->logger_->debug("stream {} from {}: negotiation timed out",
                               self->id_, self->remote_addr_);
          self->close_impl();
        }));

    self->enqueue_impl(protocol::EncodeNegotiationLine(protocol::MULTISTREAM_ID));
    self->start_read_impl();
  });
}

void AsioStream::start_read_impl() {
  if (!open_) {
    return;
  }

  auto buf = std::make_shared<std::vector<uint8_t>>(RECV_BUFFER_SIZE);
  socket_.async_read_some(
      boost::asio::buffer(*buf),
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this(),
                    buf](const boost::system::error_code &ec, size_t bytes) {
            if (!open_) {
              return;
            }
            if (ec) {
              if (ec != boost::asio::error::eof &&
                  ec != boost::asio::error::operation_aborted) {
                logger_->trace("read error on stream {} from {}: {}", id_,
                               remote_addr_, ec.message());
              }
              close_impl();
              return;
            }

            reader_.Feed(buf->data(), bytes);
            while (open_) {
              auto frame = reader_.Next();
              if (!frame) {
                break;
              }
              handle_frame_impl(std::move(*frame));
            }

            if (reader_.failed()) {
              logger_->debug("stream {} from {}: oversized or malformed frame",
                             id_, remote_addr_);
              close_impl();
              return;
            }

            start_read_impl();
          }));
}

void AsioStream::handle_frame_impl(std::vector<uint8_t> frame) {
  if (phase_ != Phase::Open) {
    if (frame.empty() || frame.back() != '\n') {
      logger_->debug("stream {} from {}: negotiation line without newline",
                     id_, remote_addr_);
      close_impl();
      return;
    }
    negotiate_impl(std::string(frame.begin(), frame.end() - 1));
    return;
  }

  MessageCallback callback = message_callback_;
  if (!callback) {
    logger_->trace("stream {} ({}): dropping message, no receiver", id_, protocol_);
    return;
  }
  try {
    callback(frame);
  } catch (const std::exception &e) {
    logger_->error("exception in message callback on stream {} ({}): {}", id_,
                   protocol_, e.what());
  }
}

void AsioStream::negotiate_impl(const std::string &line) {
  if (phase_ == Phase::AwaitHeader) {
    if (line != protocol::MULTISTREAM_ID) {
      logger_->debug("stream {} from {}: unexpected multistream header '{}'",
                     id_, remote_addr_, line);
      close_impl();
      return;
    }
    phase_ = Phase::AwaitProtocol;
    return;
  }

  StreamHandler handler = lookup_ ? lookup_(line) : StreamHandler{};
  if (!handler) {
    logger_->trace("stream {} from {}: protocol '{}' not available", id_,
                   remote_addr_, line);
    enqueue_impl(protocol::EncodeNegotiationLine(protocol::NOT_AVAILABLE));
    return;
  }

  protocol_ = line;
  phase_ = Phase::Open;
  reader_.set_max_payload(protocol::MAX_MESSAGE_SIZE);
  if (negotiation_timer_) {
    negotiation_timer_->cancel();
  }
  enqueue_impl(protocol::EncodeNegotiationLine(line));
  logger_->debug("stream {} from {} opened for {}", id_, remote_addr_, protocol_);

  try {
    handler(shared_from_this());
  } catch (const std::exception &e) {
    logger_->error("stream handler for {} failed: {}", protocol_, e.what());
    close_impl();
  }
}

bool AsioStream::Send(const std::vector<uint8_t> &message) {
  if (!open_) {
    return false;
  }
  if (message.size() > protocol::MAX_MESSAGE_SIZE) {
    logger_->warn("refusing to send {} byte message on stream {}",
                  message.size(), id_);
    return false;
  }
  // Frame before dispatching: the caller may release message immediately
  auto frame = protocol::EncodeFrame(message);
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  frame = std::move(frame)]() mutable {
    if (!open_ || close_after_flush_) {
      return;
    }
    enqueue_impl(std::move(frame));
  });
  return true;
}

void AsioStream::enqueue_impl(std::vector<uint8_t> bytes) {
  if (!open_) {
    return;
  }
  if (send_queue_bytes_ + bytes.size() > protocol::DEFAULT_SEND_QUEUE_SIZE) {
    logger_->warn("send queue overflow on stream {} ({} bytes queued), "
                  "disconnecting slow reader {}",
                  id_, send_queue_bytes_, remote_addr_);
    close_impl();
    return;
  }
  send_queue_bytes_ += bytes.size();
  send_queue_.push(std::make_shared<std::vector<uint8_t>>(std::move(bytes)));
  if (!writing_) {
    writing_ = true;
    do_write_impl();
  }
}

void AsioStream::do_write_impl() {
  if (!open_) {
    return;
  }
  if (send_queue_.empty()) {
    writing_ = false;
    if (close_after_flush_) {
      close_impl();
    }
    return;
  }

  auto data = send_queue_.front();
  boost::asio::async_write(
      socket_, boost::asio::buffer(*data),
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this(),
                    data](const boost::system::error_code &ec, size_t) {
            if (!open_) {
              return;
            }
            if (ec) {
              logger_->trace("write error on stream {} to {}: {}", id_,
                             remote_addr_, ec.message());
              close_impl();
              return;
            }
            send_queue_bytes_ -= data->size();
            send_queue_.pop();
            do_write_impl();
          }));
}

void AsioStream::Close() {
  boost::asio::dispatch(strand_, [this, self = shared_from_this()]() {
    if (!open_) {
      return;
    }
    if (writing_) {
      close_after_flush_ = true;
      return;
    }
    close_impl();
  });
}

void AsioStream::Abort() {
  boost::asio::dispatch(strand_,
                        [self = shared_from_this()]() { self->close_impl(); });
}

void AsioStream::close_impl() {
  if (!open_.exchange(false)) {
    return;
  }

  // Cancel outstanding I/O: pending handlers complete with operation_aborted
  // and release their reference to this stream
  {
    boost::asio::ip::tcp::socket socket_to_close(std::move(socket_));
    boost::system::error_code ignored;
    socket_to_close.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket_to_close.close(ignored);
  }

  // Destroy the timer now, while the io_context is known to be alive
  {
    auto timer = std::move(negotiation_timer_);
    if (timer) {
      timer->cancel();
    }
  }

  std::queue<std::shared_ptr<std::vector<uint8_t>>> empty;
  std::swap(send_queue_, empty);
  send_queue_bytes_ = 0;
  writing_ = false;
  message_callback_ = {};

  logger_->trace("stream {} from {} closed", id_, remote_addr_);

  // Callbacks run on the io_context, not the strand, so they may close or
  // send on other streams freely
  CloseCallback close_cb = std::move(close_callback_);
  ClosedHook hook = std::move(on_closed_);
  uint64_t id = id_;
  auto logger = logger_;
  boost::asio::post(io_context_, [close_cb = std::move(close_cb),
                                  hook = std::move(hook), id, logger]() {
    if (close_cb) {
      try {
        close_cb();
      } catch (const std::exception &e) {
        logger->error("exception in close callback of stream {}: {}", id, e.what());
      }
    }
    if (hook) {
      hook(id);
    }
  });
}

void AsioStream::SetMessageCallback(MessageCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    if (open_) {
      message_callback_ = std::move(cb);
    }
  });
}

void AsioStream::SetCloseCallback(CloseCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    if (open_) {
      close_callback_ = std::move(cb);
      return;
    }
    // Already closed: report it the same way close_impl() would
    if (cb) {
      boost::asio::post(io_context_, std::move(cb));
    }
  });
}

// ============================================================================
// AsioHost
// ============================================================================

std::shared_ptr<AsioHost> AsioHost::Create(const crypto::PrivateKey &key,
                                           const HostOptions &options,
                                           std::shared_ptr<spdlog::logger> logger) {
  auto host = std::shared_ptr<AsioHost>(new AsioHost(key, options, std::move(logger)));
  try {
    host->Start();
  } catch (...) {
    host->Close();
    util::RethrowWrapped(util::ErrorCode::HostError, "starting host");
  }
  return host;
}

AsioHost::AsioHost(const crypto::PrivateKey &key, const HostOptions &options,
                   std::shared_ptr<spdlog::logger> logger)
    : key_(key), id_(crypto::PeerId::FromPublicKey(key.GetPublic())),
      options_(options), logger_(std::move(logger)),
      io_context_(std::make_unique<boost::asio::io_context>()) {}

AsioHost::~AsioHost() { Close(); }

void AsioHost::Start() {
  for (const auto &addr : options_.listen_addrs) {
    Listen(addr);
  }
  if (acceptors_.empty()) {
    throw util::Error(util::ErrorCode::HostError,
                      "no usable listen address (" +
                          std::to_string(options_.listen_addrs.size()) +
                          " configured)");
  }

  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));
  io_thread_ = std::thread([this]() { io_context_->run(); });

  for (auto &acceptor : acceptors_) {
    boost::asio::post(*io_context_, [this, a = acceptor.get()]() { StartAccept(*a); });
  }

  if (options_.enable_nat_service) {
    // Discovery blocks for the UPnP timeout; keep it off the startup path
    uint16_t port = 0;
    for (const auto &addr : bound_addrs_) {
      if (auto tcp = addr.ValueForProtocol(Protocol::TCP)) {
        port = static_cast<uint16_t>(std::stoi(*tcp));
        break;
      }
    }
    nat_ = std::make_unique<NATManager>(logger_);
    nat_thread_ = std::thread([nat = nat_.get(), port]() { nat->Start(port); });
  }

  if (options_.enable_relay_hop) {
    relay_ = std::make_unique<RelayService>(*this, logger_);
  }
}

bool AsioHost::Listen(const Multiaddr &addr) {
  using tcp = boost::asio::ip::tcp;

  const auto &components = addr.components();
  bool is_tcp = components.size() == 2 &&
                (components[0].protocol == Protocol::IP4 ||
                 components[0].protocol == Protocol::IP6) &&
                components[1].protocol == Protocol::TCP;
  if (!is_tcp) {
    logger_->warn("no transport for listen address {}, skipping", addr.ToString());
    return false;
  }

  try {
    auto ip = boost::asio::ip::make_address(components[0].value);
    auto port = static_cast<uint16_t>(std::stoi(components[1].value));
    tcp::endpoint endpoint(ip, port);

    auto acceptor = std::make_unique<tcp::acceptor>(*io_context_);
    acceptor->open(endpoint.protocol());
    acceptor->set_option(tcp::acceptor::reuse_address(true));
    if (ip.is_v6()) {
      acceptor->set_option(boost::asio::ip::v6_only(true));
    }
    acceptor->bind(endpoint);
    acceptor->listen(boost::asio::socket_base::max_listen_connections);

    auto bound = Multiaddr::Parse(EndpointToMultiaddr(acceptor->local_endpoint()));
    if (!bound) {
      throw util::Error(util::ErrorCode::Internal, "cannot render bound address");
    }
    logger_->info("listening on {}", bound->ToString());
    bound_addrs_.push_back(*bound);
    accept_retry_timers_[acceptor.get()] =
        std::make_unique<boost::asio::steady_timer>(*io_context_);
    acceptors_.push_back(std::move(acceptor));
    return true;
  } catch (const std::exception &e) {
    logger_->error("failed to listen on {}: {}", addr.ToString(), e.what());
    return false;
  }
}

void AsioHost::StartAccept(boost::asio::ip::tcp::acceptor &acceptor) {
  if (!acceptor.is_open()) {
    return;
  }
  acceptor.async_accept([this, &acceptor](const boost::system::error_code &ec,
                                          boost::asio::ip::tcp::socket socket) {
    HandleAccept(acceptor, ec, std::move(socket));
  });
}

void AsioHost::HandleAccept(boost::asio::ip::tcp::acceptor &acceptor,
                            const boost::system::error_code &ec,
                            boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec == boost::asio::error::operation_aborted || closed_) {
      return;
    }
    // The pending connection stays queued, so accepting again at once
    // fails again at once (EMFILE, ENFILE, ENOBUFS)
    logger_->warn("accept error: {}, retrying in {}ms", ec.message(),
                  ACCEPT_RETRY_DELAY.count());
    ++accept_retries_;
    auto &timer = *accept_retry_timers_.at(&acceptor);
    timer.expires_after(ACCEPT_RETRY_DELAY);
    timer.async_wait([this, &acceptor](const boost::system::error_code &timer_ec) {
      if (timer_ec || closed_) {
        return;
      }
      StartAccept(acceptor);
    });
    return;
  }
  if (closed_) {
    return;
  }

  boost::system::error_code opt_ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
  socket.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

  auto stream = AsioStream::Accept(
      *io_context_, std::move(socket),
      [this](const std::string &protocol) { return LookupHandler(protocol); },
      [this](uint64_t id) {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_.erase(id);
      },
      logger_);
  logger_->debug("connection from {} accepted (stream {})",
                 stream->remote_address(), stream->id());

  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_[stream->id()] = stream;
  }
  stream->Start();

  StartAccept(acceptor);
}

StreamHandler AsioHost::LookupHandler(const std::string &protocol) const {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  auto it = handlers_.find(protocol);
  return it == handlers_.end() ? StreamHandler{} : it->second;
}

std::vector<Multiaddr> AsioHost::listen_addrs() const { return bound_addrs_; }

std::vector<Multiaddr> AsioHost::addrs() const {
  std::vector<Multiaddr> out = bound_addrs_;
  if (nat_) {
    if (auto external = nat_->GetExternalAddress()) {
      out.push_back(*external);
    }
  }
  return out;
}

void AsioHost::SetStreamHandler(const std::string &protocol,
                                StreamHandler handler) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_[protocol] = std::move(handler);
}

void AsioHost::RemoveStreamHandler(const std::string &protocol) {
  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_.erase(protocol);
}

size_t AsioHost::stream_count() const {
  std::lock_guard<std::mutex> lock(streams_mutex_);
  return streams_.size();
}

void AsioHost::Close() {
  if (closed_.exchange(true)) {
    return;
  }

  if (relay_) {
    relay_->Close();
  }

  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.clear();
  }

  // Acceptors and streams belong to the IO thread; shut them down there
  if (io_thread_.joinable()) {
    std::promise<void> done;
    auto done_future = done.get_future();
    boost::asio::post(*io_context_, [this, &done]() {
      for (auto &acceptor : acceptors_) {
        boost::system::error_code ignored;
        acceptor->close(ignored);
      }
      for (auto &[acceptor, timer] : accept_retry_timers_) {
        timer->cancel();
      }
      std::vector<std::shared_ptr<AsioStream>> live;
      {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (auto &[id, weak] : streams_) {
          if (auto stream = weak.lock()) {
            live.push_back(stream);
          }
        }
      }
      for (auto &stream : live) {
        stream->Abort();
      }
      done.set_value();
    });
    done_future.wait();

    // Without the guard run() returns once the aborted streams have
    // delivered their close callbacks
    work_guard_.reset();
    io_thread_.join();
  }
  accept_retry_timers_.clear();
  acceptors_.clear();

  if (nat_thread_.joinable()) {
    nat_thread_.join();
  }
  if (nat_) {
    nat_->Stop();
  }

  logger_->debug("host {} closed", id_.ToString());
}

} // namespace network
} // namespace rdvp
