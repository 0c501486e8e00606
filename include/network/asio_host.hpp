// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/host.hpp"
#include "network/nat_manager.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace rdvp {
namespace network {

class RelayService;

/**
 * AsioStream - inbound TCP connection running multistream-select
 *
 * Negotiates a protocol, then hands itself to the registered StreamHandler
 * and carries uvarint-framed messages. All socket work and callback state
 * is serialized on a strand.
 */
class AsioStream : public Stream,
                   public std::enable_shared_from_this<AsioStream> {
public:
  // Returns the handler for a protocol id, or an empty function
  using HandlerLookup = std::function<StreamHandler(const std::string &protocol)>;
  // Host bookkeeping hook, runs once when the stream closes
  using ClosedHook = std::function<void(uint64_t id)>;

  static std::shared_ptr<AsioStream>
  Accept(boost::asio::io_context &io_context, boost::asio::ip::tcp::socket socket,
         HandlerLookup lookup, ClosedHook on_closed,
         std::shared_ptr<spdlog::logger> logger);

  ~AsioStream() override;

  AsioStream(const AsioStream &) = delete;
  AsioStream &operator=(const AsioStream &) = delete;

  // Send the multistream header and start reading
  void Start();

  // Close immediately, dropping queued output
  void Abort();

  // Stream interface
  const std::string &protocol() const override { return protocol_; }
  std::string remote_address() const override { return remote_addr_; }
  uint64_t id() const override { return id_; }
  bool Send(const std::vector<uint8_t> &message) override;
  // Flushes queued output before closing
  void Close() override;
  bool is_open() const override { return open_; }
  void SetMessageCallback(MessageCallback callback) override;
  void SetCloseCallback(CloseCallback callback) override;

private:
  enum class Phase {
    AwaitHeader,
    AwaitProtocol,
    Open,
  };

  AsioStream(boost::asio::io_context &io_context, HandlerLookup lookup,
             ClosedHook on_closed, std::shared_ptr<spdlog::logger> logger);

  // Strand-serialized internals (must be called on strand_)
  void start_read_impl();
  void handle_frame_impl(std::vector<uint8_t> frame);
  void negotiate_impl(const std::string &line);
  void enqueue_impl(std::vector<uint8_t> bytes);
  void do_write_impl();
  void close_impl();

  boost::asio::io_context &io_context_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  std::unique_ptr<boost::asio::steady_timer> negotiation_timer_;
  std::shared_ptr<spdlog::logger> logger_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  HandlerLookup lookup_;
  ClosedHook on_closed_;

  // Accessed only on strand_
  Phase phase_{Phase::AwaitHeader};
  protocol::FrameReader reader_{protocol::MAX_NEGOTIATION_LINE + 1};
  MessageCallback message_callback_;
  CloseCallback close_callback_;
  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  size_t send_queue_bytes_{0};
  bool writing_{false};
  bool close_after_flush_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 64 * 1024;

  // Set once on acceptance, read-only afterwards
  std::string protocol_;
  std::string remote_addr_;

  std::atomic<bool> open_{false};
};

/**
 * AsioHost - boost::asio implementation of Host
 *
 * One IO thread runs every acceptor and stream. Listens on each ip4/ip6 TCP
 * listen address; other transports are skipped with a warning. Optional
 * services: NAT port mapping (NATManager) and relay hop (RelayService).
 */
class AsioHost : public Host {
public:
  /**
   * Bind, start the IO thread and optional services
   * Throws util::Error(HostError) if no listen address could be bound
   */
  static std::shared_ptr<AsioHost>
  Create(const crypto::PrivateKey &key, const HostOptions &options,
         std::shared_ptr<spdlog::logger> logger =
             util::LogManager::GetLogger("network"));

  ~AsioHost() override;

  AsioHost(const AsioHost &) = delete;
  AsioHost &operator=(const AsioHost &) = delete;

  // Host interface
  const crypto::PeerId &id() const override { return id_; }
  std::vector<Multiaddr> listen_addrs() const override;
  std::vector<Multiaddr> addrs() const override;
  void SetStreamHandler(const std::string &protocol,
                        StreamHandler handler) override;
  void RemoveStreamHandler(const std::string &protocol) override;
  // Must not be called from a stream callback (joins the IO thread)
  void Close() override;

  // Diagnostic: number of live streams
  size_t stream_count() const;

  // Diagnostic: accepts re-armed after a failure (fd exhaustion and the like)
  size_t accept_retry_count() const { return accept_retries_; }

  // Pause before accepting again after a failed accept
  static constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

private:
  AsioHost(const crypto::PrivateKey &key, const HostOptions &options,
           std::shared_ptr<spdlog::logger> logger);

  void Start();
  bool Listen(const Multiaddr &addr);
  void StartAccept(boost::asio::ip::tcp::acceptor &acceptor);
  void HandleAccept(boost::asio::ip::tcp::acceptor &acceptor,
                    const boost::system::error_code &ec,
                    boost::asio::ip::tcp::socket socket);
  StreamHandler LookupHandler(const std::string &protocol) const;

  crypto::PrivateKey key_;
  crypto::PeerId id_;
  HostOptions options_;
  std::shared_ptr<spdlog::logger> logger_;

  // io_context_ outlives every acceptor, stream and timer bound to it
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread io_thread_;

  std::vector<std::unique_ptr<boost::asio::ip::tcp::acceptor>> acceptors_;
  std::map<const boost::asio::ip::tcp::acceptor *,
           std::unique_ptr<boost::asio::steady_timer>>
      accept_retry_timers_;
  std::atomic<size_t> accept_retries_{0};
  std::vector<Multiaddr> bound_addrs_;

  mutable std::mutex handlers_mutex_;
  std::map<std::string, StreamHandler> handlers_;

  mutable std::mutex streams_mutex_;
  std::map<uint64_t, std::weak_ptr<AsioStream>> streams_;

  std::unique_ptr<NATManager> nat_;
  std::thread nat_thread_;
  std::unique_ptr<RelayService> relay_;

  std::atomic<bool> closed_{false};
};

} // namespace network
} // namespace rdvp
