#pragma once

#include "crypto/identity.hpp"
#include "network/host.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rdvp {
namespace network {

// In-memory stream for service unit tests
class MockStream : public Stream {
public:
    MockStream(std::string protocol, uint64_t id)
        : protocol_(std::move(protocol)), id_(id) {}

    const std::string& protocol() const override { return protocol_; }
    std::string remote_address() const override { return "/ip4/127.0.0.1/tcp/50000"; }
    uint64_t id() const override { return id_; }

    bool Send(const std::vector<uint8_t>& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return false;
        sent_.push_back(message);
        return true;
    }

    void Close() override {
        CloseCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) return;
            open_ = false;
            cb = std::move(close_callback_);
            message_callback_ = {};
        }
        if (cb) cb();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    void SetMessageCallback(MessageCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        message_callback_ = std::move(callback);
    }
    void SetCloseCallback(CloseCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        close_callback_ = std::move(callback);
    }

    // Deliver a message as if it came from the remote
    void SimulateReceive(const std::string& text) {
        MessageCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cb = message_callback_;
        }
        if (cb) cb(std::vector<uint8_t>(text.begin(), text.end()));
    }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& m : sent_) out.emplace_back(m.begin(), m.end());
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::string protocol_;
    uint64_t id_;
    bool open_{true};
    MessageCallback message_callback_;
    CloseCallback close_callback_;
    std::vector<std::vector<uint8_t>> sent_;
};

// Host that records its lifecycle and hands out MockStreams
class MockHost : public Host {
public:
    MockHost()
        : id_(crypto::PeerId::FromPublicKey(crypto::GenerateKey(crypto::KeyType::Ed25519).GetPublic())) {}

    explicit MockHost(const crypto::PrivateKey& key, std::vector<Multiaddr> addrs = {})
        : id_(crypto::PeerId::FromPublicKey(key.GetPublic())), addrs_(std::move(addrs)) {}

    const crypto::PeerId& id() const override { return id_; }
    std::vector<Multiaddr> listen_addrs() const override { return addrs_; }
    std::vector<Multiaddr> addrs() const override { return addrs_; }

    void SetStreamHandler(const std::string& protocol, StreamHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[protocol] = std::move(handler);
    }

    void RemoveStreamHandler(const std::string& protocol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(protocol);
    }

    void Close() override { ++close_count_; }

    bool HasHandler(const std::string& protocol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.count(protocol) > 0;
    }

    int close_count() const { return close_count_; }

    // Open an inbound stream; nullptr if no handler accepts the protocol
    std::shared_ptr<MockStream> OpenStream(const std::string& protocol) {
        StreamHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(protocol);
            if (it == handlers_.end()) return nullptr;
            handler = it->second;
        }
        auto stream = std::make_shared<MockStream>(protocol, ++next_stream_id_);
        handler(stream);
        return stream;
    }

private:
    crypto::PeerId id_;
    std::vector<Multiaddr> addrs_;
    mutable std::mutex mutex_;
    std::map<std::string, StreamHandler> handlers_;
    std::atomic<int> close_count_{0};
    std::atomic<uint64_t> next_stream_id_{0};
};

} // namespace network
} // namespace rdvp
