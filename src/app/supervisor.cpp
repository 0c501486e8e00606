// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/supervisor.hpp"
#include "util/error.hpp"
#include <boost/asio/post.hpp>
#include <thread>

namespace rdvp {
namespace app {

using util::Error;
using util::ErrorCode;

// ============================================================================
// CancellationScope
// ============================================================================

bool CancellationScope::Cancel(std::exception_ptr cause) {
  std::vector<Callback> callbacks;
  std::exception_ptr recorded;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      return false;
    }
    cancelled_ = true;
    cause_ = cause ? cause : util::MakeCanceledError();
    recorded = cause_;
    callbacks.swap(callbacks_);
  }
  cv_.notify_all();

  for (auto &callback : callbacks) {
    callback(recorded);
  }
  return true;
}

bool CancellationScope::IsCancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

std::exception_ptr CancellationScope::Cause() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cause_;
}

void CancellationScope::Subscribe(Callback callback) {
  std::exception_ptr cause;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_) {
      callbacks_.push_back(std::move(callback));
      return;
    }
    cause = cause_;
  }
  callback(cause);
}

void CancellationScope::Wait() const {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return cancelled_; });
}

bool CancellationScope::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
}

// ============================================================================
// Supervisor
// ============================================================================

Supervisor::Supervisor(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

void Supervisor::Add(const std::string &name, Execute execute,
                     Interrupt interrupt) {
  if (started_) {
    throw Error(ErrorCode::Internal, "cannot add task '" + name + "' to a running supervisor");
  }
  tasks_.push_back({name, std::move(execute), std::move(interrupt)});
}

std::exception_ptr Supervisor::Run() {
  if (started_) {
    throw Error(ErrorCode::Internal, "supervisor can only run once");
  }
  started_ = true;

  if (tasks_.empty()) {
    return nullptr;
  }

  std::vector<std::thread> threads;
  threads.reserve(tasks_.size());

  auto wait_for = [this](size_t count) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, count]() { return terminations_.size() >= count; });
  };

  auto join_all = [&threads]() {
    for (auto &thread : threads) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  };

  try {
    for (size_t i = 0; i < tasks_.size(); ++i) {
      threads.emplace_back([this, i]() {
        std::exception_ptr error;
        try {
          tasks_[i].execute();
        } catch (...) {
          error = std::current_exception();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        terminations_.push_back({i, error});
        cv_.notify_all();
      });
    }
  } catch (const std::exception &e) {
    // Could not start every task: stop the ones that did start
    logger_->error("failed to start task '{}': {}", tasks_[threads.size()].name, e.what());
    scope_.Cancel(std::current_exception());
    for (size_t i = 0; i < threads.size(); ++i) {
      tasks_[i].interrupt();
    }
    wait_for(threads.size());
    join_all();
    throw;
  }

  Termination first{};
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !terminations_.empty(); });
    first = terminations_.front();
  }

  logger_->debug("task '{}' terminated first{}{}", tasks_[first.index].name,
                 first.error ? ": " : "", util::DescribeError(first.error));

  scope_.Cancel(first.error ? first.error : util::MakeCanceledError());

  for (size_t i = 0; i < tasks_.size(); ++i) {
    if (i == first.index) {
      continue;
    }
    try {
      tasks_[i].interrupt();
    } catch (const std::exception &e) {
      logger_->error("interrupt of task '{}' failed: {}", tasks_[i].name, e.what());
    }
  }

  wait_for(tasks_.size());
  join_all();

  for (const auto &termination : terminations_) {
    if (termination.error && !util::IsCancellation(termination.error)) {
      return termination.error;
    }
  }
  return nullptr;
}

// ============================================================================
// SignalWatcher
// ============================================================================

std::string SignalName(int signo) {
  switch (signo) {
  case SIGINT:
    return "SIGINT";
  case SIGTERM:
    return "SIGTERM";
  case SIGHUP:
    return "SIGHUP";
  case SIGQUIT:
    return "SIGQUIT";
  case SIGUSR1:
    return "SIGUSR1";
  case SIGUSR2:
    return "SIGUSR2";
  default:
    return "signal " + std::to_string(signo);
  }
}

SignalWatcher::SignalWatcher(CancellationScope &scope, std::vector<int> signals,
                             std::shared_ptr<spdlog::logger> logger)
    : scope_(scope), watched_(std::move(signals)), logger_(std::move(logger)),
      state_(std::make_shared<State>()) {
  for (int signo : watched_) {
    state_->signals.add(signo);
  }
}

SignalWatcher::~SignalWatcher() {
  boost::system::error_code ec;
  state_->signals.cancel(ec);
  state_->signals.clear(ec);
}

void SignalWatcher::Execute() {
  std::shared_ptr<State> state = state_;
  std::exception_ptr received;

  state->signals.async_wait(
      [this, &received](const boost::system::error_code &ec, int signo) {
        if (ec) {
          return; // cancelled by Interrupt()
        }
        std::string name = SignalName(signo);
        logger_->info("received {}, shutting down", name);
        received = std::make_exception_ptr(
            Error(ErrorCode::Canceled, "received signal " + name));
        scope_.Cancel(received);
      });

  // Captures a raw pointer: a handler still queued when State is destroyed
  // is destroyed with it, never run
  std::weak_ptr<State> weak = state;
  scope_.Subscribe([weak](std::exception_ptr) {
    if (auto s = weak.lock()) {
      boost::asio::post(s->io_context, [raw = s.get()]() {
        boost::system::error_code ignored;
        raw->signals.cancel(ignored);
      });
    }
  });

  state->io_context.run();

  if (received) {
    std::rethrow_exception(received);
  }
  throw Error(ErrorCode::Canceled, "signal watcher interrupted");
}

void SignalWatcher::Interrupt() {
  boost::asio::post(state_->io_context, [raw = state_.get()]() {
    boost::system::error_code ignored;
    raw->signals.cancel(ignored);
  });
}

void SignalWatcher::AddTo(Supervisor &supervisor) {
  supervisor.Add(
      "signal", [this]() { Execute(); }, [this]() { Interrupt(); });
}

} // namespace app
} // namespace rdvp
