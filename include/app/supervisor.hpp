// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Process supervision

 Supervisor runs a group of tasks, each an (execute, interrupt) pair, one
 thread per execute. The first task to return ends the group:

   1. the shared CancellationScope is cancelled with that task's error
      (or a Canceled error if it returned cleanly)
   2. every other task's interrupt runs, exactly once
   3. Run() blocks until every execute has returned and its thread joined

 Run() returns the first error, in termination order, that is not a
 Canceled error; nullptr when the group shut down cleanly.

 SignalWatcher is the task that turns SIGINT/SIGTERM into a cancellation so
 an operator interrupt takes the same path as an internal failure.
*/

#include "util/logging.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rdvp {
namespace app {

/**
 * Cancel-once signal shared by supervised tasks
 *
 * Thread-safe. The first Cancel() records its cause and wakes every waiter;
 * later calls have no effect.
 */
class CancellationScope {
public:
  using Callback = std::function<void(std::exception_ptr cause)>;

  // Returns true only for the call that cancelled the scope
  bool Cancel(std::exception_ptr cause = nullptr);

  bool IsCancelled() const;

  // Cancellation cause (nullptr while not cancelled)
  std::exception_ptr Cause() const;

  /**
   * Run callback on cancellation (immediately, on this thread, if the scope
   * is already cancelled). Callbacks run outside the internal lock.
   */
  void Subscribe(Callback callback);

  void Wait() const;

  // Returns true if cancelled within timeout
  bool WaitFor(std::chrono::milliseconds timeout) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_{false};
  std::exception_ptr cause_;
  std::vector<Callback> callbacks_;
};

class Supervisor {
public:
  // Execute reports failure by throwing
  using Execute = std::function<void()>;
  using Interrupt = std::function<void()>;

  explicit Supervisor(std::shared_ptr<spdlog::logger> logger =
                          util::LogManager::GetLogger("app"));

  Supervisor(const Supervisor &) = delete;
  Supervisor &operator=(const Supervisor &) = delete;

  // Register a task; only before Run()
  void Add(const std::string &name, Execute execute, Interrupt interrupt);

  // Run all tasks to completion (see file comment). Callable once.
  std::exception_ptr Run();

  CancellationScope &scope() { return scope_; }

private:
  struct Task {
    std::string name;
    Execute execute;
    Interrupt interrupt;
  };

  struct Termination {
    size_t index;
    std::exception_ptr error;
  };

  std::shared_ptr<spdlog::logger> logger_;
  CancellationScope scope_;
  std::vector<Task> tasks_;
  bool started_{false};

  // Termination queue (filled by task threads)
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Termination> terminations_;
};

/**
 * Blocks until one of the watched signals arrives or it is interrupted
 *
 * On signal: logs, cancels the scope, throws Error(Canceled, "received
 * signal ..."). On Interrupt() or scope cancellation: throws
 * Error(Canceled, ...). Interrupt() before Execute() starts is honoured.
 */
class SignalWatcher {
public:
  explicit SignalWatcher(CancellationScope &scope,
                         std::vector<int> signals = {SIGINT, SIGTERM},
                         std::shared_ptr<spdlog::logger> logger =
                             util::LogManager::GetLogger("app"));
  ~SignalWatcher();

  SignalWatcher(const SignalWatcher &) = delete;
  SignalWatcher &operator=(const SignalWatcher &) = delete;

  void Execute();
  void Interrupt();

  // Register as a supervised task named "signal"
  void AddTo(Supervisor &supervisor);

private:
  // Shared with scope subscriptions, which may outlive this object
  struct State {
    boost::asio::io_context io_context;
    boost::asio::signal_set signals{io_context};
  };

  CancellationScope &scope_;
  std::vector<int> watched_;
  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<State> state_;
};

// "SIGINT", "SIGTERM", or the number
std::string SignalName(int signo);

} // namespace app
} // namespace rdvp
