#pragma once

#include "player.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <condition_variable>
#include <mutex>
#include <memory>
#include <optional>
#include <thread>

namespace replay {

/**
 * @brief Delivers player snapshots to the listener on its own strand. At most one
 * delivery is in flight. Snapshots pushed while one is running are merged into a
 * single pending snapshot: the newest state wins, but the messages of every merged
 * snapshot are kept in order, so messages are never dropped while a listener is
 * slow.
 */
class REPLAY_PUBLIC StateEmitter {
public:
  explicit StateEmitter(const boost::asio::any_io_executor& executor);
  ~StateEmitter();

  StateEmitter(const StateEmitter&) = delete;
  StateEmitter& operator=(const StateEmitter&) = delete;

  /**
   * @brief Replaces the listener. A snapshot held back for lack of a listener is
   * delivered to the new one.
   */
  void setListener(PlayerListener listener);

  /**
   * @brief Queues `state` for delivery, merging it with any snapshot still pending.
   */
  void emit(PlayerState state);

  /**
   * @brief Drops pending snapshots and waits for a listener call in progress to
   * return, unless called from the listener itself. No delivery starts afterwards.
   */
  void close();

  /**
   * @brief Blocks until nothing is pending or in flight.
   */
  void waitIdle();

private:
  // Shared with posted handlers so a handler that runs after the emitter is gone
  // finds it closed instead of dangling.
  struct Shared {
    std::mutex mutex;
    std::condition_variable idle;
    PlayerListener listener;
    std::optional<PlayerState> pending;
    bool inFlight = false;
    bool closed = false;
    std::thread::id deliveringThread;
  };

  boost::asio::strand<boost::asio::any_io_executor> strand_;
  std::shared_ptr<Shared> shared_;

  void schedule();
  static void deliver(const std::shared_ptr<Shared>& shared);
  static void merge(PlayerState& pending, PlayerState&& next);
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "state_emitter.inl"
#endif
