#include "log.hpp"
#include <boost/asio/post.hpp>
#include <exception>

namespace replay {

StateEmitter::StateEmitter(const boost::asio::any_io_executor& executor)
    : strand_(boost::asio::make_strand(executor))
    , shared_(std::make_shared<Shared>()) {}

StateEmitter::~StateEmitter() {
  close();
}

void StateEmitter::setListener(PlayerListener listener) {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  shared_->listener = std::move(listener);
  if (shared_->pending && !shared_->closed) {
    schedule();
  }
}

void StateEmitter::emit(PlayerState state) {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  if (shared_->closed) {
    return;
  }
  if (shared_->pending) {
    merge(*shared_->pending, std::move(state));
  } else {
    shared_->pending = std::move(state);
  }
  schedule();
}

void StateEmitter::close() {
  std::unique_lock<std::mutex> lock(shared_->mutex);
  shared_->closed = true;
  shared_->pending.reset();
  const auto self = std::this_thread::get_id();
  shared_->idle.wait(lock, [&] {
    return shared_->deliveringThread == std::thread::id() || shared_->deliveringThread == self;
  });
}

void StateEmitter::waitIdle() {
  std::unique_lock<std::mutex> lock(shared_->mutex);
  shared_->idle.wait(lock, [&] {
    return !shared_->inFlight &&
           (!shared_->pending || !shared_->listener || shared_->closed);
  });
}

// Requires shared_->mutex.
void StateEmitter::schedule() {
  if (shared_->inFlight || !shared_->listener) {
    return;
  }
  shared_->inFlight = true;
  boost::asio::post(strand_, [shared = shared_] {
    deliver(shared);
  });
}

void StateEmitter::deliver(const std::shared_ptr<Shared>& shared) {
  for (;;) {
    PlayerState state;
    PlayerListener listener;
    {
      std::lock_guard<std::mutex> lock(shared->mutex);
      shared->deliveringThread = std::thread::id();
      if (!shared->pending || !shared->listener || shared->closed) {
        shared->inFlight = false;
        shared->idle.notify_all();
        return;
      }
      state = std::move(*shared->pending);
      shared->pending.reset();
      listener = shared->listener;
      shared->deliveringThread = std::this_thread::get_id();
    }
    try {
      listener(std::move(state));
    } catch (const std::exception& e) {
      logger()->error("player listener threw: {}", e.what());
    }
  }
}

void StateEmitter::merge(PlayerState& pending, PlayerState&& next) {
  if (pending.activeData && next.activeData) {
    auto& earlier = pending.activeData->messages;
    auto& later = next.activeData->messages;
    earlier.insert(earlier.end(), std::make_move_iterator(later.begin()),
                   std::make_move_iterator(later.end()));
    later = std::move(earlier);
    next.activeData->currentTimeChanged =
      next.activeData->currentTimeChanged || pending.activeData->currentTimeChanged;
  }
  pending = std::move(next);
}

}  // namespace replay
