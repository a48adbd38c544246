/**
 * @file channel.hpp
 * @brief Thread-safe unbounded FIFO channel
 *
 * @details Carries events between a conversion job and its caller:
 *
 *          - MessageChannel: workers (producers) -> caller (consumer)
 *
 *          - CommandChannel: caller (producer) -> cancellation controller
 *
 * @note FIFO per producer; items from different producers interleave in the
 *       order they were sent.
 */

#ifndef GIF_MAKER_CHANNEL_HPP
#define GIF_MAKER_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

#include "types.hpp"

namespace gif_maker {

/**
 * @class Channel
 * @brief Many-producer, single-consumer unbounded queue.
 *
 * @attention USAGE:
 *
 *   - Producers call send() from any thread, it never blocks
 *
 *   - The consumer calls recv() / recv_for() / try_recv()
 *
 *   - recv_unless() additionally wakes when an external flag is raised,
 *     the raiser must call wake_all() after setting it
 */
template <typename T> class Channel {
public:
  /**
   * @brief Push an item to the back of the queue.
   * @note Thread-safe; notifies one waiting receiver.
   */
  void send(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      items_.push(std::move(item));
    }
    cv_.notify_one();
  }

  /**
   * @brief Pop the front item, blocking until one is available.
   */
  T recv() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !items_.empty(); });
    return pop_front();
  }

  /**
   * @brief Pop the front item, waiting at most @p timeout.
   * @return The item, or std::nullopt on timeout
   */
  template <typename Rep, typename Period>
  std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty(); }))
      return std::nullopt;
    return pop_front();
  }

  /**
   * @brief Pop the front item without blocking.
   */
  std::optional<T> try_recv() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty())
      return std::nullopt;
    return pop_front();
  }

  /**
   * @brief Pop the front item, or give up once @p stop becomes true.
   * @param stop Flag raised by another thread (followed by wake_all())
   * @return The item, or std::nullopt if @p stop was raised first
   * @note A pending item wins over a raised flag.
   */
  std::optional<T> recv_unless(const std::atomic<bool> &stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, &stop] { return !items_.empty() || stop.load(); });
    if (items_.empty())
      return std::nullopt;
    return pop_front();
  }

  /**
   * @brief Wake every waiting receiver so it re-evaluates its condition.
   * @note Takes the lock so a flag raised just before cannot be missed.
   */
  void wake_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  bool empty() const { return size() == 0; }

private:
  T pop_front() {
    T item = std::move(items_.front());
    items_.pop();
    return item;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> items_;
};

using MessageChannel = Channel<Message>;
using CommandChannel = Channel<Command>;

} // namespace gif_maker

#endif // GIF_MAKER_CHANNEL_HPP
