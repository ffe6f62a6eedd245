/**
 * @file notificationqueue.hpp
 * @brief Thread-safe hand-off of results from background workers to the
 * input/render loop
 *
 * Workers (size computations, directory listings, transfer processes) never
 * touch panel or session state. They push a message into a
 * NotificationQueue and the loop thread drains it and applies the
 * transitions itself.
 */

#ifndef NOTIFICATIONQUEUE_HPP
#define NOTIFICATIONQUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

/**
 * @class NotificationQueue
 * @brief Multi-producer, single-consumer message queue with a wake hook
 *
 * The wake hook is invoked after every push, outside the lock. The TUI uses
 * it to post a custom event so the screen loop wakes up and drains the
 * queue.
 *
 * @tparam T Message type
 */
template <typename T> class NotificationQueue {
public:
  using WakeHook = std::function<void()>;

  void push(T message) {
    WakeHook hook;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_messages.push_back(std::move(message));
      hook = m_wake_hook;
    }
    m_cv.notify_all();
    if (hook)
      hook();
  }

  /** @brief Removes and returns everything queued so far, in push order */
  std::vector<T> drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<T> out(std::make_move_iterator(m_messages.begin()),
                       std::make_move_iterator(m_messages.end()));
    m_messages.clear();
    return out;
  }

  /**
   * @brief Blocks until a message is queued or @p timeout expires
   * @return true if at least one message is waiting
   */
  bool waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] { return !m_messages.empty(); });
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_messages.empty();
  }

  void setWakeHook(WakeHook hook) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_wake_hook = std::move(hook);
  }

private:
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque<T> m_messages;
  WakeHook m_wake_hook;
};

#endif // NOTIFICATIONQUEUE_HPP
