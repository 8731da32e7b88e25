#ifndef CHUNKSTORE_UTILS_COMPLETION_CHANNEL_HPP
#define CHUNKSTORE_UTILS_COMPLETION_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace chunkstore {
namespace utils {

// Bounded multi-producer queue used to fan results of concurrent tasks
// back in to a single collector. A channel sized to the number of producers
// never blocks a producer.
template <typename T>
class CompletionChannel {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CompletionChannel(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("Completion channel: capacity must be positive");
    }
  }
  ~CompletionChannel() = default;

  CompletionChannel(const CompletionChannel&) = delete;
  CompletionChannel& operator=(const CompletionChannel&) = delete;


  // ---- CHANNEL CONTROL METHODS ----
  // Adds a result to the back of the queue, waiting while the channel is full
  void produce(T value) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return queue_.size() < capacity_; });
    queue_.push(std::move(value));
    BOOST_LOG_TRIVIAL(trace) << "Completion channel: Added result. Channel size: " << queue_.size();
    lock.unlock();
    not_empty_.notify_one();
  }

  // Blocks until a result is available, then removes and returns it
  T consume() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop();
    lock.unlock();
    not_full_.notify_one();
    return value;
  }


  // ---- QUERY METHODS ----
  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

private:
  // ---- PARAMETERS ----
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<T> queue_;
};

} // namespace utils
} // namespace chunkstore

#endif // CHUNKSTORE_UTILS_COMPLETION_CHANNEL_HPP
