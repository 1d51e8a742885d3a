#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <ios>
#include <mutex>

namespace kube_pod_copy::detail {
/**
 * @brief Bounded single-producer/single-consumer byte queue between threads.
 *
 * The producer blocks while the queue holds `capacity` bytes; the consumer
 * blocks while it is empty. close() delivers end of stream after the queued
 * bytes are drained; fail() delivers an exception to both sides instead.
 */
class BytePipe {
public:
  explicit BytePipe(std::size_t capacity = 1 << 20);

  BytePipe(const BytePipe &) = delete;
  BytePipe &operator=(const BytePipe &) = delete;

  /**
   * @brief Queue all `n` bytes, blocking while the pipe is full.
   *
   * Rethrows the failure after fail(); bytes written after close() are
   * dropped.
   */
  void write(const char *data, std::size_t n);

  /**
   * @brief Dequeue up to `n` bytes.
   *
   * @return Bytes read, or -1 once the pipe is closed and empty.
   */
  std::streamsize read(char *s, std::streamsize n);

  /// End of stream after the queued bytes; idempotent.
  void close();

  /// Wake both sides with `error`; the first failure wins.
  void fail(std::exception_ptr error);

  bool closed() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable readable_;
  std::condition_variable writable_;
  std::deque<char> buffer_;
  std::size_t capacity_;
  bool closed_ = false;
  std::exception_ptr error_;
};
} // namespace kube_pod_copy::detail
