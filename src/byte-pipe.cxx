#include <kube-pod-copy/detail/byte-pipe.hxx>

#include <algorithm>

namespace kube_pod_copy::detail {
BytePipe::BytePipe(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

void BytePipe::write(const char *data, std::size_t n) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (n > 0) {
    writable_.wait(lock, [this] {
      return error_ || closed_ || buffer_.size() < capacity_;
    });
    if (error_)
      std::rethrow_exception(error_);
    if (closed_)
      return;

    auto count = std::min(n, capacity_ - buffer_.size());
    buffer_.insert(buffer_.end(), data, data + count);
    data += count;
    n -= count;
    readable_.notify_one();
  }
}

std::streamsize BytePipe::read(char *s, std::streamsize n) {
  std::unique_lock<std::mutex> lock(mutex_);
  readable_.wait(lock,
                 [this] { return error_ || closed_ || !buffer_.empty(); });
  if (error_)
    std::rethrow_exception(error_);
  if (buffer_.empty())
    return -1;

  auto count = std::min(static_cast<std::size_t>(n), buffer_.size());
  std::copy_n(buffer_.begin(), count, s);
  buffer_.erase(buffer_.begin(),
                buffer_.begin() + static_cast<std::ptrdiff_t>(count));
  writable_.notify_one();
  return static_cast<std::streamsize>(count);
}

void BytePipe::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  readable_.notify_all();
  writable_.notify_all();
}

void BytePipe::fail(std::exception_ptr error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!error_)
    error_ = error;
  readable_.notify_all();
  writable_.notify_all();
}

bool BytePipe::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}
} // namespace kube_pod_copy::detail
