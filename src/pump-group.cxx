#include <kube-pod-copy/detail/pump-group.hxx>
#include <kube-pod-copy/logging.hxx>

#include <algorithm>
#include <condition_variable>
#include <stdexcept>
#include <vector>

namespace kube_pod_copy::detail {
PumpGroup::PumpGroup(std::function<void()> on_failure)
    : on_failure_(std::move(on_failure)) {}

PumpGroup::~PumpGroup() { join(); }

void PumpGroup::spawn(std::string name, std::function<void()> body) {
  threads_.emplace_back([this, name = std::move(name), body = std::move(body)] {
    try {
      body();
      BOOST_LOG_TRIVIAL(trace) << name << " pump finished";
    } catch (const std::exception &) {
      record(name, std::current_exception());
    }
  });
}

void PumpGroup::join() {
  for (auto &thread : threads_)
    if (thread.joinable())
      thread.join();
  threads_.clear();
}

std::exception_ptr PumpGroup::first_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return first_error_;
}

void PumpGroup::record(const std::string &name, std::exception_ptr error) {
  bool first = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!first_error_) {
      first_error_ = error;
      first = true;
    }
  }

  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    if (first)
      BOOST_LOG_TRIVIAL(debug) << name << " pump failed: " << e.what();
    else
      BOOST_LOG_TRIVIAL(trace) << name << " pump stopped: " << e.what();
  }

  if (first && on_failure_)
    on_failure_();
}

SessionGuard::SessionGuard(ExecSession &session, const CopyOptions &options)
    : timeout_(options.timeout) {
  if (options.stop_token.stop_possible())
    on_stop_.emplace(options.stop_token,
                     std::function<void()>([this, &session] {
                       stopped_ = true;
                       session.cancel();
                     }));
  if (timeout_.count() > 0)
    watchdog_ = std::jthread([this, &session](std::stop_token stop) {
      std::mutex mutex;
      std::condition_variable_any expired;
      std::unique_lock<std::mutex> lock(mutex);
      expired.wait_for(lock, stop, timeout_, [] { return false; });
      if (!stop.stop_requested()) {
        timed_out_ = true;
        session.cancel();
      }
    });
}

SessionGuard::~SessionGuard() { disarm(); }

void SessionGuard::disarm() {
  if (watchdog_.joinable()) {
    watchdog_.request_stop();
    watchdog_.join();
  }
  on_stop_.reset();
}

void SessionGuard::check(const std::string &what) const {
  if (timed_out_)
    throw CopyError(CopyError::Kind::TimedOut,
                    what + " timed out after " +
                        std::to_string(timeout_.count()) + " ms");
  if (stopped_)
    throw CopyError(CopyError::Kind::Cancelled, what + " was cancelled");
}

std::string drain_stream(ExecSession &session, OutputStream stream,
                         std::size_t keep, std::size_t chunk_size) {
  std::string kept;
  std::vector<char> buffer(std::max<std::size_t>(chunk_size, 1));
  for (;;) {
    auto n = stream == OutputStream::Stdout
                 ? session.read_stdout(buffer.data(),
                                       static_cast<std::streamsize>(buffer.size()))
                 : session.read_stderr(buffer.data(),
                                       static_cast<std::streamsize>(buffer.size()));
    if (n < 0)
      break;
    auto room = keep - std::min(keep, kept.size());
    kept.append(buffer.data(),
                std::min(room, static_cast<std::size_t>(n)));
  }
  return kept;
}

CopyError remote_failure(const CopyTarget &target, const ExecStatus &status,
                         const std::string &remote_stderr) {
  std::string message = "remote command for " + target.describe();
  if (status.exit_code >= 0)
    message += " exited with code " + std::to_string(status.exit_code);
  else
    message += " failed (" + status.reason + ")";
  if (!remote_stderr.empty())
    message += ": " + remote_stderr.substr(0, remote_stderr.find('\n'));
  else if (!status.message.empty())
    message += ": " + status.message;
  return CopyError(CopyError::Kind::RemoteCommandFailed, message,
                   status.exit_code, remote_stderr);
}
} // namespace kube_pod_copy::detail
