#pragma once

#include <kube-pod-copy/copy-session.hxx>
#include <kube-pod-copy/copy-target.hxx>
#include <kube-pod-copy/errors.hxx>
#include <kube-pod-copy/exec-channel.hxx>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace kube_pod_copy::detail {
/**
 * @brief Threads moving bytes between one exec session and local code.
 *
 * Each pump runs on its own thread. The first pump to throw records its
 * exception and triggers `on_failure` (normally ExecSession::cancel) so the
 * other pumps, blocked on the same session, unblock too. Later failures are
 * consequences of the first and are only logged.
 */
class PumpGroup {
public:
  explicit PumpGroup(std::function<void()> on_failure);
  ~PumpGroup();

  PumpGroup(const PumpGroup &) = delete;
  PumpGroup &operator=(const PumpGroup &) = delete;

  void spawn(std::string name, std::function<void()> body);

  /// Wait for every pump; safe to call more than once.
  void join();

  /// Exception of the first failed pump, null when none failed.
  std::exception_ptr first_error() const;

private:
  void record(const std::string &name, std::exception_ptr error);

  std::function<void()> on_failure_;
  std::vector<std::thread> threads_;
  mutable std::mutex mutex_;
  std::exception_ptr first_error_;
};

/**
 * @brief Cancels an exec session when the copy deadline passes or the
 * caller requests a stop, and remembers which of the two fired.
 *
 * The guard must not outlive the session. Once it fired, blocked session
 * calls fail with ChannelError::Kind::Aborted; check() turns that into the
 * CopyError the caller asked for.
 */
class SessionGuard {
public:
  SessionGuard(ExecSession &session, const CopyOptions &options);
  ~SessionGuard();

  SessionGuard(const SessionGuard &) = delete;
  SessionGuard &operator=(const SessionGuard &) = delete;

  /// Stop the watchdog and unregister the stop callback.
  void disarm();

  bool timed_out() const noexcept { return timed_out_; }
  bool stopped() const noexcept { return stopped_; }

  /**
   * @throws CopyError TimedOut or Cancelled naming `what` when the guard
   * fired.
   */
  void check(const std::string &what) const;

private:
  std::chrono::milliseconds timeout_;
  std::atomic<bool> timed_out_{false};
  std::atomic<bool> stopped_{false};
  std::optional<std::stop_callback<std::function<void()>>> on_stop_;
  std::jthread watchdog_;
};

/// Which session stream drain_stream() reads.
enum class OutputStream { Stdout, Stderr };

/**
 * @brief Read a session stream to its end.
 *
 * Bytes beyond `keep` are read and discarded so the remote side never stalls
 * on a full pipe.
 */
std::string drain_stream(ExecSession &session, OutputStream stream,
                         std::size_t keep, std::size_t chunk_size = 16384);

/// CopyError::Kind::RemoteCommandFailed describing `status`.
CopyError remote_failure(const CopyTarget &target, const ExecStatus &status,
                         const std::string &remote_stderr);
} // namespace kube_pod_copy::detail
