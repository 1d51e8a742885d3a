/**
 * @file copy-session.hxx
 * @brief State machine driving one copy through an exec session.
 */

#pragma once

#include <kube-pod-copy/archive-encoder.hxx>
#include <kube-pod-copy/copy-target.hxx>
#include <kube-pod-copy/exec-channel.hxx>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace kube_pod_copy {
namespace detail {
class SessionGuard;
} // namespace detail

enum class Direction { ToPod, FromPod };
enum class CopyMode { File, Directory };

/**
 * @brief Lifecycle of a CopySession.
 *
 * Idle -> ChannelOpening -> Streaming -> Draining -> Closed, with Failed
 * reachable from every non-terminal state. Closed and Failed are terminal.
 */
enum class SessionState {
  Idle,
  ChannelOpening,
  Streaming,
  Draining,
  Closed,
  Failed
};

const char *to_string(SessionState state) noexcept;

/**
 * @brief Per-copy knobs.
 */
struct CopyOptions {
  /// Whole-copy deadline; zero disables it.
  std::chrono::milliseconds timeout{0};
  /// Requesting a stop aborts the copy with CopyError::Kind::Cancelled.
  std::stop_token stop_token;
  /// Bytes moved per stdin write or stdout read.
  std::size_t chunk_size = 64 * 1024;
  /// Remote stderr kept for error reports; the rest is discarded.
  std::size_t stderr_capture_limit = 64 * 1024;
};

/// Stream a local archive into the remote unpack command.
struct UploadArchive {
  ArchiveEncoder encoder;
};

/// Materialize the remote archive below a local directory.
struct ExtractToDirectory {
  std::filesystem::path root;
  std::string strip_prefix;
};

/// Write the payload of the remote single-file archive to a local file.
struct ExtractFileTo {
  std::filesystem::path local_file;
};

using CopyPayload = std::variant<UploadArchive, ExtractToDirectory, ExtractFileTo>;

/**
 * @brief Everything a CopySession needs: what runs remotely and where the
 * bytes go locally.
 */
struct CopyPlan {
  Direction direction = Direction::ToPod;
  CopyMode mode = CopyMode::File;
  CopyTarget remote;
  std::vector<std::string> command;
  ExecStreamFlags flags;
  CopyPayload payload;
};

/**
 * @brief Quote `value` for `sh`, leaving `[A-Za-z0-9_./-]` words untouched.
 */
std::string shell_quote(const std::string &value);

/// `sh -c "tar -xmf - -C /"`
std::vector<std::string> unpack_command();

/// `sh -c "tar -cf - -C <directory> <name>"`
std::vector<std::string> pack_command(const std::string &directory,
                                      const std::string &name);

/// Stream flags of copies into a pod.
ExecStreamFlags upload_flags();

/// Stream flags of copies out of a pod.
ExecStreamFlags download_flags();

/**
 * @name Copy plans
 *
 * Validate the target, describe the local side and pick the remote command.
 * Plans for uploads walk the local path eagerly, so an unreadable tree fails
 * before any channel is opened.
 *
 * @throws std::invalid_argument for an invalid target.
 * @throws EncodeError when the local source cannot be described.
 */
///@{
CopyPlan plan_file_to_pod(const CopyTarget &target,
                          const std::filesystem::path &local_file);
CopyPlan plan_bytes_to_pod(const CopyTarget &target, std::string content);
CopyPlan plan_directory_to_pod(const CopyTarget &target,
                               const std::filesystem::path &local_directory);
CopyPlan plan_file_from_pod(const CopyTarget &target,
                            const std::filesystem::path &local_file);
CopyPlan plan_directory_from_pod(const CopyTarget &target,
                                 const std::filesystem::path &local_directory);
///@}

/**
 * @brief Runs one CopyPlan against an exec channel.
 *
 * run() opens the channel, runs one pump thread per requested stream, waits
 * for the remote exit status and reports the outcome. The first failing pump
 * cancels the exec session so the others unblock. A session runs once.
 *
 * Failures are reported as thrown exceptions:
 *  - ChannelError, EncodeError and DecodeError unmodified,
 *  - CopyError::Kind::RemoteCommandFailed for a non-zero remote exit,
 *  - CopyError::Kind::TimedOut and CopyError::Kind::Cancelled when the
 *    deadline passed or a stop was requested.
 */
class CopySession {
public:
  CopySession(ExecChannel &channel, CopyPlan plan, CopyOptions options = {});

  CopySession(const CopySession &) = delete;
  CopySession &operator=(const CopySession &) = delete;

  void run();

  SessionState state() const noexcept { return state_.load(); }
  const CopyPlan &plan() const noexcept { return plan_; }
  /// Remote stderr captured by the last run, clipped to the capture limit.
  const std::string &remote_stderr() const noexcept { return remote_stderr_; }

private:
  void transition(SessionState next);
  void execute(ExecSession &session, const detail::SessionGuard &guard);

  ExecChannel &channel_;
  CopyPlan plan_;
  CopyOptions options_;
  std::atomic<SessionState> state_{SessionState::Idle};
  std::string remote_stderr_;
  std::exception_ptr deferred_error_;
};
} // namespace kube_pod_copy
