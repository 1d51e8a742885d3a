/**
 * @file exec-channel.hxx
 * @brief Remote command execution sessions against a container.
 */

#pragma once

#include <kube-pod-copy/copy-target.hxx>

#include <ios>
#include <memory>
#include <string>
#include <vector>

namespace kube_pod_copy {
/**
 * @brief Which standard streams a session carries.
 *
 * Part of the wire contract: the flags are sent verbatim as the `stdin`,
 * `stdout`, `stderr` and `tty` query parameters.
 */
struct ExecStreamFlags {
  bool want_stdin = false;
  bool want_stdout = true;
  bool want_stderr = true;
  bool tty = false;

  bool operator==(const ExecStreamFlags &) const = default;
};

/**
 * @brief Exit status reported on the out-of-band status channel.
 */
struct ExecStatus {
  bool success = false;
  int exit_code = -1;  /**< @brief -1 when the server did not report one. */
  std::string reason;  /**< @brief e.g. "NonZeroExitCode", "StatusMissing". */
  std::string message; /**< @brief Server supplied description. */
};

/**
 * @brief One running remote command with its multiplexed streams.
 *
 * Streams that were not requested in ExecStreamFlags must not be used; doing
 * so raises std::logic_error. stdin is written by one thread, stdout and
 * stderr may each be read by their own thread concurrently with it.
 *
 * Every blocking call throws ChannelError::Kind::Aborted once cancel() was
 * called, and ChannelError::Kind::ConnectionFailed on transport errors.
 */
class ExecSession {
public:
  virtual ~ExecSession() = default;

  /// Write all `n` bytes to the remote stdin; blocks under backpressure.
  virtual void write_stdin(const char *data, std::size_t n) = 0;

  /**
   * @brief Signal end of input on stdin.
   *
   * Never closes stdout/stderr. Further writes raise std::logic_error.
   */
  virtual void close_stdin() = 0;

  /// Read stdout bytes; returns -1 at end of stream.
  virtual std::streamsize read_stdout(char *s, std::streamsize n) = 0;

  /// Read stderr bytes; returns -1 at end of stream.
  virtual std::streamsize read_stderr(char *s, std::streamsize n) = 0;

  /**
   * @brief Block until the remote command has terminated.
   *
   * Returns the reported status; a session that ends without one yields an
   * unsuccessful status with reason "StatusMissing".
   */
  virtual ExecStatus wait() = 0;

  /**
   * @brief Abort the session from any thread.
   *
   * Unblocks pending reads, writes and wait(), and releases the connection.
   */
  virtual void cancel() noexcept = 0;

  /// Flags the session was opened with.
  virtual const ExecStreamFlags &flags() const noexcept = 0;
};

/**
 * @brief Factory for exec sessions.
 */
class ExecChannel {
public:
  virtual ~ExecChannel() = default;

  /**
   * @brief Start `command` in the target's container.
   *
   * Only namespace, pod and container of `target` are used.
   *
   * @throws ChannelError NotFound when the server refuses the exec request,
   * ConnectionFailed on transport failure.
   */
  virtual std::unique_ptr<ExecSession>
  open(const CopyTarget &target, const std::vector<std::string> &command,
       const ExecStreamFlags &flags) = 0;
};
} // namespace kube_pod_copy
