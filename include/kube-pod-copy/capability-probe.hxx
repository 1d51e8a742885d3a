/**
 * @file capability-probe.hxx
 * @brief Preflight check of the tar implementation inside a container.
 */

#pragma once

#include <kube-pod-copy/copy-session.hxx>
#include <kube-pod-copy/copy-target.hxx>
#include <kube-pod-copy/exec-channel.hxx>

#include <string>
#include <vector>

namespace kube_pod_copy {
enum class ProbeResult { Supported, Unsupported };

const char *to_string(ProbeResult result) noexcept;

/**
 * @brief Outcome of one probe with what the remote command printed.
 */
struct ProbeReport {
  ProbeResult result = ProbeResult::Unsupported;
  ExecStatus status;
  std::string output;       /**< @brief Captured stdout, clipped. */
  std::string error_output; /**< @brief Captured stderr, clipped. */
};

/**
 * @brief Runs `sh -c "tar --version"` in the target container.
 *
 * Directory copies from a pod depend on GNU tar's handling of `-C <dir> .`;
 * busybox and other implementations are reported as unsupported so the copy
 * can fail before any data channel is opened.
 */
class CapabilityProbe {
public:
  explicit CapabilityProbe(ExecChannel &channel) : channel_(channel) {}

  /**
   * @brief Probe the container of `target` (its path is ignored).
   *
   * Supported only when the command exits successfully and its output names
   * GNU tar.
   *
   * Only `timeout` and `stop_token` of `options` apply.
   *
   * @throws ChannelError when the exec session cannot be opened or breaks.
   * @throws CopyError TimedOut or Cancelled when the deadline passed or a
   * stop was requested before the command finished.
   */
  ProbeReport run(const CopyTarget &target, const CopyOptions &options = {});

  static std::vector<std::string> command();
  static ExecStreamFlags flags();

private:
  ExecChannel &channel_;
};
} // namespace kube_pod_copy
