/**
 * @file pod-copy.hxx
 * @brief Copy files and directory trees in and out of running containers.
 */

#pragma once

#include <kube-pod-copy/capability-probe.hxx>
#include <kube-pod-copy/cluster-config.hxx>
#include <kube-pod-copy/copy-session.hxx>
#include <kube-pod-copy/copy-target.hxx>
#include <kube-pod-copy/exec-channel.hxx>

#include <filesystem>
#include <istream>
#include <memory>
#include <string>

namespace kube_pod_copy {
/**
 * @brief Entry points for copying between the local filesystem and a pod.
 *
 * Every copy runs `tar` in the target container through one exec session:
 * uploads stream an archive into `tar -xmf - -C /`, downloads read the
 * output of `tar -cf - -C <dir> <name>`. Nothing has to be installed in the
 * container beyond `sh` and `tar`.
 *
 * Calls are independent and may run concurrently from several threads.
 *
 * Progress is logged through Boost.Log at trace and debug level. Unless
 * init_logging() ran first, constructing a PodCopy filters records below
 * `warning` so they do not reach Boost.Log's default console sink.
 *
 * @code{.cpp}
 * kube_pod_copy::PodCopy copy(kube_pod_copy::ClusterConfig::in_cluster());
 * kube_pod_copy::CopyTarget target{.namespace_name = "default",
 *                                  .pod_name = "web-0",
 *                                  .path = "/etc/nginx/nginx.conf"};
 * copy.copy_file_to_pod(target, "nginx.conf");
 * @endcode
 */
class PodCopy {
public:
  /// Use an existing channel; tests pass a fake one.
  explicit PodCopy(std::shared_ptr<ExecChannel> channel);

  /**
   * @brief Talk to the API server described by `config` over WebSockets.
   *
   * @throws ConfigError when the TLS settings cannot be loaded.
   */
  explicit PodCopy(ClusterConfig config);

  /**
   * @brief Place `local_file` at `target.path`.
   *
   * Parent directories are created in the container as needed.
   */
  void copy_file_to_pod(const CopyTarget &target,
                        const std::filesystem::path &local_file,
                        const CopyOptions &options = {});

  /// Place `content` at `target.path` with mode 0644.
  void copy_bytes_to_pod(const CopyTarget &target, std::string content,
                         const CopyOptions &options = {});

  /// Recreate the tree below `local_directory` at `target.path`.
  void copy_directory_to_pod(const CopyTarget &target,
                             const std::filesystem::path &local_directory,
                             const CopyOptions &options = {});

  /**
   * @brief Stream the content of the remote file `target.path`.
   *
   * The exec session stays open while the stream is read. Reaching the end
   * of the stream checks the remote exit status; a failure, a truncated
   * archive or a broken channel is raised from the read that would have
   * returned end of file. The stream has `badbit` exceptions enabled.
   * Destroying the stream early cancels the session.
   *
   * @throws ChannelError when the session cannot be opened.
   */
  std::unique_ptr<std::istream>
  copy_file_from_pod(const CopyTarget &target, const CopyOptions &options = {});

  /// Write the remote file `target.path` to `local_file`.
  void copy_file_from_pod(const CopyTarget &target,
                          const std::filesystem::path &local_file,
                          const CopyOptions &options = {});

  /**
   * @brief Recreate the remote tree at `target.path` below `local_directory`.
   *
   * The container's tar is probed first. The probe counts against
   * `options.timeout` and honors `options.stop_token`.
   *
   * @throws CopyNotSupportedException when the probe reports an incompatible
   * tar; no data channel is opened in that case.
   */
  void copy_directory_from_pod(const CopyTarget &target,
                               const std::filesystem::path &local_directory,
                               const CopyOptions &options = {});

  /// Run the capability probe against the target's container.
  ProbeReport probe(const CopyTarget &target, const CopyOptions &options = {});

  ExecChannel &channel() noexcept { return *channel_; }

private:
  void run(CopyPlan plan, const CopyOptions &options);

  std::shared_ptr<ExecChannel> channel_;
};
} // namespace kube_pod_copy
