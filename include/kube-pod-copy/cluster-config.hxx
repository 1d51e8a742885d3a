/**
 * @file cluster-config.hxx
 * @brief Connection settings for the Kubernetes API server.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace kube_pod_copy {
/**
 * @brief Where and how to reach the API server.
 *
 * The struct is plain data. The static constructors fill it from the usual
 * sources; apply_environment() and explicit assignments override fields
 * afterwards.
 */
struct ClusterConfig {
  bool use_tls = true;               /**< @brief https (true) or http. */
  std::string host = "localhost";    /**< @brief API server host name. */
  std::uint16_t port = 443;          /**< @brief API server port. */
  std::string base_path;             /**< @brief Path prefix, no trailing /. */
  std::string bearer_token;          /**< @brief Empty disables auth. */
  std::filesystem::path ca_file;     /**< @brief PEM bundle, empty for system. */
  bool insecure_skip_tls_verify = false;
  std::chrono::seconds connect_timeout{30};
  std::string user_agent = "kube-pod-copy/0.1";

  /**
   * @brief Replace scheme, host, port and base path from a server URL.
   *
   * Accepts `http://host[:port][/base]` and `https://host[:port][/base]`.
   * IPv6 literals are written in brackets.
   *
   * @throws ConfigError on an unsupported scheme or a malformed port.
   */
  void set_server(const std::string &url);

  /// Server URL reassembled from the fields.
  std::string server() const;

  /**
   * @brief Configuration of a process running inside a pod.
   *
   * Uses KUBERNETES_SERVICE_HOST/KUBERNETES_SERVICE_PORT and the mounted
   * service account token and CA bundle.
   *
   * @throws ConfigError when the environment variables are missing.
   */
  static ClusterConfig in_cluster();

  /**
   * @brief Load a JSON configuration file.
   *
   * Recognized keys: `server`, `token`, `token_file`,
   * `certificate_authority`, `insecure_skip_tls_verify`,
   * `connect_timeout_seconds`. Unknown keys are ignored.
   *
   * @throws ConfigError when the file cannot be read or parsed.
   */
  static ClusterConfig from_file(const std::filesystem::path &path);

  /// Apply KUBE_POD_COPY_SERVER and KUBE_POD_COPY_TOKEN when set.
  void apply_environment();
};
} // namespace kube_pod_copy
