/**
 * @file copy-target.hxx
 * @brief Remote side of a copy: namespace, pod, container and path.
 */

#pragma once

#include <string>

namespace kube_pod_copy {
/**
 * @brief Identifies one filesystem path inside one container of a pod.
 *
 * An empty container name selects the pod's default container.
 */
struct CopyTarget {
  std::string namespace_name; /**< @brief Pod namespace. */
  std::string pod_name;       /**< @brief Pod name. */
  std::string container_name; /**< @brief Container, empty for default. */
  std::string path;           /**< @brief Absolute path in the container. */

  /**
   * @brief Check the invariants of a target.
   *
   * @throws std::invalid_argument when namespace or pod is empty, or when the
   * path is empty or relative.
   */
  void validate() const;

  /// Directory part of path ("/" for a path directly below the root).
  std::string parent_path() const;

  /// Last component of path, empty when path is "/".
  std::string file_name() const;

  /// Human readable form, e.g. "default/web[nginx]:/etc/nginx".
  std::string describe() const;
};
} // namespace kube_pod_copy
