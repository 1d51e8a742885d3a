/**
 * @file logging.hxx
 * @brief Boost.Log setup shared by the library and the command-line tool.
 */

#pragma once

#include <boost/log/trivial.hpp>

namespace kube_pod_copy {
/**
 * @brief Options for the console sink installed by init_logging().
 */
struct LogOptions {
  /// Records below this severity are dropped.
  boost::log::trivial::severity_level min_severity =
      boost::log::trivial::warning;
  /// Prefix records with a timestamp.
  bool timestamps = true;
};

/**
 * @brief Install a console (stderr) sink and severity filter.
 *
 * Safe to call more than once; later calls replace the previous sink.
 * The library logs through `BOOST_LOG_TRIVIAL` at trace and debug level.
 * Without a call, the first PodCopy installs a `warning` filter on the
 * Boost.Log core; applications with their own Boost.Log setup configure it
 * after constructing PodCopy or call init_logging().
 */
void init_logging(const LogOptions &options = {});

namespace detail {
/// Filter records below `warning` unless init_logging() already ran.
void ensure_default_log_filter();
} // namespace detail
} // namespace kube_pod_copy
