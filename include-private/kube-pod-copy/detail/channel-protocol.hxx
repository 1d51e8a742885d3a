#pragma once

#include <kube-pod-copy/copy-target.hxx>
#include <kube-pod-copy/exec-channel.hxx>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kube_pod_copy::detail {
/**
 * @brief Channel numbers of the Kubernetes streaming protocol.
 *
 * Every binary WebSocket message starts with one of these bytes; the rest of
 * the message is the stream payload.
 */
enum class StreamChannel : std::uint8_t {
  Stdin = 0,
  Stdout = 1,
  Stderr = 2,
  Error = 3,
  Resize = 4,
  Close = 255 /**< @brief v5 only: payload is the id of a closed stream. */
};

inline constexpr const char *protocol_v4 = "v4.channel.k8s.io";
inline constexpr const char *protocol_v5 = "v5.channel.k8s.io";

/// Percent-encode everything but RFC 3986 unreserved characters.
std::string url_encode(std::string_view value);

/**
 * @brief Request target of the pod exec endpoint.
 *
 * `{base}/api/v1/namespaces/{ns}/pods/{pod}/exec?stdin=..&stdout=..&stderr=..
 * &tty=..&command=..[&command=..][&container=..]`
 */
std::string exec_request_target(const std::string &base_path,
                                const CopyTarget &target,
                                const std::vector<std::string> &command,
                                const ExecStreamFlags &flags);

/// Prefix `payload` with the channel byte.
std::string make_frame(StreamChannel channel, std::string_view payload);

/**
 * @brief Decode the v1.Status document sent on the error channel.
 *
 * "Success" maps to exit code 0; a NonZeroExitCode failure carries the exit
 * code from details.causes[reason=ExitCode]. Unparseable input yields an
 * unsuccessful status with reason "InvalidStatus".
 */
ExecStatus parse_status(const std::string &document);
} // namespace kube_pod_copy::detail
