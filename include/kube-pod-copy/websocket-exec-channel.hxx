/**
 * @file websocket-exec-channel.hxx
 * @brief ExecChannel over the API server's WebSocket exec endpoint.
 */

#pragma once

#include <kube-pod-copy/cluster-config.hxx>
#include <kube-pod-copy/exec-channel.hxx>

#include <memory>

namespace kube_pod_copy {
/**
 * @brief Opens exec sessions with `GET .../pods/{pod}/exec` upgraded to a
 * WebSocket speaking the Kubernetes channel protocol.
 *
 * `v5.channel.k8s.io` is preferred because it can half-close stdin;
 * `v4.channel.k8s.io` is accepted as a fallback. Each session owns one
 * connection and one I/O thread running Boost.Asio; stdout and stderr are
 * buffered in bounded pipes so a slow consumer throttles the connection
 * instead of growing memory.
 *
 * A channel may be shared by concurrent copies: sessions never share state.
 */
class WebSocketExecChannel : public ExecChannel {
public:
  /**
   * @throws ConfigError when the TLS trust settings cannot be loaded.
   */
  explicit WebSocketExecChannel(ClusterConfig config);
  ~WebSocketExecChannel() override;

  std::unique_ptr<ExecSession> open(const CopyTarget &target,
                                    const std::vector<std::string> &command,
                                    const ExecStreamFlags &flags) override;

  const ClusterConfig &config() const noexcept { return config_; }

private:
  struct TlsContext;

  ClusterConfig config_;
  std::unique_ptr<TlsContext> tls_;
};
} // namespace kube_pod_copy
