#include <kube-pod-copy/detail/byte-pipe.hxx>
#include <kube-pod-copy/detail/channel-protocol.hxx>
#include <kube-pod-copy/errors.hxx>
#include <kube-pod-copy/logging.hxx>
#include <kube-pod-copy/websocket-exec-channel.hxx>

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <type_traits>

namespace kube_pod_copy {
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

struct WebSocketExecChannel::TlsContext {
  ssl::context context{ssl::context::tls_client};
};

namespace {
template <class T> struct is_tls_layer : std::false_type {};
template <class T>
struct is_tls_layer<beast::ssl_stream<T>> : std::true_type {};

std::exception_ptr aborted_error() {
  return std::make_exception_ptr(
      ChannelError(ChannelError::Kind::Aborted, "session cancelled"));
}

/**
 * @brief ExecSession over one WebSocket connection.
 *
 * A dedicated thread runs the io_context. It keeps one async_read outstanding
 * and routes each message by its channel byte: stdout/stderr payloads go to
 * bounded pipes, the status document is accumulated until the connection
 * ends. Callers write stdin by posting an async_write and blocking on its
 * completion, so at most one read and one write are in flight at any time.
 */
template <class NextLayer>
class WebSocketExecSession final : public ExecSession {
public:
  using ws_type = websocket::stream<NextLayer>;

  WebSocketExecSession(std::unique_ptr<net::io_context> ioc,
                       std::unique_ptr<ws_type> ws, ExecStreamFlags flags,
                       bool close_signal, std::string description)
      : ioc_(std::move(ioc)), ws_(std::move(ws)),
        work_(net::make_work_guard(*ioc_)), flags_(flags),
        close_signal_(close_signal), description_(std::move(description)) {
    net::post(*ioc_, [this] { do_read(); });
    thread_ = std::thread([this] { run(); });
  }

  ~WebSocketExecSession() override {
    if (!finished())
      cancel();
    work_.reset();
    if (thread_.joinable())
      thread_.join();
  }

  void write_stdin(const char *data, std::size_t n) override {
    if (!flags_.want_stdin)
      throw std::logic_error("stdin was not requested for this session");
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_closed_)
      throw std::logic_error("stdin is already closed");
    send(detail::make_frame(detail::StreamChannel::Stdin,
                            std::string_view(data, n)));
  }

  void close_stdin() override {
    if (!flags_.want_stdin)
      throw std::logic_error("stdin was not requested for this session");
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_closed_)
      return;
    stdin_closed_ = true;
    if (!close_signal_) {
      BOOST_LOG_TRIVIAL(debug)
          << description_ << ": v4 protocol, stdin ends with the archive";
      return;
    }
    if (finished()) {
      BOOST_LOG_TRIVIAL(debug)
          << description_ << ": remote command already exited";
      return;
    }
    const char stream_id = static_cast<char>(detail::StreamChannel::Stdin);
    send(detail::make_frame(detail::StreamChannel::Close,
                            std::string_view(&stream_id, 1)));
  }

  std::streamsize read_stdout(char *s, std::streamsize n) override {
    if (!flags_.want_stdout)
      throw std::logic_error("stdout was not requested for this session");
    return stdout_pipe_.read(s, n);
  }

  std::streamsize read_stderr(char *s, std::streamsize n) override {
    if (!flags_.want_stderr)
      throw std::logic_error("stderr was not requested for this session");
    return stderr_pipe_.read(s, n);
  }

  ExecStatus wait() override {
    std::unique_lock<std::mutex> lock(status_mutex_);
    finished_cv_.wait(lock, [this] { return finished_; });
    if (final_error_)
      std::rethrow_exception(final_error_);
    return final_status_;
  }

  void cancel() noexcept override {
    if (cancelled_.exchange(true))
      return;
    BOOST_LOG_TRIVIAL(debug) << description_ << ": cancelling exec session";
    auto error = aborted_error();
    stdout_pipe_.fail(error);
    stderr_pipe_.fail(error);
    net::post(*ioc_, [this] {
      beast::error_code ec;
      beast::get_lowest_layer(*ws_).socket().close(ec);
      if (ec)
        BOOST_LOG_TRIVIAL(debug)
            << description_ << ": closing socket: " << ec.message();
    });
  }

  const ExecStreamFlags &flags() const noexcept override { return flags_; }

private:
  bool finished() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return finished_;
  }

  void run() {
    try {
      ioc_->run();
    } catch (const std::exception &e) {
      BOOST_LOG_TRIVIAL(error)
          << description_ << ": exec I/O loop failed: " << e.what();
      finish({}, std::make_exception_ptr(ChannelError(
                     ChannelError::Kind::ConnectionFailed, e.what())));
    }
  }

  void do_read() {
    ws_->async_read(read_buffer_,
                    [this](beast::error_code ec, std::size_t) { on_read(ec); });
  }

  void on_read(beast::error_code ec) {
    if (ec) {
      on_read_end(ec);
      return;
    }

    auto data = read_buffer_.data();
    std::string_view message(static_cast<const char *>(data.data()),
                             data.size());
    try {
      dispatch(message);
    } catch (const ChannelError &) {
      // A pipe was failed by cancel(); stop reading.
      read_buffer_.consume(read_buffer_.size());
      on_read_end(net::error::operation_aborted);
      return;
    }
    read_buffer_.consume(read_buffer_.size());
    do_read();
  }

  void dispatch(std::string_view message) {
    if (message.empty())
      return;
    auto channel = static_cast<detail::StreamChannel>(
        static_cast<unsigned char>(message.front()));
    auto payload = message.substr(1);

    switch (channel) {
    case detail::StreamChannel::Stdout:
      if (flags_.want_stdout)
        stdout_pipe_.write(payload.data(), payload.size());
      else
        BOOST_LOG_TRIVIAL(warning)
            << description_ << ": dropping data on unrequested stdout";
      break;
    case detail::StreamChannel::Stderr:
      if (flags_.want_stderr)
        stderr_pipe_.write(payload.data(), payload.size());
      else
        BOOST_LOG_TRIVIAL(warning)
            << description_ << ": dropping data on unrequested stderr";
      break;
    case detail::StreamChannel::Error:
      status_document_.append(payload);
      break;
    default:
      BOOST_LOG_TRIVIAL(debug)
          << description_ << ": ignoring message on channel "
          << static_cast<int>(static_cast<unsigned char>(message.front()));
      break;
    }
  }

  void on_read_end(beast::error_code ec) {
    ExecStatus status;
    std::exception_ptr error;

    if (!status_document_.empty()) {
      status = detail::parse_status(status_document_);
    } else if (cancelled_) {
      error = aborted_error();
    } else if (ec == websocket::error::closed) {
      status.reason = "StatusMissing";
      status.message = "connection closed without an exit status";
    } else {
      error = std::make_exception_ptr(
          ChannelError(ChannelError::Kind::ConnectionFailed, ec.message()));
    }

    if (error) {
      stdout_pipe_.fail(error);
      stderr_pipe_.fail(error);
    } else {
      stdout_pipe_.close();
      stderr_pipe_.close();
    }
    finish(std::move(status), error);
  }

  void finish(ExecStatus status, std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (finished_)
      return;
    finished_ = true;
    final_status_ = std::move(status);
    final_error_ = error;
    BOOST_LOG_TRIVIAL(debug)
        << description_ << ": exec session ended, "
        << (error ? "with error"
                  : final_status_.reason + " exit " +
                        std::to_string(final_status_.exit_code));
    finished_cv_.notify_all();
  }

  void send(const std::string &frame) {
    if (cancelled_)
      std::rethrow_exception(aborted_error());

    std::promise<beast::error_code> promise;
    auto done = promise.get_future();
    net::post(*ioc_, [this, &frame, &promise] {
      ws_->async_write(net::buffer(frame),
                       [&promise](beast::error_code ec, std::size_t) {
                         promise.set_value(ec);
                       });
    });

    auto ec = done.get();
    if (!ec)
      return;
    if (cancelled_)
      std::rethrow_exception(aborted_error());
    throw ChannelError(ChannelError::Kind::ConnectionFailed,
                       "writing stdin: " + ec.message());
  }

  std::unique_ptr<net::io_context> ioc_;
  std::unique_ptr<ws_type> ws_;
  net::executor_work_guard<net::io_context::executor_type> work_;
  std::thread thread_;

  const ExecStreamFlags flags_;
  const bool close_signal_;
  const std::string description_;
  std::atomic<bool> cancelled_{false};

  beast::flat_buffer read_buffer_;
  detail::BytePipe stdout_pipe_;
  detail::BytePipe stderr_pipe_;
  std::string status_document_;

  std::mutex write_mutex_;
  bool stdin_closed_ = false;

  mutable std::mutex status_mutex_;
  std::condition_variable finished_cv_;
  bool finished_ = false;
  ExecStatus final_status_;
  std::exception_ptr final_error_;
};

/**
 * @brief Connect, optionally negotiate TLS, and perform the exec upgrade.
 *
 * The handshake runs asynchronously on the new session's io_context, driven
 * from the calling thread, so that the connect timeout applies to every
 * step. The io_context is then handed to the session.
 */
template <class NextLayer>
std::unique_ptr<ExecSession>
connect_session(const ClusterConfig &config, ssl::context *tls,
                const std::string &request_target,
                const ExecStreamFlags &flags, const std::string &description) {
  using ws_type = websocket::stream<NextLayer>;

  auto ioc = std::make_unique<net::io_context>(1);
  std::unique_ptr<ws_type> ws;
  if constexpr (is_tls_layer<NextLayer>::value)
    ws = std::make_unique<ws_type>(*ioc, *tls);
  else
    ws = std::make_unique<ws_type>(*ioc);

  tcp::resolver resolver(*ioc);
  beast::error_code ec;
  auto endpoints = resolver.resolve(config.host, std::to_string(config.port), ec);
  if (ec)
    throw ChannelError(ChannelError::Kind::ConnectionFailed,
                       "resolving " + config.host + ": " + ec.message());

  if constexpr (is_tls_layer<NextLayer>::value) {
    if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(),
                                  config.host.c_str()))
      throw ChannelError(ChannelError::Kind::ConnectionFailed,
                         "cannot set TLS server name " + config.host);
    if (!config.insecure_skip_tls_verify)
      ws->next_layer().set_verify_callback(
          ssl::host_name_verification(config.host));
  }

  auto token = config.bearer_token;
  auto user_agent = config.user_agent;
  ws->set_option(websocket::stream_base::decorator(
      [token, user_agent](websocket::request_type &req) {
        req.set(http::field::user_agent, user_agent);
        if (!token.empty())
          req.set(http::field::authorization, "Bearer " + token);
        req.set(http::field::sec_websocket_protocol,
                std::string(detail::protocol_v5) + ", " + detail::protocol_v4);
      }));

  websocket::stream_base::timeout timeouts =
      websocket::stream_base::timeout::suggested(beast::role_type::client);
  timeouts.handshake_timeout = config.connect_timeout;
  ws->set_option(timeouts);

  auto host_header = config.host + ":" + std::to_string(config.port);
  websocket::response_type response;
  beast::error_code result;
  const char *stage = "connect";

  std::function<void()> upgrade = [&] {
    stage = "exec upgrade";
    beast::get_lowest_layer(*ws).expires_never();
    ws->async_handshake(response, host_header, request_target,
                        [&](beast::error_code handshake_ec) {
                          result = handshake_ec;
                        });
  };

  beast::get_lowest_layer(*ws).expires_after(config.connect_timeout);
  beast::get_lowest_layer(*ws).async_connect(
      endpoints,
      [&](beast::error_code connect_ec, const tcp::endpoint &) {
        if (connect_ec) {
          result = connect_ec;
          return;
        }
        if constexpr (is_tls_layer<NextLayer>::value) {
          stage = "TLS handshake";
          ws->next_layer().async_handshake(
              ssl::stream_base::client, [&](beast::error_code tls_ec) {
                if (tls_ec) {
                  result = tls_ec;
                  return;
                }
                upgrade();
              });
        } else {
          upgrade();
        }
      });

  ioc->run();
  ioc->restart();

  if (result == websocket::error::upgrade_declined)
    throw ChannelError(ChannelError::Kind::NotFound,
                       "API server refused the exec request for " +
                           description);
  if (result)
    throw ChannelError(ChannelError::Kind::ConnectionFailed,
                       std::string(stage) + " to " + config.server() +
                           " failed: " + result.message());

  auto negotiated = response[http::field::sec_websocket_protocol];
  std::string protocol(negotiated.data(), negotiated.size());
  bool close_signal = protocol == detail::protocol_v5;
  BOOST_LOG_TRIVIAL(debug) << description << ": exec session open, protocol "
                            << (protocol.empty() ? "(none)" : protocol);

  ws->binary(true);
  return std::make_unique<WebSocketExecSession<NextLayer>>(
      std::move(ioc), std::move(ws), flags, close_signal, description);
}
} // unnamed namespace

WebSocketExecChannel::WebSocketExecChannel(ClusterConfig config)
    : config_(std::move(config)) {
  if (!config_.use_tls)
    return;

  tls_ = std::make_unique<TlsContext>();
  try {
    if (config_.insecure_skip_tls_verify) {
      tls_->context.set_verify_mode(ssl::verify_none);
      BOOST_LOG_TRIVIAL(warning)
          << "TLS certificate verification is disabled for "
          << config_.server();
    } else {
      tls_->context.set_verify_mode(ssl::verify_peer);
      if (config_.ca_file.empty())
        tls_->context.set_default_verify_paths();
      else
        tls_->context.load_verify_file(config_.ca_file.string());
    }
  } catch (const boost::system::system_error &e) {
    throw ConfigError("cannot load TLS trust settings: " +
                      std::string(e.what()));
  }
}

WebSocketExecChannel::~WebSocketExecChannel() = default;

std::unique_ptr<ExecSession>
WebSocketExecChannel::open(const CopyTarget &target,
                           const std::vector<std::string> &command,
                           const ExecStreamFlags &flags) {
  if (target.namespace_name.empty() || target.pod_name.empty())
    throw std::invalid_argument("exec target needs a namespace and a pod");

  auto request_target =
      detail::exec_request_target(config_.base_path, target, command, flags);
  auto description = target.namespace_name + "/" + target.pod_name;
  BOOST_LOG_TRIVIAL(debug) << "opening exec session " << request_target;

  if (config_.use_tls)
    return connect_session<beast::ssl_stream<beast::tcp_stream>>(
        config_, &tls_->context, request_target, flags, description);
  return connect_session<beast::tcp_stream>(config_, nullptr, request_target,
                                            flags, description);
}
} // namespace kube_pod_copy
