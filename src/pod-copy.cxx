#include <kube-pod-copy/detail/pump-group.hxx>
#include <kube-pod-copy/detail/session-source.hxx>
#include <kube-pod-copy/errors.hxx>
#include <kube-pod-copy/logging.hxx>
#include <kube-pod-copy/pod-copy.hxx>
#include <kube-pod-copy/tar-filter.hxx>
#include <kube-pod-copy/websocket-exec-channel.hxx>

#include <boost/iostreams/categories.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/stream.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

namespace kube_pod_copy {
namespace fs = std::filesystem;
namespace io = boost::iostreams;

namespace {
/**
 * @brief Open exec session whose stdout carries a single-file archive.
 *
 * Owns everything a RemoteFileSource needs: the session, the stderr pump,
 * the payload filter chain and the cancellation hooks.
 */
class RemoteFile {
public:
  RemoteFile(CopyTarget target, std::unique_ptr<ExecSession> session,
             const CopyOptions &options)
      : target_(std::move(target)), session_(std::move(session)),
        pumps_([this] { session_->cancel(); }), guard_(*session_, options) {
    pumps_.spawn("stderr", [this, limit = options.stderr_capture_limit] {
      remote_stderr_ = detail::drain_stream(
          *session_, detail::OutputStream::Stderr, limit);
    });

    payload_.push(TarFilter<>(
        static_cast<std::streamsize>(
            std::max<std::size_t>(options.chunk_size, 1)),
        TarFilterMode::SingleFile));
    payload_.push(detail::SessionStdoutSource(*session_));
  }

  ~RemoteFile() {
    guard_.disarm();
    if (!finished_)
      session_->cancel();
    pumps_.join();
  }

  std::streamsize read(char *s, std::streamsize n) {
    if (finished_)
      return -1;
    try {
      return read_payload(s, n);
    } catch (const ChannelError &) {
      guard_.check("reading " + target_.describe());
      throw;
    }
  }

private:
  std::streamsize read_payload(char *s, std::streamsize n) {
    std::exception_ptr truncated;
    try {
      // One underflow at a time, so a reader never waits for more than the
      // next decoded chunk.
      auto *buffer = payload_.rdbuf();
      if (buffer->sgetc() != std::char_traits<char>::eof())
        return buffer->sgetn(s, std::min(n, buffer->in_avail()));
    } catch (const DecodeError &e) {
      if (e.kind() != DecodeError::Kind::Truncated)
        throw;
      truncated = std::current_exception();
    }

    // End of payload: collect the rest of stdout and the exit status.
    detail::drain_stream(*session_, detail::OutputStream::Stdout, 0);
    pumps_.join();
    if (auto error = pumps_.first_error())
      std::rethrow_exception(error);
    auto status = session_->wait();
    finished_ = true;
    if (!status.success)
      throw detail::remote_failure(target_, status, remote_stderr_);
    if (truncated)
      std::rethrow_exception(truncated);
    BOOST_LOG_TRIVIAL(debug) << "finished reading " << target_.describe();
    return -1;
  }

  CopyTarget target_;
  std::unique_ptr<ExecSession> session_;
  detail::PumpGroup pumps_;
  std::string remote_stderr_;
  io::filtering_istream payload_;
  bool finished_ = false;
  detail::SessionGuard guard_;
};

/**
 * @brief Boost.Iostreams source over a shared RemoteFile.
 */
class RemoteFileSource {
public:
  using char_type = char;
  using category = io::source_tag;

  explicit RemoteFileSource(std::shared_ptr<RemoteFile> file)
      : file_(std::move(file)) {}

  std::streamsize read(char *s, std::streamsize n) { return file_->read(s, n); }

private:
  std::shared_ptr<RemoteFile> file_;
};
} // unnamed namespace

PodCopy::PodCopy(std::shared_ptr<ExecChannel> channel)
    : channel_(std::move(channel)) {
  if (!channel_)
    throw std::invalid_argument("PodCopy needs an exec channel");
  detail::ensure_default_log_filter();
}

PodCopy::PodCopy(ClusterConfig config)
    : channel_(std::make_shared<WebSocketExecChannel>(std::move(config))) {
  detail::ensure_default_log_filter();
}

void PodCopy::run(CopyPlan plan, const CopyOptions &options) {
  CopySession session(*channel_, std::move(plan), options);
  session.run();
}

void PodCopy::copy_file_to_pod(const CopyTarget &target,
                               const fs::path &local_file,
                               const CopyOptions &options) {
  BOOST_LOG_TRIVIAL(info) << "copying " << local_file.string() << " to "
                           << target.describe();
  run(plan_file_to_pod(target, local_file), options);
}

void PodCopy::copy_bytes_to_pod(const CopyTarget &target, std::string content,
                                const CopyOptions &options) {
  BOOST_LOG_TRIVIAL(info) << "writing " << content.size() << " bytes to "
                           << target.describe();
  run(plan_bytes_to_pod(target, std::move(content)), options);
}

void PodCopy::copy_directory_to_pod(const CopyTarget &target,
                                    const fs::path &local_directory,
                                    const CopyOptions &options) {
  BOOST_LOG_TRIVIAL(info) << "copying directory " << local_directory.string()
                           << " to " << target.describe();
  run(plan_directory_to_pod(target, local_directory), options);
}

std::unique_ptr<std::istream>
PodCopy::copy_file_from_pod(const CopyTarget &target,
                            const CopyOptions &options) {
  target.validate();
  if (target.file_name().empty())
    throw std::invalid_argument("remote path must name a file: " +
                                target.path);
  if (options.stop_token.stop_requested())
    throw CopyError(CopyError::Kind::Cancelled,
                    "copy cancelled before it started");

  BOOST_LOG_TRIVIAL(info) << "streaming " << target.describe();
  auto session =
      channel_->open(target,
                     pack_command(target.parent_path(), target.file_name()),
                     download_flags());
  auto file = std::make_shared<RemoteFile>(target, std::move(session), options);

  auto in = std::make_unique<io::stream<RemoteFileSource>>(
      RemoteFileSource(std::move(file)));
  in->exceptions(std::ios::badbit);
  return in;
}

void PodCopy::copy_file_from_pod(const CopyTarget &target,
                                 const fs::path &local_file,
                                 const CopyOptions &options) {
  BOOST_LOG_TRIVIAL(info) << "copying " << target.describe() << " to "
                           << local_file.string();
  run(plan_file_from_pod(target, local_file), options);
}

void PodCopy::copy_directory_from_pod(const CopyTarget &target,
                                      const fs::path &local_directory,
                                      const CopyOptions &options) {
  auto plan = plan_directory_from_pod(target, local_directory);

  auto started = std::chrono::steady_clock::now();
  auto report = probe(target, options);
  if (report.result != ProbeResult::Supported)
    throw CopyNotSupportedException(
        CopyNotSupportedException::Kind::IncompatibleRemoteTar,
        "tar in " + target.namespace_name + "/" + target.pod_name +
            " cannot be used for directory copies (exit " +
            std::to_string(report.status.exit_code) + ")");

  // The probe and the copy share one deadline.
  auto remaining = options;
  if (options.timeout.count() > 0) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    remaining.timeout =
        std::max(options.timeout - elapsed, std::chrono::milliseconds(1));
  }

  BOOST_LOG_TRIVIAL(info) << "copying directory " << target.describe()
                           << " to " << local_directory.string();
  run(std::move(plan), remaining);
}

ProbeReport PodCopy::probe(const CopyTarget &target,
                           const CopyOptions &options) {
  return CapabilityProbe(*channel_).run(target, options);
}
} // namespace kube_pod_copy
