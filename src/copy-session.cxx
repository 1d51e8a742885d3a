#include <kube-pod-copy/archive-decoder.hxx>
#include <kube-pod-copy/copy-session.hxx>
#include <kube-pod-copy/detail/pump-group.hxx>
#include <kube-pod-copy/detail/session-source.hxx>
#include <kube-pod-copy/errors.hxx>
#include <kube-pod-copy/logging.hxx>
#include <kube-pod-copy/tar-filter.hxx>

#include <boost/iostreams/filtering_stream.hpp>

#include <fstream>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

namespace kube_pod_copy {
namespace fs = std::filesystem;
namespace io = boost::iostreams;

namespace {
bool is_plain_word(const std::string &value) {
  if (value.empty())
    return false;
  for (unsigned char c : value) {
    bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
              (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '/' ||
              c == '-';
    if (!ok)
      return false;
  }
  return true;
}

} // unnamed namespace

const char *to_string(SessionState state) noexcept {
  switch (state) {
  case SessionState::Idle:
    return "idle";
  case SessionState::ChannelOpening:
    return "channel-opening";
  case SessionState::Streaming:
    return "streaming";
  case SessionState::Draining:
    return "draining";
  case SessionState::Closed:
    return "closed";
  case SessionState::Failed:
    return "failed";
  }
  return "unknown";
}

std::string shell_quote(const std::string &value) {
  if (is_plain_word(value))
    return value;
  std::string out = "'";
  for (char c : value) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

std::vector<std::string> unpack_command() {
  return {"sh", "-c", "tar -xmf - -C /"};
}

std::vector<std::string> pack_command(const std::string &directory,
                                      const std::string &name) {
  return {"sh", "-c",
          "tar -cf - -C " + shell_quote(directory) + " " + shell_quote(name)};
}

ExecStreamFlags upload_flags() {
  return ExecStreamFlags{.want_stdin = true,
                         .want_stdout = true,
                         .want_stderr = true,
                         .tty = false};
}

ExecStreamFlags download_flags() {
  return ExecStreamFlags{.want_stdin = false,
                         .want_stdout = true,
                         .want_stderr = true,
                         .tty = false};
}

CopyPlan plan_file_to_pod(const CopyTarget &target,
                          const fs::path &local_file) {
  target.validate();
  if (target.file_name().empty())
    throw std::invalid_argument("remote path must name a file: " +
                                target.path);
  return CopyPlan{
      .direction = Direction::ToPod,
      .mode = CopyMode::File,
      .remote = target,
      .command = unpack_command(),
      .flags = upload_flags(),
      .payload = UploadArchive{
          ArchiveEncoder(std::vector{file_entry(local_file, target.path)})}};
}

CopyPlan plan_bytes_to_pod(const CopyTarget &target, std::string content) {
  target.validate();
  if (target.file_name().empty())
    throw std::invalid_argument("remote path must name a file: " +
                                target.path);
  return CopyPlan{
      .direction = Direction::ToPod,
      .mode = CopyMode::File,
      .remote = target,
      .command = unpack_command(),
      .flags = upload_flags(),
      .payload = UploadArchive{ArchiveEncoder(
          std::vector{bytes_entry(target.path, std::move(content))})}};
}

CopyPlan plan_directory_to_pod(const CopyTarget &target,
                               const fs::path &local_directory) {
  target.validate();
  std::error_code ec;
  if (!fs::is_directory(fs::symlink_status(local_directory, ec)))
    throw EncodeError(EncodeError::Kind::UnsupportedEntry,
                      local_directory.string(), "not a directory");
  return CopyPlan{.direction = Direction::ToPod,
                  .mode = CopyMode::Directory,
                  .remote = target,
                  .command = unpack_command(),
                  .flags = upload_flags(),
                  .payload = UploadArchive{
                      ArchiveEncoder(local_directory, target.path)}};
}

CopyPlan plan_file_from_pod(const CopyTarget &target,
                            const fs::path &local_file) {
  target.validate();
  if (target.file_name().empty())
    throw std::invalid_argument("remote path must name a file: " +
                                target.path);
  return CopyPlan{
      .direction = Direction::FromPod,
      .mode = CopyMode::File,
      .remote = target,
      .command = pack_command(target.parent_path(), target.file_name()),
      .flags = download_flags(),
      .payload = ExtractFileTo{local_file}};
}

CopyPlan plan_directory_from_pod(const CopyTarget &target,
                                 const fs::path &local_directory) {
  target.validate();
  return CopyPlan{.direction = Direction::FromPod,
                  .mode = CopyMode::Directory,
                  .remote = target,
                  .command = pack_command(target.path, "."),
                  .flags = download_flags(),
                  .payload = ExtractToDirectory{local_directory, ""}};
}

CopySession::CopySession(ExecChannel &channel, CopyPlan plan,
                         CopyOptions options)
    : channel_(channel), plan_(std::move(plan)), options_(std::move(options)) {
  if (options_.chunk_size == 0)
    options_.chunk_size = 1;
}

void CopySession::transition(SessionState next) {
  auto previous = state_.exchange(next);
  BOOST_LOG_TRIVIAL(debug) << "copy " << plan_.remote.describe() << ": "
                            << to_string(previous) << " -> " << to_string(next);
}

void CopySession::run() {
  if (state_ != SessionState::Idle)
    throw std::logic_error("a copy session runs only once");

  try {
    if (options_.stop_token.stop_requested())
      throw CopyError(CopyError::Kind::Cancelled,
                      "copy cancelled before it started");

    transition(SessionState::ChannelOpening);
    auto session = channel_.open(plan_.remote, plan_.command, plan_.flags);

    transition(SessionState::Streaming);
    detail::SessionGuard guard(*session, options_);
    execute(*session, guard);
  } catch (...) {
    transition(SessionState::Failed);
    throw;
  }
  transition(SessionState::Closed);
}

/**
 * @brief Streaming and draining phases for one open session.
 *
 * Pumps are chosen by the payload. Once they are joined the remote exit
 * status is collected; a remote failure takes precedence over the local
 * errors it caused (a broken stdin pipe, a truncated archive).
 */
void CopySession::execute(ExecSession &session,
                          const detail::SessionGuard &guard) {
  const auto chunk = options_.chunk_size;
  std::string remote_stdout;
  std::optional<ArchiveDecoder> decoder;
  if (auto *extract = std::get_if<ExtractToDirectory>(&plan_.payload))
    decoder.emplace(extract->root,
                    DecodeOptions{.strip_prefix = extract->strip_prefix});

  detail::PumpGroup pumps([&session] { session.cancel(); });

  pumps.spawn("stderr", [&] {
    remote_stderr_ = detail::drain_stream(
        session, detail::OutputStream::Stderr, options_.stderr_capture_limit,
        chunk);
  });

  std::visit(
      [&](auto &payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, UploadArchive>) {
          pumps.spawn("stdin", [&] {
            std::vector<char> buffer(chunk);
            for (;;) {
              auto n = payload.encoder.read(
                  buffer.data(), static_cast<std::streamsize>(buffer.size()));
              if (n < 0)
                break;
              session.write_stdin(buffer.data(), static_cast<std::size_t>(n));
            }
            session.close_stdin();
            BOOST_LOG_TRIVIAL(debug)
                << "sent " << payload.encoder.bytes_produced()
                << " archive bytes in " << payload.encoder.entries().size()
                << " entries";
          });
          pumps.spawn("stdout", [&] {
            remote_stdout = detail::drain_stream(
                session, detail::OutputStream::Stdout, 4096, chunk);
          });
        } else if constexpr (std::is_same_v<T, ExtractToDirectory>) {
          pumps.spawn("stdout", [&] {
            std::vector<char> buffer(chunk);
            for (;;) {
              auto n = session.read_stdout(
                  buffer.data(), static_cast<std::streamsize>(buffer.size()));
              if (n < 0)
                break;
              decoder->write(buffer.data(), n);
            }
          });
        } else {
          pumps.spawn("stdout", [&] {
            io::filtering_istream in;
            in.push(TarFilter<>(static_cast<std::streamsize>(chunk),
                                TarFilterMode::SingleFile));
            in.push(detail::SessionStdoutSource(session));
            in.exceptions(std::ios::badbit);

            std::ofstream out;
            auto open_output = [&] {
              if (out.is_open())
                return;
              out.open(payload.local_file, std::ios::binary | std::ios::trunc);
              if (!out)
                throw DecodeError(DecodeError::Kind::LocalIOFailure,
                                  payload.local_file.string(),
                                  "cannot open for writing");
            };

            std::vector<char> buffer(chunk);
            try {
              while (in.read(buffer.data(),
                             static_cast<std::streamsize>(buffer.size())),
                     in.gcount() > 0) {
                open_output();
                out.write(buffer.data(), in.gcount());
                if (!out)
                  throw DecodeError(DecodeError::Kind::LocalIOFailure,
                                    payload.local_file.string(),
                                    "write failed");
              }
              open_output();
            } catch (const DecodeError &e) {
              if (e.kind() != DecodeError::Kind::Truncated)
                throw;
              deferred_error_ = std::current_exception();
            }
            out.close();
            if (out.fail())
              throw DecodeError(DecodeError::Kind::LocalIOFailure,
                                payload.local_file.string(),
                                "cannot close file");

            // The filter stops at the end-of-archive marker; the record
            // padding behind it is still in flight.
            detail::drain_stream(session, detail::OutputStream::Stdout, 0,
                                 chunk);
          });
        }
      },
      plan_.payload);

  pumps.join();
  auto pump_error = pumps.first_error();

  transition(SessionState::Draining);
  const auto what = "copy " + plan_.remote.describe();
  guard.check(what);

  ExecStatus status;
  try {
    status = session.wait();
  } catch (const ChannelError &) {
    // The deadline may pass while waiting for the exit status.
    guard.check(what);
    if (pump_error)
      std::rethrow_exception(pump_error);
    throw;
  }

  if (!status.success)
    throw detail::remote_failure(plan_.remote, status, remote_stderr_);
  if (pump_error)
    std::rethrow_exception(pump_error);
  if (deferred_error_)
    std::rethrow_exception(deferred_error_);
  if (decoder) {
    decoder->finish();
    BOOST_LOG_TRIVIAL(debug) << "extracted " << decoder->entries().size()
                              << " entries into "
                              << decoder->destination_root().string();
  }
  if (!remote_stdout.empty())
    BOOST_LOG_TRIVIAL(debug) << "remote stdout: " << remote_stdout;
}
} // namespace kube_pod_copy
