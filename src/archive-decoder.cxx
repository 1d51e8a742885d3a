#include <kube-pod-copy/archive-decoder.hxx>
#include <kube-pod-copy/detail/tar-header.hxx>
#include <kube-pod-copy/errors.hxx>
#include <kube-pod-copy/logging.hxx>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <mutex>
#include <optional>
#include <set>
#include <system_error>

namespace kube_pod_copy {
namespace fs = std::filesystem;

namespace {
// Extension records (long names, pax headers) larger than this are refused.
constexpr std::uint64_t max_extension_size = 1 << 20;

/**
 * @brief Registry of destination files currently open for writing.
 *
 * Two copies must never write the same file at once; copies to different
 * files only contend for the registry itself.
 */
class DestinationClaims {
public:
  bool claim(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_.insert(path).second;
  }

  void release(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    paths_.erase(path);
  }

private:
  std::mutex mutex_;
  std::set<std::string> paths_;
};

DestinationClaims &destination_claims() {
  static DestinationClaims claims;
  return claims;
}

std::vector<std::string> split_components(const std::string &name) {
  std::vector<std::string> parts;
  std::size_t pos = 0;
  while (pos <= name.size()) {
    auto slash = name.find('/', pos);
    if (slash == std::string::npos)
      slash = name.size();
    parts.push_back(name.substr(pos, slash - pos));
    pos = slash + 1;
  }
  return parts;
}

/// Lexical normalization; std::nullopt when ".." climbs above the start.
std::optional<std::vector<std::string>> normalize(const std::string &name) {
  std::vector<std::string> out;
  for (auto &part : split_components(name)) {
    if (part.empty() || part == ".")
      continue;
    if (part == "..") {
      if (out.empty())
        return std::nullopt;
      out.pop_back();
      continue;
    }
    out.push_back(std::move(part));
  }
  return out;
}

bool is_within(const fs::path &root, const fs::path &candidate) {
  auto r = root.begin();
  auto c = candidate.begin();
  for (; r != root.end(); ++r, ++c) {
    if (c == candidate.end() || *r != *c)
      return false;
  }
  return true;
}

std::string join_components(const std::vector<std::string> &parts) {
  std::string out;
  for (const auto &part : parts) {
    if (!out.empty())
      out += '/';
    out += part;
  }
  return out;
}
} // unnamed namespace

namespace detail {
/**
 * @brief Parsing and materialization state of an ArchiveDecoder.
 *
 * Same block-driven state machine as the payload filter, except that payload
 * bytes go to files below the root instead of the output buffer.
 */
struct ArchiveDecoderState {
  enum class State {
    ReadHeader,
    ReadExtension,
    ReadFileData,
    SkipData,
    SkipPadding,
    Done
  };

  fs::path root;
  fs::path canonical_root;
  DecodeOptions options;
  std::vector<std::string> strip_components;

  State state = State::ReadHeader;
  char header[block_size];
  std::size_t header_bytes_read = 0;
  std::uint64_t bytes_seen = 0;

  char extension_type = 0;
  std::string extension;
  std::optional<std::string> pending_name;

  std::string current_name;
  std::string current_relative;
  fs::path current_path;
  std::ofstream file;
  bool file_claimed = false;
  std::uint32_t current_mode = 0;
  std::uint64_t data_left = 0;
  std::size_t padding_left = 0;

  std::vector<ArchiveEntry> entries;
  std::exception_ptr failure;

  ~ArchiveDecoderState() { close_file(); }

  void close_file() {
    if (file.is_open())
      file.close();
    if (file_claimed) {
      destination_claims().release(current_path.string());
      file_claimed = false;
    }
  }

  DecodeError error(DecodeError::Kind kind, const std::string &message) const {
    return DecodeError(kind, current_name, message);
  }

  fs::path resolve(const std::string &name) {
    auto parts = normalize(name);
    if (!parts)
      throw error(DecodeError::Kind::PathTraversal,
                  "entry escapes the destination directory");

    if (!strip_components.empty() && parts->size() >= strip_components.size() &&
        std::equal(strip_components.begin(), strip_components.end(),
                   parts->begin()))
      parts->erase(parts->begin(),
                   parts->begin() +
                       static_cast<std::ptrdiff_t>(strip_components.size()));

    current_relative = join_components(*parts);
    auto path = root;
    for (const auto &part : *parts)
      path /= part;

    std::error_code ec;
    auto parent = fs::weakly_canonical(path.parent_path(), ec);
    if (ec)
      throw error(DecodeError::Kind::LocalIOFailure, ec.message());
    if (!parts->empty() && !is_within(canonical_root, parent))
      throw error(DecodeError::Kind::PathTraversal,
                  "entry resolves outside the destination directory");
    if (!parts->empty() && fs::is_symlink(fs::symlink_status(path, ec)))
      throw error(DecodeError::Kind::PathTraversal,
                  "entry would be written through a symbolic link");
    return path;
  }

  void apply_mode(const fs::path &path, std::uint32_t mode) {
    if (!options.preserve_permissions)
      return;
    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(mode & 07777),
                    fs::perm_options::replace, ec);
    if (ec)
      throw error(DecodeError::Kind::LocalIOFailure,
                  "cannot set permissions: " + ec.message());
  }

  ArchiveEntry &record(EntryKind kind, std::uint64_t size,
                       std::uint32_t mode, std::int64_t mtime) {
    ArchiveEntry entry;
    entry.relative_path = current_relative;
    entry.kind = kind;
    entry.size = size;
    entry.mode = mode;
    entry.mtime = mtime;
    entries.push_back(std::move(entry));
    return entries.back();
  }

  void start_directory(std::uint32_t mode, std::int64_t mtime) {
    auto path = resolve(current_name);
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec)
      throw error(DecodeError::Kind::LocalIOFailure,
                  "cannot create directory: " + ec.message());
    // Keep the owner able to populate the directory.
    apply_mode(path, mode | 0700);
    record(EntryKind::Directory, 0, mode, mtime);
  }

  void start_file(std::uint64_t size, std::uint32_t mode, std::int64_t mtime) {
    auto path = resolve(current_name);
    if (path == root)
      throw error(DecodeError::Kind::MalformedHeader,
                  "regular file entry without a name");

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec)
      throw error(DecodeError::Kind::LocalIOFailure,
                  "cannot create parent directory: " + ec.message());

    if (!destination_claims().claim(path.string()))
      throw error(DecodeError::Kind::LocalIOFailure,
                  "file is being written by another copy");
    current_path = path;
    file_claimed = true;

    file.open(path, std::ios::binary | std::ios::trunc);
    if (!file)
      throw error(DecodeError::Kind::LocalIOFailure,
                  "cannot open for writing: " + std::string(std::strerror(errno)));

    current_mode = mode;
    data_left = size;
    record(EntryKind::RegularFile, size, mode, mtime);
    if (data_left == 0)
      complete_file();
  }

  void complete_file() {
    file.close();
    if (file.fail())
      throw error(DecodeError::Kind::LocalIOFailure, "cannot close file");
    apply_mode(current_path, current_mode);
    close_file();
  }

  void on_header() {
    if (is_zero_block(header)) {
      state = State::Done;
      return;
    }

    auto tar = reinterpret_cast<const TarHeader *>(header);
    current_name = pending_name ? *pending_name : entry_name(*tar);
    pending_name.reset();

    if (!checksum_matches(*tar))
      throw error(DecodeError::Kind::MalformedHeader, "header checksum mismatch");
    auto size = parse_numeric(tar->size, sizeof(tar->size));
    if (!size)
      throw error(DecodeError::Kind::MalformedHeader, "invalid entry size");
    auto mode = static_cast<std::uint32_t>(
        parse_numeric(tar->mode, sizeof(tar->mode)).value_or(0644));
    auto mtime = static_cast<std::int64_t>(
        parse_numeric(tar->mtime, sizeof(tar->mtime)).value_or(0));

    padding_left = padding_for(*size);
    data_left = *size;

    switch (tar->typeflag[0]) {
    case type_gnu_long_name:
    case type_pax_header:
      if (*size > max_extension_size)
        throw error(DecodeError::Kind::MalformedHeader,
                    "extension record too large");
      extension_type = tar->typeflag[0];
      extension.clear();
      state = *size > 0 ? State::ReadExtension : State::SkipPadding;
      break;

    case type_pax_global:
    case type_gnu_long_link:
      state = *size > 0 ? State::SkipData : State::SkipPadding;
      break;

    case type_directory:
    case 'D': // GNU dumpdir: directory followed by a listing
      start_directory(mode, mtime);
      state = *size > 0 ? State::SkipData : State::SkipPadding;
      break;

    case type_regular:
    case type_regular_old:
    case type_contiguous:
      start_file(*size, mode, mtime);
      state = data_left > 0 ? State::ReadFileData : State::SkipPadding;
      break;

    case type_symlink:
    case type_hard_link:
      throw error(DecodeError::Kind::UnsupportedEntry,
                  "links are not supported");

    default:
      throw error(DecodeError::Kind::UnsupportedEntry,
                  std::string("unsupported entry type '") + tar->typeflag[0] +
                      "'");
    }
  }

  void on_extension_complete() {
    if (extension_type == type_gnu_long_name) {
      pending_name = field_string(extension.data(), extension.size());
    } else if (auto path = pax_path(extension)) {
      pending_name = *path;
    }
  }

  void write(const char *src, std::size_t n) {
    bytes_seen += n;
    const char *end = src + n;
    while (src < end) {
      auto available = static_cast<std::size_t>(end - src);
      switch (state) {
      case State::ReadHeader: {
        auto count = std::min(block_size - header_bytes_read, available);
        std::memcpy(header + header_bytes_read, src, count);
        src += count;
        header_bytes_read += count;
        if (header_bytes_read == block_size) {
          header_bytes_read = 0;
          on_header();
        }
        break;
      }

      case State::ReadExtension: {
        auto count = static_cast<std::size_t>(
            std::min<std::uint64_t>(data_left, available));
        extension.append(src, count);
        src += count;
        data_left -= count;
        if (data_left == 0) {
          on_extension_complete();
          state = State::SkipPadding;
        }
        break;
      }

      case State::ReadFileData: {
        auto count = static_cast<std::size_t>(
            std::min<std::uint64_t>(data_left, available));
        file.write(src, static_cast<std::streamsize>(count));
        if (!file)
          throw error(DecodeError::Kind::LocalIOFailure, "write failed");
        src += count;
        data_left -= count;
        if (data_left == 0) {
          complete_file();
          state = State::SkipPadding;
        }
        break;
      }

      case State::SkipData: {
        auto count = static_cast<std::size_t>(
            std::min<std::uint64_t>(data_left, available));
        src += count;
        data_left -= count;
        if (data_left == 0)
          state = State::SkipPadding;
        break;
      }

      case State::SkipPadding: {
        auto count = std::min(padding_left, available);
        src += count;
        padding_left -= count;
        break;
      }

      case State::Done:
        return;
      }

      if (state == State::SkipPadding && padding_left == 0)
        state = State::ReadHeader;
    }
  }

  void finish() {
    switch (state) {
    case State::Done:
      return;
    case State::ReadHeader:
      if (header_bytes_read == 0 && !entries.empty()) {
        BOOST_LOG_TRIVIAL(warning)
            << "archive ended without an end-of-archive marker";
        return;
      }
      current_name.clear();
      throw error(DecodeError::Kind::Truncated,
                  bytes_seen == 0 ? "empty archive stream"
                                  : "archive ended inside a header");
    case State::SkipPadding:
      return;
    case State::ReadExtension:
    case State::ReadFileData:
    case State::SkipData:
      break;
    }
    close_file();
    throw error(DecodeError::Kind::Truncated,
                "archive ended with " + std::to_string(data_left) +
                    " payload bytes missing");
  }
};
} // namespace detail

ArchiveDecoder::ArchiveDecoder(const fs::path &destination_root,
                               DecodeOptions options)
    : state_(std::make_shared<detail::ArchiveDecoderState>()) {
  std::error_code ec;
  fs::create_directories(destination_root, ec);
  if (ec)
    throw DecodeError(DecodeError::Kind::LocalIOFailure,
                      destination_root.string(),
                      "cannot create destination: " + ec.message());
  auto canonical = fs::canonical(destination_root, ec);
  if (ec)
    throw DecodeError(DecodeError::Kind::LocalIOFailure,
                      destination_root.string(), ec.message());

  state_->root = destination_root;
  state_->canonical_root = canonical;
  if (auto strip = normalize(options.strip_prefix))
    state_->strip_components = *strip;
  state_->options = std::move(options);
}

std::streamsize ArchiveDecoder::write(const char *s, std::streamsize n) {
  if (state_->failure)
    std::rethrow_exception(state_->failure);
  try {
    state_->write(s, static_cast<std::size_t>(n));
  } catch (const DecodeError &) {
    state_->failure = std::current_exception();
    state_->close_file();
    throw;
  }
  return n;
}

void ArchiveDecoder::finish() {
  if (state_->failure)
    std::rethrow_exception(state_->failure);
  state_->finish();
}

bool ArchiveDecoder::done() const {
  return state_->state == detail::ArchiveDecoderState::State::Done;
}

const std::vector<ArchiveEntry> &ArchiveDecoder::entries() const {
  return state_->entries;
}

const fs::path &ArchiveDecoder::destination_root() const {
  return state_->root;
}
} // namespace kube_pod_copy
