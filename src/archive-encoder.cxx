#include <kube-pod-copy/archive-encoder.hxx>
#include <kube-pod-copy/detail/tar-header.hxx>
#include <kube-pod-copy/errors.hxx>
#include <kube-pod-copy/logging.hxx>

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <system_error>

namespace kube_pod_copy {
namespace fs = std::filesystem;

namespace {
// Archives are padded to whole records the way tar writes them (blocking
// factor 20), so a reader filling full records never waits for more input.
constexpr std::uint64_t record_size = 20 * detail::block_size;

EncodeError io_failure(const fs::path &path, const std::string &what) {
  return EncodeError(EncodeError::Kind::LocalIOFailure, path.string(), what);
}

/**
 * @brief Stat a path without following symlinks and describe it as an entry.
 *
 * Only regular files and directories are accepted.
 */
ArchiveEntry describe(const fs::path &path, const std::string &entry_name) {
  struct stat st;
  if (::lstat(path.c_str(), &st) != 0)
    throw io_failure(path, std::strerror(errno));

  ArchiveEntry entry;
  entry.relative_path = entry_name;
  entry.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
  entry.mtime = static_cast<std::int64_t>(st.st_mtime);

  if (S_ISREG(st.st_mode)) {
    entry.kind = EntryKind::RegularFile;
    entry.size = static_cast<std::uint64_t>(st.st_size);
    entry.source = path;
  } else if (S_ISDIR(st.st_mode)) {
    entry.kind = EntryKind::Directory;
  } else {
    throw EncodeError(EncodeError::Kind::UnsupportedEntry, path.string(),
                      S_ISLNK(st.st_mode)
                          ? "symbolic links are not supported"
                          : "special files are not supported");
  }
  return entry;
}
} // unnamed namespace

std::string join_entry_path(const std::string &prefix,
                            const std::string &name) {
  auto begin = prefix.find_first_not_of('/');
  auto end = prefix.find_last_not_of('/');
  std::string head =
      begin == std::string::npos ? "" : prefix.substr(begin, end - begin + 1);
  auto tail = name;
  while (!tail.empty() && tail.front() == '/')
    tail.erase(0, 1);
  if (head.empty())
    return tail;
  if (tail.empty())
    return head;
  return head + "/" + tail;
}

std::vector<ArchiveEntry> collect_entries(const fs::path &local,
                                          const std::string &prefix) {
  auto root = describe(local, "");
  if (root.kind == EntryKind::RegularFile) {
    root.relative_path = join_entry_path(prefix, local.filename().string());
    return {root};
  }

  std::vector<ArchiveEntry> entries;
  auto head = join_entry_path(prefix, "");
  if (!head.empty()) {
    root.relative_path = head;
    entries.push_back(root);
  }

  std::vector<ArchiveEntry> children;
  std::error_code ec;
  fs::recursive_directory_iterator it(local, ec), end;
  if (ec)
    throw io_failure(local, ec.message());
  for (; it != end; it.increment(ec)) {
    if (ec)
      throw io_failure(local, ec.message());
    auto relative = it->path().lexically_relative(local).generic_string();
    children.push_back(
        describe(it->path(), join_entry_path(prefix, relative)));
  }
  if (ec)
    throw io_failure(local, ec.message());

  std::sort(children.begin(), children.end(),
            [](const ArchiveEntry &a, const ArchiveEntry &b) {
              return a.relative_path < b.relative_path;
            });
  entries.insert(entries.end(), children.begin(), children.end());
  return entries;
}

ArchiveEntry file_entry(const fs::path &local_file,
                        const std::string &entry_name) {
  auto entry = describe(local_file, join_entry_path(entry_name, ""));
  if (entry.kind != EntryKind::RegularFile)
    throw EncodeError(EncodeError::Kind::UnsupportedEntry, local_file.string(),
                      "not a regular file");
  return entry;
}

ArchiveEntry bytes_entry(const std::string &entry_name, std::string content,
                         std::uint32_t mode) {
  ArchiveEntry entry;
  entry.relative_path = join_entry_path(entry_name, "");
  entry.kind = EntryKind::RegularFile;
  entry.size = content.size();
  entry.mode = mode;
  entry.inline_content = std::make_shared<const std::string>(std::move(content));
  return entry;
}

namespace detail {
/**
 * @brief Streaming state of an ArchiveEncoder.
 *
 * The state machine is the inverse of the decoding one: emit the header
 * record(s) of the next entry, then its payload, then padding to the next
 * block boundary; after the last entry emit two zero blocks, padded to a
 * full record.
 */
struct ArchiveEncoderState {
  enum class State { NextEntry, Header, FileData, Padding, Trailer, Done };

  std::vector<ArchiveEntry> entries;
  std::size_t next_index = 0;
  State state = State::NextEntry;

  std::string pending; /**< @brief Header or trailer bytes being emitted. */
  std::size_t pending_offset = 0;
  std::ifstream file;
  std::uint64_t payload_left = 0;
  std::uint64_t inline_offset = 0;
  std::size_t padding_left = 0;
  std::uint64_t produced = 0;
  std::exception_ptr failure;

  const ArchiveEntry &current() const { return entries[next_index - 1]; }

  void start_entry() {
    const auto &entry = entries[next_index++];
    auto name = entry.relative_path;
    char typeflag = type_regular;
    std::uint64_t size = entry.size;
    if (entry.kind == EntryKind::Directory) {
      name += "/";
      typeflag = type_directory;
      size = 0;
    }

    pending.clear();
    pending_offset = 0;

    auto header = make_header(name, typeflag, size, entry.mode, entry.mtime);
    TarHeader probe;
    if (!store_name(probe, name)) {
      auto long_name = make_header(gnu_long_link_name, type_gnu_long_name,
                                   name.size() + 1, 0644, 0);
      pending.append(reinterpret_cast<const char *>(&long_name),
                     sizeof(long_name));
      pending.append(name);
      pending.push_back('\0');
      pending.append(padding_for(name.size() + 1), '\0');
    }
    pending.append(reinterpret_cast<const char *>(&header), sizeof(header));

    payload_left = size;
    inline_offset = 0;
    padding_left = padding_for(size);

    if (size > 0 && !entry.inline_content) {
      file.close();
      file.clear();
      file.open(entry.source, std::ios::binary);
      if (!file)
        throw io_failure(entry.source, std::strerror(errno));
    }
    state = State::Header;
  }

  std::size_t emit_pending(char *s, std::size_t n) {
    auto count = std::min(n, pending.size() - pending_offset);
    std::memcpy(s, pending.data() + pending_offset, count);
    pending_offset += count;
    return count;
  }

  std::size_t emit_payload(char *s, std::size_t n) {
    auto want = static_cast<std::size_t>(
        std::min<std::uint64_t>(n, payload_left));
    const auto &entry = current();
    if (entry.inline_content) {
      std::memcpy(s, entry.inline_content->data() + inline_offset, want);
      inline_offset += want;
      payload_left -= want;
      return want;
    }

    file.read(s, static_cast<std::streamsize>(want));
    auto got = static_cast<std::size_t>(file.gcount());
    if (got == 0) {
      if (file.bad())
        throw io_failure(entry.source, "read failed");
      throw io_failure(entry.source, "file shrank while it was archived");
    }
    payload_left -= got;
    if (payload_left == 0)
      file.close();
    return got;
  }

  std::streamsize read(char *s, std::streamsize n) {
    std::size_t done = 0;
    const auto limit = static_cast<std::size_t>(n);
    while (done < limit) {
      switch (state) {
      case State::NextEntry:
        if (next_index == entries.size()) {
          auto total = produced + done + 2 * block_size;
          pending.assign(
              2 * block_size + (record_size - total % record_size) % record_size,
              '\0');
          pending_offset = 0;
          state = State::Trailer;
        } else {
          start_entry();
        }
        break;

      case State::Header:
        done += emit_pending(s + done, limit - done);
        if (pending_offset == pending.size())
          state = payload_left > 0 ? State::FileData : State::Padding;
        break;

      case State::FileData:
        done += emit_payload(s + done, limit - done);
        if (payload_left == 0)
          state = State::Padding;
        break;

      case State::Padding: {
        auto count = std::min(limit - done, padding_left);
        std::memset(s + done, 0, count);
        done += count;
        padding_left -= count;
        if (padding_left == 0)
          state = State::NextEntry;
        break;
      }

      case State::Trailer:
        done += emit_pending(s + done, limit - done);
        if (pending_offset == pending.size())
          state = State::Done;
        break;

      case State::Done:
        produced += done;
        return done > 0 ? static_cast<std::streamsize>(done) : -1;
      }
    }
    produced += done;
    return static_cast<std::streamsize>(done);
  }
};
} // namespace detail

ArchiveEncoder::ArchiveEncoder(std::vector<ArchiveEntry> entries)
    : state_(std::make_shared<detail::ArchiveEncoderState>()) {
  state_->entries = std::move(entries);
}

ArchiveEncoder::ArchiveEncoder(const fs::path &local_path,
                               const std::string &destination_prefix)
    : ArchiveEncoder(collect_entries(local_path, destination_prefix)) {}

std::streamsize ArchiveEncoder::read(char *s, std::streamsize n) {
  if (state_->failure)
    std::rethrow_exception(state_->failure);
  try {
    return state_->read(s, n);
  } catch (const EncodeError &e) {
    BOOST_LOG_TRIVIAL(error) << "archive encoding stopped: " << e.what();
    state_->failure = std::current_exception();
    state_->file.close();
    throw;
  }
}

const std::vector<ArchiveEntry> &ArchiveEncoder::entries() const {
  return state_->entries;
}

std::uint64_t ArchiveEncoder::bytes_produced() const {
  return state_->produced;
}
} // namespace kube_pod_copy
