#include <kube-pod-copy/detail/base-tar-filter-impl.hxx>
#include <kube-pod-copy/detail/tar-header.hxx>
#include <kube-pod-copy/errors.hxx>

#include <algorithm>
#include <cstring>
#include <string>

namespace kube_pod_copy::detail {
namespace {
/**
 * @brief Check whether a header entry represents a regular file.
 *
 * According to the TAR standard, a typeflag of '0' or a NUL indicates a
 * regular file entry; '7' (contiguous file) is read the same way.
 */
inline bool is_regular_file(const TarHeader *tar) {
  return tar->typeflag[0] == type_regular ||
         tar->typeflag[0] == type_regular_old ||
         tar->typeflag[0] == type_contiguous;
}

/**
 * @brief Check whether an entry carries no file content worth forwarding.
 *
 * Directories and name/attribute extension records are skipped together with
 * whatever payload they declare.
 */
inline bool is_skippable(const TarHeader *tar) {
  switch (tar->typeflag[0]) {
  case type_directory:
  case type_gnu_long_name:
  case type_gnu_long_link:
  case type_pax_header:
  case type_pax_global:
  case 'D':
    return true;
  default:
    return false;
  }
}
} // unnamed namespace

BaseTarFilterImpl::BaseTarFilterImpl(TarFilterMode mode) : mode(mode) {}

/**
 * @brief Validate a complete header block and pick the next state.
 */
void BaseTarFilterImpl::on_header() {
  auto tar = reinterpret_cast<const TarHeader *>(header_buffer.data());
  current_file_name = entry_name(*tar);

  if (!checksum_matches(*tar))
    throw DecodeError(DecodeError::Kind::MalformedHeader, current_file_name,
                      "header checksum mismatch");
  auto size = parse_numeric(tar->size, sizeof(tar->size));
  if (!size)
    throw DecodeError(DecodeError::Kind::MalformedHeader, current_file_name,
                      "invalid entry size");

  entry_size = *size;
  entry_bytes_read = 0;
  padding_bytes = padding_for(entry_size);
  padding_bytes_skipped = 0;

  bool single = mode == TarFilterMode::SingleFile;
  if (single && (tar->typeflag[0] == type_directory ||
                 (is_regular_file(tar) && files_seen > 0)))
    throw DecodeError(DecodeError::Kind::UnsupportedEntry, current_file_name,
                      "remote path is not a regular file");

  if (is_regular_file(tar)) {
    ++files_seen;
    state = entry_size > 0 ? State::ReadFileData : State::SkipPadding;
  } else if (is_skippable(tar)) {
    state = entry_size > 0 ? State::SkipData : State::SkipPadding;
  } else {
    throw DecodeError(DecodeError::Kind::UnsupportedEntry, current_file_name,
                      "entry is not a regular file");
  }
}

/**
 * @brief Main streaming filter: read headers, forward file data and skip
 * everything else.
 *
 * The state machine:
 *  - reads 512-byte TAR headers,
 *  - determines entry size and type,
 *  - copies regular file payload bytes into the destination buffer,
 *  - skips the payload of directories and extension records,
 *  - skips padding to align to 512-byte blocks,
 *  - recognizes archive termination (zero block).
 */
bool BaseTarFilterImpl::filter(const char *&src_begin,
                               const char *const src_end, char *&dest_begin,
                               const char *const dest_end, bool flush) {
  while (src_begin < src_end && dest_begin < dest_end) {
    switch (state) {
    case State::ReadHeader: {
      auto needed = block_size - header_bytes_read;
      auto available = static_cast<std::size_t>(src_end - src_begin);
      auto to_copy = std::min(needed, available);

      if (header_buffer.size() < block_size)
        header_buffer.resize(block_size);
      std::memcpy(&header_buffer[header_bytes_read], src_begin, to_copy);
      src_begin += to_copy;
      header_bytes_read += to_copy;

      if (header_bytes_read == block_size) {
        header_bytes_read = 0;
        if (is_zero_block(header_buffer.data())) {
          state = State::Done;
          return false;
        }
        on_header();
      }
      break;
    }

    case State::ReadFileData: {
      auto remaining = entry_size - entry_bytes_read;
      auto src_avail = static_cast<std::uint64_t>(src_end - src_begin);
      auto dest_space = static_cast<std::uint64_t>(dest_end - dest_begin);

      auto const to_copy = static_cast<std::size_t>(
          std::min(remaining, std::min(src_avail, dest_space)));
      std::copy(src_begin, src_begin + to_copy, dest_begin);

      src_begin += to_copy;
      dest_begin += to_copy;
      entry_bytes_read += to_copy;

      if (entry_bytes_read == entry_size)
        state = State::SkipPadding;
      break;
    }

    case State::SkipData: {
      auto remaining = entry_size - entry_bytes_read;
      auto src_avail = static_cast<std::uint64_t>(src_end - src_begin);
      auto to_skip = static_cast<std::size_t>(std::min(remaining, src_avail));

      src_begin += to_skip;
      entry_bytes_read += to_skip;

      if (entry_bytes_read == entry_size)
        state = State::SkipPadding;
      break;
    }

    case State::SkipPadding: {
      auto remaining = padding_bytes - padding_bytes_skipped;
      auto src_avail = static_cast<std::size_t>(src_end - src_begin);
      auto to_skip = std::min(remaining, src_avail);

      src_begin += to_skip;
      padding_bytes_skipped += to_skip;

      if (padding_bytes_skipped == padding_bytes)
        state = State::ReadHeader;
      break;
    }

    case State::Done:
      return false;
    }
  }

  if (state == State::Done)
    return false;

  if (flush && src_begin == src_end) {
    if (state == State::SkipPadding)
      return false;
    if (state == State::ReadHeader && header_bytes_read == 0 && files_seen > 0)
      return false;
    throw DecodeError(DecodeError::Kind::Truncated, current_file_name,
                      files_seen == 0 && state == State::ReadHeader &&
                              header_bytes_read == 0
                          ? "archive stream carried no file"
                          : "archive ended before the entry was complete");
  }

  return true;
}

/**
 * @brief Reset internal parser state so the filter can be reused.
 */
void BaseTarFilterImpl::close() {
  state = State::ReadHeader;
  header_bytes_read = 0;
  entry_bytes_read = 0;
  entry_size = 0;
  padding_bytes = 0;
  padding_bytes_skipped = 0;
  files_seen = 0;
  header_buffer.clear();
  current_file_name.clear();
}
} // namespace kube_pod_copy::detail
