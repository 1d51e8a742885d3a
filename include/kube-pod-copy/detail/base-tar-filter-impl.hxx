#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kube_pod_copy {
/// Which entries a TarFilter accepts.
enum class TarFilterMode {
  /// Concatenate every regular file; directories are skipped.
  AllFiles,
  /// Exactly one regular file; a directory or a second file is refused.
  SingleFile
};
} // namespace kube_pod_copy

namespace kube_pod_copy::detail {
/**
 * @class BaseTarFilterImpl
 * @brief Core TAR parsing logic that operates on char buffers.
 *
 * This class implements a small state machine to parse TAR archives streamed
 * in 512-byte blocks and forwards the payload of regular file entries. It is
 * independent of any iostreams interfaces so it can be tested and reused by
 * templated adapter layers.
 */
class BaseTarFilterImpl {
public:
  /** @enum State Parsing states for the internal state machine. */
  enum class State { ReadHeader, ReadFileData, SkipData, SkipPadding, Done };

  std::vector<char>
      header_buffer; /**< @brief Buffer for accumulating a 512-byte header. */
  std::size_t header_bytes_read =
      0; /**< @brief Number of header bytes currently buffered. */
  std::uint64_t entry_size =
      0; /**< @brief Payload size of the current entry in bytes. */
  std::uint64_t entry_bytes_read =
      0; /**< @brief Payload bytes of the current entry already consumed. */
  std::size_t padding_bytes =
      0; /**< @brief Number of padding bytes after the payload. */
  std::size_t padding_bytes_skipped =
      0; /**< @brief Number of padding bytes already skipped. */
  std::size_t files_seen = 0; /**< @brief Regular file entries started. */
  State state = State::ReadHeader; /**< @brief Current state of the parser. */
  std::string current_file_name;   /**< @brief Name of the entry currently being
                                      processed. */
  TarFilterMode mode; /**< @brief Entries the filter accepts. */

  explicit BaseTarFilterImpl(TarFilterMode mode = TarFilterMode::AllFiles);

  /**
   * @brief Process input TAR data and copy file contents to the destination
   * buffer.
   *
   * Both source and destination pointers are advanced as bytes are consumed
   * and produced.
   *
   * @param src_begin Reference to beginning of source buffer; advanced by
   * consumed bytes.
   * @param src_end One-past-end pointer of source buffer.
   * @param dest_begin Reference to beginning of destination buffer; advanced by
   * written bytes.
   * @param dest_end One-past-end pointer of destination buffer.
   * @param flush True once the upstream source is exhausted.
   * @return true when more input/output activity may be possible.
   * @return false when the archive is fully processed, or when flushing
   * with no input left at an entry boundary.
   * @throws DecodeError Truncated when flushing inside a header or payload;
   * MalformedHeader on a checksum mismatch; UnsupportedEntry for links and
   * special files, and in SingleFile mode for directories and extra files.
   */
  bool filter(const char *&src_begin, const char *const src_end,
              char *&dest_begin, const char *const dest_end, bool flush);

  /**
   * @brief Reset the parser to initial state for reuse.
   */
  void close();

private:
  void on_header();
};
} // namespace kube_pod_copy::detail
