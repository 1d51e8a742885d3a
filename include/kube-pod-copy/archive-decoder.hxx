/**
 * @file archive-decoder.hxx
 * @brief Boost.Iostreams sink materializing a tar stream under a directory.
 */

#pragma once

#include <kube-pod-copy/archive-entry.hxx>

#include <boost/iostreams/categories.hpp>

#include <filesystem>
#include <ios>
#include <memory>
#include <string>
#include <vector>

namespace kube_pod_copy {
namespace detail {
struct ArchiveDecoderState;
}

/**
 * @brief Options for ArchiveDecoder.
 */
struct DecodeOptions {
  /**
   * @brief Leading path removed from every entry after normalization.
   *
   * Entries outside the prefix keep their full relative path.
   */
  std::string strip_prefix;
  /// Apply the permission bits stored in the archive.
  bool preserve_permissions = true;
};

/**
 * @brief Writes the entries of a tar stream below a destination root.
 *
 * Bytes are pushed with write() in arbitrary chunk sizes, in stream order.
 * Entries are materialized as soon as their header is complete, so a large
 * archive is never buffered. Once the stream source is exhausted the caller
 * must call finish() to find out whether the archive was complete.
 *
 * Entry names are normalized lexically: empty and "." components are
 * dropped, ".." pops the previous component, and a leading '/' is ignored.
 * Names that climb above the root, or whose parent directory resolves
 * outside it through an existing symlink, are rejected with
 * DecodeError::Kind::PathTraversal before anything is written.
 *
 * Copies share state, as Boost.Iostreams copies devices when they are pushed
 * onto a chain.
 */
class ArchiveDecoder {
public:
  /// Character type used by the stream.
  using char_type = char;
  /// Filter category for Boost.Iostreams.
  using category = boost::iostreams::sink_tag;

  /**
   * @brief Create a decoder; the root is created if it does not exist.
   *
   * @throws DecodeError LocalIOFailure when the root cannot be created.
   */
  explicit ArchiveDecoder(const std::filesystem::path &destination_root,
                          DecodeOptions options = {});

  /**
   * @brief Consume archive bytes.
   *
   * @return Always `n`; bytes after the end-of-archive marker are ignored.
   * @throws DecodeError on traversal, malformed or unsupported entries and
   * local write failures. The decoder is unusable afterwards.
   */
  std::streamsize write(const char *s, std::streamsize n);

  /**
   * @brief Declare the end of input and check completeness.
   *
   * @throws DecodeError Truncated when the stream ended inside a header or
   * before an entry's payload was complete, or carried no entry at all.
   */
  void finish();

  /// True once the end-of-archive marker was seen.
  bool done() const;

  /// Entries materialized so far, in stream order.
  const std::vector<ArchiveEntry> &entries() const;

  const std::filesystem::path &destination_root() const;

private:
  std::shared_ptr<detail::ArchiveDecoderState> state_;
};
} // namespace kube_pod_copy
