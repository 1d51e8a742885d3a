/**
 * @file archive-encoder.hxx
 * @brief Boost.Iostreams source producing a tar stream from local entries.
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
struct ArchiveEncoderState;
}

/**
 * @brief Lazily serializes archive entries as a USTAR stream.
 *
 * Headers are generated and file contents are read only as the consumer
 * pulls bytes, so memory use is bounded by the caller's buffer regardless of
 * the tree size. The stream can be consumed once.
 *
 * Copies share the same underlying stream position, as Boost.Iostreams copies
 * devices when they are pushed onto a chain.
 *
 * @code{.cpp}
 * namespace io = boost::iostreams;
 *
 * ArchiveEncoder encoder("/tmp/site", "srv/www");
 * io::filtering_istream in;
 * in.push(encoder);
 * // "srv/www/", "srv/www/index.html", ... until end of archive
 * @endcode
 */
class ArchiveEncoder {
public:
  /// Character type used by the stream.
  using char_type = char;
  /// Filter category for Boost.Iostreams.
  using category = boost::iostreams::source_tag;

  /// Archive exactly the given entries, in order.
  explicit ArchiveEncoder(std::vector<ArchiveEntry> entries);

  /// Archive a local file or tree, see collect_entries().
  ArchiveEncoder(const std::filesystem::path &local_path,
                 const std::string &destination_prefix);

  /**
   * @brief Produce up to `n` archive bytes.
   *
   * @return Number of bytes produced, or -1 once the end-of-archive marker
   * has been fully emitted.
   * @throws EncodeError when a local file cannot be read or changes size
   * while it is archived. The stream is unusable afterwards and every later
   * call rethrows.
   */
  std::streamsize read(char *s, std::streamsize n);

  /// Entries this encoder serializes.
  const std::vector<ArchiveEntry> &entries() const;

  /// Bytes produced so far.
  std::uint64_t bytes_produced() const;

private:
  std::shared_ptr<detail::ArchiveEncoderState> state_;
};
} // namespace kube_pod_copy
