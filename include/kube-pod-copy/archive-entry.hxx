/**
 * @file archive-entry.hxx
 * @brief One file or directory carried by an archive stream.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kube_pod_copy {
/** @enum EntryKind Entry types this library moves through a channel. */
enum class EntryKind { RegularFile, Directory };

/**
 * @brief Metadata and content source of one archive entry.
 *
 * For entries produced by the encoder either `source` names the local file
 * whose bytes are streamed, or `inline_content` holds them. Entries reported
 * by the decoder only carry metadata.
 */
struct ArchiveEntry {
  std::string relative_path; /**< @brief '/'-separated, no leading slash. */
  EntryKind kind = EntryKind::RegularFile;
  std::uint64_t size = 0;    /**< @brief Payload bytes, 0 for directories. */
  std::uint32_t mode = 0644; /**< @brief Permission bits. */
  std::int64_t mtime = 0;    /**< @brief Seconds since the epoch. */
  std::filesystem::path source;
  std::shared_ptr<const std::string> inline_content;
};

/**
 * @brief Walk a local file or directory and describe it as archive entries.
 *
 * A regular file yields one entry named `prefix/<file name>`. A directory
 * yields an entry for `prefix` itself (when non-empty) followed by one entry
 * per descendant, named `prefix/<relative path>`, sorted by relative path.
 * A leading '/' in `prefix` is dropped.
 *
 * @throws EncodeError LocalIOFailure when the path cannot be inspected,
 * UnsupportedEntry for symlinks and special files.
 */
std::vector<ArchiveEntry> collect_entries(const std::filesystem::path &local,
                                          const std::string &prefix);

/**
 * @brief Describe one local regular file published under `entry_name`.
 *
 * @throws EncodeError as collect_entries().
 */
ArchiveEntry file_entry(const std::filesystem::path &local_file,
                        const std::string &entry_name);

/// Describe an in-memory file published under `entry_name`.
ArchiveEntry bytes_entry(const std::string &entry_name, std::string content,
                         std::uint32_t mode = 0644);

/// Join an archive prefix and a relative name, dropping leading '/'.
std::string join_entry_path(const std::string &prefix,
                            const std::string &name);
} // namespace kube_pod_copy
