#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kube_pod_copy::detail {
/**
 * @struct TarHeader
 * @brief Representation of a POSIX/USTAR TAR header block (512 bytes).
 *
 * The struct layout matches the on-disk TAR header format. Fields are
 * fixed-size character arrays and may be NUL-terminated or filled according to
 * the TAR format.
 */
struct __attribute__((packed)) TarHeader {
  char name[100];     /**< @brief File name (may be NUL-terminated). */
  char mode[8];       /**< @brief File mode (octal ASCII). */
  char uid[8];        /**< @brief Owner user ID (octal ASCII). */
  char gid[8];        /**< @brief Owner group ID (octal ASCII). */
  char size[12];      /**< @brief File size (octal ASCII or base-256 binary). */
  char mtime[12];     /**< @brief Modification time (octal ASCII). */
  char chksum[8];     /**< @brief Header checksum field (octal ASCII). */
  char typeflag[1];   /**< @brief Entry type, see the type_* constants. */
  char linkname[100]; /**< @brief Name of linked file for symlinks. */
  char magic[6];      /**< @brief UStar magic ("ustar\0"). */
  char version[2];    /**< @brief UStar version ("00"). */
  char uname[32];     /**< @brief Owner user name. */
  char gname[32];     /**< @brief Owner group name. */
  char devmajor[8];   /**< @brief Device major number for special files. */
  char devminor[8];   /**< @brief Device minor number for special files. */
  char prefix[155];   /**< @brief Prefix for long file names. */
  char padding[12];   /**< @brief Padding to make the header 512 bytes. */
};

static_assert(sizeof(TarHeader) == 512, "TarHeader must be 512 bytes");

inline constexpr std::size_t block_size = 512;

inline constexpr char type_regular = '0';
inline constexpr char type_regular_old = '\0';
inline constexpr char type_hard_link = '1';
inline constexpr char type_symlink = '2';
inline constexpr char type_char_device = '3';
inline constexpr char type_block_device = '4';
inline constexpr char type_directory = '5';
inline constexpr char type_fifo = '6';
inline constexpr char type_contiguous = '7';
inline constexpr char type_gnu_long_name = 'L';
inline constexpr char type_gnu_long_link = 'K';
inline constexpr char type_pax_header = 'x';
inline constexpr char type_pax_global = 'g';

/// Name GNU tar uses for long-name extension records.
inline constexpr const char *gnu_long_link_name = "././@LongLink";

/// True when every byte of the 512-byte block is NUL.
bool is_zero_block(const char *block);

/// Bytes of padding after an entry payload of `size` bytes.
constexpr std::size_t padding_for(std::uint64_t size) {
  return static_cast<std::size_t>((block_size - (size % block_size)) %
                                  block_size);
}

/**
 * @brief Parse a numeric header field, octal ASCII or GNU base-256.
 *
 * @return std::nullopt for a negative or out-of-range base-256 value.
 */
std::optional<std::uint64_t> parse_numeric(const char *field, std::size_t n);

/**
 * @brief Write `value` into a numeric field.
 *
 * Uses zero-padded octal with a terminating NUL while it fits, base-256
 * otherwise.
 */
void write_numeric(char *field, std::size_t n, std::uint64_t value);

/// Field contents up to the first NUL or the field length.
std::string field_string(const char *field, std::size_t n);

/// Full entry name: "prefix/name" for USTAR headers with a prefix, else name.
std::string entry_name(const TarHeader &header);

/// Verify the checksum field against the header bytes.
bool checksum_matches(const TarHeader &header);

/// Compute the checksum and store it in the header.
void finalize_checksum(TarHeader &header);

/**
 * @brief Store `name` in the USTAR name/prefix fields.
 *
 * @return false when the name cannot be represented, in which case the
 * caller emits a GNU long-name record first.
 */
bool store_name(TarHeader &header, const std::string &name);

/**
 * @brief Build a USTAR header with the fields this library emits.
 *
 * The checksum is finalized. Names that do not fit are truncated in the
 * header and must be preceded by a long-name record.
 */
TarHeader make_header(const std::string &name, char typeflag,
                      std::uint64_t size, std::uint32_t mode,
                      std::int64_t mtime);

/**
 * @brief Extract the `path` record from a pax extended header payload.
 *
 * Records have the form "<len> <key>=<value>\n".
 *
 * @throws DecodeError MalformedHeader when a record's length does not cover
 * its own length field or does not end on the record's newline.
 */
std::optional<std::string> pax_path(const std::string &records);
} // namespace kube_pod_copy::detail
