#include <kube-pod-copy/detail/tar-header.hxx>
#include <kube-pod-copy/errors.hxx>

#include <algorithm>
#include <cstring>

namespace kube_pod_copy::detail {
namespace {
/**
 * @brief Decode a GNU base-256 field into a signed 64-bit value.
 *
 * The value is big-endian two's complement; the top bit of the first byte
 * marks the encoding and the next one carries the sign.
 *
 * @return std::nullopt when the value does not fit in int64_t.
 */
std::optional<std::int64_t> parse_base256(const char *field, std::size_t n) {
  auto p = reinterpret_cast<const unsigned char *>(field);
  auto c = *p;
  unsigned char neg;
  std::uint64_t l;

  if (c & 0x40) {
    neg = 0xff;
    c |= 0x80;
    l = ~std::uint64_t(0);
  } else {
    neg = 0;
    c &= 0x7f;
    l = 0;
  }

  while (n > sizeof(std::int64_t)) {
    --n;
    if (c != neg)
      return std::nullopt;
    c = *++p;
  }

  if ((c ^ neg) & 0x80)
    return std::nullopt;

  while (--n > 0) {
    l = (l << 8) | c;
    c = *++p;
  }
  l = (l << 8) | c;
  return static_cast<std::int64_t>(l);
}

std::uint32_t checksum_of(const TarHeader &header) {
  auto bytes = reinterpret_cast<const unsigned char *>(&header);
  std::uint32_t sum = 0;
  for (std::size_t i = 0; i < sizeof(TarHeader); ++i)
    sum += bytes[i];
  // The checksum field itself counts as eight spaces.
  for (std::size_t i = 0; i < sizeof(header.chksum); ++i)
    sum += static_cast<unsigned char>(' ') -
           static_cast<unsigned char>(header.chksum[i]);
  return sum;
}

void copy_field(char *field, std::size_t n, const std::string &value) {
  std::memset(field, 0, n);
  std::memcpy(field, value.data(), std::min(n, value.size()));
}
} // unnamed namespace

bool is_zero_block(const char *block) {
  return std::all_of(block, block + block_size,
                     [](char c) { return c == '\0'; });
}

std::optional<std::uint64_t> parse_numeric(const char *field, std::size_t n) {
  if (static_cast<unsigned char>(field[0]) & 0x80) {
    auto value = parse_base256(field, n);
    if (!value || *value < 0)
      return std::nullopt;
    return static_cast<std::uint64_t>(*value);
  }

  std::uint64_t result = 0;
  for (std::size_t i = 0; i < n && field[i]; ++i)
    if (field[i] >= '0' && field[i] <= '7')
      result = (result << 3) + static_cast<std::uint64_t>(field[i] - '0');
  return result;
}

void write_numeric(char *field, std::size_t n, std::uint64_t value) {
  // n - 1 octal digits plus the terminating NUL.
  const auto digits = n - 1;
  if (digits < 22 && value >= (std::uint64_t(1) << (3 * digits))) {
    std::memset(field, 0, n);
    auto p = reinterpret_cast<unsigned char *>(field);
    for (std::size_t i = n; i-- > 1;) {
      p[i] = static_cast<unsigned char>(value & 0xff);
      value >>= 8;
    }
    p[0] = 0x80;
    return;
  }

  field[digits] = '\0';
  for (std::size_t i = digits; i-- > 0;) {
    field[i] = static_cast<char>('0' + (value & 7));
    value >>= 3;
  }
}

std::string field_string(const char *field, std::size_t n) {
  std::size_t len = 0;
  for (; len < n; ++len)
    if (field[len] == '\0')
      break;
  return std::string(field, len);
}

std::string entry_name(const TarHeader &header) {
  auto name = field_string(header.name, sizeof(header.name));
  if (std::memcmp(header.magic, "ustar", 5) != 0)
    return name;
  auto prefix = field_string(header.prefix, sizeof(header.prefix));
  if (prefix.empty())
    return name;
  return prefix + "/" + name;
}

bool checksum_matches(const TarHeader &header) {
  auto stored = parse_numeric(header.chksum, sizeof(header.chksum));
  return stored && *stored == checksum_of(header);
}

void finalize_checksum(TarHeader &header) {
  std::memset(header.chksum, ' ', sizeof(header.chksum));
  auto sum = checksum_of(header);
  // Six octal digits, NUL, space: the layout every tar writes.
  write_numeric(header.chksum, 7, sum);
  header.chksum[7] = ' ';
}

bool store_name(TarHeader &header, const std::string &name) {
  if (name.size() <= sizeof(header.name)) {
    copy_field(header.name, sizeof(header.name), name);
    std::memset(header.prefix, 0, sizeof(header.prefix));
    return true;
  }

  // Split at a slash so that the tail fits in name and the head in prefix.
  auto limit = std::min(name.size() - 1, sizeof(header.prefix));
  for (auto pos = name.rfind('/', limit); pos != std::string::npos && pos > 0;
       pos = name.rfind('/', pos - 1)) {
    auto tail = name.size() - pos - 1;
    if (tail > sizeof(header.name))
      break;
    if (tail == 0)
      continue;
    copy_field(header.prefix, sizeof(header.prefix), name.substr(0, pos));
    copy_field(header.name, sizeof(header.name), name.substr(pos + 1));
    return true;
  }

  copy_field(header.name, sizeof(header.name), name);
  std::memset(header.prefix, 0, sizeof(header.prefix));
  return false;
}

TarHeader make_header(const std::string &name, char typeflag,
                      std::uint64_t size, std::uint32_t mode,
                      std::int64_t mtime) {
  TarHeader header;
  std::memset(&header, 0, sizeof(header));
  store_name(header, name);
  write_numeric(header.mode, sizeof(header.mode), mode & 07777);
  write_numeric(header.uid, sizeof(header.uid), 0);
  write_numeric(header.gid, sizeof(header.gid), 0);
  write_numeric(header.size, sizeof(header.size), size);
  write_numeric(header.mtime, sizeof(header.mtime),
                mtime > 0 ? static_cast<std::uint64_t>(mtime) : 0);
  header.typeflag[0] = typeflag;
  std::memcpy(header.magic, "ustar", 6);
  std::memcpy(header.version, "00", 2);
  finalize_checksum(header);
  return header;
}

std::optional<std::string> pax_path(const std::string &records) {
  std::optional<std::string> path;
  std::size_t pos = 0;
  while (pos < records.size()) {
    auto space = records.find(' ', pos);
    if (space == std::string::npos)
      break;
    std::size_t length = 0;
    for (auto i = pos; i < space; ++i) {
      if (records[i] < '0' || records[i] > '9')
        return path;
      length = length * 10 + static_cast<std::size_t>(records[i] - '0');
    }
    if (length == 0 || pos + length > records.size())
      break;
    if (pos + length < space + 2 || records[pos + length - 1] != '\n')
      throw DecodeError(DecodeError::Kind::MalformedHeader, "",
                        "pax record length does not match its content");

    // "<key>=<value>\n" between the space and the end of the record.
    auto record = records.substr(space + 1, pos + length - space - 2);
    auto eq = record.find('=');
    if (eq != std::string::npos && record.substr(0, eq) == "path")
      path = record.substr(eq + 1);
    pos += length;
  }
  return path;
}
} // namespace kube_pod_copy::detail
