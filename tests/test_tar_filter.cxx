#include <kube-pod-copy/archive-encoder.hxx>
#include <kube-pod-copy/detail/tar-header.hxx>
#include <kube-pod-copy/errors.hxx>
#include <kube-pod-copy/tar-filter.hxx>

#include "test-support.hxx"

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <gtest/gtest.h>
#include <ios>
#include <iterator>
#include <string>
#include <vector>

namespace io = boost::iostreams;
using namespace kube_pod_copy;
using namespace kube_pod_copy::test;

namespace {
std::string gzip(const std::string &data) {
  std::string out;
  io::filtering_ostream compress;
  compress.push(io::gzip_compressor());
  compress.push(io::back_inserter(out));
  compress.write(data.data(), static_cast<std::streamsize>(data.size()));
  io::close(compress);
  return out;
}

/// Everything TarFilter yields for `archive`, read with istreambuf_iterator.
std::string filter_archive(const std::string &archive,
                           std::streamsize buffer_size =
                               io::default_device_buffer_size,
                           TarFilterMode mode = TarFilterMode::AllFiles) {
  io::filtering_istream in;
  in.push(TarFilter<>(buffer_size, mode));
  in.push(io::array_source(archive.data(), archive.size()));
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>{});
}

std::string long_name(std::size_t length) {
  std::string name = "deep/";
  while (name.size() < length)
    name += "segment-";
  return name.substr(0, length);
}

/// Archive holding one hand-built header followed by the end marker.
std::string single_header_archive(const detail::TarHeader &header) {
  std::string out(reinterpret_cast<const char *>(&header), sizeof(header));
  out.append(2 * detail::block_size, '\0');
  return out;
}
} // unnamed namespace

/**
 * @brief Parameters for a single TAR test case.
 *
 * - name: label of the generated archive
 * - entries: what the archive holds
 * - hash: expected SHA-256 digest of the file contents the filter yields
 * - tar_filter_buffer_sizes: sizes to instantiate the TarFilter with (exercises
 * buffer behavior)
 */
struct TarHashTestCase {
  std::string name;
  std::vector<ArchiveEntry> entries;
  std::string hash;
  std::vector<std::streamsize> tar_filter_buffer_sizes;
};

void PrintTo(const TarHashTestCase &test_case, std::ostream *os) {
  *os << test_case.name;
}

/**
 * @brief Parameterized fixture reading gzip-compressed archives through
 * TarFilter and gzip_decompressor.
 */
class TarFilterHashTest : public ::testing::TestWithParam<TarHashTestCase> {};

TEST_P(TarFilterHashTest, MatchesExpectedSHA256) {
  const auto &[name, entries, expected_hash, buffer_sizes] = GetParam();

  const auto compressed = gzip(make_archive(entries));
  for (const auto buffer_size : buffer_sizes) {
    io::filtering_istream in;
    in.push(TarFilter<>(buffer_size));
    in.push(io::gzip_decompressor());
    in.push(io::array_source(compressed.data(), compressed.size()));

    const auto hash = sha256sum(in);
    EXPECT_EQ(hash, expected_hash)
        << name << " with buffer size " << buffer_size;
  }
}

INSTANTIATE_TEST_SUITE_P(
    TarFilterTests, TarFilterHashTest,
    ::testing::Values(
        TarHashTestCase{
            .name = "single-file",
            .entries = {bytes_entry("nginx.conf", pattern_bytes(70'001))},
            .hash = sha256_of(pattern_bytes(70'001)),
            .tar_filter_buffer_sizes = {io::default_device_buffer_size,
                                        16'384, 1}},
        TarHashTestCase{
            .name = "multi-file-multi-level",
            .entries = {directory_entry("etc"),
                        bytes_entry("etc/hosts", "127.0.0.1 localhost\n"),
                        directory_entry("etc/ssl"),
                        bytes_entry("etc/ssl/ca.pem", pattern_bytes(4096, 3)),
                        bytes_entry("etc/empty", "")},
            .hash = sha256_of("127.0.0.1 localhost\n" + pattern_bytes(4096, 3)),
            .tar_filter_buffer_sizes = {io::default_device_buffer_size,
                                        16'384, 1}},
        TarHashTestCase{
            .name = "long-file-name",
            .entries = {bytes_entry(long_name(300), "far away")},
            .hash = sha256_of("far away"),
            .tar_filter_buffer_sizes = {io::default_device_buffer_size, 7}}));

TEST(TarFilter, StopsAtTheEndOfArchiveMarker) {
  auto archive = make_archive({bytes_entry("a", "payload")});
  archive += "trailing garbage that is never parsed";
  EXPECT_EQ(filter_archive(archive), "payload");
}

TEST(TarFilter, MissingTrailerAfterCompleteEntryIsAccepted) {
  auto archive = make_archive({bytes_entry("a", "payload")});
  archive.resize(2 * detail::block_size);
  EXPECT_EQ(filter_archive(archive), "payload");
}

TEST(TarFilter, TruncatedPayloadThrows) {
  auto archive = make_archive({bytes_entry("big", pattern_bytes(5000))});
  archive.resize(detail::block_size + 1000);
  try {
    filter_archive(archive);
    FAIL() << "a truncated payload must not read as a short file";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.kind(), DecodeError::Kind::Truncated);
    EXPECT_EQ(e.entry(), "big");
  }
}

TEST(TarFilter, TruncatedHeaderThrows) {
  auto archive = make_archive({bytes_entry("a", "payload")});
  archive.resize(200);
  try {
    filter_archive(archive, 1);
    FAIL() << "a partial header must be reported";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.kind(), DecodeError::Kind::Truncated);
  }
}

TEST(TarFilter, EmptyStreamThrows) {
  try {
    filter_archive("");
    FAIL() << "an empty stream carries no file";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.kind(), DecodeError::Kind::Truncated);
  }
}

TEST(TarFilter, ChecksumMismatchIsMalformed) {
  auto archive = make_archive({bytes_entry("a", "payload")});
  archive[0] = 'b';
  try {
    filter_archive(archive);
    FAIL() << "a corrupted header must be rejected";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.kind(), DecodeError::Kind::MalformedHeader);
  }
}

TEST(TarFilter, SymlinkEntryIsUnsupported) {
  auto header = detail::make_header("link", detail::type_symlink, 0, 0777, 0);
  try {
    filter_archive(single_header_archive(header));
    FAIL() << "a symlink has no content to yield";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.kind(), DecodeError::Kind::UnsupportedEntry);
    EXPECT_EQ(e.entry(), "link");
  }
}

TEST(TarFilter, SingleFileModeYieldsTheOnlyFile) {
  auto archive = make_archive({bytes_entry("motd", "welcome\n")});
  EXPECT_EQ(filter_archive(archive, 3, TarFilterMode::SingleFile),
            "welcome\n");
}

TEST(TarFilter, SingleFileModeRefusesADirectory) {
  auto archive = make_archive({directory_entry("conf"),
                               bytes_entry("conf/a.yaml", "AAA\n"),
                               bytes_entry("conf/b.yaml", "BBB\n")});
  try {
    filter_archive(archive, io::default_device_buffer_size,
                   TarFilterMode::SingleFile);
    FAIL() << "a directory must not read as one file";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.kind(), DecodeError::Kind::UnsupportedEntry);
    EXPECT_EQ(e.entry(), "conf/");
  }
}

TEST(TarFilter, SingleFileModeRefusesASecondFile) {
  auto archive = make_archive(
      {bytes_entry("a.yaml", "AAA\n"), bytes_entry("b.yaml", "BBB\n")});
  try {
    filter_archive(archive, io::default_device_buffer_size,
                   TarFilterMode::SingleFile);
    FAIL() << "two files must not be joined";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.kind(), DecodeError::Kind::UnsupportedEntry);
    EXPECT_EQ(e.entry(), "b.yaml");
  }
}
