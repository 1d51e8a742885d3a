#include <kube-pod-copy/archive-decoder.hxx>
#include <kube-pod-copy/detail/tar-header.hxx>
#include <kube-pod-copy/errors.hxx>

#include "test-support.hxx"

#include <boost/iostreams/filtering_stream.hpp>

#include <cstring>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace io = boost::iostreams;
using namespace kube_pod_copy;
using namespace kube_pod_copy::test;

namespace {
std::string header_bytes(const detail::TarHeader &header) {
  return std::string(reinterpret_cast<const char *>(&header), sizeof(header));
}

std::string padded(std::string payload) {
  payload.append(detail::padding_for(payload.size()), '\0');
  return payload;
}

std::string end_marker() { return std::string(2 * detail::block_size, '\0'); }

/// Entry whose header is written verbatim, bypassing the encoder's
/// normalization.
std::string raw_file(const std::string &name, const std::string &content) {
  return header_bytes(detail::make_header(name, detail::type_regular,
                                          content.size(), 0644, 0)) +
         padded(content);
}

std::string pax_record(const std::string &key, const std::string &value) {
  auto body = " " + key + "=" + value + "\n";
  auto length = body.size() + 1;
  while (std::to_string(length).size() + body.size() != length)
    ++length;
  return std::to_string(length) + body;
}

DecodeError::Kind decode_failure(const fs::path &root,
                                 const std::string &archive) {
  try {
    ArchiveDecoder decoder(root);
    decoder.write(archive.data(), static_cast<std::streamsize>(archive.size()));
    decoder.finish();
  } catch (const DecodeError &e) {
    return e.kind();
  }
  ADD_FAILURE() << "archive decoded without error";
  return DecodeError::Kind::MalformedHeader;
}

class ArchiveDecoderTest : public ::testing::Test {
protected:
  TempDir tmp;
};
} // unnamed namespace

TEST_F(ArchiveDecoderTest, RejectsParentTraversal) {
  auto archive = raw_file("../../etc/passwd", "root::0:0::/:/bin/sh\n") +
                 end_marker();
  EXPECT_EQ(decode_failure(tmp / "dst", archive),
            DecodeError::Kind::PathTraversal);
  EXPECT_FALSE(fs::exists(tmp / "etc/passwd"));
  EXPECT_TRUE(list_tree(tmp / "dst").empty());
}

TEST_F(ArchiveDecoderTest, InnerDotDotStaysInsideTheRoot) {
  auto archive = raw_file("a/../b.txt", "fine") + end_marker();
  ArchiveDecoder decoder(tmp / "dst");
  decoder.write(archive.data(), static_cast<std::streamsize>(archive.size()));
  decoder.finish();
  EXPECT_EQ(read_file(tmp / "dst/b.txt"), "fine");
  EXPECT_EQ(decoder.entries().at(0).relative_path, "b.txt");
}

TEST_F(ArchiveDecoderTest, AbsoluteNamesLandBelowTheRoot) {
  auto archive = raw_file("/etc/hostname", "pod\n") + end_marker();
  ArchiveDecoder decoder(tmp / "dst");
  decoder.write(archive.data(), static_cast<std::streamsize>(archive.size()));
  decoder.finish();
  EXPECT_EQ(read_file(tmp / "dst/etc/hostname"), "pod\n");
}

TEST_F(ArchiveDecoderTest, RejectsWritesThroughSymlinkedParent) {
  fs::create_directories(tmp / "dst");
  fs::create_directories(tmp / "outside");
  fs::create_directory_symlink(tmp / "outside", tmp / "dst/escape");

  auto archive = raw_file("escape/owned.txt", "gotcha") + end_marker();
  EXPECT_EQ(decode_failure(tmp / "dst", archive),
            DecodeError::Kind::PathTraversal);
  EXPECT_FALSE(fs::exists(tmp / "outside/owned.txt"));
}

TEST_F(ArchiveDecoderTest, RejectsOverwritingASymlink) {
  fs::create_directories(tmp / "dst");
  write_file(tmp / "victim", "keep");
  fs::create_symlink(tmp / "victim", tmp / "dst/file");

  auto archive = raw_file("file", "replaced") + end_marker();
  EXPECT_EQ(decode_failure(tmp / "dst", archive),
            DecodeError::Kind::PathTraversal);
  EXPECT_EQ(read_file(tmp / "victim"), "keep");
}

TEST_F(ArchiveDecoderTest, SymlinkEntryIsUnsupported) {
  auto header = detail::make_header("link", detail::type_symlink, 0, 0777, 0);
  std::memcpy(header.linkname, "/etc/shadow", 11);
  detail::finalize_checksum(header);
  auto archive = header_bytes(header) + end_marker();
  EXPECT_EQ(decode_failure(tmp / "dst", archive),
            DecodeError::Kind::UnsupportedEntry);
  EXPECT_FALSE(fs::exists(tmp / "dst/link"));
}

TEST_F(ArchiveDecoderTest, TruncatedPayloadFailsAtFinish) {
  auto archive = make_archive({bytes_entry("big.bin", pattern_bytes(4000))});
  archive.resize(detail::block_size + 2000);

  ArchiveDecoder decoder(tmp / "dst");
  decoder.write(archive.data(), static_cast<std::streamsize>(archive.size()));
  try {
    decoder.finish();
    FAIL() << "missing payload bytes must be reported";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.kind(), DecodeError::Kind::Truncated);
    EXPECT_EQ(e.entry(), "big.bin");
  }
}

TEST_F(ArchiveDecoderTest, TruncatedHeaderFailsAtFinish) {
  auto archive = make_archive({bytes_entry("a", "1"), bytes_entry("b", "2")});
  archive.resize(2 * detail::block_size + 100);
  EXPECT_EQ(decode_failure(tmp / "dst", archive), DecodeError::Kind::Truncated);
}

TEST_F(ArchiveDecoderTest, EmptyStreamIsTruncated) {
  EXPECT_EQ(decode_failure(tmp / "dst", ""), DecodeError::Kind::Truncated);
}

TEST_F(ArchiveDecoderTest, MissingEndMarkerAtEntryBoundaryIsAccepted) {
  auto archive = raw_file("only.txt", "content");
  ArchiveDecoder decoder(tmp / "dst");
  decoder.write(archive.data(), static_cast<std::streamsize>(archive.size()));
  EXPECT_NO_THROW(decoder.finish());
  EXPECT_FALSE(decoder.done());
  EXPECT_EQ(read_file(tmp / "dst/only.txt"), "content");
}

TEST_F(ArchiveDecoderTest, ChecksumMismatchIsMalformed) {
  auto header = detail::make_header("a.txt", detail::type_regular, 1, 0644, 0);
  header.size[0] = '7';
  auto archive = header_bytes(header) + padded("x") + end_marker();
  EXPECT_EQ(decode_failure(tmp / "dst", archive),
            DecodeError::Kind::MalformedHeader);
}

TEST_F(ArchiveDecoderTest, FailedDecoderStaysFailed) {
  auto archive = raw_file("../escape", "x") + end_marker();
  ArchiveDecoder decoder(tmp / "dst");
  EXPECT_THROW(decoder.write(archive.data(),
                             static_cast<std::streamsize>(archive.size())),
               DecodeError);
  auto good = raw_file("ok", "y");
  EXPECT_THROW(
      decoder.write(good.data(), static_cast<std::streamsize>(good.size())),
      DecodeError);
  EXPECT_THROW(decoder.finish(), DecodeError);
}

TEST_F(ArchiveDecoderTest, GnuLongNameRecordNamesTheNextEntry) {
  std::string name = "logs/" + std::string(150, 'x') + "/" +
                     std::string(150, 'y') + ".log";
  auto long_header =
      detail::make_header(detail::gnu_long_link_name,
                          detail::type_gnu_long_name, name.size() + 1, 0644, 0);
  auto archive = header_bytes(long_header) + padded(name + '\0') +
                 raw_file("truncated-in-header", "long") + end_marker();

  ArchiveDecoder decoder(tmp / "dst");
  decoder.write(archive.data(), static_cast<std::streamsize>(archive.size()));
  decoder.finish();
  EXPECT_EQ(read_file(tmp / "dst" / name), "long");
  EXPECT_FALSE(fs::exists(tmp / "dst/truncated-in-header"));
}

TEST_F(ArchiveDecoderTest, PaxPathRecordNamesTheNextEntry) {
  auto records = pax_record("mtime", "1700000000.5") +
                 pax_record("path", "pax/named/file.txt");
  auto pax_header = detail::make_header("PaxHeaders/file.txt",
                                        detail::type_pax_header, records.size(),
                                        0644, 0);
  auto archive = header_bytes(pax_header) + padded(records) +
                 raw_file("file.txt", "from pax") + end_marker();

  ArchiveDecoder decoder(tmp / "dst");
  decoder.write(archive.data(), static_cast<std::streamsize>(archive.size()));
  decoder.finish();
  EXPECT_EQ(read_file(tmp / "dst/pax/named/file.txt"), "from pax");
}

TEST_F(ArchiveDecoderTest, PaxRecordShorterThanItsPrefixIsMalformed) {
  std::string records = "2 path=/etc/passwd\n";
  auto pax_header = detail::make_header("PaxHeaders/file.txt",
                                        detail::type_pax_header, records.size(),
                                        0644, 0);
  auto archive = header_bytes(pax_header) + padded(records) +
                 raw_file("file.txt", "x") + end_marker();
  EXPECT_EQ(decode_failure(tmp / "dst", archive),
            DecodeError::Kind::MalformedHeader);
  EXPECT_FALSE(fs::exists(tmp / "dst/etc/passwd"));
}

TEST_F(ArchiveDecoderTest, DirectoryStreamFromTarCreateDot) {
  auto archive = make_archive({directory_entry("."), directory_entry("./sub"),
                               bytes_entry("./sub/b.txt", "b"),
                               bytes_entry("./a.txt", "a")});
  ArchiveDecoder decoder(tmp / "dst");
  decoder.write(archive.data(), static_cast<std::streamsize>(archive.size()));
  decoder.finish();
  EXPECT_EQ(list_tree(tmp / "dst"),
            (std::vector<std::string>{"a.txt", "sub", "sub/b.txt"}));
}

TEST_F(ArchiveDecoderTest, StripPrefixAppliesOnlyToMatchingEntries) {
  auto archive = make_archive({bytes_entry("var/log/app.log", "in"),
                               bytes_entry("etc/other", "out")});
  ArchiveDecoder decoder(tmp / "dst", DecodeOptions{.strip_prefix = "/var/log"});
  decoder.write(archive.data(), static_cast<std::streamsize>(archive.size()));
  decoder.finish();
  EXPECT_EQ(read_file(tmp / "dst/app.log"), "in");
  EXPECT_EQ(read_file(tmp / "dst/etc/other"), "out");
}

TEST_F(ArchiveDecoderTest, WorksAsABoostIostreamsSink) {
  auto archive = make_archive({bytes_entry("via/sink.txt", "streamed")});
  {
    io::filtering_ostream out;
    out.push(ArchiveDecoder(tmp / "dst"));
    out.write(archive.data(), static_cast<std::streamsize>(archive.size()));
  }
  EXPECT_EQ(read_file(tmp / "dst/via/sink.txt"), "streamed");
}
