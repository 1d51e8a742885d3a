#include <kube-pod-copy/archive-decoder.hxx>
#include <kube-pod-copy/errors.hxx>
#include <kube-pod-copy/logging.hxx>
#include <kube-pod-copy/pod-copy.hxx>

#include "fake-exec-channel.hxx"
#include "test-support.hxx"

#include <boost/log/keywords/severity.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

using namespace kube_pod_copy;
using namespace kube_pod_copy::test;
using namespace std::chrono_literals;

namespace {
const std::string gnu_tar_version =
    "tar (GNU tar) 1.34\nCopyright (C) 2021 Free Software Foundation, Inc.\n";

CopyTarget pod_path(const std::string &path) {
  return CopyTarget{.namespace_name = "apps",
                    .pod_name = "worker-1",
                    .container_name = "main",
                    .path = path};
}

/**
 * @brief PodCopy wired to a FakeExecChannel the test can script and inspect.
 */
class PodCopyTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeExecChannel> channel =
      std::make_shared<FakeExecChannel>();
  PodCopy copy{channel};
  TempDir tmp;
};
} // unnamed namespace

TEST_F(PodCopyTest, DebugRecordsAreFilteredWithoutLoggingSetup) {
  namespace logging = boost::log;
  auto &logger = logging::trivial::logger::get();
  auto debug = logger.open_record(
      logging::keywords::severity = logging::trivial::debug);
  EXPECT_FALSE(static_cast<bool>(debug));
  auto warning = logger.open_record(
      logging::keywords::severity = logging::trivial::warning);
  EXPECT_TRUE(static_cast<bool>(warning));
}

TEST_F(PodCopyTest, ProbeRunsTarVersionWithoutStdin) {
  channel->push(FakeScript{.stdout_data = gnu_tar_version});

  auto report = copy.probe(pod_path("/ignored"));
  EXPECT_EQ(report.result, ProbeResult::Supported);
  EXPECT_EQ(report.output, gnu_tar_version);

  auto calls = channel->calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0]->command,
            (std::vector<std::string>{"sh", "-c", "tar --version"}));
  EXPECT_FALSE(calls[0]->flags.want_stdin);
  EXPECT_TRUE(calls[0]->flags.want_stdout);
  EXPECT_TRUE(calls[0]->flags.want_stderr);
  EXPECT_FALSE(calls[0]->flags.tty);
  EXPECT_EQ(calls[0]->target.container_name, "main");
}

TEST_F(PodCopyTest, BusyboxTarIsUnsupported) {
  channel->push(FakeScript{.stdout_data = "tar (busybox) 1.36.1\n"});
  EXPECT_EQ(copy.probe(pod_path("/")).result, ProbeResult::Unsupported);
}

TEST_F(PodCopyTest, FailingProbeCommandIsUnsupported) {
  channel->push(FakeScript{.stderr_data = "sh: tar: not found\n",
                           .status = ExecStatus{.success = false,
                                                .exit_code = 127,
                                                .reason = "NonZeroExitCode"}});
  auto report = copy.probe(pod_path("/"));
  EXPECT_EQ(report.result, ProbeResult::Unsupported);
  EXPECT_EQ(report.status.exit_code, 127);
  EXPECT_EQ(report.error_output, "sh: tar: not found\n");
}

TEST_F(PodCopyTest, ProbeChannelFailurePropagates) {
  channel->push(FakeScript{.open_error = ChannelError::Kind::NotFound});
  EXPECT_THROW(copy.probe(pod_path("/")), ChannelError);
}

TEST_F(PodCopyTest, DirectoryFromPodProbesBeforeTheDataChannel) {
  channel->push(FakeScript{.stdout_data = gnu_tar_version});
  channel->push(FakeScript{.stdout_data = make_archive(
                               {directory_entry("."),
                                bytes_entry("./config.yaml", "replicas: 3\n")})});

  copy.copy_directory_from_pod(pod_path("/etc/app"), tmp / "app");

  auto calls = channel->calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0]->command.back(), "tar --version");
  EXPECT_EQ(calls[1]->command.back(), "tar -cf - -C /etc/app .");
  EXPECT_EQ(read_file(tmp / "app/config.yaml"), "replicas: 3\n");
}

TEST_F(PodCopyTest, IncompatibleTarOpensNoDataChannel) {
  channel->push(FakeScript{.stdout_data = "tar (busybox) 1.36.1\n"});

  try {
    copy.copy_directory_from_pod(pod_path("/etc/app"), tmp / "app");
    FAIL() << "directory copy should have been refused";
  } catch (const CopyNotSupportedException &e) {
    EXPECT_EQ(e.kind(), CopyNotSupportedException::Kind::IncompatibleRemoteTar);
  }
  EXPECT_EQ(channel->calls().size(), 1u);
  EXPECT_FALSE(fs::exists(tmp / "app"));
}

TEST_F(PodCopyTest, HangingProbeIsBoundByTheCopyTimeout) {
  channel->push(
      FakeScript{.stdout_data = gnu_tar_version, .hold_stdout = true});

  auto started = std::chrono::steady_clock::now();
  try {
    copy.copy_directory_from_pod(pod_path("/etc/app"), tmp / "app",
                                 CopyOptions{.timeout = 200ms});
    FAIL() << "a probe that never finishes must time out";
  } catch (const CopyError &e) {
    EXPECT_EQ(e.kind(), CopyError::Kind::TimedOut);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);

  auto calls = channel->calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_TRUE(calls[0]->cancelled);
  EXPECT_FALSE(fs::exists(tmp / "app"));
}

TEST_F(PodCopyTest, StopRequestedBeforeTheProbeOpensNothing) {
  std::stop_source stop;
  stop.request_stop();
  try {
    copy.copy_directory_from_pod(pod_path("/etc/app"), tmp / "app",
                                 CopyOptions{.stop_token = stop.get_token()});
    FAIL() << "a stopped copy must not start";
  } catch (const CopyError &e) {
    EXPECT_EQ(e.kind(), CopyError::Kind::Cancelled);
  }
  EXPECT_TRUE(channel->calls().empty());
}

TEST_F(PodCopyTest, MissingPodFailsTheCopy) {
  write_file(tmp / "notes.txt", "remember");
  channel->push(FakeScript{.open_error = ChannelError::Kind::NotFound});

  try {
    copy.copy_file_to_pod(pod_path("/tmp/notes.txt"), tmp / "notes.txt");
    FAIL() << "copy to a missing pod should fail";
  } catch (const ChannelError &e) {
    EXPECT_EQ(e.kind(), ChannelError::Kind::NotFound);
  }
}

TEST_F(PodCopyTest, BytesToPodArrivesUnderTheTargetPath) {
  copy.copy_bytes_to_pod(pod_path("/run/secrets/token"), "s3cr3t");

  auto calls = channel->calls();
  ASSERT_EQ(calls.size(), 1u);
  ArchiveDecoder decoder(tmp / "remote");
  decoder.write(calls[0]->stdin_data.data(),
                static_cast<std::streamsize>(calls[0]->stdin_data.size()));
  decoder.finish();
  EXPECT_EQ(read_file(tmp / "remote/run/secrets/token"), "s3cr3t");
}

TEST_F(PodCopyTest, DirectoryToPodCarriesTheWholeTree) {
  write_file(tmp / "site/index.html", "index");
  write_file(tmp / "site/css/main.css", "body{}");

  copy.copy_directory_to_pod(pod_path("/srv/www"), tmp / "site");

  auto calls = channel->calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0]->command.back(), "tar -xmf - -C /");
  ArchiveDecoder decoder(tmp / "remote");
  decoder.write(calls[0]->stdin_data.data(),
                static_cast<std::streamsize>(calls[0]->stdin_data.size()));
  decoder.finish();
  EXPECT_EQ(read_file(tmp / "remote/srv/www/css/main.css"), "body{}");
  EXPECT_EQ(read_file(tmp / "remote/srv/www/index.html"), "index");
}

TEST_F(PodCopyTest, FileFromPodStreamYieldsTheContent) {
  auto content = pattern_bytes(123'457);
  channel->push(FakeScript{
      .stdout_data = make_archive({bytes_entry("dump.bin", content)})});

  auto in = copy.copy_file_from_pod(pod_path("/var/dump.bin"));
  EXPECT_EQ(sha256sum(*in), sha256_of(content));

  auto calls = channel->calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0]->command.back(), "tar -cf - -C /var dump.bin");
  EXPECT_FALSE(calls[0]->flags.want_stdin);
}

TEST_F(PodCopyTest, FileFromPodStreamRaisesRemoteFailureAtEnd) {
  channel->push(FakeScript{
      .stderr_data = "tar: dump.bin: Cannot open: Permission denied\n",
      .status = ExecStatus{.success = false,
                           .exit_code = 2,
                           .reason = "NonZeroExitCode"}});

  auto in = copy.copy_file_from_pod(pod_path("/var/dump.bin"));
  std::vector<char> buffer(512);
  try {
    in->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    FAIL() << "reading a failed remote file should throw";
  } catch (const CopyError &e) {
    EXPECT_EQ(e.kind(), CopyError::Kind::RemoteCommandFailed);
    EXPECT_EQ(e.exit_code(), 2);
    EXPECT_NE(e.remote_stderr().find("Permission denied"), std::string::npos);
  }
}

TEST_F(PodCopyTest, AbandonedStreamCancelsTheSession) {
  channel->push(FakeScript{
      .stdout_data = make_archive({bytes_entry("log", pattern_bytes(2048))})
                         .substr(0, 1024),
      .hold_stdout = true});

  {
    auto in = copy.copy_file_from_pod(pod_path("/var/log"));
    std::vector<char> buffer(16);
    in->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    EXPECT_EQ(in->gcount(), 16);
  }
  EXPECT_TRUE(channel->calls().front()->cancelled);
}

TEST_F(PodCopyTest, FileFromPodToLocalFile) {
  channel->push(FakeScript{
      .stdout_data = make_archive({bytes_entry("motd", "welcome\n")})});
  copy.copy_file_from_pod(pod_path("/etc/motd"), tmp / "motd");
  EXPECT_EQ(read_file(tmp / "motd"), "welcome\n");
}

TEST_F(PodCopyTest, FileFromPodStreamRefusesADirectory) {
  channel->push(FakeScript{.stdout_data = make_archive(
                               {directory_entry("conf"),
                                bytes_entry("conf/a.yaml", "AAA\n"),
                                bytes_entry("conf/b.yaml", "BBB\n")})});

  auto in = copy.copy_file_from_pod(pod_path("/etc/conf"));
  std::vector<char> buffer(64);
  try {
    in->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    FAIL() << "a remote directory must not read as one file";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.kind(), DecodeError::Kind::UnsupportedEntry);
  }
}

TEST_F(PodCopyTest, FileFromPodToLocalFileRefusesADirectory) {
  channel->push(FakeScript{.stdout_data = make_archive(
                               {directory_entry("conf"),
                                bytes_entry("conf/a.yaml", "AAA\n"),
                                bytes_entry("conf/b.yaml", "BBB\n")})});

  try {
    copy.copy_file_from_pod(pod_path("/etc/conf"), tmp / "conf.yaml");
    FAIL() << "a remote directory must not be written as one file";
  } catch (const DecodeError &e) {
    EXPECT_EQ(e.kind(), DecodeError::Kind::UnsupportedEntry);
  }
  EXPECT_FALSE(fs::exists(tmp / "conf.yaml"));
}
