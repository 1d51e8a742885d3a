#include <kube-pod-copy/capability-probe.hxx>
#include <kube-pod-copy/detail/pump-group.hxx>
#include <kube-pod-copy/errors.hxx>
#include <kube-pod-copy/logging.hxx>

namespace kube_pod_copy {
namespace {
constexpr std::size_t probe_output_limit = 4096;
constexpr const char *gnu_tar_signature = "GNU tar";
} // unnamed namespace

const char *to_string(ProbeResult result) noexcept {
  switch (result) {
  case ProbeResult::Supported:
    return "supported";
  case ProbeResult::Unsupported:
    return "unsupported";
  }
  return "unknown";
}

std::vector<std::string> CapabilityProbe::command() {
  return {"sh", "-c", "tar --version"};
}

ExecStreamFlags CapabilityProbe::flags() {
  return ExecStreamFlags{.want_stdin = false,
                         .want_stdout = true,
                         .want_stderr = true,
                         .tty = false};
}

ProbeReport CapabilityProbe::run(const CopyTarget &target,
                                 const CopyOptions &options) {
  const auto what = "probing tar in " + target.namespace_name + "/" +
                    target.pod_name;
  if (options.stop_token.stop_requested())
    throw CopyError(CopyError::Kind::Cancelled, what + " was cancelled");

  auto session = channel_.open(target, command(), flags());
  detail::SessionGuard guard(*session, options);

  ProbeReport report;
  {
    detail::PumpGroup pumps([&session] { session->cancel(); });
    pumps.spawn("probe stderr", [&] {
      report.error_output = detail::drain_stream(
          *session, detail::OutputStream::Stderr, probe_output_limit);
    });
    pumps.spawn("probe stdout", [&] {
      report.output = detail::drain_stream(
          *session, detail::OutputStream::Stdout, probe_output_limit);
    });
    pumps.join();
    guard.check(what);
    if (auto error = pumps.first_error())
      std::rethrow_exception(error);
  }

  try {
    report.status = session->wait();
  } catch (const ChannelError &) {
    guard.check(what);
    throw;
  }
  guard.disarm();
  if (report.status.success &&
      report.output.find(gnu_tar_signature) != std::string::npos)
    report.result = ProbeResult::Supported;

  BOOST_LOG_TRIVIAL(info) << "tar in " << target.namespace_name << "/"
                           << target.pod_name << " is "
                           << to_string(report.result) << " (exit "
                           << report.status.exit_code << ")";
  if (report.result == ProbeResult::Unsupported)
    BOOST_LOG_TRIVIAL(debug) << "probe output: " << report.output
                              << report.error_output;
  return report;
}
} // namespace kube_pod_copy
