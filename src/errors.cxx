#include <kube-pod-copy/errors.hxx>

#include <utility>

namespace kube_pod_copy {
namespace {
std::string with_subject(const std::string &subject,
                         const std::string &message) {
  if (subject.empty())
    return message;
  return subject + ": " + message;
}
} // unnamed namespace

ChannelError::ChannelError(Kind kind, const std::string &message)
    : Error(std::string("exec channel ") + to_string(kind) + ": " + message),
      kind_(kind) {}

EncodeError::EncodeError(Kind kind, const std::string &path,
                         const std::string &message)
    : Error(with_subject(path, message)), kind_(kind), path_(path) {}

DecodeError::DecodeError(Kind kind, const std::string &entry,
                         const std::string &message)
    : Error(with_subject(entry, message)), kind_(kind), entry_(entry) {}

CopyError::CopyError(Kind kind, const std::string &message, int exit_code,
                     std::string remote_stderr)
    : Error(message), kind_(kind), exit_code_(exit_code),
      remote_stderr_(std::move(remote_stderr)) {}

CopyNotSupportedException::CopyNotSupportedException(Kind kind,
                                                     const std::string &message)
    : Error(message), kind_(kind) {}

const char *to_string(ChannelError::Kind kind) noexcept {
  switch (kind) {
  case ChannelError::Kind::NotFound:
    return "not found";
  case ChannelError::Kind::ConnectionFailed:
    return "connection failed";
  case ChannelError::Kind::Aborted:
    return "aborted";
  }
  return "unknown";
}

const char *to_string(EncodeError::Kind kind) noexcept {
  switch (kind) {
  case EncodeError::Kind::LocalIOFailure:
    return "local I/O failure";
  case EncodeError::Kind::UnsupportedEntry:
    return "unsupported entry";
  }
  return "unknown";
}

const char *to_string(DecodeError::Kind kind) noexcept {
  switch (kind) {
  case DecodeError::Kind::PathTraversal:
    return "path traversal";
  case DecodeError::Kind::Truncated:
    return "truncated";
  case DecodeError::Kind::LocalIOFailure:
    return "local I/O failure";
  case DecodeError::Kind::UnsupportedEntry:
    return "unsupported entry";
  case DecodeError::Kind::MalformedHeader:
    return "malformed header";
  }
  return "unknown";
}

const char *to_string(CopyError::Kind kind) noexcept {
  switch (kind) {
  case CopyError::Kind::RemoteCommandFailed:
    return "remote command failed";
  case CopyError::Kind::Cancelled:
    return "cancelled";
  case CopyError::Kind::TimedOut:
    return "timed out";
  }
  return "unknown";
}
} // namespace kube_pod_copy
