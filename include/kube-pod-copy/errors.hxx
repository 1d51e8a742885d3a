/**
 * @file errors.hxx
 * @brief Exception hierarchy reported by pod copy operations.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace kube_pod_copy {
/**
 * @brief Common base for every error raised by this library.
 *
 * Callers that do not care about the failure category can catch this type;
 * the derived classes carry a `kind()` for finer dispatch.
 */
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Failure to open or keep an exec channel to a container.
 */
class ChannelError : public Error {
public:
  enum class Kind {
    NotFound,         /**< @brief Pod/container missing or upgrade refused. */
    ConnectionFailed, /**< @brief Transport failure (DNS, TCP, TLS, I/O). */
    Aborted           /**< @brief The session was cancelled locally. */
  };

  ChannelError(Kind kind, const std::string &message);

  Kind kind() const noexcept { return kind_; }

private:
  Kind kind_;
};

/**
 * @brief Failure while producing an archive from the local filesystem.
 */
class EncodeError : public Error {
public:
  enum class Kind { LocalIOFailure, UnsupportedEntry };

  EncodeError(Kind kind, const std::string &path, const std::string &message);

  Kind kind() const noexcept { return kind_; }
  /// Local path that caused the failure.
  const std::string &path() const noexcept { return path_; }

private:
  Kind kind_;
  std::string path_;
};

/**
 * @brief Failure while materializing an archive stream locally.
 */
class DecodeError : public Error {
public:
  enum class Kind {
    PathTraversal,    /**< @brief Entry would land outside the root. */
    Truncated,        /**< @brief Stream ended inside a header or entry. */
    LocalIOFailure,   /**< @brief Local create/write failed. */
    UnsupportedEntry, /**< @brief Symlink, hard link or special file. */
    MalformedHeader   /**< @brief Checksum mismatch or unusable header. */
  };

  DecodeError(Kind kind, const std::string &entry, const std::string &message);

  Kind kind() const noexcept { return kind_; }
  /// Archive entry name being processed, empty when not applicable.
  const std::string &entry() const noexcept { return entry_; }

private:
  Kind kind_;
  std::string entry_;
};

/**
 * @brief Failure of a copy session after the channel was opened.
 */
class CopyError : public Error {
public:
  enum class Kind { RemoteCommandFailed, Cancelled, TimedOut };

  CopyError(Kind kind, const std::string &message, int exit_code = -1,
            std::string remote_stderr = {});

  Kind kind() const noexcept { return kind_; }
  /// Remote exit code, -1 when unknown.
  int exit_code() const noexcept { return exit_code_; }
  /// Captured (possibly clipped) standard error of the remote command.
  const std::string &remote_stderr() const noexcept { return remote_stderr_; }

private:
  Kind kind_;
  int exit_code_;
  std::string remote_stderr_;
};

/**
 * @brief The container cannot take part in a directory copy.
 *
 * Raised before any data channel is opened.
 */
class CopyNotSupportedException : public Error {
public:
  enum class Kind { IncompatibleRemoteTar };

  CopyNotSupportedException(Kind kind, const std::string &message);

  Kind kind() const noexcept { return kind_; }

private:
  Kind kind_;
};

/**
 * @brief Unusable cluster configuration.
 */
class ConfigError : public Error {
public:
  using Error::Error;
};

const char *to_string(ChannelError::Kind kind) noexcept;
const char *to_string(EncodeError::Kind kind) noexcept;
const char *to_string(DecodeError::Kind kind) noexcept;
const char *to_string(CopyError::Kind kind) noexcept;
} // namespace kube_pod_copy
