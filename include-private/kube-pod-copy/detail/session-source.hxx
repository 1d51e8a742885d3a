#pragma once

#include <kube-pod-copy/exec-channel.hxx>

#include <boost/iostreams/categories.hpp>

#include <ios>

namespace kube_pod_copy::detail {
/**
 * @brief Boost.Iostreams source reading the stdout of an exec session.
 *
 * Does not own the session.
 */
class SessionStdoutSource {
public:
  using char_type = char;
  using category = boost::iostreams::source_tag;

  explicit SessionStdoutSource(ExecSession &session) : session_(&session) {}

  std::streamsize read(char *s, std::streamsize n) {
    return session_->read_stdout(s, n);
  }

private:
  ExecSession *session_;
};
} // namespace kube_pod_copy::detail
