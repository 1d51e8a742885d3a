#include <kube-pod-copy/copy-target.hxx>

#include <stdexcept>

namespace kube_pod_copy {
namespace {
// Drops trailing slashes but keeps a lone "/".
std::string trimmed(const std::string &path) {
  auto end = path.find_last_not_of('/');
  if (end == std::string::npos)
    return path.empty() ? path : std::string("/");
  return path.substr(0, end + 1);
}
} // unnamed namespace

void CopyTarget::validate() const {
  if (namespace_name.empty())
    throw std::invalid_argument("copy target: namespace must not be empty");
  if (pod_name.empty())
    throw std::invalid_argument("copy target: pod name must not be empty");
  if (path.empty())
    throw std::invalid_argument("copy target: path must not be empty");
  if (path.front() != '/')
    throw std::invalid_argument("copy target: path must be absolute: " + path);
}

std::string CopyTarget::parent_path() const {
  auto p = trimmed(path);
  auto slash = p.find_last_of('/');
  if (slash == std::string::npos || slash == 0)
    return "/";
  return p.substr(0, slash);
}

std::string CopyTarget::file_name() const {
  auto p = trimmed(path);
  if (p == "/")
    return {};
  auto slash = p.find_last_of('/');
  return slash == std::string::npos ? p : p.substr(slash + 1);
}

std::string CopyTarget::describe() const {
  std::string out = namespace_name + "/" + pod_name;
  if (!container_name.empty())
    out += "[" + container_name + "]";
  return out + ":" + path;
}
} // namespace kube_pod_copy
