#include <kube-pod-copy/detail/channel-protocol.hxx>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <sstream>

namespace kube_pod_copy::detail {
namespace pt = boost::property_tree;

namespace {
const char *flag(bool value) { return value ? "true" : "false"; }

bool is_unreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
         c == '~';
}
} // unnamed namespace

std::string url_encode(std::string_view value) {
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (is_unreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0f]);
    }
  }
  return out;
}

std::string exec_request_target(const std::string &base_path,
                                const CopyTarget &target,
                                const std::vector<std::string> &command,
                                const ExecStreamFlags &flags) {
  std::string out = base_path + "/api/v1/namespaces/" +
                    url_encode(target.namespace_name) + "/pods/" +
                    url_encode(target.pod_name) + "/exec";
  out += "?stdin=";
  out += flag(flags.want_stdin);
  out += "&stdout=";
  out += flag(flags.want_stdout);
  out += "&stderr=";
  out += flag(flags.want_stderr);
  out += "&tty=";
  out += flag(flags.tty);
  for (const auto &token : command)
    out += "&command=" + url_encode(token);
  if (!target.container_name.empty())
    out += "&container=" + url_encode(target.container_name);
  return out;
}

std::string make_frame(StreamChannel channel, std::string_view payload) {
  std::string frame;
  frame.reserve(payload.size() + 1);
  frame.push_back(static_cast<char>(channel));
  frame.append(payload);
  return frame;
}

ExecStatus parse_status(const std::string &document) {
  ExecStatus status;
  pt::ptree tree;
  try {
    std::istringstream in(document);
    pt::read_json(in, tree);
  } catch (const pt::json_parser_error &) {
    status.reason = "InvalidStatus";
    status.message = document;
    return status;
  }

  status.message = tree.get<std::string>("message", "");
  if (tree.get<std::string>("status", "") == "Success") {
    status.success = true;
    status.exit_code = 0;
    status.reason = "Success";
    return status;
  }

  status.reason = tree.get<std::string>("reason", "Failure");
  if (auto causes = tree.get_child_optional("details.causes")) {
    for (const auto &cause : *causes) {
      if (cause.second.get<std::string>("reason", "") != "ExitCode")
        continue;
      try {
        status.exit_code = std::stoi(cause.second.get<std::string>("message"));
      } catch (const std::exception &) {
        status.exit_code = -1;
      }
    }
  }
  return status;
}
} // namespace kube_pod_copy::detail
