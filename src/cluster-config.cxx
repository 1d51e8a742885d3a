#include <kube-pod-copy/cluster-config.hxx>
#include <kube-pod-copy/errors.hxx>
#include <kube-pod-copy/logging.hxx>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>

namespace kube_pod_copy {
namespace pt = boost::property_tree;
namespace fs = std::filesystem;

namespace {
const fs::path service_account_dir =
    "/var/run/secrets/kubernetes.io/serviceaccount";

std::string read_token_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw ConfigError("cannot read token file " + path.string());
  std::string token((std::istreambuf_iterator<char>(in)),
                    std::istreambuf_iterator<char>());
  while (!token.empty() && (token.back() == '\n' || token.back() == '\r' ||
                            token.back() == ' '))
    token.pop_back();
  return token;
}

std::uint16_t parse_port(const std::string &text) {
  if (text.empty() ||
      text.find_first_not_of("0123456789") != std::string::npos)
    throw ConfigError("invalid port '" + text + "'");
  auto value = std::stoul(text);
  if (value == 0 || value > std::numeric_limits<std::uint16_t>::max())
    throw ConfigError("port out of range '" + text + "'");
  return static_cast<std::uint16_t>(value);
}

const char *getenv_or_null(const char *name) {
  auto value = std::getenv(name);
  return value && *value ? value : nullptr;
}
} // unnamed namespace

void ClusterConfig::set_server(const std::string &url) {
  std::string rest;
  if (url.rfind("https://", 0) == 0) {
    use_tls = true;
    rest = url.substr(8);
  } else if (url.rfind("http://", 0) == 0) {
    use_tls = false;
    rest = url.substr(7);
  } else {
    throw ConfigError("server URL must start with http:// or https://: " +
                      url);
  }

  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  std::string path = slash == std::string::npos ? "" : rest.substr(slash);
  while (!path.empty() && path.back() == '/')
    path.pop_back();

  std::string new_host;
  std::uint16_t new_port = use_tls ? 443 : 80;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos)
      throw ConfigError("unterminated IPv6 literal in " + url);
    new_host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':')
        throw ConfigError("malformed authority in " + url);
      new_port = parse_port(authority.substr(close + 2));
    }
  } else {
    auto colon = authority.rfind(':');
    new_host = authority.substr(0, colon);
    if (colon != std::string::npos)
      new_port = parse_port(authority.substr(colon + 1));
  }
  if (new_host.empty())
    throw ConfigError("server URL has no host: " + url);

  host = new_host;
  port = new_port;
  base_path = path;
}

std::string ClusterConfig::server() const {
  std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  return std::string(use_tls ? "https://" : "http://") + h + ":" +
         std::to_string(port) + base_path;
}

ClusterConfig ClusterConfig::in_cluster() {
  auto service_host = getenv_or_null("KUBERNETES_SERVICE_HOST");
  auto service_port = getenv_or_null("KUBERNETES_SERVICE_PORT");
  if (!service_host || !service_port)
    throw ConfigError("not running in a cluster: KUBERNETES_SERVICE_HOST and "
                      "KUBERNETES_SERVICE_PORT must be set");

  ClusterConfig config;
  config.use_tls = true;
  config.host = service_host;
  config.port = parse_port(service_port);
  config.bearer_token = read_token_file(service_account_dir / "token");
  if (fs::exists(service_account_dir / "ca.crt"))
    config.ca_file = service_account_dir / "ca.crt";
  return config;
}

ClusterConfig ClusterConfig::from_file(const fs::path &path) {
  pt::ptree tree;
  try {
    pt::read_json(path.string(), tree);
  } catch (const pt::json_parser_error &e) {
    throw ConfigError("cannot load " + path.string() + ": " + e.what());
  }

  ClusterConfig config;
  try {
    if (auto server = tree.get_optional<std::string>("server"))
      config.set_server(*server);
    if (auto token = tree.get_optional<std::string>("token"))
      config.bearer_token = *token;
    if (auto token_file = tree.get_optional<std::string>("token_file")) {
      fs::path token_path = *token_file;
      if (token_path.is_relative())
        token_path = path.parent_path() / token_path;
      config.bearer_token = read_token_file(token_path);
    }
    if (auto ca = tree.get_optional<std::string>("certificate_authority")) {
      config.ca_file = *ca;
      if (config.ca_file.is_relative())
        config.ca_file = path.parent_path() / config.ca_file;
    }
    if (auto insecure = tree.get_optional<bool>("insecure_skip_tls_verify"))
      config.insecure_skip_tls_verify = *insecure;
    if (auto timeout = tree.get_optional<int>("connect_timeout_seconds")) {
      if (*timeout <= 0)
        throw ConfigError("connect_timeout_seconds must be positive");
      config.connect_timeout = std::chrono::seconds(*timeout);
    }
  } catch (const pt::ptree_bad_data &e) {
    throw ConfigError("invalid value in " + path.string() + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "loaded cluster config from " << path
                            << ", server " << config.server();
  return config;
}

void ClusterConfig::apply_environment() {
  if (auto server = getenv_or_null("KUBE_POD_COPY_SERVER"))
    set_server(server);
  if (auto token = getenv_or_null("KUBE_POD_COPY_TOKEN"))
    bearer_token = token;
}
} // namespace kube_pod_copy
