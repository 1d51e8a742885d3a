#include <kube-pod-copy/cluster-config.hxx>
#include <kube-pod-copy/errors.hxx>
#include <kube-pod-copy/logging.hxx>
#include <kube-pod-copy/pod-copy.hxx>

#include <boost/program_options.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace fs = std::filesystem;
using namespace kube_pod_copy;

namespace {
constexpr int exit_copy_failed = 1;
constexpr int exit_usage = 2;

struct RemotePath {
  std::string namespace_name;
  std::string pod_name;
  std::string path;
};

/**
 * @brief Parse `[namespace/]pod:/path`.
 *
 * Anything else, including relative remote paths, is a local path.
 */
std::optional<RemotePath> parse_remote(const std::string &arg) {
  auto colon = arg.find(':');
  if (colon == std::string::npos || colon == 0)
    return std::nullopt;
  auto pod = arg.substr(0, colon);
  auto path = arg.substr(colon + 1);
  if (path.empty() || path.front() != '/')
    return std::nullopt;

  RemotePath remote;
  auto slash = pod.find('/');
  if (slash != std::string::npos) {
    if (pod.find('/', slash + 1) != std::string::npos || slash == 0 ||
        slash + 1 == pod.size())
      return std::nullopt;
    remote.namespace_name = pod.substr(0, slash);
    pod = pod.substr(slash + 1);
  }
  remote.pod_name = pod;
  remote.path = path;
  return remote;
}

void print_usage(std::ostream &out, const po::options_description &options) {
  out << "Usage: kube-pod-cp [options] SRC DEST\n"
         "\n"
         "Exactly one of SRC and DEST names a container path, written as\n"
         "[namespace/]pod:/absolute/path. DEST may be '-' to write a remote\n"
         "file to standard output.\n"
         "\n"
      << options << "\n";
}

ClusterConfig load_config(const po::variables_map &vm) {
  ClusterConfig config;
  if (vm.count("config"))
    config = ClusterConfig::from_file(vm["config"].as<std::string>());
  else if (std::getenv("KUBERNETES_SERVICE_HOST"))
    config = ClusterConfig::in_cluster();
  config.apply_environment();

  if (vm.count("server"))
    config.set_server(vm["server"].as<std::string>());
  if (vm.count("token"))
    config.bearer_token = vm["token"].as<std::string>();
  if (vm["insecure-skip-tls-verify"].as<bool>())
    config.insecure_skip_tls_verify = true;
  return config;
}

int copy_to_pod(PodCopy &copy, CopyTarget target, const fs::path &local,
                const CopyOptions &options) {
  if (fs::is_directory(local)) {
    copy.copy_directory_to_pod(target, local, options);
    return EXIT_SUCCESS;
  }
  if (target.path.back() == '/')
    target.path += local.filename().string();
  copy.copy_file_to_pod(target, local, options);
  return EXIT_SUCCESS;
}

int copy_from_pod(PodCopy &copy, const CopyTarget &target,
                  const std::string &local, bool recursive,
                  const CopyOptions &options) {
  if (recursive) {
    copy.copy_directory_from_pod(target, local, options);
    return EXIT_SUCCESS;
  }

  if (local == "-") {
    auto in = copy.copy_file_from_pod(target, options);
    std::vector<char> buffer(64 * 1024);
    while (in->read(buffer.data(), static_cast<std::streamsize>(buffer.size())),
           in->gcount() > 0)
      std::cout.write(buffer.data(), in->gcount());
    std::cout.flush();
    return std::cout ? EXIT_SUCCESS : exit_copy_failed;
  }

  fs::path destination(local);
  if (fs::is_directory(destination))
    destination /= target.file_name();
  copy.copy_file_from_pod(target, destination, options);
  return EXIT_SUCCESS;
}
} // unnamed namespace

int main(int argc, char *argv[]) {
  po::options_description visible("Options");
  // clang-format off
  visible.add_options()
    ("help,h", "show this help")
    ("container,c", po::value<std::string>()->default_value(""),
     "container name, defaults to the pod's default container")
    ("namespace,n", po::value<std::string>()->default_value("default"),
     "namespace of pods given without one")
    ("recursive,r", po::bool_switch(),
     "copy a directory out of the pod")
    ("config", po::value<std::string>(), "JSON cluster configuration file")
    ("server", po::value<std::string>(), "API server URL")
    ("token", po::value<std::string>(), "bearer token")
    ("insecure-skip-tls-verify", po::bool_switch(),
     "do not verify the API server certificate")
    ("timeout", po::value<unsigned>()->default_value(0),
     "abort the copy after this many seconds, 0 for no limit")
    ("verbose,v", po::bool_switch(), "log debug messages");
  // clang-format on

  po::options_description hidden;
  hidden.add_options()("paths", po::value<std::vector<std::string>>());
  po::options_description all;
  all.add(visible).add(hidden);
  po::positional_options_description positional;
  positional.add("paths", -1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << "kube-pod-cp: " << e.what() << "\n";
    print_usage(std::cerr, visible);
    return exit_usage;
  }

  if (vm.count("help")) {
    print_usage(std::cout, visible);
    return EXIT_SUCCESS;
  }

  init_logging(LogOptions{.min_severity = vm["verbose"].as<bool>()
                                              ? boost::log::trivial::debug
                                              : boost::log::trivial::warning});

  std::vector<std::string> paths;
  if (vm.count("paths"))
    paths = vm["paths"].as<std::vector<std::string>>();
  if (paths.size() != 2) {
    print_usage(std::cerr, visible);
    return exit_usage;
  }

  auto source = parse_remote(paths[0]);
  auto destination = parse_remote(paths[1]);
  if (source.has_value() == destination.has_value()) {
    std::cerr << "kube-pod-cp: exactly one of SRC and DEST must be a "
                 "container path\n";
    return exit_usage;
  }

  const auto &remote = source ? *source : *destination;
  CopyTarget target{.namespace_name = remote.namespace_name.empty()
                                          ? vm["namespace"].as<std::string>()
                                          : remote.namespace_name,
                    .pod_name = remote.pod_name,
                    .container_name = vm["container"].as<std::string>(),
                    .path = remote.path};

  CopyOptions options;
  options.timeout = std::chrono::seconds(vm["timeout"].as<unsigned>());

  try {
    PodCopy copy(load_config(vm));
    if (destination)
      return copy_to_pod(copy, target, paths[0], options);
    return copy_from_pod(copy, target, paths[1], vm["recursive"].as<bool>(),
                         options);
  } catch (const ConfigError &e) {
    std::cerr << "kube-pod-cp: " << e.what() << "\n";
    return exit_usage;
  } catch (const std::invalid_argument &e) {
    std::cerr << "kube-pod-cp: " << e.what() << "\n";
    return exit_usage;
  } catch (const CopyError &e) {
    std::cerr << "kube-pod-cp: " << e.what() << "\n";
    if (!e.remote_stderr().empty())
      std::cerr << e.remote_stderr();
    return exit_copy_failed;
  } catch (const Error &e) {
    std::cerr << "kube-pod-cp: " << e.what() << "\n";
    return exit_copy_failed;
  } catch (const std::ios_base::failure &e) {
    std::cerr << "kube-pod-cp: " << e.what() << "\n";
    return exit_copy_failed;
  }
}
