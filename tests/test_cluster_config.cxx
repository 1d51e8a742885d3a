#include <kube-pod-copy/cluster-config.hxx>
#include <kube-pod-copy/errors.hxx>

#include "test-support.hxx"

#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

using namespace kube_pod_copy;
using namespace kube_pod_copy::test;

namespace {
/**
 * @brief Sets an environment variable for the lifetime of the object.
 */
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    if (auto old = std::getenv(name))
      previous_ = old;
    if (value)
      ::setenv(name, value, 1);
    else
      ::unsetenv(name);
  }

  ~ScopedEnv() {
    if (previous_.empty())
      ::unsetenv(name_);
    else
      ::setenv(name_, previous_.c_str(), 1);
  }

private:
  const char *name_;
  std::string previous_;
};
} // unnamed namespace

TEST(ClusterConfig, SetServerParsesSchemeHostPortAndBase) {
  ClusterConfig config;
  config.set_server("https://api.example.com:6443/proxy/");
  EXPECT_TRUE(config.use_tls);
  EXPECT_EQ(config.host, "api.example.com");
  EXPECT_EQ(config.port, 6443);
  EXPECT_EQ(config.base_path, "/proxy");
  EXPECT_EQ(config.server(), "https://api.example.com:6443/proxy");
}

TEST(ClusterConfig, SetServerDefaultsThePortPerScheme) {
  ClusterConfig config;
  config.set_server("http://127.0.0.1");
  EXPECT_FALSE(config.use_tls);
  EXPECT_EQ(config.port, 80);
  EXPECT_EQ(config.base_path, "");

  config.set_server("https://kubernetes.default.svc");
  EXPECT_TRUE(config.use_tls);
  EXPECT_EQ(config.port, 443);
}

TEST(ClusterConfig, SetServerAcceptsBracketedIPv6) {
  ClusterConfig config;
  config.set_server("https://[fd00::1]:8443");
  EXPECT_EQ(config.host, "fd00::1");
  EXPECT_EQ(config.port, 8443);
  EXPECT_EQ(config.server(), "https://[fd00::1]:8443");
}

TEST(ClusterConfig, SetServerRejectsMalformedUrls) {
  ClusterConfig config;
  EXPECT_THROW(config.set_server("ftp://host"), ConfigError);
  EXPECT_THROW(config.set_server("host:443"), ConfigError);
  EXPECT_THROW(config.set_server("https://host:http"), ConfigError);
  EXPECT_THROW(config.set_server("https://host:70000"), ConfigError);
  EXPECT_THROW(config.set_server("https://[::1"), ConfigError);
  EXPECT_THROW(config.set_server("https://:443"), ConfigError);

  EXPECT_EQ(config.host, "localhost");
}

TEST(ClusterConfig, FromFileResolvesRelativePaths) {
  TempDir tmp;
  write_file(tmp / "token", "abc.def.ghi\n");
  write_file(tmp / "cluster.json", R"({
    "server": "https://10.0.0.1:6443",
    "token_file": "token",
    "certificate_authority": "ca.pem",
    "insecure_skip_tls_verify": false,
    "connect_timeout_seconds": 5,
    "unknown_key": "ignored"
  })");

  auto config = ClusterConfig::from_file(tmp / "cluster.json");
  EXPECT_EQ(config.host, "10.0.0.1");
  EXPECT_EQ(config.port, 6443);
  EXPECT_EQ(config.bearer_token, "abc.def.ghi");
  EXPECT_EQ(config.ca_file, tmp / "ca.pem");
  EXPECT_FALSE(config.insecure_skip_tls_verify);
  EXPECT_EQ(config.connect_timeout, std::chrono::seconds(5));
}

TEST(ClusterConfig, FromFileReportsBadInput) {
  TempDir tmp;
  EXPECT_THROW(ClusterConfig::from_file(tmp / "missing.json"), ConfigError);

  write_file(tmp / "broken.json", "{ \"server\": ");
  EXPECT_THROW(ClusterConfig::from_file(tmp / "broken.json"), ConfigError);

  write_file(tmp / "timeout.json", R"({"connect_timeout_seconds": "soon"})");
  EXPECT_THROW(ClusterConfig::from_file(tmp / "timeout.json"), ConfigError);

  write_file(tmp / "token.json", R"({"token_file": "nowhere"})");
  EXPECT_THROW(ClusterConfig::from_file(tmp / "token.json"), ConfigError);
}

TEST(ClusterConfig, EnvironmentOverridesServerAndToken) {
  ScopedEnv server("KUBE_POD_COPY_SERVER", "http://localhost:8001");
  ScopedEnv token("KUBE_POD_COPY_TOKEN", "from-env");

  ClusterConfig config;
  config.bearer_token = "from-file";
  config.apply_environment();
  EXPECT_FALSE(config.use_tls);
  EXPECT_EQ(config.port, 8001);
  EXPECT_EQ(config.bearer_token, "from-env");
}

TEST(ClusterConfig, InClusterNeedsTheServiceEnvironment) {
  ScopedEnv host("KUBERNETES_SERVICE_HOST", nullptr);
  ScopedEnv port("KUBERNETES_SERVICE_PORT", nullptr);
  EXPECT_THROW(ClusterConfig::in_cluster(), ConfigError);
}
