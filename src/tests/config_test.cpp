#include <gtest/gtest.h>
#include <map>
#include "cache/errors.hpp"
#include "config/config.hpp"
#include "test_utils.hpp"

using namespace rcache;
using namespace rcache::config;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }

  EnvLookup lookup() {
    return [this](const std::string& name) -> std::optional<std::string> {
      auto it = env.find(name);
      if (it == env.end()) {
        return std::nullopt;
      }
      return it->second;
    };
  }

  std::map<std::string, std::string> env;
};

TEST_F(ConfigTest, ReadsEnvironment) {
  env[ENV_REMOTE_CACHE_URL] = "grpc://cache.example.com";
  env[ENV_API_KEY] = "secret";
  env[ENV_VERSION_SALT] = "2.0";
  env[ENV_UPLOAD_CHUNK_SIZE] = "131072";

  Config config = Config::from_environment(lookup());
  EXPECT_EQ(config.remote_cache_url, "grpc://cache.example.com");
  EXPECT_EQ(config.credential, "secret");
  EXPECT_EQ(config.salt, "2.0");
  ASSERT_TRUE(config.max_frame_bytes.has_value());
  EXPECT_EQ(*config.max_frame_bytes, 131072u);
  EXPECT_TRUE(config.is_enabled());
  EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, DefaultsWhenUnset) {
  Config config = Config::from_environment(lookup());
  EXPECT_EQ(config.salt, "1.0");
  EXPECT_FALSE(config.max_frame_bytes.has_value());
  EXPECT_FALSE(config.is_enabled());
}

TEST_F(ConfigTest, MissingRequiredValuesAreConfigErrors) {
  Config config = Config::from_environment(lookup());
  EXPECT_THROW(config.validate(), ConfigError);

  config.remote_cache_url = "localhost:9092";
  EXPECT_FALSE(config.is_enabled());
  EXPECT_THROW(config.validate(), ConfigError);

  config.credential = "secret";
  EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, InvalidChunkSize) {
  env[ENV_UPLOAD_CHUNK_SIZE] = "64k";
  EXPECT_THROW(Config::from_environment(lookup()), ConfigError);
}

TEST_F(ConfigTest, EndpointForms) {
  auto plain = parse_endpoint("localhost:9092");
  EXPECT_EQ(plain.host, "localhost");
  EXPECT_EQ(plain.port, 9092);

  auto tcp = parse_endpoint("tcp://10.0.0.5:7000");
  EXPECT_EQ(tcp.host, "10.0.0.5");
  EXPECT_EQ(tcp.port, 7000);

  auto grpc = parse_endpoint("grpc://cache.example.com");
  EXPECT_EQ(grpc.host, "cache.example.com");
  EXPECT_EQ(grpc.port, 80);

  auto with_path = parse_endpoint("grpc://cache.example.com:8980/instance");
  EXPECT_EQ(with_path.host, "cache.example.com");
  EXPECT_EQ(with_path.port, 8980);
}

TEST_F(ConfigTest, MalformedEndpoints) {
  EXPECT_THROW(parse_endpoint("localhost"), ConfigError);
  EXPECT_THROW(parse_endpoint(":9092"), ConfigError);
  EXPECT_THROW(parse_endpoint("localhost:port"), ConfigError);
  EXPECT_THROW(parse_endpoint("localhost:70000"), ConfigError);
  EXPECT_THROW(parse_endpoint("http://localhost:80"), ConfigError);
}

TEST_F(ConfigTest, TlsEndpointsAreRejected) {
  EXPECT_THROW(parse_endpoint("grpcs://cache.example.com"), ConfigError);
  EXPECT_THROW(parse_endpoint("grpcs://cache.example.com:8443"), ConfigError);

  Config config;
  config.remote_cache_url = "grpcs://cache.example.com";
  config.credential = "secret";
  EXPECT_THROW(config.validate(), ConfigError);
}
