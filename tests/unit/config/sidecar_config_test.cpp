#include <gtest/gtest.h>

#include <sidecar/config/config_helpers.h>
#include <sidecar/config/sidecar_config.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using namespace sidecar::config;

namespace {

fs::path make_temp_dir(const std::string& prefix = "sidecar-cfg-test-") {
    auto base = fs::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned long long> dist;
    fs::path dir;
    for (int i = 0; i < 5; ++i) {
        dir = base / (prefix + std::to_string(dist(gen)));
        if (!fs::exists(dir)) {
            fs::create_directories(dir);
            break;
        }
    }
    return dir;
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = make_temp_dir(); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write(const std::string& content) {
        auto path = dir_ / "config.toml";
        std::ofstream out(path, std::ios::trunc);
        out << content;
        return path;
    }

    fs::path dir_;
};

} // namespace

TEST(SidecarConfigTest, DefaultPortWhenUnset) {
    MapNameResolver resolver;
    EXPECT_EQ(SidecarConfig::fromEnvironment(resolver).baseAddress, "http://localhost:3500");
}

TEST(SidecarConfigTest, PortFromResolver) {
    MapNameResolver resolver(std::unordered_map<std::string, std::string>{{"DAPR_HTTP_PORT", "3601"}});
    EXPECT_EQ(SidecarConfig::fromEnvironment(resolver).baseAddress, "http://localhost:3601");
}

TEST(SidecarConfigTest, UnparseablePortFallsBackToDefault) {
    for (const char* bad : {"", "abc", "35O0", "3500x", "-1", "70000"}) {
        SCOPED_TRACE(bad);
        MapNameResolver resolver(std::unordered_map<std::string, std::string>{{"DAPR_HTTP_PORT", bad}});
        EXPECT_EQ(SidecarConfig::fromEnvironment(resolver).baseAddress, "http://localhost:3500");
    }
}

TEST(SidecarConfigTest, PortWithSurroundingWhitespaceIsAccepted) {
    MapNameResolver resolver(std::unordered_map<std::string, std::string>{{"DAPR_HTTP_PORT", " 3502 "}});
    EXPECT_EQ(SidecarConfig::fromEnvironment(resolver).baseAddress, "http://localhost:3502");
}

TEST(SidecarConfigTest, EnvironmentResolverReadsProcessEnvironment) {
    ::setenv("SIDECAR_TEST_RESOLVER_VALUE", "hello", 1);
    EnvironmentNameResolver resolver;
    EXPECT_EQ(resolver.resolve("SIDECAR_TEST_RESOLVER_VALUE").value_or(""), "hello");
    ::unsetenv("SIDECAR_TEST_RESOLVER_VALUE");
    EXPECT_FALSE(resolver.resolve("SIDECAR_TEST_RESOLVER_VALUE").has_value());
}

TEST(SidecarConfigTest, StripTrailingSlashRemovesOneSlash) {
    EXPECT_EQ(stripTrailingSlash("http://h:1/"), "http://h:1");
    EXPECT_EQ(stripTrailingSlash("http://h:1"), "http://h:1");
    EXPECT_EQ(stripTrailingSlash(""), "");
}

TEST(ConfigHelpersTest, ParseIntIsStrict) {
    EXPECT_EQ(parse_int("42").value_or(-1), 42);
    EXPECT_EQ(parse_int(" 42 ").value_or(-1), 42);
    EXPECT_FALSE(parse_int("42ms").has_value());
    EXPECT_FALSE(parse_int("").has_value());
    EXPECT_FALSE(parse_ms("-5").has_value());
    EXPECT_EQ(parse_ms("250").value_or(std::chrono::milliseconds(0)).count(), 250);
}

TEST_F(ConfigFileTest, ReadsSidecarSection) {
    auto path = write(R"(# sidecar client settings
[other]
http_port = 1

[sidecar]
http_port = 3700
timeout_ms = 1500   # per request
connect_timeout_ms = "250"
)");
    MapNameResolver resolver;
    auto cfg = loadSidecarConfig(path, resolver);
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().baseAddress, "http://localhost:3700");
    EXPECT_EQ(cfg.value().timeout.count(), 1500);
    EXPECT_EQ(cfg.value().connectTimeout.count(), 250);
}

TEST_F(ConfigFileTest, DottedKeysAreSupported) {
    auto path = write("sidecar.address = \"http://sidecar.local:3500/\"\n");
    MapNameResolver resolver;
    auto cfg = loadSidecarConfig(path, resolver);
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().baseAddress, "http://sidecar.local:3500");
}

TEST_F(ConfigFileTest, QuotedValueKeepsHashAndDropsTrailingComment) {
    auto path = write("[sidecar]\naddress = \"http://h:1/#x\"  # trailing\n");
    EXPECT_EQ(parse_config_value(path, "sidecar", "address"), "http://h:1/#x");
}

TEST_F(ConfigFileTest, EnvironmentPortOverridesFile) {
    auto path = write("[sidecar]\naddress = \"http://elsewhere:1\"\n");
    MapNameResolver resolver(std::unordered_map<std::string, std::string>{{"DAPR_HTTP_PORT", "3900"}});
    auto cfg = loadSidecarConfig(path, resolver);
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().baseAddress, "http://localhost:3900");
}

TEST_F(ConfigFileTest, InvalidEnvironmentPortKeepsFileValue) {
    auto path = write("[sidecar]\nhttp_port = 3800\n");
    MapNameResolver resolver(std::unordered_map<std::string, std::string>{{"DAPR_HTTP_PORT", "not-a-port"}});
    auto cfg = loadSidecarConfig(path, resolver);
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().baseAddress, "http://localhost:3800");
}

TEST_F(ConfigFileTest, InvalidTimeoutIsAnError) {
    auto path = write("[sidecar]\ntimeout_ms = soon\n");
    MapNameResolver resolver;
    auto cfg = loadSidecarConfig(path, resolver);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, sidecar::ErrorCode::InvalidArgument);
}

TEST_F(ConfigFileTest, MissingFileUsesDefaults) {
    MapNameResolver resolver;
    auto cfg = loadSidecarConfig(dir_ / "absent.toml", resolver);
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().baseAddress, "http://localhost:3500");
    EXPECT_EQ(cfg.value().timeout.count(), 60000);
}

TEST(ConfigPathTest, OverrideAndEnvironment) {
    EXPECT_EQ(get_config_path("/tmp/x.toml"), fs::path("/tmp/x.toml"));

    ::setenv("SIDECAR_CONFIG", "/etc/sidecar/config.toml", 1);
    EXPECT_EQ(get_config_path(), fs::path("/etc/sidecar/config.toml"));
    ::unsetenv("SIDECAR_CONFIG");

    ::setenv("XDG_CONFIG_HOME", "/xdg", 1);
    EXPECT_EQ(get_config_path(), fs::path("/xdg/sidecar/config.toml"));
    ::unsetenv("XDG_CONFIG_HOME");
}
