#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "config/provider_config.hpp"

namespace {

const char* kVars[] = {
    "ALPACA_API_KEY", "ALPACA_API_SECRET", "APCA_API_KEY_ID", "APCA_API_SECRET_KEY",
    "ALPACA_DATA_URL", "ALPACA_STREAM_URL", "ALPACA_FEED", "MDCORE_TEST_A", "MDCORE_TEST_B",
    "MDCORE_TEST_C", "MDCORE_TEST_D",
};

class ProviderConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override {
        clear();
        if (!env_path.empty()) std::remove(env_path.c_str());
    }

    static void clear() {
        for (const char* v : kVars) unsetenv(v);
    }

    std::string write_env(const std::string& contents) {
        env_path = ::testing::TempDir() + "mdcore_test_" + std::to_string(::getpid()) + ".env";
        std::ofstream out(env_path);
        out << contents;
        return env_path;
    }

    std::string env_path;
};

} // namespace

TEST_F(ProviderConfigTest, DefaultEndpoints) {
    const ProviderEndpoints ep = default_endpoints("Alpaca");
    EXPECT_EQ(ep.rest_base, "https://data.alpaca.markets");
    EXPECT_EQ(ep.stream_url, "wss://stream.data.alpaca.markets/v2/iex");
    EXPECT_EQ(ep.feed, "iex");
    EXPECT_TRUE(default_endpoints("etrade").stream_url.empty());
}

TEST_F(ProviderConfigTest, ReadsVendorPrefixedCredentials) {
    setenv("ALPACA_API_KEY", "key-id", 1);
    setenv("ALPACA_API_SECRET", "secret-key", 1);

    const ProviderConfig cfg = provider_config_from_env("alpaca");

    EXPECT_EQ(cfg.vendor, "alpaca");
    EXPECT_EQ(cfg.credential.api_key, "key-id");
    ASSERT_TRUE(cfg.credential.api_secret.has_value());
    EXPECT_EQ(*cfg.credential.api_secret, "secret-key");
    EXPECT_EQ(cfg.endpoints.rest_base, "https://data.alpaca.markets");
}

TEST_F(ProviderConfigTest, FallsBackToAlpacaSdkVariables) {
    setenv("APCA_API_KEY_ID", "sdk-key", 1);
    setenv("APCA_API_SECRET_KEY", "sdk-secret", 1);

    const ProviderConfig cfg = provider_config_from_env("alpaca");

    EXPECT_EQ(cfg.credential.api_key, "sdk-key");
    EXPECT_EQ(cfg.credential.api_secret, "sdk-secret");
}

TEST_F(ProviderConfigTest, MissingKeyNamesTheVariable) {
    try {
        (void)provider_config_from_env("alpaca");
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("ALPACA_API_KEY"), std::string::npos);
    }
}

TEST_F(ProviderConfigTest, FeedSelectsStreamPath) {
    setenv("ALPACA_API_KEY", "k", 1);
    setenv("ALPACA_FEED", "SIP", 1);
    setenv("ALPACA_DATA_URL", "https://sandbox.test/", 1);

    const ProviderConfig cfg = provider_config_from_env("alpaca");

    EXPECT_EQ(cfg.endpoints.feed, "sip");
    EXPECT_EQ(cfg.endpoints.stream_url, "wss://stream.data.alpaca.markets/v2/sip");
    EXPECT_EQ(cfg.endpoints.rest_base, "https://sandbox.test");
    EXPECT_FALSE(cfg.credential.api_secret.has_value());
}

TEST_F(ProviderConfigTest, ExplicitStreamUrlWins) {
    setenv("ALPACA_API_KEY", "k", 1);
    setenv("ALPACA_FEED", "sip", 1);
    setenv("ALPACA_STREAM_URL", "wss://stream.test/v2/test", 1);

    EXPECT_EQ(provider_config_from_env("alpaca").endpoints.stream_url, "wss://stream.test/v2/test");
}

TEST_F(ProviderConfigTest, RejectsUnknownFeed) {
    setenv("ALPACA_API_KEY", "k", 1);
    setenv("ALPACA_FEED", "otc", 1);
    EXPECT_THROW((void)provider_config_from_env("alpaca"), std::runtime_error);
}

TEST_F(ProviderConfigTest, LoadEnvFileParsesAndKeepsExistingValues) {
    setenv("MDCORE_TEST_C", "from-process", 1);
    const std::string path = write_env(
        "# comment\n"
        "MDCORE_TEST_A=plain\n"
        "MDCORE_TEST_B = \"quoted value\"\n"
        "MDCORE_TEST_C=from-file\n"
        "export MDCORE_TEST_D='single'\n"
        "not a pair\n");

    ASSERT_TRUE(load_env_file(path));

    EXPECT_STREQ(std::getenv("MDCORE_TEST_A"), "plain");
    EXPECT_STREQ(std::getenv("MDCORE_TEST_B"), "quoted value");
    EXPECT_STREQ(std::getenv("MDCORE_TEST_C"), "from-process");
    EXPECT_STREQ(std::getenv("MDCORE_TEST_D"), "single");
}

TEST_F(ProviderConfigTest, MissingEnvFileIsNotAnError) {
    EXPECT_FALSE(load_env_file("/nonexistent/mdcore.env"));
}
