/**
 * @file test_config.cpp
 * @brief Unit tests for ClientConfig validation and environment loading
 */

#include <gtest/gtest.h>
#include <ldapauth/config.h>
#include <ldapauth/exceptions.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace ldapauth;

namespace {

const char* const kEnvVars[] = {
    "LDAP_HOST", "LDAP_PORT", "LDAP_USE_SSL", "LDAP_INSECURE_SKIP_VERIFY",
    "LDAP_BIND_DN", "LDAP_BIND_PASSWORD", "LDAP_BASE_DN", "LDAP_USER_FILTER",
    "LDAP_GROUP_FILTER", "LDAP_ATTRIBUTES", "LDAP_CA_CERT_FILE",
    "LDAP_CLIENT_CERT_FILE", "LDAP_CLIENT_KEY_FILE", "LDAP_NETWORK_TIMEOUT",
};

} // namespace

class ConfigEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const char* name : kEnvVars) {
            unsetenv(name);
        }
    }
};

// ============================================================================
// validate()
// ============================================================================

TEST(ConfigValidateTest, DefaultsAreValid) {
    ClientConfig config;
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigValidateTest, EmptyHost) {
    ClientConfig config;
    config.host = "";
    EXPECT_THROW(config.validate(), ConfigException);
}

TEST(ConfigValidateTest, PortOutOfRange) {
    ClientConfig config;
    config.port = 0;
    EXPECT_THROW(config.validate(), ConfigException);
    config.port = 70000;
    EXPECT_THROW(config.validate(), ConfigException);
}

TEST(ConfigValidateTest, UserFilterNeedsExactlyOneSlot) {
    ClientConfig config;
    config.userFilter = "(uid=alice)";
    EXPECT_THROW(config.validate(), ConfigException);
    config.userFilter = "(|(uid=%s)(mail=%s))";
    EXPECT_THROW(config.validate(), ConfigException);
}

// ============================================================================
// fromEnvironment()
// ============================================================================

TEST_F(ConfigEnvTest, NoVariables_Defaults) {
    auto config = ClientConfig::fromEnvironment();
    EXPECT_EQ(config.host, "localhost");
    EXPECT_EQ(config.port, 389);
    EXPECT_FALSE(config.useSsl);
    EXPECT_EQ(config.userFilter, "(uid=%s)");
    EXPECT_TRUE(config.attributes.empty());
}

TEST_F(ConfigEnvTest, AllScalars) {
    setenv("LDAP_HOST", "ldap.example.com", 1);
    setenv("LDAP_PORT", "636", 1);
    setenv("LDAP_USE_SSL", "true", 1);
    setenv("LDAP_INSECURE_SKIP_VERIFY", "yes", 1);
    setenv("LDAP_BIND_DN", "cn=svc,dc=example,dc=com", 1);
    setenv("LDAP_BIND_PASSWORD", "secret", 1);
    setenv("LDAP_BASE_DN", "dc=example,dc=com", 1);
    setenv("LDAP_USER_FILTER", "(sAMAccountName=%s)", 1);
    setenv("LDAP_GROUP_FILTER", "(memberUid=%s)", 1);
    setenv("LDAP_ATTRIBUTES", " mail, cn ,,uid ", 1);
    setenv("LDAP_NETWORK_TIMEOUT", "10", 1);

    auto config = ClientConfig::fromEnvironment();

    EXPECT_EQ(config.host, "ldap.example.com");
    EXPECT_EQ(config.port, 636);
    EXPECT_TRUE(config.useSsl);
    EXPECT_TRUE(config.insecureSkipVerify);
    EXPECT_EQ(config.bindDn, "cn=svc,dc=example,dc=com");
    EXPECT_EQ(config.bindPassword, "secret");
    EXPECT_EQ(config.base, "dc=example,dc=com");
    EXPECT_EQ(config.userFilter, "(sAMAccountName=%s)");
    EXPECT_EQ(config.groupFilter, "(memberUid=%s)");
    EXPECT_EQ(config.attributes, (std::vector<std::string>{"mail", "cn", "uid"}));
    EXPECT_EQ(config.networkTimeoutSec, 10);
}

TEST_F(ConfigEnvTest, InvalidIntegers_DefaultOrClamped) {
    setenv("LDAP_PORT", "not-a-port", 1);
    setenv("LDAP_NETWORK_TIMEOUT", "9999", 1);

    auto config = ClientConfig::fromEnvironment();

    EXPECT_EQ(config.port, 389);
    EXPECT_EQ(config.networkTimeoutSec, 300);
}

TEST_F(ConfigEnvTest, InvalidBoolean_Default) {
    setenv("LDAP_USE_SSL", "maybe", 1);
    EXPECT_FALSE(ClientConfig::fromEnvironment().useSsl);
}

TEST_F(ConfigEnvTest, CaCertFileRead) {
    std::string path = ::testing::TempDir() + "ldapauth_test_ca.pem";
    {
        std::ofstream out(path);
        out << "-----BEGIN CERTIFICATE-----\nAAAA\n-----END CERTIFICATE-----\n";
    }
    setenv("LDAP_CA_CERT_FILE", path.c_str(), 1);

    auto config = ClientConfig::fromEnvironment();
    EXPECT_NE(config.caCertificates.find("BEGIN CERTIFICATE"), std::string::npos);

    std::remove(path.c_str());
}

TEST_F(ConfigEnvTest, MissingCaCertFile_ConfigError) {
    setenv("LDAP_CA_CERT_FILE", "/nonexistent/ldapauth/ca.pem", 1);
    EXPECT_THROW(ClientConfig::fromEnvironment(), ConfigException);
}

TEST_F(ConfigEnvTest, ClientCertWithoutKey_ConfigError) {
    setenv("LDAP_CLIENT_CERT_FILE", "/tmp/cert.pem", 1);
    EXPECT_THROW(ClientConfig::fromEnvironment(), ConfigException);
}
