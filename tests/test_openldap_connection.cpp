/**
 * @file test_openldap_connection.cpp
 * @brief Unit tests for the OpenLDAP dialer that need no directory server
 */

#include <gtest/gtest.h>
#include <ldapauth/exceptions.h>
#include <ldapauth/openldap_connection.h>
#include "test_helpers.h"

#include <cstdlib>
#include <string>

using namespace ldapauth;

TEST(OpenLdapDialerTest, BuildUri_Plain) {
    ClientConfig config;
    config.host = "ldap.example.com";
    config.port = 389;
    EXPECT_EQ(OpenLdapDialer::buildUri(config), "ldap://ldap.example.com:389");
}

TEST(OpenLdapDialerTest, BuildUri_Ssl) {
    ClientConfig config;
    config.host = "ldap.example.com";
    config.port = 636;
    config.useSsl = true;
    EXPECT_EQ(OpenLdapDialer::buildUri(config), "ldaps://ldap.example.com:636");
}

TEST(OpenLdapDialerTest, ConnectionLostCodes) {
    EXPECT_TRUE(OpenLdapConnection::isConnectionLost(LDAP_SERVER_DOWN));
    EXPECT_TRUE(OpenLdapConnection::isConnectionLost(LDAP_CONNECT_ERROR));
    EXPECT_FALSE(OpenLdapConnection::isConnectionLost(LDAP_INVALID_CREDENTIALS));
    EXPECT_FALSE(OpenLdapConnection::isConnectionLost(LDAP_SUCCESS));
}

TEST(OpenLdapDialerTest, MalformedCa_FailsBeforeNetwork) {
    ClientConfig config;
    // Unresolvable name: reaching the network would report a different error
    config.host = "ldapauth.invalid";
    config.port = 636;
    config.useSsl = true;
    config.caCertificates = "this is not PEM";

    OpenLdapDialer dialer;
    try {
        dialer.dial(config);
        FAIL() << "expected ConnectionException";
    } catch (const ConnectionException& e) {
        EXPECT_NE(std::string(e.what()).find("could not append CA certs from PEM"), std::string::npos);
    }
}

TEST(OpenLdapDialerTest, Unreachable_ConnectionError) {
    ClientConfig config;
    config.host = "127.0.0.1";
    config.port = 1;
    config.networkTimeoutSec = 2;

    OpenLdapDialer dialer;
    EXPECT_THROW(dialer.dial(config), ConnectionException);
}

TEST(OpenLdapDialerTest, BadTempDirectory_ConnectionError) {
    auto key = test_helpers::generateEcKey();
    ASSERT_TRUE(key);
    auto ca = test_helpers::createSelfSigned(key.get(), "Test Directory CA");

    ClientConfig config;
    config.host = "127.0.0.1";
    config.port = 1;
    config.useSsl = true;
    config.caCertificates = test_helpers::certToPem(ca.get());

    const char* saved = std::getenv("TMPDIR");
    std::string previous = saved ? saved : "";
    setenv("TMPDIR", "/nonexistent/ldapauth-tmp", 1);

    OpenLdapDialer dialer;
    try {
        dialer.dial(config);
        ADD_FAILURE() << "expected ConnectionException";
    } catch (const ConnectionException& e) {
        EXPECT_FALSE(e.peerClosed());
    } catch (const std::exception& e) {
        ADD_FAILURE() << "unexpected exception type: " << e.what();
    }

    if (saved) {
        setenv("TMPDIR", previous.c_str(), 1);
    } else {
        unsetenv("TMPDIR");
    }
}
