/**
 * @file config.h
 * @brief LDAP client configuration
 *
 * Immutable for the lifetime of a client. Can be filled in directly or
 * loaded from environment variables.
 */

#pragma once

#include <string>
#include <vector>

namespace ldapauth {

/**
 * @brief Client certificate presented during the TLS handshake
 */
struct ClientCertificate {
    std::string certificatePem;  ///< Leaf certificate followed by optional intermediates
    std::string privateKeyPem;   ///< Private key matching the leaf certificate
};

struct ClientConfig {
    std::string host = "localhost";
    int port = 389;

    bool useSsl = false;
    bool insecureSkipVerify = false;
    std::string caCertificates;                        // Raw PEM bytes, empty = system trust store
    std::vector<ClientCertificate> clientCertificates;

    // Service identity used for lookups
    std::string bindDn;
    std::string bindPassword;

    std::string base;
    std::string userFilter = "(uid=%s)";   // %s replaced with the escaped username
    std::string groupFilter;               // e.g. "(memberUid=%s)", not used for authentication
    std::vector<std::string> attributes;

    int networkTimeoutSec = 5;

    /**
     * @brief Check the values that can be checked without a server
     * @throws ConfigException on empty host, port out of range or a
     *         userFilter without exactly one %s slot
     */
    void validate() const;

    /**
     * @brief Build a configuration from LDAP_* environment variables
     *
     * Unset variables keep the defaults above.
     *
     * @throws ConfigException when a referenced certificate file cannot be read
     */
    static ClientConfig fromEnvironment();

    // Safe environment variable integer parser with range clamping
    static int envStoi(const char* val, int defaultVal, int minVal, int maxVal);

    static bool envBool(const char* val, bool defaultVal);
};

} // namespace ldapauth
