/**
 * @file tls_material.h
 * @brief TLS trust and client identity material for ldaps:// sessions
 *
 * Certificate and key bytes from the configuration are parsed with OpenSSL
 * before any network I/O, so malformed material is reported as a
 * ConnectionException without dialing. The normalized PEM is what the
 * directory session hands to its TLS layer.
 *
 * Memory ownership: OpenSSL objects are returned in unique_ptr wrappers.
 */

#pragma once

#include <ldapauth/config.h>

#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace ldapauth {

struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using UniqueX509 = std::unique_ptr<X509, X509Deleter>;

struct PKeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
using UniqueKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

/**
 * @brief Validated TLS material in PEM form
 */
struct TlsMaterial {
    std::string caPem;          ///< Trusted CAs, empty = system default trust store
    size_t caCount = 0;
    std::string clientCertPem;  ///< Leaf followed by intermediates, empty = no client auth
    std::string clientKeyPem;

    bool hasCaCertificates() const { return !caPem.empty(); }
    bool hasClientCertificate() const { return !clientCertPem.empty(); }
};

/**
 * @brief Parse every PEM certificate block in a buffer
 *
 * Blocks of other types and certificate blocks that fail to decode are
 * skipped; parsing continues with the next block.
 *
 * @return Parsed certificates, empty if none could be parsed
 */
std::vector<UniqueX509> parseCertificatesPem(const std::string& pem);

/**
 * @brief Parse a PEM private key (PKCS#8 or traditional)
 * @return Key, or nullptr if the buffer holds no parseable key
 */
UniqueKey parsePrivateKeyPem(const std::string& pem);

/**
 * @brief Encode certificates back to PEM
 */
std::string certificatesToPem(const std::vector<UniqueX509>& certs);

/**
 * @brief Validate and normalize the TLS material of a configuration
 *
 * Only the first client certificate is presented; libldap holds a single
 * certificate per session.
 *
 * @throws ConnectionException if CA bytes contain no certificate, a client
 *         certificate or key fails to parse, or a key does not match its
 *         certificate
 */
TlsMaterial prepareTlsMaterial(const ClientConfig& config);

} // namespace ldapauth
