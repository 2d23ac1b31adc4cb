/**
 * @file tls_material.cpp
 * @brief OpenSSL parsing and validation of TLS material
 */

#include <ldapauth/tls_material.h>
#include <ldapauth/exceptions.h>

#include <cstring>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>

namespace ldapauth {

namespace {

struct BioDeleter { void operator()(BIO* p) const { BIO_free(p); } };
using UniqueBio = std::unique_ptr<BIO, BioDeleter>;

UniqueBio memoryBio(const std::string& data) {
    return UniqueBio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
}

std::string bioToString(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    return (len > 0 && data) ? std::string(data, static_cast<size_t>(len)) : std::string();
}

std::string privateKeyToPem(EVP_PKEY* key) {
    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        ERR_clear_error();
        throw ConnectionException("could not encode client private key");
    }
    return bioToString(bio.get());
}

} // namespace

std::vector<UniqueX509> parseCertificatesPem(const std::string& pem) {
    std::vector<UniqueX509> certs;
    if (pem.empty()) {
        return certs;
    }

    auto bio = memoryBio(pem);
    if (!bio) {
        return certs;
    }

    while (true) {
        size_t remaining = BIO_ctrl_pending(bio.get());

        char* name = nullptr;
        char* header = nullptr;
        unsigned char* data = nullptr;
        long len = 0;
        if (PEM_read_bio(bio.get(), &name, &header, &data, &len) != 1) {
            unsigned long err = ERR_peek_last_error();
            ERR_clear_error();
            // End of input, or a failure that consumed nothing
            if (ERR_GET_REASON(err) == PEM_R_NO_START_LINE ||
                BIO_ctrl_pending(bio.get()) >= remaining) {
                break;
            }
            spdlog::debug("Skipping undecodable PEM block");
            continue;
        }

        if (std::strcmp(name, PEM_STRING_X509) == 0 ||
            std::strcmp(name, PEM_STRING_X509_OLD) == 0 ||
            std::strcmp(name, PEM_STRING_X509_TRUSTED) == 0) {
            const unsigned char* p = data;
            X509* cert = std::strcmp(name, PEM_STRING_X509_TRUSTED) == 0
                ? d2i_X509_AUX(nullptr, &p, len)
                : d2i_X509(nullptr, &p, len);
            if (cert) {
                certs.emplace_back(cert);
            } else {
                ERR_clear_error();
                spdlog::debug("Skipping malformed certificate block");
            }
        }

        OPENSSL_free(name);
        OPENSSL_free(header);
        OPENSSL_free(data);
    }

    return certs;
}

UniqueKey parsePrivateKeyPem(const std::string& pem) {
    if (pem.empty()) {
        return nullptr;
    }
    auto bio = memoryBio(pem);
    UniqueKey key(bio ? PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr) : nullptr);
    ERR_clear_error();
    return key;
}

std::string certificatesToPem(const std::vector<UniqueX509>& certs) {
    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        return "";
    }
    for (const auto& cert : certs) {
        if (PEM_write_bio_X509(bio.get(), cert.get()) != 1) {
            ERR_clear_error();
            return "";
        }
    }
    return bioToString(bio.get());
}

TlsMaterial prepareTlsMaterial(const ClientConfig& config) {
    TlsMaterial material;

    if (!config.caCertificates.empty()) {
        auto caCerts = parseCertificatesPem(config.caCertificates);
        if (caCerts.empty()) {
            throw ConnectionException("could not append CA certs from PEM");
        }
        material.caPem = certificatesToPem(caCerts);
        material.caCount = caCerts.size();
        spdlog::debug("TLS trust store: {} CA certificate(s) from config", material.caCount);
    }

    if (config.clientCertificates.empty()) {
        return material;
    }

    if (config.clientCertificates.size() > 1) {
        spdlog::warn("{} client certificates configured, only the first is presented",
                     config.clientCertificates.size());
    }

    const ClientCertificate& clientCert = config.clientCertificates.front();
    auto chain = parseCertificatesPem(clientCert.certificatePem);
    if (chain.empty()) {
        throw ConnectionException("could not parse client certificate from PEM");
    }

    auto key = parsePrivateKeyPem(clientCert.privateKeyPem);
    if (!key) {
        throw ConnectionException("could not parse client private key from PEM");
    }

    if (X509_check_private_key(chain.front().get(), key.get()) != 1) {
        ERR_clear_error();
        throw ConnectionException("client private key does not match client certificate");
    }

    material.clientCertPem = certificatesToPem(chain);
    material.clientKeyPem = privateKeyToPem(key.get());
    return material;
}

} // namespace ldapauth
