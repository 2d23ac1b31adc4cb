/**
 * @file openldap_connection.cpp
 * @brief OpenLDAP session and dialer
 */

#include <ldapauth/openldap_connection.h>
#include <ldapauth/exceptions.h>
#include <ldapauth/tls_material.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <system_error>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace ldapauth {

namespace {

struct MessageDeleter { void operator()(LDAPMessage* m) const { ldap_msgfree(m); } };
using UniqueMessage = std::unique_ptr<LDAPMessage, MessageDeleter>;

int toLdapScope(SearchScope scope) {
    switch (scope) {
        case SearchScope::BASE:      return LDAP_SCOPE_BASE;
        case SearchScope::ONE_LEVEL: return LDAP_SCOPE_ONELEVEL;
        case SearchScope::SUBTREE:   return LDAP_SCOPE_SUBTREE;
    }
    return LDAP_SCOPE_SUBTREE;
}

int toLdapDeref(DerefAliases deref) {
    switch (deref) {
        case DerefAliases::NEVER:     return LDAP_DEREF_NEVER;
        case DerefAliases::SEARCHING: return LDAP_DEREF_SEARCHING;
        case DerefAliases::FINDING:   return LDAP_DEREF_FINDING;
        case DerefAliases::ALWAYS:    return LDAP_DEREF_ALWAYS;
    }
    return LDAP_DEREF_NEVER;
}

/**
 * @brief Private (0600) temporary file holding PEM material
 *
 * libldap reads TLS material from files when the session context is
 * created. The file is removed on destruction.
 */
class TempPemFile {
private:
    std::string path_;

public:
    explicit TempPemFile(const std::string& contents) {
        std::error_code ec;
        std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            throw ConnectionException("no temporary directory for TLS files: " + ec.message());
        }
        std::string pattern = (dir / "ldapauth-XXXXXX").string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');

        int fd = mkstemp(name.data());
        if (fd < 0) {
            throw ConnectionException(std::string("cannot create temporary TLS file: ") + std::strerror(errno));
        }
        path_ = name.data();

        size_t written = 0;
        while (written < contents.size()) {
            ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                int err = errno;
                ::close(fd);
                ::unlink(path_.c_str());
                throw ConnectionException(std::string("cannot write temporary TLS file: ") + std::strerror(err));
            }
            written += static_cast<size_t>(n);
        }
        ::close(fd);
    }

    ~TempPemFile() {
        ::unlink(path_.c_str());
    }

    TempPemFile(const TempPemFile&) = delete;
    TempPemFile& operator=(const TempPemFile&) = delete;

    const std::string& path() const { return path_; }
};

void setOption(LDAP* ld, int option, const void* value, const char* name) {
    int rc = ldap_set_option(ld, option, value);
    if (rc != LDAP_OPT_SUCCESS) {
        throw ConnectionException(std::string("ldap_set_option ") + name + " failed: " + ldap_err2string(rc));
    }
}

} // namespace

// --- OpenLdapConnection ---

OpenLdapConnection::~OpenLdapConnection() {
    close();
}

void OpenLdapConnection::bind(const std::string& dn, const std::string& password) {
    if (!ld_) {
        throw ConnectionException("session to " + uri_ + " is closed");
    }

    struct berval cred;
    cred.bv_val = const_cast<char*>(password.c_str());
    cred.bv_len = password.length();

    int rc = ldap_sasl_bind_s(ld_, dn.c_str(), LDAP_SASL_SIMPLE, &cred, nullptr, nullptr, nullptr);
    if (rc == LDAP_SUCCESS) {
        spdlog::debug("LDAP bind succeeded: dn={}", dn);
        return;
    }

    if (isConnectionLost(rc)) {
        throw ConnectionException("bind as '" + dn + "' on " + uri_ + ": " + ldap_err2string(rc), true);
    }
    throw ProtocolException("bind as '" + dn + "' failed: " + ldap_err2string(rc), rc);
}

SearchResult OpenLdapConnection::search(const SearchRequest& request) {
    if (!ld_) {
        throw ConnectionException("session to " + uri_ + " is closed");
    }

    int deref = toLdapDeref(request.derefAliases);
    int rc = ldap_set_option(ld_, LDAP_OPT_DEREF, &deref);
    if (rc != LDAP_OPT_SUCCESS) {
        throw ProtocolException(std::string("ldap_set_option DEREF failed: ") + ldap_err2string(rc), rc);
    }

    std::vector<char*> attrs;
    attrs.reserve(request.attributes.size() + 1);
    for (const auto& attr : request.attributes) {
        attrs.push_back(const_cast<char*>(attr.c_str()));
    }
    attrs.push_back(nullptr);

    struct timeval timeout = {request.timeLimit, 0};

    LDAPMessage* raw = nullptr;
    rc = ldap_search_ext_s(ld_, request.baseDn.c_str(), toLdapScope(request.scope),
                           request.filter.c_str(),
                           request.attributes.empty() ? nullptr : attrs.data(),
                           request.typesOnly ? 1 : 0,
                           nullptr, nullptr,
                           request.timeLimit > 0 ? &timeout : nullptr,
                           request.sizeLimit, &raw);
    UniqueMessage message(raw);

    if (rc != LDAP_SUCCESS) {
        throw ProtocolException("search " + request.filter + " under '" + request.baseDn +
                                "' failed: " + ldap_err2string(rc), rc);
    }

    SearchResult result;
    for (LDAPMessage* entry = ldap_first_entry(ld_, message.get()); entry != nullptr;
         entry = ldap_next_entry(ld_, entry)) {
        DirectoryEntry item;

        if (char* dn = ldap_get_dn(ld_, entry)) {
            item.dn = dn;
            ldap_memfree(dn);
        }

        BerElement* ber = nullptr;
        for (char* attr = ldap_first_attribute(ld_, entry, &ber); attr != nullptr;
             attr = ldap_next_attribute(ld_, entry, ber)) {
            auto& values = item.attributes[attr];
            if (struct berval** vals = ldap_get_values_len(ld_, entry, attr)) {
                for (int i = 0; vals[i] != nullptr; ++i) {
                    values.emplace_back(vals[i]->bv_val, vals[i]->bv_len);
                }
                ldap_value_free_len(vals);
            }
            ldap_memfree(attr);
        }
        if (ber) {
            ber_free(ber, 0);
        }

        result.entries.push_back(std::move(item));
    }

    spdlog::debug("LDAP search {} under '{}' returned {} entries",
                  request.filter, request.baseDn, result.entries.size());
    return result;
}

void OpenLdapConnection::close() {
    if (ld_) {
        ldap_unbind_ext_s(ld_, nullptr, nullptr);
        ld_ = nullptr;
        spdlog::debug("LDAP session to {} closed", uri_);
    }
}

// --- OpenLdapDialer ---

std::string OpenLdapDialer::buildUri(const ClientConfig& config) {
    return std::string(config.useSsl ? "ldaps://" : "ldap://") + config.host + ":" + std::to_string(config.port);
}

std::unique_ptr<IDirectoryConnection> OpenLdapDialer::dial(const ClientConfig& config) {
    std::string uri = buildUri(config);

    // Certificate material is checked before anything touches the network
    TlsMaterial material;
    if (config.useSsl) {
        material = prepareTlsMaterial(config);
    }

    LDAP* ld = nullptr;
    int rc = ldap_initialize(&ld, uri.c_str());
    if (rc != LDAP_SUCCESS) {
        throw ConnectionException("ldap_initialize failed for " + uri + ": " + ldap_err2string(rc));
    }
    // From here on the handle is released by the connection's destructor
    auto connection = std::make_unique<OpenLdapConnection>(ld, uri);

    int version = LDAP_VERSION3;
    setOption(ld, LDAP_OPT_PROTOCOL_VERSION, &version, "PROTOCOL_VERSION");
    setOption(ld, LDAP_OPT_REFERRALS, LDAP_OPT_OFF, "REFERRALS");

    if (config.networkTimeoutSec > 0) {
        struct timeval timeout = {config.networkTimeoutSec, 0};
        rc = ldap_set_option(ld, LDAP_OPT_NETWORK_TIMEOUT, &timeout);
        if (rc != LDAP_OPT_SUCCESS) {
            spdlog::warn("ldap_set_option NETWORK_TIMEOUT failed: {}", ldap_err2string(rc));
        }
    }

    std::optional<TempPemFile> caFile;
    std::optional<TempPemFile> certFile;
    std::optional<TempPemFile> keyFile;

    if (config.useSsl) {
        int requireCert = config.insecureSkipVerify ? LDAP_OPT_X_TLS_NEVER : LDAP_OPT_X_TLS_DEMAND;
        setOption(ld, LDAP_OPT_X_TLS_REQUIRE_CERT, &requireCert, "X_TLS_REQUIRE_CERT");

        if (material.hasCaCertificates()) {
            caFile.emplace(material.caPem);
            setOption(ld, LDAP_OPT_X_TLS_CACERTFILE, caFile->path().c_str(), "X_TLS_CACERTFILE");
        }
        if (material.hasClientCertificate()) {
            certFile.emplace(material.clientCertPem);
            keyFile.emplace(material.clientKeyPem);
            setOption(ld, LDAP_OPT_X_TLS_CERTFILE, certFile->path().c_str(), "X_TLS_CERTFILE");
            setOption(ld, LDAP_OPT_X_TLS_KEYFILE, keyFile->path().c_str(), "X_TLS_KEYFILE");
        }

        // Build the per-session client context from the options above
        int isServer = 0;
        rc = ldap_set_option(ld, LDAP_OPT_X_TLS_NEWCTX, &isServer);
        if (rc != LDAP_OPT_SUCCESS) {
            throw ConnectionException(std::string("TLS context setup failed for ") + uri + ": " +
                                      ldap_err2string(rc));
        }
    }

    rc = ldap_connect(ld);
    if (rc != LDAP_SUCCESS) {
        throw ConnectionException("cannot connect to " + uri + ": " + ldap_err2string(rc));
    }

    spdlog::info("LDAP connection established: {}", uri);
    return connection;
}

} // namespace ldapauth
