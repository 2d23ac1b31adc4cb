/**
 * @file openldap_connection.h
 * @brief OpenLDAP implementation of the directory collaborator
 */

#pragma once

#include <ldapauth/directory.h>

#include <ldap.h>
#include <memory>
#include <string>

namespace ldapauth {

/**
 * @brief Directory session over an OpenLDAP handle
 *
 * Owns the LDAP* handle and unbinds it on close() or destruction.
 */
class OpenLdapConnection : public IDirectoryConnection {
private:
    LDAP* ld_;
    std::string uri_;

public:
    OpenLdapConnection(LDAP* ld, std::string uri)
        : ld_(ld), uri_(std::move(uri)) {}

    ~OpenLdapConnection() override;

    OpenLdapConnection(const OpenLdapConnection&) = delete;
    OpenLdapConnection& operator=(const OpenLdapConnection&) = delete;

    void bind(const std::string& dn, const std::string& password) override;

    SearchResult search(const SearchRequest& request) override;

    void close() override;

    const std::string& uri() const { return uri_; }

    /**
     * @brief True for the result codes libldap reports once the link is gone
     */
    static bool isConnectionLost(int rc) {
        return rc == LDAP_SERVER_DOWN || rc == LDAP_CONNECT_ERROR;
    }
};

/**
 * @brief Opens OpenLDAP sessions
 *
 * URI is ldap://host:port, or ldaps://host:port when useSsl is set. The
 * session is connected eagerly (ldap_connect) so that dial and TLS
 * handshake failures are reported by dial().
 */
class OpenLdapDialer : public IDirectoryDialer {
public:
    std::unique_ptr<IDirectoryConnection> dial(const ClientConfig& config) override;

    static std::string buildUri(const ClientConfig& config);
};

} // namespace ldapauth
