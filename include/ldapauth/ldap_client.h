/**
 * @file ldap_client.h
 * @brief LDAP authentication client
 *
 * Usage:
 * @code
 *   ldapauth::ClientConfig config = ldapauth::ClientConfig::fromEnvironment();
 *   ldapauth::LdapClient client(config);
 *   client.open();
 *   auto result = client.authenticate("alice", password);
 *   if (result.authenticated) { ... (*result.attributes)["mail"] ... }
 * @endcode
 *
 * Not thread-safe: the session and its bound identity are shared state.
 * Serialize calls externally or use one client per thread.
 */

#pragma once

#include <ldapauth/authenticator.h>
#include <ldapauth/binder.h>
#include <ldapauth/config.h>
#include <ldapauth/connection_manager.h>
#include <ldapauth/directory.h>

#include <memory>
#include <string>

namespace ldapauth {

/**
 * @brief Interface for LDAP authentication clients
 */
class ILdapClient {
public:
    virtual ~ILdapClient() = default;

    /**
     * @brief Bind as the configured service identity
     * @throws LdapAuthException subclasses
     */
    virtual void bind() = 0;

    virtual AuthResult authenticate(const std::string& username, const std::string& password) = 0;

    virtual void close() = 0;
};

class LdapClient : public ILdapClient {
public:
    /**
     * @brief Create a disconnected client using the OpenLDAP dialer
     */
    explicit LdapClient(ClientConfig config);

    /**
     * @brief Create a disconnected client with a custom session factory
     * @throws std::invalid_argument if dialer is null
     */
    LdapClient(ClientConfig config, std::shared_ptr<IDirectoryDialer> dialer);

    ~LdapClient() override;

    LdapClient(const LdapClient&) = delete;
    LdapClient& operator=(const LdapClient&) = delete;
    LdapClient(LdapClient&&) = delete;
    LdapClient& operator=(LdapClient&&) = delete;

    /**
     * @brief Validate the configuration, connect and bind as the service identity
     *
     * On failure the client is closed again and stays usable: open() or
     * connect() may be called later.
     *
     * @throws LdapAuthException subclasses
     */
    void open();

    /**
     * @brief (Re)connect without binding
     * @throws ConnectionException
     */
    void connect();

    void bind() override;

    AuthResult authenticate(const std::string& username, const std::string& password) override;

    void close() override;

    bool isConnected() const { return connections_.isConnected(); }

    int disconnectRetryCount() const { return binder_.disconnectRetryCount(); }

    const ClientConfig& config() const { return config_; }

private:
    // Declaration order matters: later members hold references to earlier ones
    const ClientConfig config_;
    ConnectionManager connections_;
    Binder binder_;
    Authenticator authenticator_;
};

} // namespace ldapauth
