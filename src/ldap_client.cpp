/**
 * @file ldap_client.cpp
 * @brief LdapClient implementation
 */

#include <ldapauth/ldap_client.h>
#include <ldapauth/exceptions.h>
#include <ldapauth/openldap_connection.h>

#include <spdlog/spdlog.h>

namespace ldapauth {

LdapClient::LdapClient(ClientConfig config)
    : LdapClient(std::move(config), std::make_shared<OpenLdapDialer>()) {}

LdapClient::LdapClient(ClientConfig config, std::shared_ptr<IDirectoryDialer> dialer)
    : config_(std::move(config)),
      connections_(config_, std::move(dialer)),
      binder_(config_, connections_),
      authenticator_(config_, connections_, binder_) {}

LdapClient::~LdapClient() {
    close();
}

void LdapClient::open() {
    try {
        config_.validate();
        connections_.connect();
        binder_.bindService();
    } catch (const LdapAuthException& e) {
        spdlog::debug("LDAP client open failed for {}:{}: {}", config_.host, config_.port, e.what());
        close();
        throw;
    }
    spdlog::info("LDAP client ready: {}:{} as {}", config_.host, config_.port, config_.bindDn);
}

void LdapClient::connect() {
    connections_.connect();
}

void LdapClient::bind() {
    binder_.bindService();
}

AuthResult LdapClient::authenticate(const std::string& username, const std::string& password) {
    return authenticator_.authenticate(username, password);
}

void LdapClient::close() {
    connections_.close();
}

} // namespace ldapauth
