/**
 * @file binder.cpp
 * @brief Binder implementation
 */

#include <ldapauth/binder.h>
#include <ldapauth/exceptions.h>

#include <spdlog/spdlog.h>

namespace ldapauth {

Binder::Binder(const ClientConfig& config, ConnectionManager& connections)
    : config_(config), connections_(connections) {}

void Binder::bindService() {
    if (config_.bindDn.empty() || config_.bindPassword.empty()) {
        throw ConfigException("BindDN or BindPassword was not set on client config");
    }

    // The retry budget applies per call, not across calls
    disconnectRetryCount_ = 0;

    while (true) {
        try {
            connections_.connection().bind(config_.bindDn, config_.bindPassword);
            disconnectRetryCount_ = 0;
            return;
        } catch (const ConnectionException& e) {
            if (!e.peerClosed()) {
                throw;
            }
            ++disconnectRetryCount_;
            if (disconnectRetryCount_ >= kMaxDisconnects) {
                spdlog::warn("LDAP service bind failed after reconnect: {}", e.what());
                throw;
            }
            spdlog::warn("LDAP connection closed by server during service bind, reconnecting: {}", e.what());
        }

        connections_.connect();
    }
}

void Binder::bindAs(const std::string& dn, const std::string& password) {
    // An empty simple-bind password is an unauthenticated bind that servers accept
    if (password.empty()) {
        throw ProtocolException("empty password not allowed for '" + dn + "'");
    }

    connections_.connection().bind(dn, password);
    disconnectRetryCount_ = 0;
}

} // namespace ldapauth
