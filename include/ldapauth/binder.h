/**
 * @file binder.h
 * @brief Simple bind with bounded reconnect-and-retry
 */

#pragma once

#include <ldapauth/config.h>
#include <ldapauth/connection_manager.h>

#include <string>

namespace ldapauth {

/**
 * @brief Binds the client's session
 *
 * The service bind survives one server-side disconnect: when the bind fails
 * with a peer-closed ConnectionException, the session is re-dialed and the
 * bind issued once more. A second peer-closed failure is thrown.
 */
class Binder {
public:
    /// Retry stops once this many consecutive peer-closed failures were seen
    static constexpr int kMaxDisconnects = 2;

    Binder(const ClientConfig& config, ConnectionManager& connections);

    /**
     * @brief Bind as the configured service identity
     *
     * @throws ConfigException if bindDn or bindPassword is empty (no network call)
     * @throws ConnectionException if the reconnect fails or the link drops twice
     * @throws ProtocolException if the server rejects the bind
     */
    void bindService();

    /**
     * @brief One-shot bind as an arbitrary identity, without retry
     *
     * @throws ProtocolException on rejection or an empty password
     * @throws ConnectionException if the link is gone
     */
    void bindAs(const std::string& dn, const std::string& password);

    int disconnectRetryCount() const { return disconnectRetryCount_; }

private:
    const ClientConfig& config_;
    ConnectionManager& connections_;
    int disconnectRetryCount_ = 0;
};

} // namespace ldapauth
