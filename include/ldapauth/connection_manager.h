/**
 * @file connection_manager.h
 * @brief Ownership of the single directory session of a client
 */

#pragma once

#include <ldapauth/config.h>
#include <ldapauth/directory.h>

#include <memory>

namespace ldapauth {

/**
 * @brief Owns at most one live directory session
 *
 * connect() always closes the previous session before dialing, so two
 * sessions are never held at the same time.
 */
class ConnectionManager {
private:
    const ClientConfig& config_;
    std::shared_ptr<IDirectoryDialer> dialer_;
    std::unique_ptr<IDirectoryConnection> connection_;

public:
    /**
     * @param config Client configuration, must outlive the manager
     * @param dialer Session factory
     * @throws std::invalid_argument if dialer is null
     */
    ConnectionManager(const ClientConfig& config, std::shared_ptr<IDirectoryDialer> dialer);

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Replace the current session with a new one
     *
     * On failure no session is held afterwards.
     *
     * @throws ConnectionException
     */
    void connect();

    /**
     * @brief Close the session if one is held
     */
    void close();

    bool isConnected() const { return connection_ != nullptr; }

    /**
     * @brief Live session
     * @throws ConnectionException (not peerClosed) when disconnected
     */
    IDirectoryConnection& connection();
};

} // namespace ldapauth
