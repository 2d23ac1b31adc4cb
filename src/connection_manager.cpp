/**
 * @file connection_manager.cpp
 * @brief ConnectionManager implementation
 */

#include <ldapauth/connection_manager.h>
#include <ldapauth/exceptions.h>

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace ldapauth {

ConnectionManager::ConnectionManager(const ClientConfig& config, std::shared_ptr<IDirectoryDialer> dialer)
    : config_(config), dialer_(std::move(dialer)) {
    if (!dialer_) {
        throw std::invalid_argument("ConnectionManager: dialer cannot be null");
    }
}

ConnectionManager::~ConnectionManager() {
    close();
}

void ConnectionManager::connect() {
    close();

    spdlog::debug("Connecting to LDAP server {}:{} (ssl={})", config_.host, config_.port, config_.useSsl);
    auto connection = dialer_->dial(config_);
    if (!connection) {
        throw ConnectionException("dialer returned no session for " + config_.host);
    }
    connection_ = std::move(connection);
}

void ConnectionManager::close() {
    if (connection_) {
        connection_->close();
        connection_.reset();
    }
}

IDirectoryConnection& ConnectionManager::connection() {
    if (!connection_) {
        throw ConnectionException("not connected to " + config_.host + ":" + std::to_string(config_.port));
    }
    return *connection_;
}

} // namespace ldapauth
