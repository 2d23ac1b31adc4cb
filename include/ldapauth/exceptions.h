/**
 * @file exceptions.h
 * @brief Exception hierarchy for the LDAP authentication client
 *
 * Every failure raised by the client derives from LdapAuthException and
 * carries an ErrorKind so that callers can branch on the category without
 * matching message text.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ldapauth {

/**
 * @brief Error category
 */
enum class ErrorKind {
    CONFIG,      ///< Missing or invalid configuration, caller-fixable
    CONNECTION,  ///< Dial, TLS handshake, certificate material or lost link
    PROTOCOL,    ///< Bind rejected or search failed
    IDENTITY     ///< Username matched zero or several entries
};

inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIG:     return "CONFIG";
        case ErrorKind::CONNECTION: return "CONNECTION";
        case ErrorKind::PROTOCOL:   return "PROTOCOL";
        case ErrorKind::IDENTITY:   return "IDENTITY";
    }
    return "UNKNOWN";
}

/**
 * @brief Base exception for all client errors
 */
class LdapAuthException : public std::runtime_error {
public:
    LdapAuthException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Configuration error
 */
class ConfigException : public LdapAuthException {
public:
    explicit ConfigException(const std::string& message)
        : LdapAuthException(ErrorKind::CONFIG, "Configuration error: " + message) {}
};

/**
 * @brief Transport level failure
 *
 * peerClosed() is true when the server link was already gone while an
 * operation was issued. That is the only failure the service bind retries.
 */
class ConnectionException : public LdapAuthException {
public:
    explicit ConnectionException(const std::string& message, bool peerClosed = false)
        : LdapAuthException(ErrorKind::CONNECTION, "Connection error: " + message),
          peerClosed_(peerClosed) {}

    bool peerClosed() const { return peerClosed_; }

private:
    bool peerClosed_;
};

/**
 * @brief Directory operation rejected by the server
 */
class ProtocolException : public LdapAuthException {
public:
    explicit ProtocolException(const std::string& message, int resultCode = 0)
        : LdapAuthException(ErrorKind::PROTOCOL, "LDAP error: " + message),
          resultCode_(resultCode) {}

    /// LDAP result code reported by the server (0 when not applicable)
    int resultCode() const { return resultCode_; }

private:
    int resultCode_;
};

/**
 * @brief Username did not resolve to exactly one entry
 */
class IdentityException : public LdapAuthException {
public:
    explicit IdentityException(const std::string& message)
        : LdapAuthException(ErrorKind::IDENTITY, message) {}
};

} // namespace ldapauth
