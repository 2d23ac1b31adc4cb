/**
 * @file authenticator.h
 * @brief Search-then-bind user authentication
 */

#pragma once

#include <ldapauth/binder.h>
#include <ldapauth/config.h>
#include <ldapauth/connection_manager.h>
#include <ldapauth/directory.h>
#include <ldapauth/exceptions.h>

#include <map>
#include <optional>
#include <string>

namespace ldapauth {

/// Configured attribute name -> first value ("" when absent on the entry)
using AttributeMap = std::map<std::string, std::string>;

struct AuthError {
    ErrorKind kind;
    std::string message;

    static AuthError from(const LdapAuthException& e) {
        return {e.kind(), e.what()};
    }
};

/**
 * @brief Outcome of an authenticate() call
 *
 * authenticated is never true while error is set. attributes is present
 * whenever the username resolved to exactly one entry, including when the
 * password was then rejected.
 */
struct AuthResult {
    bool authenticated = false;
    std::optional<AttributeMap> attributes;
    std::optional<AuthError> error;
    std::optional<AuthError> restoreError;  ///< Service rebind after the call failed

    static AuthResult failure(const LdapAuthException& e) {
        AuthResult result;
        result.error = AuthError::from(e);
        return result;
    }
};

/**
 * @brief Authenticates users against the directory
 *
 * Sequence:
 *   1. Bind as the service identity (call fails here without restoration)
 *   2. Subtree search under base with userFilter and the escaped username
 *   3. Require exactly one entry, collect configured attributes
 *   4. Bind as the entry DN with the candidate password (no retry)
 *   5. Rebind as the service identity, on every exit path after step 1
 */
class Authenticator {
public:
    Authenticator(const ClientConfig& config, ConnectionManager& connections, Binder& binder);

    AuthResult authenticate(const std::string& username, const std::string& password);

    /**
     * @brief Search request used to resolve a username
     * @throws ConfigException if userFilter has no %s slot
     */
    SearchRequest buildUserSearch(const std::string& username) const;

private:
    AuthResult lookupAndVerify(const std::string& username, const std::string& password);

    const ClientConfig& config_;
    ConnectionManager& connections_;
    Binder& binder_;
};

} // namespace ldapauth
