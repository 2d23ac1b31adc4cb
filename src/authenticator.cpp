/**
 * @file authenticator.cpp
 * @brief Authenticator implementation
 */

#include <ldapauth/authenticator.h>
#include <ldapauth/filter.h>

#include <spdlog/spdlog.h>

namespace ldapauth {

namespace {

/**
 * @brief Rebinds as the service identity when it goes out of scope
 *
 * A failed rebind never replaces the primary outcome: it is logged and
 * stored in the slot passed at construction.
 */
class ServiceBindRestorer {
private:
    Binder& binder_;
    std::optional<AuthError>& failure_;

public:
    ServiceBindRestorer(Binder& binder, std::optional<AuthError>& failure)
        : binder_(binder), failure_(failure) {}

    ~ServiceBindRestorer() {
        try {
            binder_.bindService();
        } catch (const LdapAuthException& e) {
            spdlog::warn("Could not restore LDAP service bind: {}", e.what());
            failure_ = AuthError::from(e);
        } catch (const std::exception& e) {
            spdlog::warn("Could not restore LDAP service bind: {}", e.what());
            failure_ = AuthError{ErrorKind::CONNECTION, e.what()};
        }
    }

    ServiceBindRestorer(const ServiceBindRestorer&) = delete;
    ServiceBindRestorer& operator=(const ServiceBindRestorer&) = delete;
};

} // namespace

Authenticator::Authenticator(const ClientConfig& config, ConnectionManager& connections, Binder& binder)
    : config_(config), connections_(connections), binder_(binder) {}

SearchRequest Authenticator::buildUserSearch(const std::string& username) const {
    SearchRequest request;
    request.baseDn = config_.base;
    request.scope = SearchScope::SUBTREE;
    request.derefAliases = DerefAliases::NEVER;
    request.sizeLimit = 0;
    request.timeLimit = 0;
    request.typesOnly = false;
    request.filter = formatFilter(config_.userFilter, username);
    request.attributes = config_.attributes;
    request.attributes.push_back("dn");
    return request;
}

AuthResult Authenticator::authenticate(const std::string& username, const std::string& password) {
    try {
        binder_.bindService();
    } catch (const LdapAuthException& e) {
        spdlog::debug("LDAP authenticate '{}': service bind failed: {}", username, e.what());
        return AuthResult::failure(e);
    }

    AuthResult result;
    {
        ServiceBindRestorer restorer(binder_, result.restoreError);
        result = lookupAndVerify(username, password);
    }
    return result;
}

AuthResult Authenticator::lookupAndVerify(const std::string& username, const std::string& password) {
    SearchResult found;
    try {
        SearchRequest request = buildUserSearch(username);
        spdlog::debug("LDAP user search: base={}, filter={}", request.baseDn, request.filter);
        found = connections_.connection().search(request);
    } catch (const LdapAuthException& e) {
        return AuthResult::failure(e);
    }

    if (found.entries.empty()) {
        return AuthResult::failure(IdentityException("user does not exist"));
    }
    if (found.entries.size() > 1) {
        spdlog::debug("LDAP user search for '{}' matched {} entries", username, found.entries.size());
        return AuthResult::failure(IdentityException("too many entries returned"));
    }

    const DirectoryEntry& entry = found.entries.front();

    AuthResult result;
    result.attributes = AttributeMap();
    for (const auto& name : config_.attributes) {
        (*result.attributes)[name] = entry.getAttributeValue(name);
    }

    try {
        binder_.bindAs(entry.dn, password);
    } catch (const LdapAuthException& e) {
        spdlog::debug("LDAP password check failed for {}: {}", entry.dn, e.what());
        result.error = AuthError::from(e);
        return result;
    }

    result.authenticated = true;
    spdlog::debug("LDAP user authenticated: {}", entry.dn);
    return result;
}

} // namespace ldapauth
