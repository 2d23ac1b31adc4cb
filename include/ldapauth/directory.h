/**
 * @file directory.h
 * @brief Directory protocol collaborator interfaces
 *
 * These interfaces decouple the client from the wire implementation:
 *   - Production: OpenLdapDialer / OpenLdapConnection (libldap)
 *   - Tests: in-memory fakes
 *
 * Failure contract for implementations:
 *   - bind(): ConnectionException with peerClosed() == true when the server
 *     link is already gone, ProtocolException for every other rejection
 *   - search(): ProtocolException
 *   - dial(): ConnectionException
 */

#pragma once

#include <ldapauth/config.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ldapauth {

enum class SearchScope {
    BASE,
    ONE_LEVEL,
    SUBTREE
};

enum class DerefAliases {
    NEVER,
    SEARCHING,
    FINDING,
    ALWAYS
};

struct SearchRequest {
    std::string baseDn;
    SearchScope scope = SearchScope::SUBTREE;
    DerefAliases derefAliases = DerefAliases::NEVER;
    int sizeLimit = 0;   // 0 = unlimited
    int timeLimit = 0;   // seconds, 0 = unlimited
    bool typesOnly = false;
    std::string filter;
    std::vector<std::string> attributes;
};

/**
 * @brief Single entry returned by a search
 */
struct DirectoryEntry {
    std::string dn;
    std::map<std::string, std::vector<std::string>> attributes;

    /**
     * @brief First value of an attribute
     *
     * Attribute names compare case-insensitively.
     *
     * @return The first value, or an empty string when the attribute is absent
     */
    std::string getAttributeValue(const std::string& name) const;
};

struct SearchResult {
    std::vector<DirectoryEntry> entries;
};

/**
 * @brief A live, exclusively owned directory session
 */
class IDirectoryConnection {
public:
    virtual ~IDirectoryConnection() = default;

    /**
     * @brief Simple bind
     * @throws ConnectionException (peerClosed) or ProtocolException
     */
    virtual void bind(const std::string& dn, const std::string& password) = 0;

    /**
     * @brief Run a search and collect every entry
     * @throws ProtocolException
     */
    virtual SearchResult search(const SearchRequest& request) = 0;

    /**
     * @brief Release the session, safe to call more than once
     */
    virtual void close() = 0;
};

/**
 * @brief Factory for directory sessions
 */
class IDirectoryDialer {
public:
    virtual ~IDirectoryDialer() = default;

    /**
     * @brief Open a connected session (plain or TLS per config)
     * @throws ConnectionException on dial, handshake or certificate failure
     */
    virtual std::unique_ptr<IDirectoryConnection> dial(const ClientConfig& config) = 0;
};

} // namespace ldapauth
