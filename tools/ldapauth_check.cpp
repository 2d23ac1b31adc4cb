/**
 * @file ldapauth_check.cpp
 * @brief Authenticate one user against the configured LDAP server
 *
 * Configuration comes from LDAP_* environment variables (see config.h).
 * The password is read from LDAP_AUTH_PASSWORD, or from the first line of
 * standard input when that variable is unset.
 *
 * Usage:
 *   ./ldapauth-check [-v] <username>
 *
 * -v raises the log level to debug (overrides LOG_LEVEL).
 *
 * Exit status: 0 authenticated, 1 rejected, 2 configuration or connection error
 */

#include <ldapauth/config.h>
#include <ldapauth/exceptions.h>
#include <ldapauth/ldap_client.h>
#include <ldapauth/logger.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>

namespace {

constexpr int kExitAuthenticated = 0;
constexpr int kExitRejected = 1;
constexpr int kExitError = 2;

std::string readPassword() {
    if (const char* env = std::getenv("LDAP_AUTH_PASSWORD")) {
        return env;
    }
    std::string line;
    std::getline(std::cin, line);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = argc == 3 && std::string(argv[1]) == "-v";
    if (argc != 2 && !verbose) {
        std::cerr << "Usage: " << argv[0] << " [-v] <username>" << std::endl;
        return kExitError;
    }
    const std::string username = argv[argc - 1];

    const char* logLevel = std::getenv("LOG_LEVEL");
    ldapauth::Logger::initialize("ldapauth-check", logLevel ? logLevel : "warn");
    if (verbose) {
        ldapauth::Logger::setLevel("debug");
    }

    try {
        ldapauth::ClientConfig config = ldapauth::ClientConfig::fromEnvironment();
        config.validate();

        ldapauth::LdapClient client(config);
        client.open();

        auto result = client.authenticate(username, readPassword());

        if (result.restoreError) {
            spdlog::warn("Service bind not restored: {}", result.restoreError->message);
        }

        if (result.attributes) {
            for (const auto& [name, value] : *result.attributes) {
                std::cout << name << ": " << value << std::endl;
            }
        }

        if (result.authenticated) {
            std::cout << "authenticated: " << username << std::endl;
            return kExitAuthenticated;
        }

        std::cout << "rejected: " << username;
        if (result.error) {
            std::cout << " [" << ldapauth::errorKindToString(result.error->kind) << "] "
                      << result.error->message;
        }
        std::cout << std::endl;

        if (result.error && (result.error->kind == ldapauth::ErrorKind::CONFIG ||
                             result.error->kind == ldapauth::ErrorKind::CONNECTION)) {
            return kExitError;
        }
        return kExitRejected;

    } catch (const ldapauth::LdapAuthException& e) {
        spdlog::error("{}", e.what());
        return kExitError;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return kExitError;
    }
}
