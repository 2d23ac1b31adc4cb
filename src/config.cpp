/**
 * @file config.cpp
 * @brief ClientConfig validation and environment loading
 */

#include <ldapauth/config.h>
#include <ldapauth/exceptions.h>
#include <ldapauth/filter.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace ldapauth {

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigException("cannot read file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        // Trim whitespace
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // namespace

void ClientConfig::validate() const {
    if (host.empty()) {
        throw ConfigException("host is empty");
    }
    if (port < 1 || port > 65535) {
        throw ConfigException("port out of range: " + std::to_string(port));
    }
    if (countFilterSlots(userFilter) != 1) {
        throw ConfigException("userFilter must contain exactly one %s slot: " + userFilter);
    }
    if (networkTimeoutSec < 0) {
        throw ConfigException("networkTimeoutSec is negative");
    }
}

int ClientConfig::envStoi(const char* val, int defaultVal, int minVal, int maxVal) {
    try {
        int v = std::stoi(val);
        return std::clamp(v, minVal, maxVal);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer env value '{}', using default {}", val, defaultVal);
        return defaultVal;
    }
}

bool ClientConfig::envBool(const char* val, bool defaultVal) {
    std::string lowerValue = val;
    std::transform(lowerValue.begin(), lowerValue.end(), lowerValue.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    } else if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean env value '{}', using default {}", val, defaultVal);
    return defaultVal;
}

ClientConfig ClientConfig::fromEnvironment() {
    ClientConfig config;

    if (auto val = std::getenv("LDAP_HOST")) config.host = val;
    if (auto val = std::getenv("LDAP_PORT")) config.port = envStoi(val, 389, 1, 65535);
    if (auto val = std::getenv("LDAP_USE_SSL")) config.useSsl = envBool(val, false);
    if (auto val = std::getenv("LDAP_INSECURE_SKIP_VERIFY")) {
        config.insecureSkipVerify = envBool(val, false);
    }
    if (auto val = std::getenv("LDAP_BIND_DN")) config.bindDn = val;
    if (auto val = std::getenv("LDAP_BIND_PASSWORD")) config.bindPassword = val;
    if (auto val = std::getenv("LDAP_BASE_DN")) config.base = val;
    if (auto val = std::getenv("LDAP_USER_FILTER")) config.userFilter = val;
    if (auto val = std::getenv("LDAP_GROUP_FILTER")) config.groupFilter = val;
    if (auto val = std::getenv("LDAP_ATTRIBUTES")) config.attributes = splitList(val);
    if (auto val = std::getenv("LDAP_NETWORK_TIMEOUT")) {
        config.networkTimeoutSec = envStoi(val, 5, 0, 300);
    }

    if (auto val = std::getenv("LDAP_CA_CERT_FILE")) {
        config.caCertificates = readFile(val);
    }

    const char* certFile = std::getenv("LDAP_CLIENT_CERT_FILE");
    const char* keyFile = std::getenv("LDAP_CLIENT_KEY_FILE");
    if (certFile && keyFile) {
        config.clientCertificates.push_back({readFile(certFile), readFile(keyFile)});
    } else if (certFile || keyFile) {
        throw ConfigException("LDAP_CLIENT_CERT_FILE and LDAP_CLIENT_KEY_FILE must be set together");
    }

    spdlog::debug("LDAP config loaded: host={}, port={}, ssl={}, base={}, attributes={}",
                  config.host, config.port, config.useSsl, config.base, config.attributes.size());
    return config;
}

} // namespace ldapauth
