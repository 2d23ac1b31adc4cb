/**
 * @file directory.cpp
 * @brief DirectoryEntry helpers
 */

#include <ldapauth/directory.h>

#include <algorithm>
#include <cctype>

namespace ldapauth {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

std::string DirectoryEntry::getAttributeValue(const std::string& name) const {
    auto it = attributes.find(name);
    if (it == attributes.end()) {
        it = std::find_if(attributes.begin(), attributes.end(),
                          [&name](const auto& attr) { return equalsIgnoreCase(attr.first, name); });
    }
    if (it == attributes.end() || it->second.empty()) {
        return "";
    }
    return it->second.front();
}

} // namespace ldapauth
