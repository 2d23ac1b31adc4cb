/**
 * @file filter.cpp
 * @brief LDAP search filter helpers
 */

#include <ldapauth/filter.h>
#include <ldapauth/exceptions.h>

#include <iomanip>
#include <sstream>

namespace ldapauth {

namespace {
constexpr const char* kSlot = "%s";
}

std::string escapeFilterValue(const std::string& value) {
    if (value.empty()) return value;

    std::string escaped;
    escaped.reserve(value.size() * 3); // Reserve extra space for hex escapes

    for (unsigned char c : value) {
        switch (c) {
            case '*':
                escaped += "\\2a";
                break;
            case '(':
                escaped += "\\28";
                break;
            case ')':
                escaped += "\\29";
                break;
            case '\\':
                escaped += "\\5c";
                break;
            case '\0':
                escaped += "\\00";
                break;
            default:
                if (c < 0x20 || c > 0x7E) {
                    std::ostringstream oss;
                    oss << "\\" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
                    escaped += oss.str();
                } else {
                    escaped += static_cast<char>(c);
                }
        }
    }

    return escaped;
}

int countFilterSlots(const std::string& filterTemplate) {
    int count = 0;
    for (size_t pos = filterTemplate.find(kSlot); pos != std::string::npos;
         pos = filterTemplate.find(kSlot, pos + 2)) {
        ++count;
    }
    return count;
}

std::string formatFilter(const std::string& filterTemplate, const std::string& value) {
    size_t pos = filterTemplate.find(kSlot);
    if (pos == std::string::npos) {
        throw ConfigException("filter template has no %s slot: " + filterTemplate);
    }

    std::string filter = filterTemplate;
    filter.replace(pos, 2, escapeFilterValue(value));
    return filter;
}

} // namespace ldapauth
