/**
 * @file filter.h
 * @brief LDAP search filter helpers
 */

#pragma once

#include <string>

namespace ldapauth {

/**
 * @brief Escape LDAP filter value according to RFC 4515
 *
 * Escapes special characters in LDAP search filter values:
 * - * (asterisk) → \2a
 * - ( (left paren) → \28
 * - ) (right paren) → \29
 * - \ (backslash) → \5c
 * - NUL (null byte) → \00
 * - Non-printable characters → \HH (hex)
 *
 * @example
 *   escapeFilterValue("admin*)(uid=*") → "admin\2a\29\28uid=\2a"
 */
std::string escapeFilterValue(const std::string& value);

/**
 * @brief Count the %s substitution slots in a filter template
 */
int countFilterSlots(const std::string& filterTemplate);

/**
 * @brief Substitute an escaped value into the %s slot of a filter template
 *
 * @param filterTemplate Template such as "(uid=%s)"
 * @param value Raw user input, escaped before substitution
 * @throws ConfigException if the template has no %s slot
 */
std::string formatFilter(const std::string& filterTemplate, const std::string& value);

} // namespace ldapauth
