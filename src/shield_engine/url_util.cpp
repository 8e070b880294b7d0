/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/url_util.h"

#include <algorithm>
#include <cctype>
#include <set>

#include "kbase/string_util.h"

namespace {

constexpr const char kAuthorityPrefix[] = "//";
constexpr const char kAuthorityTerminators[] = "/?#\\";

// Schemes that must carry a non-empty host.
const std::set<std::string> kSpecialSchemes {
    "http", "https", "ws", "wss", "ftp"
};

bool IsSchemeChar(char ch)
{
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '+' || ch == '-' ||
           ch == '.';
}

bool IsValidHostChar(char ch)
{
    auto uch = static_cast<unsigned char>(ch);
    return uch > 0x20 && uch != 0x7F && ch != '<' && ch != '>' && ch != '^' && ch != '|' &&
           ch != '%' && ch != '"';
}

bool IsAllDigits(const std::string& text)
{
    return std::all_of(text.begin(), text.end(), [](char ch) {
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    });
}

// Returns the position of the colon ending the scheme, or npos if `url` doesn't start with
// a scheme.
size_t FindSchemeEnd(const std::string& url)
{
    if (url.empty() || !std::isalpha(static_cast<unsigned char>(url[0]))) {
        return std::string::npos;
    }

    for (size_t i = 1; i < url.size(); ++i) {
        if (url[i] == ':') {
            return i;
        }

        if (!IsSchemeChar(url[i])) {
            return std::string::npos;
        }
    }

    return std::string::npos;
}

// `authority` has the form of [userinfo@]host[:port].
bool ExtractHost(const std::string& authority, std::string& host)
{
    auto host_begin = authority.rfind('@');
    host_begin = host_begin == std::string::npos ? 0 : host_begin + 1;
    std::string host_port = authority.substr(host_begin);

    std::string port;
    if (kbase::StartsWith(host_port, "[")) {
        auto bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) {
            return false;
        }

        host = host_port.substr(0, bracket_end + 1);
        auto rest = host_port.substr(bracket_end + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                return false;
            }

            port = rest.substr(1);
        }
    } else {
        auto colon_pos = host_port.find(':');
        host = host_port.substr(0, colon_pos);
        if (colon_pos != std::string::npos) {
            port = host_port.substr(colon_pos + 1);
        }
    }

    if (!IsAllDigits(port) || !std::all_of(host.begin(), host.end(), IsValidHostChar)) {
        return false;
    }

    host = kbase::StringToLowerASCII(host);
    return true;
}

}   // namespace

namespace sse {

bool ParseURLHost(const std::string& url, std::string& host)
{
    auto scheme_end = FindSchemeEnd(url);
    if (scheme_end == std::string::npos) {
        return false;
    }

    std::string scheme = kbase::StringToLowerASCII(url.substr(0, scheme_end));
    bool special = kSpecialSchemes.count(scheme) > 0;

    auto authority_begin = scheme_end + 1;
    if (url.compare(authority_begin, 2, kAuthorityPrefix) != 0) {
        host.clear();
        return !special;
    }

    authority_begin += 2;
    auto authority_end = url.find_first_of(kAuthorityTerminators, authority_begin);
    if (authority_end == std::string::npos) {
        authority_end = url.size();
    }

    if (!ExtractHost(url.substr(authority_begin, authority_end - authority_begin), host)) {
        return false;
    }

    return !special || !host.empty();
}

}   // namespace sse
