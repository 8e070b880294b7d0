/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_URL_UTIL_H_
#define KSHIELDENGINE_SHIELD_ENGINE_URL_UTIL_H_

#include <string>

namespace sse {

// Extracts the lower-cased host from an absolute url, e.g. `https://Ads.Example.com:8080/x`
// gives `ads.example.com`.
// Returns false if the `url` is malformed; `host` is unspecified then.
// A url of a scheme without authority, such as `data:` or `about:`, is well-formed and has an
// empty host.
bool ParseURLHost(const std::string& url, std::string& host);

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_URL_UTIL_H_
