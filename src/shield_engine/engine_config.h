/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_ENGINE_CONFIG_H_
#define KSHIELDENGINE_SHIELD_ENGINE_ENGINE_CONFIG_H_

#include <string>
#include <vector>

#include "kbase/path.h"

namespace sse {

struct FilterListConfig {
    std::string id;
    std::string name;
    std::string url;
    bool enabled;
};

struct EngineConfig {
    std::vector<FilterListConfig> filter_lists;
    long fetch_timeout_seconds;
    std::string user_agent;
    bool compile_patterns;
};

// EasyList and EasyPrivacy, both enabled.
EngineConfig DefaultEngineConfig();

// Parses a JSON document; keys absent from the document keep their default values, and a
// present `filter_lists` replaces the default lists as a whole.
// Throws ConfigError if the document is malformed or carries invalid values.
EngineConfig ParseEngineConfig(const std::string& json_text);

// Throws ConfigError if the file doesn't exist or its content is invalid.
EngineConfig LoadEngineConfig(const kbase::Path& config_file);

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_ENGINE_CONFIG_H_
