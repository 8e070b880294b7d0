/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/engine_config.h"

#include <set>

#include "nlohmann/json.hpp"

#include "kbase/error_exception_util.h"
#include "kbase/file_util.h"
#include "kbase/logging.h"

#include "shield_engine/engine_errors.h"
#include "shield_engine/filter_list.h"

namespace {

using sse::ConfigError;
using sse::FilterListConfig;

constexpr const char kFilterListsKey[] = "filter_lists";
constexpr const char kFetchTimeoutKey[] = "fetch_timeout_seconds";
constexpr const char kUserAgentKey[] = "user_agent";
constexpr const char kCompilePatternsKey[] = "compile_patterns";

constexpr const long kDefaultFetchTimeoutSeconds = 30;
constexpr const char kDefaultUserAgent[] = "KShieldEngine/1.0";

FilterListConfig ParseFilterListConfig(const nlohmann::json& item)
{
    ENSURE(RAISE, item.is_object()).Require<ConfigError>();

    FilterListConfig list;
    list.id = item.at("id").get<std::string>();
    list.url = item.at("url").get<std::string>();
    list.name = item.value("name", list.id);
    list.enabled = item.value("enabled", true);

    ENSURE(RAISE, !list.id.empty() && list.id != sse::kUserRulesListId)(list.id)
          .Require<ConfigError>();
    ENSURE(RAISE, !list.url.empty())(list.id).Require<ConfigError>();

    return list;
}

}   // namespace

namespace sse {

EngineConfig DefaultEngineConfig()
{
    EngineConfig config;
    config.filter_lists = {
        { "easylist", "EasyList", "https://easylist.to/easylist/easylist.txt", true },
        { "easyprivacy", "EasyPrivacy", "https://easylist.to/easylist/easyprivacy.txt", true }
    };
    config.fetch_timeout_seconds = kDefaultFetchTimeoutSeconds;
    config.user_agent = kDefaultUserAgent;
    config.compile_patterns = false;

    return config;
}

EngineConfig ParseEngineConfig(const std::string& json_text)
{
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigError(std::string("malformed config: ") + ex.what());
    }

    ENSURE(RAISE, doc.is_object()).Require<ConfigError>();

    EngineConfig config = DefaultEngineConfig();
    try {
        if (doc.count(kFetchTimeoutKey) > 0) {
            const auto& timeout = doc.at(kFetchTimeoutKey);
            ENSURE(RAISE, timeout.is_number_integer() && timeout.get<long>() > 0)
                  .Require<ConfigError>();
            config.fetch_timeout_seconds = timeout.get<long>();
        }

        if (doc.count(kUserAgentKey) > 0) {
            config.user_agent = doc.at(kUserAgentKey).get<std::string>();
        }

        if (doc.count(kCompilePatternsKey) > 0) {
            config.compile_patterns = doc.at(kCompilePatternsKey).get<bool>();
        }

        if (doc.count(kFilterListsKey) > 0) {
            const auto& lists = doc.at(kFilterListsKey);
            ENSURE(RAISE, lists.is_array()).Require<ConfigError>();

            config.filter_lists.clear();
            std::set<std::string> ids;
            for (const auto& item : lists) {
                auto list = ParseFilterListConfig(item);
                bool unique_id = ids.insert(list.id).second;
                ENSURE(RAISE, unique_id)(list.id).Require<ConfigError>();
                config.filter_lists.push_back(std::move(list));
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        throw ConfigError(std::string("invalid config value: ") + ex.what());
    }

    return config;
}

EngineConfig LoadEngineConfig(const kbase::Path& config_file)
{
    ENSURE(RAISE, kbase::PathExists(config_file)).Require<ConfigError>();

    std::string json_text = kbase::ReadFileToString(config_file);
    auto config = ParseEngineConfig(json_text);

    LOG(INFO) << "Engine config loaded; filter lists: " << config.filter_lists.size()
              << " compile patterns: " << config.compile_patterns;

    return config;
}

}   // namespace sse
