/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/filter_list.h"

#include <algorithm>

#include "kbase/error_exception_util.h"
#include "kbase/string_util.h"
#include "kbase/tokenizer.h"

#include "shield_engine/engine_errors.h"

namespace {

using sse::FilterListInfo;
using sse::RuleKind;

constexpr const char kVersionTagName[] = "version";
constexpr const char kTitleTagName[] = "title";
constexpr const char kLastModifiedTagName[] = "last modified";

constexpr const char kWhitespaces[] = " \t\v\f";

bool IsComment(const std::string& line)
{
    return kbase::StartsWith(line, "!") || kbase::StartsWith(line, "[");
}

bool IsExceptionRule(const std::string& line)
{
    return kbase::StartsWith(line, "@@");
}

bool IsElemHideRule(const std::string& line)
{
    return line.find("##") != std::string::npos;
}

std::string TrimWhitespaces(std::string text)
{
    kbase::TrimString(text, kWhitespaces);
    return text;
}

// Picks up `! Title: xxx` like header comments.
void LoadFilterInfo(const std::string& comment, FilterListInfo& info)
{
    auto colon_pos = comment.find(':');
    if (!kbase::StartsWith(comment, "!") || colon_pos == std::string::npos) {
        return;
    }

    auto info_tag = kbase::StringToLowerASCII(TrimWhitespaces(comment.substr(1, colon_pos - 1)));
    auto value = TrimWhitespaces(comment.substr(colon_pos + 1));
    if (info_tag == kVersionTagName) {
        info.version = std::move(value);
    } else if (info_tag == kTitleTagName) {
        info.title = std::move(value);
    } else if (info_tag == kLastModifiedTagName) {
        info.last_modified = std::move(value);
    }
}

}   // namespace

namespace sse {

kbase::Pickle& operator<<(kbase::Pickle& pickle, const FilterListInfo& info)
{
    pickle << info.version
           << info.title
           << info.last_modified;
    return pickle;
}

kbase::Pickle& operator<<(kbase::Pickle& pickle, const FilterList& list)
{
    pickle << list.id_
           << list.name_
           << list.source_url_
           << list.enabled_
           << TimestampToMillis(list.last_updated_)
           << list.info_
           << static_cast<uint32_t>(list.rules_.size());
    for (const auto& rule : list.rules_) {
        pickle << rule;
    }

    return pickle;
}

bool ParseRuleLine(const std::string& line, RuleSequence& rules)
{
    std::string rule_text = TrimWhitespaces(line);
    if (rule_text.empty() || IsComment(rule_text)) {
        return false;
    }

    RuleKind kind = RuleKind::BLOCK;
    if (IsExceptionRule(rule_text)) {
        kind = RuleKind::ALLOW;
        rule_text.erase(0, 2);
    } else if (IsElemHideRule(rule_text)) {
        kind = RuleKind::HIDE;
    }

    // Options are not interpreted; they only end the pattern.
    auto option_pos = rule_text.find('$');
    if (option_pos != std::string::npos) {
        rule_text.resize(option_pos);
    }

    if (rule_text.empty()) {
        return false;
    }

    rules.emplace_back(kind, std::move(rule_text));
    return true;
}

ParsedFilterList ParseFilterList(const std::string& content)
{
    ENSURE(RAISE, !content.empty()).Require<ParseError>();

    ParsedFilterList parsed;
    kbase::Tokenizer data_lines(content, "\r\n");
    for (auto&& token : data_lines) {
        if (token.empty()) {
            continue;
        }

        std::string line = TrimWhitespaces(token.ToString());
        if (IsComment(line)) {
            LoadFilterInfo(line, parsed.info);
            continue;
        }

        ParseRuleLine(line, parsed.rules);
    }

    return parsed;
}

FilterList::FilterList(std::string id, std::string name, std::string source_url, bool enabled)
    : id_(std::move(id)),
      name_(std::move(name)),
      source_url_(std::move(source_url)),
      enabled_(enabled),
      last_updated_(Now())
{
    ENSURE(RAISE, !id_.empty()).Require<InvalidArgumentError>();
}

FilterList FilterList::FromSnapshot(kbase::PickleReader& snapshot)
{
    std::string id, name, source_url;
    bool enabled = false;
    int64_t last_updated = 0;
    snapshot >> id >> name >> source_url >> enabled >> last_updated;
    ENSURE(RAISE, !id.empty()).Require<SnapshotError>();

    FilterList list(std::move(id), std::move(name), std::move(source_url), enabled);
    list.last_updated_ = TimestampFromMillis(last_updated);
    snapshot >> list.info_.version >> list.info_.title >> list.info_.last_modified;

    uint32_t rule_count = 0;
    snapshot >> rule_count;
    for (uint32_t i = 0; i < rule_count; ++i) {
        list.rules_.push_back(ReadRule(snapshot));
    }

    return list;
}

void FilterList::ReplaceRules(ParsedFilterList parsed, Timestamp updated_at)
{
    info_ = std::move(parsed.info);
    rules_ = std::move(parsed.rules);
    last_updated_ = updated_at;
}

void FilterList::AppendRule(Rule rule)
{
    rules_.push_back(std::move(rule));
    last_updated_ = Now();
}

bool FilterList::RemoveRule(const Rule& rule)
{
    auto it = std::find(rules_.begin(), rules_.end(), rule);
    if (it == rules_.end()) {
        return false;
    }

    rules_.erase(it);
    last_updated_ = Now();
    return true;
}

}   // namespace sse
