/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/pattern_matcher.h"

namespace {

constexpr const auto kOptFlag = std::regex_constants::ECMAScript | std::regex_constants::optimize;

const std::regex kEscapeSpecialSymbolPat("\\W", kOptFlag);

std::string TransformPattern(const std::string& pattern)
{
    // Wildcards, anchors and separators are plain characters here; the pattern is taken
    // literally, hence escaping is the only transformation.
    return std::regex_replace(pattern, kEscapeSpecialSymbolPat, "\\$&");
}

}   // namespace

namespace sse {

CompiledPattern::CompiledPattern(const std::string& pattern)
    : regex_(TransformPattern(pattern), kOptFlag)
{}

bool CompiledPattern::Match(const std::string& url) const
{
    return std::regex_search(url, regex_);
}

CompiledPatternMap CompilePatterns(const RuleSequence& rules)
{
    CompiledPatternMap patterns;
    for (const auto& rule : rules) {
        if (patterns.count(rule.pattern) == 0) {
            patterns.emplace(rule.pattern, std::make_shared<const CompiledPattern>(rule.pattern));
        }
    }

    return patterns;
}

const CompiledPattern* PatternCache::Find(const std::string& pattern) const
{
    auto it = patterns_.find(pattern);
    return it == patterns_.end() ? nullptr : it->second.get();
}

void PatternCache::Merge(CompiledPatternMap patterns)
{
    for (auto& entry : patterns) {
        patterns_[entry.first] = std::move(entry.second);
    }
}

void PatternCache::Retain(const std::unordered_set<std::string>& live_patterns)
{
    for (auto it = patterns_.begin(); it != patterns_.end();) {
        if (live_patterns.count(it->first) == 0) {
            it = patterns_.erase(it);
        } else {
            ++it;
        }
    }
}

void PatternCache::Clear()
{
    patterns_.clear();
}

bool MatchPattern(const PatternCache& cache, const std::string& pattern, const std::string& url)
{
    const CompiledPattern* compiled = cache.Find(pattern);
    if (compiled) {
        return compiled->Match(url);
    }

    return url.find(pattern) != std::string::npos;
}

}   // namespace sse
