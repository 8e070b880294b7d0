/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_PATTERN_MATCHER_H_
#define KSHIELDENGINE_SHIELD_ENGINE_PATTERN_MATCHER_H_

#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "kbase/basic_macros.h"

#include "shield_engine/filter_rule.h"

namespace sse {

// A rule pattern transformed into a regex literal.
// Every non-word character is escaped, so a compiled pattern matches exactly the urls
// containing the pattern text.
class CompiledPattern {
public:
    explicit CompiledPattern(const std::string& pattern);

    ~CompiledPattern() = default;

    DISALLOW_COPY(CompiledPattern);

    bool Match(const std::string& url) const;

private:
    std::regex regex_;
};

using CompiledPatternMap = std::unordered_map<std::string, std::shared_ptr<const CompiledPattern>>;

// Compiles patterns of `rules`; duplicated patterns are compiled only once.
CompiledPatternMap CompilePatterns(const RuleSequence& rules);

// Compiled patterns keyed by the exact pattern text.
class PatternCache {
public:
    PatternCache() = default;

    ~PatternCache() = default;

    DISALLOW_COPY(PatternCache);

    // Returns nullptr if `pattern` was never compiled.
    const CompiledPattern* Find(const std::string& pattern) const;

    void Merge(CompiledPatternMap patterns);

    // Drops every entry whose pattern is not in `live_patterns`.
    void Retain(const std::unordered_set<std::string>& live_patterns);

    void Clear();

    size_t size() const
    {
        return patterns_.size();
    }

private:
    CompiledPatternMap patterns_;
};

// Returns true if `url` matches the `pattern`, using its compiled form if there is one in
// the `cache`, and plain substring containment otherwise.
bool MatchPattern(const PatternCache& cache, const std::string& pattern, const std::string& url);

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_PATTERN_MATCHER_H_
