/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_LIST_UPDATER_H_
#define KSHIELDENGINE_SHIELD_ENGINE_LIST_UPDATER_H_

#include <memory>
#include <string>
#include <vector>

#include "kbase/basic_macros.h"

#include "shield_engine/engine_errors.h"
#include "shield_engine/filter_list.h"
#include "shield_engine/list_fetcher.h"
#include "shield_engine/pattern_matcher.h"

namespace sse {

struct FilterListSource {
    std::string list_id;
    std::string source_url;
};

// Everything needed to swap in the new content of a list.
struct ListUpdate {
    std::string list_id;
    ParsedFilterList parsed;
    CompiledPatternMap compiled_patterns;
    Timestamp fetched_at;
};

struct ListRefreshOutcome {
    std::string list_id;
    bool succeeded;
    size_t rule_count;
    ErrorKind error_kind;
    std::string error_message;
};

using RefreshReport = std::vector<ListRefreshOutcome>;

// Downloads and parses filter lists. It touches no engine state, therefore it runs without
// holding any lock.
class ListUpdater {
public:
    ListUpdater(std::unique_ptr<ListFetcher> fetcher, bool compile_patterns);

    ~ListUpdater() = default;

    DISALLOW_COPY(ListUpdater);

    // Throws FetchError if the list can't be downloaded, and ParseError if the content is
    // unusable.
    ListUpdate FetchAndParse(const FilterListSource& source) const;

private:
    std::unique_ptr<ListFetcher> fetcher_;
    bool compile_patterns_;
};

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_LIST_UPDATER_H_
