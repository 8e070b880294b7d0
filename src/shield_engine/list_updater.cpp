/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/list_updater.h"

#include <exception>

#include "kbase/error_exception_util.h"
#include "kbase/logging.h"

namespace sse {

ListUpdater::ListUpdater(std::unique_ptr<ListFetcher> fetcher, bool compile_patterns)
    : fetcher_(std::move(fetcher)), compile_patterns_(compile_patterns)
{
    ENSURE(CHECK, fetcher_ != nullptr).Require();
}

ListUpdate ListUpdater::FetchAndParse(const FilterListSource& source) const
{
    std::string content;
    try {
        content = fetcher_->Fetch(source.source_url);
    } catch (const EngineError&) {
        throw;
    } catch (const std::exception& ex) {
        throw FetchError("failed to fetch " + source.list_id + ": " + ex.what());
    }

    ENSURE(RAISE, !content.empty())(source.list_id)(source.source_url).Require<ParseError>();

    ListUpdate update;
    update.list_id = source.list_id;
    try {
        update.parsed = ParseFilterList(content);
        if (compile_patterns_) {
            update.compiled_patterns = CompilePatterns(update.parsed.rules);
        }
    } catch (const EngineError&) {
        throw;
    } catch (const std::exception& ex) {
        throw ParseError("failed to parse " + source.list_id + ": " + ex.what());
    }

    update.fetched_at = Now();

    LOG(INFO) << "Fetched filter list " << source.list_id << "; bytes: " << content.size()
              << " rules: " << update.parsed.rules.size();

    return update;
}

}   // namespace sse
