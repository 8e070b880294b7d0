/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_LIST_FETCHER_H_
#define KSHIELDENGINE_SHIELD_ENGINE_LIST_FETCHER_H_

#include <string>

#include "kbase/basic_macros.h"

namespace sse {

// Downloads the raw content of a filter list.
// Implementations must allow concurrent calls to Fetch().
class ListFetcher {
public:
    virtual ~ListFetcher() = default;

    // Throws FetchError on failure.
    virtual std::string Fetch(const std::string& source_url) = 0;

protected:
    ListFetcher() = default;

    DISALLOW_COPY(ListFetcher);
};

// Fetches `http(s)://` sources via libcurl, and `file://` sources from the local disk.
class CurlListFetcher : public ListFetcher {
public:
    CurlListFetcher(long timeout_seconds, std::string user_agent);

    ~CurlListFetcher() = default;

    DISALLOW_COPY(CurlListFetcher);

    std::string Fetch(const std::string& source_url) override;

private:
    std::string FetchLocalFile(const std::string& source_url) const;

    std::string FetchRemote(const std::string& source_url) const;

private:
    long timeout_seconds_;
    std::string user_agent_;
};

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_LIST_FETCHER_H_
