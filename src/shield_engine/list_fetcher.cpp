/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/list_fetcher.h"

#include <memory>
#include <mutex>

#include <curl/curl.h>

#include "kbase/error_exception_util.h"
#include "kbase/file_util.h"
#include "kbase/path.h"
#include "kbase/string_util.h"

#include "shield_engine/engine_errors.h"

namespace {

using sse::FetchError;

constexpr const char kFileScheme[] = "file://";
constexpr const size_t kFileSchemeLength = sizeof(kFileScheme) - 1;

constexpr const long kMaxRedirections = 5;

std::once_flag curl_init_flag;

struct CurlEasyDeleter {
    void operator()(CURL* curl) const
    {
        curl_easy_cleanup(curl);
    }
};

using ScopedCurl = std::unique_ptr<CURL, CurlEasyDeleter>;

size_t AppendResponseData(char* data, size_t size, size_t count, void* user_data)
{
    auto response = static_cast<std::string*>(user_data);
    response->append(data, size * count);
    return size * count;
}

template<typename T>
void SetCurlOption(CURL* curl, CURLoption option, T value)
{
    auto rv = curl_easy_setopt(curl, option, value);
    ENSURE(RAISE, rv == CURLE_OK)(option)(curl_easy_strerror(rv)).Require<FetchError>();
}

void EnsureCurlInitialized()
{
    std::call_once(curl_init_flag, [] {
        auto rv = curl_global_init(CURL_GLOBAL_DEFAULT);
        ENSURE(RAISE, rv == CURLE_OK)(curl_easy_strerror(rv)).Require<FetchError>();
    });
}

}   // namespace

namespace sse {

CurlListFetcher::CurlListFetcher(long timeout_seconds, std::string user_agent)
    : timeout_seconds_(timeout_seconds), user_agent_(std::move(user_agent))
{}

std::string CurlListFetcher::Fetch(const std::string& source_url)
{
    if (kbase::StartsWith(source_url, kFileScheme, false)) {
        return FetchLocalFile(source_url);
    }

    return FetchRemote(source_url);
}

std::string CurlListFetcher::FetchLocalFile(const std::string& source_url) const
{
    kbase::Path list_file(source_url.substr(kFileSchemeLength));
    ENSURE(RAISE, kbase::PathExists(list_file))(source_url).Require<FetchError>();
    return kbase::ReadFileToString(list_file);
}

std::string CurlListFetcher::FetchRemote(const std::string& source_url) const
{
    EnsureCurlInitialized();

    ScopedCurl curl(curl_easy_init());
    ENSURE(RAISE, curl != nullptr)(source_url).Require<FetchError>();

    std::string response;
    char error_buf[CURL_ERROR_SIZE] {};
    SetCurlOption(curl.get(), CURLOPT_URL, source_url.c_str());
    SetCurlOption(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    SetCurlOption(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    SetCurlOption(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    SetCurlOption(curl.get(), CURLOPT_MAXREDIRS, kMaxRedirections);
    SetCurlOption(curl.get(), CURLOPT_NOSIGNAL, 1L);
    SetCurlOption(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    SetCurlOption(curl.get(), CURLOPT_ERRORBUFFER, error_buf);
    SetCurlOption(curl.get(), CURLOPT_WRITEFUNCTION, AppendResponseData);
    SetCurlOption(curl.get(), CURLOPT_WRITEDATA, &response);

    auto rv = curl_easy_perform(curl.get());
    if (rv != CURLE_OK) {
        std::string reason = error_buf[0] != '\0' ? error_buf : curl_easy_strerror(rv);
        throw FetchError("failed to fetch " + source_url + ": " + reason);
    }

    long status_code = 0;
    rv = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    ENSURE(RAISE, rv == CURLE_OK)(source_url).Require<FetchError>();
    ENSURE(RAISE, status_code >= 200 && status_code < 300)(source_url)(status_code)
          .Require<FetchError>();

    return response;
}

}   // namespace sse
