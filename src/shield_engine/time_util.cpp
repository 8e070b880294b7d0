/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/time_util.h"

#include <ctime>

#include "kbase/error_exception_util.h"

#include "shield_engine/engine_errors.h"

namespace sse {

int64_t TimestampToMillis(Timestamp timestamp)
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    return duration_cast<milliseconds>(timestamp.time_since_epoch()).count();
}

Timestamp TimestampFromMillis(int64_t millis)
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    constexpr auto kMaxMillis = duration_cast<milliseconds>(Timestamp::duration::max()).count();
    constexpr auto kMinMillis = duration_cast<milliseconds>(Timestamp::duration::min()).count();
    ENSURE(RAISE, millis >= kMinMillis && millis <= kMaxMillis)(millis).Require<SnapshotError>();

    return Timestamp(duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
}

std::string FormatTimestamp(Timestamp timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc_time {};
    gmtime_r(&time, &utc_time);

    char buf[32] {};
    auto length = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc_time);
    return std::string(buf, length);
}

}   // namespace sse
