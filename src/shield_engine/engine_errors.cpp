/*
 @ 0xCCCCCCCC
*/

#include "shield_engine/engine_errors.h"

#include "kbase/error_exception_util.h"

namespace sse {

const char* ErrorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::NONE:
            return "none";

        case ErrorKind::NOT_FOUND:
            return "not-found";

        case ErrorKind::INVALID_ARGUMENT:
            return "invalid-argument";

        case ErrorKind::FETCH:
            return "fetch";

        case ErrorKind::PARSE:
            return "parse";

        case ErrorKind::CONFIG:
            return "config";

        case ErrorKind::SNAPSHOT:
            return "snapshot";

        default:
            ENSURE(CHECK, kbase::NotReached())(static_cast<int>(kind)).Require();
            return "";
    }
}

EngineError::EngineError(ErrorKind kind, const std::string& message)
    : runtime_error(message), kind_(kind)
{}

NotFoundError::NotFoundError(const char* message)
    : EngineError(ErrorKind::NOT_FOUND, message)
{}

NotFoundError::NotFoundError(const std::string& message)
    : EngineError(ErrorKind::NOT_FOUND, message)
{}

InvalidArgumentError::InvalidArgumentError(const char* message)
    : EngineError(ErrorKind::INVALID_ARGUMENT, message)
{}

InvalidArgumentError::InvalidArgumentError(const std::string& message)
    : EngineError(ErrorKind::INVALID_ARGUMENT, message)
{}

FetchError::FetchError(const char* message)
    : EngineError(ErrorKind::FETCH, message)
{}

FetchError::FetchError(const std::string& message)
    : EngineError(ErrorKind::FETCH, message)
{}

ParseError::ParseError(const char* message)
    : EngineError(ErrorKind::PARSE, message)
{}

ParseError::ParseError(const std::string& message)
    : EngineError(ErrorKind::PARSE, message)
{}

ConfigError::ConfigError(const char* message)
    : EngineError(ErrorKind::CONFIG, message)
{}

ConfigError::ConfigError(const std::string& message)
    : EngineError(ErrorKind::CONFIG, message)
{}

SnapshotError::SnapshotError(const char* message)
    : EngineError(ErrorKind::SNAPSHOT, message)
{}

SnapshotError::SnapshotError(const std::string& message)
    : EngineError(ErrorKind::SNAPSHOT, message)
{}

}   // namespace sse
