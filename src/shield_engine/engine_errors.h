/*
 @ 0xCCCCCCCC
*/

#if defined(_MSC_VER)
#pragma once
#endif

#ifndef KSHIELDENGINE_SHIELD_ENGINE_ENGINE_ERRORS_H_
#define KSHIELDENGINE_SHIELD_ENGINE_ENGINE_ERRORS_H_

#include <stdexcept>
#include <string>

namespace sse {

enum class ErrorKind {
    NONE,
    NOT_FOUND,
    INVALID_ARGUMENT,
    FETCH,
    PARSE,
    CONFIG,
    SNAPSHOT
};

const char* ErrorKindName(ErrorKind kind);

// Base of every error the engine reports to its callers.
// Raised via ENSURE(RAISE, ...).Require<T>(), hence the message-only constructors.
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const
    {
        return kind_;
    }

private:
    ErrorKind kind_;
};

class NotFoundError : public EngineError {
public:
    explicit NotFoundError(const char* message);

    explicit NotFoundError(const std::string& message);
};

class InvalidArgumentError : public EngineError {
public:
    explicit InvalidArgumentError(const char* message);

    explicit InvalidArgumentError(const std::string& message);
};

class FetchError : public EngineError {
public:
    explicit FetchError(const char* message);

    explicit FetchError(const std::string& message);
};

class ParseError : public EngineError {
public:
    explicit ParseError(const char* message);

    explicit ParseError(const std::string& message);
};

class ConfigError : public EngineError {
public:
    explicit ConfigError(const char* message);

    explicit ConfigError(const std::string& message);
};

class SnapshotError : public EngineError {
public:
    explicit SnapshotError(const char* message);

    explicit SnapshotError(const std::string& message);
};

}   // namespace sse

#endif  // KSHIELDENGINE_SHIELD_ENGINE_ENGINE_ERRORS_H_
