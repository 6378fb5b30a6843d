#pragma once
#include <stdexcept>
#include <string>

namespace Fanout {

    // A work unit ran past its per-task timeout.
    class TaskTimeoutError : public std::runtime_error {
    public:
        explicit TaskTimeoutError(const std::string& what) : std::runtime_error(what) {}
    };

    // The downstream batch call failed or returned fewer results than items.
    class BatchProcessingError : public std::runtime_error {
    public:
        explicit BatchProcessingError(const std::string& what) : std::runtime_error(what) {}
    };

    // Thrown when a named cache is accessed with a value type other than the
    // one it was created with.
    class CacheTypeError : public std::logic_error {
    public:
        explicit CacheTypeError(const std::string& what) : std::logic_error(what) {}
    };

}
