#pragma once

#include <stdexcept>
#include <string>

namespace podengine {
namespace core {

// A podcast or episode id that is no longer present in the catalog.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

// The persistence layer refused or failed an operation.
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& what) : std::runtime_error(what) {}
};

// A remote sync call exhausted its retries or returned something unusable.
class RemoteSyncError : public std::runtime_error {
public:
    explicit RemoteSyncError(const std::string& what) : std::runtime_error(what) {}
};

// A feed could not be fetched or parsed.
class FeedError : public std::runtime_error {
public:
    explicit FeedError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace core
} // namespace podengine
