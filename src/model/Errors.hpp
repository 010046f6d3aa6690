#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace Cadenza {

// Adapter and resolver failures. The resolver translates anything an adapter
// throws into one of these and fills in the backends it tried.
class ResolveError : public std::runtime_error {
public:
    explicit ResolveError(const std::string& what, std::vector<std::string> tried = {})
        : std::runtime_error(what), tried_(std::move(tried)) {}
    const std::vector<std::string>& TriedBackends() const { return tried_; }
private:
    std::vector<std::string> tried_;
};

// Retryable.
class BackendTimeout : public ResolveError {
public:
    using ResolveError::ResolveError;
};

// Malformed response: the backend is skipped for the rest of this call.
class BackendProtocolError : public ResolveError {
public:
    using ResolveError::ResolveError;
};

// Unreachable or refusing: skipped for this call, tried again on the next one.
class BackendUnavailable : public ResolveError {
public:
    using ResolveError::ResolveError;
};

class NoResultsError : public ResolveError {
public:
    using ResolveError::ResolveError;
};

class QueueError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class QueueFullError : public QueueError {
public:
    using QueueError::QueueError;
};

class QuarantinedItemError : public QueueError {
public:
    using QueueError::QueueError;
};

std::string JoinNames(const std::vector<std::string>& names);

}
