#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Malformed input or an illegal lifecycle transition. Caller's fault; never retried.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// Backing store failure. Nothing was applied; retrying with the same key is safe.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Fast-fail from a breaker: the dependency was not attempted.
class CircuitOpenError : public std::runtime_error {
public:
    CircuitOpenError(const std::string& breaker, const std::string& what)
        : std::runtime_error(what), breaker_(breaker) {}
    const std::string& breaker() const { return breaker_; }

private:
    std::string breaker_;
};

// The dependency was attempted and reported failure through its result.
class OperationFailedError : public std::runtime_error {
public:
    explicit OperationFailedError(const std::string& what) : std::runtime_error(what) {}
};

#endif // ERRORS_HPP
