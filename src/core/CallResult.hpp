#ifndef CALLRESULT_HPP
#define CALLRESULT_HPP

#include <optional>
#include <string>
#include <utility>

enum class CallStatus {
    Ok,
    Failed,      // attempted, dependency reported failure
    CircuitOpen  // not attempted
};

// Explicit success-or-failure value returned by operations wrapped in a CircuitBreaker.
template <typename T>
class CallResult {
public:
    using value_type = T;

    static CallResult ok(T value) {
        CallResult r(CallStatus::Ok);
        r.value_ = std::move(value);
        return r;
    }
    static CallResult failure(std::string error) {
        CallResult r(CallStatus::Failed);
        r.error_ = std::move(error);
        return r;
    }
    static CallResult circuitOpen(std::string error) {
        CallResult r(CallStatus::CircuitOpen);
        r.error_ = std::move(error);
        return r;
    }

    CallStatus status() const { return status_; }
    bool isOk() const { return status_ == CallStatus::Ok; }
    bool isCircuitOpen() const { return status_ == CallStatus::CircuitOpen; }
    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const std::string& error() const { return error_; }

private:
    explicit CallResult(CallStatus status) : status_(status) {}

    CallStatus status_;
    std::optional<T> value_;
    std::string error_;
};

// Operations with nothing to return.
struct Unit {};

#endif // CALLRESULT_HPP
