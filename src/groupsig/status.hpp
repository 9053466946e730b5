#ifndef GRPSIG_STATUS_HPP
#define GRPSIG_STATUS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace grpsig {

// -----------------------------------------------------------------------------
// Result codes for protocol steps. Failed joins, opens and lookups are normal
// outcomes under an adversarial model, so they are values, not exceptions.
// -----------------------------------------------------------------------------
enum class ErrorCode : uint8_t {
    Ok           = 0,
    Protocol     = 1,  // message inconsistent with the current phase/session
    Verification = 2,  // a proof or pairing check inside the step failed
    NotFound     = 3,  // no registry entry matches
    Unsupported  = 4,  // capability not implemented by this scheme
    MissingKey   = 5   // the caller does not hold the key the step needs
};

const char* to_string(ErrorCode code);

class Status {
public:
    Status() = default;

    static Status Ok() { return Status(); }
    static Status Error(ErrorCode code, std::string message) {
        Status s;
        s.code_ = code;
        s.message_ = std::move(message);
        return s;
    }

    bool ok() const { return code_ == ErrorCode::Ok; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    ErrorCode   code_ = ErrorCode::Ok;
    std::string message_;
};

template <typename T>
class Outcome {
public:
    Outcome(T value) : value_(std::move(value)) {}
    Outcome(Status status) : status_(std::move(status)) {
        if (status_.ok()) throw std::logic_error("Outcome: error constructor needs an error status");
    }

    static Outcome Error(ErrorCode code, std::string message) {
        return Outcome(Status::Error(code, std::move(message)));
    }

    bool ok() const { return status_.ok(); }
    const Status& status() const { return status_; }
    ErrorCode code() const { return status_.code(); }
    const std::string& message() const { return status_.message(); }

    const T& value() const {
        if (!value_) throw std::logic_error("Outcome::value on error: " + status_.message());
        return *value_;
    }
    T& value() {
        if (!value_) throw std::logic_error("Outcome::value on error: " + status_.message());
        return *value_;
    }

private:
    Status           status_;
    std::optional<T> value_;
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:           return "ok";
        case ErrorCode::Protocol:     return "protocol error";
        case ErrorCode::Verification: return "verification failure";
        case ErrorCode::NotFound:     return "not found";
        case ErrorCode::Unsupported:  return "unsupported";
        case ErrorCode::MissingKey:   return "missing key";
    }
    return "unknown";
}

} // namespace grpsig

#endif // GRPSIG_STATUS_HPP
