#pragma once

#include <stdexcept>
#include <string>

namespace transmuter {

enum class ErrorKind {
    Paused,
    InvalidTokens,
    NotCollateral,
    TooLate,
    TooSmallAmountOut,
    TooBigAmountIn,
    InvalidSwap,
    NotTrusted,
    InvalidParams,
    AlreadyAdded,
    ReentrantCall
};

const char* to_string(ErrorKind kind);

// Every rejected swap or admin call aborts with one of these; the ledger is
// left as it was before the call.
class TransmuterError : public std::runtime_error {
public:
    explicit TransmuterError(ErrorKind kind)
        : std::runtime_error(to_string(kind)), kind_(kind) {}

    TransmuterError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(std::string(to_string(kind)) + ": " + detail), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace transmuter
