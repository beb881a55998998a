#include "transmuter/errors.hpp"

namespace transmuter {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Paused:            return "paused";
        case ErrorKind::InvalidTokens:     return "invalid tokens";
        case ErrorKind::NotCollateral:     return "not collateral";
        case ErrorKind::TooLate:           return "too late";
        case ErrorKind::TooSmallAmountOut: return "too small amount out";
        case ErrorKind::TooBigAmountIn:    return "too big amount in";
        case ErrorKind::InvalidSwap:       return "invalid swap";
        case ErrorKind::NotTrusted:        return "not trusted";
        case ErrorKind::InvalidParams:     return "invalid params";
        case ErrorKind::AlreadyAdded:      return "already added";
        case ErrorKind::ReentrantCall:     return "reentrant call";
    }
    return "unknown error";
}

} // namespace transmuter
