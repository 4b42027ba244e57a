#include "common/error.hpp"

namespace saorsa_logic {

const char* to_string(LogicError error) {
    switch (error) {
        case LogicError::InvalidLength: return "invalid length";
        case LogicError::MalformedProof: return "malformed proof";
        case LogicError::HashingFailed: return "hashing failed";
    }
    return "unknown error";
}

std::ostream& operator<<(std::ostream& os, LogicError error) {
    return os << to_string(error);
}

} // namespace saorsa_logic
