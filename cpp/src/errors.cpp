#include "../include/drawbot/errors.hpp"

namespace drawbot {

const char* hand_error_kind_name(HandErrorKind kind) {
    switch (kind) {
        case HandErrorKind::INVALID_HAND_LENGTH:  return "InvalidHandLength";
        case HandErrorKind::INVALID_CARD:         return "InvalidCard";
        case HandErrorKind::DUPLICATE_CARD:       return "DuplicateCard";
        case HandErrorKind::AMBIGUOUS_HAND_STATE: return "AmbiguousHandState";
        case HandErrorKind::EMPTY_SLOT:           return "EmptySlot";
        case HandErrorKind::INVALID_ACTION:       return "InvalidAction";
    }
    return "Unknown";
}

HandError::HandError(HandErrorKind kind, const std::string& message)
    : std::invalid_argument(std::string(hand_error_kind_name(kind)) + ": " + message),
      kind_(kind) {}

} // namespace drawbot
