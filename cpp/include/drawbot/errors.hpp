/**
 * @file errors.hpp
 * @brief Error kinds raised by the hand model, evaluator and action compiler.
 *
 * Every failure in the decision pipeline is reported synchronously by
 * throwing HandError. There is no partial output: a caller either gets a
 * complete, valid action sequence or an exception.
 *
 * Kinds:
 *   - INVALID_HAND_LENGTH:  a hand was built from a sequence whose length is not 5
 *   - INVALID_CARD:         rank outside [2,14] or suit outside {H, D, C, S}
 *   - DUPLICATE_CARD:       the same card appears twice in one hand
 *   - AMBIGUOUS_HAND_STATE: fill requested for a complete hand, or swap
 *                           requested for a hand with empty slots
 *   - EMPTY_SLOT:           evaluation attempted on a hand with an empty slot
 *   - INVALID_ACTION:       unparseable command string or bad slot in an Action
 */

#pragma once

#include <stdexcept>
#include <string>

namespace drawbot {

/** @brief Category of a HandError. */
enum class HandErrorKind {
    INVALID_HAND_LENGTH = 0,
    INVALID_CARD = 1,
    DUPLICATE_CARD = 2,
    AMBIGUOUS_HAND_STATE = 3,
    EMPTY_SLOT = 4,
    INVALID_ACTION = 5
};

/**
 * @brief Stable name for an error kind ("InvalidHandLength", "DuplicateCard", ...).
 * @param kind HandErrorKind value
 * @return Name string, "Unknown" for out-of-range values
 */
const char* hand_error_kind_name(HandErrorKind kind);

/**
 * @brief Exception thrown for every invalid hand, card or action.
 *
 * Derives from std::invalid_argument so callers that only care about
 * "bad input" can catch the standard type.
 */
class HandError : public std::invalid_argument {
public:
    HandError(HandErrorKind kind, const std::string& message);

    /** @brief The error category. */
    HandErrorKind kind() const { return kind_; }

private:
    HandErrorKind kind_;
};

} // namespace drawbot
