/**
 * @file actions.hpp
 * @brief Manipulator command sequences and the top-level decision function.
 *
 * The manipulator understands five commands (slots are 1-based):
 *   | Action            | Command string     |
 *   |-------------------|--------------------|
 *   | TAKE_CARD_AT(n)   | "take card n"      |
 *   | DEFAULT_POSITION  | "default position" |
 *   | DROP_HOLDING      | "drop holding"     |
 *   | TAKE_DECK         | "take deck"        |
 *   | PLACE_AT(n)       | "place at n"       |
 *
 * decide_actions() dispatches on completeness:
 *   - Any empty slot: fill sequence, per empty slot ascending
 *     "take deck", "place at n"; then one trailing "default position".
 *   - Complete hand: evaluate, pick discards, swap sequence, per discarded
 *     slot ascending "take card n", "drop holding", "default position",
 *     "take deck", "place at n"; then one trailing "default position".
 *     No discards gives the empty sequence (stand pat).
 *
 * The caller executes the commands, reads back the physical cards and
 * calls again for the next round. Nothing is kept between calls.
 *
 * Usage:
 * @code
 *   Hand hand;  // empty holder
 *   auto fill = decide_actions(hand);         // 11 actions
 *   // ... robot fills the holder, caller builds the new Hand ...
 *   auto swap = decide_actions(filled_hand);  // swap round or empty
 *   for (const auto& cmd : to_commands(swap)) send(cmd);
 * @endcode
 */

#pragma once

#include "card.hpp"
#include <string>
#include <vector>

namespace drawbot {

/**
 * @brief One manipulator command.
 *
 * slot is meaningful only for TAKE_CARD_AT and PLACE_AT and is 0 otherwise.
 * Use the named factories to build valid actions.
 */
struct Action {
    enum Type {
        TAKE_CARD_AT = 0,     ///< Pick up the card held in a slot
        DEFAULT_POSITION = 1, ///< Return the arm to rest
        DROP_HOLDING = 2,     ///< Drop the held card into the trash
        TAKE_DECK = 3,        ///< Pick up the top card of the deck
        PLACE_AT = 4          ///< Put the held card into a slot
    };

    Type type;  ///< Command variant
    Slot slot;  ///< 1-5 for TAKE_CARD_AT / PLACE_AT, else 0

    /** @brief Default constructor: DEFAULT_POSITION */
    Action() : type(DEFAULT_POSITION), slot(0) {}

    /**
     * @brief Construct an action.
     * @throws HandError INVALID_ACTION if a slot-parameterised variant gets
     *         a slot outside [1,5], or another variant gets a non-zero slot
     */
    Action(Type t, Slot s);

    static Action take_card_at(Slot s) { return Action(TAKE_CARD_AT, s); }
    static Action default_position() { return Action(DEFAULT_POSITION, 0); }
    static Action drop_holding() { return Action(DROP_HOLDING, 0); }
    static Action take_deck() { return Action(TAKE_DECK, 0); }
    static Action place_at(Slot s) { return Action(PLACE_AT, s); }

    bool operator==(const Action& other) const {
        return type == other.type && slot == other.slot;
    }
    bool operator!=(const Action& other) const { return !(*this == other); }
};

using ActionList = std::vector<Action>;

/** @brief Serialise to the manipulator command string, e.g. "place at 3". */
std::string to_command(const Action& action);

/** @brief Serialise a whole sequence, order preserved. */
std::vector<std::string> to_commands(const ActionList& actions);

/**
 * @brief Parse a command string.
 *
 * Surrounding whitespace is ignored and matching is case-insensitive.
 *
 * @throws HandError INVALID_ACTION for unknown commands or bad slots
 */
Action parse_action(const std::string& command);

/**
 * @brief Fill sequence for every empty slot.
 * @throws HandError AMBIGUOUS_HAND_STATE if the hand has no empty slot
 */
ActionList compile_fill_actions(const Hand& hand);

/**
 * @brief Swap sequence replacing the given slots of a complete hand.
 * @param hand Complete holder state
 * @param discards Slots to replace; order and duplicates do not matter
 * @return Empty if discards is empty
 * @throws HandError AMBIGUOUS_HAND_STATE if the hand has an empty slot
 * @throws std::out_of_range if a discard slot is not in [1,5]
 */
ActionList compile_swap_actions(const Hand& hand, const SlotList& discards);

/**
 * @brief Main entry point: next command sequence for the holder.
 * @param hand Current holder state
 * @return Fill sequence, swap sequence, or empty to stand pat
 * @throws HandError DUPLICATE_CARD if a complete hand holds a card twice
 */
ActionList decide_actions(const Hand& hand);

/**
 * @brief decide_actions() rendered as command strings.
 */
std::vector<std::string> get_poker_actions(const Hand& hand);

/** @brief Number of cards taken out of the holder (TAKE_CARD_AT count). */
int count_swaps(const ActionList& actions);

/** @brief Distinct TAKE_CARD_AT slots in first-seen order. */
SlotList swap_positions(const ActionList& actions);

} // namespace drawbot
