/**
 * @file strategy.hpp
 * @brief Draw poker discard policy.
 *
 * Fixed table, one entry per hand category:
 *   | Hand Rank                     | Discard                   |
 *   |-------------------------------|---------------------------|
 *   | Royal Flush, Straight Flush   | none                      |
 *   | Four of a Kind, Full House    | none                      |
 *   | Flush, Straight               | none                      |
 *   | Three of a Kind               | the 2 non-keeper slots    |
 *   | Two Pair                      | the 1 non-keeper slot     |
 *   | Pair                          | the 3 non-keeper slots    |
 *   | High Card                     | all but the single keeper |
 *
 * Made hands of Straight or better stand pat; below that, only the cards
 * forming the current combination are kept and the rest are redrawn.
 */

#pragma once

#include "hand_eval.hpp"

namespace drawbot {

/**
 * @brief Slots to discard for a classified hand.
 * @param rank Hand category from evaluate_hand()
 * @param keepers Keeper slots from evaluate_hand()
 * @return Ascending slot list; empty means stand pat
 * @throws std::out_of_range if a keeper is not a valid slot
 *
 * Keepers and discards together always cover slots 1-5 exactly once when
 * the discard list is non-empty.
 */
SlotList discard_positions(HandRank rank, const SlotList& keepers);

/** @brief Shorthand for discard_positions(eval.rank, eval.keepers). */
SlotList discard_positions(const HandEvaluation& eval);

/**
 * @brief True when the category stands pat (no discards at all).
 */
bool stands_pat(HandRank rank);

} // namespace drawbot
