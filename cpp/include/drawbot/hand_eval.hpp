/**
 * @file hand_eval.hpp
 * @brief Five-card draw poker hand classification.
 *
 * Implements the 10-category poker ranking:
 *   1. HIGH_CARD (weakest)
 *   2. PAIR
 *   3. TWO_PAIR
 *   4. THREE_OF_A_KIND
 *   5. STRAIGHT
 *   6. FLUSH
 *   7. FULL_HOUSE
 *   8. FOUR_OF_A_KIND
 *   9. STRAIGHT_FLUSH
 *  10. ROYAL_FLUSH (strongest, the 10-J-Q-K-A straight flush)
 *
 * Besides the category, evaluation reports the keeper slots: the holder
 * positions whose cards form the category. Everything else is a candidate
 * for discard.
 *
 * Special cases handled:
 *   - A-2-3-4-5 "wheel" straight (Ace acts as low card, straight tops at 5)
 *   - Royal flush surfaced as its own category
 *   - Duplicate cards rejected
 */

#pragma once

#include "card.hpp"
#include <vector>

namespace drawbot {

/**
 * @brief Poker hand categories ordered by strength (0 = weakest, 9 = strongest).
 */
enum class HandRank {
    HIGH_CARD = 0,        ///< No matching cards (single highest card kept)
    PAIR = 1,             ///< Two cards of same rank
    TWO_PAIR = 2,         ///< Two different pairs
    THREE_OF_A_KIND = 3,  ///< Three cards of same rank (trips)
    STRAIGHT = 4,         ///< Five consecutive ranks (includes A-2-3-4-5 wheel)
    FLUSH = 5,            ///< Five cards of same suit
    FULL_HOUSE = 6,       ///< Three of a kind plus a pair
    FOUR_OF_A_KIND = 7,   ///< Four cards of same rank (quads)
    STRAIGHT_FLUSH = 8,   ///< Straight and flush combined
    ROYAL_FLUSH = 9       ///< 10-J-Q-K-A of one suit
};

/** @brief Number of HandRank categories */
constexpr int NUM_HAND_RANKS = 10;

/**
 * @brief Get human-readable name for a hand category.
 * @return "High Card", "One Pair", ..., "Royal Flush"
 */
const char* hand_rank_name(HandRank rank);

/**
 * @brief Result of evaluating a complete hand.
 */
struct HandEvaluation {
    HandRank rank;                ///< Detected category
    SlotList keepers;             ///< Slots (1-5, ascending) forming the category
    std::vector<int> tiebreakers; ///< Ranks for ordering hands of equal category

    /** @brief Default constructor (HIGH_CARD, no keepers) */
    HandEvaluation() : rank(HandRank::HIGH_CARD) {}
};

/**
 * @brief Classify a complete five-card hand.
 * @param hand Holder state with no empty slot
 * @return Category, keeper slots and tiebreakers
 *
 * Algorithm:
 *   1. Count rank and suit frequencies
 *   2. Check for flush (all same suit) and straight (5 consecutive or wheel)
 *   3. Match against categories in descending strength order
 *   4. Collect the keeper slots for the matched category
 *
 * @throws HandError EMPTY_SLOT if any slot is empty
 * @throws HandError DUPLICATE_CARD if a card appears twice
 */
HandEvaluation evaluate_hand(const Hand& hand);

/**
 * @brief Classify a hand given as a plain card sequence.
 * @throws HandError INVALID_HAND_LENGTH unless cards.size() == 5
 * @throws HandError INVALID_CARD / DUPLICATE_CARD as for evaluate_hand(const Hand&)
 */
HandEvaluation evaluate_hand(const std::vector<Card>& cards);

/**
 * @brief Compare two complete hands.
 * @return 1 if a wins, -1 if b wins, 0 on a tie
 *
 * Category first, then tiebreakers left to right.
 */
int compare_hands(const Hand& a, const Hand& b);

} // namespace drawbot
