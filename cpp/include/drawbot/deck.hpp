/**
 * @file deck.hpp
 * @brief Random card source used by callers to feed the holder.
 *
 * The decision functions never touch a Deck; they only reason about Hand
 * values. Callers (the demo program, the controller, tests) use a Deck to
 * simulate what the manipulator picks up from the physical deck.
 *
 * Draws are random without replacement: a card drawn or marked used stays
 * out of play until reset(). Explicit seeding makes draws reproducible:
 * identical seeds produce identical sequences.
 *
 * Usage:
 * @code
 *   Deck deck(42);
 *   auto hand = deck.generate_initial_hand();  // 5 distinct cards
 *   auto card = deck.draw_card();              // std::nullopt once exhausted
 *   deck.reset();                              // all 52 cards available again
 * @endcode
 */

#pragma once

#include "card.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace drawbot {

class Deck {
public:
    /** @brief Construct a deck seeded from std::random_device. */
    Deck();

    /** @brief Construct a deck with a fixed seed (same seed = same draws). */
    explicit Deck(uint64_t seed);

    /** @brief Make all 52 cards available again. The RNG is not reseeded. */
    void reset();

    /**
     * @brief Draw one random card that has not been drawn or marked used.
     * @return The card, or std::nullopt if none remain
     */
    std::optional<Card> draw_card();

    /**
     * @brief Draw up to count cards.
     * @return Fewer than count cards if the deck runs out
     */
    std::vector<Card> draw_cards(int count);

    /** @brief Draw HAND_SIZE distinct cards. */
    std::vector<Card> generate_initial_hand();

    /** @brief Take a card out of play without drawing it (e.g., it went to the trash). */
    void mark_used(const Card& card);

    void mark_used(const std::vector<Card>& cards);

    /** @brief Cards still available to draw. */
    int remaining() const { return DECK_SIZE - used_count_; }

    /** @brief True if the card has not been drawn or marked used. */
    bool is_available(const Card& card) const;

    /** @brief Drawn and marked cards, in deck order (suit-major). */
    std::vector<Card> used_cards() const;

private:
    static int index_of(const Card& card);

    std::vector<Card> all_cards_;  ///< Full 52-card listing
    std::vector<bool> used_;       ///< used_[i] iff all_cards_[i] is out of play
    int used_count_;               ///< Number of true entries in used_
    std::mt19937_64 rng_;          ///< Mersenne Twister RNG for draws
};

} // namespace drawbot
