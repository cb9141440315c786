/**
 * @file card.hpp
 * @brief Card values, constants and the five-slot hand held by the card holder.
 *
 * A card is a (rank, suit) pair:
 *   - Ranks: 2-14, where 11=J, 12=Q, 13=K, 14=A
 *   - Suits: Hearts, Diamonds, Clubs, Spades (written 'H', 'D', 'C', 'S')
 *   - Example: Ace of Hearts = {14, Suit::HEARTS}, printed "AH"
 *   - Example: Ten of Diamonds = {10, Suit::DIAMONDS}, printed "10D"
 *
 * A Hand is the physical card holder: exactly HAND_SIZE slots, each either
 * holding a card or empty. Slots are addressed 1-5 to match the holder
 * numbering used by the manipulator commands.
 */

#pragma once

#include "errors.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace drawbot {

/** @brief Number of slots in the card holder */
constexpr int HAND_SIZE = 5;

/** @brief Total number of ranks in a standard deck (2 through Ace) */
constexpr int NUM_RANKS = 13;

/** @brief Total number of suits */
constexpr int NUM_SUITS = 4;

/** @brief Total cards in a standard deck */
constexpr int DECK_SIZE = 52;

/** @brief Lowest rank value (Two) */
constexpr int MIN_RANK = 2;

/** @brief Highest rank value (Ace) */
constexpr int MAX_RANK = 14;

/** @brief Card suit. Underlying values index suit counters. */
enum class Suit {
    HEARTS = 0,
    DIAMONDS = 1,
    CLUBS = 2,
    SPADES = 3
};

/**
 * @brief Immutable playing card value.
 *
 * Build cards with make_card() to get range checking. Two cards are equal
 * iff rank and suit both match.
 */
struct Card {
    int rank;   ///< 2-14, Ace high
    Suit suit;  ///< One of the four suits

    bool operator==(const Card& other) const {
        return rank == other.rank && suit == other.suit;
    }
    bool operator!=(const Card& other) const { return !(*this == other); }
};

/** @brief Holder position, 1-based (1..HAND_SIZE). */
using Slot = int;

/** @brief Ascending list of holder positions. */
using SlotList = std::vector<Slot>;

/** @brief Contents of one holder position: a card or nothing. */
using CardSlot = std::optional<Card>;

/**
 * @brief Construct a card, validating rank and suit.
 * @param rank Rank value (2-14)
 * @param suit Suit enumerator
 * @return The card
 * @throws HandError INVALID_CARD if rank or suit is out of range
 */
Card make_card(int rank, Suit suit);

/**
 * @brief Construct a card from a suit letter.
 * @param rank Rank value (2-14)
 * @param suit_char 'H', 'D', 'C' or 'S' (either case)
 * @throws HandError INVALID_CARD if rank or suit letter is invalid
 */
Card make_card(int rank, char suit_char);

/** @brief Check that a card's rank and suit are in range. */
bool is_valid_card(const Card& card);

/** @brief Check a (rank, suit letter) pair without constructing a card. */
bool is_valid_card(int rank, char suit_char);

/**
 * @brief Throw unless the card is valid.
 * @throws HandError INVALID_CARD
 */
void validate_card(const Card& card);

/** @brief Throw std::out_of_range unless 1 <= slot <= HAND_SIZE. */
void check_slot(Slot slot);

/**
 * @brief Convert a suit letter to a Suit.
 * @throws HandError INVALID_CARD for anything but H, D, C, S (either case)
 */
Suit suit_from_char(char c);

/** @brief Suit letter: 'H', 'D', 'C' or 'S'. */
char suit_to_char(Suit suit);

/** @brief Rank label: "2".."10", "J", "Q", "K", "A"; "?" when out of range. */
const char* get_rank_name(int rank);

/** @brief Suit label: "Hearts", "Diamonds", "Clubs", "Spades". */
const char* get_suit_name(Suit suit);

/** @brief Short form, e.g. "AH", "10D", "7C". */
std::string card_to_string(const Card& card);

/** @brief Long form, e.g. "A of Hearts". */
std::string card_to_full_string(const Card& card);

/**
 * @brief Parse the short form produced by card_to_string().
 *
 * Accepts ranks "2"-"10", "J", "Q", "K", "A" (and "T" for ten) followed by
 * a suit letter, case-insensitive.
 *
 * @throws HandError INVALID_CARD on malformed text
 */
Card card_from_string(const std::string& text);

/**
 * @brief All 52 cards, ordered suit by suit (H, D, C, S), ranks ascending.
 */
std::vector<Card> create_full_deck();

/**
 * @brief Fixed-size view of the card holder.
 *
 * Always exactly HAND_SIZE slots; the length invariant is enforced when the
 * hand is built, and every occupied slot holds a validated card. Hands are
 * values: replace() returns a new hand rather than editing in place.
 *
 * Usage:
 * @code
 *   Hand hand = Hand::from_slots({make_card(10, 'H'), std::nullopt,
 *                                 make_card(5, 'C'), std::nullopt,
 *                                 make_card(7, 'H')});
 *   hand.empty_slots();  // {2, 4}
 * @endcode
 */
class Hand {
public:
    /** @brief Construct an empty holder (all slots empty). */
    Hand();

    /**
     * @brief Construct from exactly HAND_SIZE slots.
     * @throws HandError INVALID_CARD if any occupied slot holds an invalid card
     */
    explicit Hand(const std::array<CardSlot, HAND_SIZE>& slots);

    /**
     * @brief Construct from a sequence of slots of any length.
     * @throws HandError INVALID_HAND_LENGTH unless slots.size() == HAND_SIZE
     * @throws HandError INVALID_CARD if any occupied slot holds an invalid card
     */
    static Hand from_slots(const std::vector<CardSlot>& slots);

    /**
     * @brief Construct a complete hand from a sequence of cards.
     * @throws HandError INVALID_HAND_LENGTH unless cards.size() == HAND_SIZE
     * @throws HandError INVALID_CARD if any card is invalid
     */
    static Hand from_cards(const std::vector<Card>& cards);

    /**
     * @brief Contents of a slot.
     * @param slot 1-based holder position
     * @throws std::out_of_range if slot is not in [1, HAND_SIZE]
     */
    const CardSlot& at(Slot slot) const;

    /** @brief Copy of this hand with one slot replaced. */
    Hand replace(Slot slot, const CardSlot& card) const;

    /** @brief True when no slot is empty. */
    bool is_complete() const;

    /** @brief True when every slot is empty. */
    bool is_empty() const;

    /** @brief Empty holder positions, ascending. */
    SlotList empty_slots() const;

    /**
     * @brief The five cards of a complete hand, in slot order.
     * @throws HandError EMPTY_SLOT if any slot is empty
     */
    std::array<Card, HAND_SIZE> cards() const;

    /** @brief Raw slot storage (index 0 is slot 1). */
    const std::array<CardSlot, HAND_SIZE>& slots() const { return slots_; }

    bool operator==(const Hand& other) const { return slots_ == other.slots_; }
    bool operator!=(const Hand& other) const { return !(*this == other); }

private:
    std::array<CardSlot, HAND_SIZE> slots_;
};

/** @brief Render a hand as "[AH, --, 5C, --, 7H]". */
std::string hand_to_string(const Hand& hand);

} // namespace drawbot
