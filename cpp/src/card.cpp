/**
 * @file card.cpp
 * @brief Card validation, text conversion and the Hand holder model.
 *
 * Provides:
 *   - Checked card construction (rank 2-14, suit H/D/C/S)
 *   - Short ("AH") and long ("A of Hearts") text forms plus parsing
 *   - Full 52-card deck listing
 *   - Hand construction with the five-slot invariant
 */

#include "../include/drawbot/card.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace drawbot {

namespace {

std::string rank_out_of_range(int rank) {
    return "rank " + std::to_string(rank) + " outside [" +
           std::to_string(MIN_RANK) + ", " + std::to_string(MAX_RANK) + "]";
}

bool is_valid_suit(Suit suit) {
    int s = static_cast<int>(suit);
    return s >= 0 && s < NUM_SUITS;
}

} // anonymous namespace

Card make_card(int rank, Suit suit) {
    Card card{rank, suit};
    validate_card(card);
    return card;
}

Card make_card(int rank, char suit_char) {
    return make_card(rank, suit_from_char(suit_char));
}

bool is_valid_card(const Card& card) {
    return card.rank >= MIN_RANK && card.rank <= MAX_RANK && is_valid_suit(card.suit);
}

bool is_valid_card(int rank, char suit_char) {
    if (rank < MIN_RANK || rank > MAX_RANK) return false;
    char c = static_cast<char>(std::toupper(static_cast<unsigned char>(suit_char)));
    return c == 'H' || c == 'D' || c == 'C' || c == 'S';
}

void validate_card(const Card& card) {
    if (card.rank < MIN_RANK || card.rank > MAX_RANK) {
        throw HandError(HandErrorKind::INVALID_CARD, rank_out_of_range(card.rank));
    }
    if (!is_valid_suit(card.suit)) {
        throw HandError(HandErrorKind::INVALID_CARD,
                        "suit value " + std::to_string(static_cast<int>(card.suit)) +
                        " is not one of H, D, C, S");
    }
}

void check_slot(Slot slot) {
    if (slot < 1 || slot > HAND_SIZE) {
        throw std::out_of_range("slot " + std::to_string(slot) + " outside [1, " +
                                std::to_string(HAND_SIZE) + "]");
    }
}

Suit suit_from_char(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'H': return Suit::HEARTS;
        case 'D': return Suit::DIAMONDS;
        case 'C': return Suit::CLUBS;
        case 'S': return Suit::SPADES;
        default:
            throw HandError(HandErrorKind::INVALID_CARD,
                            "unknown suit character '" + std::string(1, c) + "'");
    }
}

char suit_to_char(Suit suit) {
    static const char letters[] = {'H', 'D', 'C', 'S'};
    return is_valid_suit(suit) ? letters[static_cast<int>(suit)] : '?';
}

const char* get_rank_name(int rank) {
    static const char* names[] = {
        "2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K", "A"
    };
    return (rank >= MIN_RANK && rank <= MAX_RANK) ? names[rank - MIN_RANK] : "?";
}

const char* get_suit_name(Suit suit) {
    static const char* names[] = {"Hearts", "Diamonds", "Clubs", "Spades"};
    return is_valid_suit(suit) ? names[static_cast<int>(suit)] : "?";
}

std::string card_to_string(const Card& card) {
    return std::string(get_rank_name(card.rank)) + suit_to_char(card.suit);
}

std::string card_to_full_string(const Card& card) {
    return std::string(get_rank_name(card.rank)) + " of " + get_suit_name(card.suit);
}

Card card_from_string(const std::string& text) {
    if (text.size() < 2 || text.size() > 3) {
        throw HandError(HandErrorKind::INVALID_CARD,
                        "invalid card string '" + text + "', expected e.g. 'AH' or '10D'");
    }

    std::string rank_text = text.substr(0, text.size() - 1);
    std::transform(rank_text.begin(), rank_text.end(), rank_text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    int rank = 0;
    if (rank_text == "A") rank = 14;
    else if (rank_text == "K") rank = 13;
    else if (rank_text == "Q") rank = 12;
    else if (rank_text == "J") rank = 11;
    else if (rank_text == "T" || rank_text == "10") rank = 10;
    else if (rank_text.size() == 1 && rank_text[0] >= '2' && rank_text[0] <= '9') {
        rank = rank_text[0] - '0';
    } else {
        throw HandError(HandErrorKind::INVALID_CARD,
                        "invalid rank '" + rank_text + "' in card string '" + text + "'");
    }

    return make_card(rank, suit_from_char(text.back()));
}

std::vector<Card> create_full_deck() {
    std::vector<Card> deck;
    deck.reserve(DECK_SIZE);
    for (int s = 0; s < NUM_SUITS; ++s) {
        for (int r = MIN_RANK; r <= MAX_RANK; ++r) {
            deck.push_back(Card{r, static_cast<Suit>(s)});
        }
    }
    return deck;
}

// ============================================================================
// Hand
// ============================================================================

Hand::Hand() : slots_{} {}

Hand::Hand(const std::array<CardSlot, HAND_SIZE>& slots) : slots_(slots) {
    for (const auto& slot : slots_) {
        if (slot) validate_card(*slot);
    }
}

Hand Hand::from_slots(const std::vector<CardSlot>& slots) {
    if (slots.size() != static_cast<size_t>(HAND_SIZE)) {
        throw HandError(HandErrorKind::INVALID_HAND_LENGTH,
                        "hand must have exactly " + std::to_string(HAND_SIZE) +
                        " slots, got " + std::to_string(slots.size()));
    }
    std::array<CardSlot, HAND_SIZE> fixed;
    std::copy(slots.begin(), slots.end(), fixed.begin());
    return Hand(fixed);
}

Hand Hand::from_cards(const std::vector<Card>& cards) {
    return from_slots(std::vector<CardSlot>(cards.begin(), cards.end()));
}

const CardSlot& Hand::at(Slot slot) const {
    check_slot(slot);
    return slots_[slot - 1];
}

Hand Hand::replace(Slot slot, const CardSlot& card) const {
    check_slot(slot);
    std::array<CardSlot, HAND_SIZE> next = slots_;
    next[slot - 1] = card;
    return Hand(next);
}

bool Hand::is_complete() const {
    return std::all_of(slots_.begin(), slots_.end(),
                       [](const CardSlot& s) { return s.has_value(); });
}

bool Hand::is_empty() const {
    return std::none_of(slots_.begin(), slots_.end(),
                        [](const CardSlot& s) { return s.has_value(); });
}

SlotList Hand::empty_slots() const {
    SlotList empty;
    for (int i = 0; i < HAND_SIZE; ++i) {
        if (!slots_[i]) empty.push_back(i + 1);
    }
    return empty;
}

std::array<Card, HAND_SIZE> Hand::cards() const {
    std::array<Card, HAND_SIZE> out{};
    for (int i = 0; i < HAND_SIZE; ++i) {
        if (!slots_[i]) {
            throw HandError(HandErrorKind::EMPTY_SLOT,
                            "slot " + std::to_string(i + 1) + " is empty");
        }
        out[i] = *slots_[i];
    }
    return out;
}

std::string hand_to_string(const Hand& hand) {
    std::ostringstream oss;
    oss << "[";
    for (int i = 0; i < HAND_SIZE; ++i) {
        const CardSlot& slot = hand.slots()[i];
        oss << (slot ? card_to_string(*slot) : "--");
        if (i < HAND_SIZE - 1) oss << ", ";
    }
    oss << "]";
    return oss.str();
}

} // namespace drawbot
