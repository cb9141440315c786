/**
 * @file deck.cpp
 * @brief Random-without-replacement card source.
 *
 * Determinism: draws come from std::mt19937_64, so an explicit seed gives
 * the same sequence on every platform.
 */

#include "../include/drawbot/deck.hpp"
#include <algorithm>

namespace drawbot {

Deck::Deck() : Deck(std::random_device{}()) {}

Deck::Deck(uint64_t seed)
    : all_cards_(create_full_deck()),
      used_(DECK_SIZE, false),
      used_count_(0),
      rng_(seed) {}

void Deck::reset() {
    std::fill(used_.begin(), used_.end(), false);
    used_count_ = 0;
}

std::optional<Card> Deck::draw_card() {
    std::vector<int> available;
    available.reserve(DECK_SIZE);
    for (int i = 0; i < DECK_SIZE; ++i) {
        if (!used_[i]) available.push_back(i);
    }
    if (available.empty()) {
        return std::nullopt;
    }

    std::uniform_int_distribution<size_t> pick(0, available.size() - 1);
    int idx = available[pick(rng_)];
    used_[idx] = true;
    ++used_count_;
    return all_cards_[idx];
}

std::vector<Card> Deck::draw_cards(int count) {
    std::vector<Card> cards;
    for (int i = 0; i < count; ++i) {
        auto card = draw_card();
        if (!card) break;
        cards.push_back(*card);
    }
    return cards;
}

std::vector<Card> Deck::generate_initial_hand() {
    return draw_cards(HAND_SIZE);
}

void Deck::mark_used(const Card& card) {
    validate_card(card);
    int idx = index_of(card);
    if (!used_[idx]) {
        used_[idx] = true;
        ++used_count_;
    }
}

void Deck::mark_used(const std::vector<Card>& cards) {
    for (const Card& c : cards) {
        mark_used(c);
    }
}

bool Deck::is_available(const Card& card) const {
    if (!is_valid_card(card)) return false;
    return !used_[index_of(card)];
}

std::vector<Card> Deck::used_cards() const {
    std::vector<Card> cards;
    for (int i = 0; i < DECK_SIZE; ++i) {
        if (used_[i]) cards.push_back(all_cards_[i]);
    }
    return cards;
}

int Deck::index_of(const Card& card) {
    // Matches create_full_deck(): suit-major, ranks ascending
    return static_cast<int>(card.suit) * NUM_RANKS + (card.rank - MIN_RANK);
}

} // namespace drawbot
