/**
 * @file hand_eval.cpp
 * @brief Implementation of five-card hand classification.
 *
 * Hand Evaluation Algorithm:
 *   1. Reject empty slots and duplicate cards
 *   2. Count rank and suit frequencies
 *   3. Check for flush (all same suit) and straight (5 consecutive)
 *   4. Match against categories in descending strength order
 *   5. Return category with keeper slots and tiebreakers
 *
 * Straight Detection:
 *   - Normal straights: 5 distinct consecutive ranks (e.g., 5-6-7-8-9)
 *   - Wheel straight: A-2-3-4-5 where Ace acts as low card
 *   - The wheel check looks for ranks {2,3,4,5,14}; its top card is 5
 *
 * Keeper Slots:
 *   - Straight/flush family and full house: all 5 slots
 *   - Quads, trips, pairs: only the matching slots (no kickers)
 *   - High Card: only the slot holding the highest rank
 */

#include "../include/drawbot/hand_eval.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace drawbot {

const char* hand_rank_name(HandRank rank) {
    static const char* names[] = {
        "High Card", "One Pair", "Two Pair", "Three of a Kind", "Straight",
        "Flush", "Full House", "Four of a Kind", "Straight Flush", "Royal Flush"
    };
    int idx = static_cast<int>(rank);
    return (idx >= 0 && idx < NUM_HAND_RANKS) ? names[idx] : "Unknown";
}

namespace {

using Cards = std::array<Card, HAND_SIZE>;

// Indexed directly by rank value (0 and 1 unused)
using RankCounts = std::array<int, MAX_RANK + 1>;

RankCounts count_ranks(const Cards& cards) {
    RankCounts counts = {};
    for (const Card& c : cards) {
        counts[c.rank]++;
    }
    return counts;
}

bool is_flush(const Cards& cards) {
    for (const Card& c : cards) {
        if (c.suit != cards[0].suit) return false;
    }
    return true;
}

// Top card of the straight, or 0 if the cards do not form one.
int straight_high(const Cards& cards) {
    std::vector<int> ranks;
    for (const Card& c : cards) {
        ranks.push_back(c.rank);
    }
    std::sort(ranks.begin(), ranks.end());
    if (std::adjacent_find(ranks.begin(), ranks.end()) != ranks.end()) return 0;

    // Check for A-2-3-4-5 (wheel)
    if (ranks[0] == 2 && ranks[1] == 3 && ranks[2] == 4 && ranks[3] == 5 && ranks[4] == 14) {
        return 5;
    }

    return (ranks[4] - ranks[0] == 4) ? ranks[4] : 0;
}

void check_duplicates(const Cards& cards) {
    for (int i = 0; i < HAND_SIZE; ++i) {
        for (int j = i + 1; j < HAND_SIZE; ++j) {
            if (cards[i] == cards[j]) {
                throw HandError(HandErrorKind::DUPLICATE_CARD,
                                card_to_string(cards[i]) + " appears in slots " +
                                std::to_string(i + 1) + " and " + std::to_string(j + 1));
            }
        }
    }
}

// Ranks having exactly `count` cards, highest first
std::vector<int> ranks_with_count(const RankCounts& counts, int count) {
    std::vector<int> out;
    for (int r = MAX_RANK; r >= MIN_RANK; --r) {
        if (counts[r] == count) out.push_back(r);
    }
    return out;
}

SlotList slots_of_ranks(const Cards& cards, const std::vector<int>& ranks) {
    SlotList slots;
    for (int i = 0; i < HAND_SIZE; ++i) {
        if (std::find(ranks.begin(), ranks.end(), cards[i].rank) != ranks.end()) {
            slots.push_back(i + 1);
        }
    }
    return slots;
}

SlotList all_slots() {
    return {1, 2, 3, 4, 5};
}

std::vector<int> descending_ranks(const Cards& cards) {
    std::vector<int> ranks;
    for (const Card& c : cards) {
        ranks.push_back(c.rank);
    }
    std::sort(ranks.rbegin(), ranks.rend());
    return ranks;
}

HandEvaluation classify(const Cards& cards) {
    HandEvaluation result;

    auto rank_counts = count_ranks(cards);
    auto quads = ranks_with_count(rank_counts, 4);
    auto trips = ranks_with_count(rank_counts, 3);
    auto pairs = ranks_with_count(rank_counts, 2);
    auto singles = ranks_with_count(rank_counts, 1);

    bool flush = is_flush(cards);
    int high = straight_high(cards);
    bool straight = high != 0;

    // Royal Flush - only the ace-high straight flush; the wheel tops at 5
    if (flush && straight && high == MAX_RANK) {
        result.rank = HandRank::ROYAL_FLUSH;
        result.keepers = all_slots();
        result.tiebreakers = {high};
        return result;
    }

    if (flush && straight) {
        result.rank = HandRank::STRAIGHT_FLUSH;
        result.keepers = all_slots();
        result.tiebreakers = {high};
        return result;
    }

    // Four of a Kind - the kicker is not kept
    if (!quads.empty()) {
        result.rank = HandRank::FOUR_OF_A_KIND;
        result.keepers = slots_of_ranks(cards, quads);
        result.tiebreakers = {quads[0], singles[0]};
        return result;
    }

    if (!trips.empty() && !pairs.empty()) {
        result.rank = HandRank::FULL_HOUSE;
        result.keepers = all_slots();
        result.tiebreakers = {trips[0], pairs[0]};
        return result;
    }

    if (flush) {
        result.rank = HandRank::FLUSH;
        result.keepers = all_slots();
        result.tiebreakers = descending_ranks(cards);
        return result;
    }

    if (straight) {
        result.rank = HandRank::STRAIGHT;
        result.keepers = all_slots();
        result.tiebreakers = {high};
        return result;
    }

    // Three of a Kind - the two odd cards are discard candidates
    if (!trips.empty()) {
        result.rank = HandRank::THREE_OF_A_KIND;
        result.keepers = slots_of_ranks(cards, trips);
        result.tiebreakers = {trips[0]};
        result.tiebreakers.insert(result.tiebreakers.end(), singles.begin(), singles.end());
        return result;
    }

    if (pairs.size() == 2) {
        result.rank = HandRank::TWO_PAIR;
        result.keepers = slots_of_ranks(cards, pairs);
        result.tiebreakers = {pairs[0], pairs[1], singles[0]};
        return result;
    }

    if (pairs.size() == 1) {
        result.rank = HandRank::PAIR;
        result.keepers = slots_of_ranks(cards, pairs);
        result.tiebreakers = {pairs[0]};
        result.tiebreakers.insert(result.tiebreakers.end(), singles.begin(), singles.end());
        return result;
    }

    // High Card - keep the highest card, lowest slot on a rank tie
    result.rank = HandRank::HIGH_CARD;
    int best = 0;
    for (int i = 1; i < HAND_SIZE; ++i) {
        if (cards[i].rank > cards[best].rank) best = i;
    }
    result.keepers = {best + 1};
    result.tiebreakers = descending_ranks(cards);
    return result;
}

} // anonymous namespace

HandEvaluation evaluate_hand(const Hand& hand) {
    Cards cards = hand.cards();
    check_duplicates(cards);

    HandEvaluation result = classify(cards);
    spdlog::trace("evaluate_hand: {} -> {} ({} keepers)",
                  hand_to_string(hand), hand_rank_name(result.rank), result.keepers.size());
    return result;
}

HandEvaluation evaluate_hand(const std::vector<Card>& cards) {
    return evaluate_hand(Hand::from_cards(cards));
}

int compare_hands(const Hand& a, const Hand& b) {
    HandEvaluation ea = evaluate_hand(a);
    HandEvaluation eb = evaluate_hand(b);

    if (ea.rank != eb.rank) {
        return static_cast<int>(ea.rank) > static_cast<int>(eb.rank) ? 1 : -1;
    }

    size_t n = std::min(ea.tiebreakers.size(), eb.tiebreakers.size());
    for (size_t i = 0; i < n; ++i) {
        if (ea.tiebreakers[i] != eb.tiebreakers[i]) {
            return ea.tiebreakers[i] > eb.tiebreakers[i] ? 1 : -1;
        }
    }
    return 0;
}

} // namespace drawbot
