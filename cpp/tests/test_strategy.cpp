#include <gtest/gtest.h>
#include "drawbot/strategy.hpp"
#include "drawbot/deck.hpp"
#include <algorithm>

using namespace drawbot;

namespace {

Hand hand_of(const std::vector<std::string>& cards) {
    std::vector<Card> parsed;
    for (const auto& c : cards) {
        parsed.push_back(card_from_string(c));
    }
    return Hand::from_cards(parsed);
}

SlotList discards_for(const std::vector<std::string>& cards) {
    return discard_positions(evaluate_hand(hand_of(cards)));
}

} // namespace

TEST(StrategyTest, MadeHandsStandPat) {
    EXPECT_TRUE(discards_for({"AH", "10H", "KH", "QH", "JH"}).empty());  // royal flush
    EXPECT_TRUE(discards_for({"9S", "5S", "7S", "6S", "8S"}).empty());   // straight flush
    EXPECT_TRUE(discards_for({"KC", "KD", "KH", "KS", "2C"}).empty());   // four of a kind
    EXPECT_TRUE(discards_for({"KC", "AS", "KD", "AC", "KH"}).empty());   // full house
    EXPECT_TRUE(discards_for({"2C", "5C", "7C", "9C", "KC"}).empty());   // flush
    EXPECT_TRUE(discards_for({"5C", "6D", "7H", "8S", "9C"}).empty());   // straight
    EXPECT_TRUE(discards_for({"3H", "AC", "5C", "2D", "4S"}).empty());   // wheel
}

TEST(StrategyTest, ThreeOfAKindDiscardsTwo) {
    EXPECT_EQ(discards_for({"7H", "KS", "7D", "2H", "7C"}), (SlotList{2, 4}));
}

TEST(StrategyTest, TwoPairDiscardsKicker) {
    EXPECT_EQ(discards_for({"10H", "10D", "5C", "5S", "7H"}), (SlotList{5}));
    EXPECT_EQ(discards_for({"7H", "10D", "5C", "5S", "10H"}), (SlotList{1}));
}

TEST(StrategyTest, PairDiscardsThree) {
    EXPECT_EQ(discards_for({"10H", "10D", "5C", "3S", "7H"}), (SlotList{3, 4, 5}));
    EXPECT_EQ(discards_for({"5C", "3S", "QH", "7H", "QD"}), (SlotList{1, 2, 4}));
}

TEST(StrategyTest, HighCardKeepsOnlyHighest) {
    EXPECT_EQ(discards_for({"2C", "9D", "KH", "5S", "7C"}), (SlotList{1, 2, 4, 5}));
}

TEST(StrategyTest, TableIsDrivenByRankOnly) {
    SlotList keepers = {1, 2};
    EXPECT_TRUE(discard_positions(HandRank::ROYAL_FLUSH, keepers).empty());
    EXPECT_TRUE(discard_positions(HandRank::STRAIGHT_FLUSH, keepers).empty());
    EXPECT_TRUE(discard_positions(HandRank::FOUR_OF_A_KIND, keepers).empty());
    EXPECT_TRUE(discard_positions(HandRank::FULL_HOUSE, keepers).empty());
    EXPECT_TRUE(discard_positions(HandRank::FLUSH, keepers).empty());
    EXPECT_TRUE(discard_positions(HandRank::STRAIGHT, keepers).empty());
    EXPECT_EQ(discard_positions(HandRank::PAIR, keepers), (SlotList{3, 4, 5}));
    EXPECT_EQ(discard_positions(HandRank::HIGH_CARD, {4}), (SlotList{1, 2, 3, 5}));
}

TEST(StrategyTest, StandsPat) {
    EXPECT_TRUE(stands_pat(HandRank::STRAIGHT));
    EXPECT_TRUE(stands_pat(HandRank::ROYAL_FLUSH));
    EXPECT_FALSE(stands_pat(HandRank::THREE_OF_A_KIND));
    EXPECT_FALSE(stands_pat(HandRank::HIGH_CARD));
}

TEST(StrategyTest, InvalidKeeperRejected) {
    EXPECT_THROW(discard_positions(HandRank::PAIR, {0, 1}), std::out_of_range);
    EXPECT_THROW(discard_positions(HandRank::HIGH_CARD, {6}), std::out_of_range);
}

TEST(StrategyTest, KeepersAndDiscardsPartitionTheHand) {
    // Every slot is kept or discarded exactly once, except four of a kind,
    // which stands pat without keeping its kicker.
    Deck deck(7);
    for (int i = 0; i < 3000; ++i) {
        deck.reset();
        Hand hand = Hand::from_cards(deck.generate_initial_hand());
        auto eval = evaluate_hand(hand);
        auto discards = discard_positions(eval);

        for (Slot s : discards) {
            EXPECT_EQ(std::count(eval.keepers.begin(), eval.keepers.end(), s), 0)
                << hand_to_string(hand);
        }

        if (eval.rank == HandRank::FOUR_OF_A_KIND) {
            EXPECT_TRUE(discards.empty());
            continue;
        }

        SlotList all = eval.keepers;
        all.insert(all.end(), discards.begin(), discards.end());
        if (!discards.empty()) {
            std::sort(all.begin(), all.end());
            EXPECT_EQ(all, (SlotList{1, 2, 3, 4, 5})) << hand_to_string(hand);
        } else {
            EXPECT_EQ(eval.keepers.size(), 5u) << hand_to_string(hand);
        }
    }
}
