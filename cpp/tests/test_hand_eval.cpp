#include <gtest/gtest.h>
#include "drawbot/hand_eval.hpp"
#include "drawbot/deck.hpp"
#include <algorithm>

using namespace drawbot;

namespace {

// Helper to build a complete hand from short card strings
Hand hand_of(const std::vector<std::string>& cards) {
    std::vector<Card> parsed;
    for (const auto& c : cards) {
        parsed.push_back(card_from_string(c));
    }
    return Hand::from_cards(parsed);
}

} // namespace

TEST(HandEvalTest, RoyalFlush) {
    // A♥ 10♥ K♥ Q♥ J♥
    auto eval = evaluate_hand(hand_of({"AH", "10H", "KH", "QH", "JH"}));
    EXPECT_EQ(eval.rank, HandRank::ROYAL_FLUSH);
    EXPECT_EQ(eval.keepers, (SlotList{1, 2, 3, 4, 5}));
}

TEST(HandEvalTest, StraightFlush) {
    auto eval = evaluate_hand(hand_of({"9S", "5S", "7S", "6S", "8S"}));
    EXPECT_EQ(eval.rank, HandRank::STRAIGHT_FLUSH);
    EXPECT_EQ(eval.keepers, (SlotList{1, 2, 3, 4, 5}));
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{9}));
}

TEST(HandEvalTest, WheelStraightFlushIsNotRoyal) {
    auto eval = evaluate_hand(hand_of({"AD", "2D", "3D", "4D", "5D"}));
    EXPECT_EQ(eval.rank, HandRank::STRAIGHT_FLUSH);
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{5}));
}

TEST(HandEvalTest, FourOfAKind) {
    // K♣ K♦ K♥ K♠ 2♣
    auto eval = evaluate_hand(hand_of({"KC", "KD", "KH", "KS", "2C"}));
    EXPECT_EQ(eval.rank, HandRank::FOUR_OF_A_KIND);
    EXPECT_EQ(eval.keepers, (SlotList{1, 2, 3, 4}));
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{13, 2}));
}

TEST(HandEvalTest, FourOfAKindKickerInMiddle) {
    auto eval = evaluate_hand(hand_of({"9H", "9D", "2C", "9S", "9C"}));
    EXPECT_EQ(eval.rank, HandRank::FOUR_OF_A_KIND);
    EXPECT_EQ(eval.keepers, (SlotList{1, 2, 4, 5}));
}

TEST(HandEvalTest, FullHouse) {
    // K♣ K♦ K♥ A♠ A♣
    auto eval = evaluate_hand(hand_of({"KC", "AS", "KD", "AC", "KH"}));
    EXPECT_EQ(eval.rank, HandRank::FULL_HOUSE);
    EXPECT_EQ(eval.keepers, (SlotList{1, 2, 3, 4, 5}));
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{13, 14}));
}

TEST(HandEvalTest, Flush) {
    auto eval = evaluate_hand(hand_of({"2C", "5C", "7C", "9C", "KC"}));
    EXPECT_EQ(eval.rank, HandRank::FLUSH);
    EXPECT_EQ(eval.keepers, (SlotList{1, 2, 3, 4, 5}));
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{13, 9, 7, 5, 2}));
}

TEST(HandEvalTest, AceDoesNotWrapAround) {
    // K-A-2-3-4 of one suit is a flush, not a straight flush
    auto eval = evaluate_hand(hand_of({"KH", "AH", "2H", "3H", "4H"}));
    EXPECT_EQ(eval.rank, HandRank::FLUSH);
}

TEST(HandEvalTest, Straight) {
    auto eval = evaluate_hand(hand_of({"5C", "6D", "7H", "8S", "9C"}));
    EXPECT_EQ(eval.rank, HandRank::STRAIGHT);
    EXPECT_EQ(eval.keepers, (SlotList{1, 2, 3, 4, 5}));
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{9}));
}

TEST(HandEvalTest, BroadwayStraight) {
    auto eval = evaluate_hand(hand_of({"AC", "KD", "QH", "JS", "10C"}));
    EXPECT_EQ(eval.rank, HandRank::STRAIGHT);
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{14}));
}

TEST(HandEvalTest, StraightWheel) {
    // A♣ 2♦ 3♥ 4♠ 5♣ (wheel), in scrambled slot order
    auto eval = evaluate_hand(hand_of({"3H", "AC", "5C", "2D", "4S"}));
    EXPECT_EQ(eval.rank, HandRank::STRAIGHT);
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{5}));
}

TEST(HandEvalTest, WheelWithEverySuitMix) {
    const char suits[] = {'H', 'D', 'C', 'S'};
    for (char a : suits) {
        for (char b : suits) {
            Hand hand = Hand::from_cards({make_card(14, a), make_card(2, b), make_card(3, 'H'),
                                          make_card(4, 'H'), make_card(5, 'H')});
            auto eval = evaluate_hand(hand);
            if (a == 'H' && b == 'H') {
                EXPECT_EQ(eval.rank, HandRank::STRAIGHT_FLUSH);
            } else {
                EXPECT_EQ(eval.rank, HandRank::STRAIGHT);
            }
        }
    }
}

TEST(HandEvalTest, ThreeOfAKind) {
    auto eval = evaluate_hand(hand_of({"7H", "KS", "7D", "2H", "7C"}));
    EXPECT_EQ(eval.rank, HandRank::THREE_OF_A_KIND);
    EXPECT_EQ(eval.keepers, (SlotList{1, 3, 5}));
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{7, 13, 2}));
}

TEST(HandEvalTest, TwoPair) {
    auto eval = evaluate_hand(hand_of({"10H", "10D", "5C", "5S", "7H"}));
    EXPECT_EQ(eval.rank, HandRank::TWO_PAIR);
    EXPECT_EQ(eval.keepers, (SlotList{1, 2, 3, 4}));
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{10, 5, 7}));
}

TEST(HandEvalTest, Pair) {
    auto eval = evaluate_hand(hand_of({"10H", "10D", "5C", "3S", "7H"}));
    EXPECT_EQ(eval.rank, HandRank::PAIR);
    EXPECT_EQ(eval.keepers, (SlotList{1, 2}));
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{10, 7, 5, 3}));
}

TEST(HandEvalTest, HighCard) {
    // 2♣ 9♦ K♥ 5♠ 7♣
    auto eval = evaluate_hand(hand_of({"2C", "9D", "KH", "5S", "7C"}));
    EXPECT_EQ(eval.rank, HandRank::HIGH_CARD);
    EXPECT_EQ(eval.keepers, (SlotList{3}));
    EXPECT_EQ(eval.tiebreakers, (std::vector<int>{13, 9, 7, 5, 2}));
}

TEST(HandEvalTest, AceIsHighOutsideTheWheel) {
    auto eval = evaluate_hand(hand_of({"2C", "AD", "9H", "5S", "7C"}));
    EXPECT_EQ(eval.rank, HandRank::HIGH_CARD);
    EXPECT_EQ(eval.keepers, (SlotList{2}));
}

TEST(HandEvalTest, DuplicateCardRejected) {
    std::vector<Card> cards = {make_card(14, 'H'), make_card(3, 'C'), make_card(9, 'D'),
                               make_card(14, 'H'), make_card(5, 'S')};
    try {
        evaluate_hand(cards);
        FAIL() << "expected HandError";
    } catch (const HandError& e) {
        EXPECT_EQ(e.kind(), HandErrorKind::DUPLICATE_CARD);
    }
}

TEST(HandEvalTest, EmptySlotRejected) {
    Hand hand = Hand::from_slots({make_card(10, 'H'), make_card(10, 'D'), std::nullopt,
                                  make_card(3, 'S'), make_card(7, 'H')});
    try {
        evaluate_hand(hand);
        FAIL() << "expected HandError";
    } catch (const HandError& e) {
        EXPECT_EQ(e.kind(), HandErrorKind::EMPTY_SLOT);
    }
}

TEST(HandEvalTest, WrongLengthRejected) {
    std::vector<Card> four = {make_card(14, 'H'), make_card(3, 'C'), make_card(9, 'D'),
                              make_card(5, 'S')};
    try {
        evaluate_hand(four);
        FAIL() << "expected HandError";
    } catch (const HandError& e) {
        EXPECT_EQ(e.kind(), HandErrorKind::INVALID_HAND_LENGTH);
    }
}

TEST(HandEvalTest, RankNames) {
    EXPECT_STREQ(hand_rank_name(HandRank::HIGH_CARD), "High Card");
    EXPECT_STREQ(hand_rank_name(HandRank::PAIR), "One Pair");
    EXPECT_STREQ(hand_rank_name(HandRank::ROYAL_FLUSH), "Royal Flush");
}

TEST(HandEvalTest, KeepersMatchCategorySize) {
    // Sample dealt hands and check keeper counts per category
    Deck deck(2024);
    for (int i = 0; i < 2000; ++i) {
        deck.reset();
        Hand hand = Hand::from_cards(deck.generate_initial_hand());
        auto eval = evaluate_hand(hand);

        size_t expected = 5;
        switch (eval.rank) {
            case HandRank::HIGH_CARD:       expected = 1; break;
            case HandRank::PAIR:            expected = 2; break;
            case HandRank::THREE_OF_A_KIND: expected = 3; break;
            case HandRank::TWO_PAIR:
            case HandRank::FOUR_OF_A_KIND:  expected = 4; break;
            default:                        expected = 5; break;
        }
        EXPECT_EQ(eval.keepers.size(), expected) << hand_to_string(hand);
        EXPECT_TRUE(std::is_sorted(eval.keepers.begin(), eval.keepers.end()));
    }
}

TEST(CompareHandsTest, DifferentCategories) {
    Hand flush = hand_of({"2C", "5C", "7C", "9C", "KC"});
    Hand straight = hand_of({"5C", "6D", "7H", "8S", "9C"});
    EXPECT_EQ(compare_hands(flush, straight), 1);
    EXPECT_EQ(compare_hands(straight, flush), -1);
}

TEST(CompareHandsTest, SameCategoryUsesTiebreakers) {
    Hand kings = hand_of({"KH", "KD", "5C", "3S", "7H"});
    Hand queens = hand_of({"QH", "QD", "AC", "3D", "7C"});
    EXPECT_EQ(compare_hands(kings, queens), 1);

    Hand wheel = hand_of({"AC", "2D", "3H", "4S", "5C"});
    Hand six_high = hand_of({"2C", "3D", "4H", "5S", "6C"});
    EXPECT_EQ(compare_hands(wheel, six_high), -1);
}

TEST(CompareHandsTest, Tie) {
    Hand a = hand_of({"10H", "10D", "5C", "3S", "7H"});
    Hand b = hand_of({"10C", "10S", "5D", "3H", "7C"});
    EXPECT_EQ(compare_hands(a, b), 0);
}
