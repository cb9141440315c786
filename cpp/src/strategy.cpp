#include "../include/drawbot/strategy.hpp"
#include <algorithm>
#include <stdexcept>

namespace drawbot {

namespace {

SlotList non_keepers(const SlotList& keepers) {
    for (Slot s : keepers) {
        check_slot(s);
    }
    SlotList discards;
    for (Slot s = 1; s <= HAND_SIZE; ++s) {
        if (std::find(keepers.begin(), keepers.end(), s) == keepers.end()) {
            discards.push_back(s);
        }
    }
    return discards;
}

} // anonymous namespace

bool stands_pat(HandRank rank) {
    // No default: a new category must be placed explicitly.
    switch (rank) {
        case HandRank::ROYAL_FLUSH:
        case HandRank::STRAIGHT_FLUSH:
        case HandRank::FOUR_OF_A_KIND:
        case HandRank::FULL_HOUSE:
        case HandRank::FLUSH:
        case HandRank::STRAIGHT:
            return true;
        case HandRank::THREE_OF_A_KIND:
        case HandRank::TWO_PAIR:
        case HandRank::PAIR:
        case HandRank::HIGH_CARD:
            return false;
    }
    throw std::logic_error("unhandled hand rank " + std::to_string(static_cast<int>(rank)));
}

SlotList discard_positions(HandRank rank, const SlotList& keepers) {
    if (stands_pat(rank)) {
        return {};
    }
    return non_keepers(keepers);
}

SlotList discard_positions(const HandEvaluation& eval) {
    return discard_positions(eval.rank, eval.keepers);
}

} // namespace drawbot
