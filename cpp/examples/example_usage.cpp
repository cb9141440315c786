// Demo: drive the holder through a fill round and swap rounds, simulating
// the manipulator with a seeded Deck.
//
//   drawbot_demo [--seed N] [--rounds N] [--deal] [--verbose]
//
// --deal starts from a dealt hand instead of an empty holder.

#include "../include/drawbot/actions.hpp"
#include "../include/drawbot/deck.hpp"
#include "../include/drawbot/hand_eval.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace drawbot;

namespace {

struct DemoOptions {
    uint64_t seed = 42;
    int rounds = 5;
    bool deal = false;
    bool verbose = false;
};

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--seed N] [--rounds N] [--deal] [--verbose]" << std::endl;
}

bool parse_options(int argc, char** argv, DemoOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--seed" && i + 1 < argc) {
            opts.seed = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--rounds" && i + 1 < argc) {
            opts.rounds = std::atoi(argv[++i]);
        } else if (arg == "--deal") {
            opts.deal = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            return false;
        }
    }
    return opts.rounds > 0;
}

void print_hand(const Hand& hand) {
    std::cout << "\nHolder:" << std::endl;
    for (Slot s = 1; s <= HAND_SIZE; ++s) {
        const CardSlot& card = hand.at(s);
        std::cout << "  [" << s << "] " << std::setw(3)
                  << (card ? card_to_string(*card) : "--");
        if (card) std::cout << "  (" << card_to_full_string(*card) << ")";
        std::cout << std::endl;
    }
    if (hand.is_complete()) {
        std::cout << "Evaluation: " << hand_rank_name(evaluate_hand(hand).rank) << std::endl;
    }
}

// Simulate the manipulator: taken cards go to the trash, placed cards come
// off the deck.
Hand execute(const Hand& hand, const ActionList& actions, Deck& deck) {
    Hand next = hand;
    for (const Action& a : actions) {
        if (a.type == Action::TAKE_CARD_AT) {
            next = next.replace(a.slot, std::nullopt);
        } else if (a.type == Action::PLACE_AT) {
            auto card = deck.draw_card();
            if (!card) {
                throw std::runtime_error("deck exhausted");
            }
            next = next.replace(a.slot, card);
        }
    }
    return next;
}

} // namespace

int main(int argc, char** argv) {
    DemoOptions opts;
    if (!parse_options(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }
    spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);

    std::cout << "=== Draw Poker Holder - Demo ===" << std::endl;
    std::cout << "seed=" << opts.seed << " rounds=" << opts.rounds << std::endl;

    Deck deck(opts.seed);
    Hand hand;
    if (opts.deal) {
        hand = Hand::from_cards(deck.generate_initial_hand());
    }

    try {
        for (int round = 1; round <= opts.rounds; ++round) {
            print_hand(hand);

            ActionList actions = decide_actions(hand);
            if (actions.empty()) {
                std::cout << "\nRound " << round << ": stand pat" << std::endl;
                break;
            }

            std::cout << "\nRound " << round << ": "
                      << (hand.is_complete() ? "swap " : "fill ")
                      << (hand.is_complete() ? count_swaps(actions)
                                             : static_cast<int>(hand.empty_slots().size()))
                      << " card(s)" << std::endl;
            int step = 1;
            for (const std::string& cmd : to_commands(actions)) {
                std::cout << "  " << std::setw(2) << step++ << ". " << cmd << std::endl;
            }

            hand = execute(hand, actions, deck);
        }
    } catch (const std::exception& e) {
        spdlog::error("demo aborted: {}", e.what());
        return 1;
    }

    print_hand(hand);
    std::cout << "\nCards left in deck: " << deck.remaining() << std::endl;
    return 0;
}
