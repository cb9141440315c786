/**
 * @file actions.cpp
 * @brief Action compiler and decision dispatch.
 *
 * Fill and swap are never mixed in one sequence: an incomplete hand cannot
 * be ranked, so it is filled first and re-submitted by the caller.
 */

#include "../include/drawbot/actions.hpp"
#include "../include/drawbot/hand_eval.hpp"
#include "../include/drawbot/strategy.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace drawbot {

namespace {

bool has_slot(Action::Type type) {
    return type == Action::TAKE_CARD_AT || type == Action::PLACE_AT;
}

std::string normalise(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

    std::string out = text.substr(begin, end - begin);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

Slot parse_slot(const std::string& digits, const std::string& command) {
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw HandError(HandErrorKind::INVALID_ACTION,
                        "missing or malformed slot in '" + command + "'");
    }
    if (digits.size() > 1) {
        throw HandError(HandErrorKind::INVALID_ACTION,
                        "slot " + digits + " outside [1, " + std::to_string(HAND_SIZE) + "]");
    }
    return digits[0] - '0';
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

Action::Action(Type t, Slot s) : type(t), slot(s) {
    if (has_slot(t)) {
        if (s < 1 || s > HAND_SIZE) {
            throw HandError(HandErrorKind::INVALID_ACTION,
                            "slot " + std::to_string(s) + " outside [1, " +
                            std::to_string(HAND_SIZE) + "]");
        }
    } else if (s != 0) {
        throw HandError(HandErrorKind::INVALID_ACTION,
                        "action type " + std::to_string(static_cast<int>(t)) + " takes no slot");
    }
}

std::string to_command(const Action& action) {
    switch (action.type) {
        case Action::TAKE_CARD_AT:     return "take card " + std::to_string(action.slot);
        case Action::DEFAULT_POSITION: return "default position";
        case Action::DROP_HOLDING:     return "drop holding";
        case Action::TAKE_DECK:        return "take deck";
        case Action::PLACE_AT:         return "place at " + std::to_string(action.slot);
    }
    throw HandError(HandErrorKind::INVALID_ACTION,
                    "unknown action type " + std::to_string(static_cast<int>(action.type)));
}

std::vector<std::string> to_commands(const ActionList& actions) {
    std::vector<std::string> commands;
    commands.reserve(actions.size());
    for (const Action& a : actions) {
        commands.push_back(to_command(a));
    }
    return commands;
}

Action parse_action(const std::string& command) {
    std::string text = normalise(command);

    if (text == "default position") return Action::default_position();
    if (text == "drop holding") return Action::drop_holding();
    if (text == "take deck") return Action::take_deck();

    const std::string take_card = "take card ";
    const std::string place_at = "place at ";
    if (starts_with(text, take_card)) {
        return Action::take_card_at(parse_slot(text.substr(take_card.size()), command));
    }
    if (starts_with(text, place_at)) {
        return Action::place_at(parse_slot(text.substr(place_at.size()), command));
    }

    throw HandError(HandErrorKind::INVALID_ACTION, "unknown action '" + command + "'");
}

ActionList compile_fill_actions(const Hand& hand) {
    SlotList empty = hand.empty_slots();
    if (empty.empty()) {
        throw HandError(HandErrorKind::AMBIGUOUS_HAND_STATE,
                        "fill requested for a complete hand " + hand_to_string(hand));
    }

    ActionList actions;
    actions.reserve(empty.size() * 2 + 1);
    for (Slot s : empty) {
        actions.push_back(Action::take_deck());
        actions.push_back(Action::place_at(s));
    }
    actions.push_back(Action::default_position());
    return actions;
}

ActionList compile_swap_actions(const Hand& hand, const SlotList& discards) {
    if (!hand.is_complete()) {
        throw HandError(HandErrorKind::AMBIGUOUS_HAND_STATE,
                        "swap requested for incomplete hand " + hand_to_string(hand));
    }

    SlotList slots = discards;
    for (Slot s : slots) {
        check_slot(s);
    }
    std::sort(slots.begin(), slots.end());
    slots.erase(std::unique(slots.begin(), slots.end()), slots.end());

    ActionList actions;
    if (slots.empty()) return actions;

    actions.reserve(slots.size() * 5 + 1);
    for (Slot s : slots) {
        actions.push_back(Action::take_card_at(s));
        actions.push_back(Action::drop_holding());
        actions.push_back(Action::default_position());
        actions.push_back(Action::take_deck());
        actions.push_back(Action::place_at(s));
    }
    actions.push_back(Action::default_position());
    return actions;
}

ActionList decide_actions(const Hand& hand) {
    try {
        if (!hand.is_complete()) {
            ActionList fill = compile_fill_actions(hand);
            spdlog::debug("decide_actions: {} has {} empty slot(s), {} fill actions",
                          hand_to_string(hand), hand.empty_slots().size(), fill.size());
            return fill;
        }

        HandEvaluation eval = evaluate_hand(hand);
        SlotList discards = discard_positions(eval);
        ActionList swap = compile_swap_actions(hand, discards);
        spdlog::debug("decide_actions: {} is {}, discarding {} slot(s), {} swap actions",
                      hand_to_string(hand), hand_rank_name(eval.rank), discards.size(),
                      swap.size());
        return swap;
    } catch (const HandError& e) {
        spdlog::warn("decide_actions: rejected {}: {}", hand_to_string(hand), e.what());
        throw;
    }
}

std::vector<std::string> get_poker_actions(const Hand& hand) {
    return to_commands(decide_actions(hand));
}

int count_swaps(const ActionList& actions) {
    return static_cast<int>(std::count_if(actions.begin(), actions.end(), [](const Action& a) {
        return a.type == Action::TAKE_CARD_AT;
    }));
}

SlotList swap_positions(const ActionList& actions) {
    SlotList positions;
    for (const Action& a : actions) {
        if (a.type == Action::TAKE_CARD_AT &&
            std::find(positions.begin(), positions.end(), a.slot) == positions.end()) {
            positions.push_back(a.slot);
        }
    }
    return positions;
}

} // namespace drawbot
