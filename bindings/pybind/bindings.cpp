#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <optional>
#include <string>
#include <tuple>
#include <vector>
#include "drawbot/actions.hpp"
#include "drawbot/deck.hpp"
#include "drawbot/hand_eval.hpp"
#include "drawbot/strategy.hpp"

namespace py = pybind11;

namespace {

// Python-side card format: (rank, suit_char), e.g. (14, 'H')
using PyCard = std::tuple<int, std::string>;

drawbot::Card card_from_py(const PyCard& card) {
    const std::string& suit = std::get<1>(card);
    if (suit.size() != 1) {
        throw drawbot::HandError(drawbot::HandErrorKind::INVALID_CARD,
                                 "suit must be a single character, got '" + suit + "'");
    }
    return drawbot::make_card(std::get<0>(card), suit[0]);
}

PyCard card_to_py(const drawbot::Card& card) {
    return PyCard(card.rank, std::string(1, drawbot::suit_to_char(card.suit)));
}

drawbot::Hand hand_from_py(const std::vector<std::optional<PyCard>>& slots) {
    std::vector<drawbot::CardSlot> converted;
    converted.reserve(slots.size());
    for (const auto& slot : slots) {
        if (slot) {
            converted.push_back(card_from_py(*slot));
        } else {
            converted.push_back(std::nullopt);
        }
    }
    return drawbot::Hand::from_slots(converted);
}

} // namespace

PYBIND11_MODULE(_drawbot_core, m) {
    m.doc() = "Draw poker holder decision core: hand evaluation, discard policy, manipulator commands";

    // Expose constants
    m.attr("HAND_SIZE") = drawbot::HAND_SIZE;
    m.attr("DECK_SIZE") = drawbot::DECK_SIZE;

    py::register_exception<drawbot::HandError>(m, "HandError", PyExc_ValueError);

    py::enum_<drawbot::Suit>(m, "Suit")
        .value("HEARTS", drawbot::Suit::HEARTS)
        .value("DIAMONDS", drawbot::Suit::DIAMONDS)
        .value("CLUBS", drawbot::Suit::CLUBS)
        .value("SPADES", drawbot::Suit::SPADES)
        .export_values();

    py::enum_<drawbot::HandRank>(m, "HandRank")
        .value("HIGH_CARD", drawbot::HandRank::HIGH_CARD)
        .value("PAIR", drawbot::HandRank::PAIR)
        .value("TWO_PAIR", drawbot::HandRank::TWO_PAIR)
        .value("THREE_OF_A_KIND", drawbot::HandRank::THREE_OF_A_KIND)
        .value("STRAIGHT", drawbot::HandRank::STRAIGHT)
        .value("FLUSH", drawbot::HandRank::FLUSH)
        .value("FULL_HOUSE", drawbot::HandRank::FULL_HOUSE)
        .value("FOUR_OF_A_KIND", drawbot::HandRank::FOUR_OF_A_KIND)
        .value("STRAIGHT_FLUSH", drawbot::HandRank::STRAIGHT_FLUSH)
        .value("ROYAL_FLUSH", drawbot::HandRank::ROYAL_FLUSH)
        .export_values();

    py::enum_<drawbot::HandErrorKind>(m, "HandErrorKind")
        .value("INVALID_HAND_LENGTH", drawbot::HandErrorKind::INVALID_HAND_LENGTH)
        .value("INVALID_CARD", drawbot::HandErrorKind::INVALID_CARD)
        .value("DUPLICATE_CARD", drawbot::HandErrorKind::DUPLICATE_CARD)
        .value("AMBIGUOUS_HAND_STATE", drawbot::HandErrorKind::AMBIGUOUS_HAND_STATE)
        .value("EMPTY_SLOT", drawbot::HandErrorKind::EMPTY_SLOT)
        .value("INVALID_ACTION", drawbot::HandErrorKind::INVALID_ACTION)
        .export_values();

    py::class_<drawbot::Card>(m, "Card")
        .def(py::init([](int rank, const std::string& suit) {
                 return card_from_py(PyCard(rank, suit));
             }),
             py::arg("rank"), py::arg("suit"))
        .def_readonly("rank", &drawbot::Card::rank)
        .def_readonly("suit", &drawbot::Card::suit)
        .def("__eq__", &drawbot::Card::operator==)
        .def("__str__", &drawbot::card_to_string)
        .def("__repr__", [](const drawbot::Card& card) {
            return "<Card " + drawbot::card_to_full_string(card) + ">";
        });

    // HandEvaluation struct
    py::class_<drawbot::HandEvaluation>(m, "HandEvaluation")
        .def(py::init<>())
        .def_readonly("rank", &drawbot::HandEvaluation::rank)
        .def_readonly("keepers", &drawbot::HandEvaluation::keepers)
        .def_readonly("tiebreakers", &drawbot::HandEvaluation::tiebreakers)
        .def_property_readonly("name", [](const drawbot::HandEvaluation& eval) {
            return std::string(drawbot::hand_rank_name(eval.rank));
        })
        .def("__repr__", [](const drawbot::HandEvaluation& eval) {
            return "<HandEvaluation rank=" + std::string(drawbot::hand_rank_name(eval.rank)) +
                   " keepers=" + std::to_string(eval.keepers.size()) + ">";
        });

    // Action type enum
    py::enum_<drawbot::Action::Type>(m, "ActionType")
        .value("TAKE_CARD_AT", drawbot::Action::TAKE_CARD_AT)
        .value("DEFAULT_POSITION", drawbot::Action::DEFAULT_POSITION)
        .value("DROP_HOLDING", drawbot::Action::DROP_HOLDING)
        .value("TAKE_DECK", drawbot::Action::TAKE_DECK)
        .value("PLACE_AT", drawbot::Action::PLACE_AT)
        .export_values();

    py::class_<drawbot::Action>(m, "Action")
        .def(py::init<drawbot::Action::Type, drawbot::Slot>(),
             py::arg("type"),
             py::arg("slot") = 0)
        .def_readonly("type", &drawbot::Action::type)
        .def_readonly("slot", &drawbot::Action::slot)
        .def("__eq__", &drawbot::Action::operator==)
        .def("__str__", &drawbot::to_command)
        .def("__repr__", [](const drawbot::Action& action) {
            return "<Action '" + drawbot::to_command(action) + "'>";
        });

    py::class_<drawbot::Deck>(m, "Deck")
        .def(py::init<>())
        .def(py::init<uint64_t>(), py::arg("seed"))
        .def("reset", &drawbot::Deck::reset)
        .def("draw_card", [](drawbot::Deck& deck) -> std::optional<PyCard> {
            auto card = deck.draw_card();
            if (!card) return std::nullopt;
            return card_to_py(*card);
        })
        .def("draw_cards", [](drawbot::Deck& deck, int count) {
            std::vector<PyCard> out;
            for (const auto& c : deck.draw_cards(count)) out.push_back(card_to_py(c));
            return out;
        }, py::arg("count"))
        .def("generate_initial_hand", [](drawbot::Deck& deck) {
            std::vector<PyCard> out;
            for (const auto& c : deck.generate_initial_hand()) out.push_back(card_to_py(c));
            return out;
        })
        .def("mark_used", [](drawbot::Deck& deck, const PyCard& card) {
            deck.mark_used(card_from_py(card));
        }, py::arg("card"))
        .def("is_available", [](const drawbot::Deck& deck, const PyCard& card) {
            return deck.is_available(card_from_py(card));
        }, py::arg("card"))
        .def("remaining_count", &drawbot::Deck::remaining)
        .def("__repr__", [](const drawbot::Deck& deck) {
            return "<Deck remaining=" + std::to_string(deck.remaining()) + ">";
        });

    m.def("evaluate_hand", [](const std::vector<std::optional<PyCard>>& hand) {
        return drawbot::evaluate_hand(hand_from_py(hand));
    }, py::arg("hand"), "Classify a complete 5-card hand");

    m.def("discard_positions", [](const std::vector<std::optional<PyCard>>& hand) {
        return drawbot::discard_positions(drawbot::evaluate_hand(hand_from_py(hand)));
    }, py::arg("hand"), "1-based slots to discard for a complete hand");

    m.def("decide_actions", [](const std::vector<std::optional<PyCard>>& hand) {
        return drawbot::decide_actions(hand_from_py(hand));
    }, py::arg("hand"), "Next manipulator actions for the holder");

    m.def("get_poker_actions", [](const std::vector<std::optional<PyCard>>& hand) {
        return drawbot::get_poker_actions(hand_from_py(hand));
    }, py::arg("hand"), "Next manipulator commands as strings; empty means stand pat");

    m.def("parse_action", &drawbot::parse_action, py::arg("command"));
    m.def("count_swaps", &drawbot::count_swaps, py::arg("actions"));
    m.def("swap_positions", &drawbot::swap_positions, py::arg("actions"));
}
