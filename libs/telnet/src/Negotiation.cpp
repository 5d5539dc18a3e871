#include "tephra/telnet/Negotiation.hpp"
#include "tephra/log/Log.hpp"

namespace tephra::telnet {

    std::string_view to_string(OptionState state) {
        switch (state) {
            case OptionState::NO: return "NO";
            case OptionState::YES: return "YES";
            case OptionState::WANT_NO: return "WANT_NO";
            case OptionState::WANT_NO_QUEUED: return "WANT_NO_QUEUED";
            case OptionState::WANT_YES: return "WANT_YES";
            case OptionState::WANT_YES_QUEUED: return "WANT_YES_QUEUED";
        }
        return "?";
    }

    Transition transition(OptionState current, NegotiationInput input, bool supported) {
        using enum OptionState;
        using R = NegotiationReply;

        switch (input) {
            case NegotiationInput::receive_enable:
                switch (current) {
                    case NO: return supported ? Transition{YES, R::enable} : Transition{NO, R::disable};
                    case YES: return {YES, R::none};
                    case WANT_NO: return {NO, R::none};
                    case WANT_NO_QUEUED: return {WANT_YES, R::enable};
                    case WANT_YES: return {YES, R::none};
                    // enabled, and the queued disable goes out straight away
                    case WANT_YES_QUEUED: return {WANT_NO, R::disable};
                }
                break;
            case NegotiationInput::receive_disable:
                switch (current) {
                    case NO: return {NO, R::none};
                    case YES: return {NO, R::disable};
                    case WANT_NO:
                    case WANT_NO_QUEUED:
                    case WANT_YES:
                    case WANT_YES_QUEUED:
                        return {NO, R::none};
                }
                break;
            case NegotiationInput::request_enable:
                switch (current) {
                    case NO: return {WANT_YES, R::enable};
                    case WANT_NO: return {WANT_NO_QUEUED, R::none};
                    case WANT_YES_QUEUED: return {WANT_YES, R::none};
                    case YES:
                    case WANT_NO_QUEUED:
                    case WANT_YES:
                        return {current, R::none};
                }
                break;
            case NegotiationInput::request_disable:
                switch (current) {
                    case YES: return {WANT_NO, R::disable};
                    case WANT_NO_QUEUED: return {WANT_NO, R::none};
                    case WANT_YES: return {WANT_YES_QUEUED, R::none};
                    case NO:
                    case WANT_NO:
                    case WANT_YES_QUEUED:
                        return {current, R::none};
                }
                break;
        }
        return {current, R::none};
    }

    OptionState NegotiationTable::get(Direction direction, Option option) const {
        const auto& entry = entries_[option];
        return direction == Direction::local ? entry.local : entry.remote;
    }

    void NegotiationTable::set(Direction direction, Option option, OptionState state) {
        auto& entry = entries_[option];
        (direction == Direction::local ? entry.local : entry.remote) = state;
    }

    NegotiationStateMachine::NegotiationStateMachine(SupportPolicy policy) : policy_(std::move(policy)) {
    }

    std::string NegotiationStateMachine::encode(Verb verb, Option option) {
        std::string out;
        out.push_back(codes::IAC);
        out.push_back(static_cast<char>(verb));
        out.push_back(static_cast<char>(option));
        return out;
    }

    std::optional<std::string> NegotiationStateMachine::on_command(Verb verb, Option option) {
        const bool about_peer = verb == Verb::WILL || verb == Verb::WONT;
        const bool enable = verb == Verb::WILL || verb == Verb::DO;
        return apply(about_peer ? Direction::remote : Direction::local, option,
            enable ? NegotiationInput::receive_enable : NegotiationInput::receive_disable);
    }

    std::optional<std::string> NegotiationStateMachine::on_request(Direction direction, Option option, bool enable) {
        return apply(direction, option,
            enable ? NegotiationInput::request_enable : NegotiationInput::request_disable);
    }

    std::optional<std::string> NegotiationStateMachine::apply(Direction direction, Option option, NegotiationInput input) {
        auto current = table_.get(direction, option);
        bool supported = input == NegotiationInput::receive_enable && current == OptionState::NO
            && policy_.accepts(direction, option);
        auto [next, reply] = transition(current, input, supported);

        if (next != current) {
            LDEBUG("Option {} ({}): {} -> {}", option, direction, current, next);
            table_.set(direction, option, next);
        }

        switch (reply) {
            case NegotiationReply::none:
                return std::nullopt;
            case NegotiationReply::enable:
                return encode(direction == Direction::local ? Verb::WILL : Verb::DO, option);
            case NegotiationReply::disable:
                return encode(direction == Direction::local ? Verb::WONT : Verb::DONT, option);
        }
        return std::nullopt;
    }
}
