#pragma once

#include "Base.hpp"

#include <array>
#include <optional>

namespace tephra::telnet {

    // RFC 1143 "Q method" states, tracked separately for each direction of each option.
    enum class OptionState : std::uint8_t {
        NO,
        YES,
        WANT_NO,
        WANT_NO_QUEUED,
        WANT_YES,
        WANT_YES_QUEUED,
    };

    std::string_view to_string(OptionState state);

    enum class NegotiationInput : std::uint8_t {
        receive_enable,   // WILL or DO from the peer
        receive_disable,  // WONT or DONT from the peer
        request_enable,   // our caller asks to enable
        request_disable,  // our caller asks to disable
    };

    // What to put on the wire after a transition. enable/disable are expressed in the
    // direction being negotiated: WILL/WONT for local, DO/DONT for remote.
    enum class NegotiationReply : std::uint8_t {
        none,
        enable,
        disable,
    };

    struct Transition {
        OptionState next;
        NegotiationReply reply;
    };

    // The whole state machine for one direction of one option. `supported` only matters for
    // receive_enable while NO.
    Transition transition(OptionState current, NegotiationInput input, bool supported);

    struct OptionStates {
        OptionState local{OptionState::NO};
        OptionState remote{OptionState::NO};
    };

    class NegotiationTable {
        public:
        OptionState get(Direction direction, Option option) const;
        void set(Direction direction, Option option, OptionState state);

        const OptionStates& at(Option option) const {
            return entries_[option];
        }

        private:
        std::array<OptionStates, 256> entries_{};
    };

    class NegotiationStateMachine {
        public:
        explicit NegotiationStateMachine(SupportPolicy policy);

        // Inbound WILL/WONT/DO/DONT. Returns the reply to transmit, if any.
        std::optional<std::string> on_command(Verb verb, Option option);

        // Caller intent to change an option. Returns the request to transmit, if any.
        std::optional<std::string> on_request(Direction direction, Option option, bool enable);

        OptionState state(Direction direction, Option option) const {
            return table_.get(direction, option);
        }

        bool is_enabled(Direction direction, Option option) const {
            return table_.get(direction, option) == OptionState::YES;
        }

        const NegotiationTable& table() const {
            return table_;
        }

        static std::string encode(Verb verb, Option option);

        private:
        std::optional<std::string> apply(Direction direction, Option option, NegotiationInput input);

        SupportPolicy policy_;
        NegotiationTable table_;
    };

}

template <>
struct fmt::formatter<tephra::telnet::OptionState> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tephra::telnet::OptionState state, FormatContext &ctx) const {
        return formatter<std::string_view>::format(tephra::telnet::to_string(state), ctx);
    }
};
