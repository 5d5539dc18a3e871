#pragma once

#include "Base.hpp"
#include "Negotiation.hpp"

namespace tephra::telnet {

    // Turns caller intents into wire bytes. Option requests go through the negotiation
    // state machine, so a request that would not change anything encodes to nothing.
    class Encoder {
        public:
        explicit Encoder(bool translate_newlines = false);

        std::string encode(const OutboundIntent& intent, NegotiationStateMachine& negotiation) const;

        // Appends data with every IAC doubled.
        static void append_escaped(std::string& out, std::string_view data);

        // IAC SB <option> <escaped payload> IAC SE
        static void append_subnegotiation(std::string& out, Option option, std::string_view data);

        // NVT line endings: lone LF becomes CR LF, lone CR becomes CR NUL.
        static std::string to_network_newlines(std::string_view data);

        private:
        bool translate_newlines_;
    };

}
