#pragma once

#include "Base.hpp"
#include "Subnegotiation.hpp"

#include <vector>

namespace tephra::telnet {

    enum class ScannerState : std::uint8_t {
        DATA,
        MARKER_SEEN,              // IAC
        COMMAND_AWAITING_OPTION,  // IAC <WILL|WONT|DO|DONT>
        SUBNEG_COLLECTING,        // IAC SB ...
        SUBNEG_MARKER_SEEN,       // IAC SB ... IAC
    };

    std::string_view to_string(ScannerState state);

    struct ScanData {
        std::string data;
    };

    struct ScanCommandCandidate {
        Verb verb;
        Option option;
    };

    struct ScanControl {
        char command;
    };

    struct ScanSubnegStart {
        Option option;
    };

    struct ScanSubnegEnd {
        TelnetMessageSubnegotiation block;
    };

    struct ScanViolation {
        ViolationKind kind;
        std::string data;
    };

    using ScanFragment = std::variant<ScanData, ScanCommandCandidate, ScanControl,
        ScanSubnegStart, ScanSubnegEnd, ScanViolation>;

    // Splits raw inbound bytes into data runs and protocol fragments.
    // A feed may end anywhere; the partial sequence is kept in state() and resumed by the next feed.
    class ByteStreamScanner {
        public:
        explicit ByteStreamScanner(std::size_t max_subnegotiation);

        std::vector<ScanFragment> feed(std::string_view bytes);

        ScannerState state() const {
            return state_;
        }

        const SubnegotiationAssembler& assembler() const {
            return assembler_;
        }

        void reset();

        private:
        void emit(std::vector<ScanFragment>& out, ScanFragment fragment);
        void flushData(std::vector<ScanFragment>& out);
        std::size_t collect(std::vector<ScanFragment>& out, std::string_view bytes);
        void onMarker(std::vector<ScanFragment>& out, char byte);
        void onSubnegMarker(std::vector<ScanFragment>& out, char byte);

        ScannerState state_{ScannerState::DATA};
        Verb pending_verb_{Verb::WILL};
        std::string data_;
        SubnegotiationAssembler assembler_;
    };

}

template <>
struct fmt::formatter<tephra::telnet::ScannerState> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tephra::telnet::ScannerState state, FormatContext &ctx) const {
        return formatter<std::string_view>::format(tephra::telnet::to_string(state), ctx);
    }
};
