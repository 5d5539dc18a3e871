#include "tephra/telnet/Base.hpp"

namespace tephra::telnet {

    bool is_control_command(char byte) {
        switch (byte) {
            case codes::EOR:
            case codes::SE:
            case codes::NOP:
            case codes::DM:
            case codes::BRK:
            case codes::IP:
            case codes::AO:
            case codes::AYT:
            case codes::EC:
            case codes::EL:
            case codes::GA:
                return true;
            default:
                return false;
        }
    }

    SupportPolicy SupportPolicy::both(SupportPredicate supports) {
        return SupportPolicy{supports, supports};
    }

    bool SupportPolicy::accepts(Direction direction, Option option) const {
        const auto& predicate = direction == Direction::local ? local : remote;
        return predicate && predicate(option);
    }

    std::string_view to_string(Verb verb) {
        switch (verb) {
            case Verb::WILL: return "WILL";
            case Verb::WONT: return "WONT";
            case Verb::DO: return "DO";
            case Verb::DONT: return "DONT";
        }
        return "?";
    }

    std::string_view to_string(Direction direction) {
        return direction == Direction::local ? "local" : "remote";
    }

    std::string_view to_string(ViolationKind kind) {
        switch (kind) {
            case ViolationKind::unknown_command: return "unknown_command";
            case ViolationKind::invalid_subnegotiation: return "invalid_subnegotiation";
            case ViolationKind::empty_subnegotiation: return "empty_subnegotiation";
            case ViolationKind::buffer_overflow: return "buffer_overflow";
        }
        return "?";
    }

    std::string command_name(char byte) {
        switch (byte) {
            case codes::EOR: return "EOR";
            case codes::SE: return "SE";
            case codes::NOP: return "NOP";
            case codes::DM: return "DM";
            case codes::BRK: return "BRK";
            case codes::IP: return "IP";
            case codes::AO: return "AO";
            case codes::AYT: return "AYT";
            case codes::EC: return "EC";
            case codes::EL: return "EL";
            case codes::GA: return "GA";
            case codes::SB: return "SB";
            case codes::WILL: return "WILL";
            case codes::WONT: return "WONT";
            case codes::DO: return "DO";
            case codes::DONT: return "DONT";
            case codes::IAC: return "IAC";
            default: return fmt::format("{}", static_cast<unsigned char>(byte));
        }
    }

    static std::string hex_bytes(std::string_view data) {
        std::string out;
        for (char ch : data) {
            if (!out.empty()) {
                out.push_back(' ');
            }
            out += fmt::format("{:02x}", static_cast<unsigned char>(ch));
        }
        return out;
    }

    std::string to_string(const TelnetEvent& event) {
        return std::visit([](const auto& m) -> std::string {
            using T = std::decay_t<decltype(m)>;

            if constexpr (std::is_same_v<T, TelnetMessageData>) {
                return fmt::format("Data[{}]", hex_bytes(m.data));
            } else if constexpr (std::is_same_v<T, TelnetMessageNegotiation>) {
                return fmt::format("Negotiation({} {})", m.verb, m.option);
            } else if constexpr (std::is_same_v<T, TelnetMessageSubnegotiation>) {
                return fmt::format("Subnegotiation({}, [{}])", m.option, hex_bytes(m.data));
            } else if constexpr (std::is_same_v<T, TelnetMessageCommand>) {
                return fmt::format("Command({})", command_name(m.command));
            } else {
                return fmt::format("ProtocolViolation({}, [{}])", m.kind, hex_bytes(m.data));
            }
        }, event);
    }
}
