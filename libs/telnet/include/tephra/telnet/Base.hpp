#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>

namespace tephra::telnet {

    // Negotiable capability code. The engine treats it as opaque.
    using Option = std::uint8_t;

    namespace codes {
        constexpr char NUL = static_cast<char>(0);
        constexpr char LF  = static_cast<char>(10);
        constexpr char CR  = static_cast<char>(13);

        constexpr char IAC  = static_cast<char>(255);
        constexpr char DONT = static_cast<char>(254);
        constexpr char DO   = static_cast<char>(253);
        constexpr char WONT = static_cast<char>(252);
        constexpr char WILL = static_cast<char>(251);
        constexpr char SB   = static_cast<char>(250);
        constexpr char SE   = static_cast<char>(240);

        // Telnet Commands
        constexpr char EOR = static_cast<char>(239);
        constexpr char NOP = static_cast<char>(241);
        constexpr char DM  = static_cast<char>(242);
        constexpr char BRK = static_cast<char>(243);
        constexpr char IP  = static_cast<char>(244);
        constexpr char AO  = static_cast<char>(245);
        constexpr char AYT = static_cast<char>(246);
        constexpr char EC  = static_cast<char>(247);
        constexpr char EL  = static_cast<char>(248);
        constexpr char GA  = static_cast<char>(249);

        // Telnet Options
        constexpr Option TELOPT_BINARY = 0;
        constexpr Option TELOPT_ECHO   = 1;
        constexpr Option SGA           = 3;
        constexpr Option TELOPT_STATUS = 5;
        constexpr Option TIMING_MARK   = 6;
        constexpr Option TTYPE         = 24;
        constexpr Option TELOPT_EOR    = 25;
        constexpr Option NAWS          = 31;
        constexpr Option LINEMODE      = 34;
        constexpr Option NEW_ENVIRON   = 39;
        constexpr Option CHARSET       = 42;
        constexpr Option MSSP          = 70;
        constexpr Option GMCP          = 201;
    }

    // True for the single-byte commands that may follow IAC with no payload.
    bool is_control_command(char byte);

    enum class Verb : std::uint8_t {
        WILL = 251,
        WONT = 252,
        DO   = 253,
        DONT = 254,
    };

    // local: capabilities we perform (peer sends DO/DONT). remote: capabilities the peer performs (WILL/WONT).
    enum class Direction : std::uint8_t {
        local,
        remote,
    };

    enum class ViolationKind : std::uint8_t {
        unknown_command,
        invalid_subnegotiation,
        empty_subnegotiation,
        buffer_overflow,
    };

    struct TelnetMessageData {
        std::string data;
        bool operator==(const TelnetMessageData&) const = default;
    };

    struct TelnetMessageNegotiation {
        Verb verb;
        Option option;
        bool operator==(const TelnetMessageNegotiation&) const = default;
    };

    struct TelnetMessageSubnegotiation {
        Option option;
        std::string data;
        bool operator==(const TelnetMessageSubnegotiation&) const = default;
    };

    struct TelnetMessageCommand {
        char command; // e.g., NOP, AYT, GA, etc.
        bool operator==(const TelnetMessageCommand&) const = default;
    };

    struct TelnetProtocolViolation {
        ViolationKind kind;
        std::string data; // the discarded bytes, when there are any worth reporting
        bool operator==(const TelnetProtocolViolation&) const = default;
    };

    using TelnetEvent = std::variant<TelnetMessageData, TelnetMessageNegotiation,
        TelnetMessageSubnegotiation, TelnetMessageCommand, TelnetProtocolViolation>;

    struct SendData {
        std::string data;
    };

    struct RequestOption {
        Direction direction;
        Option option;
        bool enable;
    };

    struct SendSubnegotiation {
        Option option;
        std::string data;
    };

    struct SendCommand {
        char command;
    };

    using OutboundIntent = std::variant<SendData, RequestOption, SendSubnegotiation, SendCommand>;

    struct TelnetSettings {
        std::size_t max_subnegotiation{64 * 1024};
        bool translate_newlines{false};
    };

    using SupportPredicate = std::function<bool(Option)>;

    struct SupportPolicy {
        SupportPredicate local;   // agree to DO for these
        SupportPredicate remote;  // agree to WILL for these

        static SupportPolicy both(SupportPredicate supports);

        bool accepts(Direction direction, Option option) const;
    };

    std::string_view to_string(Verb verb);
    std::string_view to_string(Direction direction);
    std::string_view to_string(ViolationKind kind);
    std::string to_string(const TelnetEvent& event);

    // Symbolic name for a command byte following IAC ("NOP", "GA"...), or its decimal value.
    std::string command_name(char byte);
}

template <>
struct fmt::formatter<tephra::telnet::Verb> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tephra::telnet::Verb verb, FormatContext &ctx) const {
        return formatter<std::string_view>::format(tephra::telnet::to_string(verb), ctx);
    }
};

template <>
struct fmt::formatter<tephra::telnet::Direction> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tephra::telnet::Direction direction, FormatContext &ctx) const {
        return formatter<std::string_view>::format(tephra::telnet::to_string(direction), ctx);
    }
};

template <>
struct fmt::formatter<tephra::telnet::ViolationKind> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(tephra::telnet::ViolationKind kind, FormatContext &ctx) const {
        return formatter<std::string_view>::format(tephra::telnet::to_string(kind), ctx);
    }
};

template <>
struct fmt::formatter<tephra::telnet::TelnetEvent> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tephra::telnet::TelnetEvent &event, FormatContext &ctx) const {
        return formatter<std::string_view>::format(tephra::telnet::to_string(event), ctx);
    }
};
