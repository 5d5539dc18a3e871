#include "tephra/telnet/Encoder.hpp"

#include "CatchFormatters.hpp"

using namespace tephra::telnet;
using tephra::telnet::test::bytes;

TEST_CASE("encoding intents") {
    NegotiationStateMachine negotiation(SupportPolicy::both([](Option) { return true; }));
    Encoder encoder;

    SECTION("data without markers passes through") {
        CHECK(encoder.encode(SendData{"plain text\r\n"}, negotiation) == "plain text\r\n");
    }
    SECTION("every marker byte is doubled") {
        CHECK(encoder.encode(SendData{bytes({255, 'a', 255, 255})}, negotiation)
              == bytes({255, 255, 'a', 255, 255, 255, 255}));
    }
    SECTION("empty data encodes to nothing") {
        CHECK(encoder.encode(SendData{""}, negotiation).empty());
    }
    SECTION("an option request consults the negotiation state") {
        CHECK(encoder.encode(RequestOption{Direction::remote, codes::TTYPE, true}, negotiation)
              == bytes({255, 253, 24}));
        CHECK(negotiation.state(Direction::remote, codes::TTYPE) == OptionState::WANT_YES);
        CHECK(encoder.encode(RequestOption{Direction::remote, codes::TTYPE, true}, negotiation).empty());
    }
    SECTION("disabling an option that is off sends nothing") {
        CHECK(encoder.encode(RequestOption{Direction::local, codes::TELOPT_ECHO, false}, negotiation).empty());
    }
    SECTION("subnegotiation framing") {
        CHECK(encoder.encode(SendSubnegotiation{codes::TTYPE, bytes({0})}, negotiation)
              == bytes({255, 250, 24, 0, 255, 240}));
        CHECK(encoder.encode(SendSubnegotiation{codes::MSSP, ""}, negotiation) == bytes({255, 250, 70, 255, 240}));
    }
    SECTION("single-byte commands") {
        CHECK(encoder.encode(SendCommand{codes::NOP}, negotiation) == bytes({255, 241}));
        CHECK(encoder.encode(SendCommand{codes::GA}, negotiation) == bytes({255, 249}));
        CHECK(encoder.encode(SendCommand{codes::EOR}, negotiation) == bytes({255, 239}));
    }
    SECTION("bytes that would open a longer sequence are not sent as commands") {
        CHECK(encoder.encode(SendCommand{codes::IAC}, negotiation).empty());
        CHECK(encoder.encode(SendCommand{codes::SB}, negotiation).empty());
        CHECK(encoder.encode(SendCommand{codes::WILL}, negotiation).empty());
        CHECK(encoder.encode(SendCommand{'a'}, negotiation).empty());
    }
}

TEST_CASE("network newlines") {
    SECTION("conversion") {
        CHECK(Encoder::to_network_newlines("a\nb") == "a\r\nb");
        CHECK(Encoder::to_network_newlines("a\rb") == bytes({'a', 13, 0, 'b'}));
        CHECK(Encoder::to_network_newlines("a\r\nb") == "a\r\nb");
        CHECK(Encoder::to_network_newlines("\r") == bytes({13, 0}));
        CHECK(Encoder::to_network_newlines("\n\n") == "\r\n\r\n");
    }
    SECTION("applied to data when enabled") {
        NegotiationStateMachine negotiation(SupportPolicy{});
        Encoder translating(true);
        CHECK(translating.encode(SendData{bytes({'x', 10, 255})}, negotiation) == bytes({'x', 13, 10, 255, 255}));
        // subnegotiation payloads are binary and never translated
        CHECK(translating.encode(SendSubnegotiation{codes::GMCP, "\n"}, negotiation) == bytes({255, 250, 201, 10, 255, 240}));
    }
}
