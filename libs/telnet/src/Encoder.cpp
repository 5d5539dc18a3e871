#include "tephra/telnet/Encoder.hpp"
#include "tephra/log/Log.hpp"

namespace tephra::telnet {

    Encoder::Encoder(bool translate_newlines) : translate_newlines_(translate_newlines) {
    }

    void Encoder::append_escaped(std::string& out, std::string_view data) {
        for (char ch : data) {
            out.push_back(ch);
            if (ch == codes::IAC) {
                out.push_back(codes::IAC);
            }
        }
    }

    void Encoder::append_subnegotiation(std::string& out, Option option, std::string_view data) {
        out.push_back(codes::IAC);
        out.push_back(codes::SB);
        out.push_back(static_cast<char>(option));
        append_escaped(out, data);
        out.push_back(codes::IAC);
        out.push_back(codes::SE);
    }

    std::string Encoder::to_network_newlines(std::string_view data) {
        std::string out;
        out.reserve(data.size());
        for (std::size_t i = 0; i < data.size(); ++i) {
            char ch = data[i];
            if (ch == codes::CR) {
                out.push_back(codes::CR);
                if (i + 1 < data.size() && data[i + 1] == codes::LF) {
                    out.push_back(codes::LF);
                    ++i;
                } else {
                    out.push_back(codes::NUL);
                }
            } else if (ch == codes::LF) {
                out.push_back(codes::CR);
                out.push_back(codes::LF);
            } else {
                out.push_back(ch);
            }
        }
        return out;
    }

    std::string Encoder::encode(const OutboundIntent& intent, NegotiationStateMachine& negotiation) const {
        return std::visit([&](const auto& m) -> std::string {
            using T = std::decay_t<decltype(m)>;
            std::string out;

            if constexpr (std::is_same_v<T, SendData>) {
                out.reserve(m.data.size());
                if (translate_newlines_) {
                    append_escaped(out, to_network_newlines(m.data));
                } else {
                    append_escaped(out, m.data);
                }
            } else if constexpr (std::is_same_v<T, RequestOption>) {
                if (auto request = negotiation.on_request(m.direction, m.option, m.enable)) {
                    out = std::move(*request);
                }
            } else if constexpr (std::is_same_v<T, SendSubnegotiation>) {
                append_subnegotiation(out, m.option, m.data);
            } else if constexpr (std::is_same_v<T, SendCommand>) {
                if (!is_control_command(m.command)) {
                    LWARN("Refusing to send {} as a single-byte command.", command_name(m.command));
                } else {
                    out.push_back(codes::IAC);
                    out.push_back(m.command);
                }
            }

            return out;
        }, intent);
    }
}
