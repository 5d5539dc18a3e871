#include "tephra/telnet/Connection.hpp"
#include "tephra/log/Log.hpp"

namespace tephra::telnet {

    TelnetConnection::TelnetConnection(SupportPolicy policy, TelnetSettings settings)
        : settings_(settings),
        scanner_(settings.max_subnegotiation),
        negotiation_(std::move(policy)),
        encoder_(settings.translate_newlines) {
    }

    TelnetConnection::TelnetConnection(SupportPredicate supports, TelnetSettings settings)
        : TelnetConnection(SupportPolicy::both(std::move(supports)), settings) {
    }

    FeedResult TelnetConnection::feed(std::string_view bytes) {
        FeedResult result;
        for (auto& fragment : scanner_.feed(bytes)) {
            deliver(result, fragment);
        }
        return result;
    }

    std::string TelnetConnection::submit(const OutboundIntent& intent) {
        return encoder_.encode(intent, negotiation_);
    }

    std::string TelnetConnection::submit(const std::vector<OutboundIntent>& intents) {
        std::string out;
        for (const auto& intent : intents) {
            out += submit(intent);
        }
        return out;
    }

    void TelnetConnection::deliver(FeedResult& result, ScanFragment& fragment) {
        std::visit([&](auto& m) {
            using T = std::decay_t<decltype(m)>;

            if constexpr (std::is_same_v<T, ScanData>) {
                deliverData(result, std::move(m.data));
            } else if constexpr (std::is_same_v<T, ScanCommandCandidate>) {
                releasePendingCR(result);
                LTRACE("Received IAC {} {}", m.verb, m.option);
                result.events.emplace_back(TelnetMessageNegotiation{m.verb, m.option});
                if (auto reply = negotiation_.on_command(m.verb, m.option)) {
                    result.output += *reply;
                }
            } else if constexpr (std::is_same_v<T, ScanControl>) {
                releasePendingCR(result);
                result.events.emplace_back(TelnetMessageCommand{m.command});
            } else if constexpr (std::is_same_v<T, ScanSubnegStart>) {
                LTRACE("Subnegotiation started for option {}", m.option);
            } else if constexpr (std::is_same_v<T, ScanSubnegEnd>) {
                releasePendingCR(result);
                result.events.emplace_back(std::move(m.block));
            } else if constexpr (std::is_same_v<T, ScanViolation>) {
                releasePendingCR(result);
                TelnetEvent event = TelnetProtocolViolation{m.kind, std::move(m.data)};
                LWARN("Telnet protocol violation: {}", event);
                result.events.emplace_back(std::move(event));
            }
        }, fragment);
    }

    void TelnetConnection::deliverData(FeedResult& result, std::string data) {
        if (!settings_.translate_newlines) {
            result.events.emplace_back(TelnetMessageData{std::move(data)});
            return;
        }

        // CR LF -> LF, CR NUL -> CR, CR <other> -> CR <other>
        std::string out;
        out.reserve(data.size() + 1);
        for (char ch : data) {
            if (pending_cr_) {
                pending_cr_ = false;
                if (ch == codes::LF) {
                    out.push_back(codes::LF);
                    continue;
                }
                out.push_back(codes::CR);
                if (ch == codes::NUL) {
                    continue;
                }
            }
            if (ch == codes::CR) {
                pending_cr_ = true;
                continue;
            }
            out.push_back(ch);
        }

        if (!out.empty()) {
            result.events.emplace_back(TelnetMessageData{std::move(out)});
        }
    }

    void TelnetConnection::releasePendingCR(FeedResult& result) {
        if (!pending_cr_) {
            return;
        }
        pending_cr_ = false;
        result.events.emplace_back(TelnetMessageData{std::string(1, codes::CR)});
    }

}
