#pragma once
#include "Base.hpp"
#include "Encoder.hpp"
#include "Negotiation.hpp"
#include "Scanner.hpp"

#include <vector>

namespace tephra::telnet {

    struct FeedResult {
        std::vector<TelnetEvent> events;
        // Negotiation replies produced while reading; the transport writes these out.
        std::string output;
    };

    // One Telnet session's protocol state. Performs no I/O: bytes in, events and bytes out.
    // Not thread-safe; the transport must serialize calls into a single instance.
    class TelnetConnection {
        public:
        explicit TelnetConnection(SupportPolicy policy, TelnetSettings settings = {});
        explicit TelnetConnection(SupportPredicate supports, TelnetSettings settings = {});

        FeedResult feed(std::string_view bytes);

        std::string submit(const OutboundIntent& intent);
        std::string submit(const std::vector<OutboundIntent>& intents);

        OptionState local_state(Option option) const {
            return negotiation_.state(Direction::local, option);
        }

        OptionState remote_state(Option option) const {
            return negotiation_.state(Direction::remote, option);
        }

        bool local_enabled(Option option) const {
            return negotiation_.is_enabled(Direction::local, option);
        }

        bool remote_enabled(Option option) const {
            return negotiation_.is_enabled(Direction::remote, option);
        }

        ScannerState scanner_state() const {
            return scanner_.state();
        }

        const NegotiationTable& table() const {
            return negotiation_.table();
        }

        const TelnetSettings& settings() const {
            return settings_;
        }

        private:
        void deliver(FeedResult& result, ScanFragment& fragment);
        void deliverData(FeedResult& result, std::string data);
        void releasePendingCR(FeedResult& result);

        TelnetSettings settings_;
        ByteStreamScanner scanner_;
        NegotiationStateMachine negotiation_;
        Encoder encoder_;
        // translate_newlines: a CR whose partner byte has not arrived yet
        bool pending_cr_{false};
    };

} // namespace tephra::telnet
