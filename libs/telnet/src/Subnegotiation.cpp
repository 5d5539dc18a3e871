#include "tephra/telnet/Subnegotiation.hpp"
#include "tephra/log/Log.hpp"

namespace tephra::telnet {

    SubnegotiationAssembler::SubnegotiationAssembler(std::size_t max_payload) : max_payload_(max_payload) {
    }

    void SubnegotiationAssembler::begin(Option option) {
        option_ = option;
        buffer_.clear();
    }

    bool SubnegotiationAssembler::accumulate(std::string_view bytes) {
        if (bytes.size() > max_payload_ - buffer_.size()) {
            LDEBUG("Subnegotiation for option {} exceeded {} bytes, discarding.", option_.value_or(0), max_payload_);
            discard();
            return false;
        }
        buffer_.append(bytes);
        return true;
    }

    TelnetMessageSubnegotiation SubnegotiationAssembler::finish() {
        TelnetMessageSubnegotiation out{option_.value_or(0), std::move(buffer_)};
        discard();
        return out;
    }

    void SubnegotiationAssembler::discard() {
        option_.reset();
        buffer_.clear();
    }
}
