#pragma once

#include "Base.hpp"

#include <optional>

namespace tephra::telnet {

    // Buffers the payload of one IAC SB <option> ... IAC SE block.
    // Bytes reaching the assembler are already de-escaped: a doubled IAC arrives as a single 0xFF.
    class SubnegotiationAssembler {
        public:
        explicit SubnegotiationAssembler(std::size_t max_payload);

        void begin(Option option);

        // Returns false when the payload would exceed the limit; the block is discarded in that case.
        [[nodiscard]] bool accumulate(std::string_view bytes);

        // Yields the completed block and leaves the assembler idle.
        TelnetMessageSubnegotiation finish();

        void discard();

        bool active() const {
            return option_.has_value();
        }

        std::size_t size() const {
            return buffer_.size();
        }

        std::size_t max_payload() const {
            return max_payload_;
        }

        private:
        std::size_t max_payload_;
        std::optional<Option> option_;
        std::string buffer_;
    };

}
