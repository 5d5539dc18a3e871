#include "tephra/telnet/Scanner.hpp"

namespace tephra::telnet {

    std::string_view to_string(ScannerState state) {
        switch (state) {
            case ScannerState::DATA: return "DATA";
            case ScannerState::MARKER_SEEN: return "MARKER_SEEN";
            case ScannerState::COMMAND_AWAITING_OPTION: return "COMMAND_AWAITING_OPTION";
            case ScannerState::SUBNEG_COLLECTING: return "SUBNEG_COLLECTING";
            case ScannerState::SUBNEG_MARKER_SEEN: return "SUBNEG_MARKER_SEEN";
        }
        return "?";
    }

    ByteStreamScanner::ByteStreamScanner(std::size_t max_subnegotiation) : assembler_(max_subnegotiation) {
    }

    void ByteStreamScanner::reset() {
        state_ = ScannerState::DATA;
        data_.clear();
        assembler_.discard();
    }

    std::vector<ScanFragment> ByteStreamScanner::feed(std::string_view bytes) {
        std::vector<ScanFragment> out;
        std::size_t pos = 0;

        while (pos < bytes.size()) {
            switch (state_) {
                case ScannerState::DATA: {
                    // plain bytes up to the next marker form one run
                    auto next = bytes.find(codes::IAC, pos);
                    if (next == std::string_view::npos) {
                        data_.append(bytes.substr(pos));
                        pos = bytes.size();
                    } else {
                        data_.append(bytes.substr(pos, next - pos));
                        state_ = ScannerState::MARKER_SEEN;
                        pos = next + 1;
                    }
                    break;
                }
                case ScannerState::MARKER_SEEN:
                    onMarker(out, bytes[pos++]);
                    break;
                case ScannerState::COMMAND_AWAITING_OPTION:
                    state_ = ScannerState::DATA;
                    emit(out, ScanCommandCandidate{pending_verb_, static_cast<Option>(bytes[pos++])});
                    break;
                case ScannerState::SUBNEG_COLLECTING: {
                    auto next = bytes.find(codes::IAC, pos);
                    if (next == pos) {
                        state_ = ScannerState::SUBNEG_MARKER_SEEN;
                        ++pos;
                        break;
                    }
                    auto end = next == std::string_view::npos ? bytes.size() : next;
                    pos += collect(out, bytes.substr(pos, end - pos));
                    break;
                }
                case ScannerState::SUBNEG_MARKER_SEEN:
                    onSubnegMarker(out, bytes[pos++]);
                    break;
            }
        }

        flushData(out);
        return out;
    }

    void ByteStreamScanner::emit(std::vector<ScanFragment>& out, ScanFragment fragment) {
        flushData(out);
        out.emplace_back(std::move(fragment));
    }

    void ByteStreamScanner::flushData(std::vector<ScanFragment>& out) {
        if (data_.empty()) {
            return;
        }
        out.emplace_back(ScanData{std::move(data_)});
        data_.clear();
    }

    std::size_t ByteStreamScanner::collect(std::vector<ScanFragment>& out, std::string_view bytes) {
        if (!assembler_.active()) {
            // first byte after IAC SB names the option
            auto option = static_cast<Option>(bytes.front());
            assembler_.begin(option);
            emit(out, ScanSubnegStart{option});
            return 1;
        }

        // Only take up to the first byte that no longer fits; whatever follows it is plain data again.
        auto room = assembler_.max_payload() - assembler_.size();
        auto take = bytes.size() > room ? room + 1 : bytes.size();
        if (!assembler_.accumulate(bytes.substr(0, take))) {
            state_ = ScannerState::DATA;
            emit(out, ScanViolation{ViolationKind::buffer_overflow, {}});
        }
        return take;
    }

    void ByteStreamScanner::onMarker(std::vector<ScanFragment>& out, char byte) {
        state_ = ScannerState::DATA;

        switch (byte) {
            case codes::IAC:
                // escaped 255 data byte
                data_.push_back(codes::IAC);
                return;
            case codes::WILL:
            case codes::WONT:
            case codes::DO:
            case codes::DONT:
                pending_verb_ = static_cast<Verb>(static_cast<unsigned char>(byte));
                state_ = ScannerState::COMMAND_AWAITING_OPTION;
                return;
            case codes::SB:
                flushData(out);
                assembler_.discard();
                state_ = ScannerState::SUBNEG_COLLECTING;
                return;
            default:
                if (is_control_command(byte)) {
                    emit(out, ScanControl{byte});
                } else {
                    emit(out, ScanViolation{ViolationKind::unknown_command, std::string{codes::IAC, byte}});
                }
                return;
        }
    }

    void ByteStreamScanner::onSubnegMarker(std::vector<ScanFragment>& out, char byte) {
        if (byte == codes::IAC) {
            // escaped 255 inside the payload
            static constexpr std::string_view marker{"\xff", 1};
            state_ = ScannerState::SUBNEG_COLLECTING;
            collect(out, marker);
            return;
        }

        state_ = ScannerState::DATA;

        if (byte == codes::SE) {
            if (!assembler_.active()) {
                emit(out, ScanViolation{ViolationKind::empty_subnegotiation, {}});
            } else {
                emit(out, ScanSubnegEnd{assembler_.finish()});
            }
            return;
        }

        assembler_.discard();
        emit(out, ScanViolation{ViolationKind::invalid_subnegotiation, std::string{codes::IAC, byte}});
    }
}
