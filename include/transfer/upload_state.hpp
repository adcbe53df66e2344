#ifndef RCOPY_TRANSFER_UPLOAD_STATE_HPP
#define RCOPY_TRANSFER_UPLOAD_STATE_HPP

#include <ostream>
#include <string>

namespace rcopy {
namespace transfer {

/**
 * UploadState tracks one inbound upload and rejects invalid transitions.
 */
class UploadState {
public:
    /**
     * Upload states:
     * AWAITING_FIRST_CHUNK - Session created, destination not opened yet
     * RECEIVING            - Destination open, chunks being written
     * COMPLETED            - Stream ended and the byte count matched
     * FAILED               - Open, write, transport or size check failed
     */
    enum class State {
        AWAITING_FIRST_CHUNK,
        RECEIVING,
        COMPLETED,
        FAILED
    };

    UploadState() : current_state_(State::AWAITING_FIRST_CHUNK) {}

    State get_state() const { return current_state_; }

    bool is_terminal() const {
        return current_state_ == State::COMPLETED ||
               current_state_ == State::FAILED;
    }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::AWAITING_FIRST_CHUNK:
                // An empty stream completes without ever opening a file
                return to == State::RECEIVING ||
                       to == State::COMPLETED ||
                       to == State::FAILED;

            case State::RECEIVING:
                return to == State::COMPLETED ||
                       to == State::FAILED;

            case State::COMPLETED:
            case State::FAILED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::AWAITING_FIRST_CHUNK: return "AWAITING_FIRST_CHUNK";
            case State::RECEIVING:            return "RECEIVING";
            case State::COMPLETED:            return "COMPLETED";
            case State::FAILED:               return "FAILED";
            default:                          return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

inline std::ostream& operator<<(std::ostream& os, const UploadState::State& state) {
    os << UploadState::state_to_string(state);
    return os;
}

} // namespace transfer
} // namespace rcopy

#endif // RCOPY_TRANSFER_UPLOAD_STATE_HPP
