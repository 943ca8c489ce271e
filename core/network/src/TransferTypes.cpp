#include "TransferTypes.h"

namespace PinDrop {

const char* toString(TransferRole role) {
    switch (role) {
        case TransferRole::Send: return "send";
        case TransferRole::Receive: return "receive";
    }
    return "unknown";
}

const char* toString(TransferEventKind kind) {
    switch (kind) {
        case TransferEventKind::StateChanged: return "state";
        case TransferEventKind::Progress: return "progress";
        case TransferEventKind::Completed: return "completed";
        case TransferEventKind::Failed: return "failed";
        case TransferEventKind::Rejected: return "rejected";
    }
    return "unknown";
}

const char* toString(ReceiverState state) {
    switch (state) {
        case ReceiverState::Idle: return "IDLE";
        case ReceiverState::Listening: return "LISTENING";
        case ReceiverState::Connected: return "CONNECTED";
        case ReceiverState::Verifying: return "VERIFYING";
        case ReceiverState::Receiving: return "RECEIVING";
        case ReceiverState::Done: return "DONE";
        case ReceiverState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

const char* toString(SenderState state) {
    switch (state) {
        case SenderState::Idle: return "IDLE";
        case SenderState::Connecting: return "CONNECTING";
        case SenderState::SendingPin: return "SENDING_PIN";
        case SenderState::Streaming: return "STREAMING";
        case SenderState::Done: return "DONE";
        case SenderState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

} // namespace PinDrop
