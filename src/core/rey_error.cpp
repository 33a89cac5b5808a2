#include "rey/core/rey_error.h"

namespace rey {

// ------------------------------------------------------------
// Category from error code range
// ------------------------------------------------------------
const char* error_category(ErrorCode code) {
    const int value = error_value(code);

    if (value == 0) return "Success";
    if (value >= -109 && value <= -100) return "Initialization";
    if (value >= -129 && value <= -110) return "Model";
    if (value >= -179 && value <= -150) return "Network";
    if (value >= -249 && value <= -230) return "ComponentState";
    if (value >= -279 && value <= -250) return "Validation";
    if (value >= -299 && value <= -280) return "Audio";
    if (value >= -329 && value <= -320) return "Authentication";
    if (value >= -699 && value <= -600) return "Backend";

    return "Unknown";
}

const char* error_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";
        case ErrorCode::NotInitialized:
            return "Component not initialized";
        case ErrorCode::ClassifierUnavailable:
            return "Wake word classifier unavailable";
        case ErrorCode::TranscriberUnavailable:
            return "Transcriber unavailable";
        case ErrorCode::TransportError:
            return "Connection lost";
        case ErrorCode::HandshakeFailed:
            return "WebSocket handshake failed";
        case ErrorCode::ConnectionClosed:
            return "Connection closed";
        case ErrorCode::Cancelled:
            return "Operation cancelled";
        case ErrorCode::InvalidState:
            return "Invalid state for operation";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InvalidJson:
            return "Invalid JSON";
        case ErrorCode::EmptyOrShortTranscript:
            return "Didn't catch that";
        case ErrorCode::AudioTooQuiet:
            return "Didn't hear anything";
        case ErrorCode::Unauthorized:
            return "Unauthorized";
        case ErrorCode::BackendError:
            return "Backend request failed";
        case ErrorCode::BackendBadResponse:
            return "Backend returned an invalid response";
        case ErrorCode::SynthesisUnavailable:
            return "Speech synthesis unavailable";
    }
    return "Unknown error";
}

ErrorModel make_error_model(ErrorCode code) {
    ErrorModel model;
    model.code = code;
    model.message = error_message(code);
    model.category = error_category(code);
    return model;
}

}  // namespace rey
