/**
 * @file rey_error.h
 * @brief Rey Voice Server - Error codes and structured error model
 *
 * Error codes are negative and grouped in ranges so the category of any code
 * can be derived from its value:
 *
 *   -100..-109  Initialization
 *   -110..-129  Model
 *   -150..-179  Network
 *   -230..-249  ComponentState
 *   -250..-279  Validation
 *   -280..-299  Audio
 *   -320..-329  Authentication
 *   -600..-699  Backend
 */

#ifndef REY_CORE_ERROR_H
#define REY_CORE_ERROR_H

#include <string>

namespace rey {

enum class ErrorCode : int {
    Ok = 0,

    // Initialization
    NotInitialized = -100,

    // Model
    ClassifierUnavailable = -110,
    TranscriberUnavailable = -111,

    // Network
    TransportError = -150,
    HandshakeFailed = -151,
    ConnectionClosed = -152,

    // ComponentState
    Cancelled = -230,
    InvalidState = -231,

    // Validation
    InvalidArgument = -250,
    InvalidJson = -251,

    // Audio
    EmptyOrShortTranscript = -280,
    AudioTooQuiet = -281,

    // Authentication
    Unauthorized = -320,

    // Backend
    BackendError = -600,
    BackendBadResponse = -601,
    SynthesisUnavailable = -610,
};

/**
 * @brief Structured error: code plus its message and category.
 */
struct ErrorModel {
    ErrorCode code = ErrorCode::Ok;
    const char* message = "";
    const char* category = "";
};

/**
 * @brief Get error category string from error code range
 */
const char* error_category(ErrorCode code);

/**
 * @brief Get a short human-readable message for an error code
 */
const char* error_message(ErrorCode code);

/**
 * @brief Create structured error model from error code
 */
ErrorModel make_error_model(ErrorCode code);

inline int error_value(ErrorCode code) {
    return static_cast<int>(code);
}

}  // namespace rey

#endif  // REY_CORE_ERROR_H
