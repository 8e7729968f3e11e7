#include "hitl/core/error.h"

namespace hitl {

const char* errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::REGISTRATION_ERROR: return "RegistrationError";
    case ErrorCode::AUTHORIZATION_DENIED: return "AuthorizationDenied";
    case ErrorCode::AUTHORIZATION_TIMEOUT: return "AuthorizationTimeout";
    case ErrorCode::STATE_MISMATCH: return "StateMismatch";
    case ErrorCode::TOKEN_EXCHANGE_ERROR: return "TokenExchangeError";
    case ErrorCode::TOKEN_REFRESH_ERROR: return "TokenRefreshError";
    case ErrorCode::REAUTHENTICATION_REQUIRED: return "ReauthenticationRequired";
    case ErrorCode::ENCRYPTION_ERROR: return "EncryptionError";
    case ErrorCode::DECRYPTION_ERROR: return "DecryptionError";
    case ErrorCode::NETWORK_ERROR: return "NetworkError";
    case ErrorCode::PERMISSION_ERROR: return "PermissionError";
    case ErrorCode::CANCELLED: return "Cancelled";
    case ErrorCode::CONFIGURATION_ERROR: return "ConfigurationError";
    default: return "UnknownError";
  }
}

}  // namespace hitl
