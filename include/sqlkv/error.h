#pragma once

#include <cstdint>

#define CHECK_KV_ERR(err)          \
    if ((err) != KvError::NoError) \
    {                              \
        return err;                \
    }

namespace sqlkv
{
enum struct KvError : uint8_t
{
    NoError = 0,    // Success.
    InvalidArgs,    // Invalid inputs/options (e.g., bad location/key/range).
    NotFound,       // Missing key.
    NotRunning,     // Store not opened or already closed.
    InitFailed,     // Cache selection or schema bootstrap failed.
    ValueTooLarge,  // Encoded key/value exceeds its column width.
    Corrupted,      // Row read from the backend cannot be decoded.
    TryAgain,       // Retryable condition (connection lost, locked table).
    Busy,           // Backend busy.
    Timeout,        // Waiting for a connected backend exceeded the deadline.
    BackendErr,     // Statement failed after exhausting retries.
};

constexpr const char *ErrorString(KvError err)
{
    switch (err)
    {
    case KvError::NoError:
        return "Succeed";
    case KvError::InvalidArgs:
        return "Invalid arguments";
    case KvError::NotFound:
        return "Resource not found";
    case KvError::NotRunning:
        return "Store is not opened";
    case KvError::InitFailed:
        return "Backend cache could not be initialized";
    case KvError::ValueTooLarge:
        return "Key or value exceeds column width";
    case KvError::Corrupted:
        return "Stored data corrupted";
    case KvError::TryAgain:
        return "Try again later";
    case KvError::Busy:
        return "Backend busy";
    case KvError::Timeout:
        return "Operation timeout";
    case KvError::BackendErr:
        return "Backend statement failed";
    }
    return "Unknown error";
}

constexpr bool IsRetryableErr(KvError err)
{
    switch (err)
    {
    case KvError::TryAgain:
    case KvError::Busy:
    case KvError::Timeout:
        return true;
    default:
        return false;
    }
}

}  // namespace sqlkv
