#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cosign
{

    /** Unix time in milliseconds. All engine timestamps use this unit. */
    using Timestamp = std::int64_t;

    /**
     * Error kinds for cosign operations.
     * The first block is the coordination taxonomy reported to signers;
     * the second covers infrastructure failures.
     */
    enum class ErrorCode
    {
        NotFound,
        Unauthorized,
        AlreadySigned,
        InvalidSignature,
        StaleSignature,
        NotPending,
        Expired,
        AlreadyResolved,
        InsufficientWeight,
        ExecutionFailed,
        InvalidThreshold,
        LastValidatorRemoval,

        ConfigError,
        CryptoError,
        StorageError,
        InvalidInput,
        AlreadyExists,
        AuthError,
        InternalError
    };

    /** Stable wire name for an error code (used in HTTP and WebSocket error bodies). */
    std::string_view error_code_name(ErrorCode code);

    /**
     * Cosign error with code and message
     */
    class CosignError : public std::runtime_error
    {
    public:
        ErrorCode code;

        CosignError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static CosignError not_found(const std::string &msg)
        {
            return CosignError(ErrorCode::NotFound, msg);
        }

        static CosignError unauthorized(const std::string &msg)
        {
            return CosignError(ErrorCode::Unauthorized, msg);
        }

        static CosignError already_signed(const std::string &msg)
        {
            return CosignError(ErrorCode::AlreadySigned, msg);
        }

        static CosignError invalid_signature(const std::string &msg)
        {
            return CosignError(ErrorCode::InvalidSignature, msg);
        }

        static CosignError stale_signature(const std::string &msg)
        {
            return CosignError(ErrorCode::StaleSignature, msg);
        }

        static CosignError not_pending(const std::string &msg)
        {
            return CosignError(ErrorCode::NotPending, msg);
        }

        static CosignError expired(const std::string &msg)
        {
            return CosignError(ErrorCode::Expired, msg);
        }

        static CosignError already_resolved(const std::string &msg)
        {
            return CosignError(ErrorCode::AlreadyResolved, msg);
        }

        static CosignError insufficient_weight(const std::string &msg)
        {
            return CosignError(ErrorCode::InsufficientWeight, msg);
        }

        static CosignError execution_failed(const std::string &msg)
        {
            return CosignError(ErrorCode::ExecutionFailed, msg);
        }

        static CosignError invalid_threshold(const std::string &msg)
        {
            return CosignError(ErrorCode::InvalidThreshold, msg);
        }

        static CosignError last_validator(const std::string &msg)
        {
            return CosignError(ErrorCode::LastValidatorRemoval, msg);
        }

        static CosignError config(const std::string &msg)
        {
            return CosignError(ErrorCode::ConfigError, msg);
        }

        static CosignError crypto(const std::string &msg)
        {
            return CosignError(ErrorCode::CryptoError, msg);
        }

        static CosignError storage(const std::string &msg)
        {
            return CosignError(ErrorCode::StorageError, msg);
        }

        static CosignError invalid_input(const std::string &msg)
        {
            return CosignError(ErrorCode::InvalidInput, msg);
        }

        static CosignError already_exists(const std::string &msg)
        {
            return CosignError(ErrorCode::AlreadyExists, msg);
        }

        static CosignError auth(const std::string &msg)
        {
            return CosignError(ErrorCode::AuthError, msg);
        }

        static CosignError internal(const std::string &msg)
        {
            return CosignError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, CosignError>;

    /**
     * Time source shared by every component so that expiry and replay
     * windows can be driven deterministically in tests.
     */
    class Clock
    {
    public:
        virtual ~Clock() = default;

        virtual Timestamp now_ms() const = 0;
    };

    class SystemClock : public Clock
    {
    public:
        Timestamp now_ms() const override
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }
    };

    /** Process-wide system clock instance. */
    std::shared_ptr<const Clock> system_clock();

    /** ISO 8601 (UTC, millisecond precision) rendering of a timestamp. */
    std::string to_iso8601(Timestamp ts);

    /**
     * Parse a non-negative decimal amount ("1", "0.25", "10.000") in
     * display units. Signs, exponents and empty strings are rejected.
     */
    Result<double> parse_amount(std::string_view text);

} // namespace cosign
