#include "cosign/types.hpp"
#include <charconv>
#include <ctime>
#include <format>

namespace cosign
{

    std::string_view error_code_name(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::Unauthorized:
            return "Unauthorized";
        case ErrorCode::AlreadySigned:
            return "AlreadySigned";
        case ErrorCode::InvalidSignature:
            return "InvalidSignature";
        case ErrorCode::StaleSignature:
            return "StaleSignature";
        case ErrorCode::NotPending:
            return "NotPending";
        case ErrorCode::Expired:
            return "Expired";
        case ErrorCode::AlreadyResolved:
            return "AlreadyResolved";
        case ErrorCode::InsufficientWeight:
            return "InsufficientWeight";
        case ErrorCode::ExecutionFailed:
            return "ExecutionFailed";
        case ErrorCode::InvalidThreshold:
            return "InvalidThreshold";
        case ErrorCode::LastValidatorRemoval:
            return "LastValidatorRemoval";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::AlreadyExists:
            return "AlreadyExists";
        case ErrorCode::AuthError:
            return "AuthError";
        case ErrorCode::InternalError:
            return "InternalError";
        }
        return "Unknown";
    }

    std::shared_ptr<const Clock> system_clock()
    {
        static const auto clock = std::make_shared<SystemClock>();
        return clock;
    }

    std::string to_iso8601(Timestamp ts)
    {
        std::time_t secs = static_cast<std::time_t>(ts / 1000);
        auto ms = static_cast<int>(ts % 1000);

        std::tm tm_buf;
        gmtime_r(&secs, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec,
                           ms);
    }

    Result<double> parse_amount(std::string_view text)
    {
        if (text.empty())
            return std::unexpected(CosignError::invalid_input("amount must not be empty"));

        std::size_t dots = 0;
        for (char c : text)
        {
            if (c == '.')
                ++dots;
            else if (c < '0' || c > '9')
                return std::unexpected(CosignError::invalid_input(std::format("invalid amount: {}", text)));
        }
        if (dots > 1 || text.front() == '.' || text.back() == '.')
            return std::unexpected(CosignError::invalid_input(std::format("invalid amount: {}", text)));

        double value = 0.0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size())
            return std::unexpected(CosignError::invalid_input(std::format("invalid amount: {}", text)));
        return value;
    }

} // namespace cosign
