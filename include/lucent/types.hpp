#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace lucent
{

    /**
     * Error categories raised by the dispatch core.
     */
    enum class ErrorCode
    {
        RouteNotFound,
        HandlerResolution,
        MissingArgument,
        EntityNotFound,
        UnknownValidationRule,
        InvalidRule,
        InvalidInput,
        ConfigError,
        StorageError,
        ParsingError,
        InternalError
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::RouteNotFound:
            return "RouteNotFound";
        case ErrorCode::HandlerResolution:
            return "HandlerResolution";
        case ErrorCode::MissingArgument:
            return "MissingArgument";
        case ErrorCode::EntityNotFound:
            return "EntityNotFound";
        case ErrorCode::UnknownValidationRule:
            return "UnknownValidationRule";
        case ErrorCode::InvalidRule:
            return "InvalidRule";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::ParsingError:
            return "ParsingError";
        case ErrorCode::InternalError:
            return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Lucent error with code and message
     */
    class LucentError : public std::runtime_error
    {
    public:
        ErrorCode code;

        LucentError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static LucentError route_not_found(const std::string &msg)
        {
            return LucentError(ErrorCode::RouteNotFound, msg);
        }

        static LucentError handler_resolution(const std::string &msg)
        {
            return LucentError(ErrorCode::HandlerResolution, msg);
        }

        static LucentError missing_argument(const std::string &msg)
        {
            return LucentError(ErrorCode::MissingArgument, msg);
        }

        static LucentError entity_not_found(const std::string &msg)
        {
            return LucentError(ErrorCode::EntityNotFound, msg);
        }

        static LucentError unknown_rule(const std::string &msg)
        {
            return LucentError(ErrorCode::UnknownValidationRule, msg);
        }

        static LucentError invalid_rule(const std::string &msg)
        {
            return LucentError(ErrorCode::InvalidRule, msg);
        }

        static LucentError invalid_input(const std::string &msg)
        {
            return LucentError(ErrorCode::InvalidInput, msg);
        }

        static LucentError config(const std::string &msg)
        {
            return LucentError(ErrorCode::ConfigError, msg);
        }

        static LucentError storage(const std::string &msg)
        {
            return LucentError(ErrorCode::StorageError, msg);
        }

        static LucentError parsing(const std::string &msg)
        {
            return LucentError(ErrorCode::ParsingError, msg);
        }

        static LucentError internal(const std::string &msg)
        {
            return LucentError(ErrorCode::InternalError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, LucentError>;

} // namespace lucent
