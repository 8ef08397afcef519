//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef PINCH_ERROR_HPP
#define PINCH_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error value carried by Result<T, Error>.
 *
 * Only the CLI treats an Error as fatal. Inside the graph builder a failed
 * record or resolution root is skipped and reported as a warning.
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace pinch {

    enum class ErrorCode {
        None,
        InvalidArgument,  ///< Bad CLI value or function argument
        NotFound,         ///< Scan root, records file or config file missing
        ParseError,       ///< Lockfile, records file or resolver output malformed
        IoError,          ///< Filesystem or process plumbing failed
        ConfigError,      ///< Config file rejected by validation
        ResolutionError,  ///< Package-manager command failed for one root
        InternalError
    };

    inline const char* error_code_to_string(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::ResolutionError: return "ResolutionError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Immutable error with a code, a message and an optional context,
     * usually the path or package identity involved.
     */
    class Error {
    public:
        using Context = std::optional<std::string>;

        Error(const ErrorCode code, std::string message, Context context = std::nullopt)
            : code_(code), message_(std::move(message)), context_(std::move(context)) {}

        static Error invalid_argument(std::string message, Context context = std::nullopt) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, Context context = std::nullopt) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error resolution_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ResolutionError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }
        [[nodiscard]] const std::string& message() const noexcept { return message_; }
        [[nodiscard]] const Context& context() const noexcept { return context_; }
        [[nodiscard]] bool has_context() const noexcept { return context_.has_value(); }

        /**
         * Copy with more context; existing context is kept in front,
         * separated by "; ".
         */
        [[nodiscard]] Error with_context(const std::string& more) const {
            return {code_, message_, context_ ? *context_ + "; " + more : more};
        }

        /**
         * "[Code] message" or "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string text = std::string("[") + error_code_to_string(code_) + "] " + message_;
            if (context_) {
                text += " (context: " + *context_ + ")";
            }
            return text;
        }

        bool operator==(const Error&) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        Context context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, const ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace pinch

#endif //PINCH_ERROR_HPP
