#pragma once
#include <string>
#include <variant>

namespace memvault::core::errors {

    // 1. Typed failure kinds, one per way a memory command can go wrong
    enum class ErrorKind {
        InvalidArgument, // Malformed command or flag
        InvalidPath,     // Outside the sandbox or missing the virtual prefix
        NotFound,
        AlreadyExists,
        IsADirectory,
        NotADirectory,
        NoMatch,         // str_replace found nothing
        AmbiguousMatch,  // str_replace found more than one occurrence
        LineOutOfRange,
        Io               // Permission denied, disk full, ...
    };

    // The standardized error payload. Messages only ever name virtual paths.
    struct MemoryError {
            ErrorKind kind;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a MemoryError.
    template <typename T>
    using Result = std::variant<T, MemoryError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<MemoryError>(result);
    }

    template <typename T>
    const MemoryError& get_error(const Result<T>& result) {
        return std::get<MemoryError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::InvalidArgument: return "invalid_argument";
            case ErrorKind::InvalidPath:     return "invalid_path";
            case ErrorKind::NotFound:        return "not_found";
            case ErrorKind::AlreadyExists:   return "already_exists";
            case ErrorKind::IsADirectory:    return "is_a_directory";
            case ErrorKind::NotADirectory:   return "not_a_directory";
            case ErrorKind::NoMatch:         return "no_match";
            case ErrorKind::AmbiguousMatch:  return "ambiguous_match";
            case ErrorKind::LineOutOfRange:  return "line_out_of_range";
            case ErrorKind::Io:              return "io_error";
            default: return "unknown";
        }
    }

} // namespace memvault::core::errors
