#pragma once

#include <stdexcept>
#include <string>

namespace lineage {

/**
 * Structured error reporting for lineage runs.
 *
 * Only conditions that make the whole run useless are raised as exceptions.
 * Per-table and per-file problems (unreadable files, cycles, budget overruns)
 * are logged and reported in results instead.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Corpus errors
    CORPUS_NOT_FOUND = 100,
    EMPTY_CORPUS = 101,
    NO_TARGETS = 102,

    // I/O errors
    FILE_NOT_FOUND = 300,
    FILE_READ_FAILED = 301,
    OUTPUT_FAILED = 302,

    // Input format errors
    MALFORMED_INPUT = 400,

    INTERNAL_ERROR = 500
};

class LineageException : public std::runtime_error {
public:
    explicit LineageException(ErrorCode code, const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Lineage error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public LineageException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : LineageException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class CorpusError : public LineageException {
public:
    explicit CorpusError(ErrorCode code, const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : LineageException(code, message, context, suggestion) {}
};

class IOError : public LineageException {
public:
    explicit IOError(ErrorCode code, const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : LineageException(code, message, context, suggestion) {}
};

// True for conditions that abort a run (as opposed to bad invocation)
inline bool is_fatal_run_error(ErrorCode code) {
    return code == ErrorCode::CORPUS_NOT_FOUND ||
           code == ErrorCode::EMPTY_CORPUS ||
           code == ErrorCode::NO_TARGETS ||
           code == ErrorCode::OUTPUT_FAILED;
}

// Process exit status for an error that ends a CLI command: 2 for a fatal
// run condition, 1 for bad invocation
inline int exit_status(ErrorCode code) {
    return is_fatal_run_error(code) ? 2 : 1;
}

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw LineageException(code, message, context, suggestion);
        }
    }
};

#define LINEAGE_CHECK(condition, code, message) \
    lineage::ErrorHandler::check_condition(condition, code, message, __func__)

#define LINEAGE_CHECK_ARGUMENT(condition, message) \
    LINEAGE_CHECK(condition, lineage::ErrorCode::INVALID_ARGUMENT, message)

#define LINEAGE_THROW(code, message) \
    throw lineage::LineageException(code, message, __func__)

#define LINEAGE_THROW_INVALID_ARG(message) \
    throw lineage::InvalidArgumentError(message, __func__)

} // namespace lineage
