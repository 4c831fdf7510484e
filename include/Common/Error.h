#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include "SourceLocation.h"

namespace FJS {
namespace Common {

enum class ErrorLevel {
    Note,
    Warning,
    Error,
    Fatal
};

enum class ErrorCode {
    // Lexer errors (1000-1999)
    UnexpectedCharacter = 1000,
    UnterminatedString,
    UnterminatedComment,
    InvalidNumberLiteral,

    // Parser errors (2000-2999)
    UnexpectedToken = 2000,
    ExpectedToken,
    InvalidSyntax,
    UnsupportedSyntax,

    // Structural errors raised by the validator (3000-3499)
    DuplicateDeclaration = 3000,
    MissingBuildMethod,
    MissingStateClass,
    CircularComponentDependency,

    // Structural warnings raised by the validator (3500-3999)
    RedundantDefault = 3500,
    UnknownType,
    OrphanedStateHolder,
    MissingDispose,
    UndisposedController,
    MissingNotifyListeners,
    DuplicateImport,
    DeferredImport,

    // Per-file and cache failures (4000-4999)
    ParseFailure = 4000,
    ExtractionFailure,
    CacheReadFailure,
    CacheWriteFailure,

    // Project-level errors (5000-5999)
    ProjectRootNotFound = 5000,
    ManifestNotFound,
    CircularImport,
    FileNotFound,
    IOError,
    InternalError
};

class Error {
public:
    ErrorLevel level;
    ErrorCode code;
    std::string message;
    SourceLocation location;
    std::string sourceSnippet; // The offending source line, when known

    Error(ErrorLevel lvl, ErrorCode c, const std::string& msg, const SourceLocation& loc)
        : level(lvl), code(c), message(msg), location(loc) {}

    std::string toString() const;
    std::string getLevelString() const;
    std::string getColorCode() const;
};

class ErrorReporter {
private:
    std::vector<Error> errors;
    bool hasErrors_;
    bool hasWarnings_;

public:
    ErrorReporter() : hasErrors_(false), hasWarnings_(false) {}

    void reportError(ErrorCode code, const std::string& message, const SourceLocation& loc);
    void reportWarning(ErrorCode code, const std::string& message, const SourceLocation& loc);
    void reportNote(const std::string& message, const SourceLocation& loc);

    bool hasErrors() const { return hasErrors_; }
    bool hasWarnings() const { return hasWarnings_; }
    const std::vector<Error>& getErrors() const { return errors; }

    // First error-level diagnostic rendered without color, empty if none
    std::string firstErrorMessage() const;

    void printErrors() const;
    void clear();
};

/**
 * Unrecoverable project-level failure (missing root, missing manifest,
 * circular imports). Aborts the analysis pipeline.
 */
class FatalError : public std::runtime_error {
public:
    FatalError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

std::string errorCodeName(ErrorCode code);

} // namespace Common
} // namespace FJS
