#pragma once
#include <memory>
#include <string>
#include <vector>
#include "AST.h"
#include "../Common/Error.h"

namespace FJS {
namespace Parser {

struct ParseResult {
    std::unique_ptr<CompilationUnit> unit;  // Null when the file could not be read
    std::vector<Common::Error> diagnostics;

    bool hasErrors() const;
    std::string firstError() const;
};

/**
 * Frontend seam used by the project analyzer. Implementations must be safe
 * to call from several worker threads at once.
 */
class ISourceParser {
public:
    virtual ~ISourceParser() = default;

    virtual ParseResult parseFile(const std::string& path) = 0;
    virtual ParseResult parseSource(const std::string& source, const std::string& path) = 0;
};

// Lexer + Parser pipeline for Dart sources; holds no state between calls
class DartSourceParser : public ISourceParser {
public:
    ParseResult parseFile(const std::string& path) override;
    ParseResult parseSource(const std::string& source, const std::string& path) override;
};

} // namespace Parser
} // namespace FJS
