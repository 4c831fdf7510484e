#include "Parser/SourceParser.h"
#include "Parser/Parser.h"
#include "Lexer/Lexer.h"
#include "Utils/FileUtils.h"
#include <stdexcept>

namespace FJS {
namespace Parser {

bool ParseResult::hasErrors() const {
    if (!unit) return true;
    for (const auto& diagnostic : diagnostics) {
        if (diagnostic.level == Common::ErrorLevel::Error || diagnostic.level == Common::ErrorLevel::Fatal) {
            return true;
        }
    }
    return false;
}

std::string ParseResult::firstError() const {
    for (const auto& diagnostic : diagnostics) {
        if (diagnostic.level == Common::ErrorLevel::Error || diagnostic.level == Common::ErrorLevel::Fatal) {
            return diagnostic.location.toString() + ": " + diagnostic.message;
        }
    }
    return unit ? "" : "no compilation unit";
}

ParseResult DartSourceParser::parseFile(const std::string& path) {
    std::string source;
    try {
        source = Utils::FileUtils::readFile(path);
    } catch (const std::runtime_error& e) {
        ParseResult result;
        result.diagnostics.emplace_back(Common::ErrorLevel::Error, Common::ErrorCode::IOError, e.what(),
                                        Common::SourceLocation(path, 1, 1, 0));
        return result;
    }
    return parseSource(source, path);
}

ParseResult DartSourceParser::parseSource(const std::string& source, const std::string& path) {
    Common::ErrorReporter reporter;
    ParseResult result;

    Lexer::Lexer lexer(source, path, reporter);
    auto tokens = lexer.tokenize();

    Parser parser(tokens, path, reporter);
    result.unit = parser.parse();
    result.diagnostics = reporter.getErrors();
    return result;
}

} // namespace Parser
} // namespace FJS
