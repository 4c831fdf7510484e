#pragma once
#include <string>
#include <vector>
#include <set>
#include "../IR/ApplicationDeclaration.h"
#include "../Semantic/SymbolRegistry.h"
#include "../Common/Error.h"

namespace FJS {
namespace Analysis {

struct ValidationIssue {
    Common::ErrorCode code;
    std::string message;
    std::string file;
    Common::SourceLocation location;
    std::string declaration;  // Name of the declaration the issue is about

    std::string toString() const;
};

//==============================================================================
// VALIDATION RESULT
//
// Errors block code generation; warnings are advisory. The application is
// valid when no error was recorded.
//==============================================================================

struct ValidationResult {
    bool isValid = true;
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;

    void addError(ValidationIssue issue) {
        isValid = false;
        errors.push_back(std::move(issue));
    }

    void addWarning(ValidationIssue issue) {
        warnings.push_back(std::move(issue));
    }

    // Errors plus warnings carrying `code`
    size_t countOf(Common::ErrorCode code) const;

    std::string getSummary() const {
        if (isValid && warnings.empty()) return "Validation passed";
        if (isValid) return "Validation passed with " + std::to_string(warnings.size()) + " warnings";
        return "Validation failed: " + std::to_string(errors.size()) + " errors, " +
               std::to_string(warnings.size()) + " warnings";
    }
};

/**
 * Structural checks over a linked application. Every check runs
 * independently; none of them stops the others.
 */
class DeclarationValidator {
public:
    explicit DeclarationValidator(const Semantic::SymbolRegistry& registry);

    ValidationResult validate(const IR::ApplicationDeclaration& app) const;

    // Individual checks
    void checkDuplicates(const IR::ApplicationDeclaration& app, ValidationResult& result) const;
    void checkComponents(const IR::ApplicationDeclaration& app, ValidationResult& result) const;
    void checkProperties(const IR::ApplicationDeclaration& app, ValidationResult& result) const;
    void checkStateHolders(const IR::ApplicationDeclaration& app, ValidationResult& result) const;
    void checkObservables(const IR::ApplicationDeclaration& app, ValidationResult& result) const;
    void checkComponentCycles(const IR::ApplicationDeclaration& app, ValidationResult& result) const;
    void checkImports(const IR::ApplicationDeclaration& app, ValidationResult& result) const;

    // Zero parameters and a declared void return type
    static bool isAssumedMutator(const IR::FunctionDeclaration& function);

    // Every identifier-like name in a type: `Map<String, List<Item>>?` -> Map, String, List, Item
    static std::vector<std::string> referencedTypeNames(const std::string& typeName);

private:
    const Semantic::SymbolRegistry& registry_;

    bool isKnownType(const std::string& name) const;

    void findCycles(const IR::ComponentGraph& graph, const std::string& node,
                    std::set<std::string>& visited, std::set<std::string>& recStack,
                    std::vector<std::string>& path, std::vector<std::vector<std::string>>& cycles) const;
};

} // namespace Analysis
} // namespace FJS
