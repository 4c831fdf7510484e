#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <stdexcept>
#include "AnalysisContext.h"
#include "BodyConverter.h"
#include "../Parser/AST.h"
#include "../Parser/SourceParser.h"
#include "../IR/Declarations.h"
#include "../Common/Error.h"

namespace FJS {
namespace Analysis {

// A file that cannot be turned into a FileDeclaration
class ExtractionError : public std::runtime_error {
public:
    ExtractionError(Common::ErrorCode code, const std::string& file, const std::string& message)
        : std::runtime_error(message), code_(code), file_(file) {}

    Common::ErrorCode code() const { return code_; }
    const std::string& file() const { return file_; }

private:
    Common::ErrorCode code_;
    std::string file_;
};

/**
 * Per-file IR extraction. Classifies each top-level type by walking its
 * supertype chain (same-file declarations first, then the registry):
 *   StatelessWidget root -> stateless ComponentDeclaration
 *   StatefulWidget root  -> stateful ComponentDeclaration
 *   State<X>             -> StateHolderDeclaration bound to X
 *   anything else        -> PlainTypeDeclaration
 * Bodies are lowered to the statement/expression IR and build methods get a
 * reconstructed component tree.
 */
class DeclarationExtractor {
public:
    explicit DeclarationExtractor(const AnalysisContext& context);

    // Throws ExtractionError when the parse produced errors
    IR::FileDeclaration extract(const Parser::ParseResult& parsed);
    IR::FileDeclaration extract(const Parser::CompilationUnit& unit);

    // Tree rooted at an instance creation, or nullopt for any other expression
    static std::optional<IR::ComponentNode> buildComponentTree(const IR::ExprRef& expression,
                                                               const std::string& slot = "");

    // First instance creation reached in pre-order, or null
    static const IR::InstanceCreationExpr* firstInstanceCreation(const IR::ExprRef& expression);

private:
    enum class Role {
        None,
        StatelessComponent,
        StatefulComponent,
        StateHolder
    };

    const AnalysisContext& context_;
    BodyConverter converter_;

    // Supertype base names of the classes declared in the file being extracted
    std::map<std::string, std::string> localSupertypes_;

    Role resolveRole(const std::string& superName) const;

    void extractClass(const Parser::ClassDecl& decl, IR::FileDeclaration& out);
    IR::ComponentDeclaration extractComponent(const Parser::ClassDecl& decl, IR::ComponentKind kind);
    IR::StateHolderDeclaration extractStateHolder(const Parser::ClassDecl& decl, const std::string& componentName);
    IR::PlainTypeDeclaration extractPlainType(const Parser::ClassDecl& decl);
    IR::PlainTypeDeclaration extractMixin(const Parser::MixinDecl& decl);
    IR::PlainTypeDeclaration extractEnum(const Parser::EnumDecl& decl);
    IR::PlainTypeDeclaration extractTypedef(const Parser::TypedefDecl& decl);
    IR::PlainTypeDeclaration extractExtension(const Parser::ExtensionDecl& decl);

    void extractMembers(const std::vector<std::unique_ptr<Parser::ClassMember>>& members,
                        std::vector<IR::FieldDeclaration>& fields,
                        std::vector<IR::ConstructorDeclaration>& constructors,
                        std::vector<IR::FunctionDeclaration>& methods);

    std::vector<IR::FieldDeclaration> convertFields(const Parser::FieldDecl& decl);
    IR::ConstructorDeclaration convertConstructor(const Parser::ConstructorDecl& decl);
    IR::FunctionDeclaration convertFunction(const Parser::MethodDecl& decl, bool topLevel);
    IR::BuildDeclaration convertBuild(const IR::FunctionDeclaration& function);

    std::vector<IR::PropertyDeclaration> mergeProperties(const std::vector<IR::FieldDeclaration>& fields,
                                                         const std::vector<IR::ConstructorDeclaration>& constructors) const;

    static std::string stateFactoryTarget(const IR::FunctionDeclaration& createState);
    static bool isControllerField(const IR::FieldDeclaration& field);
    static std::vector<std::string> typeNames(const std::vector<Parser::TypeAnnotation>& types);
    static std::vector<std::string> typeParameterNames(const std::vector<Parser::TypeParameter>& parameters);
};

} // namespace Analysis
} // namespace FJS
