#include "Analysis/DeclarationExtractor.h"
#include "IR/IRWalker.h"
#include "IR/IRPrinter.h"
#include "Semantic/SymbolRegistry.h"
#include "Common/Debug.h"
#include <set>

namespace FJS {
namespace Analysis {

using Semantic::SymbolRegistry;

namespace {

// Named arguments whose instance-creation values are nested components
const std::set<std::string> kChildSlots = {
    "child", "children", "body", "appBar", "home", "title", "subtitle", "leading",
    "trailing", "content", "actions", "bottomNavigationBar", "floatingActionButton",
    "drawer", "endDrawer", "bottom", "bottomSheet", "flexibleSpace", "icon", "label",
    "header", "footer", "background", "secondary", "prefix", "suffix", "prefixIcon",
    "suffixIcon", "placeholder", "sliver", "slivers", "tabs"
};

IR::ExprRef stripParentheses(IR::ExprRef expression) {
    while (expression && expression->kind() == IR::ExprKind::Parenthesized) {
        expression = static_cast<const IR::ParenthesizedExpr&>(*expression).expression;
    }
    return expression;
}

class FirstCreationFinder : public IR::IRWalker {
public:
    using IR::IRWalker::visit;

    const IR::InstanceCreationExpr* found = nullptr;

    void visit(const IR::InstanceCreationExpr& node) override {
        if (!found) {
            found = &node;
        }
    }
};

// Return values of a build body: the expression body, top-level returns and
// returns directly under a top-level if/else
struct ReturnPath {
    std::string note;
    IR::ExprRef value;
};

void collectBranchReturns(const IR::StmtRef& branch, const std::string& note, std::vector<ReturnPath>& out) {
    if (!branch) return;
    if (branch->kind() == IR::StmtKind::Return) {
        out.push_back({note, static_cast<const IR::ReturnStmt&>(*branch).value});
        return;
    }
    if (branch->kind() == IR::StmtKind::Block) {
        for (const auto& statement : static_cast<const IR::BlockStmt&>(*branch).statements) {
            if (statement && statement->kind() == IR::StmtKind::Return) {
                out.push_back({note, static_cast<const IR::ReturnStmt&>(*statement).value});
            }
        }
    }
}

} // anonymous namespace

DeclarationExtractor::DeclarationExtractor(const AnalysisContext& context)
    : context_(context),
      converter_([&context](const std::string& name) { return context.registry.isRegistered(name); }) {}

IR::FileDeclaration DeclarationExtractor::extract(const Parser::ParseResult& parsed) {
    if (parsed.hasErrors()) {
        throw ExtractionError(Common::ErrorCode::ParseFailure, context_.file, parsed.firstError());
    }
    return extract(*parsed.unit);
}

IR::FileDeclaration DeclarationExtractor::extract(const Parser::CompilationUnit& unit) {
    IR::FileDeclaration result;
    result.file = context_.file;
    result.libraryName = unit.libraryName;

    for (const auto& directive : unit.imports) {
        IR::ImportRecord record;
        record.uri = directive.uri;
        record.prefix = directive.prefix;
        record.isDeferred = directive.isDeferred;
        record.show = directive.show;
        record.hide = directive.hide;
        record.location = directive.location;
        result.imports.push_back(std::move(record));
    }
    for (const auto& directive : unit.exports) {
        result.exports.push_back(directive.uri);
    }
    result.parts = unit.parts;

    localSupertypes_.clear();
    for (const auto& decl : unit.declarations) {
        if (decl->kind() != Parser::DeclarationKind::Class) continue;
        const auto& classDecl = static_cast<const Parser::ClassDecl&>(*decl);
        if (classDecl.superclass) {
            localSupertypes_[classDecl.name] = SymbolRegistry::baseTypeName(classDecl.superclass->name);
        }
    }

    for (const auto& decl : unit.declarations) {
        if (decl->name.empty() && decl->kind() != Parser::DeclarationKind::Extension) {
            throw ExtractionError(Common::ErrorCode::ExtractionFailure, context_.file,
                                  "Unnamed declaration at " + decl->location.toString());
        }

        switch (decl->kind()) {
            case Parser::DeclarationKind::Class:
                extractClass(static_cast<const Parser::ClassDecl&>(*decl), result);
                break;
            case Parser::DeclarationKind::Mixin:
                result.plainTypes.push_back(extractMixin(static_cast<const Parser::MixinDecl&>(*decl)));
                break;
            case Parser::DeclarationKind::Enum:
                result.plainTypes.push_back(extractEnum(static_cast<const Parser::EnumDecl&>(*decl)));
                break;
            case Parser::DeclarationKind::Typedef:
                result.plainTypes.push_back(extractTypedef(static_cast<const Parser::TypedefDecl&>(*decl)));
                break;
            case Parser::DeclarationKind::Extension:
                result.plainTypes.push_back(extractExtension(static_cast<const Parser::ExtensionDecl&>(*decl)));
                break;
            case Parser::DeclarationKind::Function: {
                const auto& functionDecl = static_cast<const Parser::FunctionDecl&>(*decl);
                IR::FunctionDeclaration function = convertFunction(*functionDecl.function, true);
                function.annotations.insert(function.annotations.begin(),
                                            functionDecl.annotations.begin(), functionDecl.annotations.end());
                result.functions.push_back(std::move(function));
                break;
            }
            case Parser::DeclarationKind::Variable: {
                const auto& variableDecl = static_cast<const Parser::TopLevelVariableDecl&>(*decl);
                for (auto& field : convertFields(*variableDecl.variables)) {
                    result.topLevelVariables.push_back(std::move(field));
                }
                break;
            }
        }
    }

    DEBUG_OUT("[extract] " << context_.file << ": " << result.components.size() << " components, "
              << result.stateHolders.size() << " state holders, "
              << result.plainTypes.size() << " types" << std::endl);
    return result;
}

//==============================================================================
// Classification
//==============================================================================

DeclarationExtractor::Role DeclarationExtractor::resolveRole(const std::string& superName) const {
    std::set<std::string> visited;
    std::string name = superName;

    while (!name.empty() && visited.insert(name).second) {
        if (name == "StatelessWidget") return Role::StatelessComponent;
        if (name == "StatefulWidget") return Role::StatefulComponent;
        if (name == "State") return Role::StateHolder;

        auto local = localSupertypes_.find(name);
        if (local != localSupertypes_.end()) {
            name = local->second;
            continue;
        }

        auto descriptor = context_.registry.lookup(name);
        if (!descriptor) break;
        if (descriptor->isStatelessComponent) return Role::StatelessComponent;
        if (descriptor->isStatefulComponent) return Role::StatefulComponent;
        if (descriptor->isStateHolder) return Role::StateHolder;
        name = descriptor->superType;
    }
    return Role::None;
}

void DeclarationExtractor::extractClass(const Parser::ClassDecl& decl, IR::FileDeclaration& out) {
    if (!decl.superclass) {
        out.plainTypes.push_back(extractPlainType(decl));
        return;
    }

    std::string superName = SymbolRegistry::baseTypeName(decl.superclass->name);
    switch (resolveRole(superName)) {
        case Role::StatelessComponent:
            out.components.push_back(extractComponent(decl, IR::ComponentKind::Stateless));
            break;
        case Role::StatefulComponent:
            out.components.push_back(extractComponent(decl, IR::ComponentKind::Stateful));
            break;
        case Role::StateHolder: {
            std::string componentName;
            if (!decl.superclass->arguments.empty()) {
                componentName = SymbolRegistry::baseTypeName(decl.superclass->arguments.front().name);
            }
            out.stateHolders.push_back(extractStateHolder(decl, componentName));
            break;
        }
        case Role::None:
            out.plainTypes.push_back(extractPlainType(decl));
            break;
    }
}

//==============================================================================
// Components and state holders
//==============================================================================

IR::ComponentDeclaration DeclarationExtractor::extractComponent(const Parser::ClassDecl& decl,
                                                                IR::ComponentKind kind) {
    IR::ComponentDeclaration component;
    component.id = IR::makeDeclarationId(context_.file, decl.name);
    component.name = decl.name;
    component.kind = kind;
    component.file = context_.file;
    component.superType = SymbolRegistry::baseTypeName(decl.superclass->name);
    component.mixins = typeNames(decl.mixins);
    component.interfaces = typeNames(decl.interfaces);
    component.location = decl.location;

    std::vector<IR::FieldDeclaration> fields;
    std::vector<IR::FunctionDeclaration> methods;
    extractMembers(decl.members, fields, component.constructors, methods);

    for (auto& method : methods) {
        if (method.kind == IR::FunctionKind::Method && !method.isStatic &&
            method.name == "build" && method.parameters.size() == 1) {
            component.build = convertBuild(method);
        } else if (method.name == "createState" && kind == IR::ComponentKind::Stateful) {
            component.stateHolderName = stateFactoryTarget(method);
            component.methods.push_back(std::move(method));
        } else {
            component.methods.push_back(std::move(method));
        }
    }

    component.properties = mergeProperties(fields, component.constructors);
    return component;
}

IR::StateHolderDeclaration DeclarationExtractor::extractStateHolder(const Parser::ClassDecl& decl,
                                                                    const std::string& componentName) {
    IR::StateHolderDeclaration holder;
    holder.id = IR::makeDeclarationId(context_.file, decl.name);
    holder.name = decl.name;
    holder.file = context_.file;
    holder.componentName = componentName;
    holder.mixins = typeNames(decl.mixins);
    holder.location = decl.location;

    std::vector<IR::ConstructorDeclaration> constructors;
    std::vector<IR::FunctionDeclaration> methods;
    extractMembers(decl.members, holder.fields, constructors, methods);

    for (auto& method : methods) {
        bool lifecycle = method.kind == IR::FunctionKind::Method && !method.isStatic;
        if (lifecycle && method.name == "initState") {
            holder.initState = std::move(method);
        } else if (lifecycle && method.name == "dispose") {
            holder.dispose = std::move(method);
        } else if (lifecycle && method.name == "didUpdateWidget") {
            holder.didUpdateWidget = std::move(method);
        } else if (lifecycle && method.name == "didChangeDependencies") {
            holder.didChangeDependencies = std::move(method);
        } else if (lifecycle && method.name == "build" && method.parameters.size() == 1) {
            holder.build = convertBuild(method);
        } else {
            holder.methods.push_back(std::move(method));
        }
    }

    for (const auto& field : holder.fields) {
        if (isControllerField(field)) {
            holder.controllers.push_back(field.name);
        }
    }
    return holder;
}

std::vector<IR::PropertyDeclaration> DeclarationExtractor::mergeProperties(
    const std::vector<IR::FieldDeclaration>& fields,
    const std::vector<IR::ConstructorDeclaration>& constructors) const {
    // Unnamed constructor first, then the others in declaration order
    std::vector<const IR::ConstructorDeclaration*> ordered;
    for (const auto& ctor : constructors) {
        if (ctor.name.empty()) ordered.push_back(&ctor);
    }
    for (const auto& ctor : constructors) {
        if (!ctor.name.empty()) ordered.push_back(&ctor);
    }

    std::vector<IR::PropertyDeclaration> properties;
    for (const auto& field : fields) {
        if (field.isStatic) continue;

        IR::PropertyDeclaration property;
        property.name = field.name;
        property.typeName = field.typeName;
        property.isFinal = field.isFinal;
        property.location = field.location;

        const IR::ParameterDeclaration* parameter = nullptr;
        for (const auto* ctor : ordered) {
            for (const auto& candidate : ctor->parameters) {
                if (candidate.name == field.name && !candidate.isSuperFormal) {
                    parameter = &candidate;
                    break;
                }
            }
            if (parameter) break;
        }

        if (parameter) {
            property.isRequired = parameter->isRequired;
            property.isNamed = parameter->isNamed;
            property.defaultValue = parameter->defaultValue;
            if (property.typeName.empty()) {
                property.typeName = parameter->typeName;
            }
        }
        properties.push_back(std::move(property));
    }
    return properties;
}

std::string DeclarationExtractor::stateFactoryTarget(const IR::FunctionDeclaration& createState) {
    IR::ExprRef returned;
    if (createState.expressionBody) {
        returned = createState.expressionBody;
    } else if (createState.body && createState.body->kind() == IR::StmtKind::Block) {
        const auto& block = static_cast<const IR::BlockStmt&>(*createState.body);
        if (block.statements.size() == 1 && block.statements.front()->kind() == IR::StmtKind::Return) {
            returned = static_cast<const IR::ReturnStmt&>(*block.statements.front()).value;
        }
    }

    const IR::InstanceCreationExpr* creation = firstInstanceCreation(returned);
    return creation ? SymbolRegistry::baseTypeName(creation->typeName) : "";
}

bool DeclarationExtractor::isControllerField(const IR::FieldDeclaration& field) {
    if (field.isStatic) return false;

    auto isControllerType = [](const std::string& typeName) {
        std::string base = SymbolRegistry::baseTypeName(typeName);
        static const std::string suffix = "Controller";
        return base == "FocusNode" ||
               (base.size() >= suffix.size() &&
                base.compare(base.size() - suffix.size(), suffix.size(), suffix) == 0);
    };

    if (!field.typeName.empty()) {
        return isControllerType(field.typeName);
    }
    IR::ExprRef initializer = stripParentheses(field.initializer);
    // AnimationController(vsync: this)..repeat()
    if (initializer && initializer->kind() == IR::ExprKind::Cascade) {
        initializer = stripParentheses(static_cast<const IR::CascadeExpr&>(*initializer).target);
    }
    if (initializer && initializer->kind() == IR::ExprKind::InstanceCreation) {
        return isControllerType(static_cast<const IR::InstanceCreationExpr&>(*initializer).typeName);
    }
    return false;
}

//==============================================================================
// Build methods and component trees
//==============================================================================

IR::BuildDeclaration DeclarationExtractor::convertBuild(const IR::FunctionDeclaration& function) {
    IR::BuildDeclaration build;
    build.contextName = function.parameters.empty() ? "" : function.parameters.front().name;
    build.body = function.body;
    build.expressionBody = function.expressionBody;
    build.location = function.location;

    std::vector<ReturnPath> returns;
    if (function.expressionBody) {
        returns.push_back({"", function.expressionBody});
    } else if (function.body && function.body->kind() == IR::StmtKind::Block) {
        for (const auto& statement : static_cast<const IR::BlockStmt&>(*function.body).statements) {
            if (!statement) continue;
            if (statement->kind() == IR::StmtKind::Return) {
                returns.push_back({"", static_cast<const IR::ReturnStmt&>(*statement).value});
            } else if (statement->kind() == IR::StmtKind::If) {
                const auto& ifStmt = static_cast<const IR::IfStmt&>(*statement);
                std::string condition = IR::IRPrinter::print(ifStmt.condition);
                collectBranchReturns(ifStmt.thenBranch, "if (" + condition + ")", returns);
                collectBranchReturns(ifStmt.elseBranch, "else of if (" + condition + ")", returns);
            }
        }
    }

    // A single conditional expression splits into its two branches
    if (returns.size() == 1) {
        IR::ExprRef value = stripParentheses(returns.front().value);
        if (value && value->kind() == IR::ExprKind::Conditional) {
            const auto& conditional = static_cast<const IR::ConditionalExpr&>(*value);
            std::string condition = IR::IRPrinter::print(conditional.condition);
            returns = {
                {"when " + condition, conditional.thenExpr},
                {"unless " + condition, conditional.elseExpr}
            };
        }
    }

    if (returns.size() == 1) {
        build.tree = buildComponentTree(returns.front().value);
        return build;
    }

    for (const auto& path : returns) {
        auto tree = buildComponentTree(path.value);
        if (!tree) continue;
        if (!path.note.empty()) {
            build.conditionalNotes.push_back(path.note + " -> " + tree->typeName);
        }
        build.alternatives.push_back(std::move(*tree));
    }
    if (!build.alternatives.empty()) {
        build.tree = build.alternatives.front();
    }
    return build;
}

std::optional<IR::ComponentNode> DeclarationExtractor::buildComponentTree(const IR::ExprRef& expression,
                                                                         const std::string& slot) {
    IR::ExprRef value = stripParentheses(expression);
    if (!value || value->kind() != IR::ExprKind::InstanceCreation) {
        return std::nullopt;
    }
    const auto& creation = static_cast<const IR::InstanceCreationExpr&>(*value);

    IR::ComponentNode node;
    node.typeName = creation.typeName;
    node.constructorName = creation.constructorName;
    node.isConst = creation.isConst;
    node.slot = slot;

    for (size_t i = 0; i < creation.arguments.size(); ++i) {
        const auto& argument = creation.arguments[i];
        std::string name = argument.isNamed() ? argument.name : std::to_string(i);

        if (argument.isNamed() && kChildSlots.count(argument.name) > 0) {
            size_t before = node.children.size();
            std::vector<IR::ExprRef> pending = {argument.value};
            while (!pending.empty()) {
                IR::ExprRef current = stripParentheses(pending.front());
                pending.erase(pending.begin());
                if (!current) continue;

                switch (current->kind()) {
                    case IR::ExprKind::InstanceCreation:
                        if (auto child = buildComponentTree(current, argument.name)) {
                            node.children.push_back(std::move(*child));
                        }
                        break;
                    case IR::ExprKind::Conditional: {
                        const auto& conditional = static_cast<const IR::ConditionalExpr&>(*current);
                        pending.push_back(conditional.thenExpr);
                        pending.push_back(conditional.elseExpr);
                        break;
                    }
                    case IR::ExprKind::CollectionLiteral:
                        for (const auto& element : static_cast<const IR::CollectionLiteralExpr&>(*current).elements) {
                            pending.push_back(element);
                        }
                        break;
                    case IR::ExprKind::IfElement: {
                        const auto& ifElement = static_cast<const IR::IfElementExpr&>(*current);
                        pending.push_back(ifElement.thenElement);
                        pending.push_back(ifElement.elseElement);
                        break;
                    }
                    case IR::ExprKind::ForElement:
                        pending.push_back(static_cast<const IR::ForElementExpr&>(*current).body);
                        break;
                    default:
                        break;
                }
            }
            if (node.children.size() > before) {
                continue;
            }
        }

        node.properties.emplace_back(name, IR::IRPrinter::print(argument.value));
    }
    return node;
}

const IR::InstanceCreationExpr* DeclarationExtractor::firstInstanceCreation(const IR::ExprRef& expression) {
    if (!expression) return nullptr;
    FirstCreationFinder finder;
    finder.walk(expression);
    return finder.found;
}

//==============================================================================
// Plain types
//==============================================================================

IR::PlainTypeDeclaration DeclarationExtractor::extractPlainType(const Parser::ClassDecl& decl) {
    IR::PlainTypeDeclaration type;
    type.id = IR::makeDeclarationId(context_.file, decl.name);
    type.name = decl.name;
    type.file = context_.file;
    type.kind = decl.isAbstract ? Semantic::TypeKind::AbstractClass : Semantic::TypeKind::Class;
    type.superType = decl.superclass ? decl.superclass->toString() : "";
    type.interfaces = typeNames(decl.interfaces);
    type.mixins = typeNames(decl.mixins);
    type.typeParameters = typeParameterNames(decl.typeParameters);
    type.location = decl.location;
    extractMembers(decl.members, type.fields, type.constructors, type.methods);
    return type;
}

IR::PlainTypeDeclaration DeclarationExtractor::extractMixin(const Parser::MixinDecl& decl) {
    IR::PlainTypeDeclaration type;
    type.id = IR::makeDeclarationId(context_.file, decl.name);
    type.name = decl.name;
    type.file = context_.file;
    type.kind = Semantic::TypeKind::Mixin;
    if (!decl.onTypes.empty()) {
        type.superType = decl.onTypes.front().toString();
    }
    type.interfaces = typeNames(decl.interfaces);
    type.typeParameters = typeParameterNames(decl.typeParameters);
    type.location = decl.location;
    extractMembers(decl.members, type.fields, type.constructors, type.methods);
    return type;
}

IR::PlainTypeDeclaration DeclarationExtractor::extractEnum(const Parser::EnumDecl& decl) {
    IR::PlainTypeDeclaration type;
    type.id = IR::makeDeclarationId(context_.file, decl.name);
    type.name = decl.name;
    type.file = context_.file;
    type.kind = Semantic::TypeKind::Enum;
    type.interfaces = typeNames(decl.interfaces);
    type.mixins = typeNames(decl.mixins);
    type.enumValues = decl.values;
    type.location = decl.location;
    extractMembers(decl.members, type.fields, type.constructors, type.methods);
    return type;
}

IR::PlainTypeDeclaration DeclarationExtractor::extractTypedef(const Parser::TypedefDecl& decl) {
    IR::PlainTypeDeclaration type;
    type.id = IR::makeDeclarationId(context_.file, decl.name);
    type.name = decl.name;
    type.file = context_.file;
    type.kind = Semantic::TypeKind::TypeAlias;
    type.typeParameters = typeParameterNames(decl.typeParameters);
    type.aliasedType = decl.aliasedType.toString();
    type.location = decl.location;
    return type;
}

IR::PlainTypeDeclaration DeclarationExtractor::extractExtension(const Parser::ExtensionDecl& decl) {
    IR::PlainTypeDeclaration type;
    type.extendedType = decl.extendedType.toString();
    // Unnamed extensions are keyed by the type they extend
    type.name = decl.name.empty() ? "extension on " + type.extendedType : decl.name;
    type.id = IR::makeDeclarationId(context_.file, type.name);
    type.file = context_.file;
    type.kind = Semantic::TypeKind::Extension;
    type.typeParameters = typeParameterNames(decl.typeParameters);
    type.location = decl.location;
    extractMembers(decl.members, type.fields, type.constructors, type.methods);
    return type;
}

//==============================================================================
// Members
//==============================================================================

void DeclarationExtractor::extractMembers(const std::vector<std::unique_ptr<Parser::ClassMember>>& members,
                                          std::vector<IR::FieldDeclaration>& fields,
                                          std::vector<IR::ConstructorDeclaration>& constructors,
                                          std::vector<IR::FunctionDeclaration>& methods) {
    for (const auto& member : members) {
        switch (member->kind()) {
            case Parser::MemberKind::Field:
                for (auto& field : convertFields(static_cast<const Parser::FieldDecl&>(*member))) {
                    fields.push_back(std::move(field));
                }
                break;
            case Parser::MemberKind::Constructor:
                constructors.push_back(convertConstructor(static_cast<const Parser::ConstructorDecl&>(*member)));
                break;
            case Parser::MemberKind::Method:
                methods.push_back(convertFunction(static_cast<const Parser::MethodDecl&>(*member), false));
                break;
        }
    }
}

std::vector<IR::FieldDeclaration> DeclarationExtractor::convertFields(const Parser::FieldDecl& decl) {
    std::vector<IR::FieldDeclaration> fields;
    for (const auto& variable : decl.variables) {
        IR::FieldDeclaration field;
        field.name = variable.name;
        field.typeName = decl.type ? decl.type->toString() : "";
        field.isFinal = decl.isFinal;
        field.isConst = decl.isConst;
        field.isLate = decl.isLate;
        field.isStatic = decl.isStatic;
        field.initializer = converter_.convert(variable.initializer.get());
        field.location = variable.location;
        fields.push_back(std::move(field));
    }
    return fields;
}

IR::ConstructorDeclaration DeclarationExtractor::convertConstructor(const Parser::ConstructorDecl& decl) {
    IR::ConstructorDeclaration ctor;
    ctor.name = decl.name;
    ctor.parameters = converter_.convertParameters(decl.parameters);
    ctor.isConst = decl.isConst;
    ctor.isFactory = decl.isFactory;
    ctor.location = decl.location;

    for (const auto& init : decl.initializers) {
        switch (init.kind) {
            case Parser::ConstructorInitializer::Kind::Field: {
                auto target = std::make_shared<IR::IdentifierExpr>();
                target->name = init.name;
                auto assignment = std::make_shared<IR::AssignmentExpr>();
                assignment->target = IR::ExprRef(target);
                assignment->op = "=";
                assignment->value = converter_.convert(init.value.get());
                ctor.initializers.push_back(IR::ExprRef(assignment));
                break;
            }
            case Parser::ConstructorInitializer::Kind::Super:
            case Parser::ConstructorInitializer::Kind::This: {
                auto call = std::make_shared<IR::CallExpr>();
                if (init.kind == Parser::ConstructorInitializer::Kind::Super) {
                    call->target = IR::ExprRef(std::make_shared<IR::SuperExpr>());
                } else {
                    call->target = IR::ExprRef(std::make_shared<IR::ThisExpr>());
                }
                call->method = init.name;
                call->arguments = converter_.convertArguments(init.arguments);
                ctor.initializers.push_back(IR::ExprRef(call));
                break;
            }
            case Parser::ConstructorInitializer::Kind::Assert: {
                auto call = std::make_shared<IR::CallExpr>();
                call->method = "assert";
                IR::Argument condition;
                condition.value = converter_.convert(init.value.get());
                call->arguments.push_back(std::move(condition));
                for (auto& argument : converter_.convertArguments(init.arguments)) {
                    call->arguments.push_back(std::move(argument));
                }
                ctor.initializers.push_back(IR::ExprRef(call));
                break;
            }
        }
    }

    if (decl.redirectTarget) {
        ctor.redirectTarget = decl.redirectTarget->toString();
    }
    if (decl.body) {
        ctor.body = converter_.convert(decl.body.get());
    } else if (decl.expressionBody) {
        // `factory Foo() => expr` is kept as `{ return expr; }`
        auto ret = std::make_shared<IR::ReturnStmt>();
        ret->value = converter_.convert(decl.expressionBody.get());
        auto block = std::make_shared<IR::BlockStmt>();
        block->statements.push_back(IR::StmtRef(ret));
        ctor.body = IR::StmtRef(block);
    }
    return ctor;
}

IR::FunctionDeclaration DeclarationExtractor::convertFunction(const Parser::MethodDecl& decl, bool topLevel) {
    IR::FunctionDeclaration function;
    function.name = decl.name;
    if (decl.isGetter) {
        function.kind = IR::FunctionKind::Getter;
    } else if (decl.isSetter) {
        function.kind = IR::FunctionKind::Setter;
    } else if (decl.isOperator) {
        function.kind = IR::FunctionKind::Operator;
    } else {
        function.kind = topLevel ? IR::FunctionKind::Function : IR::FunctionKind::Method;
    }
    function.returnType = decl.returnType ? decl.returnType->toString() : "";
    function.parameters = converter_.convertParameters(decl.parameters);
    function.typeParameters = decl.typeParameters;
    function.body = converter_.convert(decl.body.get());
    function.expressionBody = converter_.convert(decl.expressionBody.get());
    function.isAsync = decl.isAsync;
    function.isGenerator = decl.isGenerator;
    function.isStatic = !topLevel && decl.isStatic;
    function.isAbstract = decl.isAbstract() && !decl.isExternal;
    function.annotations = decl.annotations;
    function.location = decl.location;
    return function;
}

std::vector<std::string> DeclarationExtractor::typeNames(const std::vector<Parser::TypeAnnotation>& types) {
    std::vector<std::string> names;
    for (const auto& type : types) {
        names.push_back(type.toString());
    }
    return names;
}

std::vector<std::string> DeclarationExtractor::typeParameterNames(const std::vector<Parser::TypeParameter>& parameters) {
    std::vector<std::string> names;
    for (const auto& parameter : parameters) {
        names.push_back(parameter.name);
    }
    return names;
}

} // namespace Analysis
} // namespace FJS
