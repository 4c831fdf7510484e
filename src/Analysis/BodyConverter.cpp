#include "Analysis/BodyConverter.h"
#include <cctype>
#include <set>

namespace FJS {
namespace Analysis {

namespace {

// Static helpers that look like named constructors but are not
const std::set<std::string> kStaticCallNames = {
    "of", "maybeOf", "push", "pushNamed", "pushReplacement", "pushReplacementNamed",
    "pushAndRemoveUntil", "pop", "maybePop", "canPop", "popUntil",
    "parse", "tryParse", "showSnackBar"
};

bool startsUpper(const std::string& name) {
    return !name.empty() && std::isupper(static_cast<unsigned char>(name[0]));
}

bool startsLower(const std::string& name) {
    return !name.empty() && std::islower(static_cast<unsigned char>(name[0]));
}

} // anonymous namespace

BodyConverter::BodyConverter(TypePredicate isKnownType)
    : isKnownType_(std::move(isKnownType)) {}

IR::ExprRef BodyConverter::convert(Parser::Expression* expression) {
    if (!expression) return nullptr;
    exprResult_ = nullptr;
    expression->accept(*this);
    IR::ExprRef result = exprResult_;
    exprResult_ = nullptr;
    return result;
}

IR::StmtRef BodyConverter::convert(Parser::Statement* statement) {
    if (!statement) return nullptr;
    stmtResult_ = nullptr;
    statement->accept(*this);
    IR::StmtRef result = stmtResult_;
    stmtResult_ = nullptr;
    return result;
}

bool BodyConverter::looksLikeTypeName(const std::string& name) const {
    size_t start = name.find_first_not_of('_');
    if (start != std::string::npos && std::isupper(static_cast<unsigned char>(name[start]))) {
        return true;
    }
    return isKnownType_ && isKnownType_(name);
}

std::vector<std::string> BodyConverter::typeStrings(const std::vector<Parser::TypeAnnotation>& types) {
    std::vector<std::string> result;
    result.reserve(types.size());
    for (const auto& type : types) {
        result.push_back(type.toString());
    }
    return result;
}

IR::ParameterDeclaration BodyConverter::convertParameter(const Parser::FormalParameter& parameter) {
    IR::ParameterDeclaration result;
    result.name = parameter.name;
    result.typeName = parameter.type ? parameter.type->toString() : "";
    result.isRequired = parameter.isRequired;
    result.isNamed = parameter.isNamed;
    result.isOptionalPositional = parameter.isOptionalPositional;
    result.isFieldFormal = parameter.isFieldFormal;
    result.isSuperFormal = parameter.isSuperFormal;
    result.defaultValue = convert(parameter.defaultValue.get());
    result.location = parameter.location;
    return result;
}

std::vector<IR::ParameterDeclaration> BodyConverter::convertParameters(
    const std::vector<Parser::FormalParameter>& parameters) {
    std::vector<IR::ParameterDeclaration> result;
    result.reserve(parameters.size());
    for (const auto& parameter : parameters) {
        result.push_back(convertParameter(parameter));
    }
    return result;
}

std::vector<IR::Argument> BodyConverter::convertArguments(const std::vector<Parser::Argument>& arguments) {
    std::vector<IR::Argument> result;
    result.reserve(arguments.size());
    for (const auto& argument : arguments) {
        IR::Argument converted;
        converted.name = argument.name;
        converted.value = convert(argument.value.get());
        result.push_back(std::move(converted));
    }
    return result;
}

//==============================================================================
// Expressions
//==============================================================================

void BodyConverter::visit(Parser::IntegerLiteralExpr& node) {
    auto n = std::make_shared<IR::LiteralExpr>();
    n->literalKind = IR::LiteralKind::Int;
    n->value = node.text;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::DoubleLiteralExpr& node) {
    auto n = std::make_shared<IR::LiteralExpr>();
    n->literalKind = IR::LiteralKind::Double;
    n->value = node.text;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::StringLiteralExpr& node) {
    auto n = std::make_shared<IR::LiteralExpr>();
    n->literalKind = IR::LiteralKind::String;
    n->value = node.value;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::StringInterpolationExpr& node) {
    auto n = std::make_shared<IR::StringInterpolationExpr>();
    for (auto& part : node.parts) {
        n->parts.push_back(convert(part.get()));
    }
    exprResult_ = n;
}

void BodyConverter::visit(Parser::BoolLiteralExpr& node) {
    auto n = std::make_shared<IR::LiteralExpr>();
    n->literalKind = IR::LiteralKind::Bool;
    n->value = node.value ? "true" : "false";
    exprResult_ = n;
}

void BodyConverter::visit(Parser::NullLiteralExpr&) {
    auto n = std::make_shared<IR::LiteralExpr>();
    n->literalKind = IR::LiteralKind::Null;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::IdentifierExpr& node) {
    auto n = std::make_shared<IR::IdentifierExpr>();
    n->name = node.name;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::ThisExpr&) {
    exprResult_ = std::make_shared<IR::ThisExpr>();
}

void BodyConverter::visit(Parser::SuperExpr&) {
    exprResult_ = std::make_shared<IR::SuperExpr>();
}

void BodyConverter::visit(Parser::BinaryExpr& node) {
    auto n = std::make_shared<IR::BinaryExpr>();
    n->left = convert(node.left.get());
    n->op = node.op;
    n->right = convert(node.right.get());
    exprResult_ = n;
}

void BodyConverter::visit(Parser::PrefixExpr& node) {
    auto n = std::make_shared<IR::UnaryExpr>();
    n->op = node.op;
    n->operand = convert(node.operand.get());
    n->isPrefix = true;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::PostfixExpr& node) {
    auto n = std::make_shared<IR::UnaryExpr>();
    n->op = node.op;
    n->operand = convert(node.operand.get());
    n->isPrefix = false;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::AssignmentExpr& node) {
    auto n = std::make_shared<IR::AssignmentExpr>();
    n->target = convert(node.target.get());
    n->op = node.op;
    n->value = convert(node.value.get());
    exprResult_ = n;
}

void BodyConverter::visit(Parser::ConditionalExpr& node) {
    auto n = std::make_shared<IR::ConditionalExpr>();
    n->condition = convert(node.condition.get());
    n->thenExpr = convert(node.thenExpr.get());
    n->elseExpr = convert(node.elseExpr.get());
    exprResult_ = n;
}

void BodyConverter::visit(Parser::PropertyAccessExpr& node) {
    auto n = std::make_shared<IR::PropertyAccessExpr>();
    n->target = convert(node.target.get());
    n->name = node.name;
    n->isNullAware = node.isNullAware;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::IndexExpr& node) {
    auto n = std::make_shared<IR::IndexExpr>();
    n->target = convert(node.target.get());
    n->index = convert(node.index.get());
    n->isNullAware = node.isNullAware;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::MethodInvocationExpr& node) {
    // Foo(...), _Foo<T>(...)
    if (!node.target && looksLikeTypeName(node.methodName)) {
        auto n = std::make_shared<IR::InstanceCreationExpr>();
        n->typeName = node.methodName;
        n->typeArguments = typeStrings(node.typeArguments);
        n->arguments = convertArguments(node.arguments);
        exprResult_ = n;
        return;
    }

    auto* targetName = dynamic_cast<Parser::IdentifierExpr*>(node.target.get());
    if (targetName && !node.isNullAware) {
        // EdgeInsets.all(8)
        if (looksLikeTypeName(targetName->name) && startsLower(node.methodName) &&
            node.typeArguments.empty() && kStaticCallNames.count(node.methodName) == 0) {
            auto n = std::make_shared<IR::InstanceCreationExpr>();
            n->typeName = targetName->name;
            n->constructorName = node.methodName;
            n->arguments = convertArguments(node.arguments);
            exprResult_ = n;
            return;
        }
        // material.Text('x')
        if (startsLower(targetName->name) && startsUpper(node.methodName)) {
            auto n = std::make_shared<IR::InstanceCreationExpr>();
            n->typeName = targetName->name + "." + node.methodName;
            n->typeArguments = typeStrings(node.typeArguments);
            n->arguments = convertArguments(node.arguments);
            exprResult_ = n;
            return;
        }
    }

    auto n = std::make_shared<IR::CallExpr>();
    n->target = convert(node.target.get());
    n->method = node.methodName;
    n->typeArguments = typeStrings(node.typeArguments);
    n->arguments = convertArguments(node.arguments);
    n->isNullAware = node.isNullAware;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::FunctionCallExpr& node) {
    auto n = std::make_shared<IR::CallExpr>();
    n->target = convert(node.callee.get());
    n->arguments = convertArguments(node.arguments);
    exprResult_ = n;
}

void BodyConverter::visit(Parser::InstanceCreationExpr& node) {
    auto n = std::make_shared<IR::InstanceCreationExpr>();
    n->typeName = node.type.name;
    n->typeArguments = typeStrings(node.type.arguments);
    n->constructorName = node.constructorName;
    n->isConst = node.isConst;
    n->arguments = convertArguments(node.arguments);
    exprResult_ = n;
}

void BodyConverter::visit(Parser::ListLiteralExpr& node) {
    auto n = std::make_shared<IR::CollectionLiteralExpr>();
    n->collectionKind = IR::CollectionKind::List;
    if (node.elementType) {
        n->typeArguments.push_back(node.elementType->toString());
    }
    for (auto& element : node.elements) {
        n->elements.push_back(convert(element.get()));
    }
    n->isConst = node.isConst;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::SetOrMapLiteralExpr& node) {
    auto n = std::make_shared<IR::CollectionLiteralExpr>();
    n->collectionKind = node.isMap() ? IR::CollectionKind::Map : IR::CollectionKind::Set;
    n->typeArguments = typeStrings(node.typeArguments);
    for (auto& element : node.elements) {
        n->elements.push_back(convert(element.get()));
    }
    n->isConst = node.isConst;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::MapEntryExpr& node) {
    auto n = std::make_shared<IR::MapEntryExpr>();
    n->key = convert(node.key.get());
    n->value = convert(node.value.get());
    exprResult_ = n;
}

void BodyConverter::visit(Parser::SpreadElementExpr& node) {
    auto n = std::make_shared<IR::SpreadExpr>();
    n->expression = convert(node.expression.get());
    n->isNullAware = node.isNullAware;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::IfElementExpr& node) {
    auto n = std::make_shared<IR::IfElementExpr>();
    n->condition = convert(node.condition.get());
    n->thenElement = convert(node.thenElement.get());
    n->elseElement = convert(node.elseElement.get());
    exprResult_ = n;
}

void BodyConverter::visit(Parser::ForElementExpr& node) {
    auto n = std::make_shared<IR::ForElementExpr>();
    n->variableType = node.variableType ? node.variableType->toString() : "";
    n->variableName = node.variableName;
    n->iterable = convert(node.iterable.get());
    n->body = convert(node.body.get());
    exprResult_ = n;
}

IR::ExprRef BodyConverter::makeFunction(Parser::FunctionExpr& node) {
    auto n = std::make_shared<IR::FunctionExpr>();
    n->typeParameters = node.typeParameters;
    n->parameters = convertParameters(node.parameters);
    n->body = convert(node.blockBody.get());
    n->expressionBody = convert(node.expressionBody.get());
    n->isAsync = node.isAsync;
    n->isGenerator = node.isGenerator;
    return n;
}

void BodyConverter::visit(Parser::FunctionExpr& node) {
    exprResult_ = makeFunction(node);
}

void BodyConverter::visit(Parser::AwaitExpr& node) {
    auto n = std::make_shared<IR::AwaitExpr>();
    n->expression = convert(node.expression.get());
    exprResult_ = n;
}

void BodyConverter::visit(Parser::ThrowExpr& node) {
    auto n = std::make_shared<IR::ThrowExpr>();
    n->expression = convert(node.expression.get());
    exprResult_ = n;
}

void BodyConverter::visit(Parser::AsExpr& node) {
    auto n = std::make_shared<IR::CastExpr>();
    n->expression = convert(node.expression.get());
    n->typeName = node.type.toString();
    exprResult_ = n;
}

void BodyConverter::visit(Parser::IsExpr& node) {
    auto n = std::make_shared<IR::TypeTestExpr>();
    n->expression = convert(node.expression.get());
    n->typeName = node.type.toString();
    n->isNegated = node.isNegated;
    exprResult_ = n;
}

void BodyConverter::visit(Parser::ParenthesizedExpr& node) {
    auto n = std::make_shared<IR::ParenthesizedExpr>();
    n->expression = convert(node.expression.get());
    exprResult_ = n;
}

// The receiver lowers to an empty target
void BodyConverter::visit(Parser::CascadeReceiverExpr&) {
    exprResult_ = nullptr;
}

void BodyConverter::visit(Parser::CascadeExpr& node) {
    auto n = std::make_shared<IR::CascadeExpr>();
    n->target = convert(node.target.get());
    for (auto& section : node.sections) {
        n->sections.push_back(convert(section.get()));
    }
    n->isNullAware = node.isNullAware;
    exprResult_ = n;
}

//==============================================================================
// Statements
//==============================================================================

void BodyConverter::visit(Parser::BlockStmt& node) {
    auto n = std::make_shared<IR::BlockStmt>();
    for (auto& statement : node.statements) {
        n->statements.push_back(convert(statement.get()));
    }
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::ExpressionStmt& node) {
    auto n = std::make_shared<IR::ExpressionStmt>();
    n->expression = convert(node.expression.get());
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::VariableDeclarationStmt& node) {
    auto n = std::make_shared<IR::VariableDeclStmt>();
    n->typeName = node.type ? node.type->toString() : "";
    n->isFinal = node.isFinal;
    n->isConst = node.isConst;
    n->isLate = node.isLate;
    for (auto& variable : node.variables) {
        IR::VariableBinding binding;
        binding.name = variable.name;
        binding.initializer = convert(variable.initializer.get());
        n->variables.push_back(std::move(binding));
    }
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::LocalFunctionStmt& node) {
    auto n = std::make_shared<IR::VariableDeclStmt>();
    n->typeName = node.returnType ? node.returnType->toString() : "";
    n->isFinal = true;
    IR::VariableBinding binding;
    binding.name = node.name;
    if (node.function) {
        binding.initializer = makeFunction(*node.function);
    }
    n->variables.push_back(std::move(binding));
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::IfStmt& node) {
    auto n = std::make_shared<IR::IfStmt>();
    n->condition = convert(node.condition.get());
    n->thenBranch = convert(node.thenBranch.get());
    n->elseBranch = convert(node.elseBranch.get());
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::ForStmt& node) {
    auto n = std::make_shared<IR::ForStmt>();
    n->initializer = convert(node.initializer.get());
    n->condition = convert(node.condition.get());
    for (auto& updater : node.updaters) {
        n->updaters.push_back(convert(updater.get()));
    }
    n->body = convert(node.body.get());
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::ForEachStmt& node) {
    auto n = std::make_shared<IR::ForEachStmt>();
    n->variableType = node.variableType ? node.variableType->toString() : "";
    n->variableName = node.variableName;
    n->isFinal = node.isFinal;
    n->isAwait = node.isAwait;
    n->iterable = convert(node.iterable.get());
    n->body = convert(node.body.get());
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::WhileStmt& node) {
    auto n = std::make_shared<IR::WhileStmt>();
    n->condition = convert(node.condition.get());
    n->body = convert(node.body.get());
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::DoWhileStmt& node) {
    auto n = std::make_shared<IR::DoWhileStmt>();
    n->body = convert(node.body.get());
    n->condition = convert(node.condition.get());
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::SwitchStmt& node) {
    auto n = std::make_shared<IR::SwitchStmt>();
    n->subject = convert(node.subject.get());
    for (auto& switchCase : node.cases) {
        IR::SwitchCase converted;
        for (auto& label : switchCase.labels) {
            converted.labels.push_back(convert(label.get()));
        }
        converted.isDefault = switchCase.isDefault;
        for (auto& statement : switchCase.statements) {
            converted.statements.push_back(convert(statement.get()));
        }
        n->cases.push_back(std::move(converted));
    }
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::TryStmt& node) {
    auto n = std::make_shared<IR::TryStmt>();
    n->body = convert(node.body.get());
    for (auto& clause : node.catches) {
        IR::CatchClause converted;
        converted.exceptionType = clause.exceptionType ? clause.exceptionType->toString() : "";
        converted.exceptionName = clause.exceptionName;
        converted.stackTraceName = clause.stackTraceName;
        converted.body = convert(clause.body.get());
        n->catches.push_back(std::move(converted));
    }
    n->finallyBlock = convert(node.finallyBlock.get());
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::ReturnStmt& node) {
    auto n = std::make_shared<IR::ReturnStmt>();
    n->value = convert(node.value.get());
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::BreakStmt& node) {
    auto n = std::make_shared<IR::BreakStmt>();
    n->label = node.label;
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::ContinueStmt& node) {
    auto n = std::make_shared<IR::ContinueStmt>();
    n->label = node.label;
    stmtResult_ = n;
}

void BodyConverter::visit(Parser::YieldStmt& node) {
    auto n = std::make_shared<IR::YieldStmt>();
    n->value = convert(node.value.get());
    n->isStar = node.isStar;
    stmtResult_ = n;
}

// assert(cond, message) is kept as a call statement
void BodyConverter::visit(Parser::AssertStmt& node) {
    auto call = std::make_shared<IR::CallExpr>();
    call->method = "assert";
    IR::Argument condition;
    condition.value = convert(node.condition.get());
    call->arguments.push_back(std::move(condition));
    if (node.message) {
        IR::Argument message;
        message.value = convert(node.message.get());
        call->arguments.push_back(std::move(message));
    }
    auto n = std::make_shared<IR::ExpressionStmt>();
    n->expression = IR::ExprRef(call);
    stmtResult_ = n;
}

} // namespace Analysis
} // namespace FJS
