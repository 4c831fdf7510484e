#include "IR/IRPrinter.h"

namespace FJS {
namespace IR {

std::string IRPrinter::print(const ExprRef& expression) {
    return expression ? print(*expression) : std::string();
}

std::string IRPrinter::print(const StmtRef& statement) {
    return statement ? print(*statement) : std::string();
}

std::string IRPrinter::print(const Expression& expression) {
    IRPrinter printer;
    expression.accept(printer);
    return printer.out.str();
}

std::string IRPrinter::print(const Statement& statement) {
    IRPrinter printer;
    statement.accept(printer);
    return printer.out.str();
}

void IRPrinter::indent() {
    for (int i = 0; i < indentLevel; ++i) {
        out << "  ";
    }
}

void IRPrinter::printExpr(const ExprRef& expression) {
    if (expression) {
        expression->accept(*this);
    }
}

// Nested statements start on the current line and end without a newline
void IRPrinter::printBody(const StmtRef& statement) {
    if (!statement) {
        out << "{}";
        return;
    }
    if (statement->kind() == StmtKind::Block) {
        statement->accept(*this);
        return;
    }
    out << "\n";
    indentLevel++;
    indent();
    statement->accept(*this);
    indentLevel--;
}

void IRPrinter::printArguments(const std::vector<Argument>& arguments) {
    out << "(";
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) out << ", ";
        if (arguments[i].isNamed()) {
            out << arguments[i].name << ": ";
        }
        printExpr(arguments[i].value);
    }
    out << ")";
}

void IRPrinter::printTypeArguments(const std::vector<std::string>& typeArguments) {
    if (typeArguments.empty()) return;
    out << "<";
    for (size_t i = 0; i < typeArguments.size(); ++i) {
        if (i > 0) out << ", ";
        out << typeArguments[i];
    }
    out << ">";
}

void IRPrinter::printParameters(const std::vector<ParameterDeclaration>& parameters) {
    out << "(";
    bool inNamed = false;
    bool inOptional = false;
    for (size_t i = 0; i < parameters.size(); ++i) {
        const auto& parameter = parameters[i];
        if (i > 0) out << ", ";
        if (parameter.isNamed && !inNamed) {
            out << "{";
            inNamed = true;
        } else if (parameter.isOptionalPositional && !inOptional) {
            out << "[";
            inOptional = true;
        }
        if (parameter.isNamed && parameter.isRequired) out << "required ";
        if (!parameter.typeName.empty()) out << parameter.typeName << " ";
        if (parameter.isFieldFormal) out << "this.";
        if (parameter.isSuperFormal) out << "super.";
        out << parameter.name;
        if (parameter.defaultValue) {
            out << " = ";
            printExpr(parameter.defaultValue);
        }
    }
    if (inNamed) out << "}";
    if (inOptional) out << "]";
    out << ")";
}

std::string IRPrinter::quote(const std::string& text) {
    std::string result = "'";
    for (char c : text) {
        switch (c) {
            case '\'': result += "\\'"; break;
            case '\\': result += "\\\\"; break;
            case '$': result += "\\$"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default: result += c; break;
        }
    }
    return result + "'";
}

//==============================================================================
// Expressions
//==============================================================================

void IRPrinter::visit(const LiteralExpr& node) {
    switch (node.literalKind) {
        case LiteralKind::Null: out << "null"; break;
        case LiteralKind::String: out << quote(node.value); break;
        default: out << node.value; break;
    }
}

void IRPrinter::visit(const IdentifierExpr& node) {
    out << node.name;
}

void IRPrinter::visit(const ThisExpr&) {
    out << "this";
}

void IRPrinter::visit(const SuperExpr&) {
    out << "super";
}

void IRPrinter::visit(const BinaryExpr& node) {
    printExpr(node.left);
    out << " " << node.op << " ";
    printExpr(node.right);
}

void IRPrinter::visit(const UnaryExpr& node) {
    if (node.isPrefix) {
        out << node.op;
        printExpr(node.operand);
    } else {
        printExpr(node.operand);
        out << node.op;
    }
}

void IRPrinter::visit(const AssignmentExpr& node) {
    printExpr(node.target);
    out << " " << node.op << " ";
    printExpr(node.value);
}

void IRPrinter::visit(const CallExpr& node) {
    if (node.target) {
        printExpr(node.target);
        if (!node.method.empty()) {
            out << (node.isNullAware ? "?." : ".");
        }
    }
    out << node.method;
    printTypeArguments(node.typeArguments);
    printArguments(node.arguments);
}

// An empty target is the receiver of a cascade section and prints nothing
void IRPrinter::visit(const PropertyAccessExpr& node) {
    if (node.target) {
        printExpr(node.target);
        out << (node.isNullAware ? "?." : ".");
    }
    out << node.name;
}

void IRPrinter::visit(const IndexExpr& node) {
    printExpr(node.target);
    out << (node.isNullAware ? "?[" : "[");
    printExpr(node.index);
    out << "]";
}

void IRPrinter::visit(const ConditionalExpr& node) {
    printExpr(node.condition);
    out << " ? ";
    printExpr(node.thenExpr);
    out << " : ";
    printExpr(node.elseExpr);
}

void IRPrinter::visit(const CollectionLiteralExpr& node) {
    if (node.isConst) out << "const ";
    printTypeArguments(node.typeArguments);
    bool isList = node.collectionKind == CollectionKind::List;
    out << (isList ? "[" : "{");
    for (size_t i = 0; i < node.elements.size(); ++i) {
        if (i > 0) out << ", ";
        printExpr(node.elements[i]);
    }
    out << (isList ? "]" : "}");
}

void IRPrinter::visit(const MapEntryExpr& node) {
    printExpr(node.key);
    out << ": ";
    printExpr(node.value);
}

void IRPrinter::visit(const SpreadExpr& node) {
    out << (node.isNullAware ? "...?" : "...");
    printExpr(node.expression);
}

void IRPrinter::visit(const IfElementExpr& node) {
    out << "if (";
    printExpr(node.condition);
    out << ") ";
    printExpr(node.thenElement);
    if (node.elseElement) {
        out << " else ";
        printExpr(node.elseElement);
    }
}

void IRPrinter::visit(const ForElementExpr& node) {
    out << "for (" << (node.variableType.empty() ? "var" : node.variableType) << " " << node.variableName << " in ";
    printExpr(node.iterable);
    out << ") ";
    printExpr(node.body);
}

void IRPrinter::visit(const StringInterpolationExpr& node) {
    out << "'";
    for (const auto& part : node.parts) {
        auto* literal = dynamic_cast<const LiteralExpr*>(part.get());
        if (literal && literal->literalKind == LiteralKind::String) {
            std::string quoted = quote(literal->value);
            out << quoted.substr(1, quoted.size() - 2);
        } else {
            out << "${";
            printExpr(part);
            out << "}";
        }
    }
    out << "'";
}

void IRPrinter::visit(const AwaitExpr& node) {
    out << "await ";
    printExpr(node.expression);
}

void IRPrinter::visit(const ThrowExpr& node) {
    if (!node.expression) {
        out << "rethrow";
        return;
    }
    out << "throw ";
    printExpr(node.expression);
}

void IRPrinter::visit(const CastExpr& node) {
    printExpr(node.expression);
    out << " as " << node.typeName;
}

void IRPrinter::visit(const TypeTestExpr& node) {
    printExpr(node.expression);
    out << (node.isNegated ? " is! " : " is ") << node.typeName;
}

void IRPrinter::visit(const InstanceCreationExpr& node) {
    if (node.isConst) out << "const ";
    out << node.typeName;
    printTypeArguments(node.typeArguments);
    if (!node.constructorName.empty()) {
        out << "." << node.constructorName;
    }
    printArguments(node.arguments);
}

void IRPrinter::visit(const FunctionExpr& node) {
    printTypeArguments(node.typeParameters);
    printParameters(node.parameters);
    if (node.isAsync) {
        out << (node.isGenerator ? " async*" : " async");
    } else if (node.isGenerator) {
        out << " sync*";
    }
    if (node.expressionBody) {
        out << " => ";
        printExpr(node.expressionBody);
    } else {
        out << " ";
        printBody(node.body);
    }
}

void IRPrinter::visit(const ParenthesizedExpr& node) {
    out << "(";
    printExpr(node.expression);
    out << ")";
}

void IRPrinter::visit(const CascadeExpr& node) {
    printExpr(node.target);
    for (size_t i = 0; i < node.sections.size(); ++i) {
        out << (i == 0 && node.isNullAware ? "?.." : "..");
        printExpr(node.sections[i]);
    }
}

//==============================================================================
// Statements
//==============================================================================

void IRPrinter::visit(const BlockStmt& node) {
    out << "{\n";
    indentLevel++;
    for (const auto& statement : node.statements) {
        indent();
        statement->accept(*this);
        out << "\n";
    }
    indentLevel--;
    indent();
    out << "}";
}

void IRPrinter::visit(const ExpressionStmt& node) {
    printExpr(node.expression);
    out << ";";
}

void IRPrinter::visit(const VariableDeclStmt& node) {
    if (node.isLate) out << "late ";
    if (node.isFinal) {
        out << "final ";
    } else if (node.isConst) {
        out << "const ";
    } else if (node.typeName.empty()) {
        out << "var ";
    }
    if (!node.typeName.empty()) out << node.typeName << " ";

    for (size_t i = 0; i < node.variables.size(); ++i) {
        if (i > 0) out << ", ";
        out << node.variables[i].name;
        if (node.variables[i].initializer) {
            out << " = ";
            printExpr(node.variables[i].initializer);
        }
    }
    out << ";";
}

void IRPrinter::visit(const IfStmt& node) {
    out << "if (";
    printExpr(node.condition);
    out << ") ";
    printBody(node.thenBranch);
    if (node.elseBranch) {
        out << " else ";
        if (node.elseBranch->kind() == StmtKind::If) {
            node.elseBranch->accept(*this);
        } else {
            printBody(node.elseBranch);
        }
    }
}

void IRPrinter::visit(const ForStmt& node) {
    out << "for (";
    if (node.initializer) {
        std::string init = print(node.initializer);
        if (!init.empty() && init.back() == ';') init.pop_back();
        out << init;
    }
    out << "; ";
    printExpr(node.condition);
    out << "; ";
    for (size_t i = 0; i < node.updaters.size(); ++i) {
        if (i > 0) out << ", ";
        printExpr(node.updaters[i]);
    }
    out << ") ";
    printBody(node.body);
}

void IRPrinter::visit(const ForEachStmt& node) {
    if (node.isAwait) out << "await ";
    out << "for (";
    if (node.isFinal) out << "final ";
    out << (node.variableType.empty() ? (node.isFinal ? "" : "var ") : node.variableType + " ");
    out << node.variableName << " in ";
    printExpr(node.iterable);
    out << ") ";
    printBody(node.body);
}

void IRPrinter::visit(const WhileStmt& node) {
    out << "while (";
    printExpr(node.condition);
    out << ") ";
    printBody(node.body);
}

void IRPrinter::visit(const DoWhileStmt& node) {
    out << "do ";
    printBody(node.body);
    out << " while (";
    printExpr(node.condition);
    out << ");";
}

void IRPrinter::visit(const SwitchStmt& node) {
    out << "switch (";
    printExpr(node.subject);
    out << ") {\n";
    indentLevel++;
    for (const auto& switchCase : node.cases) {
        for (const auto& label : switchCase.labels) {
            indent();
            out << "case ";
            printExpr(label);
            out << ":\n";
        }
        if (switchCase.isDefault) {
            indent();
            out << "default:\n";
        }
        indentLevel++;
        for (const auto& statement : switchCase.statements) {
            indent();
            statement->accept(*this);
            out << "\n";
        }
        indentLevel--;
    }
    indentLevel--;
    indent();
    out << "}";
}

void IRPrinter::visit(const TryStmt& node) {
    out << "try ";
    printBody(node.body);
    for (const auto& clause : node.catches) {
        if (!clause.exceptionType.empty()) {
            out << " on " << clause.exceptionType;
        }
        if (!clause.exceptionName.empty()) {
            out << " catch (" << clause.exceptionName;
            if (!clause.stackTraceName.empty()) out << ", " << clause.stackTraceName;
            out << ")";
        }
        out << " ";
        printBody(clause.body);
    }
    if (node.finallyBlock) {
        out << " finally ";
        printBody(node.finallyBlock);
    }
}

void IRPrinter::visit(const ReturnStmt& node) {
    out << "return";
    if (node.value) {
        out << " ";
        printExpr(node.value);
    }
    out << ";";
}

void IRPrinter::visit(const BreakStmt& node) {
    out << "break";
    if (!node.label.empty()) out << " " << node.label;
    out << ";";
}

void IRPrinter::visit(const ContinueStmt& node) {
    out << "continue";
    if (!node.label.empty()) out << " " << node.label;
    out << ";";
}

void IRPrinter::visit(const YieldStmt& node) {
    out << (node.isStar ? "yield* " : "yield ");
    printExpr(node.value);
    out << ";";
}

} // namespace IR
} // namespace FJS
