#include "limcalc/compiler.h"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace limcalc {

namespace {

struct UnaryFunction {
    const char* name;
    OpCode opcode;
};

const UnaryFunction kUnaryFunctions[] = {
    {"sin", OpCode::SIN},
    {"cos", OpCode::COS},
    {"tan", OpCode::TAN},
    {"cot", OpCode::COT},
    {"sec", OpCode::SEC},
    {"csc", OpCode::CSC},
    {"asin", OpCode::ASIN},
    {"acos", OpCode::ACOS},
    {"atan", OpCode::ATAN},
    {"exp", OpCode::EXP},
    {"log", OpCode::LOG},
    {"sqrt", OpCode::SQRT},
    {"abs", OpCode::ABS},
    {"sign", OpCode::SIGN},
    {"floor", OpCode::FLOOR},
    {"ceiling", OpCode::CEIL},
    {"Heaviside", OpCode::HEAVISIDE}
};

double constant_value(const std::string& name) {
    if (name == "pi") {
        return 3.14159265358979323846;
    }
    if (name == "E") {
        return 2.71828182845904523536;
    }
    if (name == "oo") {
        return std::numeric_limits<double>::infinity();
    }
    throw std::runtime_error("Unknown constant: " + name);
}

} // namespace

Compiler::Compiler() {}

std::unique_ptr<BytecodeProgram> Compiler::compile(const ASTNode& ast,
                                                   const std::vector<std::string>& variables) {
    error_message_.clear();

    auto program = std::make_unique<BytecodeProgram>();

    try {
        compile_node(ast, variables, *program);
        program->add_instruction(Instruction(OpCode::RETURN));
    } catch (const std::exception& e) {
        error_message_ = e.what();
        return nullptr;
    }

    program->set_num_variables(variables.size());
    return program;
}

void Compiler::compile_node(const ASTNode& node,
                            const std::vector<std::string>& variables,
                            BytecodeProgram& program) {
    switch (node.type) {
        case ASTNodeType::NUMBER: {
            double value = std::stod(node.value);
            program.add_instruction(Instruction(OpCode::PUSH_CONST, value));
            break;
        }

        case ASTNodeType::CONSTANT: {
            program.add_instruction(Instruction(OpCode::PUSH_CONST, constant_value(node.value)));
            break;
        }

        case ASTNodeType::VARIABLE: {
            size_t index = 0;
            while (index < variables.size() && variables[index] != node.value) {
                ++index;
            }
            if (index == variables.size()) {
                throw std::runtime_error("Unknown variable: " + node.value);
            }
            program.add_instruction(Instruction(OpCode::LOAD_VAR, index));
            break;
        }

        case ASTNodeType::BINARY_OP: {
            if (node.children.size() != 2) {
                throw std::runtime_error("Binary operation requires exactly 2 operands");
            }

            // Compile operands
            compile_node(*node.children[0], variables, program);
            compile_node(*node.children[1], variables, program);

            // Emit operator instruction
            if (node.value == "+") {
                program.add_instruction(Instruction(OpCode::ADD));
            } else if (node.value == "-") {
                program.add_instruction(Instruction(OpCode::SUB));
            } else if (node.value == "*") {
                program.add_instruction(Instruction(OpCode::MUL));
            } else if (node.value == "/") {
                program.add_instruction(Instruction(OpCode::DIV));
            } else if (node.value == "^") {
                program.add_instruction(Instruction(OpCode::POW));
            } else {
                throw std::runtime_error("Unknown binary operator: " + node.value);
            }
            break;
        }

        case ASTNodeType::UNARY_OP: {
            if (node.children.size() != 1) {
                throw std::runtime_error("Unary operation requires exactly 1 operand");
            }

            compile_node(*node.children[0], variables, program);

            if (node.value == "-") {
                program.add_instruction(Instruction(OpCode::NEG));
            } else {
                throw std::runtime_error("Unknown unary operator: " + node.value);
            }
            break;
        }

        case ASTNodeType::FUNCTION_CALL: {
            if (node.value == "pow") {
                if (node.children.size() != 2) {
                    throw std::runtime_error("pow() requires exactly 2 arguments");
                }
                compile_node(*node.children[0], variables, program);
                compile_node(*node.children[1], variables, program);
                program.add_instruction(Instruction(OpCode::POW));
                break;
            }

            for (const auto& fn : kUnaryFunctions) {
                if (node.value == fn.name) {
                    if (node.children.size() != 1) {
                        throw std::runtime_error(node.value + "() requires exactly 1 argument");
                    }
                    compile_node(*node.children[0], variables, program);
                    program.add_instruction(Instruction(fn.opcode));
                    return;
                }
            }
            throw std::runtime_error("Unknown function: " + node.value);
        }
    }
}

} // namespace limcalc
