#include "limcalc/vm.h"
#include <cmath>
#include <limits>

namespace limcalc {

VM::VM() {
    stack_.reserve(256);
}

bool VM::pop_operands(double& a, double& b, const char* op) {
    if (stack_.size() < 2) {
        set_error(std::string("Stack underflow in ") + op);
        return false;
    }
    b = stack_.back(); stack_.pop_back();
    a = stack_.back(); stack_.pop_back();
    return true;
}

bool VM::require_operand(const char* op) {
    if (stack_.empty()) {
        set_error(std::string("Stack underflow in ") + op);
        return false;
    }
    return true;
}

bool VM::execute(const BytecodeProgram& program,
                 const double* inputs,
                 size_t num_inputs,
                 double& result) {
    clear_error();
    stack_.clear();

    if (num_inputs != program.num_variables()) {
        set_error("Input count mismatch");
        return false;
    }

    double a = 0.0;
    double b = 0.0;

    for (const auto& inst : program.instructions()) {
        switch (inst.opcode) {
            case OpCode::PUSH_CONST:
                stack_.push_back(inst.operand.const_value);
                break;

            case OpCode::LOAD_VAR: {
                size_t idx = inst.operand.var_index;
                if (idx >= num_inputs) {
                    set_error("Variable index out of bounds");
                    return false;
                }
                stack_.push_back(inputs[idx]);
                break;
            }

            case OpCode::ADD:
                if (!pop_operands(a, b, "ADD")) return false;
                stack_.push_back(a + b);
                break;

            case OpCode::SUB:
                if (!pop_operands(a, b, "SUB")) return false;
                stack_.push_back(a - b);
                break;

            case OpCode::MUL:
                if (!pop_operands(a, b, "MUL")) return false;
                stack_.push_back(a * b);
                break;

            case OpCode::DIV:
                if (!pop_operands(a, b, "DIV")) return false;
                if (b == 0.0) {
                    set_error("Division by zero");
                    return false;
                }
                stack_.push_back(a / b);
                break;

            case OpCode::NEG:
                if (!require_operand("NEG")) return false;
                stack_.back() = -stack_.back();
                break;

            case OpCode::POW: {
                if (!pop_operands(a, b, "POW")) return false;
                if (a == 0.0 && b < 0.0) {
                    set_error("Division by zero in power");
                    return false;
                }
                if (a < 0.0 && std::isfinite(b) && b != std::floor(b)) {
                    set_error("Negative base with fractional exponent");
                    return false;
                }
                stack_.push_back(std::pow(a, b));
                break;
            }

            case OpCode::SIN:
                if (!require_operand("SIN")) return false;
                stack_.back() = std::sin(stack_.back());
                break;

            case OpCode::COS:
                if (!require_operand("COS")) return false;
                stack_.back() = std::cos(stack_.back());
                break;

            case OpCode::TAN:
                if (!require_operand("TAN")) return false;
                stack_.back() = std::tan(stack_.back());
                break;

            case OpCode::COT: {
                if (!require_operand("COT")) return false;
                const double s = std::sin(stack_.back());
                if (s == 0.0) {
                    set_error("Cotangent of a multiple of pi");
                    return false;
                }
                stack_.back() = std::cos(stack_.back()) / s;
                break;
            }

            case OpCode::SEC: {
                if (!require_operand("SEC")) return false;
                const double c = std::cos(stack_.back());
                if (c == 0.0) {
                    set_error("Secant where cosine is zero");
                    return false;
                }
                stack_.back() = 1.0 / c;
                break;
            }

            case OpCode::CSC: {
                if (!require_operand("CSC")) return false;
                const double s = std::sin(stack_.back());
                if (s == 0.0) {
                    set_error("Cosecant of a multiple of pi");
                    return false;
                }
                stack_.back() = 1.0 / s;
                break;
            }

            case OpCode::ASIN:
                if (!require_operand("ASIN")) return false;
                if (std::abs(stack_.back()) > 1.0) {
                    set_error("asin argument outside [-1, 1]");
                    return false;
                }
                stack_.back() = std::asin(stack_.back());
                break;

            case OpCode::ACOS:
                if (!require_operand("ACOS")) return false;
                if (std::abs(stack_.back()) > 1.0) {
                    set_error("acos argument outside [-1, 1]");
                    return false;
                }
                stack_.back() = std::acos(stack_.back());
                break;

            case OpCode::ATAN:
                if (!require_operand("ATAN")) return false;
                stack_.back() = std::atan(stack_.back());
                break;

            case OpCode::EXP:
                if (!require_operand("EXP")) return false;
                stack_.back() = std::exp(stack_.back());
                break;

            case OpCode::LOG:
                if (!require_operand("LOG")) return false;
                if (stack_.back() <= 0.0) {
                    set_error("Logarithm of non-positive number");
                    return false;
                }
                stack_.back() = std::log(stack_.back());
                break;

            case OpCode::SQRT:
                if (!require_operand("SQRT")) return false;
                if (stack_.back() < 0.0) {
                    set_error("Square root of negative number");
                    return false;
                }
                stack_.back() = std::sqrt(stack_.back());
                break;

            case OpCode::ABS:
                if (!require_operand("ABS")) return false;
                stack_.back() = std::abs(stack_.back());
                break;

            case OpCode::SIGN: {
                if (!require_operand("SIGN")) return false;
                const double v = stack_.back();
                stack_.back() = v > 0.0 ? 1.0 : (v < 0.0 ? -1.0 : 0.0);
                break;
            }

            case OpCode::FLOOR:
                if (!require_operand("FLOOR")) return false;
                stack_.back() = std::floor(stack_.back());
                break;

            case OpCode::CEIL:
                if (!require_operand("CEIL")) return false;
                stack_.back() = std::ceil(stack_.back());
                break;

            case OpCode::HEAVISIDE: {
                if (!require_operand("HEAVISIDE")) return false;
                const double v = stack_.back();
                stack_.back() = v > 0.0 ? 1.0 : (v < 0.0 ? 0.0 : 0.5);
                break;
            }

            case OpCode::RETURN: {
                if (stack_.size() != 1) {
                    set_error("Invalid stack size at return");
                    return false;
                }
                result = stack_.back();
                return true;
            }
        }
    }

    set_error("Missing return instruction");
    return false;
}

} // namespace limcalc
