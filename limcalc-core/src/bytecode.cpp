#include "limcalc/bytecode.h"
#include <sstream>

namespace limcalc {

const char* opcode_name(OpCode op) {
    switch (op) {
        case OpCode::PUSH_CONST: return "PUSH_CONST";
        case OpCode::LOAD_VAR:   return "LOAD_VAR";
        case OpCode::ADD:        return "ADD";
        case OpCode::SUB:        return "SUB";
        case OpCode::MUL:        return "MUL";
        case OpCode::DIV:        return "DIV";
        case OpCode::NEG:        return "NEG";
        case OpCode::POW:        return "POW";
        case OpCode::SIN:        return "SIN";
        case OpCode::COS:        return "COS";
        case OpCode::TAN:        return "TAN";
        case OpCode::COT:        return "COT";
        case OpCode::SEC:        return "SEC";
        case OpCode::CSC:        return "CSC";
        case OpCode::ASIN:       return "ASIN";
        case OpCode::ACOS:       return "ACOS";
        case OpCode::ATAN:       return "ATAN";
        case OpCode::EXP:        return "EXP";
        case OpCode::LOG:        return "LOG";
        case OpCode::SQRT:       return "SQRT";
        case OpCode::ABS:        return "ABS";
        case OpCode::SIGN:       return "SIGN";
        case OpCode::FLOOR:      return "FLOOR";
        case OpCode::CEIL:       return "CEIL";
        case OpCode::HEAVISIDE:  return "HEAVISIDE";
        case OpCode::RETURN:     return "RETURN";
    }
    return "UNKNOWN";
}

void BytecodeProgram::add_instruction(const Instruction& inst) {
    instructions_.push_back(inst);
}

std::string BytecodeProgram::disassemble() const {
    std::ostringstream oss;
    oss << "Bytecode (variables: " << num_variables_ << "):\n";

    for (size_t i = 0; i < instructions_.size(); ++i) {
        oss << "  " << i << ": " << opcode_name(instructions_[i].opcode);

        switch (instructions_[i].opcode) {
            case OpCode::PUSH_CONST:
                oss << " " << instructions_[i].operand.const_value;
                break;
            case OpCode::LOAD_VAR:
                oss << " " << instructions_[i].operand.var_index;
                break;
            default:
                break;
        }
        oss << "\n";
    }

    return oss.str();
}

} // namespace limcalc
