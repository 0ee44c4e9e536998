#ifndef LIMCALC_VM_H
#define LIMCALC_VM_H

#include "bytecode.h"
#include <vector>
#include <string>

namespace limcalc {

// Stack machine for compiled expressions. Domain violations (division by
// zero, log of a non-positive number, ...) fail the execution instead of
// producing inf/NaN, so callers can tell "undefined here" from a value.
class VM {
public:
    VM();

    // Execute program with given inputs
    bool execute(const BytecodeProgram& program,
                 const double* inputs,
                 size_t num_inputs,
                 double& result);

    const std::string& get_error() const { return error_message_; }

private:
    std::vector<double> stack_;
    std::string error_message_;

    bool pop_operands(double& a, double& b, const char* op);
    bool require_operand(const char* op);

    void clear_error() { error_message_.clear(); }
    void set_error(const std::string& msg) { error_message_ = msg; }
};

} // namespace limcalc

#endif // LIMCALC_VM_H
