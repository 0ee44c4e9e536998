#ifndef LIMCALC_COMPILER_H
#define LIMCALC_COMPILER_H

#include "parser.h"
#include "bytecode.h"
#include <memory>

namespace limcalc {

class Compiler {
public:
    Compiler();

    // Compile AST to bytecode; variables map names to LOAD_VAR slots
    std::unique_ptr<BytecodeProgram> compile(const ASTNode& ast,
                                             const std::vector<std::string>& variables);

    const std::string& get_error() const { return error_message_; }

private:
    void compile_node(const ASTNode& node,
                      const std::vector<std::string>& variables,
                      BytecodeProgram& program);

    std::string error_message_;
};

} // namespace limcalc

#endif // LIMCALC_COMPILER_H
