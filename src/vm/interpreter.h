#pragma once

#include <dao/value.h>
#include <dao/bytecode/instruction.h>
#include "vm/vm_state.h"

namespace dao {

class Interpreter {
public:
    // Steps through the current block until pc leaves it; yields the last result.
    static Value run(VMState& state);

    // One counted step: evalCounter and pc advance before the command runs.
    static void step(VMState& state, const Command& command);

    static void execute(VMState& state, const Command& command);
    static void condition(VMState& state, const Condition& condition);
    static Value eval(VMState& state, const Expression& expression);
    static Value lookup(VMState& state, const Lookup& lookup);
};

}
