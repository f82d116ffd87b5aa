#pragma once

#include <span>
#include <string>
#include <dao/core/module.h>
#include "vm/vm_state.h"

namespace dao {

// Runs every rule of the module whose pattern prefixes the tokens, in declaration order.
void run_rules(VMState& state, std::span<const std::string> tokens, const Module& module);

}
