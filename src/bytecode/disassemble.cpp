#include <dao/bytecode/disassemble.h>
#include <dao/bytecode/instruction.h>
#include <dao/bytecode/op_codes.h>
#include <dao/value.h>

#include <algorithm>
#include <format>
#include <iterator>
#include <optional>
#include <string_view>
#include <meow_enum.h>

namespace dao {

namespace {
    // Hand-built instructions may leave fields empty.
    constexpr std::string_view missing = "<missing>";

    std::string text(const std::optional<Label>& label) {
        return label ? label->str() : std::string(missing);
    }

    std::string text(const std::optional<Address>& address) {
        return address ? address->to_string() : std::string(missing);
    }
}

std::string disassemble(const Lookup& lookup) {
    switch (lookup.kind) {
        case LookupKind::RESULT: return "RESULT";
        case LookupKind::CONST:  return std::format("CONST {}", to_string(lookup.constant));
        case LookupKind::VAR:    return std::format("VAR {}", text(lookup.label));
        case LookupKind::DEREF:  return std::format("DEREF {}", text(lookup.label));
        case LookupKind::LOOKUP: return std::format("LOOKUP {}.{}", text(lookup.module), text(lookup.label));
        default:                 return "UNKNOWN_LOOKUP";
    }
}

std::string disassemble(const Expression& expr) {
    if (expr.op == OpCode::TAKE) return disassemble(expr.target);

    std::string out = "(";
    out += meow::enum_name(expr.op);
    switch (expr.op) {
        case OpCode::SYS:
            std::format_to(std::back_inserter(out), " {}", text(expr.address));
            if (expr.forward_stack) out += " STACK";
            break;
        case OpCode::CALL:
            std::format_to(std::back_inserter(out), " {} {}", text(expr.address), disassemble(expr.target));
            break;
        case OpCode::LOCAL: case OpCode::GOTO:
            std::format_to(std::back_inserter(out), " {}", disassemble(expr.target));
            break;
        default:
            break;
    }
    for (const Expression& operand : expr.operands) {
        out.push_back(' ');
        out += disassemble(operand);
    }
    out.push_back(')');
    return out;
}

std::string disassemble(const Command& cmd) {
    const std::string_view name = meow::enum_name(cmd.op);
    switch (cmd.op) {
        case CommandOp::LOAD: case CommandOp::PUSH:
        case CommandOp::RETURN: case CommandOp::THROW:
            return std::format("{} {}", name, disassemble(cmd.lookup));

        case CommandOp::STORE: case CommandOp::SETJUMP: case CommandOp::JUMP:
            return std::format("{} {}", name, text(cmd.label));

        case CommandOp::UPDATE:
            return std::format("{} {} {}", name, disassemble(cmd.lookup), text(cmd.label));

        case CommandOp::EVAL:
            return std::format("{} {}", name, cmd.expression ? disassemble(*cmd.expression) : std::string(missing));

        case CommandOp::DO: {
            if (!cmd.condition) return std::format("{} {}", name, missing);
            const Condition& cond = *cmd.condition;
            return std::format("{} {} {} {}", name, cond.kind == ConditionKind::WHEN ? "WHEN" : "UNLESS",
                               disassemble(cond.test), disassemble(cond.body));
        }

        default:
            return std::string(name);
    }
}

std::string disassemble_block(const Block& block, std::string_view name) noexcept {
    std::string out;
    out.reserve(block.size() * 32);

    std::format_to(std::back_inserter(out), "== {} ==\n", name.empty() ? "Block" : name);
    for (size_t pc = 0; pc < block.size(); ++pc) {
        std::format_to(std::back_inserter(out), "{:04d}: {}\n", pc, disassemble(block[pc]));
    }
    return out;
}

std::string disassemble_around(const Block& block, size_t pc, size_t context_lines) noexcept {
    std::string out;
    if (block.empty()) return "    <empty block>\n";

    // A pc one past the end points at the last command.
    const size_t focus = std::min(pc, block.size() - 1);
    const size_t start = focus > context_lines ? focus - context_lines : 0;
    const size_t end = std::min(block.size(), focus + context_lines + 1);

    for (size_t i = start; i < end; ++i) {
        if (i == focus) {
            std::format_to(std::back_inserter(out), " -> {:04d}: {}   <--- HERE\n", i, disassemble(block[i]));
        } else {
            std::format_to(std::back_inserter(out), "    {:04d}: {}\n", i, disassemble(block[i]));
        }
    }
    return out;
}

}
