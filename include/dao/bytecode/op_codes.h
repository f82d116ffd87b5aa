/**
 * @file op_codes.h
 */
#pragma once
#include <cstdint>
#include <meow_enum.h>

namespace dao {

enum class LookupKind : uint8_t {
    RESULT, CONST, VAR, DEREF, LOOKUP,
    TOTAL_LOOKUPS
};

enum class CommandOp : uint8_t {
    LOAD, STORE, UPDATE,
    SETJUMP, JUMP,
    PUSH, PEEK, POP, CLEAR_FORWARD, CLEAR_REVERSE,
    EVAL, DO,
    RETURN, THROW,
    TOTAL_COMMANDS
};

enum class ConditionKind : uint8_t { WHEN, UNLESS };

enum class OpCode : uint8_t {
    TAKE,
    NOT, SIZE,
    ADD, SUB, MUL, DIV, MOD, INDEX,
    GT, GE, LT, LE, EQ, NE,
    APPEND,
    AND, OR, XOR, SHIFT_R, SHIFT_L,
    IF, IF_NOT,
    SYS, CALL, LOCAL, GOTO,

    TOTAL_OPCODES
};

}

// Opcode names are looked up by meow::enum_name; keep the scan within the used range.
template <>
struct meow::enum_traits<dao::OpCode> {
    static constexpr int min_val = 0;
    static constexpr int max_val = 63;
};

template <>
struct meow::enum_traits<dao::CommandOp> {
    static constexpr int min_val = 0;
    static constexpr int max_val = 31;
};

template <>
struct meow::enum_traits<dao::LookupKind> {
    static constexpr int min_val = 0;
    static constexpr int max_val = 15;
};

namespace dao {

struct OpInfo {
    uint8_t arity;      // Number of operand expressions
    bool variadic;      // Operands are call arguments
};

constexpr OpInfo get_op_info(OpCode op) {
    using enum OpCode;
    switch (op) {
        case TAKE:
            return {0, false};

        case NOT: case SIZE:
            return {1, false};

        case ADD: case SUB: case MUL: case DIV: case MOD: case INDEX:
        case GT: case GE: case LT: case LE: case EQ: case NE:
        case APPEND:
        case AND: case OR: case XOR: case SHIFT_R: case SHIFT_L:
            return {2, false};

        case IF: case IF_NOT:
            return {3, false};

        case SYS: case CALL: case LOCAL: case GOTO:
            return {0, true};

        default:
            return {0, false};
    }
}

}
