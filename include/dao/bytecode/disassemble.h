#pragma once

#include <string>
#include <string_view>

namespace dao {
    struct Lookup;
    struct Expression;
    struct Command;
    class Block;
}

namespace dao {

    std::string disassemble(const Lookup& lookup);
    std::string disassemble(const Expression& expr);
    std::string disassemble(const Command& cmd);

    /**
     * @brief Whole block, one numbered command per line.
     */
    std::string disassemble_block(const Block& block, std::string_view name = {}) noexcept;

    /**
     * @brief Commands around `pc`, the one at `pc` marked. Used for error reports.
     */
    std::string disassemble_around(const Block& block, size_t pc, size_t context_lines = 3) noexcept;
}
