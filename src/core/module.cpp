#include <dao/core/module.h>

namespace dao {

bool Rule::matches(std::span<const std::string> input) const noexcept {
    if (pattern.size() > input.size()) return false;
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != input[i]) return false;
    }
    return true;
}

}
