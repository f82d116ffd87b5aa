#pragma once

#include <optional>
#include <span>
#include <string_view>

#include <dao/common.h>
#include <dao/value.h>

namespace dao {

// Partial coercions: std::nullopt means the value does not have the requested shape.

inline std::optional<bool> as_bool(param_t value) noexcept {
    if (value.is_true()) return true;
    if (value.is_null()) return false;
    return std::nullopt;
}

inline std::optional<int_t> as_int(param_t value) noexcept {
    if (auto* i = value.as_if_int()) return *i;
    return std::nullopt;
}

inline std::optional<float_t> as_float(param_t value) noexcept {
    if (auto* f = value.as_if_float()) return *f;
    return std::nullopt;
}

inline std::optional<std::string_view> as_str(param_t value) noexcept {
    if (auto* s = value.as_if_string()) return std::string_view(*s);
    return std::nullopt;
}

inline std::optional<Address> as_pointer(param_t value) {
    if (auto* p = value.as_if_pointer()) return *p;
    return std::nullopt;
}

inline std::optional<std::span<const Value>> as_list(param_t value) noexcept {
    if (value.is_list()) return value.as_list();
    return std::nullopt;
}

inline const Function* as_func(param_t value) noexcept {
    return value.as_if_function();
}

// Fields of a Data value, only when its tag is exactly `tag`.
inline const Fields* as_data(param_t value, const Address& tag) noexcept {
    const DataRecord* record = value.as_if_data();
    if (!record || record->tag != tag) return nullptr;
    return &record->fields;
}

// Named field of a Data value carrying `tag`.
inline const Value* member(param_t value, const Address& tag, const Label& name) noexcept {
    const Fields* fields = as_data(value, tag);
    return fields ? fields->find(name) : nullptr;
}

}
