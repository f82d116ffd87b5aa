#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>
#include <dao/common.h>
#include <dao/naming.h>
#include "meow_variant.h"
#include "meow_flat_map.h"

namespace dao {

using base_t = meow::variant<null_t, true_t, int_t, float_t, string_t, pointer_t, list_t, data_t, function_t>;

class Value {
private:
    base_t data_;

public:
    // --- Constructors & Assignments ---

    inline Value() noexcept : data_(null_t{}) {}
    inline Value(null_t) noexcept : data_(null_t{}) {}
    inline Value(true_t) noexcept : data_(true_t{}) {}

    template <std::integral T>
    requires (!std::is_same_v<T, bool>)
    inline Value(T v) noexcept : data_(static_cast<int_t>(v)) {}

    template <std::floating_point T>
    inline Value(T v) noexcept : data_(static_cast<float_t>(v)) {}

    Value(bool) = delete;

    inline Value(string_t v) : data_(std::move(v)) {}
    inline Value(std::string_view v) : data_(string_t(v)) {}
    inline Value(const char* v) : data_(string_t(v)) {}
    inline Value(pointer_t v) : data_(std::move(v)) {}
    inline Value(list_t v) noexcept : data_((v && v->empty()) ? list_t{} : std::move(v)) {}
    inline Value(data_t v) noexcept : data_(std::move(v)) {}
    inline Value(function_t v) noexcept : data_(std::move(v)) {}

    inline Value(const Value&) = default;
    inline Value(Value&&) noexcept = default;
    inline Value& operator=(const Value&) = default;
    inline Value& operator=(Value&&) noexcept = default;
    inline ~Value() noexcept = default;

    // --- Factories ---

    [[nodiscard]] static inline Value null() noexcept { return Value(); }
    [[nodiscard]] static inline Value truth() noexcept { return Value(true_t{}); }
    [[nodiscard]] static inline Value boolean(bool b) noexcept { return b ? truth() : null(); }
    [[nodiscard]] static Value list(std::vector<Value> items);
    [[nodiscard]] static Value data(Address tag, meow::flat_map<Label, Value> fields = {});
    [[nodiscard]] static Value function(std::vector<Label> params, Block body);

    // --- Operators ---

    [[nodiscard]] std::strong_ordering operator<=>(const Value& other) const;
    [[nodiscard]] bool operator==(const Value& other) const;

    // --- Core Access ---

    [[nodiscard]] inline size_t index() const noexcept { return data_.index(); }
    [[nodiscard]] inline ValueType type() const noexcept { return static_cast<ValueType>(data_.index()); }

    // === Type Checkers ===

    inline bool is_null() const noexcept { return data_.holds<null_t>(); }
    inline bool is_true() const noexcept { return data_.holds<true_t>(); }
    inline bool is_int() const noexcept { return data_.holds<int_t>(); }
    inline bool is_float() const noexcept { return data_.holds<float_t>(); }
    inline bool is_string() const noexcept { return data_.holds<string_t>(); }
    inline bool is_pointer() const noexcept { return data_.holds<pointer_t>(); }
    inline bool is_list() const noexcept { return data_.holds<list_t>(); }
    inline bool is_data() const noexcept { return data_.holds<data_t>(); }
    inline bool is_function() const noexcept { return data_.holds<function_t>(); }

    // === Unsafe Accessors ===

    inline int_t as_int() const noexcept { return data_.get<int_t>(); }
    inline float_t as_float() const noexcept { return data_.get<float_t>(); }
    inline const string_t& as_string() const noexcept { return data_.get<string_t>(); }
    inline const Address& as_pointer() const noexcept { return data_.get<pointer_t>(); }
    [[nodiscard]] const DataRecord& as_data() const noexcept;
    [[nodiscard]] const Function& as_function() const noexcept;

    // An absent list and an empty list read the same.
    [[nodiscard]] std::span<const Value> as_list() const noexcept;

    // === Safe Getters (Deducing 'this') ===

    template <typename Self>
    auto as_if_int(this Self&& self) noexcept { return self.data_.template get_if<int_t>(); }
    template <typename Self>
    auto as_if_float(this Self&& self) noexcept { return self.data_.template get_if<float_t>(); }
    template <typename Self>
    auto as_if_string(this Self&& self) noexcept { return self.data_.template get_if<string_t>(); }
    template <typename Self>
    auto as_if_pointer(this Self&& self) noexcept { return self.data_.template get_if<pointer_t>(); }

    [[nodiscard]] const DataRecord* as_if_data() const noexcept;
    [[nodiscard]] const Function* as_if_function() const noexcept;

    // === Visitor ===
    template <typename... Fs>
    decltype(auto) visit(Fs&&... fs) const { return data_.visit(std::forward<Fs>(fs)...); }
};

using Fields = meow::flat_map<Label, Value>;

struct DataRecord {
    Address tag;
    Fields fields;

    [[nodiscard]] const Value* field(const Label& name) const noexcept { return fields.find(name); }
};

[[nodiscard]] std::string to_string(const Value& value);
[[nodiscard]] std::string_view type_name(ValueType type) noexcept;

}
