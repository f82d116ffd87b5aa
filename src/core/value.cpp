#include <dao/value.h>
#include <dao/bytecode/instruction.h>
#include <algorithm>
#include <compare>
#include <format>

namespace dao {

namespace {
    template <typename Seq>
    std::strong_ordering compare_sequences(const Seq& a, const Seq& b) {
        return std::lexicographical_compare_three_way(a.begin(), a.end(), b.begin(), b.end());
    }

    std::strong_ordering compare_fields(const Fields& a, const Fields& b) {
        if (auto c = compare_sequences(a.keys(), b.keys()); c != 0) return c;
        return compare_sequences(a.values(), b.values());
    }

    void append_escaped(std::string& out, std::string_view s) {
        out.push_back('"');
        for (char c : s) {
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\t': out += "\\t"; break;
                default:   out.push_back(c);
            }
        }
        out.push_back('"');
    }
}

// --- Factories ---

Value Value::list(std::vector<Value> items) {
    if (items.empty()) return Value(list_t{});
    return Value(std::make_shared<const std::vector<Value>>(std::move(items)));
}

Value Value::data(Address tag, Fields fields) {
    return Value(std::make_shared<const DataRecord>(DataRecord{std::move(tag), std::move(fields)}));
}

Value Value::function(std::vector<Label> params, Block body) {
    return Value(std::make_shared<const Function>(Function{std::move(params), std::move(body)}));
}

// --- Accessors ---

std::span<const Value> Value::as_list() const noexcept {
    if (auto* list = data_.get_if<list_t>(); list && *list) return std::span<const Value>(**list);
    return {};
}

const DataRecord& Value::as_data() const noexcept { return *data_.get<data_t>(); }
const Function& Value::as_function() const noexcept { return *data_.get<function_t>(); }

const DataRecord* Value::as_if_data() const noexcept {
    auto* ptr = data_.get_if<data_t>();
    return ptr ? ptr->get() : nullptr;
}

const Function* Value::as_if_function() const noexcept {
    auto* ptr = data_.get_if<function_t>();
    return ptr ? ptr->get() : nullptr;
}

// --- Ordering ---

// Type first, then contents. Floats use the IEEE total order so the relation stays total.
std::strong_ordering Value::operator<=>(const Value& other) const {
    if (auto c = index() <=> other.index(); c != 0) return c;

    switch (type()) {
        case ValueType::Null:
        case ValueType::True:
            return std::strong_ordering::equal;
        case ValueType::Int:
            return as_int() <=> other.as_int();
        case ValueType::Float:
            return std::strong_order(as_float(), other.as_float());
        case ValueType::String:
            return as_string() <=> other.as_string();
        case ValueType::Pointer:
            return as_pointer() <=> other.as_pointer();
        case ValueType::List: {
            auto a = as_list();
            auto b = other.as_list();
            if (auto c = a.size() <=> b.size(); c != 0) return c;
            return std::lexicographical_compare_three_way(a.begin(), a.end(), b.begin(), b.end());
        }
        case ValueType::Data: {
            const DataRecord& a = as_data();
            const DataRecord& b = other.as_data();
            if (&a == &b) return std::strong_ordering::equal;
            if (auto c = a.tag <=> b.tag; c != 0) return c;
            return compare_fields(a.fields, b.fields);
        }
        case ValueType::Function: {
            const Function& a = as_function();
            const Function& b = other.as_function();
            if (&a == &b) return std::strong_ordering::equal;
            return a <=> b;
        }
        default:
            return std::strong_ordering::equal;
    }
}

bool Value::operator==(const Value& other) const {
    return (*this <=> other) == 0;
}

// --- Rendering ---

std::string_view type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::Null:     return "Null";
        case ValueType::True:     return "True";
        case ValueType::Int:      return "Int";
        case ValueType::Float:    return "Float";
        case ValueType::String:   return "Str";
        case ValueType::Pointer:  return "Pointer";
        case ValueType::List:     return "List";
        case ValueType::Data:     return "Data";
        case ValueType::Function: return "Func";
        default:                  return "Unknown";
    }
}

std::string to_string(const Value& value) {
    return value.visit(
        [](null_t) -> std::string { return "null"; },
        [](true_t) -> std::string { return "true"; },
        [](int_t i) -> std::string { return std::to_string(i); },
        [](float_t f) -> std::string { return std::format("{}", f); },
        [](const string_t& s) -> std::string {
            std::string out;
            append_escaped(out, s);
            return out;
        },
        [](const pointer_t& p) -> std::string { return "&" + p.to_string(); },
        [&value](const list_t&) -> std::string {
            std::string out = "[";
            bool first = true;
            for (const Value& item : value.as_list()) {
                if (!first) out += ", ";
                out += to_string(item);
                first = false;
            }
            out += "]";
            return out;
        },
        [](const data_t& d) -> std::string {
            std::string out = d->tag.to_string() + "{";
            const auto& keys = d->fields.keys();
            const auto& vals = d->fields.values();
            for (size_t i = 0; i < keys.size(); ++i) {
                if (i) out += ", ";
                out += std::format("{}: {}", keys[i].str(), to_string(vals[i]));
            }
            out += "}";
            return out;
        },
        [](const function_t& f) -> std::string {
            std::string params;
            for (size_t i = 0; i < f->params.size(); ++i) {
                if (i) params += ", ";
                params += f->params[i].str();
            }
            return std::format("func({}){{{} commands}}", params, f->body.size());
        }
    );
}

}
