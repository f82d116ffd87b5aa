#include <dao/signal.h>
#include <format>
#include <meow_enum.h>

namespace dao {

Address error_tag(ErrorKind kind) {
    return Address(Label(meow::enum_name(kind)));
}

Value make_error(ErrorKind kind, std::string_view problem, ErrorContext context) {
    Fields fields;
    fields[Label("problem")] = Value(problem);
    for (const auto& [name, value] : context) {
        fields[Label(name)] = value;
    }
    return Value::data(error_tag(kind), std::move(fields));
}

void throw_error(ErrorKind kind, std::string_view problem, ErrorContext context) {
    throw Signal::error(make_error(kind, problem, context));
}

std::optional<ErrorKind> error_kind(const Value& error) noexcept {
    const DataRecord* record = error.as_if_data();
    if (!record || record->tag.size() != 1) return std::nullopt;
    return meow::enum_cast<ErrorKind>(record->tag.front().str());
}

// --- Failure ---

const Value* Failure::field(std::string_view name) const {
    const DataRecord* record = error.as_if_data();
    if (!record || !Label::is_valid(name)) return nullptr;
    return record->field(Label(name));
}

std::string Failure::message() const {
    const DataRecord* record = error.as_if_data();
    if (!record) return to_string(error);

    const Value* problem = record->field(Label("problem"));
    if (problem && problem->is_string()) {
        return std::format("{}: {}", record->tag.to_string(), problem->as_string());
    }
    return to_string(error);
}

}
