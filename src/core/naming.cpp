#include <dao/naming.h>
#include <dao/value.h>
#include <cctype>
#include <format>

namespace dao {

namespace {
    [[gnu::always_inline]]
    inline bool is_head_char(char c) noexcept {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    [[gnu::always_inline]]
    inline bool is_tail_char(char c) noexcept {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    ParseError label_error(std::string_view input, std::string problem) {
        return ParseError{std::string(input), std::move(problem), false};
    }

    ParseError address_error(std::string_view input, std::string problem) {
        return ParseError{std::string(input), std::move(problem), true};
    }

    // Problem text for a malformed label, empty when the label is fine.
    std::string check_label(std::string_view text) {
        if (text.empty()) return "label is empty";
        if (!is_head_char(text.front())) {
            return std::format("label must start with a letter or underscore, found '{}'", text.front());
        }
        for (char c : text.substr(1)) {
            if (!is_tail_char(c)) return std::format("invalid character '{}' in label", c);
        }
        return {};
    }
}

// --- ParseError ---

std::string ParseError::message() const {
    return std::format("{}.Error: {} (input: \"{}\")", address ? "Address" : "Label", problem, input);
}

Value ParseError::to_value() const {
    Fields fields;
    fields[Label("problem")] = Value(problem);
    fields[Label("input")] = Value(input);
    return Value::data(Address(address ? "Address.Error" : "Label.Error"), std::move(fields));
}

NamingError::NamingError(ParseError detail)
    : std::runtime_error(detail.message()), detail_(std::move(detail)) {}

// --- Label ---

Label::Label(std::string_view text) : text_(text) {
    if (auto problem = check_label(text); !problem.empty()) {
        throw NamingError(label_error(text, std::move(problem)));
    }
}

meow::expected<Label, ParseError> Label::parse(std::string_view text) {
    if (auto problem = check_label(text); !problem.empty()) {
        return meow::unexpected(label_error(text, std::move(problem)));
    }
    return Label(unchecked_t{}, std::string(text));
}

bool Label::is_valid(std::string_view text) noexcept {
    if (text.empty() || !is_head_char(text.front())) return false;
    for (char c : text.substr(1)) {
        if (!is_tail_char(c)) return false;
    }
    return true;
}

// --- Address ---

Address::Address(Label label) {
    labels_.push_back(std::move(label));
}

Address::Address(std::vector<Label> labels) : labels_(std::move(labels)) {
    if (labels_.empty()) {
        throw NamingError(address_error("", "address needs at least one label"));
    }
}

Address::Address(std::string_view text) {
    auto parsed = parse(text);
    if (!parsed) throw NamingError(parsed.error());
    labels_ = std::move(parsed->labels_);
}

meow::expected<Address, ParseError> Address::parse(std::string_view text) {
    if (text.empty()) return meow::unexpected(address_error(text, "address is empty"));

    std::vector<Label> labels;
    size_t start = 0;
    while (true) {
        size_t dot = text.find('.', start);
        std::string_view part = text.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);

        auto label = Label::parse(part);
        if (!label) {
            return meow::unexpected(address_error(text, std::format("component {}: {}", labels.size(), label.error().problem)));
        }
        labels.push_back(*label);

        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return Address(std::move(labels));
}

Address Address::child(const Label& label) const {
    std::vector<Label> labels = labels_;
    labels.push_back(label);
    return Address(std::move(labels));
}

bool Address::is_prefix_of(const Address& other) const noexcept {
    if (labels_.size() > other.labels_.size()) return false;
    for (size_t i = 0; i < labels_.size(); ++i) {
        if (labels_[i] != other.labels_[i]) return false;
    }
    return true;
}

std::string Address::to_string() const {
    std::string out;
    for (size_t i = 0; i < labels_.size(); ++i) {
        if (i) out.push_back('.');
        out += labels_[i].str();
    }
    return out;
}

}
