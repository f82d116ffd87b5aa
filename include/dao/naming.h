#pragma once

#include <compare>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "meow_expected.h"

namespace dao {

class Value;

struct ParseError {
    std::string input;
    std::string problem;
    bool address = true;

    [[nodiscard]] std::string message() const;
    // Data record tagged Address.Error or Label.Error with problem and input fields.
    [[nodiscard]] Value to_value() const;
};

class NamingError : public std::runtime_error {
public:
    explicit NamingError(ParseError detail);
    [[nodiscard]] const ParseError& detail() const noexcept { return detail_; }
private:
    ParseError detail_;
};

class Label {
public:
    // --- Constructors ---
    explicit Label(std::string_view text);
    Label(const char* text) : Label(std::string_view(text)) {}
    Label(const Label&) = default;
    Label(Label&&) noexcept = default;
    Label& operator=(const Label&) = default;
    Label& operator=(Label&&) noexcept = default;

    [[nodiscard]] static meow::expected<Label, ParseError> parse(std::string_view text);
    [[nodiscard]] static bool is_valid(std::string_view text) noexcept;

    [[nodiscard]] inline const std::string& str() const noexcept { return text_; }

    std::strong_ordering operator<=>(const Label&) const = default;
    bool operator==(const Label&) const = default;
private:
    struct unchecked_t {};
    Label(unchecked_t, std::string text) noexcept : text_(std::move(text)) {}

    std::string text_;
};

class Address {
public:
    // --- Constructors ---
    explicit Address(Label label);
    explicit Address(std::vector<Label> labels);
    explicit Address(std::string_view text);
    Address(const char* text) : Address(std::string_view(text)) {}
    Address(const Address&) = default;
    Address(Address&&) noexcept = default;
    Address& operator=(const Address&) = default;
    Address& operator=(Address&&) noexcept = default;

    [[nodiscard]] static meow::expected<Address, ParseError> parse(std::string_view text);

    // --- Accessors ---
    [[nodiscard]] inline const std::vector<Label>& labels() const noexcept { return labels_; }
    [[nodiscard]] inline size_t size() const noexcept { return labels_.size(); }
    [[nodiscard]] inline const Label& front() const noexcept { return labels_.front(); }
    [[nodiscard]] inline const Label& back() const noexcept { return labels_.back(); }

    [[nodiscard]] Address child(const Label& label) const;
    [[nodiscard]] bool is_prefix_of(const Address& other) const noexcept;
    [[nodiscard]] std::string to_string() const;

    std::strong_ordering operator<=>(const Address&) const = default;
    bool operator==(const Address&) const = default;
private:
    std::vector<Label> labels_;
};

[[nodiscard]] inline std::string to_string(const Label& label) { return label.str(); }
[[nodiscard]] inline std::string to_string(const Address& address) { return address.to_string(); }

}
