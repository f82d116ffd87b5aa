#pragma once

#include <exception>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <dao/value.h>
#include <meow_enum.h>

namespace dao {

enum class ErrorKind : uint8_t {
    UndefinedVariable,
    UndefinedModuleVariable,
    UndefinedModule,
    UndefinedSystemCall,
    UndefinedJumpTarget,
    StackUnderflow,
    NotEnoughArguments,
    NoCurrentModule,
    BadInstruction,
    ModuleAlreadyActive,
    SystemCall,
    CallDepthExceeded,
};

}

template <>
struct meow::enum_traits<dao::ErrorKind> {
    static constexpr int min_val = 0;
    static constexpr int max_val = 31;
};

namespace dao {

using ErrorContext = std::initializer_list<std::pair<std::string_view, Value>>;

// The one unwinding channel for both `Return` and `Throw`.
class Signal : public std::exception {
public:
    enum class Kind : uint8_t { RETURN, ERROR };

    Signal(Kind kind, Value payload) noexcept : kind_(kind), payload_(std::move(payload)) {}

    [[nodiscard]] static Signal returning(Value payload) noexcept { return Signal(Kind::RETURN, std::move(payload)); }
    [[nodiscard]] static Signal error(Value payload) noexcept { return Signal(Kind::ERROR, std::move(payload)); }

    [[nodiscard]] inline Kind kind() const noexcept { return kind_; }
    [[nodiscard]] inline bool is_return() const noexcept { return kind_ == Kind::RETURN; }
    [[nodiscard]] inline bool is_error() const noexcept { return kind_ == Kind::ERROR; }
    [[nodiscard]] inline const Value& payload() const noexcept { return payload_; }

    const char* what() const noexcept override {
        return is_return() ? "dao return signal" : "dao error signal";
    }
private:
    Kind kind_;
    Value payload_;
};

[[nodiscard]] Address error_tag(ErrorKind kind);

// Data record tagged by the kind, with a `problem` field and the given context fields.
[[nodiscard]] Value make_error(ErrorKind kind, std::string_view problem, ErrorContext context = {});

[[noreturn]] void throw_error(ErrorKind kind, std::string_view problem, ErrorContext context = {});

// The kind named by an error value's tag, if it is one of ours.
[[nodiscard]] std::optional<ErrorKind> error_kind(const Value& error) noexcept;

// What an uncaught error looks like from the host side.
struct Failure {
    Value error;

    [[nodiscard]] std::optional<ErrorKind> kind() const noexcept { return error_kind(error); }
    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind() == k; }
    [[nodiscard]] const Value* field(std::string_view name) const;
    [[nodiscard]] std::string message() const;
};

}
