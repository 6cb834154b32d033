// errors.hpp - Diagnostic records and the exception taxonomy of the engine
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace alkey {

struct Note { std::string message; int line=-1; int col=-1; };
struct Diagnostic { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<Note> notes; };

// Root of every engine failure. what() carries "<code>: <message>".
struct error : std::runtime_error {
    explicit error(Diagnostic d);
    const Diagnostic& diagnostic() const noexcept { return diag_; }
    const std::string& code() const noexcept { return diag_.code; }
private:
    Diagnostic diag_;
};

// Raised by Registry::define; nothing is installed.
struct MalformedTypeDefinition : error { using error::error; };

enum class ValidationErrorKind { MissingField, UnknownField, UnknownVariant, TypeMismatch, UnknownType, WrongKind, DuplicateField };
enum class CompileErrorKind { NonExhaustiveMatch, DuplicateVariant, UnknownVariant, UnknownType, NotASumType, MissingHandler };
enum class DispatchErrorKind { GuardExhaustionFailure, TypeMismatch };
enum class SynthesisErrorKind { NoMatchingRule };

const char* to_string(ValidationErrorKind k);
const char* to_string(CompileErrorKind k);
const char* to_string(DispatchErrorKind k);
const char* to_string(SynthesisErrorKind k);

struct ValidationError : error {
    ValidationError(ValidationErrorKind k, std::string type_name, Diagnostic d)
        : error(std::move(d)), kind_(k), type_(std::move(type_name)) {}
    ValidationErrorKind kind() const noexcept { return kind_; }
    const std::string& type_name() const noexcept { return type_; }
private:
    ValidationErrorKind kind_;
    std::string type_;
};

struct CompileError : error {
    CompileError(CompileErrorKind k, Diagnostic d, std::vector<std::string> missing = {})
        : error(std::move(d)), kind_(k), missing_(std::move(missing)) {}
    CompileErrorKind kind() const noexcept { return kind_; }
    // Populated for NonExhaustiveMatch, in declaration order.
    const std::vector<std::string>& missing_variants() const noexcept { return missing_; }
private:
    CompileErrorKind kind_;
    std::vector<std::string> missing_;
};

struct DispatchError : error {
    DispatchError(DispatchErrorKind k, Diagnostic d) : error(std::move(d)), kind_(k) {}
    DispatchErrorKind kind() const noexcept { return kind_; }
private:
    DispatchErrorKind kind_;
};

// A lazy computation raised. The cell that ran it is still pending.
struct ComputationFailed : error { using error::error; };

struct SynthesisError : error {
    SynthesisError(SynthesisErrorKind k, Diagnostic d) : error(std::move(d)), kind_(k) {}
    SynthesisErrorKind kind() const noexcept { return kind_; }
private:
    SynthesisErrorKind kind_;
};

// Syntax error from the form reader.
struct schema_error : error { using error::error; };

inline Diagnostic make_diag(std::string code, std::string message, std::string hint = {}, int line=-1, int col=-1){
    return Diagnostic{std::move(code), std::move(message), std::move(hint), line, col, {}};
}

} // namespace alkey
