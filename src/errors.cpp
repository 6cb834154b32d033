#include "alkey/errors.hpp"

namespace alkey {

static std::string render(const Diagnostic& d){
    std::string s = d.code.empty() ? d.message : d.code + ": " + d.message;
    if(!d.hint.empty()) s += " (hint: " + d.hint + ")";
    return s;
}

error::error(Diagnostic d) : std::runtime_error(render(d)), diag_(std::move(d)) {}

const char* to_string(ValidationErrorKind k){
    switch(k){
        case ValidationErrorKind::MissingField: return "MissingField";
        case ValidationErrorKind::UnknownField: return "UnknownField";
        case ValidationErrorKind::UnknownVariant: return "UnknownVariant";
        case ValidationErrorKind::TypeMismatch: return "TypeMismatch";
        case ValidationErrorKind::UnknownType: return "UnknownType";
        case ValidationErrorKind::WrongKind: return "WrongKind";
        case ValidationErrorKind::DuplicateField: return "DuplicateField";
    }
    return "?";
}

const char* to_string(CompileErrorKind k){
    switch(k){
        case CompileErrorKind::NonExhaustiveMatch: return "NonExhaustiveMatch";
        case CompileErrorKind::DuplicateVariant: return "DuplicateVariant";
        case CompileErrorKind::UnknownVariant: return "UnknownVariant";
        case CompileErrorKind::UnknownType: return "UnknownType";
        case CompileErrorKind::NotASumType: return "NotASumType";
        case CompileErrorKind::MissingHandler: return "MissingHandler";
    }
    return "?";
}

const char* to_string(DispatchErrorKind k){
    switch(k){
        case DispatchErrorKind::GuardExhaustionFailure: return "GuardExhaustionFailure";
        case DispatchErrorKind::TypeMismatch: return "TypeMismatch";
    }
    return "?";
}

const char* to_string(SynthesisErrorKind k){
    switch(k){
        case SynthesisErrorKind::NoMatchingRule: return "NoMatchingRule";
    }
    return "?";
}

} // namespace alkey
