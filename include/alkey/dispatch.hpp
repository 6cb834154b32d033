// dispatch.hpp - Runs a compiled match against an instance
#pragma once
#include "alkey/events.hpp"
#include "alkey/pattern.hpp"
#include "alkey/value.hpp"
#include <memory>

namespace alkey {

// Selects the first clause, in declaration order, among those naming the instance's variant whose
// guard holds; then the wildcard clauses in order. If every candidate's guard fails the result is
// GuardExhaustionFailure, which is recoverable. Dispatch never mutates the instance.
class Dispatcher {
public:
    explicit Dispatcher(std::shared_ptr<EventSink> sink = {}) : sink_(std::move(sink)) {}

    // Throws DispatchError.
    value dispatch(const CompiledPattern& pattern, const Instance& inst) const;
    value dispatch(const CompiledPattern& pattern, const instance_ptr& inst) const;

private:
    [[noreturn]] void fail(DispatchErrorKind k, const std::string& type, Diagnostic d) const;
    std::shared_ptr<EventSink> sink_;
};

} // namespace alkey
