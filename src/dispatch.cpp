#include "alkey/dispatch.hpp"
#include "alkey/log.hpp"

namespace alkey {

void Dispatcher::fail(DispatchErrorKind k, const std::string& type, Diagnostic d) const {
    if(debug_enabled()) log_debug("dispatch", d.code + " " + d.message);
    if(sink_) sink_->emit_payload(events::DispatchFailed{type, k});
    throw DispatchError(k, std::move(d));
}

value Dispatcher::dispatch(const CompiledPattern& pattern, const Instance& inst) const {
    Stopwatch sw;
    const DecisionTable& t = pattern.table();
    if(inst.type_name != t.type_name)
        fail(DispatchErrorKind::TypeMismatch, t.type_name, make_diag("E1431", "match over " + t.type_name + " applied to an instance of " + inst.type_name, "compile a match for the instance's type"));
    if(!inst.variant)
        fail(DispatchErrorKind::TypeMismatch, t.type_name, make_diag("E1431", "instance of " + inst.type_name + " carries no variant"));
    if(inst.revision != t.revision)
        fail(DispatchErrorKind::TypeMismatch, t.type_name, make_diag("E1431", "instance of " + inst.type_name + " was built against revision " + std::to_string(inst.revision) +
             ", match compiled against revision " + std::to_string(t.revision), "recompile the match after redefining the type"));

    auto arm = t.arms.find(*inst.variant);
    if(arm == t.arms.end())
        fail(DispatchErrorKind::TypeMismatch, t.type_name, make_diag("E1431", "variant " + *inst.variant + " is not part of " + t.type_name));

    const auto& clauses = pattern.clauses();
    auto pick = [&](const std::vector<size_t>& idx) -> const Clause* {
        for(size_t i : idx){
            const Clause& c = clauses[i];
            if(!c.guard || c.guard(inst)) return &c;
        }
        return nullptr;
    };
    const Clause* chosen = pick(arm->second);
    if(!chosen) chosen = pick(t.fallback);
    if(!chosen){
        Diagnostic d = make_diag("E1430", "every guard rejected " + t.type_name + "." + *inst.variant, "add an unguarded clause for " + *inst.variant);
        d.notes.push_back(Note{"candidates: " + std::to_string(arm->second.size() + t.fallback.size())});
        fail(DispatchErrorKind::GuardExhaustionFailure, t.type_name, std::move(d));
    }
    value out = chosen->handler(inst);
    if(sink_) sink_->emit_payload(events::PatternDispatched{t.type_name, *inst.variant, sw.elapsed()});
    return out;
}

value Dispatcher::dispatch(const CompiledPattern& pattern, const instance_ptr& inst) const {
    if(!inst)
        fail(DispatchErrorKind::TypeMismatch, pattern.type_name(), make_diag("E1431", "null instance"));
    return dispatch(pattern, *inst);
}

} // namespace alkey
