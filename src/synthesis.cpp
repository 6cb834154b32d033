#include "alkey/synthesis.hpp"
#include "alkey/log.hpp"

namespace alkey {

instance_ptr Synthesizer::synthesize(std::string_view type, const value& input, const std::vector<Rule>& rules) const {
    validator_.require(type, TypeKind::Sum);
    for(size_t i=0;i<rules.size(); ++i){
        const Rule& r = rules[i];
        if(!r.predicate || !r.builder || !r.predicate(input)) continue;
        if(debug_enabled()) log_debug("synthesis", std::string(type) + " via rule " + (r.name.empty() ? "#" + std::to_string(i) : r.name));
        Build b = r.builder(input);
        return validator_.construct_variant(type, b.variant, std::move(b.fields));
    }
    Diagnostic d = make_diag("E1450", "no rule accepts " + to_string(input) + " for " + std::string(type), "add a rule covering this input");
    d.notes.push_back(Note{"rules tried: " + std::to_string(rules.size())});
    if(debug_enabled()) log_debug("synthesis", d.code + " " + d.message);
    if(sink_) sink_->emit_payload(events::SynthesisFailed{std::string(type), SynthesisErrorKind::NoMatchingRule, rules.size()});
    throw SynthesisError(SynthesisErrorKind::NoMatchingRule, std::move(d));
}

} // namespace alkey
