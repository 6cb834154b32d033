#include "alkey/engine.hpp"
#include "alkey/diagnostics_json.hpp"
#include "alkey/log.hpp"
#include <cstdio>

namespace alkey {

Engine::Engine(EngineEnv env)
    : env_(env), sink_(std::make_shared<EventSink>()), registry_(sink_), validator_(registry_, sink_),
      compiler_(registry_, sink_), dispatcher_(sink_), synthesizer_(validator_, sink_) {
    if(env_.traceEvents) trace_ = attach_event_logger(*sink_);
}

Engine::~Engine(){
    if(trace_) sink_->unsubscribe(trace_);
}

value Engine::match(const instance_ptr& inst, std::vector<Clause> clauses){
    if(!inst)
        throw DispatchError(DispatchErrorKind::TypeMismatch, make_diag("E1431", "null instance"));
    auto p = compiler_.compile(inst->type_name, std::move(clauses));
    return dispatcher_.dispatch(p, *inst);
}

SchemaResult Engine::load(std::string_view text, std::string_view source_name){
    SchemaResult r = load_schema(registry_, validator_, text, source_name);
    if(env_.diagJson) std::fprintf(stderr, "%s\n", diagnostics_to_json(r).c_str());
    return r;
}

} // namespace alkey
