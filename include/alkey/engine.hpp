// engine.hpp - One isolated registry with its validator, compiler, dispatcher and synthesizer
#pragma once
#include "alkey/cell.hpp"
#include "alkey/dispatch.hpp"
#include "alkey/env.hpp"
#include "alkey/events.hpp"
#include "alkey/pattern.hpp"
#include "alkey/registry.hpp"
#include "alkey/schema.hpp"
#include "alkey/synthesis.hpp"
#include "alkey/validator.hpp"
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace alkey
{

    // All components share one EventSink. Engines share nothing with each other.
    class Engine
    {
    public:
        explicit Engine(EngineEnv env = detectEnv());
        ~Engine();
        Engine(const Engine &) = delete;
        Engine &operator=(const Engine &) = delete;

        EventSink &events() { return *sink_; }
        const std::shared_ptr<EventSink> &sink() const { return sink_; }
        Registry &registry() { return registry_; }
        const Validator &validator() const { return validator_; }
        PatternCompiler &compiler() { return compiler_; }
        const Dispatcher &dispatcher() const { return dispatcher_; }
        const Synthesizer &synthesizer() const { return synthesizer_; }
        const EngineEnv &env() const { return env_; }

        void define(TypeDefinition def) { registry_.define(std::move(def)); }
        instance_ptr product(std::string_view type, field_list fields) const { return validator_.construct_product(type, std::move(fields)); }
        instance_ptr variant(std::string_view type, std::string_view variant, field_list fields) const
        {
            return validator_.construct_variant(type, variant, std::move(fields));
        }

        CompiledPattern compile(std::string_view type, std::vector<Clause> clauses) { return compiler_.compile(type, std::move(clauses)); }
        value dispatch(const CompiledPattern &p, const instance_ptr &inst) const { return dispatcher_.dispatch(p, inst); }
        // Compile (usually a cache hit after the first call) and dispatch in one step.
        value match(const instance_ptr &inst, std::vector<Clause> clauses);

        instance_ptr synthesize(std::string_view type, const value &input, const std::vector<Rule> &rules) const
        {
            return synthesizer_.synthesize(type, input, rules);
        }

        cell_ptr eager(value v) const { return eager_cell(std::move(v)); }
        // Lazy cells created here report LazyForced to this engine's sink.
        cell_ptr lazy(std::function<value()> fn) const { return lazy_cell(std::move(fn), sink_); }
        value force(const cell_ptr &cell, std::string_view type) const { return validator_.force_checked(cell, type); }

        // Loads declarations and fixtures; prints JSON diagnostics to stderr when env().diagJson is set.
        SchemaResult load(std::string_view text, std::string_view source_name = "<schema>");

    private:
        EngineEnv env_;
        std::shared_ptr<EventSink> sink_;
        Registry registry_;
        Validator validator_;
        PatternCompiler compiler_;
        Dispatcher dispatcher_;
        Synthesizer synthesizer_;
        SubscriptionHandle trace_ = 0;
    };

} // namespace alkey
