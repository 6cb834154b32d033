#include "alkey/pattern.hpp"
#include "alkey/log.hpp"
#include <mutex>

namespace alkey {

std::string PatternCompiler::signature_of(std::string_view type, uint64_t revision, const std::vector<Clause>& clauses){
    std::string s(type);
    s += "@" + std::to_string(revision) + ":";
    for(size_t i=0;i<clauses.size(); ++i){
        if(i) s += "|";
        s += clauses[i].variant;
        if(clauses[i].guarded()) s += "?" + (clauses[i].guard_key.empty() ? std::string("guard") : clauses[i].guard_key);
    }
    return s;
}

void PatternCompiler::fail(CompileErrorKind k, std::string_view type, Diagnostic d, std::vector<std::string> missing){
    if(debug_enabled()) log_debug("pattern", d.code + " " + d.message);
    if(sink_) sink_->emit_payload(events::CompileFailed{std::string(type), k});
    throw CompileError(k, std::move(d), std::move(missing));
}

std::shared_ptr<const DecisionTable> PatternCompiler::analyze(const TypeDefinition& def, const std::vector<Clause>& clauses, std::string signature){
    ++analyses_;
    auto table = std::make_shared<DecisionTable>();
    table->type_name = def.name;
    table->revision = def.revision;
    table->signature = std::move(signature);
    for(auto& v : def.variants) table->arms[v.name];

    std::unordered_map<std::string, size_t> unconditional; // variant -> first unguarded clause
    bool haveWildcard = false;
    bool haveUnguardedWildcard = false;
    size_t wildcardAt = 0;
    for(size_t i=0;i<clauses.size(); ++i){
        const Clause& c = clauses[i];
        if(c.variant == kWildcard){
            if(!c.guarded()){
                if(haveUnguardedWildcard)
                    fail(CompileErrorKind::DuplicateVariant, def.name, make_diag("E1421", "duplicate unconditional wildcard clause (clauses " + std::to_string(wildcardAt) + " and " + std::to_string(i) + ")", "remove one of the wildcard clauses"));
                haveUnguardedWildcard = true; wildcardAt = i;
            }
            haveWildcard = true;
            table->fallback.push_back(i);
            continue;
        }
        auto arm = table->arms.find(c.variant);
        if(arm == table->arms.end()){
            Diagnostic d = make_diag("E1422", "sum " + def.name + " has no variant '" + c.variant + "'", "match on declared variants only");
            for(auto& v : def.variants) d.notes.push_back(Note{"declared: " + v.name});
            fail(CompileErrorKind::UnknownVariant, def.name, std::move(d));
        }
        if(!c.guarded()){
            auto [it, inserted] = unconditional.emplace(c.variant, i);
            if(!inserted)
                fail(CompileErrorKind::DuplicateVariant, def.name, make_diag("E1421", "duplicate unconditional clause for variant " + c.variant +
                     " (clauses " + std::to_string(it->second) + " and " + std::to_string(i) + ")", "guard one of them or remove it"));
        }
        arm->second.push_back(i);
    }

    // A guarded clause never covers its variant on its own.
    std::vector<std::string> missing;
    for(auto& v : def.variants) if(!unconditional.count(v.name)) missing.push_back(v.name);
    if(!missing.empty() && !haveWildcard){
        std::string list;
        for(size_t i=0;i<missing.size(); ++i){ if(i) list += ", "; list += missing[i]; }
        Diagnostic d = make_diag("E1420", "non-exhaustive match over " + def.name + ": missing " + list, "add an unguarded clause per missing variant or a wildcard clause");
        for(auto& m : missing) d.notes.push_back(Note{"missing: " + m});
        fail(CompileErrorKind::NonExhaustiveMatch, def.name, std::move(d), std::move(missing));
    }
    table->exhaustive = missing.empty();
    if(table->exhaustive && !table->fallback.empty()){
        if(debug_enabled()) log_debug("pattern", "wildcard clauses over " + def.name + " are unreachable: every variant has an unguarded clause");
        table->fallback.clear();
    }
    return table;
}

CompiledPattern PatternCompiler::compile(std::string_view type, std::vector<Clause> clauses){
    Stopwatch sw;
    auto def = reg_.lookup(type);
    if(!def)
        fail(CompileErrorKind::UnknownType, type, make_diag("E1423", "unknown type '" + std::string(type) + "'", "define the sum type before compiling a match"));
    if(def->kind != TypeKind::Sum)
        fail(CompileErrorKind::NotASumType, type, make_diag("E1424", std::string(type) + " is a product type", "pattern matching applies to sum types"));
    // Handlers belong to the call site, not the cached shape.
    for(size_t i=0;i<clauses.size(); ++i)
        if(!clauses[i].handler)
            fail(CompileErrorKind::MissingHandler, def->name, make_diag("E1425", "clause " + std::to_string(i) + " (" + clauses[i].variant + ") has no handler", "attach a handler to every clause"));

    std::string sig = signature_of(def->name, def->revision, clauses);
    std::shared_ptr<const DecisionTable> table;
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        auto it = cache_.find(sig);
        if(it != cache_.end()) table = it->second;
    }
    const bool hit = table != nullptr;
    if(!hit){
        auto fresh = analyze(*def, clauses, sig);
        std::unique_lock<std::shared_mutex> lk(mu_);
        table = cache_.try_emplace(sig, std::move(fresh)).first->second;
    }
    if(debug_enabled()) log_debug("pattern", std::string(hit ? "cache hit " : "compiled ") + sig);
    if(sink_) sink_->emit_payload(events::PatternCompiled{def->name, sig, sw.elapsed(), table->exhaustive, hit});
    return CompiledPattern(std::move(table), std::move(clauses), hit);
}

size_t PatternCompiler::cache_size() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return cache_.size();
}

void PatternCompiler::clear_cache(){
    std::unique_lock<std::shared_mutex> lk(mu_);
    cache_.clear();
}

} // namespace alkey
