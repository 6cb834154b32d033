// pattern.hpp - Compiles match clauses over a sum type into cached decision tables
#pragma once
#include "alkey/errors.hpp"
#include "alkey/events.hpp"
#include "alkey/registry.hpp"
#include "alkey/value.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace alkey {

using Guard = std::function<bool(const Instance&)>;
using Handler = std::function<value(const Instance&)>;

// Variant name of a clause that matches any variant.
inline const std::string kWildcard = "_";

struct Clause {
    std::string variant;   // declared variant name or kWildcard
    Guard guard;           // empty: unconditional
    std::string guard_key; // fingerprint of the guard in the cache key
    Handler handler;

    bool guarded() const { return static_cast<bool>(guard); }
};

inline Clause on(std::string variant, Handler h){ return Clause{std::move(variant), {}, {}, std::move(h)}; }
inline Clause on_if(std::string variant, Guard g, Handler h, std::string guard_key = "guard"){
    return Clause{std::move(variant), std::move(g), std::move(guard_key), std::move(h)};
}
inline Clause otherwise(Handler h){ return Clause{kWildcard, {}, {}, std::move(h)}; }

// Shape-only part of a compiled match, shared by every call site with the same clause signature.
struct DecisionTable {
    std::string type_name;
    uint64_t revision = 0;
    std::string signature;
    // variant -> indices of clauses naming it, in declaration order
    std::unordered_map<std::string, std::vector<size_t>> arms;
    // wildcard clause indices, consulted after a variant's own clauses; empty when exhaustive
    std::vector<size_t> fallback;
    // every declared variant has an unguarded clause
    bool exhaustive = false;
};

// A decision table bound to one call site's guards and handlers.
class CompiledPattern {
public:
    const DecisionTable& table() const { return *table_; }
    const std::vector<Clause>& clauses() const { return clauses_; }
    const std::string& type_name() const { return table_->type_name; }
    bool cache_hit() const { return cache_hit_; }
private:
    friend class PatternCompiler;
    CompiledPattern(std::shared_ptr<const DecisionTable> t, std::vector<Clause> c, bool hit)
        : table_(std::move(t)), clauses_(std::move(c)), cache_hit_(hit) {}
    std::shared_ptr<const DecisionTable> table_;
    std::vector<Clause> clauses_;
    bool cache_hit_ = false;
};

// Each declared variant needs an unguarded clause, or the match needs a wildcard (guarded or
// not); guarded clauses alone never cover a variant. A variant left to guarded clauses and a
// guarded wildcard can still fail at dispatch with GuardExhaustionFailure. Once every variant has
// an unguarded clause, wildcard clauses are unreachable and the table has no fallback. Two
// unguarded clauses for one variant (or two unguarded wildcards) are a DuplicateVariant error.
// Analysis runs once per distinct signature (type, definition revision, clause shape); later
// compiles reuse the cached table. Handlers are checked on every compile.
class PatternCompiler {
public:
    explicit PatternCompiler(const Registry& reg, std::shared_ptr<EventSink> sink = {}) : reg_(reg), sink_(std::move(sink)) {}

    // Throws CompileError.
    CompiledPattern compile(std::string_view type, std::vector<Clause> clauses);

    // e.g. "Option@3:Some|None?positive|_"
    static std::string signature_of(std::string_view type, uint64_t revision, const std::vector<Clause>& clauses);

    size_t analysis_count() const { return analyses_.load(); }
    size_t cache_size() const;
    void clear_cache();

private:
    std::shared_ptr<const DecisionTable> analyze(const TypeDefinition& def, const std::vector<Clause>& clauses, std::string signature);
    [[noreturn]] void fail(CompileErrorKind k, std::string_view type, Diagnostic d, std::vector<std::string> missing = {});

    const Registry& reg_;
    std::shared_ptr<EventSink> sink_;
    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<const DecisionTable>> cache_;
    std::atomic<size_t> analyses_{0};
};

} // namespace alkey
