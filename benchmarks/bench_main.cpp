#include "alkey/engine.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using namespace alkey;

static double ms_since(Clock::time_point t0){ return std::chrono::duration<double, std::milli>(Clock::now() - t0).count(); }

// Sum type with n fieldless variants V0..V{n-1} and the clause list covering all of them.
static std::vector<Clause> declare_wide(Engine& e, const std::string& name, size_t n){
    std::vector<VariantSpec> vs;
    std::vector<Clause> cs;
    for(size_t i=0;i<n;++i){
        std::string v = "V" + std::to_string(i);
        vs.push_back({v, {}});
        cs.push_back(on(v, [i](const Instance&){ return value(static_cast<int64_t>(i)); }));
    }
    e.define(TypeDefinition::sum(name, std::move(vs)));
    return cs;
}

int main(){
    Engine engine(EngineEnv{});
    const int iters = 20000;

    for(size_t width : {4u, 32u, 256u}){
        std::string name = "Wide" + std::to_string(width);
        auto clauses = declare_wide(engine, name, width);

        auto t0 = Clock::now();
        auto compiled = engine.compile(name, clauses);
        double msMiss = ms_since(t0);

        t0 = Clock::now();
        for(int i=0;i<iters;++i) (void)engine.compile(name, clauses);
        double msHit = ms_since(t0) / iters;

        auto inst = engine.variant(name, "V" + std::to_string(width - 1), {});
        t0 = Clock::now();
        int64_t sum = 0;
        for(int i=0;i<iters;++i) sum += engine.dispatch(compiled, inst).as<int64_t>();
        double msDispatch = ms_since(t0) / iters;

        std::cout << "[bench] " << name << " compile(miss)=" << msMiss << "ms compile(hit)=" << msHit
                  << "ms dispatch=" << msDispatch << "ms checksum=" << sum << "\n";
    }

    std::vector<cell_ptr> cells;
    for(int i=0;i<iters;++i) cells.push_back(engine.lazy([i]{ return value(i); }));
    auto t0 = Clock::now();
    for(auto& c : cells) (void)c->force();
    double msFirst = ms_since(t0) / iters;
    t0 = Clock::now();
    for(auto& c : cells) (void)c->force();
    double msMemo = ms_since(t0) / iters;
    std::cout << "[bench] lazy force(first)=" << msFirst << "ms force(memoized)=" << msMemo << "ms\n";
    return 0;
}
