#include "alkey/env.hpp"
#include <cstdlib>

namespace alkey {

bool env_flag(const char* name){
    const char* v = std::getenv(name);
    if(!v || !*v) return false;
    return v[0]=='1'||v[0]=='y'||v[0]=='Y'||v[0]=='t'||v[0]=='T';
}

EngineEnv detectEnv(){
    EngineEnv e{};
    e.debug = env_flag("ALKEY_DEBUG");
    e.traceEvents = env_flag("ALKEY_TRACE_EVENTS");
    e.diagJson = env_flag("ALKEY_DIAG_JSON");
    e.fatalHandler = env_flag("ALKEY_INSTALL_FATAL_HANDLER");
    return e;
}

} // namespace alkey
