#pragma once
#include <string>

namespace alkey {

struct EngineEnv {
    bool debug = false;          // ALKEY_DEBUG=1
    bool traceEvents = false;    // ALKEY_TRACE_EVENTS=1
    bool diagJson = false;       // ALKEY_DIAG_JSON=1
    bool fatalHandler = false;   // ALKEY_INSTALL_FATAL_HANDLER=1
};

// Reads process env vars and constructs an EngineEnv. Unset or empty vars keep the defaults.
EngineEnv detectEnv();

// True for "1", "y", "Y", "t", "T" (first character), as used by every ALKEY_* flag.
bool env_flag(const char* name);

} // namespace alkey
