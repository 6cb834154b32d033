#include "alkey/log.hpp"
#include "alkey/env.hpp"

#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/PrettyStackTrace.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/raw_ostream.h>
#include <cstdio>
#include <sstream>

namespace alkey {

bool debug_enabled(){ return env_flag("ALKEY_DEBUG"); }

void log_debug(std::string_view component, const std::string& message){
    if(!debug_enabled()) return;
    llvm::errs() << "[alkey][" << llvm::StringRef(component.data(), component.size()) << "] " << message << "\n";
}

static std::string micros(event_duration d){
    std::ostringstream os; os << (static_cast<double>(d.count()) / 1000.0) << "us";
    return os.str();
}

std::string describe(const Event& e){
    std::ostringstream os;
    os << to_string(e.kind());
    if(auto* p = e.get<events::TypeDefined>())
        os << " name=" << p->name << " kind=" << to_string(p->kind) << " members=" << p->member_count << " rev=" << p->revision;
    else if(auto* p = e.get<events::InstanceConstructed>())
        os << " type=" << p->type << (p->variant ? " variant=" + *p->variant : std::string()) << " took=" << micros(p->duration);
    else if(auto* p = e.get<events::PatternCompiled>())
        os << " type=" << p->type << " sig=" << p->clause_signature << " exhaustive=" << p->exhaustive << " hit=" << p->cache_hit << " took=" << micros(p->duration);
    else if(auto* p = e.get<events::PatternDispatched>())
        os << " type=" << p->type << " variant=" << p->variant << " took=" << micros(p->duration);
    else if(auto* p = e.get<events::ValidationFailed>())
        os << " type=" << p->type << " error=" << to_string(p->error_kind);
    else if(auto* p = e.get<events::LazyForced>())
        os << " cell=" << p->cell_id << " took=" << micros(p->duration);
    else if(auto* p = e.get<events::CompileFailed>())
        os << " type=" << p->type << " error=" << to_string(p->error_kind);
    else if(auto* p = e.get<events::DispatchFailed>())
        os << " type=" << p->type << " error=" << to_string(p->error_kind);
    else if(auto* p = e.get<events::SynthesisFailed>())
        os << " type=" << p->type << " error=" << to_string(p->error_kind) << " rules=" << p->rules_tried;
    return os.str();
}

SubscriptionHandle attach_event_logger(EventSink& sink, llvm::raw_ostream* os){
    llvm::raw_ostream* out = os ? os : &llvm::errs();
    return sink.subscribe([out](const Event& e){ *out << "[alkey][event] " << describe(e) << "\n"; });
}

static void alkeyFatalHandler(void* userData, const char* reason, bool genCrashDiag){
    (void)userData; (void)genCrashDiag;
    fprintf(stderr, "[fatal][llvm] %s\n", reason ? reason : "<null reason>");
    llvm::sys::PrintStackTrace(llvm::errs());
    fprintf(stderr, "[fatal][llvm] end stack trace\n");
}

bool install_fatal_handler_if_requested(){
    static bool installed = false;
    if(installed) return true;
    if(!env_flag("ALKEY_INSTALL_FATAL_HANDLER")) return false;
    llvm::install_fatal_error_handler(alkeyFatalHandler);
    llvm::EnablePrettyStackTrace();
    llvm::sys::AddSignalHandler([](void*){
        fprintf(stderr, "[fatal][signal] caught fatal signal, printing stack trace...\n");
        llvm::sys::PrintStackTrace(llvm::errs());
        fprintf(stderr, "[fatal][signal] end stack trace\n");
    }, nullptr);
    installed = true;
    fprintf(stderr, "[diag] Installed LLVM fatal error handler (ALKEY_INSTALL_FATAL_HANDLER=1)\n");
    return installed;
}

} // namespace alkey
