// log.hpp - Debug logging and event tracing on top of LLVM's raw_ostream
#pragma once
#include "alkey/events.hpp"
#include <string>
#include <string_view>

namespace llvm { class raw_ostream; }

namespace alkey {

// ALKEY_DEBUG is re-read on every call so tests can toggle it.
bool debug_enabled();

// Writes "[alkey][component] message" to llvm::errs() when debug logging is enabled.
void log_debug(std::string_view component, const std::string& message);

// One-line rendering of an event, e.g. "PatternCompiled type=Option sig=... hit=1".
std::string describe(const Event& e);

// Subscribes a logger that prints every event to `os` (llvm::errs() when null).
SubscriptionHandle attach_event_logger(EventSink& sink, llvm::raw_ostream* os = nullptr);

// With ALKEY_INSTALL_FATAL_HANDLER=1, installs LLVM's fatal error handler and a signal handler
// printing a stack trace. Returns whether a handler is installed.
bool install_fatal_handler_if_requested();

} // namespace alkey
