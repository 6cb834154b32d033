// events.hpp - Observability sink: the only boundary surface of the engine
#pragma once
#include "alkey/errors.hpp"
#include "alkey/types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace alkey {

// Order matches the alternatives of event_payload.
enum class EventKind { TypeDefined, InstanceConstructed, PatternCompiled, PatternDispatched, ValidationFailed, LazyForced, CompileFailed, DispatchFailed, SynthesisFailed };

using event_duration = std::chrono::nanoseconds;

namespace events {
struct TypeDefined { std::string name; TypeKind kind; size_t member_count; uint64_t revision; };
struct InstanceConstructed { std::string type; std::optional<std::string> variant; event_duration duration; };
struct PatternCompiled { std::string type; std::string clause_signature; event_duration duration; bool exhaustive; bool cache_hit; };
struct PatternDispatched { std::string type; std::string variant; event_duration duration; };
struct ValidationFailed { std::string type; ValidationErrorKind error_kind; };
struct LazyForced { uint64_t cell_id; event_duration duration; };
struct CompileFailed { std::string type; CompileErrorKind error_kind; };
struct DispatchFailed { std::string type; DispatchErrorKind error_kind; };
struct SynthesisFailed { std::string type; SynthesisErrorKind error_kind; size_t rules_tried; };
} // namespace events

using event_payload = std::variant<events::TypeDefined, events::InstanceConstructed, events::PatternCompiled, events::PatternDispatched,
                                   events::ValidationFailed, events::LazyForced, events::CompileFailed, events::DispatchFailed, events::SynthesisFailed>;

struct Event {
    event_payload payload;
    EventKind kind() const { return static_cast<EventKind>(payload.index()); }
    template<typename T> const T* get() const { return std::get_if<T>(&payload); }
};

const char* to_string(EventKind k);

using SubscriptionHandle = uint64_t;
using EventPredicate = std::function<bool(EventKind)>;
using EventCallback = std::function<void(const Event&)>;

EventPredicate any_kind();
EventPredicate kinds(std::initializer_list<EventKind> ks);

// Subscribers are called synchronously, in-line with the emitting operation and outside the
// sink's lock, so a callback may subscribe or unsubscribe. No ordering across subscribers.
// A callback must return quickly; slow consumers hand off to their own queue.
class EventSink {
public:
    SubscriptionHandle subscribe(EventPredicate pred, EventCallback cb);
    SubscriptionHandle subscribe(EventCallback cb){ return subscribe(any_kind(), std::move(cb)); }
    // Returns false for an unknown (or already removed) handle.
    bool unsubscribe(SubscriptionHandle h);
    void emit(const Event& e) const;
    template<typename P> void emit_payload(P p) const { if(!empty()) emit(Event{event_payload{std::move(p)}}); }
    bool empty() const;
    size_t subscriber_count() const;
private:
    struct Subscriber { SubscriptionHandle id; EventPredicate pred; EventCallback cb; };
    mutable std::mutex mu_;
    std::vector<std::shared_ptr<const Subscriber>> subs_;
    SubscriptionHandle next_ = 1;
};

// Steady-clock stopwatch used for the duration fields of events.
class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}
    event_duration elapsed() const { return std::chrono::duration_cast<event_duration>(std::chrono::steady_clock::now() - start_); }
private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace alkey
