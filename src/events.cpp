#include "alkey/events.hpp"
#include <algorithm>

namespace alkey {

const char* to_string(EventKind k){
    switch(k){
        case EventKind::TypeDefined: return "TypeDefined";
        case EventKind::InstanceConstructed: return "InstanceConstructed";
        case EventKind::PatternCompiled: return "PatternCompiled";
        case EventKind::PatternDispatched: return "PatternDispatched";
        case EventKind::ValidationFailed: return "ValidationFailed";
        case EventKind::LazyForced: return "LazyForced";
        case EventKind::CompileFailed: return "CompileFailed";
        case EventKind::DispatchFailed: return "DispatchFailed";
        case EventKind::SynthesisFailed: return "SynthesisFailed";
    }
    return "?";
}

EventPredicate any_kind(){ return [](EventKind){ return true; }; }

EventPredicate kinds(std::initializer_list<EventKind> ks){
    std::vector<EventKind> wanted(ks);
    return [wanted](EventKind k){ return std::find(wanted.begin(), wanted.end(), k) != wanted.end(); };
}

SubscriptionHandle EventSink::subscribe(EventPredicate pred, EventCallback cb){
    if(!pred) pred = any_kind();
    std::lock_guard<std::mutex> lk(mu_);
    SubscriptionHandle id = next_++;
    subs_.push_back(std::make_shared<const Subscriber>(Subscriber{id, std::move(pred), std::move(cb)}));
    return id;
}

bool EventSink::unsubscribe(SubscriptionHandle h){
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(subs_.begin(), subs_.end(), [&](const auto& s){ return s->id == h; });
    if(it == subs_.end()) return false;
    subs_.erase(it);
    return true;
}

void EventSink::emit(const Event& e) const {
    std::vector<std::shared_ptr<const Subscriber>> snapshot;
    {
        std::lock_guard<std::mutex> lk(mu_);
        snapshot = subs_;
    }
    const EventKind k = e.kind();
    for(auto& s : snapshot){
        if(s->cb && s->pred(k)) s->cb(e);
    }
}

bool EventSink::empty() const {
    std::lock_guard<std::mutex> lk(mu_);
    return subs_.empty();
}

size_t EventSink::subscriber_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return subs_.size();
}

} // namespace alkey
