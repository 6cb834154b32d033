#pragma once
// Shared type declarations and an event recorder for the gtest suites.
#include "alkey/events.hpp"
#include "alkey/registry.hpp"
#include "alkey/types.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace alkey_test {

inline alkey::TypeDefinition point_type(){
    using namespace alkey;
    return TypeDefinition::product("Point", {{"x", scalar_tag(TypeTag::Kind::Int)}, {"y", scalar_tag(TypeTag::Kind::Int)}});
}

inline alkey::TypeDefinition option_type(){
    using namespace alkey;
    return TypeDefinition::sum("Option", {{"Some", {{"value", scalar_tag(TypeTag::Kind::Int)}}}, {"None", {}}});
}

inline alkey::TypeDefinition result_type(){
    using namespace alkey;
    return TypeDefinition::sum("Result", {{"Success", {{"value", scalar_tag(TypeTag::Kind::String)}}},
                                          {"Error", {{"message", scalar_tag(TypeTag::Kind::String)}}}});
}

// Cons cells whose tail is a recursion cell: an unbounded stream when built lazily.
inline alkey::TypeDefinition stream_type(){
    using namespace alkey;
    return TypeDefinition::sum("Stream", {{"Cons", {{"head", scalar_tag(TypeTag::Kind::Int)}, {"tail", rec_tag("Stream")}}}, {"End", {}}});
}

// Sum type with variants V0..V{n-1}, each without fields.
inline alkey::TypeDefinition enum_type(const std::string& name, size_t n){
    std::vector<alkey::VariantSpec> vs;
    for(size_t i=0;i<n;++i) vs.push_back({"V" + std::to_string(i), {}});
    return alkey::TypeDefinition::sum(name, std::move(vs));
}

// Collects every event it sees; safe to share across threads.
class Recorder {
public:
    explicit Recorder(alkey::EventSink& sink) : sink_(sink) {
        handle_ = sink_.subscribe([this](const alkey::Event& e){ std::lock_guard<std::mutex> lk(mu_); seen_.push_back(e); });
    }
    ~Recorder(){ sink_.unsubscribe(handle_); }

    size_t count(alkey::EventKind k) const {
        std::lock_guard<std::mutex> lk(mu_);
        size_t n = 0;
        for(auto& e : seen_) if(e.kind() == k) ++n;
        return n;
    }
    std::vector<alkey::Event> of(alkey::EventKind k) const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<alkey::Event> out;
        for(auto& e : seen_) if(e.kind() == k) out.push_back(e);
        return out;
    }
    size_t total() const { std::lock_guard<std::mutex> lk(mu_); return seen_.size(); }
    void clear(){ std::lock_guard<std::mutex> lk(mu_); seen_.clear(); }

private:
    alkey::EventSink& sink_;
    alkey::SubscriptionHandle handle_ = 0;
    mutable std::mutex mu_;
    std::vector<alkey::Event> seen_;
};

} // namespace alkey_test
