// synthesis.hpp - Builds sum-type instances from arbitrary input through ordered rules
#pragma once
#include "alkey/events.hpp"
#include "alkey/validator.hpp"
#include "alkey/value.hpp"
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace alkey {

// What a rule's builder produces: a variant and its field values, fed to construct_variant.
struct Build {
    std::string variant;
    field_list fields;
};

struct Rule {
    std::function<bool(const value&)> predicate;
    std::function<Build(const value&)> builder;
    std::string name; // diagnostics only
};

inline Rule rule(std::string name, std::function<bool(const value&)> pred, std::function<Build(const value&)> build){
    return Rule{std::move(pred), std::move(build), std::move(name)};
}

class Synthesizer {
public:
    explicit Synthesizer(const Validator& v, std::shared_ptr<EventSink> sink = {}) : validator_(v), sink_(std::move(sink)) {}

    // First rule whose predicate accepts `input` wins; later rules are not consulted. Rules need not
    // cover the input domain: no match throws SynthesisError{NoMatchingRule}. Builder output goes
    // through construct_variant, so a bad build surfaces as ValidationError. No match also emits
    // SynthesisFailed.
    instance_ptr synthesize(std::string_view type, const value& input, const std::vector<Rule>& rules) const;

private:
    const Validator& validator_;
    std::shared_ptr<EventSink> sink_;
};

} // namespace alkey
