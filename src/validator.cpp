#include "alkey/validator.hpp"
#include "alkey/cell.hpp"
#include "alkey/log.hpp"
#include <algorithm>
#include <unordered_set>

namespace alkey {

void Validator::fail(ValidationErrorKind k, std::string_view type, Diagnostic d) const {
    if(debug_enabled()) log_debug("validator", d.code + " " + d.message);
    if(sink_) sink_->emit_payload(events::ValidationFailed{std::string(type), k});
    throw ValidationError(k, std::string(type), std::move(d));
}

std::shared_ptr<const TypeDefinition> Validator::require(std::string_view type, TypeKind kind) const {
    auto def = reg_.lookup(type);
    if(!def)
        fail(ValidationErrorKind::UnknownType, type, make_diag("E1414", "unknown type '" + std::string(type) + "'", "define the type before constructing it"));
    if(def->kind != kind)
        fail(ValidationErrorKind::WrongKind, type, make_diag("E1415", std::string(type) + " is a " + to_string(def->kind) + " type, not a " + to_string(kind),
             kind == TypeKind::Sum ? "use construct_product" : "use construct_variant with a variant name"));
    return def;
}

static bool fail_why(std::string* why, std::string msg){ if(why) *why = std::move(msg); return false; }

bool Validator::conforms(const value& v, const TypeTag& tag, std::string* why){
    using K = TypeTag::Kind;
    auto expect = [&](bool ok){ return ok ? true : fail_why(why, "expected " + to_string(tag) + ", found " + describe(v)); };
    switch(tag.kind){
        case K::Nil: return expect(v.is_nil());
        case K::Bool: return expect(v.is<bool>());
        case K::Int: return expect(v.is<int64_t>());
        case K::Float: return expect(v.is<double>());
        case K::String: return expect(v.is<std::string>());
        case K::Keyword: return expect(v.is<keyword>());
        case K::Ref: {
            auto* p = std::get_if<instance_ptr>(&v.data);
            return expect(p && *p && (*p)->type_name == tag.type_name);
        }
        case K::Rec: {
            auto* c = std::get_if<cell_ptr>(&v.data);
            if(!c || !*c) return expect(false);
            const value* inner = (*c)->peek();
            if(!inner) return true; // pending: checked when forced
            auto* p = std::get_if<instance_ptr>(&inner->data);
            if(p && *p && (*p)->type_name == tag.type_name) return true;
            return fail_why(why, "expected cell of " + tag.type_name + ", cell holds " + describe(*inner));
        }
        case K::Seq: {
            auto* s = std::get_if<seq>(&v.data);
            if(!s) return expect(false);
            for(size_t i=0;i<s->elems.size(); ++i){
                std::string inner;
                if(!conforms(s->elems[i], *tag.elem, &inner)) return fail_why(why, "element " + std::to_string(i) + ": " + inner);
            }
            return true;
        }
        case K::Map: {
            auto* m = std::get_if<map_t>(&v.data);
            if(!m) return expect(false);
            for(auto& kv : m->entries){
                std::string inner;
                if(!conforms(kv.first, *tag.elem, &inner)) return fail_why(why, "key " + to_string(kv.first) + ": " + inner);
                if(!conforms(kv.second, *tag.val, &inner)) return fail_why(why, "value at " + to_string(kv.first) + ": " + inner);
            }
            return true;
        }
    }
    return fail_why(why, "unknown type tag");
}

instance_ptr Validator::build(const TypeDefinition& def, const VariantSpec* vs, field_list fields) const {
    Stopwatch sw;
    const auto& specs = vs ? vs->fields : def.fields;
    const std::string owner = vs ? def.name + "." + vs->name : def.name;

    std::unordered_set<std::string> given;
    for(auto& kv : fields){
        if(!given.insert(kv.first).second)
            fail(ValidationErrorKind::DuplicateField, def.name, make_diag("E1416", owner + ": field '" + kv.first + "' given more than once", "pass each field once"));
        bool declared = false;
        for(auto& s : specs) if(s.name == kv.first){ declared = true; break; }
        if(!declared)
            fail(ValidationErrorKind::UnknownField, def.name, make_diag("E1411", owner + ": unknown field '" + kv.first + "'", "declared fields are listed in the type definition"));
    }

    auto out = std::make_shared<Instance>();
    out->type_name = def.name;
    if(vs) out->variant = vs->name;
    out->revision = def.revision;
    out->fields.reserve(specs.size());
    for(auto& s : specs){
        auto it = std::find_if(fields.begin(), fields.end(), [&](const auto& kv){ return kv.first == s.name; });
        if(it == fields.end())
            fail(ValidationErrorKind::MissingField, def.name, make_diag("E1410", owner + ": missing field '" + s.name + "'", "provide a value of type " + to_string(s.tag)));
        std::string why;
        if(!conforms(it->second, s.tag, &why)){
            Diagnostic d = make_diag("E1413", owner + ": field '" + s.name + "' type mismatch", "ensure field has type " + to_string(s.tag));
            d.notes.push_back(Note{why});
            fail(ValidationErrorKind::TypeMismatch, def.name, std::move(d));
        }
        out->fields.emplace_back(s.name, std::move(it->second));
    }
    if(sink_) sink_->emit_payload(events::InstanceConstructed{def.name, out->variant, sw.elapsed()});
    return out;
}

instance_ptr Validator::construct_product(std::string_view type, field_list fields) const {
    auto def = require(type, TypeKind::Product);
    return build(*def, nullptr, std::move(fields));
}

instance_ptr Validator::construct_variant(std::string_view type, std::string_view variant, field_list fields) const {
    auto def = require(type, TypeKind::Sum);
    const VariantSpec* vs = def->variant(variant);
    if(!vs){
        Diagnostic d = make_diag("E1412", "sum " + def->name + " has no variant '" + std::string(variant) + "'", "choose one of the declared variants");
        for(auto& v : def->variants) d.notes.push_back(Note{"declared: " + v.name});
        fail(ValidationErrorKind::UnknownVariant, def->name, std::move(d));
    }
    return build(*def, vs, std::move(fields));
}

value Validator::force_checked(const cell_ptr& cell, std::string_view type) const {
    if(!cell)
        fail(ValidationErrorKind::TypeMismatch, type, make_diag("E1413", "null recursion cell for " + std::string(type)));
    const value& v = cell->force();
    auto* p = std::get_if<instance_ptr>(&v.data);
    if(!p || !*p || (*p)->type_name != type)
        fail(ValidationErrorKind::TypeMismatch, type, make_diag("E1413", "recursion cell produced " + describe(v) + ", expected instance " + std::string(type)));
    return v;
}

} // namespace alkey
