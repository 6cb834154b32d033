#include "alkey/registry.hpp"
#include "alkey/errors.hpp"
#include "alkey/log.hpp"
#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace alkey {

static void check_tag(const TypeDefinition& def, const std::string& where, const TypeTag& t){
    auto bad = [&](const std::string& msg){
        throw MalformedTypeDefinition(make_diag("E1406", "type " + def.name + ": " + where + ": " + msg, "use (seq T), (map K V), (rec T) or a type name"));
    };
    switch(t.kind){
        case TypeTag::Kind::Ref:
        case TypeTag::Kind::Rec: if(t.type_name.empty()) bad("type reference without a name"); break;
        case TypeTag::Kind::Seq: if(!t.elem) bad("seq without element type"); check_tag(def, where, *t.elem); break;
        case TypeTag::Kind::Map:
            if(!t.elem || !t.val) bad("map without key/value types");
            check_tag(def, where, *t.elem); check_tag(def, where, *t.val);
            break;
        default: break;
    }
}

static void check_fields(const TypeDefinition& def, const std::string& owner, const std::vector<FieldSpec>& fields, const char* dupCode){
    std::unordered_set<std::string> seen;
    for(auto& f : fields){
        if(f.name.empty())
            throw MalformedTypeDefinition(make_diag("E1405", "type " + def.name + ": " + owner + " has a field without a name", "give every field a name"));
        if(!seen.insert(f.name).second)
            throw MalformedTypeDefinition(make_diag(dupCode, "type " + def.name + ": duplicate field '" + f.name + "' in " + owner, "rename field"));
        check_tag(def, owner + " field " + f.name, f.tag);
    }
}

void Registry::check_well_formed(const TypeDefinition& def){
    if(def.name.empty())
        throw MalformedTypeDefinition(make_diag("E1400", "type definition without a name", "provide :name"));
    if(def.kind == TypeKind::Product){
        if(!def.variants.empty())
            throw MalformedTypeDefinition(make_diag("E1407", "product " + def.name + " declares variants", "declare a sum type instead"));
        check_fields(def, "product " + def.name, def.fields, "E1401");
        return;
    }
    if(!def.fields.empty())
        throw MalformedTypeDefinition(make_diag("E1407", "sum " + def.name + " declares top-level fields", "move fields into a variant"));
    if(def.variants.empty())
        throw MalformedTypeDefinition(make_diag("E1402", "sum " + def.name + " has no variants", "add at least one variant"));
    std::unordered_set<std::string> vnames;
    for(auto& v : def.variants){
        if(v.name.empty())
            throw MalformedTypeDefinition(make_diag("E1405", "sum " + def.name + " has a variant without a name", "give every variant a name"));
        if(v.name == "_")
            throw MalformedTypeDefinition(make_diag("E1405", "sum " + def.name + ": '_' is reserved for wildcard clauses", "rename variant"));
        if(!vnames.insert(v.name).second)
            throw MalformedTypeDefinition(make_diag("E1403", "sum " + def.name + ": duplicate variant '" + v.name + "'", "rename variant"));
        check_fields(def, "variant " + v.name, v.fields, "E1404");
    }
}

void Registry::define(TypeDefinition def){
    check_well_formed(def);
    def.revision = next_revision_.fetch_add(1);
    auto snapshot = std::make_shared<const TypeDefinition>(std::move(def));
    bool replaced = false;
    {
        std::unique_lock<std::shared_mutex> lk(mu_);
        auto& slot = defs_[snapshot->name];
        replaced = slot != nullptr;
        slot = snapshot;
    }
    if(debug_enabled())
        log_debug("registry", std::string(replaced ? "replaced " : "defined ") + to_string(snapshot->kind) + " " + snapshot->name + " rev=" + std::to_string(snapshot->revision));
    if(sink_) sink_->emit_payload(events::TypeDefined{snapshot->name, snapshot->kind, snapshot->member_count(), snapshot->revision});
}

std::shared_ptr<const TypeDefinition> Registry::lookup(std::string_view name) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = defs_.find(std::string(name));
    return it == defs_.end() ? nullptr : it->second;
}

std::vector<std::string> Registry::names() const {
    std::vector<std::string> out;
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        out.reserve(defs_.size());
        for(auto& kv : defs_) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t Registry::size() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return defs_.size();
}

} // namespace alkey
