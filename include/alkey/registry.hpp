// registry.hpp - Live store of declared product and sum types
#pragma once
#include "alkey/events.hpp"
#include "alkey/types.hpp"
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace alkey {

// Definitions are immutable once installed and handed out as shared snapshots, so a reader never
// sees a partially installed shape. define() under an existing name replaces the old definition
// entirely and gives it a new revision. Concurrent define() of the same name is last-write-wins.
class Registry {
public:
    explicit Registry(std::shared_ptr<EventSink> sink = {}) : sink_(std::move(sink)) {}

    // Throws MalformedTypeDefinition; on failure nothing is installed.
    void define(TypeDefinition def);
    // Null when no type of that name is registered.
    std::shared_ptr<const TypeDefinition> lookup(std::string_view name) const;
    bool contains(std::string_view name) const { return lookup(name) != nullptr; }
    // Sorted.
    std::vector<std::string> names() const;
    size_t size() const;

    // Shape checks run by define(): non-empty names, unique field names per product/variant,
    // unique variant names, at least one variant per sum, well-formed tags.
    static void check_well_formed(const TypeDefinition& def);

private:
    std::shared_ptr<EventSink> sink_;
    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<const TypeDefinition>> defs_;
    std::atomic<uint64_t> next_revision_{1};
};

} // namespace alkey
