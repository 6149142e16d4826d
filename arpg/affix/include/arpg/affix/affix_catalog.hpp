#pragma once

#include <arpg/affix/affix_definition.hpp>
#include <arpg/data/json_loader.hpp>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace arpg::affix {

// ============================================================================
// AffixCatalog - Registry of affix definitions keyed by id
// ============================================================================

class AffixCatalog {
public:
    AffixCatalog() = default;

    // Validate and store a definition. Rejected definitions are logged and
    // reported through out_error. Re-registering an id replaces it. A stat key
    // already owned by another id is rejected.
    bool register_definition(AffixDefinition def, std::string* out_error = nullptr);

    // Lookup
    const AffixDefinition* get(std::string_view id) const;
    const AffixDefinition* find_by_stat(std::string_view stat_key) const;
    bool contains(std::string_view id) const { return get(id) != nullptr; }

    std::vector<const AffixDefinition*> get_by_category(items::AffixCategory category) const;
    std::vector<std::string> get_all_ids() const;

    // Iterate all definitions in id order
    void each(const std::function<void(const AffixDefinition&)>& fn) const;

    size_t size() const { return m_definitions.size(); }
    bool empty() const { return m_definitions.empty(); }
    void clear();

    // Register every definition from a JSON document ({"affixes": [...]} or a bare array).
    // Definitions that fail to parse or validate end up in the result's errors.
    data::LoadResult<std::string> load_from_json(const nlohmann::json& root);
    data::LoadResult<std::string> load_from_file(const std::string& path);

private:
    std::map<std::string, AffixDefinition, std::less<>> m_definitions;
    std::map<std::string, std::string, std::less<>> m_stat_to_id;
};

// ============================================================================
// Built-in content
// ============================================================================

// Regular affixes, the four legacy conditionals and the designed chase conditionals
void register_builtin_affixes(AffixCatalog& catalog);

// Shared read-only catalog populated with the built-in content
const AffixCatalog& builtin_affix_catalog();

} // namespace arpg::affix
