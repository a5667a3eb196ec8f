#ifndef PRAM_GROUP_HPP
#define PRAM_GROUP_HPP

#include <pram/types.hpp>
#include <pram/group_split_spec.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pram {

class AttributeUsageObserver;
class Group;
class GroupPopulation;
class Rule;
class Site;

using RuleList = std::vector<std::shared_ptr<Rule>>;

// One-shot initializer applied to every group before the first iteration
using GroupSetupFn = std::function<std::optional<std::vector<GroupSplitSpec>>(const GroupPopulation&, const Group&)>;

/**
 * A set of functionally identical agents.
 *
 * Identity is the (attributes, relations) content; name and mass never take
 * part in it. The content hash is computed on first use and reset by every
 * mutation. Once a population registers a group its content is frozen:
 * setters throw GroupFrozenError unless called with force = true.
 */
class Group {
public:
    enum class State : std::uint8_t {
        STANDALONE,
        REGISTERED
    };

    // Which rule callback drives apply_rules
    enum class Stage : std::uint8_t {
        ITERATION,     // Rule::apply on applicable rules
        RULE_SETUP,    // Rule::setup, no applicability check
        RULE_CLEANUP   // Rule::cleanup, no applicability check
    };

    explicit Group(std::string name = "", double mass = 0.0, AttrMap attrs = {}, RelMap rels = {});

    const std::string& name() const { return name_; }
    double mass() const { return mass_; }
    const AttrMap& attrs() const { return attrs_; }
    const RelMap& rels() const { return rels_; }

    State state() const { return state_; }
    bool is_registered() const { return state_ == State::REGISTERED; }

    ContentHash hash() const;
    static ContentHash gen_hash(const AttrMap& attrs, const RelMap& rels);

    // Base map with set applied, then every key in del removed
    static AttrMap make_attrs(const AttrMap& base, const AttrMap& set, const KeySet& del);
    static RelMap make_rels(const RelMap& base, const RelMap& set, const KeySet& del);

    // === Read side (usage is reported to the observer when one is given) ===

    const Value* get_attr(const std::string& name, AttributeUsageObserver* observer = nullptr) const;
    const RelValue* get_rel(const std::string& name, AttributeUsageObserver* observer = nullptr) const;

    bool has_attr(const std::string& name, AttributeUsageObserver* observer = nullptr) const;
    bool has_attr(const std::vector<std::string>& names, AttributeUsageObserver* observer = nullptr) const;
    bool has_attr(const AttrMap& attrs, AttributeUsageObserver* observer = nullptr) const;

    bool has_rel(const std::string& name, AttributeUsageObserver* observer = nullptr) const;
    bool has_rel(const std::vector<std::string>& names, AttributeUsageObserver* observer = nullptr) const;
    bool has_rel(const RelMap& rels, AttributeUsageObserver* observer = nullptr) const;

    bool is_void() const { return attrs_.count(VOID_ATTR) > 0; }

    // Hash of the site the group is at (its SITE_AT relation), if any
    std::optional<EntityHash> site_at() const;
    bool is_at_site(const Site& site) const;

    // True if relation rel_name exists and points where SITE_AT does
    bool is_at_site_name(const std::string& rel_name) const;

    // === Write side ===

    Group& set_attr(const std::string& name, Value value, bool force = false);
    Group& set_attrs(const AttrMap& attrs, bool force = false);
    Group& set_rel(const std::string& name, RelValue value, bool force = false);
    Group& set_rels(const RelMap& rels, bool force = false);

    // Mutable copy; name, mass and content are preserved
    Group standalone_copy() const;

    // === Splitting ===

    /**
     * Destination groups for the given split specs (see partition_mass).
     * Destinations carry this group's name and are standalone; entity
     * references in rel_set are kept as references and resolved when the
     * population registers the destination.
     */
    std::vector<Group> split(const std::vector<GroupSplitSpec>& specs, bool allow_fractional) const;

    /**
     * Combine the rules' split specs for this group and split accordingly.
     * Rules answering nullopt or an empty list make no claim.
     * @return Destination groups, or nullopt if no rule made a claim
     */
    std::optional<std::vector<Group>> apply_rules(const GroupPopulation& pop, const RuleList& rules,
                                                  std::size_t iter, double t,
                                                  Stage stage = Stage::ITERATION) const;

    std::optional<std::vector<Group>> apply_group_setup(const GroupPopulation& pop, const GroupSetupFn& fn) const;

    std::string to_string() const;

    bool operator==(const Group& other) const { return hash() == other.hash(); }
    bool operator!=(const Group& other) const { return !(*this == other); }

private:
    friend class GroupPopulation;

    void check_mutable(bool force, const std::string& what) const;
    void reset_hash() { cached_hash_.reset(); }

    std::optional<std::vector<Group>> split_claims(const std::vector<std::vector<GroupSplitSpec>>& claims,
                                                   bool allow_fractional) const;

    std::string name_;
    double mass_;
    AttrMap attrs_;
    RelMap rels_;
    State state_ = State::STANDALONE;

    mutable std::optional<ContentHash> cached_hash_;
};

} // namespace pram

#endif // PRAM_GROUP_HPP
