#ifndef PRAM_GROUP_POPULATION_HPP
#define PRAM_GROUP_POPULATION_HPP

#include <pram/group.hpp>
#include <pram/group_query.hpp>
#include <pram/resource.hpp>
#include <pram/types.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifndef PRAM_DEFAULT_FRACTIONAL_MASS
#define PRAM_DEFAULT_FRACTIONAL_MASS false
#endif

namespace pram {

class AttributeUsageObserver;

/**
 * Mass leaving one source group during a transfer.
 */
struct MassFlowSpec {
    double pop_mass;             // Population mass when the flow was computed
    ContentHash src_hash;
    std::vector<Group> dst;
};

/**
 * Snapshot of the population taken at the end of a mass transfer.
 */
struct PopulationHistory {
    double mass = 0.0;
    double mass_in = 0.0;
    double mass_out = 0.0;
    std::unordered_map<ContentHash, double> group_masses;

    double group_mass(ContentHash hash) const {
        auto it = group_masses.find(hash);
        return (it != group_masses.end()) ? it->second : 0.0;
    }
};

/**
 * Registry of groups, sites and resources, and the engine moving mass
 * between groups.
 *
 * One iteration is apply_rules() followed by post_iteration(). apply_rules
 * computes every group's destinations against the unchanged population and
 * only then transfers mass, so rules never see a partially updated state.
 * Groups are visited in ascending content hash order.
 *
 * Mass accounting: mass() changes only through add_group (mass entering the
 * population from outside), VOID removal (debited and credited to mass_out)
 * and VITA fold-in (credited to mass_in). Transfers conserve it.
 */
class GroupPopulation {
public:
    GroupPopulation();
    ~GroupPopulation();

    GroupPopulation(const GroupPopulation&) = delete;
    GroupPopulation& operator=(const GroupPopulation&) = delete;

    // === Configuration ===

    void set_fractional_mass(bool enable) { fractional_mass_ = enable; }
    bool fractional_mass() const { return fractional_mass_; }

    // Run compact() at the end of every post_iteration()
    void set_autocompact(bool enable) { autocompact_ = enable; }
    bool autocompact() const { return autocompact_; }

    // Number of snapshots retained; shrinking drops the oldest
    void set_history_length(std::size_t len);
    std::size_t history_length() const { return history_length_; }

    void set_keep_mass_flow_specs(bool enable) { keep_mass_flow_specs_ = enable; }
    bool keep_mass_flow_specs() const { return keep_mass_flow_specs_; }

    // Not owned; nullptr disables usage recording
    void set_usage_observer(AttributeUsageObserver* observer) { observer_ = observer; }
    AttributeUsageObserver* usage_observer() const { return observer_; }

    // === Construction ===

    /**
     * Register a rule.
     * @throws SimulationConstructionError if groups already exist
     */
    GroupPopulation& add_rule(std::shared_ptr<Rule> rule);
    GroupPopulation& add_rules(const RuleList& rules);
    const RuleList& rules() const { return rules_; }

    /**
     * Register a group, or merge its mass into the registered group with the
     * same content. Sites and resources referenced by the group's relations are
     * registered too and the relations rewritten to their hashes.
     *
     * @return The registered group now holding the mass
     * @throws SimulationConstructionError if no rule has been added yet
     */
    const Group& add_group(Group group);
    GroupPopulation& add_groups(std::vector<Group> groups);

    // Register a site, or return the already registered site with equal content
    std::shared_ptr<Site> add_site(std::shared_ptr<Site> site);
    GroupPopulation& add_sites(const std::vector<std::shared_ptr<Site>>& sites);

    std::shared_ptr<Resource> add_resource(std::shared_ptr<Resource> resource);
    GroupPopulation& add_resources(const std::vector<std::shared_ptr<Resource>>& resources);

    // Mass entering at the end of the current iteration; equal content merges
    GroupPopulation& add_vita_group(Group group);
    std::size_t vita_group_count() const { return vita_groups_.size(); }
    double vita_mass() const;

    // === Iteration ===

    // Apply the given rules to every group and transfer the resulting mass
    GroupPopulation& apply_rules(const RuleList& rules, std::size_t iter, double t);

    // Same, with the registered rules
    GroupPopulation& apply_rules(std::size_t iter, double t);

    GroupPopulation& apply_rule_setup(const RuleList& rules);
    GroupPopulation& apply_rule_cleanup(const RuleList& rules);
    GroupPopulation& apply_group_setup(const GroupSetupFn& fn);

    /**
     * Move mass from the flows' sources to their destinations.
     * Every source is zeroed before any destination is credited; destinations
     * merge into registered groups with equal content or are registered anew.
     * @throws std::invalid_argument if a source is unknown or appears twice;
     *         the population is left unchanged
     */
    GroupPopulation& transfer_mass(std::vector<MassFlowSpec> flows);

    // Retire VOID groups, then fold VITA groups in
    GroupPopulation& post_iteration();

    // Drop zero-mass groups
    GroupPopulation& compact();

    // Snapshot the current state (no-op when the history length is 0)
    void archive();

    // === Queries ===

    // Group with exactly this content, or nullptr
    const Group* get_group(const AttrMap& attrs, const RelMap& rels = {}) const;

    std::vector<const Group*> get_groups(const GroupQuery* qry = nullptr) const;

    /**
     * Mass of matching groups. With hist_delta > 0, the change of that mass
     * relative to the snapshot hist_delta archives back (the most recent
     * snapshot being 1); 0.0 while fewer snapshots exist.
     *
     * @throws std::out_of_range if hist_delta exceeds the history length
     */
    double get_groups_mass(const GroupQuery* qry = nullptr, std::size_t hist_delta = 0) const;

    double get_groups_mass_prop(const GroupQuery* qry = nullptr) const;
    std::pair<double, double> get_groups_mass_and_prop(const GroupQuery* qry = nullptr) const;

    std::size_t group_count(bool only_non_empty = false) const;
    std::size_t site_count() const { return sites_.size(); }
    std::size_t resource_count() const { return resources_.size(); }

    double mass() const { return mass_; }
    double mass_in() const { return mass_in_; }
    double mass_out() const { return mass_out_; }

    std::string next_group_name() const;

    // @throws std::out_of_range if no such site is registered
    const Site& site(EntityHash hash) const;
    std::shared_ptr<Site> find_site(EntityHash hash) const;
    std::shared_ptr<Resource> find_resource(EntityHash hash) const;

    // Site the group's SITE_AT relation points to, or nullptr
    const Site* site_at(const Group& group) const;

    const std::map<EntityHash, std::shared_ptr<Site>>& sites() const { return sites_; }
    const std::map<EntityHash, std::shared_ptr<Resource>>& resources() const { return resources_; }

    // Total mass moved by the last transfer
    double last_mass_flow_total() const { return last_mass_flow_total_; }
    const std::vector<MassFlowSpec>& last_mass_flow_specs() const { return last_mass_flow_specs_; }

    const std::deque<PopulationHistory>& history() const { return history_; }

    std::string summary() const;

private:
    using SplitFn = std::function<std::optional<std::vector<Group>>(const Group&)>;

    // Split every non-empty group with fn and transfer the result
    GroupPopulation& split_all(const SplitFn& fn);

    Group& register_group(Group group, bool count_mass);
    RelValue register_entity(const RelValue& value);
    void relink_sites();
    void reset_cache() const;

    std::map<ContentHash, std::unique_ptr<Group>> groups_;
    std::map<EntityHash, std::shared_ptr<Site>> sites_;
    std::map<EntityHash, std::shared_ptr<Resource>> resources_;
    std::map<ContentHash, Group> vita_groups_;
    RuleList rules_;

    double mass_ = 0.0;
    double mass_in_ = 0.0;
    double mass_out_ = 0.0;

    // Configuration
    bool fractional_mass_ = PRAM_DEFAULT_FRACTIONAL_MASS;
    bool autocompact_ = false;
    std::size_t history_length_ = 0;
    bool keep_mass_flow_specs_ = false;
    AttributeUsageObserver* observer_ = nullptr;

    // Last iteration
    double last_mass_flow_total_ = 0.0;
    std::vector<MassFlowSpec> last_mass_flow_specs_;

    std::deque<PopulationHistory> history_;

    // Query result caches, keyed by GroupQuery::cache_key()
    mutable std::unordered_map<ContentHash, std::vector<const Group*>> cache_groups_;
    mutable std::unordered_map<ContentHash, double> cache_mass_;
};

} // namespace pram

#endif // PRAM_GROUP_POPULATION_HPP
