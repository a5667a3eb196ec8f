#include <pram/group_population.hpp>
#include <pram/debug_log.hpp>
#include <pram/errors.hpp>
#include <pram/rule.hpp>
#include <pram/split.hpp>
#include <pram/usage_observer.hpp>
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>

namespace pram {

namespace {

// Relative difference tolerated between a flow's source and destination masses
constexpr double MASS_TOLERANCE = 1e-9;

} // namespace

GroupPopulation::GroupPopulation() = default;
GroupPopulation::~GroupPopulation() = default;

void GroupPopulation::set_history_length(std::size_t len) {
    history_length_ = len;
    while (history_.size() > history_length_) {
        history_.pop_front();
    }
}

/*
 * Construction
 */

GroupPopulation& GroupPopulation::add_rule(std::shared_ptr<Rule> rule) {
    if (!rule) {
        throw std::invalid_argument("Cannot add a null rule");
    }
    if (!groups_.empty()) {
        throw SimulationConstructionError("Rule '" + rule->name() +
                                          "' added after groups; add all rules before any group");
    }
    rules_.push_back(std::move(rule));
    return *this;
}

GroupPopulation& GroupPopulation::add_rules(const RuleList& rules) {
    for (const auto& rule : rules) {
        add_rule(rule);
    }
    return *this;
}

const Group& GroupPopulation::add_group(Group group) {
    if (rules_.empty()) {
        throw SimulationConstructionError("Group '" + group.name() +
                                          "' added before any rule; add rules first");
    }
    Group& registered = register_group(std::move(group), true);
    relink_sites();
    reset_cache();
    return registered;
}

GroupPopulation& GroupPopulation::add_groups(std::vector<Group> groups) {
    if (groups.empty()) {
        return *this;
    }
    if (rules_.empty()) {
        throw SimulationConstructionError("Groups added before any rule; add rules first");
    }
    for (auto& g : groups) {
        register_group(std::move(g), true);
    }
    relink_sites();
    reset_cache();
    return *this;
}

Group& GroupPopulation::register_group(Group group, bool count_mass) {
    if (count_mass) {
        mass_ += group.mass_;
    }

    ContentHash h = group.hash();
    auto it = groups_.find(h);
    if (it != groups_.end()) {
        it->second->mass_ += group.mass_;
        PRAM_DEBUG_LOG("Merged %.3f into group %016llx (now %.3f)",
                       group.mass_, static_cast<unsigned long long>(h), it->second->mass_);
        return *it->second;
    }

    for (auto& [key, value] : group.rels_) {
        if (value.is_entity()) {
            value = register_entity(value);
        }
    }
    group.reset_hash();
    group.state_ = Group::State::REGISTERED;

    auto inserted = groups_.emplace(h, std::make_unique<Group>(std::move(group))).first;
    PRAM_DEBUG_LOG("Registered group '%s' %016llx with mass %.3f",
                   inserted->second->name_.c_str(), static_cast<unsigned long long>(h), inserted->second->mass_);
    return *inserted->second;
}

RelValue GroupPopulation::register_entity(const RelValue& value) {
    const auto& entity = value.entity();
    if (!entity) {
        throw std::invalid_argument("Relation holds a null entity reference");
    }
    if (auto site = std::dynamic_pointer_cast<Site>(entity)) {
        return RelValue(add_site(site)->entity_hash());
    }
    return RelValue(add_resource(entity)->entity_hash());
}

std::shared_ptr<Site> GroupPopulation::add_site(std::shared_ptr<Site> site) {
    if (!site) {
        throw std::invalid_argument("Cannot add a null site");
    }
    EntityHash h = site->entity_hash();
    auto it = sites_.find(h);
    if (it != sites_.end()) {
        return it->second;
    }
    sites_.emplace(h, site);
    if (!groups_.empty()) {
        relink_sites();
    }
    return site;
}

GroupPopulation& GroupPopulation::add_sites(const std::vector<std::shared_ptr<Site>>& sites) {
    for (const auto& site : sites) {
        add_site(site);
    }
    return *this;
}

std::shared_ptr<Resource> GroupPopulation::add_resource(std::shared_ptr<Resource> resource) {
    if (!resource) {
        throw std::invalid_argument("Cannot add a null resource");
    }
    EntityHash h = resource->entity_hash();
    auto it = resources_.find(h);
    if (it != resources_.end()) {
        return it->second;
    }
    resources_.emplace(h, resource);
    return resource;
}

GroupPopulation& GroupPopulation::add_resources(const std::vector<std::shared_ptr<Resource>>& resources) {
    for (const auto& resource : resources) {
        add_resource(resource);
    }
    return *this;
}

GroupPopulation& GroupPopulation::add_vita_group(Group group) {
    ContentHash h = group.hash();
    auto it = vita_groups_.find(h);
    if (it != vita_groups_.end()) {
        it->second.mass_ += group.mass_;
    } else {
        vita_groups_.emplace(h, std::move(group));
    }
    return *this;
}

double GroupPopulation::vita_mass() const {
    std::vector<double> masses;
    masses.reserve(vita_groups_.size());
    for (const auto& entry : vita_groups_) {
        masses.push_back(entry.second.mass());
    }
    return accurate_sum(masses);
}

/*
 * Iteration
 */

GroupPopulation& GroupPopulation::split_all(const SplitFn& fn) {
    // (1) Compute every source's destinations against the unchanged population
    std::vector<MassFlowSpec> flows;
    for (const auto& [h, g] : groups_) {
        if (g->mass() <= 0.0) {
            continue;
        }
        auto dst = fn(*g);
        if (dst.has_value()) {
            flows.push_back(MassFlowSpec{mass_, h, std::move(*dst)});
        }
    }

    if (flows.empty()) {
        return *this;
    }

    // (2) Apply
    return transfer_mass(std::move(flows));
}

GroupPopulation& GroupPopulation::apply_rules(const RuleList& rules, std::size_t iter, double t) {
    return split_all([&](const Group& g) {
        return g.apply_rules(*this, rules, iter, t, Group::Stage::ITERATION);
    });
}

GroupPopulation& GroupPopulation::apply_rules(std::size_t iter, double t) {
    return apply_rules(rules_, iter, t);
}

GroupPopulation& GroupPopulation::apply_rule_setup(const RuleList& rules) {
    return split_all([&](const Group& g) {
        return g.apply_rules(*this, rules, 0, 0.0, Group::Stage::RULE_SETUP);
    });
}

GroupPopulation& GroupPopulation::apply_rule_cleanup(const RuleList& rules) {
    return split_all([&](const Group& g) {
        return g.apply_rules(*this, rules, 0, 0.0, Group::Stage::RULE_CLEANUP);
    });
}

GroupPopulation& GroupPopulation::apply_group_setup(const GroupSetupFn& fn) {
    return split_all([&](const Group& g) {
        return g.apply_group_setup(*this, fn);
    });
}

GroupPopulation& GroupPopulation::transfer_mass(std::vector<MassFlowSpec> flows) {
    std::set<ContentHash> sources;
    for (const auto& flow : flows) {
        if (groups_.find(flow.src_hash) == groups_.end()) {
            std::ostringstream oss;
            oss << "Mass flow source " << std::hex << flow.src_hash << " is not a registered group";
            throw std::invalid_argument(oss.str());
        }
        // A source's mass can leave it only once
        if (!sources.insert(flow.src_hash).second) {
            std::ostringstream oss;
            oss << "Mass flow source " << std::hex << flow.src_hash << " appears in more than one flow";
            throw std::invalid_argument(oss.str());
        }
    }

    // (1) Zero the sources before crediting anything
    for (const auto& flow : flows) {
        Group& src = *groups_.at(flow.src_hash);

        std::vector<double> dst_masses;
        for (const auto& dst : flow.dst) {
            dst_masses.push_back(dst.mass());
        }
        double dst_total = accurate_sum(dst_masses);
        if (std::fabs(dst_total - src.mass_) > MASS_TOLERANCE * std::max(1.0, src.mass_)) {
            PRAM_WARN_LOG("Mass flow from %016llx does not conserve mass: %.6f out, %.6f in",
                          static_cast<unsigned long long>(flow.src_hash), src.mass_, dst_total);
        }
        src.mass_ = 0.0;
    }

    // (2) Credit destinations
    std::vector<double> moved;
    for (auto& flow : flows) {
        for (auto& dst : flow.dst) {
            moved.push_back(dst.mass());
            if (keep_mass_flow_specs_) {
                register_group(dst.standalone_copy(), false);
            } else {
                register_group(std::move(dst), false);
            }
        }
    }

    last_mass_flow_total_ = accurate_sum(moved);
    if (keep_mass_flow_specs_) {
        last_mass_flow_specs_ = std::move(flows);
    } else {
        last_mass_flow_specs_.clear();
    }

    PRAM_DEBUG_LOG("Transferred %.3f mass across %zu destinations (%zu groups)",
                   last_mass_flow_total_, moved.size(), groups_.size());

    // (3) Rebuild site membership and drop stale query results
    relink_sites();
    reset_cache();
    archive();
    return *this;
}

GroupPopulation& GroupPopulation::post_iteration() {
    // (1) Retire VOID groups
    double m_void = 0.0;
    std::size_t n_void = 0;
    for (auto it = groups_.begin(); it != groups_.end();) {
        if (it->second->is_void()) {
            double m = it->second->mass();
            mass_ -= m;
            mass_out_ += m;
            m_void += m;
            ++n_void;
            it = groups_.erase(it);
        } else {
            ++it;
        }
    }

    // (2) Fold VITA groups in
    double m_vita = 0.0;
    for (auto& entry : vita_groups_) {
        double m = entry.second.mass();
        register_group(std::move(entry.second), false);
        mass_ += m;
        mass_in_ += m;
        m_vita += m;
    }
    std::size_t n_vita = vita_groups_.size();
    vita_groups_.clear();

    PRAM_DEBUG_LOG("Post-iteration: removed %zu VOID groups (%.3f), folded in %zu VITA groups (%.3f)",
                   n_void, m_void, n_vita, m_vita);

    if (n_void > 0 || n_vita > 0) {
        relink_sites();
        reset_cache();
    }

    if (autocompact_) {
        compact();
    }
    return *this;
}

GroupPopulation& GroupPopulation::compact() {
    std::size_t removed = 0;
    for (auto it = groups_.begin(); it != groups_.end();) {
        if (it->second->mass() <= 0.0) {
            it = groups_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        PRAM_DEBUG_LOG("Compacted %zu empty groups (%zu remain)", removed, groups_.size());
        relink_sites();
        reset_cache();
    }
    return *this;
}

void GroupPopulation::archive() {
    if (history_length_ == 0) {
        return;
    }

    PopulationHistory snapshot;
    snapshot.mass = mass_;
    snapshot.mass_in = mass_in_;
    snapshot.mass_out = mass_out_;
    for (const auto& [h, g] : groups_) {
        snapshot.group_masses.emplace(h, g->mass());
    }

    history_.push_back(std::move(snapshot));
    while (history_.size() > history_length_) {
        history_.pop_front();
    }
    PRAM_DEBUG_LOG("Archived population state (%zu/%zu snapshots)", history_.size(), history_length_);
}

void GroupPopulation::relink_sites() {
    for (auto& entry : sites_) {
        entry.second->reset_group_links();
    }
    for (const auto& [h, g] : groups_) {
        for (const auto& [key, value] : g->rels()) {
            if (!value.is_hash()) {
                continue;
            }
            auto it = sites_.find(value.entity_hash());
            if (it != sites_.end() && it->second->rel_name() == key) {
                it->second->add_group_link(g.get());
            }
        }
    }
}

void GroupPopulation::reset_cache() const {
    cache_groups_.clear();
    cache_mass_.clear();
}

/*
 * Queries
 */

const Group* GroupPopulation::get_group(const AttrMap& attrs, const RelMap& rels) const {
    auto it = groups_.find(Group::gen_hash(attrs, rels));
    return (it != groups_.end()) ? it->second.get() : nullptr;
}

std::vector<const Group*> GroupPopulation::get_groups(const GroupQuery* qry) const {
    if (qry) {
        qry->report_usage(observer_);
        auto it = cache_groups_.find(qry->cache_key());
        if (it != cache_groups_.end()) {
            return it->second;
        }
    }

    std::vector<const Group*> matched;
    for (const auto& entry : groups_) {
        if (query_matches(qry, *entry.second)) {
            matched.push_back(entry.second.get());
        }
    }

    if (qry) {
        cache_groups_.emplace(qry->cache_key(), matched);
    }
    return matched;
}

double GroupPopulation::get_groups_mass(const GroupQuery* qry, std::size_t hist_delta) const {
    if (hist_delta == 0) {
        if (qry) {
            auto it = cache_mass_.find(qry->cache_key());
            if (it != cache_mass_.end()) {
                qry->report_usage(observer_);
                return it->second;
            }
        }

        std::vector<double> masses;
        for (const Group* g : get_groups(qry)) {
            masses.push_back(g->mass());
        }
        double m = accurate_sum(masses);
        if (qry) {
            cache_mass_.emplace(qry->cache_key(), m);
        }
        return m;
    }

    if (hist_delta > history_length_) {
        std::ostringstream oss;
        oss << "History delta " << hist_delta << " exceeds the retained history length " << history_length_;
        throw std::out_of_range(oss.str());
    }
    if (history_.size() < hist_delta) {
        return 0.0;
    }

    const PopulationHistory& past = history_[history_.size() - hist_delta];
    std::vector<double> deltas;
    for (const Group* g : get_groups(qry)) {
        deltas.push_back(g->mass() - past.group_mass(g->hash()));
    }
    return accurate_sum(deltas);
}

double GroupPopulation::get_groups_mass_prop(const GroupQuery* qry) const {
    return get_groups_mass_and_prop(qry).second;
}

std::pair<double, double> GroupPopulation::get_groups_mass_and_prop(const GroupQuery* qry) const {
    double m = get_groups_mass(qry);
    return {m, mass_ > 0.0 ? m / mass_ : 0.0};
}

std::size_t GroupPopulation::group_count(bool only_non_empty) const {
    if (!only_non_empty) {
        return groups_.size();
    }
    std::size_t n = 0;
    for (const auto& entry : groups_) {
        if (entry.second->mass() > 0.0) {
            ++n;
        }
    }
    return n;
}

std::string GroupPopulation::next_group_name() const {
    return "g." + std::to_string(groups_.size());
}

const Site& GroupPopulation::site(EntityHash hash) const {
    auto it = sites_.find(hash);
    if (it == sites_.end()) {
        std::ostringstream oss;
        oss << "No site registered under hash " << std::hex << hash.value;
        throw std::out_of_range(oss.str());
    }
    return *it->second;
}

std::shared_ptr<Site> GroupPopulation::find_site(EntityHash hash) const {
    auto it = sites_.find(hash);
    return (it != sites_.end()) ? it->second : nullptr;
}

std::shared_ptr<Resource> GroupPopulation::find_resource(EntityHash hash) const {
    auto it = resources_.find(hash);
    return (it != resources_.end()) ? it->second : nullptr;
}

const Site* GroupPopulation::site_at(const Group& group) const {
    auto h = group.site_at();
    if (!h.has_value()) {
        return nullptr;
    }
    return find_site(*h).get();
}

std::string GroupPopulation::summary() const {
    std::ostringstream oss;
    oss << "Population\n"
        << "  mass:      " << mass_ << "\n"
        << "  mass in:   " << mass_in_ << "\n"
        << "  mass out:  " << mass_out_ << "\n"
        << "  groups:    " << groups_.size() << " (" << group_count(true) << " non-empty)\n"
        << "  sites:     " << sites_.size() << "\n"
        << "  resources: " << resources_.size() << "\n";
    return oss.str();
}

} // namespace pram
