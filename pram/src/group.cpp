#include <pram/group.hpp>
#include <pram/content_hash.hpp>
#include <pram/errors.hpp>
#include <pram/group_population.hpp>
#include <pram/resource.hpp>
#include <pram/rule.hpp>
#include <pram/split.hpp>
#include <pram/usage_observer.hpp>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace pram {

Group::Group(std::string name, double mass, AttrMap attrs, RelMap rels)
    : name_(std::move(name))
    , mass_(mass)
    , attrs_(std::move(attrs))
    , rels_(std::move(rels)) {
    if (std::isnan(mass_) || mass_ < 0.0) {
        std::ostringstream oss;
        oss << "Group mass must be non-negative: " << mass_;
        throw std::invalid_argument(oss.str());
    }
}

ContentHash Group::gen_hash(const AttrMap& attrs, const RelMap& rels) {
    return hash_content(attrs, rels);
}

ContentHash Group::hash() const {
    if (!cached_hash_.has_value()) {
        cached_hash_ = gen_hash(attrs_, rels_);
    }
    return cached_hash_.value();
}

AttrMap Group::make_attrs(const AttrMap& base, const AttrMap& set, const KeySet& del) {
    AttrMap result = base;
    for (const auto& [key, value] : set) {
        result[key] = value;
    }
    for (const auto& key : del) {
        result.erase(key);
    }
    return result;
}

RelMap Group::make_rels(const RelMap& base, const RelMap& set, const KeySet& del) {
    RelMap result = base;
    for (const auto& [key, value] : set) {
        result[key] = value;
    }
    // Deletion is by key only; the value in del's place is never consulted
    for (const auto& key : del) {
        result.erase(key);
    }
    return result;
}

/*
 * Read side
 */

const Value* Group::get_attr(const std::string& name, AttributeUsageObserver* observer) const {
    if (observer) {
        observer->on_attr_used(name);
    }
    auto it = attrs_.find(name);
    return (it != attrs_.end()) ? &it->second : nullptr;
}

const RelValue* Group::get_rel(const std::string& name, AttributeUsageObserver* observer) const {
    if (observer) {
        observer->on_rel_used(name);
    }
    auto it = rels_.find(name);
    return (it != rels_.end()) ? &it->second : nullptr;
}

bool Group::has_attr(const std::string& name, AttributeUsageObserver* observer) const {
    return get_attr(name, observer) != nullptr;
}

bool Group::has_attr(const std::vector<std::string>& names, AttributeUsageObserver* observer) const {
    bool all = true;
    for (const auto& name : names) {
        all = has_attr(name, observer) && all;
    }
    return all;
}

bool Group::has_attr(const AttrMap& attrs, AttributeUsageObserver* observer) const {
    bool all = true;
    for (const auto& [key, value] : attrs) {
        const Value* v = get_attr(key, observer);
        all = (v && *v == value) && all;
    }
    return all;
}

bool Group::has_rel(const std::string& name, AttributeUsageObserver* observer) const {
    return get_rel(name, observer) != nullptr;
}

bool Group::has_rel(const std::vector<std::string>& names, AttributeUsageObserver* observer) const {
    bool all = true;
    for (const auto& name : names) {
        all = has_rel(name, observer) && all;
    }
    return all;
}

bool Group::has_rel(const RelMap& rels, AttributeUsageObserver* observer) const {
    bool all = true;
    for (const auto& [key, value] : rels) {
        const RelValue* v = get_rel(key, observer);
        all = (v && *v == value) && all;
    }
    return all;
}

std::optional<EntityHash> Group::site_at() const {
    auto it = rels_.find(SITE_AT);
    if (it == rels_.end() || !it->second.refers_to_entity()) {
        return std::nullopt;
    }
    return it->second.entity_hash();
}

bool Group::is_at_site(const Site& site) const {
    auto at = site_at();
    return at.has_value() && *at == site.entity_hash();
}

bool Group::is_at_site_name(const std::string& rel_name) const {
    auto at = rels_.find(SITE_AT);
    auto rel = rels_.find(rel_name);
    return at != rels_.end() && rel != rels_.end() && at->second == rel->second;
}

/*
 * Write side
 */

void Group::check_mutable(bool force, const std::string& what) const {
    if (state_ == State::REGISTERED && !force) {
        throw GroupFrozenError("Cannot modify " + what + " of registered group '" + name_ +
                               "'; group content changes only through splitting");
    }
}

Group& Group::set_attr(const std::string& name, Value value, bool force) {
    check_mutable(force, "attribute '" + name + "'");
    attrs_[name] = std::move(value);
    reset_hash();
    return *this;
}

Group& Group::set_attrs(const AttrMap& attrs, bool force) {
    check_mutable(force, "attributes");
    for (const auto& [key, value] : attrs) {
        attrs_[key] = value;
    }
    reset_hash();
    return *this;
}

Group& Group::set_rel(const std::string& name, RelValue value, bool force) {
    check_mutable(force, "relation '" + name + "'");
    rels_[name] = std::move(value);
    reset_hash();
    return *this;
}

Group& Group::set_rels(const RelMap& rels, bool force) {
    check_mutable(force, "relations");
    for (const auto& [key, value] : rels) {
        rels_[key] = value;
    }
    reset_hash();
    return *this;
}

Group Group::standalone_copy() const {
    Group copy(name_, mass_, attrs_, rels_);
    copy.cached_hash_ = cached_hash_;
    return copy;
}

/*
 * Splitting
 */

std::vector<Group> Group::split(const std::vector<GroupSplitSpec>& specs, bool allow_fractional) const {
    std::vector<double> probs;
    std::vector<AttrMap> attrs;
    std::vector<RelMap> rels;
    std::vector<ContentHash> tie_keys;
    probs.reserve(specs.size());
    attrs.reserve(specs.size());
    rels.reserve(specs.size());
    tie_keys.reserve(specs.size());
    for (const auto& s : specs) {
        probs.push_back(s.p());
        attrs.push_back(make_attrs(attrs_, s.attr_set(), s.attr_del()));
        rels.push_back(make_rels(rels_, s.rel_set(), s.rel_del()));
        // Rounding ties follow the destination, not the position of its spec
        tie_keys.push_back(gen_hash(attrs.back(), rels.back()));
    }

    std::vector<Group> groups;
    for (const MassShare& share : partition_mass(mass_, probs, allow_fractional, tie_keys)) {
        groups.emplace_back(name_, share.mass, std::move(attrs[share.spec_index]), std::move(rels[share.spec_index]));
    }
    return groups;
}

std::optional<std::vector<Group>> Group::split_claims(const std::vector<std::vector<GroupSplitSpec>>& claims,
                                                      bool allow_fractional) const {
    std::vector<GroupSplitSpec> combined = combine_split_specs(claims);
    if (combined.empty()) {
        return std::nullopt;
    }
    return split(combined, allow_fractional);
}

std::optional<std::vector<Group>> Group::apply_rules(const GroupPopulation& pop, const RuleList& rules,
                                                     std::size_t iter, double t, Stage stage) const {
    std::vector<std::vector<GroupSplitSpec>> claims;
    AttributeUsageObserver* observer = pop.usage_observer();

    for (const auto& rule : rules) {
        std::optional<std::vector<GroupSplitSpec>> specs;
        switch (stage) {
            case Stage::ITERATION:
                if (observer && rule->filter()) {
                    rule->filter()->report_usage(observer);
                }
                if (!rule->is_applicable(*this, iter, t)) {
                    continue;
                }
                specs = rule->apply(pop, *this, iter, t);
                break;
            case Stage::RULE_SETUP:
                specs = rule->setup(pop, *this);
                break;
            case Stage::RULE_CLEANUP:
                specs = rule->cleanup(pop, *this);
                break;
        }
        if (specs.has_value() && !specs->empty()) {
            claims.push_back(std::move(*specs));
        }
    }

    if (claims.empty()) {
        return std::nullopt;
    }
    return split_claims(claims, pop.fractional_mass());
}

std::optional<std::vector<Group>> Group::apply_group_setup(const GroupPopulation& pop, const GroupSetupFn& fn) const {
    std::optional<std::vector<GroupSplitSpec>> specs = fn(pop, *this);
    if (!specs.has_value() || specs->empty()) {
        return std::nullopt;
    }
    return split(*specs, pop.fractional_mass());
}

std::string Group::to_string() const {
    std::ostringstream oss;
    oss << "Group  name: " << name_ << "  m: " << mass_ << "  hash: " << std::hex << hash() << std::dec
        << "  attr: " << pram::to_string(attrs_) << "  rel: " << pram::to_string(rels_);
    return oss.str();
}

} // namespace pram
