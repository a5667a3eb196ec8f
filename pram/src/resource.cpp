#include <pram/resource.hpp>
#include <pram/content_hash.hpp>
#include <pram/group.hpp>
#include <pram/group_query.hpp>
#include <pram/split.hpp>
#include <algorithm>
#include <sstream>

namespace pram {

/*
 * Resource
 */

Resource::Resource(std::string name, std::size_t capacity_max, std::size_t capacity)
    : name_(std::move(name))
    , capacity_max_(capacity_max)
    , capacity_(std::min(capacity, capacity_max)) {
}

ContentHash Resource::hash() const {
    ContentHasher hasher;
    hasher.add_byte('R');
    hasher.add_string(name_);
    return hasher.digest();
}

std::size_t Resource::allocate(std::size_t n, bool all) {
    if (all) {
        return allocate_all(n) ? 0 : n;
    }
    return allocate_any(n);
}

std::size_t Resource::allocate_any(std::size_t n) {
    std::size_t admitted = std::min(n, capacity_left());
    capacity_ += admitted;
    return n - admitted;
}

bool Resource::allocate_all(std::size_t n) {
    if (!can_accommodate_all(n)) {
        return false;
    }
    capacity_ += n;
    return true;
}

void Resource::release(std::size_t n) {
    capacity_ = (n >= capacity_) ? 0 : capacity_ - n;
}

std::string Resource::to_string() const {
    std::ostringstream oss;
    oss << "Resource  name: " << name_ << "  cap: " << capacity_ << "/" << capacity_max_
        << "  hash: " << std::hex << hash();
    return oss.str();
}

/*
 * Site
 */

Site::Site(std::string name, AttrMap attrs, std::string rel_name, std::size_t capacity_max)
    : Resource(std::move(name), capacity_max)
    , attrs_(std::move(attrs))
    , rel_name_(std::move(rel_name)) {
}

ContentHash Site::gen_hash(const std::string& name, const std::string& rel_name, const AttrMap& attrs) {
    ContentHasher hasher;
    hasher.add_byte('S');
    hasher.add_string(name);
    hasher.add_string(rel_name);
    hasher.add_attrs(attrs);
    return hasher.digest();
}

ContentHash Site::hash() const {
    if (!cached_hash_.has_value()) {
        cached_hash_ = gen_hash(name_, rel_name_, attrs_);
    }
    return cached_hash_.value();
}

const Value* Site::get_attr(const std::string& name) const {
    auto it = attrs_.find(name);
    return (it != attrs_.end()) ? &it->second : nullptr;
}

void Site::add_group_link(const Group* group) {
    groups_.push_back(group);
    mass_ += group->mass();
    clear_memo();
}

void Site::reset_group_links() {
    groups_.clear();
    mass_ = 0.0;
    clear_memo();
}

void Site::clear_memo() const {
    memo_groups_.clear();
    memo_mass_.clear();
}

const std::vector<const Group*>& Site::matching_groups(const GroupQuery* qry,
                                                       AttributeUsageObserver* observer) const {
    if (!qry) {
        return groups_;
    }

    qry->report_usage(observer);

    ContentHash key = qry->cache_key();
    auto it = memo_groups_.find(key);
    if (it != memo_groups_.end()) {
        return it->second;
    }

    std::vector<const Group*> matched;
    for (const Group* g : groups_) {
        if (qry->matches(*g)) {
            matched.push_back(g);
        }
    }
    return memo_groups_.emplace(key, std::move(matched)).first->second;
}

std::vector<const Group*> Site::get_groups(const GroupQuery* qry, bool non_empty_only,
                                           AttributeUsageObserver* observer) const {
    const auto& groups = matching_groups(qry, observer);
    if (!non_empty_only) {
        return groups;
    }

    std::vector<const Group*> result;
    std::copy_if(groups.begin(), groups.end(), std::back_inserter(result),
        [](const Group* g) { return g->mass() > 0.0; });
    return result;
}

double Site::get_mass(const GroupQuery* qry, AttributeUsageObserver* observer) const {
    if (!qry) {
        return mass_;
    }

    ContentHash key = qry->cache_key();
    auto it = memo_mass_.find(key);
    if (it != memo_mass_.end()) {
        qry->report_usage(observer);
        return it->second;
    }

    const auto& groups = matching_groups(qry, observer);
    std::vector<double> masses;
    masses.reserve(groups.size());
    for (const Group* g : groups) {
        masses.push_back(g->mass());
    }
    double m = accurate_sum(masses);
    memo_mass_.emplace(key, m);
    return m;
}

double Site::get_mass_prop(const GroupQuery* qry, AttributeUsageObserver* observer) const {
    return get_mass_and_prop(qry, observer).second;
}

std::pair<double, double> Site::get_mass_and_prop(const GroupQuery* qry, AttributeUsageObserver* observer) const {
    double m = get_mass(qry, observer);
    return {m, mass_ > 0.0 ? m / mass_ : 0.0};
}

std::string Site::to_string() const {
    std::ostringstream oss;
    oss << "Site  name: " << name_ << "  hash: " << std::hex << hash() << std::dec
        << "  attr: " << pram::to_string(attrs_) << "  groups: " << groups_.size() << "  m: " << mass_;
    return oss.str();
}

} // namespace pram
