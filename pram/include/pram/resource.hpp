#ifndef PRAM_RESOURCE_HPP
#define PRAM_RESOURCE_HPP

#include <pram/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pram {

class Group;
class GroupQuery;
class AttributeUsageObserver;

/**
 * Capacity-bounded entity shared by many agents (e.g., a bus or a hospital ward).
 * Capacity counts the agents currently accommodated; it never exceeds capacity_max.
 * Identity is the name alone.
 */
class Resource {
public:
    explicit Resource(std::string name, std::size_t capacity_max = 1, std::size_t capacity = 0);
    virtual ~Resource() = default;

    Resource(const Resource&) = default;
    Resource& operator=(const Resource&) = default;

    const std::string& name() const { return name_; }

    virtual ContentHash hash() const;
    EntityHash entity_hash() const { return EntityHash{hash()}; }

    virtual bool is_site() const { return false; }

    /**
     * Dispatch to allocate_all (all = true) or allocate_any.
     * @return Number of agents not accommodated
     */
    std::size_t allocate(std::size_t n, bool all);

    /**
     * Admit as many of n agents as fit.
     * @return Number of agents not accommodated
     */
    std::size_t allocate_any(std::size_t n);

    /**
     * All-or-nothing admission of n agents.
     * @return true if all n were admitted; false (and no change) otherwise
     */
    bool allocate_all(std::size_t n);

    bool can_accommodate_all(std::size_t n) const { return n <= capacity_left(); }
    bool can_accommodate_any(std::size_t n) const { return n > 0 && capacity_ < capacity_max_; }
    bool can_accommodate_one() const { return capacity_ < capacity_max_; }

    // Always succeeds; capacity is clamped at zero
    void release(std::size_t n);

    std::size_t capacity() const { return capacity_; }
    std::size_t capacity_left() const { return capacity_max_ - capacity_; }
    std::size_t capacity_max() const { return capacity_max_; }

    virtual std::string to_string() const;

protected:
    std::string name_;
    std::size_t capacity_max_;
    std::size_t capacity_;
};

/**
 * A physical location groups can be at (a school, a store, home).
 *
 * The site keeps back-references to the registered groups whose relation
 * SITE_AT points to it, along with their aggregate mass. The population
 * rebuilds those links after every mass transfer; per-query results are
 * memoized until the next rebuild.
 */
class Site : public Resource {
public:
    explicit Site(std::string name, AttrMap attrs = {}, std::string rel_name = SITE_AT,
                  std::size_t capacity_max = 1);

    ContentHash hash() const override;
    bool is_site() const override { return true; }

    const AttrMap& attrs() const { return attrs_; }
    const Value* get_attr(const std::string& name) const;
    const std::string& rel_name() const { return rel_name_; }

    // Group membership (maintained by the population)
    void add_group_link(const Group* group);
    void reset_group_links();

    std::size_t group_count() const { return groups_.size(); }
    double mass() const { return mass_; }

    /**
     * Groups currently at this site, optionally restricted by a query.
     * @param non_empty_only Skip zero-mass groups
     */
    std::vector<const Group*> get_groups(const GroupQuery* qry = nullptr, bool non_empty_only = false,
                                         AttributeUsageObserver* observer = nullptr) const;

    double get_mass(const GroupQuery* qry = nullptr, AttributeUsageObserver* observer = nullptr) const;
    double get_mass_prop(const GroupQuery* qry = nullptr, AttributeUsageObserver* observer = nullptr) const;
    std::pair<double, double> get_mass_and_prop(const GroupQuery* qry = nullptr,
                                                AttributeUsageObserver* observer = nullptr) const;

    static ContentHash gen_hash(const std::string& name, const std::string& rel_name, const AttrMap& attrs);

    std::string to_string() const override;

private:
    const std::vector<const Group*>& matching_groups(const GroupQuery* qry, AttributeUsageObserver* observer) const;
    void clear_memo() const;

    AttrMap attrs_;
    std::string rel_name_;

    std::vector<const Group*> groups_;
    double mass_ = 0.0;

    mutable std::optional<ContentHash> cached_hash_;
    mutable std::unordered_map<ContentHash, std::vector<const Group*>> memo_groups_;
    mutable std::unordered_map<ContentHash, double> memo_mass_;
};

} // namespace pram

#endif // PRAM_RESOURCE_HPP
