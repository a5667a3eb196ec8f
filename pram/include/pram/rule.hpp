#ifndef PRAM_RULE_HPP
#define PRAM_RULE_HPP

#include <pram/group.hpp>
#include <pram/group_query.hpp>
#include <pram/group_split_spec.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pram {

class GroupPopulation;

/**
 * A rule redistributes a group's mass by returning probability-weighted
 * split specs. Rules read the population but never change it; all mutation
 * flows through the returned specs.
 *
 * Returning nullopt (or an empty list) means the rule makes no claim on the
 * group this iteration.
 */
class Rule {
public:
    using Result = std::optional<std::vector<GroupSplitSpec>>;

    explicit Rule(std::string name, std::optional<GroupQuery> filter = std::nullopt)
        : name_(std::move(name))
        , filter_(std::move(filter)) {}

    virtual ~Rule() = default;

    const std::string& name() const { return name_; }
    const std::optional<GroupQuery>& filter() const { return filter_; }

    // Default: the filter matches, or true when there is none
    virtual bool is_applicable(const Group& group, std::size_t iter, double t) const;

    virtual Result apply(const GroupPopulation& pop, const Group& group, std::size_t iter, double t) = 0;

    // One-shot hooks run before the first and after the last iteration
    virtual Result setup(const GroupPopulation& pop, const Group& group);
    virtual Result cleanup(const GroupPopulation& pop, const Group& group);

private:
    std::string name_;
    std::optional<GroupQuery> filter_;
};

} // namespace pram

#endif // PRAM_RULE_HPP
