#include <pram/usage_observer.hpp>
#include <pram/group.hpp>
#include <pram/group_population.hpp>

namespace pram {

void AttributeUsageTracker::analyze(const GroupPopulation& pop) {
    KeySet attr_defined;
    KeySet rel_defined;

    // Read the group content directly so the analysis itself records nothing
    for (const Group* g : pop.get_groups()) {
        for (const auto& entry : g->attrs()) {
            attr_defined.insert(entry.first);
        }
        for (const auto& entry : g->rels()) {
            rel_defined.insert(entry.first);
        }
    }

    attr_unused_.clear();
    rel_unused_.clear();
    for (const auto& name : attr_defined) {
        if (attr_used_.count(name) == 0) {
            attr_unused_.insert(name);
        }
    }
    for (const auto& name : rel_defined) {
        if (rel_used_.count(name) == 0) {
            rel_unused_.insert(name);
        }
    }
}

void AttributeUsageTracker::reset() {
    attr_used_.clear();
    rel_used_.clear();
    attr_unused_.clear();
    rel_unused_.clear();
}

} // namespace pram
