#ifndef PRAM_USAGE_OBSERVER_HPP
#define PRAM_USAGE_OBSERVER_HPP

#include <pram/types.hpp>
#include <string>

namespace pram {

class GroupPopulation;

/**
 * Receives the names of attributes and relations that are conditioned on
 * while a monitored run evaluates queries. Passed explicitly to query
 * evaluation; when absent nothing is recorded.
 */
class AttributeUsageObserver {
public:
    virtual ~AttributeUsageObserver() = default;

    virtual void on_attr_used(const std::string& name) = 0;
    virtual void on_rel_used(const std::string& name) = 0;
};

/**
 * Accumulates attribute/relation usage across runs and reports which of the
 * names defining the population's groups were never conditioned on. Such
 * names only partition the group space needlessly.
 */
class AttributeUsageTracker : public AttributeUsageObserver {
public:
    void on_attr_used(const std::string& name) override { attr_used_.insert(name); }
    void on_rel_used(const std::string& name) override { rel_used_.insert(name); }

    /**
     * Recompute the unused sets from the names that define the population's
     * groups minus everything recorded so far.
     */
    void analyze(const GroupPopulation& pop);

    void reset();

    const KeySet& attr_used() const { return attr_used_; }
    const KeySet& rel_used() const { return rel_used_; }
    const KeySet& attr_unused() const { return attr_unused_; }
    const KeySet& rel_unused() const { return rel_unused_; }

private:
    KeySet attr_used_;
    KeySet rel_used_;
    KeySet attr_unused_;
    KeySet rel_unused_;
};

} // namespace pram

#endif // PRAM_USAGE_OBSERVER_HPP
