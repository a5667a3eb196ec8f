#ifndef PRAM_GROUP_SPLIT_SPEC_HPP
#define PRAM_GROUP_SPLIT_SPEC_HPP

#include <pram/types.hpp>
#include <string>

namespace pram {

/**
 * One probability-weighted destination of a group split.
 *
 * The destination's attributes are the source's with attr_set applied and
 * then attr_del removed; relations likewise. Probability is validated on
 * construction and on set_p: values outside [0, 1] and NaN throw
 * std::invalid_argument.
 */
class GroupSplitSpec {
public:
    explicit GroupSplitSpec(double p = 0.0, AttrMap attr_set = {}, KeySet attr_del = {},
                            RelMap rel_set = {}, KeySet rel_del = {});

    // Destination flagged for removal at the end of the iteration
    static GroupSplitSpec make_void(double p);

    double p() const { return p_; }
    GroupSplitSpec& set_p(double p);

    const AttrMap& attr_set() const { return attr_set_; }
    const KeySet& attr_del() const { return attr_del_; }
    const RelMap& rel_set() const { return rel_set_; }
    const KeySet& rel_del() const { return rel_del_; }

    GroupSplitSpec& set_attr(const std::string& name, Value value);
    GroupSplitSpec& del_attr(const std::string& name);
    GroupSplitSpec& set_rel(const std::string& name, RelValue value);
    GroupSplitSpec& del_rel(const std::string& name);

    // Leaves the group's attributes and relations unchanged
    bool is_identity() const {
        return attr_set_.empty() && attr_del_.empty() && rel_set_.empty() && rel_del_.empty();
    }

    std::string to_string() const;

private:
    static double validated(double p);

    double p_;
    AttrMap attr_set_;
    KeySet attr_del_;
    RelMap rel_set_;
    KeySet rel_del_;
};

} // namespace pram

#endif // PRAM_GROUP_SPLIT_SPEC_HPP
