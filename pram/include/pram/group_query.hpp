#ifndef PRAM_GROUP_QUERY_HPP
#define PRAM_GROUP_QUERY_HPP

#include <pram/types.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace pram {

class Group;
class AttributeUsageObserver;

/**
 * Custom condition on a group. Two predicates are the same only if one is a
 * copy of the other; the wrapped callable never takes part in hashing.
 */
class GroupPredicate {
public:
    using Fn = std::function<bool(const Group&)>;

    explicit GroupPredicate(Fn fn);

    bool operator()(const Group& group) const { return fn_(group); }

    std::uint64_t id() const { return id_; }

    bool operator==(const GroupPredicate& other) const { return id_ == other.id_; }
    bool operator!=(const GroupPredicate& other) const { return id_ != other.id_; }

private:
    std::uint64_t id_;
    Fn fn_;
};

/**
 * Group selection criteria.
 *
 * A query is a list of terms, each an attribute subset, a relation subset or a
 * custom predicate. A partial query matches a group whose attributes and
 * relations contain every (key, value) pair of the query and for which all
 * predicates hold. A full query requires the group's attributes and relations
 * to equal the query's exactly. Because a population holds at most one group
 * per content, a full query selects at most one group.
 *
 * Queries are immutable; their cache key digests the attribute and relation
 * content, the full flag, and predicate identities.
 */
class GroupQuery {
public:
    struct AttributeSubset {
        AttrMap attrs;
    };

    struct RelationSubset {
        RelMap rels;
    };

    struct CustomPredicate {
        GroupPredicate predicate;
    };

    using Term = std::variant<AttributeSubset, RelationSubset, CustomPredicate>;

    // Matches every group
    GroupQuery();

    // Relations are required so that a lone brace pair never reads as a copy of a query
    explicit GroupQuery(AttrMap attrs, RelMap rels, std::vector<GroupPredicate> conds = {}, bool full = false);

    static GroupQuery by_attrs(AttrMap attrs, bool full = false);
    static GroupQuery by_rels(RelMap rels, bool full = false);
    static GroupQuery by_predicate(GroupPredicate::Fn fn);
    static GroupQuery from_terms(std::vector<Term> terms, bool full = false);

    const std::vector<Term>& terms() const { return terms_; }
    bool is_full() const { return full_; }

    // Union of all attribute (relation) terms; later terms win on key conflict
    const AttrMap& attrs() const { return attrs_; }
    const RelMap& rels() const { return rels_; }
    const std::vector<GroupPredicate>& predicates() const { return predicates_; }

    bool matches(const Group& group, AttributeUsageObserver* observer = nullptr) const;

    // Report the attribute and relation names this query conditions on
    void report_usage(AttributeUsageObserver* observer) const;

    ContentHash cache_key() const { return cache_key_; }

    bool operator==(const GroupQuery& other) const;
    bool operator!=(const GroupQuery& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    void index_terms();

    std::vector<Term> terms_;
    bool full_ = false;

    AttrMap attrs_;
    RelMap rels_;
    std::vector<GroupPredicate> predicates_;
    ContentHash cache_key_ = 0;
};

// An absent query matches every group
bool query_matches(const GroupQuery* qry, const Group& group, AttributeUsageObserver* observer = nullptr);

} // namespace pram

#endif // PRAM_GROUP_QUERY_HPP
