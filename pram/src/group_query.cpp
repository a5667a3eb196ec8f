#include <pram/group_query.hpp>
#include <pram/content_hash.hpp>
#include <pram/group.hpp>
#include <pram/usage_observer.hpp>
#include <atomic>
#include <sstream>

namespace pram {

namespace {

std::uint64_t next_predicate_id() {
    static std::atomic<std::uint64_t> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

template<typename Map>
bool contains_all(const Map& haystack, const Map& needles) {
    for (const auto& [key, value] : needles) {
        auto it = haystack.find(key);
        if (it == haystack.end() || it->second != value) {
            return false;
        }
    }
    return true;
}

} // namespace

GroupPredicate::GroupPredicate(Fn fn)
    : id_(next_predicate_id())
    , fn_(std::move(fn)) {
}

GroupQuery::GroupQuery() {
    index_terms();
}

GroupQuery::GroupQuery(AttrMap attrs, RelMap rels, std::vector<GroupPredicate> conds, bool full)
    : full_(full) {
    if (!attrs.empty()) {
        terms_.push_back(AttributeSubset{std::move(attrs)});
    }
    if (!rels.empty()) {
        terms_.push_back(RelationSubset{std::move(rels)});
    }
    for (auto& cond : conds) {
        terms_.push_back(CustomPredicate{std::move(cond)});
    }
    index_terms();
}


GroupQuery GroupQuery::by_attrs(AttrMap attrs, bool full) {
    return GroupQuery(std::move(attrs), RelMap{}, {}, full);
}

GroupQuery GroupQuery::by_rels(RelMap rels, bool full) {
    return GroupQuery(AttrMap{}, std::move(rels), {}, full);
}

GroupQuery GroupQuery::by_predicate(GroupPredicate::Fn fn) {
    return GroupQuery(AttrMap{}, RelMap{}, {GroupPredicate(std::move(fn))}, false);
}

GroupQuery GroupQuery::from_terms(std::vector<Term> terms, bool full) {
    GroupQuery qry;
    qry.terms_ = std::move(terms);
    qry.full_ = full;
    qry.index_terms();
    return qry;
}

void GroupQuery::index_terms() {
    attrs_.clear();
    rels_.clear();
    predicates_.clear();

    for (const auto& term : terms_) {
        if (const auto* a = std::get_if<AttributeSubset>(&term)) {
            for (const auto& [key, value] : a->attrs) {
                attrs_[key] = value;
            }
        } else if (const auto* r = std::get_if<RelationSubset>(&term)) {
            for (const auto& [key, value] : r->rels) {
                rels_[key] = value.resolved();
            }
        } else {
            predicates_.push_back(std::get<CustomPredicate>(term).predicate);
        }
    }

    ContentHasher hasher;
    hasher.add_byte('Q');
    hasher.add_bool(full_);
    hasher.add_attrs(attrs_);
    hasher.add_rels(rels_);
    hasher.add_u64(predicates_.size());
    for (const auto& pred : predicates_) {
        hasher.add_u64(pred.id());
    }
    cache_key_ = hasher.digest();
}

bool GroupQuery::matches(const Group& group, AttributeUsageObserver* observer) const {
    report_usage(observer);

    if (full_) {
        if (group.attrs() != attrs_ || group.rels() != rels_) {
            return false;
        }
    } else {
        if (!contains_all(group.attrs(), attrs_) || !contains_all(group.rels(), rels_)) {
            return false;
        }
    }

    for (const auto& pred : predicates_) {
        if (!pred(group)) {
            return false;
        }
    }
    return true;
}

void GroupQuery::report_usage(AttributeUsageObserver* observer) const {
    if (!observer) {
        return;
    }
    for (const auto& entry : attrs_) {
        observer->on_attr_used(entry.first);
    }
    for (const auto& entry : rels_) {
        observer->on_rel_used(entry.first);
    }
}

bool GroupQuery::operator==(const GroupQuery& other) const {
    return full_ == other.full_ && attrs_ == other.attrs_ && rels_ == other.rels_ &&
           predicates_ == other.predicates_;
}

std::string GroupQuery::to_string() const {
    std::ostringstream oss;
    oss << "GroupQuery  attr: " << pram::to_string(attrs_) << "  rel: " << pram::to_string(rels_)
        << "  preds: " << predicates_.size() << "  full: " << (full_ ? "yes" : "no");
    return oss.str();
}

bool query_matches(const GroupQuery* qry, const Group& group, AttributeUsageObserver* observer) {
    return !qry || qry->matches(group, observer);
}

} // namespace pram
