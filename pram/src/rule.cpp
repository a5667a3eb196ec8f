#include <pram/rule.hpp>

namespace pram {

bool Rule::is_applicable(const Group& group, std::size_t /*iter*/, double /*t*/) const {
    return query_matches(filter_ ? &*filter_ : nullptr, group);
}

Rule::Result Rule::setup(const GroupPopulation& /*pop*/, const Group& /*group*/) {
    return std::nullopt;
}

Rule::Result Rule::cleanup(const GroupPopulation& /*pop*/, const Group& /*group*/) {
    return std::nullopt;
}

} // namespace pram
