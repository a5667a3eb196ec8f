#ifndef PRAM_SPLIT_HPP
#define PRAM_SPLIT_HPP

#include <pram/group_split_spec.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pram {

/**
 * Compensated (Neumaier) summation. Used wherever masses are aggregated so
 * that totals do not depend on the order groups happen to be visited in.
 */
double accurate_sum(const std::vector<double>& values);

/**
 * Largest-remainder rounding: every value is rounded down and the units
 * missing from round(sum) go to the values with the largest fractional
 * remainders. Remainder ties go to the smaller tie key when tie_keys is
 * given (one key per value), then to the value that comes first.
 *
 * The result sums to round(accurate_sum(values)). Values must be non-negative.
 */
std::vector<double> round_preserving_total(const std::vector<double>& values,
                                           const std::vector<std::uint64_t>& tie_keys = {});

// Mass assigned to one split spec
struct MassShare {
    std::size_t spec_index;
    double mass;
};

/**
 * Partition a mass over ordered split probabilities.
 *
 * The terminal spec gets the complement of everything before it, both in
 * probability and in mass. The terminal spec is the last one, or the first
 * one at which the running probability reaches 1; specs after it are never
 * reached. Without allow_fractional the whole part of the mass is split into
 * whole units with round_preserving_total (tie_keys as there, one per
 * probability) and the fraction of a non-integral source mass goes to the
 * terminal spec. Zero-mass shares are omitted.
 *
 * The returned masses always sum to the source mass.
 *
 * @throws std::invalid_argument if mass is negative or NaN
 */
std::vector<MassShare> partition_mass(double mass, const std::vector<double>& probs, bool allow_fractional,
                                      const std::vector<std::uint64_t>& tie_keys = {});

/**
 * Cartesian product of several rules' split spec lists.
 *
 * Each tuple yields one spec: probabilities multiply, attribute and relation
 * set-maps are merged in rule order (later rule wins on a key conflict),
 * delete sets are united. Tuples are emitted in odometer order with the first
 * list varying slowest, so the last combined spec is always the combination of
 * every list's last spec. Empty lists are skipped; no lists yield no specs.
 */
std::vector<GroupSplitSpec> combine_split_specs(const std::vector<std::vector<GroupSplitSpec>>& per_rule);

} // namespace pram

#endif // PRAM_SPLIT_HPP
