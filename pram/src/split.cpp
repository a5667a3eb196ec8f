#include <pram/split.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace pram {

namespace {

// Fractional remainders are compared at this resolution
constexpr double REMAINDER_SCALE = 1e9;

} // namespace

double accurate_sum(const std::vector<double>& values) {
    double sum = 0.0;
    double compensation = 0.0;
    for (double v : values) {
        double t = sum + v;
        if (std::fabs(sum) >= std::fabs(v)) {
            compensation += (sum - t) + v;
        } else {
            compensation += (v - t) + sum;
        }
        sum = t;
    }
    return sum + compensation;
}

std::vector<double> round_preserving_total(const std::vector<double>& values,
                                           const std::vector<std::uint64_t>& tie_keys) {
    if (!tie_keys.empty() && tie_keys.size() < values.size()) {
        throw std::invalid_argument("round_preserving_total: fewer tie keys than values");
    }

    std::vector<double> rounded(values.size());
    std::vector<long long> remainders(values.size());

    for (std::size_t i = 0; i < values.size(); ++i) {
        rounded[i] = std::floor(values[i]);
        // Quantized so that remainders differing only by summation order compare equal
        remainders[i] = std::llround((values[i] - rounded[i]) * REMAINDER_SCALE);
    }

    double target = std::round(accurate_sum(values));
    double floor_sum = accurate_sum(rounded);
    long long units = std::llround(target - floor_sum);
    units = std::max(0LL, std::min(units, static_cast<long long>(values.size())));

    std::vector<std::size_t> order(values.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        if (remainders[a] != remainders[b]) {
            return remainders[a] > remainders[b];
        }
        if (!tie_keys.empty() && tie_keys[a] != tie_keys[b]) {
            return tie_keys[a] < tie_keys[b];
        }
        return false;
    });

    for (long long k = 0; k < units; ++k) {
        rounded[order[static_cast<std::size_t>(k)]] += 1.0;
    }
    return rounded;
}

std::vector<MassShare> partition_mass(double mass, const std::vector<double>& probs, bool allow_fractional,
                                      const std::vector<std::uint64_t>& tie_keys) {
    if (std::isnan(mass) || mass < 0.0) {
        std::ostringstream oss;
        oss << "Cannot partition a negative mass: " << mass;
        throw std::invalid_argument(oss.str());
    }
    if (probs.empty()) {
        return {};
    }

    // Integer mode splits whole units only; the fraction rides on the terminal share
    double whole = allow_fractional ? mass : std::floor(mass);
    double fraction = mass - whole;

    // (1) Exact shares up to and including the terminal spec
    std::vector<double> masses;
    masses.reserve(probs.size());
    double p_sum = 0.0;

    for (std::size_t i = 0; i < probs.size(); ++i) {
        bool terminal = (i + 1 == probs.size()) || (p_sum + probs[i] >= 1.0);
        if (terminal) {
            masses.push_back(std::max(0.0, whole - accurate_sum(masses)));
            break;
        }
        masses.push_back(whole * probs[i]);
        p_sum += probs[i];
    }

    // (2) Integer rounding; the total stays at the whole part
    if (!allow_fractional) {
        masses = round_preserving_total(masses, tie_keys);
        masses.back() += fraction;
    }

    // (3) Drop empty destinations
    std::vector<MassShare> shares;
    shares.reserve(masses.size());
    for (std::size_t i = 0; i < masses.size(); ++i) {
        if (masses[i] > 0.0) {
            shares.push_back(MassShare{i, masses[i]});
        }
    }
    return shares;
}

std::vector<GroupSplitSpec> combine_split_specs(const std::vector<std::vector<GroupSplitSpec>>& per_rule) {
    std::vector<const std::vector<GroupSplitSpec>*> lists;
    for (const auto& lst : per_rule) {
        if (!lst.empty()) {
            lists.push_back(&lst);
        }
    }
    if (lists.empty()) {
        return {};
    }

    std::size_t total = 1;
    for (const auto* lst : lists) {
        total *= lst->size();
    }

    std::vector<GroupSplitSpec> combined;
    combined.reserve(total);

    std::vector<std::size_t> idx(lists.size(), 0);
    for (std::size_t n = 0; n < total; ++n) {
        double p = 1.0;
        AttrMap attr_set;
        KeySet attr_del;
        RelMap rel_set;
        KeySet rel_del;

        for (std::size_t r = 0; r < lists.size(); ++r) {
            const GroupSplitSpec& s = (*lists[r])[idx[r]];
            p *= s.p();
            for (const auto& [key, value] : s.attr_set()) {
                attr_set[key] = value;
            }
            for (const auto& [key, value] : s.rel_set()) {
                rel_set[key] = value;
            }
            attr_del.insert(s.attr_del().begin(), s.attr_del().end());
            rel_del.insert(s.rel_del().begin(), s.rel_del().end());
        }

        combined.emplace_back(p, std::move(attr_set), std::move(attr_del), std::move(rel_set), std::move(rel_del));

        // Advance the odometer; the last list varies fastest
        for (std::size_t r = lists.size(); r-- > 0;) {
            if (++idx[r] < lists[r]->size()) {
                break;
            }
            idx[r] = 0;
        }
    }
    return combined;
}

} // namespace pram
