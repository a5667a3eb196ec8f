/**
 * Conflict and Migration Example
 *
 * Demonstrates a population driven by two interacting rules:
 * - Conflict kills a small share of settled agents and sets others migrating
 * - Migration kills a share of migrating agents that grows with their number
 * - Dead agents leave through VOID groups; a probe prints population totals
 */

#include <pram/group_population.hpp>
#include <pram/probe.hpp>
#include <pram/rule.hpp>
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>

using namespace pram;

namespace {

class ConflictRule : public Rule {
public:
    ConflictRule(double severity, double scale)
        : Rule("conflict", GroupQuery::by_attrs({{"is-migrating", false}}))
        , severity_(severity)
        , scale_(scale) {}

    Result apply(const GroupPopulation&, const Group&, std::size_t, double) override {
        double p_death = scale_ * severity_ * 0.0001;
        double p_migration = scale_ * 0.01;

        return std::vector<GroupSplitSpec>{
            GroupSplitSpec::make_void(p_death),
            GroupSplitSpec(p_migration, {{"is-migrating", true}, {"migration-dur", 0}}),
            GroupSplitSpec(1.0 - p_death - p_migration)
        };
    }

private:
    double severity_;  // [0 = benign .. 1 = lethal]
    double scale_;     // [0 = contained .. 1 = wide-spread]
};

class MigrationRule : public Rule {
public:
    explicit MigrationRule(double env_harshness)
        : Rule("migration", GroupQuery::by_attrs({{"is-migrating", true}}))
        , env_harshness_(env_harshness) {}

    Result apply(const GroupPopulation& pop, const Group& group, std::size_t, double) override {
        double migrating_pct = pop.get_groups_mass_prop(&migrating_) * 100.0;
        double p_death = std::min(env_harshness_ * 0.001 + migrating_pct * 0.05 * 0.01, 1.0);
        std::int64_t dur = group.get_attr("migration-dur", pop.usage_observer())->as_int();

        return std::vector<GroupSplitSpec>{
            GroupSplitSpec::make_void(p_death),
            GroupSplitSpec(1.0 - p_death, {{"migration-dur", dur + 1}})
        };
    }

private:
    double env_harshness_;
    GroupQuery migrating_ = GroupQuery::by_attrs({{"is-migrating", true}});
};

class PopulationProbe : public Probe {
public:
    PopulationProbe() : Probe("pop") {}

    void run(const GroupPopulation& pop, std::optional<std::size_t> iter, std::optional<double>) override {
        if (!iter.has_value()) {
            mass_init_ = pop.mass();
            return;
        }

        auto [migrating_m, migrating_p] = pop.get_groups_mass_and_prop(&migrating_);
        std::printf("%4zu  pop: %10.0f    dead: %10.0f|%3.0f%%    migrating: %10.0f|%3.0f%%\n",
                    *iter, pop.mass(), pop.mass_out(), pop.mass_out() / mass_init_ * 100.0,
                    migrating_m, migrating_p * 100.0);
    }

private:
    double mass_init_ = 0.0;
    GroupQuery migrating_ = GroupQuery::by_attrs({{"is-migrating", true}});
};

} // namespace

int main() {
    std::cout << "=== Conflict and Migration Example ===\n\n";

    GroupPopulation pop;
    pop.set_autocompact(true);

    pop.add_rule(std::make_shared<ConflictRule>(0.05, 0.2));
    pop.add_rule(std::make_shared<MigrationRule>(0.05));
    pop.add_group(Group("settled", 1000000.0, {{"is-migrating", false}}));

    PopulationProbe probe;
    probe.run(pop, std::nullopt, std::nullopt);

    try {
        const std::size_t months = 48;
        for (std::size_t iter = 1; iter <= months; ++iter) {
            double t = static_cast<double>(iter);
            pop.apply_rules(iter, t);
            probe.run(pop, iter, t);
            pop.post_iteration();
        }
    } catch (const std::exception& e) {
        std::cerr << "Simulation failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n" << pop.summary();
    return 0;
}
