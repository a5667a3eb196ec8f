/**
 * Flu at Sites Example
 *
 * Demonstrates site-aware rules:
 * - Groups commute between their home and a shared workplace
 * - Infection risk depends on the infected share of the site a group is at
 * - Both rules apply to the same groups and are combined every hour
 * - The driver mirrors workplace occupancy into the site's capacity
 */

#include <pram/group_population.hpp>
#include <pram/probe.hpp>
#include <pram/rule.hpp>
#include <cstdio>
#include <iostream>
#include <memory>

using namespace pram;

namespace {

class FluAtSiteRule : public Rule {
public:
    FluAtSiteRule() : Rule("flu-at-site") {}

    bool is_applicable(const Group& group, std::size_t, double) const override {
        return group.has_attr("flu");
    }

    Result apply(const GroupPopulation& pop, const Group& group, std::size_t, double) override {
        AttributeUsageObserver* observer = pop.usage_observer();
        const std::string& flu = group.get_attr("flu", observer)->as_string();

        if (flu == "s") {
            const Site* site = pop.site_at(group);
            if (!site) {
                return std::nullopt;
            }
            double p_infection = site->get_mass_prop(&infected_, observer) * 0.5;
            return std::vector<GroupSplitSpec>{
                GroupSplitSpec(p_infection, {{"flu", "i"}}),
                GroupSplitSpec(1.0 - p_infection)
            };
        }
        if (flu == "i") {
            return std::vector<GroupSplitSpec>{
                GroupSplitSpec(0.2, {{"flu", "r"}}),
                GroupSplitSpec(0.8)
            };
        }
        return std::vector<GroupSplitSpec>{
            GroupSplitSpec(0.05, {{"flu", "s"}}),
            GroupSplitSpec(0.95)
        };
    }

private:
    GroupQuery infected_ = GroupQuery::by_attrs({{"flu", "i"}});
};

class GoToRule : public Rule {
public:
    GoToRule() : Rule("go-to") {}

    Result apply(const GroupPopulation& pop, const Group& group, std::size_t, double t) override {
        int hour = static_cast<int>(t) % 24;
        AttributeUsageObserver* observer = pop.usage_observer();

        if (hour == 8 && group.is_at_site_name("home")) {
            const RelValue* work = group.get_rel("work", observer);
            if (!work) {
                return std::nullopt;
            }
            return std::vector<GroupSplitSpec>{
                GroupSplitSpec(0.9, {}, {}, {{SITE_AT, *work}}),
                GroupSplitSpec(0.1)
            };
        }
        if (hour == 17 && group.is_at_site_name("work")) {
            return std::vector<GroupSplitSpec>{
                GroupSplitSpec(1.0, {}, {}, {{SITE_AT, *group.get_rel("home", observer)}})
            };
        }
        return std::nullopt;
    }
};

} // namespace

int main() {
    std::cout << "=== Flu at Sites Example ===\n\n";

    auto home_a = std::make_shared<Site>("home-a", AttrMap{{"district", 1}});
    auto home_b = std::make_shared<Site>("home-b", AttrMap{{"district", 2}});
    auto office = std::make_shared<Site>("office", AttrMap{{"type", "work"}}, SITE_AT, 600);

    GroupPopulation pop;
    pop.add_rule(std::make_shared<FluAtSiteRule>());
    pop.add_rule(std::make_shared<GoToRule>());

    pop.add_group(Group("a", 500.0, {{"flu", "s"}}, {{"home", home_a}, {"work", office}, {SITE_AT, home_a}}));
    pop.add_group(Group("b", 300.0, {{"flu", "s"}}, {{"home", home_b}, {"work", office}, {SITE_AT, home_b}}));

    // Seed infections in the first household only
    const EntityHash seeded = home_a->entity_hash();
    pop.apply_group_setup([seeded](const GroupPopulation&, const Group& g) -> Rule::Result {
        auto at = g.site_at();
        if (!at.has_value() || *at != seeded) {
            return std::nullopt;
        }
        return std::vector<GroupSplitSpec>{GroupSplitSpec(0.05, {{"flu", "i"}}), GroupSplitSpec(0.95)};
    });

    GroupMassProbe probe("flu", {
        {"s", GroupQuery::by_attrs({{"flu", "s"}})},
        {"i", GroupQuery::by_attrs({{"flu", "i"}})},
        {"r", GroupQuery::by_attrs({{"flu", "r"}})}
    });
    probe.run(pop, std::nullopt, std::nullopt);

    try {
        for (std::size_t iter = 1; iter <= 48; ++iter) {
            double t = static_cast<double>(iter);
            pop.apply_rules(iter, t);
            probe.run(pop, iter, t);
            pop.post_iteration();

            office->release(office->capacity());
            std::size_t turned_away = office->allocate_any(static_cast<std::size_t>(office->mass()));
            if (turned_away > 0) {
                std::printf("hour %2zu: office over capacity by %zu\n", iter, turned_away);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Simulation failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n" << probe.to_string() << "\n" << pop.summary();
    return 0;
}
