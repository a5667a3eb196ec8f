#include <gtest/gtest.h>
#include <pram/debug_log.hpp>
#include <pram/errors.hpp>
#include <pram/group_population.hpp>
#include <pram/rule.hpp>
#include "test_helpers.hpp"

using namespace pram;
using test_utils::LambdaRule;
using test_utils::make_fixed_rule;
using test_utils::make_noop_rule;

class GroupPopulationTest : public ::testing::Test {
protected:
    GroupPopulation pop;
    std::shared_ptr<Site> home = std::make_shared<Site>("home");
    std::shared_ptr<Site> work = std::make_shared<Site>("work");

    void SetUp() override {
        pop.add_rule(make_noop_rule());
    }
};

// === CONSTRUCTION ORDER ===

TEST(GroupPopulationConstructionTest, GroupBeforeRuleIsRejected) {
    GroupPopulation pop;
    EXPECT_THROW(pop.add_group(Group("g", 1.0)), SimulationConstructionError);
    EXPECT_THROW(pop.add_groups({Group("g", 1.0)}), SimulationConstructionError);
    EXPECT_EQ(pop.group_count(), 0u);
}

TEST(GroupPopulationConstructionTest, RuleAfterGroupIsRejected) {
    GroupPopulation pop;
    pop.add_rule(make_noop_rule("first"));
    pop.add_group(Group("g", 1.0));
    EXPECT_THROW(pop.add_rule(make_noop_rule("late")), SimulationConstructionError);
    EXPECT_EQ(pop.rules().size(), 1u);
}

// === REGISTRATION ===

TEST_F(GroupPopulationTest, EqualContentMerges) {
    pop.add_group(Group("a", 10.0, {{"sex", "f"}}));
    const Group& merged = pop.add_group(Group("b", 15.0, {{"sex", "f"}}));

    EXPECT_EQ(pop.group_count(), 1u);
    EXPECT_DOUBLE_EQ(merged.mass(), 25.0);
    EXPECT_EQ(merged.name(), "a");
    EXPECT_DOUBLE_EQ(pop.mass(), 25.0);
}

TEST_F(GroupPopulationTest, RegistrationResolvesSites) {
    const Group& g = pop.add_group(Group("g", 10.0, {}, {{SITE_AT, home}, {"work", work}}));

    EXPECT_EQ(pop.site_count(), 2u);
    EXPECT_TRUE(g.get_rel(SITE_AT)->is_hash());
    EXPECT_TRUE(g.get_rel("work")->is_hash());
    EXPECT_EQ(pop.site_at(g), home.get());
    EXPECT_DOUBLE_EQ(home->mass(), 10.0);
    EXPECT_DOUBLE_EQ(work->mass(), 0.0);  // linked only through SITE_AT
}

TEST_F(GroupPopulationTest, RegistrationResolvesResources) {
    auto bus = std::make_shared<Resource>("bus", 40);
    const Group& g = pop.add_group(Group("g", 10.0, {}, {{"commute", bus}}));

    EXPECT_EQ(pop.resource_count(), 1u);
    EXPECT_EQ(pop.find_resource(bus->entity_hash()), bus);
    EXPECT_TRUE(g.get_rel("commute")->is_hash());
}

TEST_F(GroupPopulationTest, AddSiteDeduplicates) {
    auto first = pop.add_site(home);
    auto again = pop.add_site(std::make_shared<Site>("home"));

    EXPECT_EQ(first, home);
    EXPECT_EQ(again, home);
    EXPECT_EQ(pop.site_count(), 1u);
    EXPECT_EQ(&pop.site(home->entity_hash()), home.get());
}

TEST_F(GroupPopulationTest, UnknownSiteLookup) {
    EXPECT_THROW(pop.site(EntityHash{42}), std::out_of_range);
    EXPECT_EQ(pop.find_site(EntityHash{42}), nullptr);
}

TEST_F(GroupPopulationTest, GetGroupByContent) {
    pop.add_group(Group("g", 3.0, {{"x", 1}}, {{SITE_AT, home}}));

    const Group* found = pop.get_group({{"x", 1}}, {{SITE_AT, home}});
    ASSERT_NE(found, nullptr);
    EXPECT_DOUBLE_EQ(found->mass(), 3.0);
    EXPECT_EQ(pop.get_group({{"x", 1}}), nullptr);
}

TEST_F(GroupPopulationTest, NextGroupName) {
    EXPECT_EQ(pop.next_group_name(), "g.0");
    pop.add_group(Group("a", 1.0, {{"x", 1}}));
    pop.add_group(Group("b", 1.0, {{"x", 2}}));
    EXPECT_EQ(pop.next_group_name(), "g.2");
}

// === MASS TRANSFER ===

TEST_F(GroupPopulationTest, TransferZeroesSourcesBeforeCrediting) {
    // Two groups swap their content; naive in-place updates would double count
    const Group& a = pop.add_group(Group("a", 10.0, {{"side", "l"}}));
    const Group& b = pop.add_group(Group("b", 30.0, {{"side", "r"}}));

    std::vector<MassFlowSpec> flows;
    flows.push_back(MassFlowSpec{pop.mass(), a.hash(), {Group("a", 10.0, {{"side", "r"}})}});
    flows.push_back(MassFlowSpec{pop.mass(), b.hash(), {Group("b", 30.0, {{"side", "l"}})}});
    pop.transfer_mass(std::move(flows));

    EXPECT_DOUBLE_EQ(pop.get_group({{"side", "l"}})->mass(), 30.0);
    EXPECT_DOUBLE_EQ(pop.get_group({{"side", "r"}})->mass(), 10.0);
    EXPECT_DOUBLE_EQ(pop.last_mass_flow_total(), 40.0);
    EXPECT_DOUBLE_EQ(pop.mass(), 40.0);
}

TEST_F(GroupPopulationTest, TransferRejectsUnknownSource) {
    pop.add_group(Group("a", 10.0, {{"x", 1}}));
    std::vector<MassFlowSpec> flows{MassFlowSpec{10.0, 12345, {Group("a", 10.0, {{"x", 2}})}}};
    EXPECT_THROW(pop.transfer_mass(std::move(flows)), std::invalid_argument);
    EXPECT_DOUBLE_EQ(pop.get_group({{"x", 1}})->mass(), 10.0);
}

TEST_F(GroupPopulationTest, TransferRejectsRepeatedSource) {
    pop.add_group(Group("a", 10.0, {{"x", 1}}));
    ContentHash src = pop.get_group({{"x", 1}})->hash();
    std::vector<MassFlowSpec> flows{
        MassFlowSpec{10.0, src, {Group("a", 10.0, {{"x", 2}})}},
        MassFlowSpec{10.0, src, {Group("a", 10.0, {{"x", 3}})}}
    };
    EXPECT_THROW(pop.transfer_mass(std::move(flows)), std::invalid_argument);
    EXPECT_DOUBLE_EQ(pop.get_group({{"x", 1}})->mass(), 10.0);
    EXPECT_EQ(pop.get_group({{"x", 2}}), nullptr);
    EXPECT_DOUBLE_EQ(pop.mass(), 10.0);
}

namespace {
std::vector<std::string> g_warnings;

void capture_warning(debug::Level level, const char* message) {
    if (level == debug::Level::WARN) {
        g_warnings.emplace_back(message);
    }
}
} // namespace

TEST_F(GroupPopulationTest, NonConservingFlowIsLogged) {
    pop.add_group(Group("a", 10.0, {{"x", 1}}));
    ContentHash src = pop.get_group({{"x", 1}})->hash();

    g_warnings.clear();
    debug::set_log_callback(&capture_warning);
    pop.transfer_mass({MassFlowSpec{10.0, src, {Group("a", 7.0, {{"x", 2}})}}});
    debug::clear_log_callback();

    ASSERT_EQ(g_warnings.size(), 1u);
    EXPECT_NE(g_warnings[0].find("[WARN][pram]"), std::string::npos);
    EXPECT_DOUBLE_EQ(pop.get_group({{"x", 2}})->mass(), 7.0);
}

TEST_F(GroupPopulationTest, ApplyRulesConservesMass) {
    pop.add_group(Group("s", 1000.0, {{"flu", "s"}}));
    pop.add_group(Group("i", 10.0, {{"flu", "i"}}));

    RuleList rules{
        make_fixed_rule("infect", {GroupSplitSpec(0.13, {{"flu", "i"}}), GroupSplitSpec(0.87)},
                        GroupQuery::by_attrs({{"flu", "s"}})),
        make_fixed_rule("recover", {GroupSplitSpec(0.27, {{"flu", "r"}}), GroupSplitSpec(0.73)},
                        GroupQuery::by_attrs({{"flu", "i"}}))
    };

    for (std::size_t iter = 1; iter <= 10; ++iter) {
        pop.apply_rules(rules, iter, static_cast<double>(iter));
        pop.post_iteration();
        EXPECT_DOUBLE_EQ(pop.get_groups_mass(), 1010.0) << "iteration " << iter;
    }
    GroupQuery recovered = GroupQuery::by_attrs({{"flu", "r"}});
    EXPECT_GT(pop.get_groups_mass(&recovered), 0.0);
}

TEST_F(GroupPopulationTest, NoSplitIsNoOp) {
    pop.set_history_length(2);
    pop.add_group(Group("g", 5.0, {{"x", 1}}));
    pop.apply_rules(1, 1.0);

    EXPECT_TRUE(pop.history().empty());
    EXPECT_DOUBLE_EQ(pop.last_mass_flow_total(), 0.0);
}

TEST_F(GroupPopulationTest, MassFlowSpecsAreKeptOnRequest) {
    pop.set_keep_mass_flow_specs(true);
    const Group& g = pop.add_group(Group("g", 100.0, {{"x", 1}}));
    ContentHash src = g.hash();

    RuleList rules{make_fixed_rule("r", {GroupSplitSpec(0.25, {{"x", 2}}), GroupSplitSpec(0.75)})};
    pop.apply_rules(rules, 1, 1.0);

    ASSERT_EQ(pop.last_mass_flow_specs().size(), 1u);
    const MassFlowSpec& flow = pop.last_mass_flow_specs()[0];
    EXPECT_EQ(flow.src_hash, src);
    EXPECT_DOUBLE_EQ(flow.pop_mass, 100.0);
    EXPECT_DOUBLE_EQ(test_utils::total_mass(flow.dst), 100.0);
    EXPECT_DOUBLE_EQ(pop.last_mass_flow_total(), 100.0);
}

TEST_F(GroupPopulationTest, SitesAreRelinkedAfterTransfer) {
    pop.add_group(Group("g", 100.0, {}, {{SITE_AT, home}}));
    pop.add_site(work);
    EXPECT_DOUBLE_EQ(home->mass(), 100.0);

    RuleList rules{make_fixed_rule("commute", {GroupSplitSpec(0.4, {}, {}, {{SITE_AT, work}}),
                                               GroupSplitSpec(0.6)})};
    pop.apply_rules(rules, 1, 1.0);

    EXPECT_DOUBLE_EQ(home->mass(), 60.0);
    EXPECT_DOUBLE_EQ(work->mass(), 40.0);
    EXPECT_EQ(work->group_count(), 1u);
}

TEST_F(GroupPopulationTest, DestinationSitesAreRegistered) {
    pop.add_group(Group("g", 10.0, {}, {{SITE_AT, home}}));
    auto store = std::make_shared<Site>("store");

    RuleList rules{make_fixed_rule("shop", {GroupSplitSpec(1.0, {}, {}, {{SITE_AT, store}})})};
    pop.apply_rules(rules, 1, 1.0);

    EXPECT_EQ(pop.site_count(), 2u);
    EXPECT_NE(pop.find_site(store->entity_hash()), nullptr);
    EXPECT_DOUBLE_EQ(store->mass(), 10.0);
}

// === VOID / VITA ===

TEST_F(GroupPopulationTest, VoidGroupsAreRemoved) {
    pop.add_group(Group("g", 100.0, {{"alive", true}}));

    RuleList rules{make_fixed_rule("die", {GroupSplitSpec::make_void(0.2), GroupSplitSpec(0.8)})};
    pop.apply_rules(rules, 1, 1.0);

    ASSERT_EQ(pop.group_count(), 2u);
    double void_mass = 0.0;
    for (const Group* g : pop.get_groups()) {
        if (g->is_void()) {
            void_mass = g->mass();
        }
    }
    EXPECT_DOUBLE_EQ(void_mass, 20.0);

    pop.post_iteration();
    EXPECT_EQ(pop.group_count(), 1u);
    for (const Group* g : pop.get_groups()) {
        EXPECT_FALSE(g->is_void());
    }
    EXPECT_DOUBLE_EQ(pop.mass(), 80.0);
    EXPECT_DOUBLE_EQ(pop.mass_out(), 20.0);
}

TEST_F(GroupPopulationTest, VitaGroupsFoldIn) {
    pop.add_group(Group("g", 50.0, {{"age", "adult"}}));

    pop.add_vita_group(Group("born", 3.0, {{"age", "child"}}));
    pop.add_vita_group(Group("born", 2.0, {{"age", "child"}}));
    pop.add_vita_group(Group("moved", 4.0, {{"age", "adult"}}));
    EXPECT_EQ(pop.vita_group_count(), 2u);
    EXPECT_DOUBLE_EQ(pop.vita_mass(), 9.0);

    pop.post_iteration();

    EXPECT_EQ(pop.vita_group_count(), 0u);
    EXPECT_DOUBLE_EQ(pop.get_group({{"age", "adult"}})->mass(), 54.0);
    ASSERT_NE(pop.get_group({{"age", "child"}}), nullptr);
    EXPECT_DOUBLE_EQ(pop.get_group({{"age", "child"}})->mass(), 5.0);
    EXPECT_TRUE(pop.get_group({{"age", "child"}})->is_registered());
    EXPECT_DOUBLE_EQ(pop.mass(), 59.0);
    EXPECT_DOUBLE_EQ(pop.mass_in(), 9.0);
}

// === COMPACTION ===

TEST_F(GroupPopulationTest, CompactDropsEmptyGroups) {
    pop.add_group(Group("g", 10.0, {{"x", 1}}, {{SITE_AT, home}}));
    RuleList rules{make_fixed_rule("move", {GroupSplitSpec(1.0, {{"x", 2}})})};
    pop.apply_rules(rules, 1, 1.0);

    EXPECT_EQ(pop.group_count(), 2u);
    EXPECT_EQ(pop.group_count(true), 1u);
    GroupQuery q = GroupQuery::by_attrs({{"x", 2}});
    double before = pop.get_groups_mass(&q);

    pop.compact();
    EXPECT_EQ(pop.group_count(), 1u);
    EXPECT_DOUBLE_EQ(pop.get_groups_mass(&q), before);
    EXPECT_EQ(home->group_count(), 1u);

    pop.compact();
    EXPECT_EQ(pop.group_count(), 1u);
}

TEST_F(GroupPopulationTest, AutocompactAfterPostIteration) {
    pop.set_autocompact(true);
    pop.add_group(Group("g", 10.0, {{"x", 1}}));
    RuleList rules{make_fixed_rule("move", {GroupSplitSpec(1.0, {{"x", 2}})})};
    pop.apply_rules(rules, 1, 1.0);
    pop.post_iteration();
    EXPECT_EQ(pop.group_count(), 1u);
}

// === QUERIES ===

TEST_F(GroupPopulationTest, QueryMassAndProportion) {
    pop.add_group(Group("a", 30.0, {{"flu", "i"}, {"age", 1}}));
    pop.add_group(Group("b", 20.0, {{"flu", "i"}, {"age", 2}}));
    pop.add_group(Group("c", 50.0, {{"flu", "s"}, {"age", 1}}));

    GroupQuery infected = GroupQuery::by_attrs({{"flu", "i"}});
    EXPECT_EQ(pop.get_groups(&infected).size(), 2u);
    EXPECT_DOUBLE_EQ(pop.get_groups_mass(&infected), 50.0);
    EXPECT_DOUBLE_EQ(pop.get_groups_mass_prop(&infected), 0.5);

    GroupQuery exact({{"flu", "i"}, {"age", 1}}, {}, {}, true);
    auto [m, p] = pop.get_groups_mass_and_prop(&exact);
    EXPECT_DOUBLE_EQ(m, 30.0);
    EXPECT_DOUBLE_EQ(p, 0.3);
}

TEST_F(GroupPopulationTest, QueryCacheIsInvalidatedByTransfer) {
    pop.add_group(Group("g", 100.0, {{"flu", "s"}}));
    GroupQuery infected = GroupQuery::by_attrs({{"flu", "i"}});
    EXPECT_DOUBLE_EQ(pop.get_groups_mass(&infected), 0.0);

    RuleList rules{make_fixed_rule("infect", {GroupSplitSpec(0.5, {{"flu", "i"}}), GroupSplitSpec(0.5)})};
    pop.apply_rules(rules, 1, 1.0);

    EXPECT_DOUBLE_EQ(pop.get_groups_mass(&infected), 50.0);
    EXPECT_EQ(pop.get_groups(&infected).size(), 1u);
}

TEST_F(GroupPopulationTest, HistoryDelta) {
    pop.set_history_length(2);
    pop.add_group(Group("g", 100.0, {{"flu", "s"}}));
    RuleList rules{make_fixed_rule("infect", {GroupSplitSpec(0.1, {{"flu", "i"}}), GroupSplitSpec(0.9)},
                                   GroupQuery::by_attrs({{"flu", "s"}}))};

    GroupQuery infected = GroupQuery::by_attrs({{"flu", "i"}});
    EXPECT_DOUBLE_EQ(pop.get_groups_mass(&infected, 1), 0.0);  // nothing archived yet

    pop.apply_rules(rules, 1, 1.0);   // s: 90, i: 10
    pop.post_iteration();
    pop.apply_rules(rules, 2, 2.0);   // s: 81, i: 19
    pop.post_iteration();

    ASSERT_EQ(pop.history().size(), 2u);
    EXPECT_DOUBLE_EQ(pop.history().back().group_mass(Group::gen_hash({{"flu", "i"}}, {})), 19.0);
    EXPECT_DOUBLE_EQ(pop.get_groups_mass(&infected, 1), 0.0);
    EXPECT_DOUBLE_EQ(pop.get_groups_mass(&infected, 2), 9.0);
    EXPECT_THROW(pop.get_groups_mass(&infected, 3), std::out_of_range);
}

TEST_F(GroupPopulationTest, HistoryIsBounded) {
    pop.set_history_length(3);
    pop.add_group(Group("g", 10.0, {{"x", 0}}));
    RuleList rules{make_fixed_rule("flip", {GroupSplitSpec(1.0, {{"x", 1}})}, GroupQuery::by_attrs({{"x", 0}})),
                   make_fixed_rule("flop", {GroupSplitSpec(1.0, {{"x", 0}})}, GroupQuery::by_attrs({{"x", 1}}))};

    for (std::size_t iter = 1; iter <= 5; ++iter) {
        pop.apply_rules(rules, iter, 0.0);
        pop.post_iteration();
    }
    EXPECT_EQ(pop.history().size(), 3u);

    pop.set_history_length(1);
    EXPECT_EQ(pop.history().size(), 1u);
}

TEST_F(GroupPopulationTest, SummaryMentionsTotals) {
    pop.add_group(Group("g", 12.0, {{"x", 1}}, {{SITE_AT, home}}));
    std::string text = pop.summary();
    EXPECT_NE(text.find("mass:"), std::string::npos);
    EXPECT_NE(text.find("sites:     1"), std::string::npos);
}

// === SETUP HOOKS ===

TEST_F(GroupPopulationTest, GroupSetupSplitsEveryGroup) {
    pop.add_group(Group("g", 100.0, {{"flu", "s"}}));
    pop.apply_group_setup([](const GroupPopulation&, const Group&) -> Rule::Result {
        return std::vector<GroupSplitSpec>{GroupSplitSpec(0.05, {{"flu", "i"}}), GroupSplitSpec(0.95)};
    });

    EXPECT_DOUBLE_EQ(pop.get_group({{"flu", "i"}})->mass(), 5.0);
    EXPECT_DOUBLE_EQ(pop.get_group({{"flu", "s"}})->mass(), 95.0);
    EXPECT_DOUBLE_EQ(pop.mass(), 100.0);
}

namespace {
// Seeds an "age" attribute on setup and strips it on cleanup; never claims during iterations
class AgeSeedRule : public Rule {
public:
    AgeSeedRule() : Rule("age-seed", GroupQuery::by_attrs({{"never", true}})) {}

    Result apply(const GroupPopulation&, const Group&, std::size_t, double) override {
        return std::nullopt;
    }

    Result setup(const GroupPopulation&, const Group&) override {
        return std::vector<GroupSplitSpec>{GroupSplitSpec(0.3, {{"age", "child"}}),
                                           GroupSplitSpec(0.7, {{"age", "adult"}})};
    }

    Result cleanup(const GroupPopulation&, const Group& group) override {
        if (!group.has_attr("age")) {
            return std::nullopt;
        }
        return std::vector<GroupSplitSpec>{GroupSplitSpec(1.0).del_attr("age")};
    }
};
} // namespace

TEST_F(GroupPopulationTest, RuleSetupAndCleanupIgnoreFilter) {
    pop.add_group(Group("g", 10.0, {{"flu", "s"}}));
    RuleList rules{std::make_shared<AgeSeedRule>()};

    pop.apply_rule_setup(rules);
    EXPECT_DOUBLE_EQ(pop.get_group({{"flu", "s"}, {"age", "child"}})->mass(), 3.0);
    EXPECT_DOUBLE_EQ(pop.get_group({{"flu", "s"}, {"age", "adult"}})->mass(), 7.0);

    pop.apply_rules(rules, 1, 1.0);  // filter never matches
    EXPECT_DOUBLE_EQ(pop.get_group({{"flu", "s"}, {"age", "child"}})->mass(), 3.0);

    pop.apply_rule_cleanup(rules);
    EXPECT_DOUBLE_EQ(pop.get_group({{"flu", "s"}})->mass(), 10.0);
    EXPECT_DOUBLE_EQ(pop.mass(), 10.0);
}
