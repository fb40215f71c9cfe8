#include <gtest/gtest.h>

#include <cmath>

#include "fixtures.hpp"
#include "solution/CostEvaluator.hpp"
#include "solution/greedy.hpp"

using namespace clrpsa;
using namespace clrpsa::testing;

TEST(GreedyTest, ExampleInstance) {
    const auto instance = Instance(example_data());
    const auto solution = construct_greedy(instance);

    ASSERT_TRUE(solution.is_feasible());

    // Facility 1 has the better ratio (80 / 15) but cannot serve the whole demand, facility 0 is opened too.
    // 设施1的成本/容量比更低，但容量不足，需同时开放设施0
    EXPECT_TRUE(solution.is_facility_open(0));
    EXPECT_TRUE(solution.is_facility_open(1));
    EXPECT_EQ(solution.get_serving_facility(2), 0);
    EXPECT_EQ(solution.get_serving_facility(3), 0);
    EXPECT_EQ(solution.get_serving_facility(4), 1);
    EXPECT_EQ(solution.get_serving_facility(5), 1);

    // 6 + 5 exceed the vehicle capacity, facility 1 needs two routes.
    EXPECT_EQ(solution.get_facility_routes(0).size(), 1u);
    EXPECT_EQ(solution.get_facility_routes(1).size(), 2u);
    EXPECT_EQ(solution.get_route_stops(solution.get_route_index(2)), (std::vector<int>{2, 3}));

    EXPECT_NEAR(solution.get_cost(), 180.0 + 30.0 + 5.0 * std::sqrt(2.0) + 2.0 * std::sqrt(5.0), 1e-9);
    EXPECT_NEAR(solution.get_cost(), evaluate_cost(instance, solution).total, 1e-9);
}

TEST(GreedyTest, ClosesUnusedFacilities) {
    auto data = example_data();
    data.facilities[1].capacity = 30;
    const auto instance = Instance(data);
    const auto solution = construct_greedy(instance);

    ASSERT_TRUE(solution.is_feasible());
    EXPECT_FALSE(solution.is_facility_open(0));
    EXPECT_EQ(solution.get_open_facilities_num(), 1);
    EXPECT_EQ(solution.get_facility_load(1), instance.get_total_demand());
}

TEST(GreedyTest, DegenerateInstance) {
    const auto instance = Instance(degenerate_data());
    const auto solution = construct_greedy(instance);

    ASSERT_TRUE(solution.is_feasible());
    EXPECT_EQ(solution.get_routes_num(), 1);
    EXPECT_DOUBLE_EQ(solution.get_cost(), 16.0);
}

TEST(GreedyTest, InsufficientCapacity) {
    const auto instance = Instance(one_echelon_data({facility(0.0, 0.0, 10.0, 5), facility(5.0, 0.0, 10.0, 5)},
                                                    {customer(1.0, 0.0, 4), customer(2.0, 0.0, 4), customer(3.0, 0.0, 4)}, 10, 1.0));
    EXPECT_THROW(construct_greedy(instance), ConstructionFailure);
}

TEST(GreedyTest, FragmentedCapacity) {
    // The total capacity covers the demand, but the last customer does not fit any residual.
    // 总容量足够，但剩余容量碎片化
    const auto instance = Instance(one_echelon_data({facility(0.0, 0.0, 10.0, 5), facility(5.0, 0.0, 10.0, 5)},
                                                    {customer(1.0, 0.0, 4), customer(4.0, 0.0, 4), customer(2.0, 0.0, 2)}, 10, 1.0));
    EXPECT_THROW(construct_greedy(instance), ConstructionFailure);
}

TEST(GreedyTest, Deterministic) {
    const auto instance = Instance(random_one_echelon_data(11, 6, 60));
    const auto first = construct_greedy(instance);
    const auto second = construct_greedy(instance);

    ASSERT_TRUE(first.is_feasible());
    EXPECT_EQ(first, second);
    EXPECT_DOUBLE_EQ(first.get_cost(), second.get_cost());
}

TEST(GreedyTest, RandomInstancesAreFeasible) {
    for (auto seed = 1u; seed <= 10u; seed++) {
        const auto instance = Instance(random_one_echelon_data(seed, 5, 50));
        const auto solution = construct_greedy(instance);
        EXPECT_TRUE(solution.is_feasible()) << "seed " << seed;
        for (auto route : solution.get_routes(Tier::SECONDARY).get_elements()) {
            EXPECT_LE(solution.get_route_load(route), instance.get_vehicle_capacity(Tier::SECONDARY));
        }
    }
}

TEST(GreedyTest, TwoEchelon) {
    for (auto seed = 1u; seed <= 5u; seed++) {
        const auto instance = Instance(random_two_echelon_data(seed, 2, 4, 40));
        const auto solution = construct_greedy(instance);

        ASSERT_TRUE(solution.is_feasible()) << "seed " << seed;
        EXPECT_GT(solution.get_routes(Tier::PRIMARY).size(), 0u);

        for (auto facility : solution.get_open_facilities(Tier::SECONDARY)) {
            EXPECT_GT(solution.get_facility_load(facility), 0);
            const auto supplier = solution.get_supplier(facility);
            ASSERT_NE(supplier, Solution::dummy_vertex);
            EXPECT_EQ(instance.get_facility_tier(supplier), Tier::PRIMARY);
        }

        auto primary_load = 0;
        for (auto facility : solution.get_open_facilities(Tier::PRIMARY)) {
            primary_load += solution.get_facility_load(facility);
        }
        EXPECT_EQ(primary_load, instance.get_total_demand());
    }
}
