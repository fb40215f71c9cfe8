#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "fixtures.hpp"
#include "solution/CostEvaluator.hpp"
#include "solution/Solution.hpp"

using namespace clrpsa;
using namespace clrpsa::testing;

namespace {

    // Customers of the example instance.
    constexpr int c_near_a = 2;  // (1, 1) demand 4
    constexpr int c_near_b = 3;  // (2, -1) demand 3
    constexpr int c_far_a = 4;   // (9, 1) demand 6
    constexpr int c_far_b = 5;   // (11, -1) demand 5

    // Facility 0 serves the two near customers in one route, facility 1 serves the far ones in two routes.
    // 可行解：设施0一条路径，设施1两条路径
    Solution make_feasible(const Instance& instance) {
        auto solution = Solution(instance);
        solution.open_facility(0);
        solution.open_facility(1);
        const auto route = solution.build_route(0, c_near_a);
        solution.insert_stop(route, 1, c_near_b);
        solution.build_route(1, c_far_a);
        solution.build_route(1, c_far_b);
        return solution;
    }

}  // namespace

TEST(SolutionTest, EmptySolution) {
    const auto instance = Instance(example_data());
    const auto solution = Solution(instance);

    EXPECT_DOUBLE_EQ(solution.get_cost(), 0.0);
    EXPECT_EQ(solution.get_routes_num(), 0);
    EXPECT_EQ(solution.get_open_facilities_num(), 0);
    EXPECT_FALSE(solution.is_vertex_in_solution(c_near_a));
    EXPECT_EQ(solution.get_serving_facility(c_near_a), Solution::dummy_vertex);
    // 顾客未被服务
    EXPECT_FALSE(solution.is_feasible());
}

TEST(SolutionTest, BuildAndInsertUpdateCaches) {
    const auto instance = Instance(example_data());
    auto solution = Solution(instance);

    EXPECT_DOUBLE_EQ(solution.open_facility(0), 100.0);

    const auto route = solution.build_route(0, c_near_a);
    EXPECT_DOUBLE_EQ(solution.get_cost(), 100.0 + 10.0 + 2.0 * std::sqrt(2.0));
    EXPECT_EQ(solution.get_route_load(route), 4);
    EXPECT_EQ(solution.get_facility_load(0), 4);
    EXPECT_EQ(solution.get_route_origin(route), 0);
    EXPECT_EQ(solution.get_route_tier(route), Tier::SECONDARY);

    const auto delta = solution.insert_stop(route, 1, c_near_b);
    EXPECT_NEAR(delta, 2.0 * std::sqrt(5.0) - std::sqrt(2.0), 1e-9);
    EXPECT_EQ(solution.get_route_stops(route), (std::vector<int>{c_near_a, c_near_b}));
    EXPECT_EQ(solution.get_position(c_near_b), 1);
    EXPECT_EQ(solution.get_route_index(c_near_b), route);
    EXPECT_EQ(solution.get_route_load(route), 7);
    EXPECT_EQ(solution.get_facility_load(0), 7);
    EXPECT_EQ(solution.get_serving_facility(c_near_b), 0);
    EXPECT_NEAR(solution.get_route_distance(route), std::sqrt(2.0) + 2.0 * std::sqrt(5.0), 1e-9);
    EXPECT_NEAR(solution.get_cost(), evaluate_cost(instance, solution).total, 1e-9);

    // Insert at the front shifts the cached positions.
    solution.insert_stop(route, 0, c_far_a);
    EXPECT_EQ(solution.get_position(c_far_a), 0);
    EXPECT_EQ(solution.get_position(c_near_a), 1);
    EXPECT_EQ(solution.get_position(c_near_b), 2);
    EXPECT_EQ(solution.get_vertex_at(route, -1), 0);
    EXPECT_EQ(solution.get_vertex_at(route, 3), 0);
}

TEST(SolutionTest, RemovingLastStopReleasesRoute) {
    const auto instance = Instance(example_data());
    auto solution = Solution(instance);
    solution.open_facility(0);

    const auto first = solution.build_route(0, c_near_a);
    const auto second = solution.build_route(0, c_near_b);
    ASSERT_NE(first, second);
    EXPECT_EQ(solution.get_routes_num(), 2);

    const auto cost_before = solution.get_cost();
    const auto delta = solution.remove_stop(first, 0);

    EXPECT_NEAR(delta, -(10.0 + 2.0 * std::sqrt(2.0)), 1e-9);
    EXPECT_NEAR(solution.get_cost(), cost_before + delta, 1e-9);
    EXPECT_EQ(solution.get_routes_num(), 1);
    EXPECT_FALSE(solution.is_route_in_use(first));
    EXPECT_TRUE(solution.is_route_in_use(second));
    EXPECT_EQ(solution.get_facility_routes(0), std::vector<int>{second});
    EXPECT_EQ(solution.get_facility_load(0), 3);

    // The freed slot is reused and the other route keeps its index.
    // 释放的槽位被重用，其他路径下标不变
    const auto third = solution.build_route(0, c_near_a);
    EXPECT_EQ(third, first);
    EXPECT_EQ(solution.get_route_stops(second), std::vector<int>{c_near_b});
    EXPECT_NEAR(solution.get_cost(), evaluate_cost(instance, solution).total, 1e-9);
}

TEST(SolutionTest, FeasibilityReport) {
    const auto instance = Instance(example_data());

    const auto feasible = make_feasible(instance);
    EXPECT_TRUE(feasible.is_feasible());
    EXPECT_NEAR(feasible.get_cost(), 180.0 + 30.0 + 5.0 * std::sqrt(2.0) + 2.0 * std::sqrt(5.0), 1e-9);

    // Facility 0 takes 11 units with a capacity of 10.
    // 设施0超出容量
    auto overloaded = Solution(instance);
    overloaded.open_facility(0);
    overloaded.open_facility(1);
    overloaded.build_route(0, c_far_a);
    overloaded.build_route(0, c_far_b);
    const auto route = overloaded.build_route(1, c_near_a);
    overloaded.insert_stop(route, 1, c_near_b);
    EXPECT_FALSE(overloaded.is_feasible());

    // Vehicle capacity of 10 exceeded by 6 + 5.
    auto heavy_route = Solution(instance);
    heavy_route.open_facility(0);
    heavy_route.open_facility(1);
    const auto near = heavy_route.build_route(0, c_near_a);
    heavy_route.insert_stop(near, 1, c_near_b);
    const auto far = heavy_route.build_route(1, c_far_a);
    heavy_route.insert_stop(far, 1, c_far_b);
    EXPECT_FALSE(heavy_route.is_feasible());
}

TEST(SolutionTest, ExchangeReverseAndRebase) {
    const auto instance = Instance(example_data());
    auto solution = make_feasible(instance);

    const auto near = solution.get_route_index(c_near_a);
    const auto far = solution.get_route_index(c_far_a);

    auto cost_before = solution.get_cost();
    auto delta = solution.exchange_stops(near, 1, far, 0);
    EXPECT_NEAR(solution.get_cost(), cost_before + delta, 1e-9);
    EXPECT_EQ(solution.get_route_index(c_near_b), far);
    EXPECT_EQ(solution.get_route_index(c_far_a), near);
    EXPECT_EQ(solution.get_position(c_far_a), 1);
    EXPECT_EQ(solution.get_facility_load(0), 10);
    EXPECT_EQ(solution.get_facility_load(1), 8);
    EXPECT_NEAR(solution.get_cost(), evaluate_cost(instance, solution).total, 1e-9);

    cost_before = solution.get_cost();
    delta = solution.reverse_path(near, 0, 1);
    EXPECT_NEAR(solution.get_cost(), cost_before + delta, 1e-9);
    EXPECT_EQ(solution.get_route_stops(near), (std::vector<int>{c_far_a, c_near_a}));
    EXPECT_EQ(solution.get_position(c_near_a), 1);

    cost_before = solution.get_cost();
    const auto moved = solution.get_route_index(c_far_b);
    delta = solution.rebase_route(moved, 0);
    EXPECT_NEAR(solution.get_cost(), cost_before + delta, 1e-9);
    EXPECT_EQ(solution.get_route_origin(moved), 0);
    EXPECT_EQ(solution.get_facility_load(0), 15);
    EXPECT_EQ(solution.get_facility_load(1), 3);
    EXPECT_EQ(solution.get_serving_facility(c_far_b), 0);
    EXPECT_NEAR(solution.get_cost(), evaluate_cost(instance, solution).total, 1e-9);
    // 设施0容量为10，此时超载
    EXPECT_FALSE(solution.is_feasible());
}

TEST(SolutionTest, TwoEchelonLoadPropagation) {
    auto data = example_data();
    data.echelons = 2;
    data.facilities.push_back(facility(5.0, 5.0, 300.0, 100, Tier::PRIMARY));
    data.primary_vehicle.capacity = 20;
    data.primary_vehicle.fixed_cost = 30.0;
    data.primary_vehicle.unit_cost = 2.0;
    const auto instance = Instance(data);

    // Customers start after the three facilities.
    const auto customer = [&](int n) { return instance.get_customers_begin() + n; };

    auto solution = Solution(instance);
    solution.open_facility(2);
    solution.open_facility(0);
    solution.open_facility(1);

    const auto primary = solution.build_route(2, 0);
    EXPECT_EQ(solution.get_route_tier(primary), Tier::PRIMARY);
    EXPECT_EQ(solution.get_route_load(primary), 0);
    EXPECT_EQ(solution.get_supplier(0), 2);

    const auto route0 = solution.build_route(0, customer(0));
    solution.insert_stop(route0, 1, customer(1));
    EXPECT_EQ(solution.get_facility_load(0), 7);
    EXPECT_EQ(solution.get_route_load(primary), 7);
    EXPECT_EQ(solution.get_facility_load(2), 7);

    solution.insert_stop(primary, 1, 1);
    const auto route1 = solution.build_route(1, customer(2));
    solution.build_route(1, customer(3));
    EXPECT_EQ(solution.get_facility_load(1), 11);
    EXPECT_EQ(solution.get_route_load(primary), 18);
    EXPECT_EQ(solution.get_facility_load(2), 18);
    EXPECT_NEAR(solution.get_cost(), evaluate_cost(instance, solution).total, 1e-9);
    EXPECT_TRUE(solution.is_feasible());

    // Routing cost of the primary route is weighted by its unit cost.
    const auto primary_distance = route_distance(instance, 2, {0, 1});
    EXPECT_NEAR(solution.get_route_distance(primary), primary_distance, 1e-9);

    // Rebasing moves the load from one intermediate facility to the other, the primary totals do not change.
    // 在两个中转设施之间转移路径，一级路径载重不变
    solution.rebase_route(route1, 0);
    EXPECT_EQ(solution.get_facility_load(0), 13);
    EXPECT_EQ(solution.get_facility_load(1), 5);
    EXPECT_EQ(solution.get_route_load(primary), 18);
    EXPECT_FALSE(solution.is_feasible());

    solution.rebase_route(route1, 1);
    const auto cost_before = solution.get_cost();
    const auto delta = solution.remove_stop(route0, 0);
    EXPECT_NEAR(solution.get_cost(), cost_before + delta, 1e-9);
    EXPECT_EQ(solution.get_facility_load(0), 3);
    EXPECT_EQ(solution.get_route_load(primary), 14);
    EXPECT_EQ(solution.get_facility_load(2), 14);
}

TEST(SolutionTest, CopyAndCompare) {
    const auto instance = Instance(example_data());
    auto solution = make_feasible(instance);

    auto copy = solution;
    EXPECT_EQ(copy, solution);

    // Same cost but different sequence.
    copy.reverse_path(copy.get_route_index(c_near_a), 0, 1);
    EXPECT_NEAR(copy.get_cost(), solution.get_cost(), 1e-9);
    EXPECT_NE(copy, solution);

    copy = solution;
    EXPECT_EQ(copy, solution);
    EXPECT_TRUE(copy.is_feasible());

    copy.reset();
    EXPECT_DOUBLE_EQ(copy.get_cost(), 0.0);
    EXPECT_EQ(copy.get_routes_num(), 0);
    EXPECT_EQ(copy.get_open_facilities_num(), 0);
    EXPECT_TRUE(solution.is_feasible());
}

TEST(SolutionTest, StoreToFile) {
    const auto instance = Instance(example_data());
    const auto solution = make_feasible(instance);

    const auto path = ::testing::TempDir() + "clrpsa_solution.sol";
    Solution::store_to_file(instance, solution, path);

    auto in = std::ifstream(path);
    ASSERT_TRUE(in.good());

    auto lines = std::vector<std::string>();
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }

    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], "Facilities 0 1");
    EXPECT_EQ(lines[1], "secondary 0 : 2 3");
    EXPECT_EQ(lines[2], "secondary 1 : 4");
    EXPECT_EQ(lines[3], "secondary 1 : 5");
    EXPECT_EQ(lines[4].rfind("Cost ", 0), 0u);
    EXPECT_NEAR(std::stod(lines[4].substr(5)), solution.get_cost(), 1e-6);

    std::remove(path.c_str());
}
