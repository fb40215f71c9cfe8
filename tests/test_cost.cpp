#include <gtest/gtest.h>

#include <cmath>
#include <random>

#include "fixtures.hpp"
#include "localsearch/Neighborhood.hpp"
#include "solution/CostEvaluator.hpp"
#include "solution/Solution.hpp"
#include "solution/greedy.hpp"

using namespace clrpsa;
using namespace clrpsa::testing;

namespace {

    // Checks that the predicted variation of `move` matches the one observed by applying it to a copy of `solution`.
    // 预测的成本变化量必须与实际执行的结果一致
    void expect_consistent(const Solution& solution, const Move& move) {
        ASSERT_TRUE(is_feasible(solution, move));

        auto copy = solution;
        const auto predicted = compute_delta(solution, move);
        const auto applied = apply_move(copy, move);

        EXPECT_NEAR(predicted, applied, 1e-6);
        EXPECT_NEAR(copy.get_cost(), solution.get_cost() + predicted, 1e-6);
        EXPECT_NEAR(copy.get_cost(), evaluate_cost(solution.get_instance(), copy).total, 1e-6);
        EXPECT_TRUE(copy.is_feasible());
    }

    // Example instance with room for every customer in a single route.
    Instance::Data roomy_data() {
        auto data = example_data();
        data.facilities[0].capacity = 30;
        data.facilities[1].capacity = 30;
        data.secondary_vehicle.capacity = 30;
        return data;
    }

    // Route 0: facility 0 -> 2 -> 3. Route 1: facility 1 -> 4. Route 2: facility 1 -> 5.
    Solution make_three_routes(const Instance& instance) {
        auto solution = Solution(instance);
        solution.open_facility(0);
        solution.open_facility(1);
        const auto route = solution.build_route(0, 2);
        solution.insert_stop(route, 1, 3);
        solution.build_route(1, 4);
        solution.build_route(1, 5);
        return solution;
    }

    // Random walk applying every feasible proposal.
    // 随机游走：执行所有可行的移动，并检查增量计算
    void random_walk(const Instance& instance, unsigned int seed, int iterations) {
        auto rand_engine = std::mt19937(seed);
        auto neighborhood = Neighborhood(instance, rand_engine);
        auto kinds = std::uniform_int_distribution<int>(0, MOVE_KINDS_NUM - 1);

        auto solution = construct_greedy(instance);
        ASSERT_TRUE(solution.is_feasible());

        auto applied_num = 0;
        for (auto iter = 0; iter < iterations; iter++) {
            const auto kind = static_cast<MoveKind>(kinds(rand_engine));
            const auto move = neighborhood.propose(kind, solution);
            if (!move || !is_feasible(solution, *move)) {
                continue;
            }
            EXPECT_EQ(get_kind(instance, *move), kind);

            const auto cost_before = solution.get_cost();
            const auto predicted = compute_delta(solution, *move);
            const auto applied = apply_move(solution, *move);
            applied_num++;

            ASSERT_NEAR(predicted, applied, 1e-6) << "move " << to_string(kind) << " at iteration " << iter;
            ASSERT_NEAR(solution.get_cost(), cost_before + predicted, 1e-6);

            if (iter % 50 == 0) {
                ASSERT_TRUE(solution.is_feasible()) << "after move " << to_string(kind) << " at iteration " << iter;
            }
        }

        EXPECT_GT(applied_num, 0);
        EXPECT_TRUE(solution.is_feasible());
        EXPECT_NEAR(solution.get_cost(), evaluate_cost(instance, solution).total, 1e-6);
    }

}  // namespace

TEST(CostTest, HandBuiltSolution) {
    const auto instance = Instance(degenerate_data());
    auto solution = Solution(instance);
    solution.open_facility(0);
    solution.build_route(0, 1);

    const auto breakdown = evaluate_cost(instance, solution);
    EXPECT_DOUBLE_EQ(breakdown.opening, 5.0);
    EXPECT_DOUBLE_EQ(breakdown.fixed, 1.0);
    EXPECT_DOUBLE_EQ(breakdown.routing, 10.0);
    EXPECT_DOUBLE_EQ(breakdown.total, 16.0);
    EXPECT_DOUBLE_EQ(solution.get_cost(), 16.0);
}

TEST(CostTest, RouteDistanceIncludesBothOriginLegs) {
    const auto instance = Instance(example_data());

    EXPECT_DOUBLE_EQ(route_distance(instance, 0, {}), 0.0);
    EXPECT_DOUBLE_EQ(route_distance(instance, 0, {2}), 2.0 * std::sqrt(2.0));
    EXPECT_NEAR(route_distance(instance, 0, {2, 3}), std::sqrt(2.0) + 2.0 * std::sqrt(5.0), 1e-12);
    // Same stops from the other facility.
    EXPECT_NEAR(route_distance(instance, 1, {2, 3}), std::sqrt(82.0) + std::sqrt(5.0) + std::sqrt(65.0), 1e-12);
}

TEST(CostTest, ExampleBreakdown) {
    const auto instance = Instance(example_data());
    const auto solution = make_three_routes(instance);

    const auto breakdown = evaluate_cost(instance, solution);
    EXPECT_DOUBLE_EQ(breakdown.opening, 180.0);
    EXPECT_DOUBLE_EQ(breakdown.fixed, 30.0);
    EXPECT_NEAR(breakdown.routing, 5.0 * std::sqrt(2.0) + 2.0 * std::sqrt(5.0), 1e-9);
    EXPECT_NEAR(breakdown.total, solution.get_cost(), 1e-9);
}

TEST(CostTest, PrimitivesMatchMutations) {
    const auto instance = Instance(example_data());
    const auto solution = make_three_routes(instance);

    {
        auto copy = solution;
        const auto predicted = removal_delta(solution, 1, 0);
        EXPECT_NEAR(predicted, -(10.0 + 2.0 * std::sqrt(2.0)), 1e-9);
        EXPECT_NEAR(copy.remove_stop(1, 0), predicted, 1e-9);
    }
    {
        // Customer 4 leaves its route first, facility 0 has room for it with the larger capacities.
        // 先移除顾客4，再插入到路径0末尾
        const auto roomy = Instance(roomy_data());
        auto copy = make_three_routes(roomy);
        copy.remove_stop(1, 0);
        ASSERT_FALSE(copy.is_vertex_in_solution(4));

        const auto predicted = insertion_delta(copy, 0, 2, 4);
        EXPECT_NEAR(predicted, std::sqrt(53.0) + std::sqrt(82.0) - std::sqrt(5.0), 1e-9);
        EXPECT_NEAR(copy.insert_stop(0, 2, 4), predicted, 1e-9);
        EXPECT_TRUE(copy.is_feasible());
        EXPECT_NEAR(copy.get_cost(), evaluate_cost(roomy, copy).total, 1e-9);
    }
    {
        auto copy = solution;
        const auto predicted = reversal_delta(solution, 0, 0, 1);
        EXPECT_NEAR(predicted, 0.0, 1e-12);
        EXPECT_NEAR(copy.reverse_path(0, 0, 1), predicted, 1e-9);
    }
    {
        auto copy = solution;
        const auto predicted = rebase_delta(solution, 2, 0);
        EXPECT_NEAR(copy.rebase_route(2, 0), predicted, 1e-9);
    }
    EXPECT_NEAR(new_route_delta(instance, 0, 5), 10.0 + 2.0 * std::sqrt(122.0), 1e-9);
    EXPECT_DOUBLE_EQ(opening_delta(instance, 1, true), 80.0);
    EXPECT_DOUBLE_EQ(opening_delta(instance, 1, false), -80.0);
}

TEST(CostTest, BoundaryMoves) {
    const auto instance = Instance(roomy_data());
    const auto solution = make_three_routes(instance);

    // Front of another route, emptying the source route.
    expect_consistent(solution, RelocateMove{5, 0, 0, Solution::dummy_vertex});
    // End of another route.
    expect_consistent(solution, RelocateMove{4, 0, 2, Solution::dummy_vertex});
    // Same route, to the last position and to the first one.
    expect_consistent(solution, RelocateMove{2, 0, 1, Solution::dummy_vertex});
    expect_consistent(solution, RelocateMove{3, 0, 0, Solution::dummy_vertex});
    // New routes, from the same facility and from another one.
    expect_consistent(solution, RelocateMove{2, Solution::dummy_route, 0, 0});
    expect_consistent(solution, RelocateMove{2, Solution::dummy_route, 0, 1});
    // The source route disappears and a new one is created.
    expect_consistent(solution, RelocateMove{4, Solution::dummy_route, 0, 0});
    expect_consistent(solution, SwapMove{2, 5});
    expect_consistent(solution, SwapMove{4, 5});
    // Whole route reversal.
    expect_consistent(solution, TwoOptMove{0, 0, 1});
    // Closings.
    expect_consistent(solution, ToggleMove{0, false, {0}, 1, Solution::dummy_route, -1, Solution::dummy_vertex});
    expect_consistent(solution, ToggleMove{1, false, {2, 1}, 0, Solution::dummy_route, -1, Solution::dummy_vertex});
}

TEST(CostTest, DeltaFollowsMoveAlternative) {
    const auto instance = Instance(roomy_data());
    const auto solution = make_three_routes(instance);

    EXPECT_NEAR(compute_delta(solution, RelocateMove{2, Solution::dummy_route, 0, 1}),
                removal_delta(solution, 0, 0) + new_route_delta(instance, 1, 2), 1e-9);
    EXPECT_NEAR(compute_delta(solution, RelocateMove{5, 0, 1, Solution::dummy_vertex}),
                removal_delta(solution, 2, 0) + insertion_delta(solution, 0, 1, 5), 1e-9);
    EXPECT_NEAR(compute_delta(solution, SwapMove{3, 4}), replacement_delta(solution, 0, 1, 4) + replacement_delta(solution, 1, 0, 3),
                1e-9);
    EXPECT_NEAR(compute_delta(solution, TwoOptMove{0, 0, 1}), reversal_delta(solution, 0, 0, 1), 1e-9);
    EXPECT_NEAR(compute_delta(solution, ToggleMove{0, false, {0}, 1, Solution::dummy_route, -1, Solution::dummy_vertex}),
                opening_delta(instance, 0, false) + rebase_delta(solution, 0, 1), 1e-9);
}

TEST(CostTest, SameRouteRelocateOnLongRoute) {
    const auto instance = Instance(roomy_data());
    auto solution = Solution(instance);
    solution.open_facility(0);
    const auto route = solution.build_route(0, 2);
    solution.insert_stop(route, 1, 3);
    solution.insert_stop(route, 2, 4);
    solution.insert_stop(route, 3, 5);

    for (auto vertex = 2; vertex <= 5; vertex++) {
        for (auto position = 0; position < 4; position++) {
            if (position == solution.get_position(vertex)) {
                continue;
            }
            expect_consistent(solution, RelocateMove{vertex, route, position, Solution::dummy_vertex});
        }
    }
    for (auto begin = 0; begin < 4; begin++) {
        for (auto end = begin + 1; end < 4; end++) {
            expect_consistent(solution, TwoOptMove{route, begin, end});
        }
    }
}

TEST(CostTest, RandomMovesOneEchelon) {
    for (auto seed = 1u; seed <= 3u; seed++) {
        const auto instance = Instance(random_one_echelon_data(seed, 5, 40));
        random_walk(instance, seed, 3000);
    }
}

TEST(CostTest, RandomMovesTwoEchelon) {
    for (auto seed = 1u; seed <= 3u; seed++) {
        const auto instance = Instance(random_two_echelon_data(seed, 2, 4, 40));
        random_walk(instance, seed, 3000);
    }
}
