#include "LocalSearch.hpp"

#include "../solution/CostEvaluator.hpp"
#include "Neighborhood.hpp"

namespace clrpsa {

    bool LocalSearch::apply(Solution &solution) const {

        const auto initial_cost = solution.get_cost();

        auto improved = true;
        while (improved) {
            improved = swap_pass(solution);
            improved = relocate_pass(solution) || improved;
        }

        assert(solution.is_feasible());

        return solution.get_cost() < initial_cost - tolerance;
    }

    bool LocalSearch::swap_pass(Solution &solution) const {

        auto improved = false;

        for (auto i = instance.get_customers_begin(); i < instance.get_customers_end(); i++) {
            for (auto j = i + 1; j < instance.get_customers_end(); j++) {
                const auto move = Move(SwapMove{i, j});
                if (!is_feasible(solution, move)) {
                    continue;
                }
                if (compute_delta(solution, move) < -tolerance) {
                    apply_move(solution, move);
                    improved = true;
                }
            }
        }

        return improved;
    }

    bool LocalSearch::relocate_pass(Solution &solution) const {

        auto improved = false;

        for (auto i = instance.get_customers_begin(); i < instance.get_customers_end(); i++) {

            // Routes are copied since an applied move can remove one.
            // 复制路径列表：执行移动可能删除路径
            const auto routes = solution.get_routes(Tier::SECONDARY).get_elements();

            auto found = false;
            for (auto route : routes) {
                const auto same = route == solution.get_route_index(i);
                const auto last = same ? solution.get_route_size(route) - 1 : solution.get_route_size(route);
                for (auto position = 0; position <= last && !found; position++) {
                    if (same && position == solution.get_position(i)) {
                        continue;
                    }
                    const auto move = Move(RelocateMove{i, route, position, Solution::dummy_vertex});
                    if (is_feasible(solution, move) && compute_delta(solution, move) < -tolerance) {
                        apply_move(solution, move);
                        found = true;
                    }
                }
                if (found) {
                    break;
                }
            }

            if (!found) {
                for (auto facility : solution.get_open_facilities(Tier::SECONDARY)) {
                    const auto move = Move(RelocateMove{i, Solution::dummy_route, 0, facility});
                    if (is_feasible(solution, move) && compute_delta(solution, move) < -tolerance) {
                        apply_move(solution, move);
                        found = true;
                        break;
                    }
                }
            }

            improved = improved || found;
        }

        return improved;
    }

}  // namespace clrpsa
