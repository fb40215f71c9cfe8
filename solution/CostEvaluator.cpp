#include "CostEvaluator.hpp"

namespace clrpsa {

    CostBreakdown evaluate_cost(const Instance &instance, const Solution &solution) {

        CostBreakdown breakdown;

        for (auto f = instance.get_facilities_begin(); f < instance.get_facilities_end(); f++) {
            if (solution.is_facility_open(f)) {
                breakdown.opening += instance.get_opening_cost(f);
            }
        }

        for (auto tier : {Tier::PRIMARY, Tier::SECONDARY}) {
            for (auto route : solution.get_routes(tier).get_elements()) {
                breakdown.fixed += instance.get_route_fixed_cost(tier);
                breakdown.routing +=
                    instance.get_unit_cost(tier) * route_distance(instance, solution.get_route_origin(route), solution.get_route_stops(route));
            }
        }

        breakdown.total = breakdown.opening + breakdown.fixed + breakdown.routing;
        return breakdown;
    }

    double route_distance(const Instance &instance, const int origin, const std::vector<int> &stops) {
        if (stops.empty()) {
            return 0.0;
        }
        auto distance = instance.get_cost(origin, stops.front());
        for (size_t n = 1; n < stops.size(); n++) {
            distance += instance.get_cost(stops[n - 1], stops[n]);
        }
        distance += instance.get_cost(stops.back(), origin);
        return distance;
    }

    double removal_delta(const Solution &solution, const int route, const int position) {
        const auto &instance = solution.get_instance();
        const auto tier = solution.get_route_tier(route);

        const auto vertex = solution.get_vertex_at(route, position);
        const auto prev = solution.get_vertex_at(route, position - 1);
        const auto next = solution.get_vertex_at(route, position + 1);

        auto delta = instance.get_unit_cost(tier) *
                     (instance.get_cost(prev, next) - instance.get_cost(prev, vertex) - instance.get_cost(vertex, next));
        if (solution.get_route_size(route) == 1) {
            delta -= instance.get_route_fixed_cost(tier);
        }
        return delta;
    }

    double insertion_delta(const Solution &solution, const int route, const int position, const int vertex) {
        const auto &instance = solution.get_instance();

        const auto prev = solution.get_vertex_at(route, position - 1);
        const auto next = solution.get_vertex_at(route, position);

        return instance.get_unit_cost(solution.get_route_tier(route)) *
               (instance.get_cost(prev, vertex) + instance.get_cost(vertex, next) - instance.get_cost(prev, next));
    }

    double new_route_delta(const Instance &instance, const int facility, const int vertex) {
        const auto tier = instance.get_facility_tier(facility);
        return instance.get_route_fixed_cost(tier) + instance.get_unit_cost(tier) * 2.0 * instance.get_cost(facility, vertex);
    }

    double replacement_delta(const Solution &solution, const int route, const int position, const int vertex) {
        const auto &instance = solution.get_instance();

        const auto current = solution.get_vertex_at(route, position);
        const auto prev = solution.get_vertex_at(route, position - 1);
        const auto next = solution.get_vertex_at(route, position + 1);

        return instance.get_unit_cost(solution.get_route_tier(route)) *
               (instance.get_cost(prev, vertex) + instance.get_cost(vertex, next) - instance.get_cost(prev, current) -
                instance.get_cost(current, next));
    }

    double reversal_delta(const Solution &solution, const int route, const int begin, const int end) {
        const auto &instance = solution.get_instance();

        const auto pre = solution.get_vertex_at(route, begin - 1);
        const auto stop = solution.get_vertex_at(route, end + 1);
        const auto vertex_begin = solution.get_vertex_at(route, begin);
        const auto vertex_end = solution.get_vertex_at(route, end);

        return instance.get_unit_cost(solution.get_route_tier(route)) *
               (instance.get_cost(pre, vertex_end) + instance.get_cost(vertex_begin, stop) - instance.get_cost(pre, vertex_begin) -
                instance.get_cost(vertex_end, stop));
    }

    double rebase_delta(const Solution &solution, const int route, const int facility) {
        const auto &instance = solution.get_instance();

        const auto origin = solution.get_route_origin(route);
        const auto &stops = solution.get_route_stops(route);
        const auto first = stops.front();
        const auto last = stops.back();

        return instance.get_unit_cost(solution.get_route_tier(route)) *
               (instance.get_cost(facility, first) + instance.get_cost(last, facility) - instance.get_cost(origin, first) -
                instance.get_cost(last, origin));
    }

    double opening_delta(const Instance &instance, const int facility, const bool open) {
        return open ? instance.get_opening_cost(facility) : -instance.get_opening_cost(facility);
    }

    namespace {

        double relocate_delta(const Solution &solution, const RelocateMove &move) {
            const auto &instance = solution.get_instance();

            const auto source = solution.get_route_index(move.vertex);
            const auto source_position = solution.get_position(move.vertex);

            if (move.route == Solution::dummy_route) {
                return removal_delta(solution, source, source_position) + new_route_delta(instance, move.facility, move.vertex);
            }

            if (move.route != source) {
                return removal_delta(solution, source, source_position) + insertion_delta(solution, move.route, move.position, move.vertex);
            }

            // Same route: the insertion position refers to the sequence without the vertex.
            // 同一路径：插入位置是删除该顶点后的序列中的下标
            const auto &stops = solution.get_route_stops(source);
            const auto origin = solution.get_route_origin(source);
            const auto size_after = static_cast<int>(stops.size()) - 1;
            const auto at = [&](int index) {
                if (index < 0 || index >= size_after) {
                    return origin;
                }
                return stops[index < source_position ? index : index + 1];
            };

            const auto vertex = move.vertex;
            const auto prev = solution.get_vertex_at(source, source_position - 1);
            const auto next = solution.get_vertex_at(source, source_position + 1);
            const auto a = at(move.position - 1);
            const auto b = at(move.position);

            return instance.get_unit_cost(solution.get_route_tier(source)) *
                   (instance.get_cost(prev, next) - instance.get_cost(prev, vertex) - instance.get_cost(vertex, next) +
                    instance.get_cost(a, vertex) + instance.get_cost(vertex, b) - instance.get_cost(a, b));
        }

        double swap_delta(const Solution &solution, const SwapMove &move) {
            const auto route1 = solution.get_route_index(move.first);
            const auto route2 = solution.get_route_index(move.second);
            return replacement_delta(solution, route1, solution.get_position(move.first), move.second) +
                   replacement_delta(solution, route2, solution.get_position(move.second), move.first);
        }

        double toggle_delta(const Solution &solution, const ToggleMove &move) {
            const auto &instance = solution.get_instance();

            auto delta = opening_delta(instance, move.facility, move.open);

            if (move.open) {
                if (move.primary_route != Solution::dummy_route) {
                    delta += insertion_delta(solution, move.primary_route, move.primary_position, move.facility);
                } else if (move.primary_facility != Solution::dummy_vertex) {
                    delta += new_route_delta(instance, move.primary_facility, move.facility);
                }
                for (auto route : move.routes) {
                    delta += rebase_delta(solution, route, move.facility);
                }
            } else {
                for (auto route : move.routes) {
                    delta += rebase_delta(solution, route, move.target);
                }
                if (move.primary_route != Solution::dummy_route) {
                    delta += removal_delta(solution, move.primary_route, move.primary_position);
                }
            }

            return delta;
        }

    }  // namespace

    double compute_delta(const Solution &solution, const Move &move) {
        if (const auto *relocate = std::get_if<RelocateMove>(&move)) {
            return relocate_delta(solution, *relocate);
        } else if (const auto *swap = std::get_if<SwapMove>(&move)) {
            return swap_delta(solution, *swap);
        } else if (const auto *two_opt = std::get_if<TwoOptMove>(&move)) {
            return reversal_delta(solution, two_opt->route, two_opt->begin, two_opt->end);
        }
        return toggle_delta(solution, std::get<ToggleMove>(move));
    }

}  // namespace clrpsa
