#include "Neighborhood.hpp"

#include <algorithm>
#include <limits>

#include "../solution/CostEvaluator.hpp"

namespace clrpsa {

    std::string to_string(MoveKind kind) {
        switch (kind) {
        case MoveKind::RELOCATE_CUSTOMER:
            return "relocate";
        case MoveKind::SWAP_CUSTOMERS:
            return "swap";
        case MoveKind::TWO_OPT:
            return "2-opt";
        case MoveKind::TOGGLE_FACILITY:
            return "toggle";
        case MoveKind::RELOCATE_FACILITY:
            return "relocate-facility";
        }
        return "unknown";
    }

    MoveKind get_kind(const Instance &instance, const Move &move) {
        if (const auto *relocate = std::get_if<RelocateMove>(&move)) {
            return instance.is_customer(relocate->vertex) ? MoveKind::RELOCATE_CUSTOMER : MoveKind::RELOCATE_FACILITY;
        }
        if (std::holds_alternative<SwapMove>(move)) {
            return MoveKind::SWAP_CUSTOMERS;
        }
        if (std::holds_alternative<TwoOptMove>(move)) {
            return MoveKind::TWO_OPT;
        }
        return MoveKind::TOGGLE_FACILITY;
    }

    bool can_absorb_load(const Solution &solution, int facility, int source, const int load) {
        const auto &instance = solution.get_instance();

        while (facility != source) {

            if (solution.get_facility_load(facility) + load > instance.get_facility_capacity(facility)) {
                return false;
            }

            const auto route = solution.get_route_index(facility);
            if (route == Solution::dummy_route) {
                return true;
            }

            const auto source_route = source == Solution::dummy_vertex ? Solution::dummy_route : solution.get_route_index(source);
            if (route == source_route) {
                return true;
            }

            if (solution.get_route_load(route) + load > instance.get_vehicle_capacity(solution.get_route_tier(route))) {
                return false;
            }

            facility = solution.get_route_origin(route);
            source = source_route == Solution::dummy_route ? Solution::dummy_vertex : solution.get_route_origin(source_route);
        }

        return true;
    }

    namespace {

        // Load released on the primary route `primary_route` when `routes` leave their intermediate facilities.
        // 路径离开原中转设施后，一级路径primary_route减少的载重
        int released_on_primary_route(const Solution &solution, const std::vector<int> &routes, const int primary_route) {
            auto released = 0;
            for (auto route : routes) {
                if (solution.get_route_index(solution.get_route_origin(route)) == primary_route) {
                    released += solution.get_route_load(route);
                }
            }
            return released;
        }

        // Load released on the primary facility `primary_facility` when `routes` leave their intermediate facilities.
        int released_on_primary_facility(const Solution &solution, const std::vector<int> &routes, const int primary_facility) {
            auto released = 0;
            for (auto route : routes) {
                if (solution.get_supplier(solution.get_route_origin(route)) == primary_facility) {
                    released += solution.get_route_load(route);
                }
            }
            return released;
        }

        bool primary_route_fits(const Solution &solution, const std::vector<int> &routes, const int primary_route, const int load) {
            const auto &instance = solution.get_instance();
            const auto origin = solution.get_route_origin(primary_route);
            return solution.get_route_load(primary_route) - released_on_primary_route(solution, routes, primary_route) + load <=
                       instance.get_vehicle_capacity(Tier::PRIMARY) &&
                   solution.get_facility_load(origin) - released_on_primary_facility(solution, routes, origin) + load <=
                       instance.get_facility_capacity(origin);
        }

        bool primary_facility_fits(const Solution &solution, const std::vector<int> &routes, const int primary_facility, const int load) {
            const auto &instance = solution.get_instance();
            return solution.get_facility_load(primary_facility) - released_on_primary_facility(solution, routes, primary_facility) + load <=
                   instance.get_facility_capacity(primary_facility);
        }

        bool is_intermediate(const Instance &instance, const int facility) {
            return instance.is_two_echelon() && instance.get_facility_tier(facility) == Tier::SECONDARY;
        }

        // Tier of the routes which can visit `vertex`.
        Tier stop_tier(const Instance &instance, const int vertex) {
            return instance.is_customer(vertex) ? Tier::SECONDARY : Tier::PRIMARY;
        }

        bool is_relocate_feasible(const Solution &solution, const RelocateMove &move) {
            const auto &instance = solution.get_instance();

            if (!solution.is_vertex_in_solution(move.vertex)) {
                return false;
            }
            if (instance.is_facility(move.vertex) && !is_intermediate(instance, move.vertex)) {
                return false;
            }

            const auto tier = stop_tier(instance, move.vertex);
            const auto source = solution.get_route_index(move.vertex);
            const auto source_origin = solution.get_route_origin(source);
            const auto load = solution.get_stop_load(move.vertex);

            if (move.route == Solution::dummy_route) {
                if (!instance.is_facility(move.facility) || !solution.is_facility_open(move.facility) ||
                    instance.get_facility_tier(move.facility) != tier) {
                    return false;
                }
                if (move.facility == source_origin && solution.get_route_size(source) == 1) {
                    return false;
                }
                return can_absorb_load(solution, move.facility, source_origin, load);
            }

            if (!solution.is_route_in_use(move.route) || solution.get_route_tier(move.route) != tier) {
                return false;
            }

            if (move.route == source) {
                return solution.get_route_size(source) >= 2 && move.position >= 0 && move.position < solution.get_route_size(source);
            }

            if (move.position < 0 || move.position > solution.get_route_size(move.route)) {
                return false;
            }
            if (solution.get_route_load(move.route) + load > instance.get_vehicle_capacity(tier)) {
                return false;
            }
            return can_absorb_load(solution, solution.get_route_origin(move.route), source_origin, load);
        }

        bool is_swap_feasible(const Solution &solution, const SwapMove &move) {
            const auto &instance = solution.get_instance();

            if (!instance.is_customer(move.first) || !instance.is_customer(move.second)) {
                return false;
            }
            if (!solution.is_vertex_in_solution(move.first) || !solution.is_vertex_in_solution(move.second)) {
                return false;
            }

            const auto route1 = solution.get_route_index(move.first);
            const auto route2 = solution.get_route_index(move.second);
            if (route1 == route2) {
                return false;
            }

            const auto variation = instance.get_demand(move.second) - instance.get_demand(move.first);
            const auto capacity = instance.get_vehicle_capacity(Tier::SECONDARY);
            if (solution.get_route_load(route1) + variation > capacity || solution.get_route_load(route2) - variation > capacity) {
                return false;
            }

            const auto origin1 = solution.get_route_origin(route1);
            const auto origin2 = solution.get_route_origin(route2);
            if (variation > 0) {
                return can_absorb_load(solution, origin1, origin2, variation);
            }
            if (variation < 0) {
                return can_absorb_load(solution, origin2, origin1, -variation);
            }
            return true;
        }

        bool is_two_opt_feasible(const Solution &solution, const TwoOptMove &move) {
            return solution.is_route_in_use(move.route) && move.begin >= 0 && move.begin < move.end &&
                   move.end < solution.get_route_size(move.route);
        }

        bool is_toggle_feasible(const Solution &solution, const ToggleMove &move) {
            const auto &instance = solution.get_instance();
            const auto facility = move.facility;

            if (!instance.is_facility(facility) || solution.is_facility_open(facility) == move.open) {
                return false;
            }

            const auto tier = instance.get_facility_tier(facility);

            if (!move.open) {

                const auto &routes = solution.get_facility_routes(facility);
                if (routes.size() != move.routes.size() ||
                    !std::all_of(move.routes.begin(), move.routes.end(),
                                 [&](int route) { return std::find(routes.begin(), routes.end(), route) != routes.end(); })) {
                    return false;
                }

                if (is_intermediate(instance, facility)) {
                    if (move.primary_route != solution.get_route_index(facility) ||
                        move.primary_position != solution.get_position(facility)) {
                        return false;
                    }
                } else if (move.primary_route != Solution::dummy_route) {
                    return false;
                }

                if (move.routes.empty()) {
                    return true;
                }

                if (move.target == facility || !instance.is_facility(move.target) || !solution.is_facility_open(move.target) ||
                    instance.get_facility_tier(move.target) != tier) {
                    return false;
                }

                return can_absorb_load(solution, move.target, facility, solution.get_facility_load(facility));
            }

            if (move.routes.empty()) {
                return false;
            }

            auto load = 0;
            for (auto n = 0u; n < move.routes.size(); n++) {
                const auto route = move.routes[n];
                if (!solution.is_route_in_use(route) || solution.get_route_tier(route) != tier) {
                    return false;
                }
                if (std::find(move.routes.begin(), move.routes.begin() + n, route) != move.routes.begin() + n) {
                    return false;
                }
                load += solution.get_route_load(route);
            }

            if (load > instance.get_usable_capacity(facility)) {
                return false;
            }

            if (!is_intermediate(instance, facility)) {
                return move.primary_route == Solution::dummy_route && move.primary_facility == Solution::dummy_vertex;
            }

            if (move.primary_route != Solution::dummy_route) {
                if (!solution.is_route_in_use(move.primary_route) || solution.get_route_tier(move.primary_route) != Tier::PRIMARY) {
                    return false;
                }
                if (move.primary_position < 0 || move.primary_position > solution.get_route_size(move.primary_route)) {
                    return false;
                }
                return primary_route_fits(solution, move.routes, move.primary_route, load);
            }

            if (!instance.is_facility(move.primary_facility) || !solution.is_facility_open(move.primary_facility) ||
                instance.get_facility_tier(move.primary_facility) != Tier::PRIMARY) {
                return false;
            }
            return primary_facility_fits(solution, move.routes, move.primary_facility, load);
        }

    }  // namespace

    bool is_feasible(const Solution &solution, const Move &move) {
        if (const auto *relocate = std::get_if<RelocateMove>(&move)) {
            return is_relocate_feasible(solution, *relocate);
        }
        if (const auto *swap = std::get_if<SwapMove>(&move)) {
            return is_swap_feasible(solution, *swap);
        }
        if (const auto *two_opt = std::get_if<TwoOptMove>(&move)) {
            return is_two_opt_feasible(solution, *two_opt);
        }
        return is_toggle_feasible(solution, std::get<ToggleMove>(move));
    }

    double apply_move(Solution &solution, const Move &move) {

        const auto cost_before = solution.get_cost();

        if (const auto *relocate = std::get_if<RelocateMove>(&move)) {

            const auto source = solution.get_route_index(relocate->vertex);
            solution.remove_stop(source, solution.get_position(relocate->vertex));
            if (relocate->route == Solution::dummy_route) {
                solution.build_route(relocate->facility, relocate->vertex);
            } else {
                solution.insert_stop(relocate->route, relocate->position, relocate->vertex);
            }

        } else if (const auto *swap = std::get_if<SwapMove>(&move)) {

            solution.exchange_stops(solution.get_route_index(swap->first), solution.get_position(swap->first),
                                    solution.get_route_index(swap->second), solution.get_position(swap->second));

        } else if (const auto *two_opt = std::get_if<TwoOptMove>(&move)) {

            solution.reverse_path(two_opt->route, two_opt->begin, two_opt->end);

        } else {

            const auto &toggle = std::get<ToggleMove>(move);
            if (toggle.open) {
                solution.open_facility(toggle.facility);
                if (toggle.primary_route != Solution::dummy_route) {
                    solution.insert_stop(toggle.primary_route, toggle.primary_position, toggle.facility);
                } else if (toggle.primary_facility != Solution::dummy_vertex) {
                    solution.build_route(toggle.primary_facility, toggle.facility);
                }
                for (auto route : toggle.routes) {
                    solution.rebase_route(route, toggle.facility);
                }
            } else {
                // 先转移路径，中转设施吞吐量归零后再离开一级路径
                for (auto route : toggle.routes) {
                    solution.rebase_route(route, toggle.target);
                }
                if (toggle.primary_route != Solution::dummy_route) {
                    solution.remove_stop(toggle.primary_route, toggle.primary_position);
                }
                solution.close_facility(toggle.facility);
            }
        }

        return solution.get_cost() - cost_before;
    }

    std::optional<Move> Neighborhood::propose(const MoveKind kind, const Solution &solution) {

        switch (kind) {

        case MoveKind::RELOCATE_CUSTOMER:
            return propose_relocate(solution, draw(instance.get_customers_begin(), instance.get_customers_end() - 1), Tier::SECONDARY);

        case MoveKind::SWAP_CUSTOMERS:
            return propose_swap(solution);

        case MoveKind::TWO_OPT:
            return propose_two_opt(solution);

        case MoveKind::TOGGLE_FACILITY: {
            auto plan = plan_toggle(solution, draw(instance.get_facilities_begin(), instance.get_facilities_end() - 1));
            if (!plan) {
                return std::nullopt;
            }
            return Move(std::move(*plan));
        }

        case MoveKind::RELOCATE_FACILITY: {
            if (!instance.is_two_echelon()) {
                return std::nullopt;
            }
            const auto open = solution.get_open_facilities(Tier::SECONDARY);
            if (open.empty()) {
                return std::nullopt;
            }
            return propose_relocate(solution, open[draw(0, static_cast<int>(open.size()) - 1)], Tier::PRIMARY);
        }
        }

        return std::nullopt;
    }

    std::optional<Move> Neighborhood::propose_relocate(const Solution &solution, const int vertex, const Tier tier) {

        const auto source = solution.get_route_index(vertex);
        if (source == Solution::dummy_route) {
            return std::nullopt;
        }

        const auto &routes = solution.get_routes(tier);
        const auto routes_num = static_cast<int>(routes.size());

        // The last draw stands for a new route.
        // 最后一个取值表示新建路径
        const auto choice = draw(0, routes_num);

        if (choice == routes_num) {
            const auto open = solution.get_open_facilities(tier);
            if (open.empty()) {
                return std::nullopt;
            }
            const auto facility = open[draw(0, static_cast<int>(open.size()) - 1)];
            if (facility == solution.get_route_origin(source) && solution.get_route_size(source) == 1) {
                return std::nullopt;
            }
            return Move(RelocateMove{vertex, Solution::dummy_route, 0, facility});
        }

        const auto route = routes.at(choice);
        if (route == source) {
            const auto size = solution.get_route_size(route);
            if (size < 2) {
                return std::nullopt;
            }
            const auto position = draw(0, size - 1);
            if (position == solution.get_position(vertex)) {
                return std::nullopt;
            }
            return Move(RelocateMove{vertex, route, position, Solution::dummy_vertex});
        }

        return Move(RelocateMove{vertex, route, draw(0, solution.get_route_size(route)), Solution::dummy_vertex});
    }

    std::optional<Move> Neighborhood::propose_swap(const Solution &solution) {

        if (instance.get_customers_num() < 2) {
            return std::nullopt;
        }

        const auto first = draw(instance.get_customers_begin(), instance.get_customers_end() - 1);
        const auto second = draw(instance.get_customers_begin(), instance.get_customers_end() - 1);

        if (first == second || solution.get_route_index(first) == solution.get_route_index(second)) {
            return std::nullopt;
        }

        return Move(SwapMove{first, second});
    }

    std::optional<Move> Neighborhood::propose_two_opt(const Solution &solution) {

        const auto &primary = solution.get_routes(Tier::PRIMARY);
        const auto &secondary = solution.get_routes(Tier::SECONDARY);
        const auto routes_num = static_cast<int>(primary.size() + secondary.size());
        if (routes_num == 0) {
            return std::nullopt;
        }

        const auto choice = draw(0, routes_num - 1);
        const auto route =
            choice < static_cast<int>(primary.size()) ? primary.at(choice) : secondary.at(choice - static_cast<int>(primary.size()));

        const auto size = solution.get_route_size(route);
        if (size < 2) {
            return std::nullopt;
        }

        auto begin = draw(0, size - 1);
        auto end = draw(0, size - 1);
        if (begin == end) {
            return std::nullopt;
        }
        if (begin > end) {
            std::swap(begin, end);
        }

        return Move(TwoOptMove{route, begin, end});
    }

    std::optional<ToggleMove> Neighborhood::plan_toggle(const Solution &solution, const int facility) const {
        if (solution.is_facility_open(facility)) {
            return plan_closing(solution, facility);
        }
        return plan_opening(solution, facility);
    }

    std::optional<ToggleMove> Neighborhood::plan_closing(const Solution &solution, const int facility) const {

        auto move = ToggleMove{facility, false, solution.get_facility_routes(facility), Solution::dummy_vertex, Solution::dummy_route, -1,
                               Solution::dummy_vertex};
        std::sort(move.routes.begin(), move.routes.end());

        if (is_intermediate(instance, facility)) {
            move.primary_route = solution.get_route_index(facility);
            move.primary_position = solution.get_position(facility);
        }

        if (move.routes.empty()) {
            return move;
        }

        // Nearest open facility of the same tier able to take the whole throughput.
        // 选择距离最近且能承接全部吞吐量的同层级开放设施
        const auto load = solution.get_facility_load(facility);
        auto candidates = solution.get_open_facilities(instance.get_facility_tier(facility));
        std::stable_sort(candidates.begin(), candidates.end(),
                         [&](int a, int b) { return instance.get_cost(facility, a) < instance.get_cost(facility, b); });

        for (auto candidate : candidates) {
            if (candidate != facility && can_absorb_load(solution, candidate, facility, load)) {
                move.target = candidate;
                return move;
            }
        }

        return std::nullopt;
    }

    std::optional<ToggleMove> Neighborhood::plan_opening(const Solution &solution, const int facility) const {

        auto move = ToggleMove{facility, true, {}, Solution::dummy_vertex, Solution::dummy_route, -1, Solution::dummy_vertex};

        // Routes whose round trip gets shorter from the new facility, best gain first.
        // 从新设施出发往返距离更短的路径，按收益降序
        auto gains = std::vector<std::pair<double, int>>();
        for (auto route : solution.get_routes(instance.get_facility_tier(facility)).get_elements()) {
            const auto delta = rebase_delta(solution, route, facility);
            if (delta < 0.0) {
                gains.emplace_back(delta, route);
            }
        }
        std::sort(gains.begin(), gains.end());

        const auto capacity = instance.get_usable_capacity(facility);
        auto load = 0;
        for (const auto &entry : gains) {
            const auto route_load = solution.get_route_load(entry.second);
            if (load + route_load <= capacity) {
                load += route_load;
                move.routes.push_back(entry.second);
            }
        }

        if (move.routes.empty()) {
            return std::nullopt;
        }

        if (!is_intermediate(instance, facility)) {
            return move;
        }

        // Cheapest feasible way to supply the intermediate facility.
        // 为中转设施寻找成本最低的可行一级路径插入位置，或新建一级路径
        auto best_delta = std::numeric_limits<double>::max();

        for (auto primary_route : solution.get_routes(Tier::PRIMARY).get_elements()) {
            if (!primary_route_fits(solution, move.routes, primary_route, load)) {
                continue;
            }
            for (auto position = 0; position <= solution.get_route_size(primary_route); position++) {
                const auto delta = insertion_delta(solution, primary_route, position, facility);
                if (delta < best_delta) {
                    best_delta = delta;
                    move.primary_route = primary_route;
                    move.primary_position = position;
                }
            }
        }

        for (auto primary_facility : solution.get_open_facilities(Tier::PRIMARY)) {
            if (!primary_facility_fits(solution, move.routes, primary_facility, load)) {
                continue;
            }
            const auto delta = new_route_delta(instance, primary_facility, facility);
            if (delta < best_delta) {
                best_delta = delta;
                move.primary_route = Solution::dummy_route;
                move.primary_position = -1;
                move.primary_facility = primary_facility;
            }
        }

        if (best_delta == std::numeric_limits<double>::max()) {
            return std::nullopt;
        }

        return move;
    }

}  // namespace clrpsa
