#include "greedy.hpp"

#include <algorithm>

#ifdef VERBOSE
    #include <iostream>
#endif

namespace clrpsa {

    namespace {

        struct Client {
            int vertex;
            int demand;
        };

        // Builds the routes of `tier` serving `clients`.
        // 构建某一层级的设施开放、分配和路径
        void build_tier(const Instance &instance, Solution &solution, const Tier tier, std::vector<Client> clients) {

            // 按开放成本/可用容量比升序排列设施
            auto facilities = instance.get_facilities_of_tier(tier);
            std::stable_sort(facilities.begin(), facilities.end(), [&](int a, int b) {
                return instance.get_opening_cost(a) / instance.get_usable_capacity(a) <
                       instance.get_opening_cost(b) / instance.get_usable_capacity(b);
            });

            auto total_demand = 0;
            for (const auto &client : clients) {
                total_demand += client.demand;
            }

            auto residual = std::vector<int>(instance.get_facilities_num(), 0);
            auto opened = std::vector<int>();
            auto next = 0u;

            const auto open_next = [&]() {
                const auto facility = facilities[next++];
                solution.open_facility(facility);
                residual[facility] = instance.get_usable_capacity(facility);
                opened.push_back(facility);
            };

            // 步骤1：开放设施直到总容量覆盖总需求
            auto open_capacity = 0;
            while (next < facilities.size() && open_capacity < total_demand) {
                open_capacity += instance.get_usable_capacity(facilities[next]);
                open_next();
            }

            // 步骤2：按需求降序分配顾客（首次适应递减）
            std::stable_sort(clients.begin(), clients.end(), [](const Client &a, const Client &b) { return a.demand > b.demand; });

            auto assigned = std::vector<std::vector<int>>(instance.get_facilities_num());
            for (const auto &client : clients) {

                auto best = Solution::dummy_vertex;
                while (true) {
                    for (auto facility : opened) {
                        if (residual[facility] < client.demand) {
                            continue;
                        }
                        const auto cost = instance.get_cost(client.vertex, facility);
                        if (best == Solution::dummy_vertex || cost < instance.get_cost(client.vertex, best) ||
                            (cost == instance.get_cost(client.vertex, best) && facility < best)) {
                            best = facility;
                        }
                    }
                    if (best != Solution::dummy_vertex) {
                        break;
                    }
                    if (next == facilities.size()) {
                        throw ConstructionFailure("Cannot assign vertex " + std::to_string(client.vertex) + " with demand " +
                                                  std::to_string(client.demand) + ": no " + to_string(tier) +
                                                  " facility has enough residual capacity");
                    }
                    open_next();
                }

                residual[best] -= client.demand;
                assigned[best].push_back(client.vertex);
            }

            // 步骤3：关闭没有顾客的设施
            for (auto facility : opened) {
                if (assigned[facility].empty()) {
                    solution.close_facility(facility);
                }
            }

            // 步骤4：最近邻构建路径
            const auto vehicle_capacity = instance.get_vehicle_capacity(tier);
            std::sort(opened.begin(), opened.end());
            for (auto facility : opened) {

                auto remaining = assigned[facility];
                std::sort(remaining.begin(), remaining.end());

                auto current = facility;
                auto route = Solution::dummy_route;
                auto load = 0;

                while (!remaining.empty()) {

                    auto nearest = remaining.begin();
                    for (auto it = remaining.begin() + 1; it != remaining.end(); ++it) {
                        if (instance.get_cost(current, *it) < instance.get_cost(current, *nearest)) {
                            nearest = it;
                        }
                    }

                    const auto vertex = *nearest;
                    const auto demand = solution.get_stop_load(vertex);
                    remaining.erase(nearest);

                    if (route == Solution::dummy_route || load + demand > vehicle_capacity) {
                        route = solution.build_route(facility, vertex);
                        load = demand;
                    } else {
                        solution.insert_stop(route, solution.get_route_size(route), vertex);
                        load += demand;
                    }

                    current = vertex;
                }
            }
        }

    }  // namespace

    Solution construct_greedy(const Instance &instance) {

        auto solution = Solution(instance);

        auto customers = std::vector<Client>();
        for (auto i = instance.get_customers_begin(); i < instance.get_customers_end(); i++) {
            customers.push_back({i, instance.get_demand(i)});
        }
        build_tier(instance, solution, instance.get_customer_tier(), std::move(customers));

        if (instance.is_two_echelon()) {
            // 一级：已使用的中转设施作为顾客，需求为其吞吐量
            auto intermediates = std::vector<Client>();
            for (auto facility : solution.get_open_facilities(Tier::SECONDARY)) {
                intermediates.push_back({facility, solution.get_facility_load(facility)});
            }
            build_tier(instance, solution, Tier::PRIMARY, std::move(intermediates));
        }

#ifdef VERBOSE
        std::cout << "Greedy solution: obj = " << solution.get_cost() << ", open facilities = " << solution.get_open_facilities_num()
                  << ", routes = " << solution.get_routes_num() << "\n";
#endif

        assert(solution.is_feasible());

        return solution;
    }

}  // namespace clrpsa
