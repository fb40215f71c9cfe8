// Solution类的实现
// 包含修改操作、可行性检查和输出
#include "Solution.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>

#include "CostEvaluator.hpp"

namespace clrpsa {

    Solution::Solution(const Instance &instance_)
        : instance(instance_)
        , routes_in_use({SparseIntSet(instance_.get_vertices_num()), SparseIntSet(instance_.get_vertices_num())})
        , route_ptr(instance_.get_vertices_num(), dummy_route)
        , position(instance_.get_vertices_num(), -1)
        , open(instance_.get_facilities_num(), 0)
        , facility_load(instance_.get_facilities_num(), 0)
        , facility_routes(instance_.get_facilities_num()) { }

    Solution &Solution::operator=(const Solution &source) {
        if (this == &source) {
            return *this;
        }
        assert(&instance == &source.instance);
        opening_cost = source.opening_cost;
        fixed_cost = source.fixed_cost;
        routing_cost = source.routing_cost;
        routes_list = source.routes_list;
        free_routes = source.free_routes;
        routes_in_use = source.routes_in_use;
        route_ptr = source.route_ptr;
        position = source.position;
        open = source.open;
        open_facilities_num = source.open_facilities_num;
        facility_load = source.facility_load;
        facility_routes = source.facility_routes;
        return *this;
    }

    bool Solution::operator==(const Solution &other) const {
        if (std::fabs(get_cost() - other.get_cost()) >= 1e-6) {
            return false;
        }
        if (open != other.open) {
            return false;
        }
        for (auto vertex = 0; vertex < instance.get_vertices_num(); vertex++) {
            const auto route = route_ptr[vertex];
            const auto other_route = other.route_ptr[vertex];
            if ((route == dummy_route) != (other_route == dummy_route)) {
                return false;
            }
            if (route == dummy_route) {
                continue;
            }
            const auto pos = position[vertex];
            const auto other_pos = other.position[vertex];
            if (get_route_origin(route) != other.get_route_origin(other_route) ||
                get_vertex_at(route, pos - 1) != other.get_vertex_at(other_route, other_pos - 1) ||
                get_vertex_at(route, pos + 1) != other.get_vertex_at(other_route, other_pos + 1)) {
                return false;
            }
        }
        return true;
    }

    void Solution::reset() {

        opening_cost = 0.0;
        fixed_cost = 0.0;
        routing_cost = 0.0;

        routes_list.clear();
        free_routes.clear();
        routes_in_use[0].clear();
        routes_in_use[1].clear();

        std::fill(route_ptr.begin(), route_ptr.end(), dummy_route);
        std::fill(position.begin(), position.end(), -1);

        std::fill(open.begin(), open.end(), 0);
        open_facilities_num = 0;
        std::fill(facility_load.begin(), facility_load.end(), 0);
        for (auto &routes : facility_routes) {
            routes.clear();
        }
    }

    std::vector<int> Solution::get_open_facilities(Tier tier) const {
        auto facilities = std::vector<int>();
        for (auto facility : instance.get_facilities_of_tier(tier)) {
            if (open[facility]) {
                facilities.push_back(facility);
            }
        }
        return facilities;
    }

    double Solution::open_facility(const int facility) {
        assert(instance.is_facility(facility));
        assert(!is_facility_open(facility));
        open[facility] = 1;
        open_facilities_num++;
        opening_cost += instance.get_opening_cost(facility);
        return instance.get_opening_cost(facility);
    }

    double Solution::close_facility(const int facility) {
        assert(is_facility_open(facility));
        assert(facility_routes[facility].empty());
        assert(route_ptr[facility] == dummy_route);
        open[facility] = 0;
        open_facilities_num--;
        opening_cost -= instance.get_opening_cost(facility);
        return -instance.get_opening_cost(facility);
    }

    int Solution::request_route(Tier tier, int facility) {
        int route;
        if (!free_routes.empty()) {
            route = free_routes.back();
            free_routes.pop_back();
        } else {
            route = static_cast<int>(routes_list.size());
            routes_list.emplace_back();
        }
        auto &node = routes_list[route];
        node.tier = tier;
        node.origin = facility;
        node.stops.clear();
        node.load = 0;
        node.distance = 0.0;
        routes_in_use[static_cast<int>(tier)].insert(route);
        facility_routes[facility].push_back(route);
        fixed_cost += instance.get_route_fixed_cost(tier);
        return route;
    }

    void Solution::release_route(int route) {
        auto &node = routes_list[route];
        assert(node.stops.empty());
        assert(node.load == 0);

        auto &routes = facility_routes[node.origin];
        const auto it = std::find(routes.begin(), routes.end(), route);
        assert(it != routes.end());
        *it = routes.back();
        routes.pop_back();

        routes_in_use[static_cast<int>(node.tier)].erase(route);
        fixed_cost -= instance.get_route_fixed_cost(node.tier);

        // The round trip of an empty route is zero, drop any residual rounding error.
        routing_cost -= instance.get_unit_cost(node.tier) * node.distance;
        node.distance = 0.0;
        node.origin = dummy_vertex;

        free_routes.push_back(route);
    }

    void Solution::add_facility_load(int facility, int delta) {
        facility_load[facility] += delta;
        const auto route = route_ptr[facility];
        if (route != dummy_route) {
            // 中转设施在一级路径中：更新一级路径载重及其起点吞吐量
            routes_list[route].load += delta;
            facility_load[routes_list[route].origin] += delta;
        }
    }

    void Solution::refresh_positions(int route, int from, int to) {
        const auto &stops = routes_list[route].stops;
        to = std::min(to, static_cast<int>(stops.size()));
        for (auto n = std::max(from, 0); n < to; n++) {
            position[stops[n]] = n;
        }
    }

    double Solution::add_route_distance(int route, double delta) {
        auto &node = routes_list[route];
        node.distance += delta;
        const auto weighted = instance.get_unit_cost(node.tier) * delta;
        routing_cost += weighted;
        return weighted;
    }

    int Solution::build_route(const int facility, const int vertex) {

        assert(is_facility_open(facility));
        assert(!is_vertex_in_solution(vertex));

        const auto tier = instance.get_facility_tier(facility);
        assert(tier == Tier::SECONDARY ? instance.is_customer(vertex) : instance.is_facility(vertex));

        const auto route = request_route(tier, facility);
        auto &node = routes_list[route];

        const auto load = get_stop_load(vertex);
        node.stops.push_back(vertex);
        node.load = load;
        route_ptr[vertex] = route;
        position[vertex] = 0;

        add_facility_load(facility, load);
        add_route_distance(route, 2.0 * instance.get_cost(facility, vertex));

        return route;
    }

    double Solution::insert_stop(const int route, const int where, const int vertex) {

        assert(is_route_in_use(route));
        assert(!is_vertex_in_solution(vertex));
        assert(where >= 0 && where <= get_route_size(route));

        auto &node = routes_list[route];

        const auto prev = get_vertex_at(route, where - 1);
        const auto next = get_vertex_at(route, where);

        const auto load = get_stop_load(vertex);
        node.stops.insert(node.stops.begin() + where, vertex);
        node.load += load;
        route_ptr[vertex] = route;
        refresh_positions(route, where, get_route_size(route));

        add_facility_load(node.origin, load);

        // 新增两条边，删除一条边
        return add_route_distance(route, instance.get_cost(prev, vertex) + instance.get_cost(vertex, next) - instance.get_cost(prev, next));
    }

    double Solution::remove_stop(const int route, const int where) {

        assert(is_route_in_use(route));
        assert(where >= 0 && where < get_route_size(route));

        auto &node = routes_list[route];

        const auto vertex = node.stops[where];
        const auto prev = get_vertex_at(route, where - 1);
        const auto next = get_vertex_at(route, where + 1);

        const auto load = get_stop_load(vertex);
        node.load -= load;
        add_facility_load(node.origin, -load);

        node.stops.erase(node.stops.begin() + where);
        route_ptr[vertex] = dummy_route;
        position[vertex] = -1;
        refresh_positions(route, where, get_route_size(route));

        auto delta = add_route_distance(route, instance.get_cost(prev, next) - instance.get_cost(prev, vertex) - instance.get_cost(vertex, next));

        if (node.stops.empty()) {
            const auto residual = instance.get_unit_cost(node.tier) * node.distance;
            release_route(route);
            delta -= residual + instance.get_route_fixed_cost(node.tier);
        }

        return delta;
    }

    double Solution::exchange_stops(const int route1, const int position1, const int route2, const int position2) {

        assert(route1 != route2);
        assert(is_route_in_use(route1) && is_route_in_use(route2));
        assert(get_route_tier(route1) == get_route_tier(route2));

        auto &node1 = routes_list[route1];
        auto &node2 = routes_list[route2];

        const auto vertex1 = node1.stops[position1];
        const auto vertex2 = node2.stops[position2];

        const auto prev1 = get_vertex_at(route1, position1 - 1);
        const auto next1 = get_vertex_at(route1, position1 + 1);
        const auto prev2 = get_vertex_at(route2, position2 - 1);
        const auto next2 = get_vertex_at(route2, position2 + 1);

        const auto load1 = get_stop_load(vertex1);
        const auto load2 = get_stop_load(vertex2);

        node1.stops[position1] = vertex2;
        node2.stops[position2] = vertex1;
        route_ptr[vertex1] = route2;
        route_ptr[vertex2] = route1;
        position[vertex1] = position2;
        position[vertex2] = position1;

        node1.load += load2 - load1;
        node2.load += load1 - load2;
        if (node1.origin != node2.origin) {
            add_facility_load(node1.origin, load2 - load1);
            add_facility_load(node2.origin, load1 - load2);
        }

        auto delta = add_route_distance(route1, instance.get_cost(prev1, vertex2) + instance.get_cost(vertex2, next1) -
                                                    instance.get_cost(prev1, vertex1) - instance.get_cost(vertex1, next1));
        delta += add_route_distance(route2, instance.get_cost(prev2, vertex1) + instance.get_cost(vertex1, next2) -
                                                instance.get_cost(prev2, vertex2) - instance.get_cost(vertex2, next2));
        return delta;
    }

    double Solution::reverse_path(const int route, const int begin, const int end) {

        assert(is_route_in_use(route));
        assert(begin >= 0 && begin < end && end < get_route_size(route));

        auto &node = routes_list[route];

        const auto pre = get_vertex_at(route, begin - 1);
        const auto stop = get_vertex_at(route, end + 1);
        const auto vertex_begin = node.stops[begin];
        const auto vertex_end = node.stops[end];

        std::reverse(node.stops.begin() + begin, node.stops.begin() + end + 1);
        refresh_positions(route, begin, end + 1);

        return add_route_distance(route, instance.get_cost(pre, vertex_end) + instance.get_cost(vertex_begin, stop) -
                                             instance.get_cost(pre, vertex_begin) - instance.get_cost(vertex_end, stop));
    }

    double Solution::rebase_route(const int route, const int facility) {

        assert(is_route_in_use(route));
        assert(is_facility_open(facility));
        assert(instance.get_facility_tier(facility) == get_route_tier(route));

        auto &node = routes_list[route];
        const auto origin = node.origin;
        if (origin == facility) {
            return 0.0;
        }

        const auto first = node.stops.front();
        const auto last = node.stops.back();

        auto &routes = facility_routes[origin];
        const auto it = std::find(routes.begin(), routes.end(), route);
        assert(it != routes.end());
        *it = routes.back();
        routes.pop_back();
        facility_routes[facility].push_back(route);

        add_facility_load(origin, -node.load);
        add_facility_load(facility, node.load);
        node.origin = facility;

        return add_route_distance(route, instance.get_cost(facility, first) + instance.get_cost(last, facility) -
                                             instance.get_cost(origin, first) - instance.get_cost(last, origin));
    }

    // 检查解的可行性
    // 检查项：
    // - 每个顾客恰好被一条二级路径访问
    // - 路径载重不超过车辆容量，设施吞吐量不超过设施容量
    // - 路径起点是同层级的开放设施
    // - 两级实例中每个开放的中转设施恰好被一条一级路径访问
    // - 缓存的载重、位置和成本与重新计算的结果一致
    bool Solution::is_feasible(const bool verbose) const {

        std::vector<std::pair<std::string, int>> errors;
        std::vector<std::pair<std::string, int>> warnings;

        auto visits = std::vector<int>(instance.get_vertices_num(), 0);
        auto computed_facility_load = std::vector<int>(instance.get_facilities_num(), 0);

        for (auto tier : {Tier::PRIMARY, Tier::SECONDARY}) {
            for (auto route : get_routes(tier).get_elements()) {

                const auto &node = routes_list[route];
                const auto origin = node.origin;

                if (node.tier != tier) {
                    errors.emplace_back("Route " + std::to_string(route) + " is listed with the wrong tier", __LINE__);
                }

                if (node.stops.empty()) {
                    errors.emplace_back("Route " + std::to_string(route) + " is in solution but empty", __LINE__);
                    continue;
                }

                if (!instance.is_facility(origin)) {
                    errors.emplace_back("Route " + std::to_string(route) + " has invalid origin " + std::to_string(origin), __LINE__);
                    continue;
                }

                if (!is_facility_open(origin)) {
                    errors.emplace_back("Route " + std::to_string(route) + " leaves the closed facility " + std::to_string(origin), __LINE__);
                }

                if (instance.get_facility_tier(origin) != tier) {
                    errors.emplace_back("Route " + std::to_string(route) + " of tier " + clrpsa::to_string(tier) + " leaves facility " +
                                            std::to_string(origin) + " of tier " + clrpsa::to_string(instance.get_facility_tier(origin)),
                                        __LINE__);
                }

                const auto &routes = facility_routes[origin];
                if (std::find(routes.begin(), routes.end(), route) == routes.end()) {
                    errors.emplace_back("Route " + std::to_string(route) + " is not listed among the routes of facility " +
                                            std::to_string(origin),
                                        __LINE__);
                }

                auto route_load = 0;
                for (auto n = 0; n < static_cast<int>(node.stops.size()); n++) {
                    const auto vertex = node.stops[n];

                    const auto expected_customer = tier == Tier::SECONDARY;
                    if (expected_customer ? !instance.is_customer(vertex)
                                          : !(instance.is_facility(vertex) && instance.get_facility_tier(vertex) == Tier::SECONDARY)) {
                        errors.emplace_back("Vertex " + std::to_string(vertex) + " cannot be a stop of the " + clrpsa::to_string(tier) +
                                                " route " + std::to_string(route),
                                            __LINE__);
                        continue;
                    }

                    if (!expected_customer && !is_facility_open(vertex)) {
                        errors.emplace_back("Closed facility " + std::to_string(vertex) + " is visited by route " + std::to_string(route),
                                            __LINE__);
                    }

                    visits[vertex]++;

                    if (route_ptr[vertex] != route) {
                        errors.emplace_back("Vertex " + std::to_string(vertex) + " in route " + std::to_string(route) +
                                                " has a route pointer " + std::to_string(route_ptr[vertex]),
                                            __LINE__);
                    }
                    if (position[vertex] != n) {
                        errors.emplace_back("Vertex " + std::to_string(vertex) + " in route " + std::to_string(route) +
                                                " is at position " + std::to_string(n) + " but the stored one is " +
                                                std::to_string(position[vertex]),
                                            __LINE__);
                    }

                    route_load += get_stop_load(vertex);
                }

                // 检查载重是否正确
                if (route_load != node.load) {
                    errors.emplace_back("Route " + std::to_string(route) + " has a computed load of " + std::to_string(route_load) +
                                            " but the stored one is " + std::to_string(node.load),
                                        __LINE__);
                }

                // 检查载重约束
                if (route_load > instance.get_vehicle_capacity(tier)) {
                    errors.emplace_back("Route " + std::to_string(route) + " has a load of " + std::to_string(route_load) +
                                            " but the vehicle capacity is " + std::to_string(instance.get_vehicle_capacity(tier)),
                                        __LINE__);
                }

                // Round trip, including the legs from and to the origin.
                // 往返距离，包含起点到第一个站点以及最后一个站点返回起点的边
                const auto distance = route_distance(instance, origin, node.stops);
                if (std::fabs(distance - node.distance) > 1e-6 * std::max(1.0, distance)) {
                    errors.emplace_back("Route " + std::to_string(route) + " has a computed distance of " + std::to_string(distance) +
                                            " but the stored one is " + std::to_string(node.distance),
                                        __LINE__);
                }

                computed_facility_load[origin] += route_load;
            }
        }

        // 检查每个顾客恰好被访问一次
        for (auto i = instance.get_customers_begin(); i < instance.get_customers_end(); i++) {
            if (visits[i] != 1) {
                errors.emplace_back("Customer " + std::to_string(i) + " is visited " + std::to_string(visits[i]) + " times", __LINE__);
            }
        }

        for (auto f = instance.get_facilities_begin(); f < instance.get_facilities_end(); f++) {

            // 两级实例：每个开放的中转设施恰好被一条一级路径访问
            if (instance.is_two_echelon() && instance.get_facility_tier(f) == Tier::SECONDARY) {
                if (is_facility_open(f) && visits[f] != 1) {
                    errors.emplace_back("Open intermediate facility " + std::to_string(f) + " is visited by " + std::to_string(visits[f]) +
                                            " primary routes",
                                        __LINE__);
                }
            } else if (route_ptr[f] != dummy_route) {
                errors.emplace_back("Facility " + std::to_string(f) + " has a route pointer but cannot be a stop", __LINE__);
            }

            if (computed_facility_load[f] != facility_load[f]) {
                errors.emplace_back("Facility " + std::to_string(f) + " has a computed load of " + std::to_string(computed_facility_load[f]) +
                                        " but the stored one is " + std::to_string(facility_load[f]),
                                    __LINE__);
            }

            if (computed_facility_load[f] > instance.get_facility_capacity(f)) {
                errors.emplace_back("Facility " + std::to_string(f) + " has a load of " + std::to_string(computed_facility_load[f]) +
                                        " but its capacity is " + std::to_string(instance.get_facility_capacity(f)),
                                    __LINE__);
            }

            if (is_facility_open(f) && facility_routes[f].empty()) {
                warnings.emplace_back("Facility " + std::to_string(f) + " is open but has no routes", __LINE__);
            }
        }

        // 检查解的成本是否正确
        const auto breakdown = evaluate_cost(instance, *this);
        if (std::fabs(breakdown.total - get_cost()) > 1e-6 * std::max(1.0, std::fabs(breakdown.total))) {
            errors.emplace_back("The solution has a computed cost of " + std::to_string(breakdown.total) + " but the stored one is " +
                                    std::to_string(get_cost()),
                                __LINE__);
        }

        if (!errors.empty() || verbose) {
            std::cout << "== BEGIN OF SOLUTION FEASIBILITY CHECK REPORT ==\n";
            if (errors.size() == 1) {
                std::cout << "There is 1 error\n";
            } else {
                std::cout << "There are " << errors.size() << " errors\n";
            }
            for (const auto &entry : errors) {
                std::cout << "+ LINE " << entry.second << " + " << entry.first << "\n";
            }
            if (warnings.size() == 1) {
                std::cout << "There is 1 warning\n";
            } else {
                std::cout << "There are " << warnings.size() << " warnings\n";
            }
            for (const auto &entry : warnings) {
                std::cout << "+ LINE " << entry.second << " + " << entry.first << "\n";
            }
            std::cout << "== END OF SOLUTION FEASIBILITY CHECK REPORT ==\n";
        }

        return errors.empty();
    }

    std::string Solution::to_string(const int route) const {
        const auto &node = routes_list[route];
        std::string str;
        str += "[" + std::to_string(route) + "] " + clrpsa::to_string(node.tier) + " ";
        str += std::to_string(node.origin) + " ";
        for (auto vertex : node.stops) {
            str += std::to_string(vertex) + " ";
        }
        str += std::to_string(node.origin);
        return str;
    }

    // static
    // 文件格式：
    //   Facilities f1 f2 ...
    //   <tier> <origin> : <stop> <stop> ...   (每条路径一行)
    //   Cost <value>
    void Solution::store_to_file(const Instance &instance, const Solution &solution, const std::string &path) {

        auto out = std::ofstream(path);
        if (!out) {
            std::cout << "Error: cannot write solution to '" << path << "'\n";
            return;
        }

        out << "Facilities";
        for (auto f = instance.get_facilities_begin(); f < instance.get_facilities_end(); f++) {
            if (solution.is_facility_open(f)) {
                out << " " << f;
            }
        }
        out << "\n";

        for (auto tier : {Tier::PRIMARY, Tier::SECONDARY}) {
            auto routes = solution.get_routes(tier).get_elements();
            std::sort(routes.begin(), routes.end());
            for (auto route : routes) {
                out << clrpsa::to_string(tier) << " " << solution.get_route_origin(route) << " :";
                for (auto vertex : solution.get_route_stops(route)) {
                    out << " " << vertex;
                }
                out << "\n";
            }
        }

        out << std::setprecision(10);
        out << "Cost " << solution.get_cost() << "\n";
    }

}  // namespace clrpsa
