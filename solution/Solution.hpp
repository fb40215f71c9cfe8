// CLRP解的表示类
// 维护开放设施集合、分层路径以及载重/成本的增量记录
#ifndef _CLRPSA_SOLUTION_HPP_
#define _CLRPSA_SOLUTION_HPP_

#include <array>
#include <string>
#include <vector>

#include "../base/SparseIntSet.hpp"
#include "../instance/Instance.hpp"

namespace clrpsa {

    // Class representing a CLRP solution.
    // CLRP解的表示类
    //
    // A few highlevel notes:
    // 高层设计说明：
    // - Routes are identified by stable slot indices. Removing a route frees its slot but never renumbers the other routes, so a move can
    //   refer to two routes even if applying it empties the first one.
    //   路径用稳定的槽位下标标识，删除路径不会改变其他路径的下标
    // - The tier of a route is the tier of its origin facility. Secondary routes visit customers, primary routes visit intermediate
    //   (secondary tier) facilities.
    //   路径的层级就是其起点设施的层级
    // - The load of a stop is the customer demand, or for an intermediate facility its current throughput. Changing the throughput of an
    //   intermediate facility is propagated to the primary route visiting it and to that route's origin.
    //   中转设施作为一级路径的站点时，其载重等于其当前吞吐量，并向上传递
    // - Every mutation updates the cached cost components incrementally and returns the cost variation.
    //   每个修改操作都增量更新缓存的成本，并返回成本变化量
    // - Empty routes are removed immediately.
    //   空路径会被立即移除
    class Solution {

    public:
        // Dummy value used to identify an invalid vertex.
        // 无效顶点的哨兵值
        static inline const int dummy_vertex = -1;

        // Dummy value used to identify an invalid route.
        // 无效路径的哨兵值
        static inline const int dummy_route = -1;

        explicit Solution(const Instance &instance_);

        Solution(const Solution &source) = default;

        // Both solutions must refer to the same instance.
        // 赋值运算符（两个解必须属于同一实例）
        Solution &operator=(const Solution &source);

        // Two solutions are equal if they open the same facilities and every stop has the same origin, predecessor and successor.
        // 相等比较：开放设施相同，且每个站点的起点、前驱和后继都相同
        bool operator==(const Solution &other) const;

        bool operator!=(const Solution &other) const {
            return !(*this == other);
        }

        // Removes every route and closes every facility.
        // 重置为空解
        void reset();

        const Instance &get_instance() const {
            return instance;
        }

        // Returns the solution cost.
        // 获取解的总成本
        inline double get_cost() const {
            return opening_cost + fixed_cost + routing_cost;
        }

        inline double get_opening_cost() const {
            return opening_cost;
        }

        inline double get_fixed_cost() const {
            return fixed_cost;
        }

        inline double get_routing_cost() const {
            return routing_cost;
        }

        // --- Facilities ---

        inline bool is_facility_open(const int facility) const {
            return open[facility] != 0;
        }

        inline int get_open_facilities_num() const {
            return open_facilities_num;
        }

        // Returns the open facilities of `tier`, sorted by index.
        // 返回指定层级的开放设施（按下标升序）
        std::vector<int> get_open_facilities(Tier tier) const;

        // Returns the throughput of `facility`, i.e. the sum of the loads of the routes leaving it.
        // 返回设施的吞吐量（从该设施出发的所有路径载重之和）
        inline int get_facility_load(const int facility) const {
            return facility_load[facility];
        }

        inline const std::vector<int> &get_facility_routes(const int facility) const {
            return facility_routes[facility];
        }

        // Opens a closed facility and returns the cost variation.
        // 开放设施，返回成本变化量
        double open_facility(int facility);

        // Closes an open facility which has no routes and, with two echelons, is not visited by a primary route.
        // 关闭设施（设施必须没有路径，且不在任何一级路径中）
        double close_facility(int facility);

        // --- Routes ---

        // Returns the number of routes in the solution.
        inline int get_routes_num() const {
            return static_cast<int>(routes_in_use[0].size() + routes_in_use[1].size());
        }

        // Returns the routes of `tier` currently in the solution.
        // 返回指定层级当前使用的路径
        inline const SparseIntSet &get_routes(Tier tier) const {
            return routes_in_use[static_cast<int>(tier)];
        }

        inline Tier get_route_tier(const int route) const {
            return routes_list[route].tier;
        }

        inline int get_route_origin(const int route) const {
            return routes_list[route].origin;
        }

        inline const std::vector<int> &get_route_stops(const int route) const {
            return routes_list[route].stops;
        }

        inline int get_route_size(const int route) const {
            return static_cast<int>(routes_list[route].stops.size());
        }

        inline int get_route_load(const int route) const {
            return routes_list[route].load;
        }

        // Returns the round trip distance of the route, before applying the unit cost of its tier.
        // 返回路径的往返距离（未乘单位成本）
        inline double get_route_distance(const int route) const {
            return routes_list[route].distance;
        }

        inline bool is_route_in_use(const int route) const {
            return route >= 0 && route < static_cast<int>(routes_list.size()) &&
                   routes_in_use[static_cast<int>(routes_list[route].tier)].contains(route);
        }

        // Returns the vertex stopped at position `position` of `route`, or the route origin when `position` is outside the stops.
        // 返回路径中指定位置的顶点，越界时返回路径起点（即仓库）
        inline int get_vertex_at(const int route, const int position) const {
            const auto &stops = routes_list[route].stops;
            if (position < 0 || position >= static_cast<int>(stops.size())) {
                return routes_list[route].origin;
            }
            return stops[position];
        }

        // --- Stops ---

        // Returns the route visiting `vertex` (a customer or an intermediate facility), Solution::dummy_route if none.
        // 返回访问该顶点的路径，不存在时返回dummy_route
        inline int get_route_index(const int vertex) const {
            return route_ptr[vertex];
        }

        inline int get_position(const int vertex) const {
            return position[vertex];
        }

        inline bool is_vertex_in_solution(const int vertex) const {
            return route_ptr[vertex] != dummy_route;
        }

        // Returns the load a vertex contributes when it is a stop.
        // 返回顶点作为站点时的载重
        inline int get_stop_load(const int vertex) const {
            return instance.is_customer(vertex) ? instance.get_demand(vertex) : facility_load[vertex];
        }

        // Returns the facility serving `customer`, Solution::dummy_vertex if it is not served.
        // 返回服务该顾客的设施
        inline int get_serving_facility(const int customer) const {
            const auto route = route_ptr[customer];
            return route == dummy_route ? dummy_vertex : routes_list[route].origin;
        }

        // Returns the primary facility supplying the intermediate `facility`, Solution::dummy_vertex if none.
        // 返回为中转设施供货的一级设施
        inline int get_supplier(const int facility) const {
            const auto route = route_ptr[facility];
            return route == dummy_route ? dummy_vertex : routes_list[route].origin;
        }

        // --- Mutations ---

        // Builds a route from the open `facility` visiting only `vertex` and returns its index.
        // 构建一条只包含一个站点的路径，返回路径下标
        int build_route(int facility, int vertex);

        // Inserts `vertex` at `position` of `route` (the stops from `position` on shift by one) and returns the cost variation.
        // 在路径的指定位置插入顶点，返回成本变化量
        double insert_stop(int route, int position, int vertex);

        // Removes the stop at `position` of `route` and returns the cost variation. The route is removed when it becomes empty.
        // 移除路径中指定位置的站点，路径为空时被移除，返回成本变化量
        double remove_stop(int route, int position);

        // Exchanges the stops at (route1, position1) and (route2, position2), with route1 != route2, and returns the cost variation.
        // 交换两条不同路径中的两个站点，返回成本变化量
        double exchange_stops(int route1, int position1, int route2, int position2);

        // Reverses the stops in positions [begin, end] of `route` and returns the cost variation.
        // 反转路径中[begin, end]位置的站点，返回成本变化量
        double reverse_path(int route, int begin, int end);

        // Moves the origin of `route` to the open `facility` of the same tier and returns the cost variation.
        // 将路径的起点改为同层级的另一个开放设施，返回成本变化量
        double rebase_route(int route, int facility);

        // --- Checks and output ---

        // Checks every feasibility invariant and the consistency of the cached data, printing a report when something is wrong or when
        // `verbose` is set.
        // 检查解的可行性和缓存数据的一致性
        bool is_feasible(bool verbose = false) const;

        // Generate a string representation of the given route.
        // 格式：[route_id] tier origin stop1 stop2 ... origin
        std::string to_string(int route) const;

        // Stores the solution in `path`.
        // 保存解到文件
        static void store_to_file(const Instance &instance, const Solution &solution, const std::string &path);

    private:
        struct Route {
            Tier tier = Tier::SECONDARY;
            int origin = dummy_vertex;
            std::vector<int> stops;
            int load = 0;
            double distance = 0.0;  // 往返距离
        };

        int request_route(Tier tier, int facility);
        void release_route(int route);

        // Adds `delta` to the throughput of `facility`, propagating it to the primary route visiting the facility.
        // 增加设施吞吐量，并向上传递到访问该设施的一级路径
        void add_facility_load(int facility, int delta);

        // Shifts the cached positions of the stops of `route` from `from` on.
        void refresh_positions(int route, int from, int to);

        // Adds a distance variation of `route` to the cached costs and returns it weighted by the unit cost.
        double add_route_distance(int route, double delta);

        const Instance &instance;

        double opening_cost = 0.0;
        double fixed_cost = 0.0;
        double routing_cost = 0.0;

        std::vector<Route> routes_list;
        std::vector<int> free_routes;
        std::array<SparseIntSet, 2> routes_in_use;

        std::vector<int> route_ptr;  // 顶点 -> 所在路径
        std::vector<int> position;   // 顶点 -> 在路径中的位置

        std::vector<char> open;
        int open_facilities_num = 0;
        std::vector<int> facility_load;
        std::vector<std::vector<int>> facility_routes;
    };

}  // namespace clrpsa

#endif
