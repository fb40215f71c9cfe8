// 邻域移动描述符
// 每种移动只记录参数，成本和可行性由CostEvaluator和Neighborhood计算
#ifndef _CLRPSA_MOVE_HPP_
#define _CLRPSA_MOVE_HPP_

#include <string>
#include <variant>
#include <vector>

namespace clrpsa {

    class Instance;

    // Neighborhoods explored by the annealer.
    // 邻域类型
    enum class MoveKind {
        RELOCATE_CUSTOMER = 0,  // 顾客重定位（同一路径、其他路径或新路径）
        SWAP_CUSTOMERS = 1,     // 两条不同路径中的顾客交换
        TWO_OPT = 2,            // 路径内反转一段站点（任意层级）
        TOGGLE_FACILITY = 3,    // 开放或关闭设施
        RELOCATE_FACILITY = 4   // 中转设施重定位（仅两级实例）
    };

    inline constexpr int MOVE_KINDS_NUM = 5;

    std::string to_string(MoveKind kind);

    // Moves `vertex` to `position` of `route`. If `route` is the route currently visiting `vertex`, `position` is the index in the route
    // after the removal of `vertex`. If `route` is Solution::dummy_route a new route leaving `facility` is created.
    // A vertex of the primary tier (an intermediate facility) gives the relocate-secondary-facility move.
    // 将vertex移到route的position位置；route为dummy_route时在facility新建路径
    struct RelocateMove {
        int vertex;
        int route;
        int position;
        int facility;
    };

    // Exchanges two customers visited by different routes.
    // 交换两条不同路径中的两个顾客
    struct SwapMove {
        int first;
        int second;
    };

    // Reverses the stops in positions [begin, end] of `route`.
    // 反转路径中[begin, end]位置的站点
    struct TwoOptMove {
        int route;
        int begin;
        int end;
    };

    // Opens or closes `facility`.
    // 开放或关闭设施
    //
    // Closing: every route in `routes` is moved to `target`, the nearest open facility of the same tier able to absorb the load. With two
    // echelons an intermediate facility also leaves its primary route (`primary_route`, `primary_position`).
    // 关闭：所有路径改到target出发；两级实例中的中转设施同时离开其一级路径
    //
    // Opening: the routes in `routes` are moved to `facility`. With two echelons the intermediate facility is inserted at
    // `primary_position` of `primary_route` or, when `primary_route` is Solution::dummy_route, in a new route leaving
    // `primary_facility`.
    // 开放：routes中的路径改到facility出发；两级实例中的中转设施插入一级路径或新建一级路径
    struct ToggleMove {
        int facility;
        bool open;
        std::vector<int> routes;
        int target;
        int primary_route;
        int primary_position;
        int primary_facility;
    };

    using Move = std::variant<RelocateMove, SwapMove, TwoOptMove, ToggleMove>;

    // Returns the neighborhood a move belongs to.
    MoveKind get_kind(const Instance &instance, const Move &move);

}  // namespace clrpsa

#endif
