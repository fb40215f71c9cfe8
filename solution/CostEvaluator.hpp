// 成本计算：完整重算和增量计算
// 所有函数都是纯函数，不修改解
#ifndef _CLRPSA_COSTEVALUATOR_HPP_
#define _CLRPSA_COSTEVALUATOR_HPP_

#include <vector>

#include "../instance/Instance.hpp"
#include "../localsearch/Move.hpp"
#include "Solution.hpp"

namespace clrpsa {

    // Cost components of a solution.
    // 成本分项：设施开放成本、路径固定成本、距离成本
    struct CostBreakdown {
        double opening = 0.0;
        double fixed = 0.0;
        double routing = 0.0;
        double total = 0.0;
    };

    // Recomputes the cost of `solution` from scratch.
    // 从头计算解的成本
    CostBreakdown evaluate_cost(const Instance &instance, const Solution &solution);

    // Returns the round trip distance of a route leaving `origin` and visiting `stops` in order. Both the origin -> first stop and the
    // last stop -> origin legs are included.
    // 返回往返距离，包含起点到第一个站点和最后一个站点返回起点的两条边
    double route_distance(const Instance &instance, int origin, const std::vector<int> &stops);

    // --- Incremental primitives ---
    // Every primitive returns the weighted cost variation, i.e. distance variations are multiplied by the unit cost of the route tier.
    // 增量计算：返回成本变化量（距离变化已乘以该层级的单位成本）

    // Removal of the stop at `position` of `route`. If it is the only stop, the route disappears together with its fixed cost.
    // 删除站点；若为唯一站点，路径及其固定成本一并删除
    double removal_delta(const Solution &solution, int route, int position);

    // Insertion of `vertex` at `position` of `route`, with `position` in [0, size].
    double insertion_delta(const Solution &solution, int route, int position, int vertex);

    // Creation of a route leaving `facility` and visiting only `vertex`.
    double new_route_delta(const Instance &instance, int facility, int vertex);

    // Replacement of the stop at `position` of `route` with `vertex`.
    double replacement_delta(const Solution &solution, int route, int position, int vertex);

    // Reversal of the stops in positions [begin, end] of `route`.
    double reversal_delta(const Solution &solution, int route, int begin, int end);

    // Change of the origin of `route` to `facility`.
    double rebase_delta(const Solution &solution, int route, int facility);

    // Opening (`open` set) or closing of `facility`.
    double opening_delta(const Instance &instance, int facility, bool open);

    // Returns the cost variation obtained by applying `move` to `solution`. The move must be feasible for the current solution.
    // 计算移动的成本变化量（由增量函数组合而成）
    double compute_delta(const Solution &solution, const Move &move);

}  // namespace clrpsa

#endif
