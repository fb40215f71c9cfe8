// 邻域：随机生成移动、检查可行性、执行移动
#ifndef _CLRPSA_NEIGHBORHOOD_HPP_
#define _CLRPSA_NEIGHBORHOOD_HPP_

#include <optional>
#include <random>

#include "../instance/Instance.hpp"
#include "../solution/Solution.hpp"
#include "Move.hpp"

namespace clrpsa {

    // Returns whether `facility` can absorb `load` more units of throughput while `source` (Solution::dummy_vertex if none) releases the
    // same amount. With two echelons the variation is followed up to the primary route and the primary facility; it cancels out where
    // both sides share them.
    // 检查设施能否增加load的吞吐量（同时source减少相同的量），两级实例中向上检查一级路径和一级设施
    bool can_absorb_load(const Solution &solution, int facility, int source, int load);

    // Returns whether applying `move` keeps every feasibility invariant of `solution`.
    // 检查移动是否保持解的可行性
    bool is_feasible(const Solution &solution, const Move &move);

    // Applies the feasible `move` to `solution` and returns the cost variation.
    // 执行移动，返回成本变化量
    double apply_move(Solution &solution, const Move &move);

    // Random move generator used by the annealer.
    // 随机移动生成器
    //
    // Proposals are structurally valid (the referenced vertices, routes and positions exist and the move is not a no-op) but may violate
    // capacities: callers check them with is_feasible() before computing the cost. Toggle proposals are complete rebuild plans, which
    // are built to respect capacities already.
    class Neighborhood {
    public:
        Neighborhood(const Instance &instance_, std::mt19937 &rand_engine_) : instance(instance_), rand_engine(rand_engine_) { }

        // Draws a move of the given kind, nullopt if no move of this kind exists for `solution` or the draw is a no-op.
        // 随机生成一个指定类型的移动，不存在时返回nullopt
        std::optional<Move> propose(MoveKind kind, const Solution &solution);

        // Builds the plan that opens (if closed) or closes (if open) `facility`, nullopt if the facility cannot be toggled.
        // 构建开放或关闭设施的方案，无法切换时返回nullopt
        std::optional<ToggleMove> plan_toggle(const Solution &solution, int facility) const;

    private:
        std::optional<Move> propose_relocate(const Solution &solution, int vertex, Tier tier);
        std::optional<Move> propose_swap(const Solution &solution);
        std::optional<Move> propose_two_opt(const Solution &solution);

        std::optional<ToggleMove> plan_closing(const Solution &solution, int facility) const;
        std::optional<ToggleMove> plan_opening(const Solution &solution, int facility) const;

        int draw(int min, int max) {
            return std::uniform_int_distribution<int>(min, max)(rand_engine);
        }

        const Instance &instance;
        std::mt19937 &rand_engine;
    };

}  // namespace clrpsa

#endif
