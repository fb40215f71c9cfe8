// 模拟退火优化器
#ifndef _CLRPSA_ANNEALER_HPP_
#define _CLRPSA_ANNEALER_HPP_

#include <array>
#include <atomic>

#include "../instance/Instance.hpp"
#include "../solution/Solution.hpp"
#include "Progress.hpp"

namespace clrpsa {

    struct AnnealingParameters {
        unsigned int seed = 0;

        long max_iterations = 1000000;
        double time_limit = 0.0;  // 秒，0表示不限时

        // A non positive initial temperature is derived from the mean cost of sampled arcs times `sa_initial_factor`, and a non positive
        // final temperature from the initial one times `sa_final_factor`.
        // 初始温度<=0时：采样弧成本的均值 * sa_initial_factor；最终温度<=0时：初始温度 * sa_final_factor
        double initial_temperature = 0.0;
        double final_temperature = 0.0;
        double sa_initial_factor = 0.1;
        double sa_final_factor = 0.01;

        double cooling_rate = 0.98;
        long iterations_per_temperature = 1000;
        long max_non_improving_iterations = 200000;  // 0表示关闭
        double boltzmann = 1.0;

        bool local_search = true;
        double tolerance = 0.01;

        long progress_period = 1000;  // 0表示只在改进最优解时发送事件

        // Selection weights indexed by MoveKind. The relocate-facility weight is ignored with one echelon.
        // 各邻域的选择权重（按MoveKind下标）
        std::array<double, MOVE_KINDS_NUM> weights = {0.35, 0.25, 0.2, 0.1, 0.1};
    };

    // Result of an annealing run.
    // 退火运行的结果
    struct AnnealingOutcome {
        Solution best;
        long iterations;
        TerminationReason reason;
        MoveStatistics statistics;
        double initial_temperature;
        double final_temperature;
    };

    // Simulated annealing over the relocate, swap, 2-opt, toggle and relocate-facility neighborhoods.
    // 模拟退火优化器
    //
    // Every iteration draws a neighborhood by weight and a move in it. Infeasible moves are discarded before computing their cost, the
    // others are evaluated incrementally on the current solution and applied in place when the Metropolis criterion accepts them. The
    // best solution is kept as a separate copy. Every iteration counts toward the limits, whatever its outcome.
    // 每次迭代按权重选择邻域并随机生成移动；不可行的移动直接丢弃，可行的移动在当前解上增量计算成本，被接受时原地执行。
    // 最优解单独保存一份副本。无论结果如何，每次迭代都计入迭代次数。
    //
    // The temperature decreases every `iterations_per_temperature` iterations; at that time, if enabled, a local search descent is run on
    // a copy of the best solution and an improvement replaces both the best and the current solution.
    // 每iterations_per_temperature次迭代降温一次，同时（若启用）对最优解的副本执行局部搜索
    class Annealer {
    public:
        // Throws std::invalid_argument if `parameters` are out of range.
        Annealer(const Instance &instance_, AnnealingParameters parameters_, ProgressSink sink_ = {});

        // Anneals starting from the feasible `initial` solution. The run stops early when `cancel` is set.
        // 从可行解initial开始退火，cancel被置位时提前结束
        AnnealingOutcome run(Solution initial, const std::atomic<bool> *cancel = nullptr) const;

        const AnnealingParameters &get_parameters() const {
            return parameters;
        }

    private:
        void emit(long iteration, const Solution &current, const Solution &best, double temperature, MoveKind kind,
                  Decision decision) const;

        const Instance &instance;
        AnnealingParameters parameters;
        ProgressSink sink;
    };

}  // namespace clrpsa

#endif
