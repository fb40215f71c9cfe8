// 求解器抽象：统一的结果类型、可替换的求解器和并行多起点求解
#ifndef _CLRPSA_SOLVER_HPP_
#define _CLRPSA_SOLVER_HPP_

#include <atomic>
#include <variant>
#include <vector>

#include "../instance/Instance.hpp"
#include "../opt/Annealer.hpp"
#include "../opt/Progress.hpp"
#include "../solution/Solution.hpp"

namespace clrpsa {

    // Result shared by every solver.
    // 所有求解器共用的结果类型
    struct SolverResult {
        Solution solution;
        double cost;
        double runtime;  // 秒
        long iterations;
        TerminationReason reason;
        MoveStatistics statistics;
    };

    // Greedy constructor as a solver.
    // 贪心构造求解器
    class GreedySolver {
    public:
        // Throws ConstructionFailure if the instance cannot be solved.
        SolverResult solve(const Instance &instance) const;
    };

    // Greedy construction followed by simulated annealing.
    // 贪心构造 + 模拟退火
    class AnnealingSolver {
    public:
        explicit AnnealingSolver(AnnealingParameters parameters_, ProgressSink sink_ = {}, const std::atomic<bool> *cancel_ = nullptr)
            : parameters(parameters_), sink(std::move(sink_)), cancel(cancel_) { }

        // Throws ConstructionFailure if the greedy constructor fails.
        SolverResult solve(const Instance &instance) const;

        // Refines the feasible `initial` solution.
        // 对给定的可行解进行优化
        SolverResult solve(Solution initial) const;

        const AnnealingParameters &get_parameters() const {
            return parameters;
        }

    private:
        AnnealingParameters parameters;
        ProgressSink sink;
        const std::atomic<bool> *cancel;
    };

    // Solvers selected at composition time. A new solver is a new alternative.
    // 可选求解器；增加求解器即增加一个候选类型
    using AnySolver = std::variant<GreedySolver, AnnealingSolver>;

    SolverResult solve(const AnySolver &solver, const Instance &instance);

    struct MultistartResult {
        SolverResult best;
        unsigned int best_seed;
        std::vector<double> costs;  // 按种子顺序
    };

    // Runs one annealing per seed, starting from the same greedy solution, on at most `threads` threads and returns the best run. Ties
    // go to the earlier seed. Every run owns its solution and random engine, the instance is shared read only.
    // 每个种子独立运行一次退火（最多threads个线程），返回最优结果；成本相同时选择靠前的种子
    //
    // Throws ConstructionFailure if the greedy constructor fails, std::invalid_argument if `seeds` is empty.
    MultistartResult solve_multistart(const Instance &instance, const AnnealingParameters &parameters, const std::vector<unsigned int> &seeds,
                                      int threads, const std::atomic<bool> *cancel = nullptr);

}  // namespace clrpsa

#endif
