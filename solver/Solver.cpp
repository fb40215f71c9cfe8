#include "Solver.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

#include "../base/Timer.hpp"
#include "../solution/greedy.hpp"

namespace clrpsa {

    SolverResult GreedySolver::solve(const Instance &instance) const {
        auto timer = Timer();
        auto solution = construct_greedy(instance);
        const auto cost = solution.get_cost();
        return SolverResult{std::move(solution), cost, timer.elapsed_seconds(), 0, TerminationReason::COMPLETED, MoveStatistics()};
    }

    SolverResult AnnealingSolver::solve(const Instance &instance) const {
        return solve(construct_greedy(instance));
    }

    SolverResult AnnealingSolver::solve(Solution initial) const {
        auto timer = Timer();
        const auto annealer = Annealer(initial.get_instance(), parameters, sink);
        auto outcome = annealer.run(std::move(initial), cancel);
        const auto cost = outcome.best.get_cost();
        return SolverResult{std::move(outcome.best), cost, timer.elapsed_seconds(), outcome.iterations, outcome.reason, outcome.statistics};
    }

    SolverResult solve(const AnySolver &solver, const Instance &instance) {
        return std::visit([&instance](const auto &concrete) { return concrete.solve(instance); }, solver);
    }

    MultistartResult solve_multistart(const Instance &instance, const AnnealingParameters &parameters, const std::vector<unsigned int> &seeds,
                                      const int threads, const std::atomic<bool> *cancel) {

        if (seeds.empty()) {
            throw std::invalid_argument("At least one seed is required");
        }

        // The greedy solution is deterministic: build it once.
        // 贪心解是确定的，只构建一次
        const auto initial = construct_greedy(instance);

        auto results = std::vector<std::optional<SolverResult>>(seeds.size());
        auto next = std::atomic<size_t>(0);
        auto failure = std::exception_ptr();
        auto failure_mutex = std::mutex();

        const auto worker = [&]() {
            while (true) {
                const auto index = next.fetch_add(1);
                if (index >= seeds.size()) {
                    return;
                }
                try {
                    auto run_parameters = parameters;
                    run_parameters.seed = seeds[index];
                    results[index].emplace(AnnealingSolver(run_parameters, {}, cancel).solve(initial));
                } catch (...) {
                    // Rethrown on the calling thread once every worker joined.
                    // 记录异常，所有线程结束后在调用线程重新抛出
                    const auto lock = std::lock_guard<std::mutex>(failure_mutex);
                    if (!failure) {
                        failure = std::current_exception();
                    }
                }
            }
        };

        const auto workers_num = std::max(1, std::min(threads, static_cast<int>(seeds.size())));
        auto workers = std::vector<std::thread>();
        for (auto n = 1; n < workers_num; n++) {
            workers.emplace_back(worker);
        }
        worker();
        for (auto &thread : workers) {
            thread.join();
        }

        if (failure) {
            std::rethrow_exception(failure);
        }

        auto best_index = size_t(0);
        auto costs = std::vector<double>();
        for (size_t n = 0; n < results.size(); n++) {
            costs.push_back(results[n]->cost);
            if (results[n]->cost < results[best_index]->cost) {
                best_index = n;
            }
        }

        return MultistartResult{std::move(*results[best_index]), seeds[best_index], std::move(costs)};
    }

}  // namespace clrpsa
