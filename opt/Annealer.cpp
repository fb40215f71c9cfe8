#include "Annealer.hpp"

#include <chrono>
#include <random>
#include <stdexcept>

#include "../base/Timer.hpp"
#include "../base/Welford.hpp"
#include "../localsearch/LocalSearch.hpp"
#include "../localsearch/Neighborhood.hpp"
#include "../solution/CostEvaluator.hpp"
#include "SimulatedAnnealing.hpp"

#ifdef VERBOSE
    #include <iostream>
#endif

namespace clrpsa {

    std::string to_string(Decision decision) {
        switch (decision) {
        case Decision::NO_MOVE:
            return "none";
        case Decision::INFEASIBLE:
            return "infeasible";
        case Decision::REJECTED:
            return "rejected";
        case Decision::ACCEPTED:
            return "accepted";
        case Decision::IMPROVED:
            return "improved";
        case Decision::INTENSIFIED:
            return "intensified";
        }
        return "unknown";
    }

    std::string to_string(TerminationReason reason) {
        switch (reason) {
        case TerminationReason::COMPLETED:
            return "completed";
        case TerminationReason::MAX_ITERATIONS:
            return "iteration limit";
        case TerminationReason::FROZEN:
            return "final temperature";
        case TerminationReason::TIME_LIMIT:
            return "time limit";
        case TerminationReason::STAGNATION:
            return "stagnation";
        case TerminationReason::CANCELLED:
            return "cancelled";
        }
        return "unknown";
    }

    Annealer::Annealer(const Instance &instance_, AnnealingParameters parameters_, ProgressSink sink_)
        : instance(instance_), parameters(parameters_), sink(std::move(sink_)) {

        if (parameters.max_iterations < 0) {
            throw std::invalid_argument("The maximum number of iterations cannot be negative");
        }
        if (!(parameters.time_limit >= 0.0)) {
            throw std::invalid_argument("The time limit cannot be negative");
        }
        if (!(parameters.cooling_rate > 0.0 && parameters.cooling_rate < 1.0)) {
            throw std::invalid_argument("The cooling rate must be in (0, 1), got " + std::to_string(parameters.cooling_rate));
        }
        if (parameters.iterations_per_temperature <= 0) {
            throw std::invalid_argument("The iterations per temperature must be positive");
        }
        if (!(parameters.boltzmann > 0.0)) {
            throw std::invalid_argument("The Boltzmann constant must be positive");
        }
        if (parameters.max_non_improving_iterations < 0 || parameters.progress_period < 0 || parameters.tolerance < 0.0) {
            throw std::invalid_argument("Stagnation, progress period and tolerance cannot be negative");
        }

        if (!instance.is_two_echelon()) {
            parameters.weights[static_cast<int>(MoveKind::RELOCATE_FACILITY)] = 0.0;
        }
        auto weights_sum = 0.0;
        for (auto weight : parameters.weights) {
            if (!(weight >= 0.0)) {
                throw std::invalid_argument("Move weights cannot be negative");
            }
            weights_sum += weight;
        }
        if (weights_sum <= 0.0) {
            throw std::invalid_argument("At least one usable move weight must be positive");
        }
    }

    void Annealer::emit(const long iteration, const Solution &current, const Solution &best, const double temperature, const MoveKind kind,
                        const Decision decision) const {
        if (sink) {
            sink(ProgressEvent{iteration, current.get_cost(), best.get_cost(), temperature, kind, decision});
        }
    }

    AnnealingOutcome Annealer::run(Solution initial, const std::atomic<bool> *cancel) const {

        auto timer = Timer();
        const auto time_limit = std::chrono::duration<double>(parameters.time_limit);

        auto rand_engine = std::mt19937(parameters.seed);

        // 计算模拟退火的初始温度：随机采样|V|条弧的成本
        auto initial_temperature = parameters.initial_temperature;
        if (initial_temperature <= 0.0) {
            auto vertices_dist = std::uniform_int_distribution<int>(0, instance.get_vertices_num() - 1);
            auto welf = Welford();
            for (auto n = 0; n < instance.get_vertices_num(); n++) {
                welf.update(instance.get_cost(vertices_dist(rand_engine), vertices_dist(rand_engine)));
            }
            initial_temperature = welf.get_mean() * parameters.sa_initial_factor;
            if (initial_temperature <= 0.0) {
                initial_temperature = 1.0;
            }
        }
        auto final_temperature = parameters.final_temperature;
        if (final_temperature <= 0.0) {
            final_temperature = initial_temperature * parameters.sa_final_factor;
        }

        auto sa = SimulatedAnnealing(initial_temperature, final_temperature, parameters.cooling_rate, parameters.boltzmann, rand_engine);

#ifdef VERBOSE
        std::cout << "Simulated annealing temperature goes from " << initial_temperature << " to " << final_temperature << ".\n";
#endif

        auto neighborhood = Neighborhood(instance, rand_engine);
        auto kinds_dist = std::discrete_distribution<int>(parameters.weights.begin(), parameters.weights.end());
        const auto local_search = LocalSearch(instance, parameters.tolerance);

        auto current = std::move(initial);
        auto best = current;
        assert(current.is_feasible());

        auto statistics = MoveStatistics();
        auto iteration = 0L;
        auto non_improving = 0L;
        auto reason = TerminationReason::MAX_ITERATIONS;
        auto kind = MoveKind::RELOCATE_CUSTOMER;

        emit(iteration, current, best, sa.get_temperature(), kind, Decision::NO_MOVE);

        while (true) {

            if (iteration >= parameters.max_iterations) {
                reason = TerminationReason::MAX_ITERATIONS;
                break;
            }
            if (cancel != nullptr && cancel->load(std::memory_order_relaxed)) {
                reason = TerminationReason::CANCELLED;
                break;
            }
            if (timer.is_expired(time_limit)) {
                reason = TerminationReason::TIME_LIMIT;
                break;
            }
            if (sa.is_frozen()) {
                reason = TerminationReason::FROZEN;
                break;
            }
            if (parameters.max_non_improving_iterations > 0 && non_improving >= parameters.max_non_improving_iterations) {
                reason = TerminationReason::STAGNATION;
                break;
            }

            iteration++;

            kind = static_cast<MoveKind>(kinds_dist(rand_engine));
            const auto k = static_cast<int>(kind);
            statistics.proposed[k]++;

            auto decision = Decision::NO_MOVE;

            const auto move = neighborhood.propose(kind, current);
            if (move.has_value()) {
                if (!is_feasible(current, *move)) {
                    decision = Decision::INFEASIBLE;
                } else {
                    statistics.feasible[k]++;
                    const auto delta = compute_delta(current, *move);
                    if (sa.accept(delta)) {
                        apply_move(current, *move);
                        statistics.accepted[k]++;
                        decision = Decision::ACCEPTED;
                        if (current.get_cost() < best.get_cost() - 1e-9) {
                            best = current;
                            decision = Decision::IMPROVED;
                            statistics.improvements++;
                        }
                    } else {
                        decision = Decision::REJECTED;
                    }
                }
            }

            non_improving = decision == Decision::IMPROVED ? 0 : non_improving + 1;

            if (decision == Decision::IMPROVED ||
                (parameters.progress_period > 0 && iteration % parameters.progress_period == 0)) {
                emit(iteration, current, best, sa.get_temperature(), kind, decision);
            }

            // 降温，并对最优解执行局部搜索
            if (iteration % parameters.iterations_per_temperature == 0) {
                sa.decrease_temperature();

                if (parameters.local_search) {
                    auto candidate = best;
                    if (local_search.apply(candidate) && candidate.get_cost() < best.get_cost() - parameters.tolerance) {
                        best = candidate;
                        current = candidate;
                        non_improving = 0;
                        statistics.intensifications++;
                        emit(iteration, current, best, sa.get_temperature(), kind, Decision::INTENSIFIED);
                    }
                }
            }
        }

        assert(best.is_feasible());

#ifdef VERBOSE
        std::cout << "Annealing stopped after " << iteration << " iterations (" << to_string(reason) << "), best = " << best.get_cost()
                  << ".\n";
#endif

        return AnnealingOutcome{std::move(best), iteration, reason, statistics, initial_temperature, final_temperature};
    }

}  // namespace clrpsa
