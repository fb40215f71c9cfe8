// CLRP模拟退火求解器主程序 - 求解带容量约束的选址-路径问题(CLRP)
// 流程：读取实例 -> 贪心构造初始解 -> 模拟退火优化（可多种子并行）-> 输出结果

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>

#include "Parameters.hpp"
#include "base/PrettyPrinter.hpp"
#include "base/Timer.hpp"
#include "instance/Instance.hpp"
#include "opt/Progress.hpp"
#include "solution/Solution.hpp"
#include "solution/greedy.hpp"
#include "solver/Solver.hpp"

// 从完整路径中提取文件名
auto get_basename(const std::string& pathname) -> std::string {
    return {std::find_if(pathname.rbegin(), pathname.rend(), [](char c) { return c == '/'; }).base(), pathname.end()};
}

// 打印缓存的进度事件
void print_progress(const std::vector<clrpsa::ProgressEvent>& events) {

    auto printer = clrpsa::PrettyPrinter({{"Iterations", clrpsa::PrettyPrinter::Field::Type::INTEGER, 10},
                                          {"Best", clrpsa::PrettyPrinter::Field::Type::REAL, 12},
                                          {"Current", clrpsa::PrettyPrinter::Field::Type::REAL, 12},
                                          {"Temp", clrpsa::PrettyPrinter::Field::Type::REAL, 8, 3},
                                          {"Move", clrpsa::PrettyPrinter::Field::Type::STRING, 17},
                                          {"Decision", clrpsa::PrettyPrinter::Field::Type::STRING, 11}});

    for (const auto& event : events) {
        if (event.decision == clrpsa::Decision::IMPROVED || event.decision == clrpsa::Decision::INTENSIFIED) {
            printer.set_style(clrpsa::PrettyPrinter::FOREGROUND_GREEN);
        }
        printer.print(event.iteration, event.best_cost, event.current_cost, event.temperature, clrpsa::to_string(event.kind),
                      clrpsa::to_string(event.decision));
        printer.unset_style();
    }
}

// 保存进度事件到文件
void store_trace(const std::vector<clrpsa::ProgressEvent>& events, const std::string& path) {
    auto out = std::ofstream(path);
    if (!out) {
        std::cout << "Error: cannot write the trace to '" << path << "'\n";
        return;
    }
    out << std::setprecision(10);
    out << "iteration\tcurrent\tbest\ttemperature\tmove\tdecision\n";
    for (const auto& event : events) {
        out << event.iteration << "\t" << event.current_cost << "\t" << event.best_cost << "\t" << event.temperature << "\t"
            << clrpsa::to_string(event.kind) << "\t" << clrpsa::to_string(event.decision) << "\n";
    }
}

// 打印各邻域的统计
void print_statistics(const clrpsa::MoveStatistics& statistics) {
    auto printer = clrpsa::PrettyPrinter({{"Move", clrpsa::PrettyPrinter::Field::Type::STRING, 17},
                                          {"Proposed", clrpsa::PrettyPrinter::Field::Type::INTEGER, 10},
                                          {"Feasible", clrpsa::PrettyPrinter::Field::Type::INTEGER, 10},
                                          {"Accepted", clrpsa::PrettyPrinter::Field::Type::INTEGER, 10}});
    for (auto k = 0; k < clrpsa::MOVE_KINDS_NUM; k++) {
        printer.print(clrpsa::to_string(static_cast<clrpsa::MoveKind>(k)), statistics.proposed[k], statistics.feasible[k],
                      statistics.accepted[k]);
    }
}


// Few notes:
// - Internal invariants are asserted in debug mode only.
int main(int argc, char* argv[]) {

#ifndef NDEBUG
    std::cout << "******************************\n";
    std::cout << "Probably running in DEBUG mode\n";
    std::cout << "******************************\n\n";
#endif

    // 全局计时器，用于记录整个算法的运行时间
    clrpsa::Timer global_timer;

    // 解析命令行参数
    const auto params = Parameters(argc, argv);

    // 从文件加载CLRP实例
    const auto load_instance = [&params]() -> std::optional<clrpsa::Instance> {
        try {
            return clrpsa::Instance::make(params.get_instance_path(), params.get_rounding());
        } catch (const clrpsa::InstanceInvalid& e) {
            std::cout << "Invalid instance: " << e.what() << "\n";
            return std::nullopt;
        }
    };
    auto maybe_instance = load_instance();

    // 如果实例加载失败，退出程序
    if (!maybe_instance.has_value()) {
        std::cout << "Cannot load the instance '" << params.get_instance_path() << "'\n";
        return EXIT_FAILURE;
    }

    const clrpsa::Instance instance = std::move(maybe_instance.value());

    std::cout << "Instance " << instance.get_name() << ": " << instance.get_facilities_num() << " facilities, "
              << instance.get_customers_num() << " customers, total demand " << instance.get_total_demand() << ".\n";

    auto seed = params.get_seed();
    auto result = std::optional<clrpsa::SolverResult>();

    try {

        if (params.get_runs() == 1) {

            // 单次运行：进度事件缓存在内存中，运行结束后打印
            auto progress = clrpsa::ProgressBuffer();
            const auto solver = clrpsa::AnySolver(clrpsa::AnnealingSolver(params.get_annealing_parameters(), progress.sink()));

            result.emplace(clrpsa::solve(solver, instance));

            print_progress(progress.get_events());
            if (!params.get_trace_path().empty()) {
                store_trace(progress.get_events(), params.get_trace_path());
            }

        } else {

            // 多种子并行运行
            auto seeds = std::vector<unsigned int>();
            for (auto n = 0; n < params.get_runs(); n++) {
                seeds.push_back(params.get_seed() + static_cast<unsigned int>(n));
            }

            auto multistart = clrpsa::solve_multistart(instance, params.get_annealing_parameters(), seeds, params.get_threads());

            auto printer = clrpsa::PrettyPrinter({{"Seed", clrpsa::PrettyPrinter::Field::Type::INTEGER, 6},
                                                  {"Objective", clrpsa::PrettyPrinter::Field::Type::REAL, 12}});
            for (size_t n = 0; n < seeds.size(); n++) {
                if (seeds[n] == multistart.best_seed) {
                    printer.set_style(clrpsa::PrettyPrinter::FOREGROUND_GREEN);
                }
                printer.print(seeds[n], multistart.costs[n]);
                printer.unset_style();
            }

            seed = multistart.best_seed;
            result.emplace(std::move(multistart.best));
        }

    } catch (const clrpsa::ConstructionFailure& e) {
        std::cout << "Cannot build an initial solution: " << e.what() << "\n";
        return EXIT_FAILURE;
    } catch (const std::invalid_argument& e) {
        std::cout << "Invalid parameters: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    const auto& best_solution = result->solution;

    print_statistics(result->statistics);

    // 记录总运行时间
    const auto global_time_elapsed = global_timer.elapsed_seconds();

    std::cout << "\n";
    std::cout << "Best solution found:\n";
    std::cout << "obj = " << best_solution.get_cost() << " (opening " << best_solution.get_opening_cost() << ", fixed "
              << best_solution.get_fixed_cost() << ", routing " << best_solution.get_routing_cost() << ")\n";
    std::cout << "open facilities = " << best_solution.get_open_facilities_num() << ", n. routes = " << best_solution.get_routes_num()
              << "\n";
    std::cout << "iterations = " << result->iterations << ", stopped by " << clrpsa::to_string(result->reason) << "\n";
    std::cout << "Run completed in " << global_time_elapsed << " seconds\n";

    // 构造输出文件名
    const auto basename = params.get_outpath() + get_basename(params.get_instance_path()) + "_seed-" + std::to_string(seed);
    const auto outfile = basename + ".out";

    // 创建输出目录（如果不存在）
    if (!params.get_outpath().empty()) {
        std::filesystem::create_directories(params.get_outpath());
    }

    // 保存结果到文件
    // .out文件包含目标值和运行时间
    auto out_stream = std::ofstream(outfile);
    out_stream << std::setprecision(10);
    out_stream << best_solution.get_cost() << "\t" << global_time_elapsed << "\n";
    // .clrp.sol文件包含开放设施和路径信息
    clrpsa::Solution::store_to_file(instance, best_solution, basename + ".clrp.sol");

    std::cout << "\n";
    std::cout << "Results stored in\n";
    std::cout << " - " << outfile << "\n";
    std::cout << " - " << basename << ".clrp.sol\n";

    return EXIT_SUCCESS;
}
