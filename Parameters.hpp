// 参数管理类 - 处理命令行参数和默认配置
#ifndef _CLRPSA_PARAMETERS_HPP_
#define _CLRPSA_PARAMETERS_HPP_

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "instance/Instance.hpp"
#include "opt/Annealer.hpp"

// Default parameters.
// 默认参数定义
#define DEFAULT_OUTPATH ("./")                       // 输出路径
#define DEFAULT_SEED (0)                             // 随机种子（多起点时为第一个种子）
#define DEFAULT_RUNS (1)                             // 独立运行次数
#define DEFAULT_THREADS (1)                          // 多起点使用的线程数
#define DEFAULT_ROUNDING ("ceil")                    // 距离取整规则
#define DEFAULT_MAX_ITERATIONS (1000000)             // 最大迭代次数
#define DEFAULT_TIME_LIMIT (0.0)                     // 时间限制（秒），0表示不限时
#define DEFAULT_INITIAL_TEMPERATURE (0.0)            // 初始温度，0表示由弧成本推导
#define DEFAULT_FINAL_TEMPERATURE (0.0)              // 最终温度，0表示由初始温度推导
#define DEFAULT_SA_INIT_FACTOR (0.1)                 // 模拟退火初始温度因子
#define DEFAULT_SA_FINAL_FACTOR (0.01)               // 模拟退火最终温度因子
#define DEFAULT_COOLING_RATE (0.98)                  // 冷却因子
#define DEFAULT_ITERATIONS_PER_TEMPERATURE (1000)    // 每个温度的迭代次数
#define DEFAULT_STAGNATION (200000)                  // 未改进迭代次数上限，0表示关闭
#define DEFAULT_BOLTZMANN (1.0)                      // 接受概率中的缩放常数K
#define DEFAULT_LOCAL_SEARCH (1)                     // 降温时是否执行局部搜索
#define DEFAULT_TOLERANCE (0.01)                     // 容差值
#define DEFAULT_PROGRESS_PERIOD (1000)               // 进度事件周期

// Tokens.
// 命令行参数标记
#define TOKEN_OUTPATH ("--outpath")
#define TOKEN_SEED ("--seed")
#define TOKEN_RUNS ("--runs")
#define TOKEN_THREADS ("--threads")
#define TOKEN_ROUNDING ("--rounding")
#define TOKEN_MAX_ITERATIONS ("--max-iterations")
#define TOKEN_TIME_LIMIT ("--time-limit")
#define TOKEN_INITIAL_TEMPERATURE ("--initial-temperature")
#define TOKEN_FINAL_TEMPERATURE ("--final-temperature")
#define TOKEN_SA_INIT_FACTOR ("--sa-initial-factor")
#define TOKEN_SA_FINAL_FACTOR ("--sa-final-factor")
#define TOKEN_COOLING_RATE ("--cooling-rate")
#define TOKEN_ITERATIONS_PER_TEMPERATURE ("--iterations-per-temperature")
#define TOKEN_STAGNATION ("--stagnation")
#define TOKEN_BOLTZMANN ("--boltzmann")
#define TOKEN_LOCAL_SEARCH ("--local-search")
#define TOKEN_TOLERANCE ("--tolerance")
#define TOKEN_PROGRESS_PERIOD ("--progress-period")
#define TOKEN_TRACE ("--trace")
#define TOKEN_HELP ("--help")


// 参数类：管理所有算法参数
class Parameters {

public:
    // 构造函数：解析命令行参数
    explicit Parameters(int argc, char* argv[]) {

        if (argc == 1) {
            std::cout << "Missing input instance.\n\n";
            print_help();
            exit(EXIT_FAILURE);
        }

        if (std::string(argv[1]) == TOKEN_HELP) {
            print_help();
            exit(EXIT_SUCCESS);
        }

        // 第一个参数是实例文件路径
        instance_path = std::string(argv[1]);

        // 解析其余的键值对参数
        for (auto n = 2; n < argc; n += 2) {

            auto token = std::string(argv[n]);

            if (token == TOKEN_HELP) {
                print_help();
                exit(EXIT_SUCCESS);
            }

            if (n + 1 >= argc) {
                std::cout << "Missing value for '" << token << "'.\n\n";
                exit(EXIT_FAILURE);
            }
            auto value = std::string(argv[n + 1]);

            try {
                set(token, value);
            } catch (const std::logic_error&) {
                // std::stoi/std::stod 抛出 invalid_argument 或 out_of_range
                std::cout << "Error: invalid value '" << value << "' for '" << token << "'.\n";
                exit(EXIT_FAILURE);
            }
        }
    }

    inline std::string get_instance_path() const {
        return instance_path;
    }
    inline std::string get_outpath() const {
        return outpath;
    }
    inline unsigned int get_seed() const {
        return seed;
    }
    inline int get_runs() const {
        return runs;
    }
    inline int get_threads() const {
        return threads;
    }
    inline clrpsa::Rounding get_rounding() const {
        return rounding;
    }
    inline const std::string& get_trace_path() const {
        return trace_path;
    }

    // Annealing parameters for the first seed.
    // 退火参数
    inline const clrpsa::AnnealingParameters& get_annealing_parameters() const {
        return annealing;
    }

    // 设置参数值
    void set(const std::string& key, const std::string& value) {

        if (key == TOKEN_OUTPATH) {
            outpath = value;
            if (!outpath.empty() && outpath.back() != std::filesystem::path::preferred_separator) {
                outpath += std::filesystem::path::preferred_separator;
            }
        } else if (key == TOKEN_SEED) {
            seed = static_cast<unsigned int>(std::stoul(value));
            annealing.seed = seed;
        } else if (key == TOKEN_RUNS) {
            runs = std::stoi(value);
            if (runs < 1) {
                throw std::invalid_argument(key);
            }
        } else if (key == TOKEN_THREADS) {
            threads = std::stoi(value);
            if (threads < 1) {
                throw std::invalid_argument(key);
            }
        } else if (key == TOKEN_ROUNDING) {
            const auto maybe_rounding = clrpsa::rounding_from_string(value);
            if (!maybe_rounding.has_value()) {
                throw std::invalid_argument(key);
            }
            rounding = maybe_rounding.value();
        } else if (key == TOKEN_MAX_ITERATIONS) {
            annealing.max_iterations = std::stol(value);
        } else if (key == TOKEN_TIME_LIMIT) {
            annealing.time_limit = std::stod(value);
        } else if (key == TOKEN_INITIAL_TEMPERATURE) {
            annealing.initial_temperature = std::stod(value);
        } else if (key == TOKEN_FINAL_TEMPERATURE) {
            annealing.final_temperature = std::stod(value);
        } else if (key == TOKEN_SA_INIT_FACTOR) {
            annealing.sa_initial_factor = std::stod(value);
        } else if (key == TOKEN_SA_FINAL_FACTOR) {
            annealing.sa_final_factor = std::stod(value);
        } else if (key == TOKEN_COOLING_RATE) {
            annealing.cooling_rate = std::stod(value);
        } else if (key == TOKEN_ITERATIONS_PER_TEMPERATURE) {
            annealing.iterations_per_temperature = std::stol(value);
        } else if (key == TOKEN_STAGNATION) {
            annealing.max_non_improving_iterations = std::stol(value);
        } else if (key == TOKEN_BOLTZMANN) {
            annealing.boltzmann = std::stod(value);
        } else if (key == TOKEN_LOCAL_SEARCH) {
            annealing.local_search = std::stoi(value) != 0;
        } else if (key == TOKEN_TOLERANCE) {
            annealing.tolerance = std::stod(value);
        } else if (key == TOKEN_PROGRESS_PERIOD) {
            annealing.progress_period = std::stol(value);
        } else if (key == TOKEN_TRACE) {
            trace_path = value;
        } else {
            std::cout << "Error: unknown argument '" << key << "'. Try --help for more information.\n";
            exit(EXIT_FAILURE);
        }
    }

    static void print_help() {
        std::cout << "Usage: clrpsa <instance.dat> [--token value]...\n\n";
        std::cout << "  " << TOKEN_OUTPATH << " <path>                  output directory (default " << DEFAULT_OUTPATH << ")\n";
        std::cout << "  " << TOKEN_SEED << " <int>                      random seed (default " << DEFAULT_SEED << ")\n";
        std::cout << "  " << TOKEN_RUNS << " <int>                      independent seeds (default " << DEFAULT_RUNS << ")\n";
        std::cout << "  " << TOKEN_THREADS << " <int>                   threads for multiple runs (default " << DEFAULT_THREADS << ")\n";
        std::cout << "  " << TOKEN_ROUNDING << " <exact|ceil|round>     distance rounding (default " << DEFAULT_ROUNDING << ")\n";
        std::cout << "  " << TOKEN_MAX_ITERATIONS << " <int>            iteration limit (default " << DEFAULT_MAX_ITERATIONS << ")\n";
        std::cout << "  " << TOKEN_TIME_LIMIT << " <seconds>            time limit, 0 = none (default " << DEFAULT_TIME_LIMIT << ")\n";
        std::cout << "  " << TOKEN_INITIAL_TEMPERATURE << " <real>      0 = derived from the arc costs\n";
        std::cout << "  " << TOKEN_FINAL_TEMPERATURE << " <real>        0 = derived from the initial temperature\n";
        std::cout << "  " << TOKEN_SA_INIT_FACTOR << " <real>           (default " << DEFAULT_SA_INIT_FACTOR << ")\n";
        std::cout << "  " << TOKEN_SA_FINAL_FACTOR << " <real>          (default " << DEFAULT_SA_FINAL_FACTOR << ")\n";
        std::cout << "  " << TOKEN_COOLING_RATE << " <real>             geometric cooling factor (default " << DEFAULT_COOLING_RATE << ")\n";
        std::cout << "  " << TOKEN_ITERATIONS_PER_TEMPERATURE << " <int> (default " << DEFAULT_ITERATIONS_PER_TEMPERATURE << ")\n";
        std::cout << "  " << TOKEN_STAGNATION << " <int>                non improving iterations, 0 = off (default " << DEFAULT_STAGNATION
                  << ")\n";
        std::cout << "  " << TOKEN_BOLTZMANN << " <real>                K in exp(-delta / (K T)) (default " << DEFAULT_BOLTZMANN << ")\n";
        std::cout << "  " << TOKEN_LOCAL_SEARCH << " <0|1>              descent on cooling (default " << DEFAULT_LOCAL_SEARCH << ")\n";
        std::cout << "  " << TOKEN_TOLERANCE << " <real>                improvement tolerance (default " << DEFAULT_TOLERANCE << ")\n";
        std::cout << "  " << TOKEN_PROGRESS_PERIOD << " <int>           progress event period (default " << DEFAULT_PROGRESS_PERIOD << ")\n";
        std::cout << "  " << TOKEN_TRACE << " <path>                    progress trace file\n";
    }

private:
    static clrpsa::AnnealingParameters default_annealing() {
        auto parameters = clrpsa::AnnealingParameters();
        parameters.seed = DEFAULT_SEED;
        parameters.max_iterations = DEFAULT_MAX_ITERATIONS;
        parameters.time_limit = DEFAULT_TIME_LIMIT;
        parameters.initial_temperature = DEFAULT_INITIAL_TEMPERATURE;
        parameters.final_temperature = DEFAULT_FINAL_TEMPERATURE;
        parameters.sa_initial_factor = DEFAULT_SA_INIT_FACTOR;
        parameters.sa_final_factor = DEFAULT_SA_FINAL_FACTOR;
        parameters.cooling_rate = DEFAULT_COOLING_RATE;
        parameters.iterations_per_temperature = DEFAULT_ITERATIONS_PER_TEMPERATURE;
        parameters.max_non_improving_iterations = DEFAULT_STAGNATION;
        parameters.boltzmann = DEFAULT_BOLTZMANN;
        parameters.local_search = DEFAULT_LOCAL_SEARCH != 0;
        parameters.tolerance = DEFAULT_TOLERANCE;
        parameters.progress_period = DEFAULT_PROGRESS_PERIOD;
        return parameters;
    }

    // 私有成员变量：存储所有参数值
    std::string instance_path;                                                            // 实例文件路径
    std::string outpath = DEFAULT_OUTPATH;                                                // 输出路径
    unsigned int seed = DEFAULT_SEED;                                                     // 随机种子
    int runs = DEFAULT_RUNS;                                                              // 独立运行次数
    int threads = DEFAULT_THREADS;                                                        // 线程数
    clrpsa::Rounding rounding = clrpsa::rounding_from_string(DEFAULT_ROUNDING).value();   // 距离取整规则
    std::string trace_path;                                                               // 进度记录文件
    clrpsa::AnnealingParameters annealing = default_annealing();                          // 退火参数
};


#endif
