// 模拟退火算法辅助类
// 实现接受准则和几何冷却，用于决定是否接受较差的解以逃离局部最优
#ifndef _CLRPSA_SIMULATEDANNEALING_HPP_
#define _CLRPSA_SIMULATEDANNEALING_HPP_

#include <cmath>
#include <random>

namespace clrpsa {

    // Simulated annealing helper class.
    // 模拟退火辅助类
    // 使用几何冷却策略：T(k+1) = T(k) * cooling_rate
    class SimulatedAnnealing {
    public:
        // @param initial_temperature_ 初始温度
        // @param final_temperature_ 最终温度（低于该温度视为冻结）
        // @param cooling_rate_ 冷却因子
        // @param boltzmann_ 接受概率中的缩放常数K
        // @param rand_engine_ 随机数生成器
        SimulatedAnnealing(double initial_temperature_, double final_temperature_, double cooling_rate_, double boltzmann_,
                           std::mt19937 &rand_engine_)
            : initial_temperature(initial_temperature_)
            , final_temperature(final_temperature_)
            , temperature(initial_temperature_)
            , factor(cooling_rate_)
            , boltzmann(boltzmann_)
            , rand_engine(rand_engine_)
            , uniform_dist(0.0, 1.0) { }

        // 降低温度（几何冷却）
        void decrease_temperature() {
            temperature *= factor;
        }

        // Metropolis criterion: improving or equal moves are always accepted, worsening ones with probability exp(-delta / (K * T)).
        // 接受准则：delta <= 0 时接受；否则以概率 exp(-delta / (K * T)) 接受
        // 实现为 delta < -K * T * log(U(0,1))
        bool accept(const double delta) {
            if (delta <= 0.0) {
                return true;
            }
            return delta < -boltzmann * temperature * std::log(uniform_dist(rand_engine));
        }

        // Whether the temperature fell below the final temperature.
        bool is_frozen() const {
            return temperature < final_temperature;
        }

        double get_temperature() const {
            return temperature;
        }

        double get_initial_temperature() const {
            return initial_temperature;
        }

        double get_final_temperature() const {
            return final_temperature;
        }

    private:
        double initial_temperature;  // 初始温度
        double final_temperature;    // 最终温度
        double temperature;          // 当前温度
        double factor;               // 冷却因子
        double boltzmann;            // 缩放常数K

        std::mt19937 &rand_engine;                            // 随机数生成器
        std::uniform_real_distribution<double> uniform_dist;  // 均匀分布
    };

}  // namespace clrpsa

#endif
