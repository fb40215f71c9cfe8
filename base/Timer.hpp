// 计时器类 - 用于测量运行时间和检查时间预算
#ifndef _CLRPSA_TIMER_HPP_
#define _CLRPSA_TIMER_HPP_

#include <chrono>

namespace clrpsa {

    // Wall clock timer based on a steady clock. It starts at construction.
    // 计时器，构造时自动开始计时
    class Timer {
    public:
        using clock = std::chrono::steady_clock;

        Timer() {
            reset();
        }

        // Returns the time elapsed since the last reset() in the requested units.
        // 返回自上次reset()以来经过的时间（以Units为单位）
        template <typename Units = typename clock::duration>
        unsigned long elapsed_time() const {
            const auto counted_time = std::chrono::duration_cast<Units>(clock::now() - start_point).count();
            return static_cast<unsigned long>(counted_time);
        }

        // Elapsed time in seconds with sub-second resolution.
        double elapsed_seconds() const {
            return std::chrono::duration<double>(clock::now() - start_point).count();
        }

        // Returns whether `budget` has been consumed. A zero budget never expires.
        // 检查时间预算是否已耗尽，预算为0表示不限时
        template <typename Rep, typename Period>
        bool is_expired(std::chrono::duration<Rep, Period> budget) const {
            if (budget.count() <= 0) {
                return false;
            }
            return clock::now() - start_point >= budget;
        }

        void reset() {
            start_point = clock::now();
        }

    private:
        clock::time_point start_point;
    };

}  // namespace clrpsa

#endif
