// 优化过程的进度事件和统计信息
#ifndef _CLRPSA_PROGRESS_HPP_
#define _CLRPSA_PROGRESS_HPP_

#include <array>
#include <functional>
#include <string>
#include <vector>

#include "../localsearch/Move.hpp"

namespace clrpsa {

    // Outcome of an annealing iteration.
    // 一次迭代的结果
    enum class Decision {
        NO_MOVE,      // 没有生成移动
        INFEASIBLE,   // 移动不可行，未计算成本
        REJECTED,     // 被接受准则拒绝
        ACCEPTED,     // 被接受
        IMPROVED,     // 被接受且改进了最优解
        INTENSIFIED   // 局部搜索改进了最优解
    };

    std::string to_string(Decision decision);

    // Why the optimizer stopped. It is informational, none of them is an error.
    // 终止原因（仅供参考，不是错误）
    enum class TerminationReason {
        COMPLETED,       // 构造算法正常结束
        MAX_ITERATIONS,  // 达到最大迭代次数
        FROZEN,          // 温度低于最终温度
        TIME_LIMIT,      // 达到时间限制
        STAGNATION,      // 连续多次迭代没有改进最优解
        CANCELLED        // 被外部取消
    };

    std::string to_string(TerminationReason reason);

    struct ProgressEvent {
        long iteration = 0;
        double current_cost = 0.0;
        double best_cost = 0.0;
        double temperature = 0.0;
        MoveKind kind = MoveKind::RELOCATE_CUSTOMER;
        Decision decision = Decision::NO_MOVE;
    };

    using ProgressSink = std::function<void(const ProgressEvent &)>;

    // In memory progress sink, read after the run.
    // 内存中的进度记录器，运行结束后读取
    class ProgressBuffer {
    public:
        void operator()(const ProgressEvent &event) {
            events.push_back(event);
        }

        // Returns a sink appending to this buffer, which must outlive the sink.
        ProgressSink sink() {
            return [this](const ProgressEvent &event) { events.push_back(event); };
        }

        const std::vector<ProgressEvent> &get_events() const {
            return events;
        }

        void clear() {
            events.clear();
        }

    private:
        std::vector<ProgressEvent> events;
    };

    // Per neighborhood counters.
    // 各邻域的统计
    struct MoveStatistics {
        std::array<long, MOVE_KINDS_NUM> proposed = {};
        std::array<long, MOVE_KINDS_NUM> feasible = {};
        std::array<long, MOVE_KINDS_NUM> accepted = {};
        long improvements = 0;
        long intensifications = 0;
    };

}  // namespace clrpsa

#endif
