// 贪心构造算法：生成确定性的初始可行解
#ifndef _CLRPSA_GREEDY_HPP_
#define _CLRPSA_GREEDY_HPP_

#include <stdexcept>

#include "../instance/Instance.hpp"
#include "Solution.hpp"

namespace clrpsa {

    // Raised when the greedy constructor cannot serve every client within the facility capacities.
    // 贪心构造无法得到可行解时抛出
    class ConstructionFailure : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Greedy constructor.
    // 贪心构造算法
    //
    // For the customer-serving tier, and then one tier up with two echelons:
    // 1. open facilities by increasing opening cost / capacity ratio until the open capacity covers the total demand;
    // 2. assign clients by decreasing demand to the nearest open facility with enough residual capacity, opening the next facility in
    //    ratio order when none fits;
    // 3. close the facilities without clients;
    // 4. build the routes of each facility by nearest neighbour, starting a new route when the vehicle is full.
    // With two echelons the clients of the primary tier are the used intermediate facilities, with demand equal to their throughput.
    // Ties are always broken by the lowest index.
    //
    // 步骤：按开放成本/容量比开放设施 -> 按需求降序分配到最近的有剩余容量的设施 -> 关闭未使用的设施 -> 最近邻构建路径
    //
    // Throws ConstructionFailure if a client cannot be assigned.
    Solution construct_greedy(const Instance &instance);

}  // namespace clrpsa

#endif
