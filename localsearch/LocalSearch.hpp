// 局部搜索：基于交换和重定位邻域的首次改进下降
#ifndef _CLRPSA_LOCALSEARCH_HPP_
#define _CLRPSA_LOCALSEARCH_HPP_

#include "../instance/Instance.hpp"
#include "../solution/Solution.hpp"

namespace clrpsa {

    // First improvement descent over the swap and relocate customer neighborhoods. Swap moves are explored first, then relocations, and
    // the two are repeated until neither finds a move improving the cost by more than `tolerance`.
    // 首次改进下降：先交换后重定位，重复直到两者都找不到改进量超过tolerance的移动
    class LocalSearch {
    public:
        LocalSearch(const Instance &instance_, double tolerance_) : instance(instance_), tolerance(tolerance_) { }

        // Improves `solution` in place and returns whether its cost decreased.
        // 原地改进解，返回成本是否降低
        bool apply(Solution &solution) const;

    private:
        bool swap_pass(Solution &solution) const;
        bool relocate_pass(Solution &solution) const;

        const Instance &instance;
        const double tolerance;
    };

}  // namespace clrpsa

#endif
