// Welford在线算法 - 增量计算均值
// 参考: https://gist.github.com/alexalemi/2151722
#ifndef _CLRPSA_WELFORD_HPP_
#define _CLRPSA_WELFORD_HPP_

namespace clrpsa {

    // Running mean of a stream of values.
    // 数值稳定的在线均值统计，只需一次遍历
    //
    // mean(n) = mean(n-1) + (x(n) - mean(n-1)) / n
    class Welford {

    public:
        Welford() = default;

        void update(double x) {
            ++k;
            mean += (x - mean) / static_cast<double>(k);
        }

        double get_mean() const {
            return mean;
        }

    private:
        unsigned long k = 0;  // 数据点数量
        double mean = 0.0;    // 当前均值
    };

}  // namespace clrpsa

#endif
