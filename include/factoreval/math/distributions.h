// include/factoreval/math/distributions.h
#pragma once
#include <cmath>
#include <cstddef>
#include <limits>

#include <boost/math/distributions/students_t.hpp>

#include "factoreval/utils/log.h"

namespace factoreval {
namespace math {

/**
 * @brief 概率分布计算：IC 显著性检验用到的 Student-t 尾概率。
 */
class Distributions {
public:
    /**
     * @brief Student-t 双侧 p 值：P(|T| >= |t|)
     *        - 自由度必须 > 0，t 必须有限，否则返回 NaN
     */
    static double student_t_two_sided_p(double t, double dof) {
        if (!std::isfinite(t) || !(dof > 0.0)) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        boost::math::students_t dist(dof);
        return 2.0 * boost::math::cdf(boost::math::complement(dist, std::fabs(t)));
    }

    /**
     * @brief 单样本均值 t 统计量：mean / (sd / sqrt(n))
     * @return n < 2、sd 非正或输入非有限时返回 NaN
     */
    static double mean_t_statistic(double mean, double sd, std::size_t n) {
        if (n < 2 || !std::isfinite(mean) || !std::isfinite(sd) || sd <= 0.0) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return mean / (sd / std::sqrt(static_cast<double>(n)));
    }
};

} // namespace math
} // namespace factoreval
