// include/factoreval/core/errors.h
#pragma once

#include <stdexcept>
#include <string>

namespace factoreval {

/**
 * @brief 评估链路的异常基类。
 *
 * 只有“整次调用无法继续”的情况才抛异常；逐期的数据不足 / 数值退化
 * 以缺失值 + Diagnostics 计数表示，不会走到这里。
 */
class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(const std::string& what) : std::runtime_error(what) {}
};

/// 因子与收益没有共同的日期或共同的标的
class AlignmentError : public EvaluationError {
public:
    explicit AlignmentError(const std::string& what) : EvaluationError(what) {}
};

/// 配置取值非法（分组数 < 2、分位数越界等），在任何逐期循环之前抛出
class ConfigurationError : public EvaluationError {
public:
    explicit ConfigurationError(const std::string& what) : EvaluationError(what) {}
};

/// Panel 构造参数不合法：形状不符、日期未排序或重复、标的重复
class PanelError : public EvaluationError {
public:
    explicit PanelError(const std::string& what) : EvaluationError(what) {}
};

/// 读写 CSV / 结果目录失败
class DataLoadError : public EvaluationError {
public:
    explicit DataLoadError(const std::string& what) : EvaluationError(what) {}
};

} // namespace factoreval
