// include/factoreval/eval/panel_aligner.h
#pragma once

#include <string>

#include "factoreval/core/panel.h"

namespace factoreval {

/**
 * @brief 对齐后的因子 / 收益：日期与标的标签完全一致，均按升序排列。
 *
 * 下游引擎直接假定两张表同形，不再重复检查。
 */
struct AlignedPair {
    Panel factor;
    Panel returns;
};

/**
 * @brief 去掉交易所后缀："000001.SZ" → "000001"，无后缀原样返回
 */
std::string canonical_instrument(const std::string& id);

/**
 * @brief 把因子面板与收益面板投影到共同的日期 / 标的上
 *
 * - 两边的标的代码都先去掉交易所后缀再求交集，结果使用去后缀后的代码；
 * - 同一张表里两个列去后缀后重名时保留先出现的列并打 warning；
 * - 日期与标的交集都按升序排列；
 * - 任一交集为空抛 AlignmentError；
 * - 不修改入参。对已对齐的结果再次调用，返回相同的面板。
 */
AlignedPair align_panels(const Panel& factor, const Panel& returns);

} // namespace factoreval
