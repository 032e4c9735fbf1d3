#pragma once

#include "data/Record.hpp"
#include <vector>

class ISplitCriterion {
public:
    virtual ~ISplitCriterion() = default;

    /** indices 指向 records 中属于当前节点的行 */
    virtual double nodeMetric(const std::vector<Record>& records,
                              const std::vector<int>& indices,
                              TargetField target) const = 0;
};
