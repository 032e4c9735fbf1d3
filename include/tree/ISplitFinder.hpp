#pragma once

#include <tuple>
#include <vector>
#include "Node.hpp"
#include "ISplitCriterion.hpp"

class ISplitFinder {
public:
    virtual ~ISplitFinder() = default;

    /**
     * 在 candidates 中选出最佳划分属性
     * @return {candidates 中的位置（无可用属性时为 -1）, 该属性的得分}
     */
    virtual std::tuple<int, double>
    findBestSplit(const std::vector<Record>& records,
                  const std::vector<int>& indices,
                  const std::vector<Attribute>& candidates,
                  TargetField target,
                  double currentMetric,
                  const ISplitCriterion& criterion) const = 0;
};
