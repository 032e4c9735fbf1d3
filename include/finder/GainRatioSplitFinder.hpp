#pragma once

#include "../tree/ISplitFinder.hpp"
#include <map>
#include <string>
#include <vector>

/**
 * C4.5 风格的分类属性选择：按信息增益率挑选属性
 * 候选属性按给定顺序评估，只有严格更大的增益率才会替换当前最佳
 */
class GainRatioSplitFinder : public ISplitFinder {
public:
    std::tuple<int, double>
    findBestSplit(const std::vector<Record>& records,
                  const std::vector<int>& indices,
                  const std::vector<Attribute>& candidates,
                  TargetField target,
                  double currentMetric,
                  const ISplitCriterion& criterion) const override;

    // 属性值 -> 行索引；缺失属性值的行不属于任何分区
    using Partitions = std::map<std::string, std::vector<int>>;

    static Partitions partition(const std::vector<Record>& records,
                                const std::vector<int>& indices,
                                Attribute attribute);

    static double gainRatio(const std::vector<Record>& records,
                            const std::vector<int>& indices,
                            Attribute attribute,
                            TargetField target,
                            double baseMetric,
                            const ISplitCriterion& criterion);

    // 以熵为度量，对全部记录计算
    static double gainRatio(const std::vector<Record>& records,
                            Attribute attribute,
                            TargetField target,
                            double baseEntropy);
};
