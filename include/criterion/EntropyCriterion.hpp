// include/criterion/EntropyCriterion.hpp
#ifndef ENTROPY_CRITERION_HPP
#define ENTROPY_CRITERION_HPP

#include "../tree/ISplitCriterion.hpp"
#include <map>
#include <string>

class EntropyCriterion : public ISplitCriterion {
public:
    double nodeMetric(const std::vector<Record>& records,
                      const std::vector<int>& indices,
                      TargetField target) const override;

    // 类别直方图：只统计目标值存在的记录
    using ClassCounts = std::map<std::string, int>;

    static ClassCounts classCounts(const std::vector<Record>& records,
                                   const std::vector<int>& indices,
                                   TargetField target);

    // 分母为直方图总数（即目标值存在的记录数）
    static double entropy(const ClassCounts& counts);

    static double entropy(const std::vector<Record>& records,
                          const std::vector<int>& indices,
                          TargetField target);

    static double entropy(const std::vector<Record>& records,
                          TargetField target);
};

#endif // ENTROPY_CRITERION_HPP
