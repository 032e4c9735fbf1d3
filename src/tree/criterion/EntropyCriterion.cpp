// src/tree/criterion/EntropyCriterion.cpp
#include "criterion/EntropyCriterion.hpp"
#include <algorithm>
#include <numeric>
#include <cmath>

double EntropyCriterion::nodeMetric(const std::vector<Record>& records,
                                    const std::vector<int>& indices,
                                    TargetField target) const {
    return entropy(records, indices, target);
}

EntropyCriterion::ClassCounts
EntropyCriterion::classCounts(const std::vector<Record>& records,
                              const std::vector<int>& indices,
                              TargetField target) {
    ClassCounts counts;
    for (int idx : indices) {
        const auto& value = records[idx].target(target);
        if (value) {
            ++counts[*value];
        }
    }
    return counts;
}

double EntropyCriterion::entropy(const ClassCounts& counts) {
    int total = 0;
    for (const auto& kv : counts) total += kv.second;
    if (total == 0) return 0.0;

    double h = 0.0;
    for (const auto& kv : counts) {
        const double p = static_cast<double>(kv.second) / total;
        h -= p * std::log2(p);
    }
    // 单一类别时避免返回 -0.0
    return std::max(0.0, h);
}

double EntropyCriterion::entropy(const std::vector<Record>& records,
                                 const std::vector<int>& indices,
                                 TargetField target) {
    if (indices.empty()) return 0.0;
    return entropy(classCounts(records, indices, target));
}

double EntropyCriterion::entropy(const std::vector<Record>& records,
                                 TargetField target) {
    std::vector<int> indices(records.size());
    std::iota(indices.begin(), indices.end(), 0);
    return entropy(records, indices, target);
}
