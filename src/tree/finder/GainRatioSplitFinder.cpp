// src/tree/finder/GainRatioSplitFinder.cpp
#include "finder/GainRatioSplitFinder.hpp"
#include "criterion/EntropyCriterion.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <tuple>
#include <utility>
#include <vector>

GainRatioSplitFinder::Partitions
GainRatioSplitFinder::partition(const std::vector<Record>& records,
                                const std::vector<int>& indices,
                                Attribute attribute) {
    Partitions parts;
    for (int idx : indices) {
        const auto& value = records[idx].attribute(attribute);
        if (value) {
            parts[*value].push_back(idx);
        }
    }
    return parts;
}

double GainRatioSplitFinder::gainRatio(const std::vector<Record>& records,
                                       const std::vector<int>& indices,
                                       Attribute attribute,
                                       TargetField target,
                                       double baseMetric,
                                       const ISplitCriterion& criterion) {
    const Partitions parts = partition(records, indices, attribute);

    size_t known = 0;
    for (const auto& kv : parts) known += kv.second.size();
    if (known == 0) return 0.0;

    // **按 (分区大小, 分区熵) 排序后累加，结果与属性取值的字典序无关**
    // 划分方式相同的两个属性因此得到逐位相同的增益率
    std::vector<std::pair<size_t, double>> terms;
    terms.reserve(parts.size());
    for (const auto& kv : parts) {
        terms.emplace_back(kv.second.size(),
                           criterion.nodeMetric(records, kv.second, target));
    }
    std::sort(terms.begin(), terms.end());

    double splitInfo = 0.0;
    double infoAttr  = 0.0;
    for (const auto& term : terms) {
        const double p = static_cast<double>(term.first) / known;
        splitInfo -= p * std::log2(p);
        infoAttr  += p * term.second;
    }

    // 只有一个分区时 splitInfo 为 0
    if (splitInfo <= 0.0) return 0.0;
    return (baseMetric - infoAttr) / splitInfo;
}

double GainRatioSplitFinder::gainRatio(const std::vector<Record>& records,
                                       Attribute attribute,
                                       TargetField target,
                                       double baseEntropy) {
    std::vector<int> indices(records.size());
    std::iota(indices.begin(), indices.end(), 0);
    EntropyCriterion criterion;
    return gainRatio(records, indices, attribute, target, baseEntropy, criterion);
}

std::tuple<int, double>
GainRatioSplitFinder::findBestSplit(const std::vector<Record>& records,
                                    const std::vector<int>& indices,
                                    const std::vector<Attribute>& candidates,
                                    TargetField target,
                                    double currentMetric,
                                    const ISplitCriterion& criterion) const {
    int    bestPos   = -1;
    double bestRatio = 0.0;

    for (size_t i = 0; i < candidates.size(); ++i) {
        const double ratio = gainRatio(records, indices, candidates[i],
                                       target, currentMetric, criterion);
        if (bestPos < 0 || ratio > bestRatio) {
            bestPos   = static_cast<int>(i);
            bestRatio = ratio;
        }
    }

    return {bestPos, bestRatio};
}
