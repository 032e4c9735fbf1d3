#pragma once

#include "tree/trainer/SingleTargetTreeTrainer.hpp"
#include "tree/TreeParams.hpp"
#include "data/Record.hpp"
#include "data/Prediction.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * 五个互相独立的单目标树，共享同一份只读训练集
 * 训练时按目标字段用 OpenMP 并行建树
 */
class MultiTargetPredictor {
public:
    explicit MultiTargetPredictor(const TreeParams& params);

    static MultiTargetPredictor build(const std::vector<Record>& records,
                                      const TreeParams& params);

    void train(const std::vector<Record>& records);

    Prediction predict(const Record& record) const;

    std::vector<Prediction> predictAll(const std::vector<Record>& records) const;

    /** 每个目标字段的准确率，scored 输出参与计分的记录数 */
    std::array<double, kNumTargets>
    evaluate(const std::vector<Record>& records,
             std::array<size_t, kNumTargets>& scored) const;

    const SingleTargetTreeTrainer& tree(TargetField target) const;
    const TreeParams& params() const { return params_; }

private:
    TreeParams params_;
    std::array<std::unique_ptr<SingleTargetTreeTrainer>, kNumTargets> trees_;
};
