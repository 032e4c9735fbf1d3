#include "app/DiagnosisApp.hpp"
#include "ensemble/MultiTargetPredictor.hpp"
#include "functions/io/DataIO.hpp"
#include "pipeline/DataSplit.hpp"
#include "preprocessing/RecordCleaner.hpp"

#include <iostream>
#include <array>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <stdexcept>

void validateOptions(const ProgramOptions& opts) {
    if (opts.trainPath.empty()) {
        throw std::invalid_argument("training data path is empty");
    }
    if (opts.maxDepth < 0) {
        throw std::invalid_argument("maxDepth must be non-negative");
    }
    if (opts.minSamplesLeaf < 0) {
        throw std::invalid_argument("minSamplesLeaf must be non-negative");
    }
    if (!std::isfinite(opts.minGainRatio) || opts.minGainRatio < 0.0) {
        throw std::invalid_argument("minGainRatio must be a non-negative number");
    }
    if (opts.testPath.empty() && !(opts.trainRatio > 0.0 && opts.trainRatio <= 1.0)) {
        throw std::invalid_argument("trainRatio must be in (0, 1]");
    }
}

void runDiagnosisApp(const ProgramOptions& opts) {
    validateOptions(opts);
    auto totalStart = std::chrono::high_resolution_clock::now();

    // 1. 读 CSV 并清洗
    DataIO io;
    auto cleaned = preprocessing::RecordCleaner::clean(io.readRecords(opts.trainPath));

    // 2. 训练/测试集
    DataParams dp;
    if (opts.testPath.empty()) {
        if (!splitDataset(cleaned, opts.trainRatio, dp)) {
            throw std::runtime_error("Failed to split dataset");
        }
    } else {
        dp.train = std::move(cleaned);
        // 测试集只做规范化，每一行都要输出预测
        for (const auto& rec : io.readRecords(opts.testPath)) {
            dp.test.push_back(preprocessing::RecordCleaner::normalize(rec));
        }
    }
    std::cout << "Train: " << dp.train.size() << " | Test: " << dp.test.size() << std::endl;

    // 3. 训练
    TreeParams params;
    params.maxDepth       = opts.maxDepth;
    params.minSamplesLeaf = opts.minSamplesLeaf;
    params.minGainRatio   = opts.minGainRatio;

    auto trainStart = std::chrono::high_resolution_clock::now();
    auto predictor = MultiTargetPredictor::build(dp.train, params);
    auto trainEnd = std::chrono::high_resolution_clock::now();

    if (opts.printTrees) {
        for (TargetField t : allTargets()) {
            predictor.tree(t).printTree(std::cout);
        }
    }

    // 4. 评估（测试集为空时评估训练集）
    const auto& evalSet = dp.test.empty() ? dp.train : dp.test;
    std::array<size_t, kNumTargets> scored{};
    const auto accuracy = predictor.evaluate(evalSet, scored);

    std::cout << "\n=== Accuracy (" << (dp.test.empty() ? "train" : "test") << ") ===" << std::endl;
    for (size_t t = 0; t < kNumTargets; ++t) {
        const TargetField target = allTargets()[t];
        std::cout << std::left << std::setw(12) << targetName(target) << std::right;
        if (scored[t] == 0) {
            std::cout << "n/a (no labelled records)" << std::endl;
        } else {
            std::cout << std::fixed << std::setprecision(4) << accuracy[t]
                      << " (" << scored[t] << " scored)"
                      << " | Depth: " << predictor.tree(target).depth()
                      << " | Leaves: " << predictor.tree(target).leafCount() << std::endl;
        }
    }

    // 5. 写出预测
    const auto predictions = predictor.predictAll(evalSet);
    io.writePredictions(opts.outputPath, evalSet, predictions);

    auto totalEnd = std::chrono::high_resolution_clock::now();
    auto trainTime = std::chrono::duration_cast<std::chrono::milliseconds>(trainEnd - trainStart);
    auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(totalEnd - totalStart);

    std::cout << "Train: " << trainTime.count() << "ms"
              << " | Total: " << totalTime.count() << "ms" << std::endl;
}
