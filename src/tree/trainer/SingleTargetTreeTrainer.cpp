// =============================================================================
// src/tree/trainer/SingleTargetTreeTrainer.cpp - 增益率分类树
// =============================================================================
#include "tree/trainer/SingleTargetTreeTrainer.hpp"
#include "criterion/EntropyCriterion.hpp"
#include "finder/GainRatioSplitFinder.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <chrono>
#include <iostream>
#include <numeric>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

std::string majorityOf(const EntropyCriterion::ClassCounts& counts) {
    // map 按键升序遍历，只有严格更多才替换 → 平局时取字典序最小
    const std::string* best = nullptr;
    int bestCount = 0;
    for (const auto& kv : counts) {
        if (kv.second > bestCount) {
            best = &kv.first;
            bestCount = kv.second;
        }
    }
    return best ? *best : std::string(SingleTargetTreeTrainer::kUnknown);
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) return false;
    }
    return true;
}

} // namespace

SingleTargetTreeTrainer::SingleTargetTreeTrainer(std::unique_ptr<ISplitFinder> finder,
                                                 std::unique_ptr<ISplitCriterion> criterion,
                                                 TargetField target,
                                                 const TreeParams& params)
    : target_(target),
      params_(params),
      finder_(std::move(finder)),
      criterion_(std::move(criterion)) {}

void SingleTargetTreeTrainer::train(const std::vector<Record>& records) {
    auto trainStart = std::chrono::high_resolution_clock::now();

    root_ = std::make_unique<Node>();

    std::vector<int> rootIndices(records.size());
    std::iota(rootIndices.begin(), rootIndices.end(), 0);

    const auto& attrs = allAttributes();
    std::vector<Attribute> attributes(attrs.begin(), attrs.end());

    splitNode(root_.get(), records, rootIndices, attributes, 0);

    auto trainEnd = std::chrono::high_resolution_clock::now();
    auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(trainEnd - trainStart);

    int treeDepth = 0, leaves = 0;
    size_t nodes = 0;
    calculateTreeStats(root_.get(), 0, treeDepth, leaves, nodes);

    // 可能在多个 OpenMP 线程中同时训练
    #pragma omp critical(progress_output)
    {
        std::cout << "Tree [" << targetName(target_) << "] trained on "
                  << records.size() << " records | Depth: " << treeDepth
                  << " | Leaves: " << leaves
                  << " | Time: " << totalTime.count() << "ms" << std::endl;
    }
}

void SingleTargetTreeTrainer::splitNode(Node* node,
                                        const std::vector<Record>& records,
                                        const std::vector<int>& indices,
                                        const std::vector<Attribute>& attributes,
                                        int depth) {
    node->samples = indices.size();

    if (indices.empty()) {
        node->makeLeaf(kUnknown);
        return;
    }

    const auto counts = EntropyCriterion::classCounts(records, indices, target_);
    const std::string majority = majorityOf(counts);

    // **深度/样本数剪枝优先于纯度检查**
    if (depth >= params_.maxDepth ||
        indices.size() < static_cast<size_t>(params_.minSamplesLeaf)) {
        node->makeLeaf(majority);
        return;
    }

    if (counts.size() == 1) {
        node->makeLeaf(counts.begin()->first);
        return;
    }

    if (attributes.empty()) {
        node->makeLeaf(majority);
        return;
    }

    node->metric = criterion_->nodeMetric(records, indices, target_);

    auto [bestPos, bestRatio] =
        finder_->findBestSplit(records, indices, attributes, target_,
                               node->metric, *criterion_);

    if (bestPos < 0 || bestRatio < params_.minGainRatio) {
        node->makeLeaf(majority);
        return;
    }

    const Attribute chosen = attributes[bestPos];
    const auto parts = GainRatioSplitFinder::partition(records, indices, chosen);

    // 所有记录在该属性上都缺失
    if (parts.empty()) {
        node->makeLeaf(majority);
        return;
    }

    std::vector<Attribute> remaining;
    remaining.reserve(attributes.size() - 1);
    std::copy_if(attributes.begin(), attributes.end(), std::back_inserter(remaining),
                 [chosen](Attribute a) { return a != chosen; });

    node->makeBranch(chosen, majority);

    for (const auto& kv : parts) {
        Node* child = node->addChild(kv.first);
        if (kv.second.size() < static_cast<size_t>(params_.minSamplesLeaf)) {
            // 小分区使用父节点的多数类
            child->samples = kv.second.size();
            child->makeLeaf(majority);
        } else {
            splitNode(child, records, kv.second, remaining, depth + 1);
        }
    }
}

const Node* SingleTargetTreeTrainer::findChild(const Node& node, const std::string& key) {
    if (const Node* exact = node.getChild(key)) return exact;
    for (const auto& kv : node.children) {
        if (equalsIgnoreCase(kv.first, key)) return kv.second.get();
    }
    return nullptr;
}

std::optional<std::string> SingleTargetTreeTrainer::predict(const Record& record) const {
    if (!root_) return std::nullopt;

    const Node* cur = root_.get();
    while (!cur->isLeaf) {
        const auto& raw = record.attribute(cur->getAttribute());
        const Node* next = findChild(*cur, raw ? *raw : std::string(kMissing));
        if (!next) return cur->getMajority();
        cur = next;
    }
    return cur->getPrediction();
}

double SingleTargetTreeTrainer::evaluate(const std::vector<Record>& records,
                                         size_t& scored) const {
    const long n = static_cast<long>(records.size());
    long correct = 0;
    long counted = 0;

    #pragma omp parallel for reduction(+:correct,counted) schedule(static, 256) if(n > 1000)
    for (long i = 0; i < n; ++i) {
        const auto& truth = records[i].target(target_);
        if (!truth) continue;
        ++counted;
        const auto pred = predict(records[i]);
        if (pred && *pred == *truth) ++correct;
    }

    scored = static_cast<size_t>(counted);
    return counted > 0 ? static_cast<double>(correct) / counted : 0.0;
}

std::string SingleTargetTreeTrainer::majorityClass(const std::vector<Record>& records,
                                                   const std::vector<int>& indices,
                                                   TargetField target) {
    return majorityOf(EntropyCriterion::classCounts(records, indices, target));
}

int SingleTargetTreeTrainer::depth() const {
    int treeDepth = 0, leaves = 0;
    size_t nodes = 0;
    calculateTreeStats(root_.get(), 0, treeDepth, leaves, nodes);
    return treeDepth;
}

int SingleTargetTreeTrainer::leafCount() const {
    int treeDepth = 0, leaves = 0;
    size_t nodes = 0;
    calculateTreeStats(root_.get(), 0, treeDepth, leaves, nodes);
    return leaves;
}

size_t SingleTargetTreeTrainer::nodeCount() const {
    int treeDepth = 0, leaves = 0;
    size_t nodes = 0;
    calculateTreeStats(root_.get(), 0, treeDepth, leaves, nodes);
    return nodes;
}

void SingleTargetTreeTrainer::calculateTreeStats(const Node* node, int currentDepth,
                                                 int& maxDepth, int& leafCount,
                                                 size_t& nodeCount) const {
    if (!node) return;

    maxDepth = std::max(maxDepth, currentDepth);
    ++nodeCount;

    if (node->isLeaf) {
        leafCount++;
    } else {
        for (const auto& kv : node->children) {
            calculateTreeStats(kv.second.get(), currentDepth + 1,
                               maxDepth, leafCount, nodeCount);
        }
    }
}

void SingleTargetTreeTrainer::printTree(std::ostream& os) const {
    os << targetName(target_) << std::endl;
    if (!root_) {
        os << "  (untrained)" << std::endl;
        return;
    }
    printNode(os, root_.get(), 1);
}

void SingleTargetTreeTrainer::printNode(std::ostream& os, const Node* node, int indent) const {
    const std::string pad(indent * 2, ' ');
    if (node->isLeaf) {
        os << pad << "-> " << node->getPrediction()
           << " (n=" << node->samples << ")" << std::endl;
        return;
    }

    os << pad << "[" << attributeName(node->getAttribute()) << "] majority: "
       << node->getMajority() << " (n=" << node->samples << ")" << std::endl;
    for (const auto& kv : node->children) {
        os << pad << "  = " << kv.first << std::endl;
        printNode(os, kv.second.get(), indent + 2);
    }
}
