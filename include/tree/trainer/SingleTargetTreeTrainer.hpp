// include/tree/trainer/SingleTargetTreeTrainer.hpp
#ifndef TREE_SINGLE_TARGET_TRAINER_HPP
#define TREE_SINGLE_TARGET_TRAINER_HPP

#include "../ISplitFinder.hpp"
#include "../ISplitCriterion.hpp"
#include "../Node.hpp"
#include "../TreeParams.hpp"
#include "../../data/Record.hpp"
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

/** 单目标分类树：为一个 TargetField 建树并按遍历预测 */
class SingleTargetTreeTrainer {
public:
    static constexpr const char* kUnknown = "unknown";   // 空集叶子
    static constexpr const char* kMissing = "missing";   // 预测时属性缺失的哨兵值

    SingleTargetTreeTrainer(std::unique_ptr<ISplitFinder>    finder,
                            std::unique_ptr<ISplitCriterion> criterion,
                            TargetField target,
                            const TreeParams& params);

    void train(const std::vector<Record>& records);

    /** 未训练时返回 std::nullopt，否则总能得到一个值 */
    std::optional<std::string> predict(const Record& record) const;

    /**
     * 在带标签数据上计算准确率，目标缺失的记录不计分
     * @param scored 输出：参与计分的记录数
     */
    double evaluate(const std::vector<Record>& records, size_t& scored) const;

    const Node* getRoot() const { return root_.get(); }
    TargetField target() const { return target_; }
    const TreeParams& params() const { return params_; }

    int    depth() const;
    int    leafCount() const;
    size_t nodeCount() const;

    void printTree(std::ostream& os) const;

    /** 出现次数最多的目标值；次数相同取字典序最小；无目标值时为 "unknown" */
    static std::string majorityClass(const std::vector<Record>& records,
                                     const std::vector<int>& indices,
                                     TargetField target);

    /** 先精确匹配，再按 ASCII 忽略大小写匹配子节点 */
    static const Node* findChild(const Node& node, const std::string& key);

private:
    void splitNode(Node* node,
                   const std::vector<Record>& records,
                   const std::vector<int>& indices,
                   const std::vector<Attribute>& attributes,
                   int depth);

    void calculateTreeStats(const Node* node,
                            int currentDepth,
                            int& maxDepth,
                            int& leafCount,
                            size_t& nodeCount) const;

    void printNode(std::ostream& os, const Node* node, int indent) const;

    TargetField target_;
    TreeParams  params_;
    std::unique_ptr<ISplitFinder>    finder_;
    std::unique_ptr<ISplitCriterion> criterion_;
    std::unique_ptr<Node>            root_;
};

#endif // TREE_SINGLE_TARGET_TRAINER_HPP
