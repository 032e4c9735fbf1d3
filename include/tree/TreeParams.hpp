#ifndef TREE_PARAMS_HPP
#define TREE_PARAMS_HPP

/** 建树参数，建树开始后不再修改 */
struct TreeParams {
    int    maxDepth       = 10;   // 最大深度（根节点深度为 0）
    int    minSamplesLeaf = 2;    // 节点样本数低于此值时不再分裂
    double minGainRatio   = 0.0;  // 接受划分所需的最小信息增益率
};

#endif // TREE_PARAMS_HPP
