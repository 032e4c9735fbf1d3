#ifndef APP_DIAGNOSIS_APP_HPP
#define APP_DIAGNOSIS_APP_HPP
#include <string>

/** 运行参数 */
struct ProgramOptions {
    std::string trainPath;       // 训练 CSV 路径
    std::string testPath;        // 测试 CSV 路径，为空时从训练集中划分
    std::string outputPath;      // 预测结果输出路径
    int         maxDepth;        // 树最大深度
    int         minSamplesLeaf;  // 继续分裂所需的最小样本数
    double      minGainRatio;    // 最小信息增益率
    double      trainRatio;      // 无测试文件时训练集比例
    bool        printTrees;      // 是否打印树结构
};

/** 参数非法时抛出 std::invalid_argument */
void validateOptions(const ProgramOptions& opts);

/** 训练五棵目标树，评估并写出预测结果 */
void runDiagnosisApp(const ProgramOptions& opts);

#endif // APP_DIAGNOSIS_APP_HPP
