#ifndef PIPELINE_DATASPLIT_HPP
#define PIPELINE_DATASPLIT_HPP

#include "data/Record.hpp"
#include <vector>

struct DataParams {
    std::vector<Record> train;
    std::vector<Record> test;
};

/**
 * 按顺序划分：前 trainRatio 的记录为训练集，其余为测试集
 * trainRatio 须在 (0, 1] 内，否则返回 false
 */
bool splitDataset(const std::vector<Record>& records,
                  double trainRatio,
                  DataParams& out);

#endif // PIPELINE_DATASPLIT_HPP
