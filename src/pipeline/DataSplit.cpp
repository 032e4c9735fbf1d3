#include "pipeline/DataSplit.hpp"
#include <algorithm>
#include <iostream>

bool splitDataset(const std::vector<Record>& records,
                  double trainRatio,
                  DataParams& out) {
    if (!(trainRatio > 0.0 && trainRatio <= 1.0)) {
        std::cerr << "Error: train ratio must be in (0, 1], got " << trainRatio << std::endl;
        return false;
    }

    size_t trainRows = static_cast<size_t>(records.size() * trainRatio);
    // 至少保留一条训练记录
    if (trainRows == 0 && !records.empty()) trainRows = 1;
    trainRows = std::min(trainRows, records.size());

    out.train.assign(records.begin(), records.begin() + trainRows);
    out.test.assign(records.begin() + trainRows, records.end());
    return true;
}
