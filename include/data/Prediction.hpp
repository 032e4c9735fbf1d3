// =============================================================================
// include/data/Prediction.hpp - 多目标预测结果
// =============================================================================
#ifndef DATA_PREDICTION_HPP
#define DATA_PREDICTION_HPP

#include "data/Record.hpp"
#include <optional>
#include <string>

/** 一次预测的结果：每个目标字段一个值 */
struct Prediction {
    std::optional<std::string> clinician;
    std::optional<std::string> gpt4_0;
    std::optional<std::string> llama;
    std::optional<std::string> gemini;
    std::optional<std::string> ddxSnomed;

    const std::optional<std::string>& get(TargetField t) const;
    std::optional<std::string>& get(TargetField t);
};

#endif // DATA_PREDICTION_HPP
