// =============================================================================
// include/data/Record.hpp - 分类记录数据模型
// =============================================================================
#ifndef DATA_RECORD_HPP
#define DATA_RECORD_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string>

/** 可用于划分的属性（按属性名字典序排列） */
enum class Attribute {
    ClinicalPanel,
    County,
    HealthLevel,
    YearsExperience
};

/** 预测目标字段 */
enum class TargetField {
    Clinician,
    Gpt4_0,
    Llama,
    Gemini,
    DdxSnomed
};

constexpr std::size_t kNumAttributes = 4;
constexpr std::size_t kNumTargets    = 5;

/** 一行数据，所有字段可缺失（std::nullopt 表示缺失，而不是空字符串） */
struct Record {
    std::optional<std::string> masterIndex;
    std::optional<std::string> county;
    std::optional<std::string> healthLevel;
    std::optional<std::string> yearsExperience;
    std::optional<std::string> prompt;
    std::optional<std::string> nursingCompetency;
    std::optional<std::string> clinicalPanel;

    // 目标字段
    std::optional<std::string> clinician;
    std::optional<std::string> gpt4_0;
    std::optional<std::string> llama;
    std::optional<std::string> gemini;
    std::optional<std::string> ddxSnomed;

    const std::optional<std::string>& attribute(Attribute a) const;
    const std::optional<std::string>& target(TargetField t) const;

    std::optional<std::string>& attribute(Attribute a);
    std::optional<std::string>& target(TargetField t);
};

/** 固定的属性评估顺序，保证平局时结果可复现 */
const std::array<Attribute, kNumAttributes>& allAttributes();
const std::array<TargetField, kNumTargets>& allTargets();

const char* attributeName(Attribute a);
const char* targetName(TargetField t);

// 原始 CSV 表头
const char* attributeColumn(Attribute a);
const char* targetColumn(TargetField t);

#endif // DATA_RECORD_HPP
