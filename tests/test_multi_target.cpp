#include <gtest/gtest.h>
#include "ensemble/MultiTargetPredictor.hpp"
#include "TestRecords.hpp"

namespace {

TreeParams defaultParams() {
    TreeParams p;
    p.maxDepth       = 4;
    p.minSamplesLeaf = 2;
    p.minGainRatio   = 0.0;
    return p;
}

// 每个目标字段标签不同，clinician / gpt4_0 随 clinical_panel 变化
std::vector<Record> trainingSet() {
    auto make = [](const char* panel, const char* county,
                   const char* clinician, const char* gpt, const char* llama,
                   const char* gemini, const char* ddx) {
        return makeRecord({{Attribute::ClinicalPanel, panel}, {Attribute::County, county}},
                          {{TargetField::Clinician, clinician},
                           {TargetField::Gpt4_0, gpt},
                           {TargetField::Llama, llama},
                           {TargetField::Gemini, gemini},
                           {TargetField::DdxSnomed, ddx}});
    };
    return {
        make("A", "c1", "X", "malaria", "l1", "g1", "111"),
        make("A", "c2", "X", "malaria", "l1", "g2", "111"),
        make("B", "c1", "Y", "typhoid", "l1", "g1", "222"),
        make("B", "c2", "Y", "typhoid", "l2", "g2", "222")
    };
}

} // namespace

TEST(MultiTargetTest, UntrainedPredictorReturnsAbsentFields) {
    MultiTargetPredictor predictor(defaultParams());
    const auto p = predictor.predict(Record{});
    for (TargetField t : allTargets()) {
        EXPECT_FALSE(p.get(t).has_value()) << targetName(t);
    }
}

TEST(MultiTargetTest, BuildsOneTreePerTarget) {
    auto predictor = MultiTargetPredictor::build(trainingSet(), defaultParams());
    for (TargetField t : allTargets()) {
        EXPECT_EQ(predictor.tree(t).target(), t);
        EXPECT_NE(predictor.tree(t).getRoot(), nullptr);
    }
}

TEST(MultiTargetTest, PredictsEveryTarget) {
    auto predictor = MultiTargetPredictor::build(trainingSet(), defaultParams());
    const auto p = predictor.predict(
        makeRecord({{Attribute::ClinicalPanel, "a"}, {Attribute::County, "c1"}}, {}));

    EXPECT_EQ(p.clinician, "X");
    EXPECT_EQ(p.gpt4_0, "malaria");
    EXPECT_EQ(p.ddxSnomed, "111");
    EXPECT_EQ(p.gemini, "g1");
    EXPECT_TRUE(p.llama.has_value());
}

TEST(MultiTargetTest, ClinicalPanelExampleEndToEnd) {
    auto predictor = MultiTargetPredictor::build(panelExample(), defaultParams());
    EXPECT_EQ(predictor.predict(makeRecord({{Attribute::ClinicalPanel, "a"}}, {})).clinician, "X");
    EXPECT_EQ(predictor.predict(makeRecord({{Attribute::ClinicalPanel, "B"}}, {})).clinician, "Y");
    // 其他目标在训练集中全部缺失
    EXPECT_EQ(predictor.predict(Record{}).gemini, "unknown");
}

TEST(MultiTargetTest, AllMissingRecordGetsRootMajorityForEveryTarget) {
    const auto records = trainingSet();
    auto predictor = MultiTargetPredictor::build(records, defaultParams());
    const auto p = predictor.predict(Record{});

    for (TargetField t : allTargets()) {
        const Node* root = predictor.tree(t).getRoot();
        ASSERT_NE(root, nullptr);
        ASSERT_TRUE(p.get(t).has_value()) << targetName(t);
        EXPECT_EQ(*p.get(t), root->value) << targetName(t);
    }
    EXPECT_EQ(p.clinician, "X");
    EXPECT_EQ(p.gpt4_0, "malaria");
}

TEST(MultiTargetTest, EmptyTrainingSetPredictsUnknown) {
    auto predictor = MultiTargetPredictor::build({}, defaultParams());
    const auto p = predictor.predict(trainingSet().front());
    for (TargetField t : allTargets()) {
        EXPECT_EQ(p.get(t), "unknown") << targetName(t);
    }
}

TEST(MultiTargetTest, PredictAllMatchesPredict) {
    const auto records = trainingSet();
    auto predictor = MultiTargetPredictor::build(records, defaultParams());
    const auto all = predictor.predictAll(records);
    ASSERT_EQ(all.size(), records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        const auto single = predictor.predict(records[i]);
        for (TargetField t : allTargets()) {
            EXPECT_EQ(all[i].get(t), single.get(t));
        }
    }
}

TEST(MultiTargetTest, EvaluateReportsPerTargetAccuracy) {
    auto records = trainingSet();
    records.push_back(makeRecord({{Attribute::ClinicalPanel, "A"}}, {{TargetField::Clinician, "X"}}));
    auto predictor = MultiTargetPredictor::build(records, defaultParams());

    std::array<size_t, kNumTargets> scored{};
    const auto acc = predictor.evaluate(records, scored);

    const auto clinician = static_cast<size_t>(TargetField::Clinician);
    const auto gpt = static_cast<size_t>(TargetField::Gpt4_0);
    EXPECT_EQ(scored[clinician], 5u);
    EXPECT_EQ(scored[gpt], 4u);
    EXPECT_DOUBLE_EQ(acc[clinician], 1.0);
    EXPECT_DOUBLE_EQ(acc[gpt], 1.0);
}
