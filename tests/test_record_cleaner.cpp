#include <gtest/gtest.h>
#include "preprocessing/RecordCleaner.hpp"
#include "pipeline/DataSplit.hpp"
#include "TestRecords.hpp"

using preprocessing::RecordCleaner;

TEST(RecordCleanerTest, NormalizeValue) {
    EXPECT_EQ(RecordCleaner::normalizeValue(std::string("  Level 4 "), true), "level 4");
    EXPECT_EQ(RecordCleaner::normalizeValue(std::string("  Malaria "), false), "Malaria");
    EXPECT_FALSE(RecordCleaner::normalizeValue(std::string("   "), true).has_value());
    EXPECT_FALSE(RecordCleaner::normalizeValue(std::nullopt, false).has_value());
}

TEST(RecordCleanerTest, LowerCasesAttributesOnly) {
    Record r = makeRecord({{Attribute::County, " Nairobi "}, {Attribute::ClinicalPanel, "PANEL A"}},
                          {{TargetField::Clinician, " Malaria "}, {TargetField::DdxSnomed, ""}});
    r.prompt = "  Fever ";

    const Record n = RecordCleaner::normalize(r);
    EXPECT_EQ(n.county, "nairobi");
    EXPECT_EQ(n.clinicalPanel, "panel a");
    EXPECT_FALSE(n.healthLevel.has_value());
    EXPECT_EQ(n.clinician, "Malaria");
    EXPECT_FALSE(n.ddxSnomed.has_value());
    EXPECT_EQ(n.prompt, "Fever");
}

TEST(RecordCleanerTest, DeduplicateKeepsFirstOccurrence) {
    Record first = makeRecord({{Attribute::County, "a"}}, {{TargetField::Clinician, "X"}});
    first.masterIndex = "1";
    Record dup = first;
    dup.masterIndex = "2";
    Record other = makeRecord({{Attribute::County, "a"}}, {{TargetField::Clinician, "Y"}});

    size_t removed = 0;
    const auto unique = RecordCleaner::deduplicate({first, dup, other, dup}, removed);
    ASSERT_EQ(unique.size(), 2u);
    EXPECT_EQ(removed, 2u);
    EXPECT_EQ(unique[0].masterIndex, "1");
    EXPECT_EQ(unique[1].clinician, "Y");
}

TEST(RecordCleanerTest, CleanMergesRecordsThatDifferOnlyInCase) {
    const auto cleaned = RecordCleaner::clean({
        makeRecord({{Attribute::County, "Nairobi "}}, {{TargetField::Clinician, "X"}}),
        makeRecord({{Attribute::County, "nairobi"}}, {{TargetField::Clinician, "X"}}),
        makeRecord({{Attribute::County, "nairobi"}}, {{TargetField::Clinician, "x"}})
    });
    ASSERT_EQ(cleaned.size(), 2u);
    EXPECT_EQ(cleaned[0].county, "nairobi");
    EXPECT_EQ(cleaned[1].clinician, "x");
}

TEST(DataSplitTest, SplitsHeadAndTail) {
    std::vector<Record> records(10);
    for (size_t i = 0; i < records.size(); ++i) records[i].masterIndex = std::to_string(i);

    DataParams dp;
    ASSERT_TRUE(splitDataset(records, 0.8, dp));
    ASSERT_EQ(dp.train.size(), 8u);
    ASSERT_EQ(dp.test.size(), 2u);
    EXPECT_EQ(dp.train.front().masterIndex, "0");
    EXPECT_EQ(dp.test.front().masterIndex, "8");
}

TEST(DataSplitTest, KeepsAtLeastOneTrainingRecord) {
    std::vector<Record> records(3);
    DataParams dp;
    ASSERT_TRUE(splitDataset(records, 0.1, dp));
    EXPECT_EQ(dp.train.size(), 1u);
    EXPECT_EQ(dp.test.size(), 2u);
}

TEST(DataSplitTest, RejectsInvalidRatio) {
    std::vector<Record> records(3);
    DataParams dp;
    EXPECT_FALSE(splitDataset(records, 0.0, dp));
    EXPECT_FALSE(splitDataset(records, 1.5, dp));
}
