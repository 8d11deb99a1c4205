// tests/test_classifier.cpp
// Tests for disk image classification

#include <gtest/gtest.h>
#include "vdalign/classifier.hpp"
#include "vdalign/errors.hpp"
#include <vector>

using namespace vdalign;

class ClassifierTest : public ::testing::Test {
protected:
    // Managed family: SLHS images; current build: date token 230401
    const std::string all_pattern = "^XDP\\d{2}SLHS-\\d{6}\\.vhd$";
    const std::string target_pattern = "SLHS-230401\\.vhd$";
};

TEST_F(ClassifierTest, TestUnsetIdentifierIsUnknown) {
    PatternClassifier classifier(all_pattern, target_pattern);
    EXPECT_EQ(classifier.classify(std::nullopt), UpdateStatus::UNKNOWN);
    EXPECT_EQ(classify(std::nullopt, "anything", "else"), UpdateStatus::UNKNOWN);
}

TEST_F(ClassifierTest, TestUnsetIdentifierSkipsPatternCompilation) {
    EXPECT_EQ(classify(std::nullopt, "", ""), UpdateStatus::UNKNOWN);
    EXPECT_EQ(classify(std::nullopt, "(", "x"), UpdateStatus::UNKNOWN);
    EXPECT_NO_THROW(classify(std::nullopt, "[unterminated", "("));

    EXPECT_THROW(classify(std::string("XDP01SLHS-000000.vhd"), "(", "x"), ConfigError);
}

TEST_F(ClassifierTest, TestCurrentImageIsUpdateCompleted) {
    PatternClassifier classifier(all_pattern, target_pattern);
    EXPECT_EQ(classifier.classify(std::string("XDP07SLHS-230401.vhd")), UpdateStatus::UPDATE_COMPLETED);
}

TEST_F(ClassifierTest, TestStaleImageIsRestartRequired) {
    PatternClassifier classifier(all_pattern, target_pattern);
    EXPECT_EQ(classifier.classify(std::string("XDP07SLHS-230115.vhd")), UpdateStatus::RESTART_REQUIRED);
}

TEST_F(ClassifierTest, TestUnrelatedImageIsIneligible) {
    PatternClassifier classifier(all_pattern, target_pattern);
    EXPECT_EQ(classifier.classify(std::string("ZZZ-unrelated.vhd")), UpdateStatus::INELIGIBLE);
    // Matches the target pattern but not the family
    EXPECT_EQ(classifier.classify(std::string("OTHER-SLHS-230401.vhd")), UpdateStatus::INELIGIBLE);
}

TEST_F(ClassifierTest, TestMatchingIsCaseInsensitive) {
    PatternClassifier classifier(all_pattern, target_pattern);
    EXPECT_EQ(classifier.classify(std::string("xdp07slhs-230401.VHD")), UpdateStatus::UPDATE_COMPLETED);
}

TEST_F(ClassifierTest, TestUnanchoredPatternsMatchAnywhere) {
    PatternClassifier classifier("SLHS", "230401");
    EXPECT_EQ(classifier.classify(std::string("XDP07SLHS-230401.vhd")), UpdateStatus::UPDATE_COMPLETED);
    EXPECT_EQ(classifier.classify(std::string("XDP07SLHS-221201.vhd")), UpdateStatus::RESTART_REQUIRED);
    EXPECT_EQ(classifier.classify(std::string("")), UpdateStatus::INELIGIBLE);
}

TEST_F(ClassifierTest, TestInvalidPatternThrows) {
    try {
        PatternClassifier classifier("XDP(", target_pattern);
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_PATTERN);
        EXPECT_EQ(e.field(), "all_versions_pattern");
    }
    EXPECT_THROW(PatternClassifier(all_pattern, ""), ConfigError);
}

TEST_F(ClassifierTest, TestClassificationIsDeterministic) {
    PatternClassifier classifier(all_pattern, target_pattern);
    const std::vector<DiskImageId> inputs = {
        std::nullopt,
        std::string("XDP07SLHS-230401.vhd"),
        std::string("XDP07SLHS-230115.vhd"),
        std::string("ZZZ-unrelated.vhd"),
        std::string(""),
    };

    for (const auto& input : inputs) {
        UpdateStatus first = classifier.classify(input);
        for (int i = 0; i < 5; ++i) {
            EXPECT_EQ(classifier.classify(input), first);
            EXPECT_EQ(classify(input, all_pattern, target_pattern), first);
        }
    }
}

TEST_F(ClassifierTest, TestPatternAccessors) {
    PatternClassifier classifier(all_pattern, target_pattern);
    EXPECT_EQ(classifier.all_versions_pattern(), all_pattern);
    EXPECT_EQ(classifier.target_version_pattern(), target_pattern);
    EXPECT_TRUE(classifier.is_managed("XDP01SLHS-000000.vhd"));
    EXPECT_FALSE(classifier.is_target("XDP01SLHS-000000.vhd"));
}
