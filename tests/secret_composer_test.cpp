#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "pwgen/class_pool.hpp"
#include "pwgen/entropy_source.hpp"
#include "pwgen/generator_options.hpp"
#include "pwgen/secret_composer.hpp"
#include "test_entropy_sources.hpp"

using pwgen::ClassPool;
using pwgen::GeneratorOptions;
using pwgen::PwgenStatus;
using pwgen::SecretComposer;
using pwgen::test::FailingEntropySource;
using pwgen::test::ScriptedEntropySource;

namespace {

ClassPool LowerAndNumberPool(const int min_lower, const int min_number) {
    GeneratorOptions opts;
    opts.use_upper = false;
    opts.use_symbol = false;
    opts.min_lower = min_lower;
    opts.min_number = min_number;
    ClassPool pool;
    EXPECT_EQ(ClassPool::Build(opts, pool), PwgenStatus::Ok);
    return pool;
}

}  // namespace

TEST(SecretComposerTest, DrawsMinimaInPoolOrderThenFillsFromFlattenedPool) {
    const ClassPool pool = LowerAndNumberPool(2, 1);
    ScriptedEntropySource rng({0, 25, 3, 26, 1});

    std::string sequence;
    ASSERT_EQ(SecretComposer::Compose(5, pool, rng, sequence), PwgenStatus::Ok);
    EXPECT_EQ(sequence, "az30b");
    EXPECT_EQ(rng.bounds, (std::vector<std::uint32_t>{26, 26, 10, 36, 36}));
}

TEST(SecretComposerTest, MinimaExceedingLengthIsRejected) {
    const ClassPool pool = LowerAndNumberPool(4, 3);
    ScriptedEntropySource rng;

    std::string sequence = "stale";
    EXPECT_EQ(SecretComposer::Compose(6, pool, rng, sequence), PwgenStatus::MinimaExceedLength);
    EXPECT_TRUE(sequence.empty());
    EXPECT_TRUE(rng.bounds.empty());
}

TEST(SecretComposerTest, MinimaEqualToLengthNeedsNoFill) {
    const ClassPool pool = LowerAndNumberPool(4, 3);
    ScriptedEntropySource rng;

    std::string sequence;
    ASSERT_EQ(SecretComposer::Compose(7, pool, rng, sequence), PwgenStatus::Ok);
    EXPECT_EQ(sequence, "aaaa000");
    EXPECT_EQ(std::count(rng.bounds.begin(), rng.bounds.end(), 36U), 0);
}

TEST(SecretComposerTest, EntropyFailureLeavesNoOutput) {
    const ClassPool pool = LowerAndNumberPool(1, 1);
    FailingEntropySource rng(3);

    std::string sequence;
    EXPECT_EQ(SecretComposer::Compose(8, pool, rng, sequence), PwgenStatus::EntropySourceFailure);
    EXPECT_TRUE(sequence.empty());
}

TEST(SecretComposerTest, ShufflePerformsFisherYatesSwaps) {
    ScriptedEntropySource rng({0, 2, 0});

    std::string sequence = "abcd";
    ASSERT_EQ(SecretComposer::Shuffle(sequence, rng), PwgenStatus::Ok);
    EXPECT_EQ(sequence, "bdca");
    EXPECT_EQ(rng.bounds, (std::vector<std::uint32_t>{4, 3, 2}));
}

TEST(SecretComposerTest, ShuffleOfShortSequencesDrawsNothing) {
    ScriptedEntropySource rng;
    std::string empty;
    std::string single = "x";
    EXPECT_EQ(SecretComposer::Shuffle(empty, rng), PwgenStatus::Ok);
    EXPECT_EQ(SecretComposer::Shuffle(single, rng), PwgenStatus::Ok);
    EXPECT_EQ(single, "x");
    EXPECT_TRUE(rng.bounds.empty());
}

TEST(SecretComposerTest, ShufflePreservesCharacterMultiset) {
    pwgen::PwgenStatus status = PwgenStatus::Ok;
    const std::unique_ptr<pwgen::IEntropySource> rng = pwgen::EntropyFactory::CreateSystem(status);
    ASSERT_EQ(status, PwgenStatus::Ok);

    const std::string original = "aaabbbccc123!!ZZ";
    std::string shuffled = original;
    ASSERT_EQ(SecretComposer::Shuffle(shuffled, *rng), PwgenStatus::Ok);

    std::string lhs = original;
    std::string rhs = shuffled;
    std::sort(lhs.begin(), lhs.end());
    std::sort(rhs.begin(), rhs.end());
    EXPECT_EQ(lhs, rhs);
}

TEST(SecretComposerTest, ShuffleFailureWipesSequence) {
    FailingEntropySource rng(1);
    std::string sequence = "abcdef";
    EXPECT_EQ(SecretComposer::Shuffle(sequence, rng), PwgenStatus::EntropySourceFailure);
    EXPECT_TRUE(sequence.empty());
}

TEST(SecretComposerTest, FormatSegmentsKeepsOrder) {
    std::string key;
    ASSERT_EQ(SecretComposer::FormatSegments("abcdefghijklmno", 3, 5, key), PwgenStatus::Ok);
    EXPECT_EQ(key, "abcde-fghij-klmno");

    ASSERT_EQ(SecretComposer::FormatSegments("abc", 1, 3, key), PwgenStatus::Ok);
    EXPECT_EQ(key, "abc");

    ASSERT_EQ(SecretComposer::FormatSegments("abcd", 4, 1, key), PwgenStatus::Ok);
    EXPECT_EQ(key, "a-b-c-d");
}

TEST(SecretComposerTest, FormatSegmentsValidatesShape) {
    std::string key;
    EXPECT_EQ(SecretComposer::FormatSegments("abcd", 0, 4, key), PwgenStatus::InvalidSegmentCount);
    EXPECT_EQ(SecretComposer::FormatSegments("abcd", -1, 4, key), PwgenStatus::InvalidSegmentCount);
    EXPECT_EQ(SecretComposer::FormatSegments("abcd", 1, 0, key), PwgenStatus::InvalidSegmentLength);
    EXPECT_EQ(SecretComposer::FormatSegments("abcde", 2, 2, key), PwgenStatus::InvalidLength);
    EXPECT_TRUE(key.empty());
}
