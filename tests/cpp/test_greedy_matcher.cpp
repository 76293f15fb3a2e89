#include <gtest/gtest.h>

#include <limits>
#include <vector>

#include "deteval/eval/ClassPartitioner.hpp"
#include "deteval/eval/EvalError.hpp"
#include "deteval/eval/GreedyMatcher.hpp"

using deteval::eval::Box;
using deteval::eval::ClassPartitioner;
using deteval::eval::ClassSlice;
using deteval::eval::GreedyMatcher;
using deteval::eval::ImageRecord;
using deteval::eval::MatchResult;
using deteval::eval::OverlapFunction;

namespace {

// Overlap function that ignores geometry and returns a fixed matrix.
OverlapFunction fixedOverlaps(cv::Mat1d m) {
    return [m](const std::vector<Box>&, const std::vector<Box>&) { return m.clone(); };
}

ClassSlice makeSlice(const std::vector<double>& scores, size_t num_gt) {
    ClassSlice slice;
    for (size_t i = 0; i < scores.size(); ++i) {
        slice.detection_boxes.emplace_back(static_cast<double>(i), 0.0, 1.0, 1.0);
        slice.detection_scores.push_back(scores[i]);
    }
    for (size_t j = 0; j < num_gt; ++j) {
        slice.ground_truth_boxes.emplace_back(static_cast<double>(j), 0.0, 1.0, 1.0);
    }
    return slice;
}

}  // namespace

TEST(ClassPartitionerTest, SelectsOnlyTargetClassInOrder) {
    ImageRecord image;
    image.detections.boxes = {Box(0, 0, 1, 1), Box(1, 0, 1, 1), Box(2, 0, 1, 1)};
    image.detections.scores = {0.1, 0.9, 0.5};
    image.detections.labels = {1, 0, 1};
    image.ground_truth.boxes = {Box(5, 5, 1, 1), Box(6, 6, 1, 1)};
    image.ground_truth.labels = {0, 0};

    const ClassSlice c1 = ClassPartitioner::partition(image, 1);
    ASSERT_EQ(c1.detection_scores.size(), 2u);
    EXPECT_DOUBLE_EQ(c1.detection_scores[0], 0.1);
    EXPECT_DOUBLE_EQ(c1.detection_scores[1], 0.5);
    EXPECT_DOUBLE_EQ(c1.detection_boxes[1].x, 2.0);
    EXPECT_TRUE(c1.ground_truth_boxes.empty());

    const ClassSlice c0 = ClassPartitioner::partition(image, 0);
    ASSERT_EQ(c0.detection_scores.size(), 1u);
    EXPECT_EQ(c0.ground_truth_boxes.size(), 2u);

    const ClassSlice c2 = ClassPartitioner::partition(image, 2);
    EXPECT_TRUE(c2.detection_boxes.empty());
    EXPECT_TRUE(c2.ground_truth_boxes.empty());
}

TEST(GreedyMatcherTest, NoGroundTruthMakesEveryDetectionFalsePositive) {
    GreedyMatcher matcher(0.5, fixedOverlaps(cv::Mat1d()));
    const MatchResult r = matcher.match(makeSlice({0.2, 0.8, 0.5}, 0));

    ASSERT_EQ(r.true_positive.size(), 3u);
    for (bool tp : r.true_positive) EXPECT_FALSE(tp);
    EXPECT_EQ(r.num_ground_truth, 0);
    // Scores come back ranked.
    EXPECT_DOUBLE_EQ(r.scores[0], 0.8);
    EXPECT_DOUBLE_EQ(r.scores[1], 0.5);
    EXPECT_DOUBLE_EQ(r.scores[2], 0.2);
}

TEST(GreedyMatcherTest, NoDetections) {
    GreedyMatcher matcher;
    const MatchResult r = matcher.match(makeSlice({}, 2));
    EXPECT_TRUE(r.true_positive.empty());
    EXPECT_TRUE(r.scores.empty());
    EXPECT_EQ(r.num_ground_truth, 2);
}

TEST(GreedyMatcherTest, HigherScoreClaimsSharedGroundTruth) {
    // Detection 0 (score 0.8) and 1 (score 0.9) both overlap gt 0 only.
    cv::Mat1d m = (cv::Mat1d(2, 2) << 0.9, 0.0,
                                      0.9, 0.0);
    GreedyMatcher matcher(0.5, fixedOverlaps(m));
    const MatchResult r = matcher.match(makeSlice({0.8, 0.9}, 2));

    ASSERT_EQ(r.true_positive.size(), 2u);
    EXPECT_DOUBLE_EQ(r.scores[0], 0.9);
    EXPECT_TRUE(r.true_positive[0]);
    EXPECT_DOUBLE_EQ(r.scores[1], 0.8);
    EXPECT_FALSE(r.true_positive[1]);
}

TEST(GreedyMatcherTest, OnlyBestOverlapIsConsidered) {
    // Detection 1 prefers gt 0 (0.8) which detection 0 already took, even
    // though gt 1 (0.7) is still free and above threshold.
    cv::Mat1d m = (cv::Mat1d(2, 2) << 0.95, 0.1,
                                      0.8,  0.7);
    GreedyMatcher matcher(0.5, fixedOverlaps(m));
    const MatchResult r = matcher.match(makeSlice({0.9, 0.6}, 2));

    EXPECT_TRUE(r.true_positive[0]);
    EXPECT_FALSE(r.true_positive[1]);
}

TEST(GreedyMatcherTest, ThresholdIsInclusive) {
    cv::Mat1d m = (cv::Mat1d(1, 1) << 0.5);
    EXPECT_TRUE(GreedyMatcher(0.5, fixedOverlaps(m)).match(makeSlice({0.3}, 1)).true_positive[0]);

    cv::Mat1d below = (cv::Mat1d(1, 1) << 0.3);
    EXPECT_FALSE(GreedyMatcher(0.5, fixedOverlaps(below)).match(makeSlice({0.3}, 1)).true_positive[0]);
}

TEST(GreedyMatcherTest, TiedScoresKeepInputOrder) {
    cv::Mat1d m = (cv::Mat1d(3, 1) << 0.6, 0.9, 0.7);
    GreedyMatcher matcher(0.5, fixedOverlaps(m));
    const MatchResult r = matcher.match(makeSlice({0.5, 0.5, 0.5}, 1));

    // First detection in input order wins the tie and claims the only gt.
    EXPECT_TRUE(r.true_positive[0]);
    EXPECT_FALSE(r.true_positive[1]);
    EXPECT_FALSE(r.true_positive[2]);
}

TEST(GreedyMatcherTest, NeverAssignsGroundTruthTwice) {
    const std::vector<Box> gts = {Box(0, 0, 10, 10), Box(50, 50, 10, 10)};
    ClassSlice slice;
    slice.ground_truth_boxes = gts;
    for (int i = 0; i < 6; ++i) {
        slice.detection_boxes.emplace_back(i % 2 == 0 ? 0.0 : 50.0, i % 2 == 0 ? 0.0 : 50.0, 10.0, 10.0);
        slice.detection_scores.push_back(1.0 - 0.1 * i);
    }

    const MatchResult r = GreedyMatcher(0.5).match(slice);
    int tp = 0;
    for (bool b : r.true_positive) tp += b ? 1 : 0;
    EXPECT_EQ(tp, 2);
    EXPECT_TRUE(r.true_positive[0]);
    EXPECT_TRUE(r.true_positive[1]);
}

TEST(GreedyMatcherTest, RejectsInvalidThreshold) {
    EXPECT_THROW(GreedyMatcher(1.5), deteval::eval::ValidationError);
    EXPECT_THROW(GreedyMatcher(std::numeric_limits<double>::quiet_NaN()),
                 deteval::eval::NumericError);
}
