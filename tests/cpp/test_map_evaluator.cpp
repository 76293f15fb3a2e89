#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "deteval/eval/EvalError.hpp"
#include "deteval/eval/MapEvaluator.hpp"

using deteval::eval::ApMethod;
using deteval::eval::Box;
using deteval::eval::EvalResult;
using deteval::eval::EvaluatorConfig;
using deteval::eval::ImageRecord;
using deteval::eval::MapEvaluator;
using deteval::eval::OverlapFunction;
using deteval::eval::computeMap;

namespace {

void addDetection(ImageRecord& image, const Box& box, int label, double score) {
    image.detections.boxes.push_back(box);
    image.detections.labels.push_back(label);
    image.detections.scores.push_back(score);
}

void addGroundTruth(ImageRecord& image, const Box& box, int label) {
    image.ground_truth.boxes.push_back(box);
    image.ground_truth.labels.push_back(label);
}

OverlapFunction fixedOverlaps(cv::Mat1d m) {
    return [m](const std::vector<Box>&, const std::vector<Box>&) { return m.clone(); };
}

EvaluatorConfig makeConfig(int num_classes, bool parallel = false) {
    EvaluatorConfig config;
    config.num_classes = num_classes;
    config.parallel = parallel;
    return config;
}

std::vector<ImageRecord> makeRandomDataset(unsigned seed, int num_images, int num_classes) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> pos(0.0, 200.0);
    std::uniform_real_distribution<double> size(5.0, 60.0);
    std::uniform_real_distribution<double> jitter(-6.0, 6.0);
    std::uniform_real_distribution<double> score(0.0, 1.0);
    std::uniform_int_distribution<int> label(0, num_classes - 1);
    std::uniform_int_distribution<int> count(0, 5);

    std::vector<ImageRecord> images;
    for (int i = 0; i < num_images; ++i) {
        ImageRecord image;
        image.image_id = "img_" + std::to_string(i);
        const int num_gt = count(rng);
        for (int g = 0; g < num_gt; ++g) {
            const Box gt(pos(rng), pos(rng), size(rng), size(rng));
            const int cls = label(rng);
            addGroundTruth(image, gt, cls);
            // A noisy hit on most objects, sometimes with the wrong class.
            if (score(rng) < 0.8) {
                const Box det(gt.x + jitter(rng), gt.y + jitter(rng), gt.width, gt.height);
                addDetection(image, det, score(rng) < 0.9 ? cls : label(rng), score(rng));
            }
        }
        const int num_fp = count(rng) / 2;
        for (int f = 0; f < num_fp; ++f) {
            addDetection(image, Box(pos(rng), pos(rng), size(rng), size(rng)), label(rng), score(rng));
        }
        images.push_back(image);
    }
    return images;
}

}  // namespace

TEST(MapEvaluatorTest, SingleExactMatchScoresOne) {
    ImageRecord image;
    addGroundTruth(image, Box(10, 20, 30, 40), 0);
    addDetection(image, Box(10, 20, 30, 40), 0, 0.9);

    const EvalResult result = computeMap({image}, 1, 0.5);
    ASSERT_EQ(result.ap_per_class.size(), 1u);
    EXPECT_EQ(result.ap_per_class[0], 1.0);
    EXPECT_EQ(result.mean_ap, 1.0);
    EXPECT_EQ(result.classes[0].num_true_positives, 1);
}

TEST(MapEvaluatorTest, LowOverlapIsFalsePositive) {
    ImageRecord image;
    addGroundTruth(image, Box(0, 0, 10, 10), 0);
    addDetection(image, Box(0, 0, 10, 10), 0, 0.9);

    MapEvaluator evaluator(makeConfig(1), fixedOverlaps(cv::Mat1d(1, 1, 0.3)));
    evaluator.addImage(image);
    const EvalResult result = evaluator.evaluate();

    EXPECT_EQ(result.classes[0].num_true_positives, 0);
    EXPECT_EQ(result.ap_per_class[0], 0.0);
    EXPECT_EQ(result.mean_ap, 0.0);
}

TEST(MapEvaluatorTest, DuplicateDetectionOfOneObject) {
    ImageRecord image;
    addGroundTruth(image, Box(0, 0, 10, 10), 0);
    addGroundTruth(image, Box(50, 50, 10, 10), 0);
    addDetection(image, Box(0, 0, 10, 10), 0, 0.9);
    addDetection(image, Box(1, 0, 10, 10), 0, 0.8);

    cv::Mat1d m = (cv::Mat1d(2, 2) << 0.9, 0.0,
                                      0.9, 0.0);
    MapEvaluator evaluator(makeConfig(1), fixedOverlaps(m));
    evaluator.addImage(image);
    const EvalResult result = evaluator.evaluate();

    EXPECT_EQ(result.classes[0].num_true_positives, 1);
    EXPECT_EQ(result.classes[0].num_detections, 2);
    EXPECT_EQ(result.classes[0].num_ground_truth, 2);
    EXPECT_LT(result.ap_per_class[0], 1.0);
    EXPECT_DOUBLE_EQ(result.ap_per_class[0], 6.0 / 11.0);
}

TEST(MapEvaluatorTest, AllPointsMethodIntegratesTheEnvelope) {
    ImageRecord image;
    addGroundTruth(image, Box(0, 0, 10, 10), 0);
    addGroundTruth(image, Box(50, 50, 10, 10), 0);
    addDetection(image, Box(0, 0, 10, 10), 0, 0.9);
    addDetection(image, Box(1, 0, 10, 10), 0, 0.8);
    addDetection(image, Box(90, 90, 10, 10), 0, 0.7);
    addDetection(image, Box(50, 50, 10, 10), 0, 0.6);

    // Ranked: hit, duplicate, miss, hit.
    cv::Mat1d m = (cv::Mat1d(4, 2) << 0.9, 0.0,
                                      0.9, 0.0,
                                      0.1, 0.1,
                                      0.0, 0.8);
    EvaluatorConfig config = makeConfig(1);
    config.ap_method = ApMethod::ALL_POINTS;
    MapEvaluator evaluator(config, fixedOverlaps(m));
    evaluator.addImage(image);
    const EvalResult result = evaluator.evaluate();

    EXPECT_EQ(result.ap_method, ApMethod::ALL_POINTS);
    EXPECT_EQ(result.classes[0].num_true_positives, 2);
    // Envelope 1.0 up to recall 0.5, then 0.5 up to recall 1.0.
    EXPECT_DOUBLE_EQ(result.ap_per_class[0], 0.75);

    MapEvaluator eleven_point(makeConfig(1), fixedOverlaps(m));
    eleven_point.addImage(image);
    EXPECT_DOUBLE_EQ(eleven_point.evaluate().ap_per_class[0], 8.0 / 11.0);
}

TEST(MapEvaluatorTest, ClassWithoutGroundTruthHalvesTheMean) {
    ImageRecord image;
    addGroundTruth(image, Box(0, 0, 10, 10), 0);
    addDetection(image, Box(0, 0, 10, 10), 0, 0.7);

    const EvalResult result = computeMap({image}, 2);
    EXPECT_EQ(result.ap_per_class[0], 1.0);
    EXPECT_EQ(result.ap_per_class[1], 0.0);
    EXPECT_EQ(result.mean_ap, 0.5);
}

TEST(MapEvaluatorTest, DetectionsWithoutGroundTruthScoreZero) {
    ImageRecord image;
    addGroundTruth(image, Box(0, 0, 10, 10), 0);
    addDetection(image, Box(0, 0, 10, 10), 0, 0.7);
    addDetection(image, Box(0, 0, 10, 10), 1, 0.9);

    const EvalResult result = computeMap({image}, 2);
    EXPECT_EQ(result.ap_per_class[1], 0.0);
    EXPECT_EQ(result.classes[1].num_detections, 1);
    EXPECT_EQ(result.mean_ap, 0.5);
}

TEST(MapEvaluatorTest, EmptyDatasetIsZero) {
    const EvalResult result = computeMap({}, 3);
    ASSERT_EQ(result.ap_per_class.size(), 3u);
    for (double ap : result.ap_per_class) EXPECT_EQ(ap, 0.0);
    EXPECT_EQ(result.mean_ap, 0.0);
    EXPECT_EQ(result.num_images, 0u);
}

TEST(MapEvaluatorTest, MatchesNeverCrossImages) {
    // Ground truth in image 0, a perfect-looking box in image 1.
    ImageRecord a;
    addGroundTruth(a, Box(0, 0, 10, 10), 0);
    ImageRecord b;
    addDetection(b, Box(0, 0, 10, 10), 0, 0.9);

    const EvalResult result = computeMap({a, b}, 1);
    EXPECT_EQ(result.classes[0].num_true_positives, 0);
    EXPECT_EQ(result.mean_ap, 0.0);
}

TEST(MapEvaluatorTest, PerfectDetectorAcrossImages) {
    std::vector<ImageRecord> images(4);
    for (int i = 0; i < 4; ++i) {
        const Box box(10.0 * i, 5.0, 20.0, 20.0);
        addGroundTruth(images[i], box, i % 2);
        addDetection(images[i], box, i % 2, 0.5 + 0.1 * i);
    }
    const EvalResult result = computeMap(images, 2);
    EXPECT_EQ(result.ap_per_class[0], 1.0);
    EXPECT_EQ(result.ap_per_class[1], 1.0);
    EXPECT_EQ(result.mean_ap, 1.0);
}

TEST(MapEvaluatorTest, StreamingMatchesBatch) {
    const auto images = makeRandomDataset(7, 40, 4);

    MapEvaluator streaming(makeConfig(4));
    for (const auto& image : images) {
        streaming.addImage(image);
    }
    const EvalResult a = streaming.evaluate();
    const EvalResult b = computeMap(images, 4);

    EXPECT_EQ(streaming.numImages(), images.size());
    EXPECT_EQ(a.ap_per_class, b.ap_per_class);
    EXPECT_EQ(a.mean_ap, b.mean_ap);
}

TEST(MapEvaluatorTest, RepeatedAndParallelRunsAreBitIdentical) {
    const auto images = makeRandomDataset(42, 60, 5);

    MapEvaluator sequential(makeConfig(5));
    sequential.addImages(images);
    const EvalResult first = sequential.evaluate();
    const EvalResult second = sequential.evaluate();

    MapEvaluator parallel(makeConfig(5, true));
    parallel.addImages(images);
    const EvalResult third = parallel.evaluate();

    EXPECT_EQ(first.ap_per_class, second.ap_per_class);
    EXPECT_EQ(first.mean_ap, second.mean_ap);
    EXPECT_EQ(first.ap_per_class, third.ap_per_class);
    EXPECT_EQ(first.mean_ap, third.mean_ap);
}

TEST(MapEvaluatorTest, ApAndMapStayInUnitInterval) {
    for (unsigned seed : {1u, 2u, 3u}) {
        for (ApMethod method : {ApMethod::ELEVEN_POINT, ApMethod::ALL_POINTS}) {
            EvaluatorConfig config = makeConfig(3);
            config.ap_method = method;
            MapEvaluator evaluator(config);
            evaluator.addImages(makeRandomDataset(seed, 30, 3));
            const EvalResult result = evaluator.evaluate();
            for (double ap : result.ap_per_class) {
                EXPECT_GE(ap, 0.0);
                EXPECT_LE(ap, 1.0);
            }
            EXPECT_GE(result.mean_ap, 0.0);
            EXPECT_LE(result.mean_ap, 1.0);
        }
    }
}

TEST(MapEvaluatorTest, ResetForgetsImages) {
    ImageRecord image;
    addGroundTruth(image, Box(0, 0, 10, 10), 0);
    addDetection(image, Box(0, 0, 10, 10), 0, 0.9);

    MapEvaluator evaluator(makeConfig(1));
    evaluator.addImage(image);
    evaluator.reset();
    EXPECT_EQ(evaluator.numImages(), 0u);
    EXPECT_EQ(evaluator.evaluate().mean_ap, 0.0);
}

TEST(MapEvaluatorTest, CarriesClassNames) {
    EvaluatorConfig config = makeConfig(2);
    config.class_names = {"cat", "dog"};
    MapEvaluator evaluator(config);
    const EvalResult result = evaluator.evaluate();
    EXPECT_EQ(result.classes[0].name, "cat");
    EXPECT_EQ(result.classes[1].name, "dog");
}

TEST(MapEvaluatorValidationTest, RejectsBadConfiguration) {
    EXPECT_THROW((MapEvaluator(makeConfig(0))), deteval::eval::ValidationError);

    EvaluatorConfig bad_iou = makeConfig(1);
    bad_iou.iou_threshold = -0.1;
    EXPECT_THROW((MapEvaluator(bad_iou)), deteval::eval::ValidationError);

    EvaluatorConfig nan_iou = makeConfig(1);
    nan_iou.iou_threshold = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW((MapEvaluator(nan_iou)), deteval::eval::NumericError);

    EvaluatorConfig names = makeConfig(2);
    names.class_names = {"only_one"};
    EXPECT_THROW((MapEvaluator(names)), deteval::eval::ValidationError);
}

TEST(MapEvaluatorValidationTest, RejectsMismatchedLengths) {
    ImageRecord image;
    image.image_id = "broken";
    addDetection(image, Box(0, 0, 1, 1), 0, 0.5);
    image.detections.scores.push_back(0.4);
    EXPECT_THROW(computeMap({image}, 1), deteval::eval::ValidationError);

    ImageRecord gt_image;
    addGroundTruth(gt_image, Box(0, 0, 1, 1), 0);
    gt_image.ground_truth.labels.push_back(0);
    EXPECT_THROW(computeMap({gt_image}, 1), deteval::eval::ValidationError);
}

TEST(MapEvaluatorValidationTest, RejectsLabelsOutOfRange) {
    ImageRecord det_image;
    addDetection(det_image, Box(0, 0, 1, 1), 2, 0.5);
    EXPECT_THROW(computeMap({det_image}, 2), deteval::eval::ValidationError);

    ImageRecord gt_image;
    addGroundTruth(gt_image, Box(0, 0, 1, 1), -1);
    EXPECT_THROW(computeMap({gt_image}, 2), deteval::eval::ValidationError);
}

TEST(MapEvaluatorValidationTest, RejectsNonFiniteValues) {
    ImageRecord nan_score;
    addDetection(nan_score, Box(0, 0, 1, 1), 0, std::numeric_limits<double>::quiet_NaN());
    EXPECT_THROW(computeMap({nan_score}, 1), deteval::eval::NumericError);

    ImageRecord inf_box;
    addGroundTruth(inf_box, Box(0, 0, std::numeric_limits<double>::infinity(), 1), 0);
    EXPECT_THROW(computeMap({inf_box}, 1), deteval::eval::NumericError);
}

TEST(MapEvaluatorValidationTest, BadImageLeavesStateUntouched) {
    ImageRecord good;
    addGroundTruth(good, Box(0, 0, 10, 10), 0);
    addDetection(good, Box(0, 0, 10, 10), 0, 0.9);
    ImageRecord bad;
    addDetection(bad, Box(0, 0, 10, 10), 5, 0.9);

    MapEvaluator evaluator(makeConfig(1));
    EXPECT_THROW(evaluator.addImages({good, bad}), deteval::eval::ValidationError);
    EXPECT_EQ(evaluator.numImages(), 0u);
    EXPECT_EQ(evaluator.evaluate().classes[0].num_detections, 0);

    evaluator.addImage(good);
    EXPECT_THROW(evaluator.addImage(bad), deteval::eval::ValidationError);
    EXPECT_EQ(evaluator.numImages(), 1u);
    EXPECT_EQ(evaluator.evaluate().mean_ap, 1.0);
}

TEST(MapEvaluatorValidationTest, BadOverlapFunctionAbortsImage) {
    ImageRecord image;
    addGroundTruth(image, Box(0, 0, 10, 10), 0);
    addDetection(image, Box(0, 0, 10, 10), 0, 0.9);

    MapEvaluator evaluator(makeConfig(1), fixedOverlaps(cv::Mat1d(1, 1, 2.0)));
    EXPECT_THROW(evaluator.addImage(image), deteval::eval::NumericError);
    EXPECT_EQ(evaluator.numImages(), 0u);
}
