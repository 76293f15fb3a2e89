#pragma once

#include <string>
#include <vector>

#include "deteval/eval/EvalTypes.hpp"
#include "deteval/eval/GreedyMatcher.hpp"
#include "deteval/eval/Overlap.hpp"
#include "deteval/eval/RankAccumulator.hpp"

namespace deteval::eval {

/**
 * @brief Evaluator configuration
 */
struct EvaluatorConfig {
    int num_classes = 0;                         // must be >= 1
    double iou_threshold = 0.5;                  // match when overlap >= threshold
    ApMethod ap_method = ApMethod::ELEVEN_POINT;
    bool parallel = false;                       // run classes on OpenCV's thread pool
    std::vector<std::string> class_names;        // empty or exactly num_classes entries
};

/**
 * @brief mAP over a stream of evaluated images
 *
 * Images can be fed one at a time while the detector is still running;
 * each one is validated and matched right away and only the per-class
 * (label, score) lists are kept. evaluate() turns them into AP values.
 *
 * Usage:
 * @code
 *   EvaluatorConfig cfg;
 *   cfg.num_classes = 20;
 *
 *   MapEvaluator evaluator(cfg);
 *   for (const auto& image : images) {
 *       evaluator.addImage(image);
 *   }
 *   EvalResult result = evaluator.evaluate();
 * @endcode
 */
class MapEvaluator {
public:
    /**
     * @throws ValidationError / NumericError on an invalid configuration
     */
    explicit MapEvaluator(const EvaluatorConfig& config,
                          OverlapFunction overlap = pairwiseIou);

    /**
     * @brief Validates and matches one image
     * @details On error nothing is accumulated.
     */
    void addImage(const ImageRecord& image);

    /**
     * @brief Validates the whole batch, then matches it
     * @details A single bad image rejects the batch before any matching.
     */
    void addImages(const std::vector<ImageRecord>& images);

    EvalResult evaluate() const;

    void reset();

    size_t numImages() const { return num_images_; }
    const EvaluatorConfig& config() const { return config_; }

private:
    std::vector<MatchResult> matchImage(const ImageRecord& image) const;

    EvaluatorConfig config_;
    GreedyMatcher matcher_;
    std::vector<RankAccumulator> accumulators_;
    size_t num_images_ = 0;
};

/**
 * @brief One-shot evaluation of a complete batch
 * @return mean AP plus per-class AP at the given IoU threshold
 */
EvalResult computeMap(const std::vector<ImageRecord>& images,
                      int num_classes,
                      double iou_threshold = 0.5);

} // namespace deteval::eval
