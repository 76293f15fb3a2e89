// mAP evaluator throughput on a synthetic dataset
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "deteval/common/log.hpp"
#include "deteval/eval/MapEvaluator.hpp"

struct Args {
  int images = 5000;
  int classes = 20;
  int max_objects = 12;     // ground truths per image, uniform in [0, max]
  double fp_rate = 0.5;     // extra false positives per ground truth
  double iou = 0.5;
  int repeats = 3;
  bool parallel = false;
  unsigned seed = 1234;
};

static bool starts_with(const char* s, const char* p) {
  return std::strncmp(s, p, std::strlen(p)) == 0;
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const char* s = argv[i];
    if (starts_with(s, "--images=")) a.images = std::atoi(s + 9);
    else if (starts_with(s, "--classes=")) a.classes = std::atoi(s + 10);
    else if (starts_with(s, "--max-objects=")) a.max_objects = std::atoi(s + 14);
    else if (starts_with(s, "--fp-rate=")) a.fp_rate = std::atof(s + 10);
    else if (starts_with(s, "--iou=")) a.iou = std::atof(s + 6);
    else if (starts_with(s, "--repeats=")) a.repeats = std::atoi(s + 10);
    else if (starts_with(s, "--seed=")) a.seed = static_cast<unsigned>(std::atoi(s + 7));
    else if (std::strcmp(s, "--parallel") == 0) a.parallel = true;
    else std::cerr << "ignoring unknown option " << s << "\n";
  }
  if (a.images < 1) a.images = 1;
  if (a.classes < 1) a.classes = 1;
  if (a.max_objects < 0) a.max_objects = 0;
  if (a.repeats < 1) a.repeats = 1;
  if (a.fp_rate < 0.0) a.fp_rate = 0.0;
  return a;
}

static std::vector<deteval::eval::ImageRecord> make_dataset(const Args& a) {
  std::mt19937 rng(a.seed);
  std::uniform_real_distribution<double> pos(0.0, 600.0);
  std::uniform_real_distribution<double> size(8.0, 120.0);
  std::normal_distribution<double> jitter(0.0, 4.0);
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  std::uniform_int_distribution<int> label(0, a.classes - 1);
  std::uniform_int_distribution<int> count(0, a.max_objects);

  std::vector<deteval::eval::ImageRecord> images(static_cast<size_t>(a.images));
  for (size_t i = 0; i < images.size(); ++i) {
    auto& img = images[i];
    img.image_id = std::to_string(i);
    const int n = count(rng);
    for (int k = 0; k < n; ++k) {
      const deteval::eval::Box gt(pos(rng), pos(rng), size(rng), size(rng));
      const int cls = label(rng);
      img.ground_truth.boxes.push_back(gt);
      img.ground_truth.labels.push_back(cls);
      if (unit(rng) < 0.85) {
        img.detections.boxes.emplace_back(gt.x + jitter(rng), gt.y + jitter(rng), gt.width, gt.height);
        img.detections.labels.push_back(cls);
        img.detections.scores.push_back(unit(rng));
      }
      if (unit(rng) < a.fp_rate) {
        img.detections.boxes.emplace_back(pos(rng), pos(rng), size(rng), size(rng));
        img.detections.labels.push_back(label(rng));
        img.detections.scores.push_back(unit(rng) * 0.6);
      }
    }
  }
  return images;
}

int main(int argc, char** argv) {
  const Args a = parse_args(argc, argv);
  evlog::setLevel(evlog::WARN);

  const auto images = make_dataset(a);
  size_t num_det = 0;
  size_t num_gt = 0;
  for (const auto& img : images) {
    num_det += img.detections.boxes.size();
    num_gt += img.ground_truth.boxes.size();
  }

  deteval::eval::EvaluatorConfig cfg;
  cfg.num_classes = a.classes;
  cfg.iou_threshold = a.iou;
  cfg.parallel = a.parallel;

  double best_ms = 0.0;
  double map = 0.0;
  for (int r = 0; r < a.repeats; ++r) {
    const auto t0 = std::chrono::steady_clock::now();
    deteval::eval::MapEvaluator evaluator(cfg);
    evaluator.addImages(images);
    map = evaluator.evaluate().mean_ap;
    const auto t1 = std::chrono::steady_clock::now();
    const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    if (r == 0 || ms < best_ms) best_ms = ms;
  }

  std::cout << "images=" << a.images << " classes=" << a.classes
            << " detections=" << num_det << " ground_truth=" << num_gt
            << " parallel=" << (a.parallel ? 1 : 0) << "\n";
  std::cout << "mAP=" << map << " best_ms=" << best_ms
            << " images_per_s=" << (best_ms > 0.0 ? a.images * 1000.0 / best_ms : 0.0) << "\n";
  return 0;
}
