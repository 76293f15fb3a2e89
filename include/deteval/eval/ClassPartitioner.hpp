#pragma once

#include "deteval/eval/EvalTypes.hpp"

namespace deteval::eval {

class ClassPartitioner {
public:
    /**
     * @brief Selects the detections and ground truths labelled class_id
     * @details Relative input order is kept. Either side may come back empty.
     */
    static ClassSlice partition(const ImageRecord& image, int class_id);
};

} // namespace deteval::eval
