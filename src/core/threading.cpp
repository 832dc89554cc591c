#include "speckle_track/core/threading.hpp"
#include "speckle_track/core/parallel.hpp"

#include <opencv2/core.hpp>

namespace speckle_track::core {

ThreadingScope::ThreadingScope(int workers)
    : workers_(compute_worker_count(workers, 0)),
      previous_cv_threads_(cv::getNumThreads()) {
    cv::setNumThreads(workers_);
}

ThreadingScope::~ThreadingScope() {
    cv::setNumThreads(previous_cv_threads_);
}

} // namespace speckle_track::core
