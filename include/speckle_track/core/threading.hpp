#pragma once

namespace speckle_track::core {

// Process-wide thread configuration for the numeric backends. Construct one
// at program start; the previous OpenCV thread count is restored on exit.
class ThreadingScope {
public:
    explicit ThreadingScope(int workers);
    ~ThreadingScope();

    ThreadingScope(const ThreadingScope&) = delete;
    ThreadingScope& operator=(const ThreadingScope&) = delete;

    int workers() const { return workers_; }

private:
    int workers_;
    int previous_cv_threads_;
};

} // namespace speckle_track::core
