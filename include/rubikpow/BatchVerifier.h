#pragma once

#include <vector>

#include "Submission.h"
#include "ThreadPool.h"

namespace rubikpow {

// Verifies independent submissions in parallel. Each task builds its own PuzzleState,
// so workers share nothing mutable; verdicts are returned in input order.
class BatchVerifier {
public:
    explicit BatchVerifier(int threads = 0, SubmissionPolicy policy = SubmissionPolicy{});

    std::vector<SubmissionVerdict> verifyAll(const std::vector<Submission>& submissions);

    size_t getThreadCount() const { return pool.getThreadCount(); }
    const SubmissionPolicy& getPolicy() const { return policy; }

private:
    SubmissionPolicy policy;
    ThreadPool pool;
};

} // namespace rubikpow
