#include "rubikpow/BatchVerifier.h"

#include <future>
#include <thread>

namespace rubikpow {

namespace {
int resolveThreadCount(int requested) {
    if (requested > 0) {
        return requested;
    }
    const unsigned int hw = std::thread::hardware_concurrency();
    return hw > 0 ? static_cast<int>(hw) : 1;
}
} // namespace

BatchVerifier::BatchVerifier(int threads, SubmissionPolicy policy)
    : policy(policy), pool(resolveThreadCount(threads)) {}

std::vector<SubmissionVerdict> BatchVerifier::verifyAll(const std::vector<Submission>& submissions) {
    std::vector<std::future<SubmissionVerdict>> pending;
    pending.reserve(submissions.size());
    for (const auto& submission : submissions) {
        const Submission* item = &submission;
        pending.push_back(pool.enqueue([this, item]() { return verifySubmission(*item, policy); }));
    }

    std::vector<SubmissionVerdict> verdicts;
    verdicts.reserve(pending.size());
    for (auto& result : pending) {
        verdicts.push_back(result.get());
    }
    return verdicts;
}

} // namespace rubikpow
