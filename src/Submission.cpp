#include "rubikpow/Submission.h"
#include "rubikpow/PuzzleState.h"
#include "rubikpow/ScrambleGenerator.h"
#include "rubikpow/Verification.h"

#include <algorithm>

namespace rubikpow {

const char* verdictName(SubmissionVerdict verdict) {
    switch (verdict) {
        case ACCEPTED:          return "accepted";
        case SIZE_TOO_SMALL:    return "size too small";
        case SIZE_TOO_LARGE:    return "size too large";
        case SOLUTION_TOO_LONG: return "solution too long";
        case INVALID_SOLUTION:  return "invalid solution";
        case TARGET_NOT_MET:    return "target not met";
    }
    return "unknown";
}

SubmissionVerdict verifySubmission(const Submission& submission, const SubmissionPolicy& policy) {
    if (submission.size < std::max(policy.minSize, MIN_PUZZLE_SIZE)) {
        return SIZE_TOO_SMALL;
    }
    if (submission.size > policy.maxSize) {
        return SIZE_TOO_LARGE;
    }
    if (submission.solution.size() > policy.maxSolutionMoves) {
        return SOLUTION_TOO_LONG;
    }

    PuzzleState scrambled(submission.size);
    ScrambleGenerator::scrambleDeterministic(scrambled, submission.nonce, submission.header);

    if (!verifySolution(scrambled, submission.solution)) {
        return INVALID_SOLUTION;
    }
    if (!meetsDifficulty(scrambled, submission.target)) {
        return TARGET_NOT_MET;
    }
    return ACCEPTED;
}

} // namespace rubikpow
