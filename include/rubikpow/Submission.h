#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "Constants.h"
#include "Difficulty.h"
#include "Move.h"

namespace rubikpow {

// Everything a verifier needs to check one block; no shared chain state.
struct Submission {
    int size{3};
    uint64_t nonce{0};
    std::vector<uint8_t> header;
    std::vector<Move> solution;
    Uint128 target{MAX_UINT128};
};

struct SubmissionPolicy {
    int minSize{DEFAULT_MIN_SUBMISSION_SIZE};
    int maxSize{DEFAULT_MAX_SUBMISSION_SIZE};
    size_t maxSolutionMoves{DEFAULT_MAX_SOLUTION_MOVES};
};

enum SubmissionVerdict : int {
    ACCEPTED,
    SIZE_TOO_SMALL,
    SIZE_TOO_LARGE,
    SOLUTION_TOO_LONG,
    INVALID_SOLUTION,
    TARGET_NOT_MET
};

const char* verdictName(SubmissionVerdict verdict);

// Bounds checks, deterministic scramble, solution replay, then the hash target
// on the scrambled state. The first failing check decides the verdict.
SubmissionVerdict verifySubmission(const Submission& submission, const SubmissionPolicy& policy = SubmissionPolicy{});

} // namespace rubikpow
