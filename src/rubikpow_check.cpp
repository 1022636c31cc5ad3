// Scrambles a cube from (size, nonce, header) and optionally checks a solution against a target.

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "rubikpow/Difficulty.h"
#include "rubikpow/Errors.h"
#include "rubikpow/PuzzleState.h"
#include "rubikpow/ScrambleGenerator.h"
#include "rubikpow/Submission.h"

using namespace rubikpow;

namespace {
void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <size> <nonce> <header> [options]\n"
              << "  --solution \"<moves>\"   verify a solution, e.g. \"R U2 F'\"\n"
              << "  --target <value>       hash target (decimal or 0x hex)\n"
              << "  --zero-bits <n>        hash target with n leading zero bits\n"
              << "  --print                print the scrambled cube\n";
}

struct Options {
    int size{3};
    uint64_t nonce{0};
    std::string header;
    bool hasSolution{false};
    std::string solution;
    Uint128 target{MAX_UINT128};
    bool print{false};
};

Options parseArgs(int argc, char** argv) {
    if (argc < 4) {
        throw std::invalid_argument("expected <size> <nonce> <header>");
    }
    Options opts;
    opts.size = std::stoi(argv[1]);
    opts.nonce = std::stoull(argv[2]);
    opts.header = argv[3];

    for (int i = 4; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " needs a value");
            }
            return argv[++i];
        };
        if (arg == "--solution") {
            opts.hasSolution = true;
            opts.solution = next();
        } else if (arg == "--target") {
            opts.target = parseUint128(next());
        } else if (arg == "--zero-bits") {
            opts.target = targetFromLeadingZeroBits(std::stoi(next()));
        } else if (arg == "--print") {
            opts.print = true;
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }
    return opts;
}
} // namespace

int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    try {
        PuzzleState cube(opts.size);
        const std::vector<Move> scramble = ScrambleGenerator::scrambleDeterministic(cube, opts.nonce, opts.header);

        std::cout << "Scramble (" << scramble.size() << " moves): " << sequenceToString(scramble) << "\n";
        std::cout << "Inverse: " << sequenceToString(invertSequence(scramble)) << "\n";
        std::cout << "State hash: " << toHexString(stateHashValue(cube)) << "\n";

        const DifficultyFigure figure = describeDifficulty(opts.size);
        std::cout << "Difficulty: " << (figure.exact ? toDecimalString(figure.value) : std::string("> 2^128"))
                  << " (" << (figure.exact ? "exact" : "approximate") << ", ~2^"
                  << std::fixed << std::setprecision(2) << figure.log2Configurations << " configurations)\n";

        if (opts.print) {
            cube.printState();
        }

        if (opts.hasSolution) {
            Submission submission;
            submission.size = opts.size;
            submission.nonce = opts.nonce;
            submission.header.assign(opts.header.begin(), opts.header.end());
            submission.solution = parseMoveSequence(opts.solution);
            submission.target = opts.target;

            const SubmissionVerdict verdict = verifySubmission(submission);
            std::cout << "Verdict: " << verdictName(verdict) << "\n";
            return verdict == ACCEPTED ? 0 : 1;
        }
    } catch (const SizeError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const MoveParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
