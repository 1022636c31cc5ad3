#pragma once

#include <stdexcept>
#include <string>

namespace rubikpow {

// Puzzle size below the supported minimum.
class SizeError : public std::invalid_argument {
public:
    SizeError(int size, int minimum)
        : std::invalid_argument("puzzle size " + std::to_string(size) +
                                " is below the minimum of " + std::to_string(minimum)),
          size(size) {}

    int getSize() const { return size; }

private:
    int size;
};

// Malformed move notation.
class MoveParseError : public std::invalid_argument {
public:
    explicit MoveParseError(const std::string& token)
        : std::invalid_argument("cannot parse move '" + token + "'"), token(token) {}

    const std::string& getToken() const { return token; }

private:
    std::string token;
};

// Malformed wire bytes (move list or serialized state).
class DecodeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace rubikpow
