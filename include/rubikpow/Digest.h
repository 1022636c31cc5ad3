#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "Constants.h"

namespace rubikpow {

using Digest = std::array<uint8_t, DIGEST_SIZE>;

// SHA3-256 (FIPS 202). Throws std::runtime_error if the crypto backend fails.
Digest sha3_256(const uint8_t* data, size_t length);
Digest sha3_256(const std::vector<uint8_t>& data);

std::string digestToHex(const Digest& digest);

} // namespace rubikpow
