#pragma once

#include <cstdint>
#include <functional>
#include <random>
#include <vector>

#include "infrastructure/error_handling.h"
#include "network/envelope.h"

namespace liarslie::core {

using ForgeFn = std::function<Result<network::Envelope>(const network::Envelope& original,
                                                         uint64_t maxValue,
                                                         std::mt19937_64& rng)>;

// Rewrites a signed SendValue to carry a random value in [1, maxValue] while
// keeping the original signature, which then no longer matches.
Result<network::Envelope> forgeSendValue(const network::Envelope& original,
                                         uint64_t maxValue,
                                         std::mt19937_64& rng);

// Each reply is replaced with probability `probability`. If any forge fails the
// original replies are returned untouched.
std::vector<network::Envelope> tamperReplies(const std::vector<network::Envelope>& replies,
                                             double probability,
                                             uint64_t maxValue,
                                             std::mt19937_64& rng,
                                             const ForgeFn& forge = forgeSendValue);

}
