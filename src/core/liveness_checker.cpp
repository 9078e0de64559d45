/**
 * @file liveness_checker.cpp
 * @brief LivenessChecker implementation.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#include "ubnt/core/liveness_checker.hpp"
#include "ubnt/utils/logger.hpp"

#include <stdexcept>

namespace ubnt {
namespace core {

LivenessChecker::LivenessChecker(std::shared_ptr<HttpProber> prober)
    : prober_(std::move(prober))
{
    if (!prober_) {
        throw std::invalid_argument("LivenessChecker requires a prober");
    }
}

bool LivenessChecker::isAlive(const std::string& address) {
    SystemInfoResult result = prober_->probeSystemInfo(address);
    bool alive = result.outcome != ProbeOutcome::UNREACHABLE;

    LOG_INFO("Liveness", "{} is {} ({})", address, alive ? "alive" : "unreachable",
             probeOutcomeToString(result.outcome));
    return alive;
}

}  // namespace core
}  // namespace ubnt
