/**
 * @file liveness_checker.hpp
 * @brief Reachability check for a device's management API.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#include "ubnt/core/export.hpp"
#include "ubnt/core/http_prober.hpp"

#include <memory>
#include <string>

namespace ubnt {
namespace core {

/**
 * @class LivenessChecker
 * @brief Answers "does this host's management API respond at all".
 *
 * Only the system-info endpoint is requested. Any HTTP status counts as
 * alive, including 401 and 404; the body is not inspected.
 */
class UBNT_CORE_API LivenessChecker {
public:
    explicit LivenessChecker(std::shared_ptr<HttpProber> prober);

    /**
     * @return False on connection failure or timeout, true otherwise.
     */
    bool isAlive(const std::string& address);

private:
    std::shared_ptr<HttpProber> prober_;
};

}  // namespace core
}  // namespace ubnt
