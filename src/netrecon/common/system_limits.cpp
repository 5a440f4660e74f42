#include "netrecon/common/system_limits.h"
#include "netrecon/common/logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/resource.h>

namespace netrecon {

std::size_t raise_descriptor_limit() {
    struct rlimit rl;
    if (getrlimit(RLIMIT_NOFILE, &rl) != 0) {
        LOG_CORE_WARN("getrlimit(RLIMIT_NOFILE) failed: {}", strerror(errno));
        return 1024;
    }

    if (rl.rlim_cur < rl.rlim_max) {
        struct rlimit new_rl = rl;
        new_rl.rlim_cur = rl.rlim_max;
        if (setrlimit(RLIMIT_NOFILE, &new_rl) == 0) {
            LOG_CORE_DEBUG("Raised FD limit from {} to {}", rl.rlim_cur, new_rl.rlim_cur);
            rl = new_rl;
        } else {
            LOG_CORE_WARN("Failed to raise FD limit from {} to {}: {}",
                          rl.rlim_cur, rl.rlim_max, strerror(errno));
        }
    }

    if (rl.rlim_cur == RLIM_INFINITY) {
        return 65535;
    }
    if (rl.rlim_cur < 1024) {
        LOG_CORE_WARN("System file descriptor limit is low ({}). Run 'ulimit -n 65535' for larger scans.",
                      rl.rlim_cur);
    }
    return static_cast<std::size_t>(rl.rlim_cur);
}

std::size_t derive_in_flight_ceiling(std::size_t descriptor_limit,
                                     std::size_t workers,
                                     std::size_t per_host_attempts,
                                     std::size_t requested) {
    std::size_t usable = descriptor_limit > kReservedDescriptors
        ? descriptor_limit - kReservedDescriptors
        : 16;
    workers = std::max<std::size_t>(1, workers);
    per_host_attempts = std::max<std::size_t>(1, per_host_attempts);
    // 乘积饱和到 usable，避免溢出
    std::size_t demand = workers > usable / per_host_attempts ? usable : workers * per_host_attempts;

    std::size_t ceiling = std::min(usable, demand);
    if (requested > 0) {
        if (requested > usable) {
            LOG_CORE_WARN("Configured max in-flight connections ({}) exceeds usable FD count ({}). Cap to {}",
                          requested, usable, usable);
        }
        ceiling = std::min(requested, usable);
    }
    return std::max<std::size_t>(1, ceiling);
}

} // namespace netrecon
