/**
 * @file log_collector.h
 * @brief Main header for the log_collector library
 * @version 0.1.0
 *
 * Include this header to access the whole collection engine.
 *
 * @code
 * #include <kcenon/log_collector/log_collector.h>
 *
 * using namespace kcenon::log_collector;
 *
 * auto service = collector_service::builder().build();
 * service.value().connect(profile);
 *
 * collection_request request;
 * request.sources = {source_spec::linux_kernel_logs()};
 * request.compress = true;
 * request.destination_root = "/home/user/collected";
 * auto id = service.value().start_collection(request);
 * @endcode
 */

#ifndef KCENON_LOG_COLLECTOR_LOG_COLLECTOR_H
#define KCENON_LOG_COLLECTOR_LOG_COLLECTOR_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/log_collector/core/types.h"
#include "kcenon/log_collector/core/source_types.h"
#include "kcenon/log_collector/core/filter_engine.h"
#include "kcenon/log_collector/core/disk_space_monitor.h"
#include "kcenon/log_collector/core/checksum.h"
#include "kcenon/log_collector/config/validation.h"

// Session
#include "kcenon/log_collector/session/session_types.h"
#include "kcenon/log_collector/session/remote_channel.h"
#include "kcenon/log_collector/session/libssh_channel.h"
#include "kcenon/log_collector/session/connection_session.h"

// Discovery and compression
#include "kcenon/log_collector/discovery/discovery_engine.h"
#include "kcenon/log_collector/compression/compression_handler.h"

// Orchestration
#include "kcenon/log_collector/orchestrator/collection_types.h"
#include "kcenon/log_collector/orchestrator/event_channel.h"
#include "kcenon/log_collector/orchestrator/collection_orchestrator.h"
#include "kcenon/log_collector/service/collector_service.h"

namespace kcenon::log_collector {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::log_collector

#endif  // KCENON_LOG_COLLECTOR_LOG_COLLECTOR_H
