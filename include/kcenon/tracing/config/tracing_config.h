#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file tracing_config.h
 * @brief Runtime switches for interception and enrichment
 */

#include "../core/result_types.h"
#include "../utils/config_parser.h"

#include <string>
#include <vector>

namespace kcenon { namespace tracing {

/**
 * @struct tracing_config
 * @brief Configuration shared by the interceptor, link builder and header enricher
 *
 * Recognised keys for from_map():
 * - service_name (string)
 * - enabled, record_code_metadata, record_exceptions, link_carried_context (bool)
 * - enrichment_headers, skip_path_prefixes (comma separated lists)
 */
struct tracing_config {
    std::string service_name{"tracing_system"};
    bool enabled{true};
    bool record_code_metadata{true};
    bool record_exceptions{true};
    bool link_carried_context{true};
    std::vector<std::string> enrichment_headers;
    std::vector<std::string> skip_path_prefixes{"/actuator/", "/health"};

    result_void validate() const;

    /**
     * @brief Build a configuration from a string map
     *
     * Missing keys keep their defaults. A boolean key whose value is not a
     * recognised boolean is reported as configuration_parse_error rather than
     * silently defaulted. The result is validated before it is returned.
     */
    static result<tracing_config> from_map(const config_map& values);
};

} } // namespace kcenon::tracing
