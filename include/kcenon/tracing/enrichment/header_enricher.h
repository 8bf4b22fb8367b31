#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file header_enricher.h
 * @brief Copies selected inbound request headers onto the active span
 */

#include "../attributes/telemetry_attributes.h"
#include "../config/tracing_config.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kcenon { namespace tracing {

/**
 * @class header_enricher
 * @brief Per-request filter writing http.request.header.<name> attributes
 *
 * Header names are matched case-insensitively and recorded lower-cased.
 * Requests whose path starts with a skip prefix are left alone, as are
 * headers that are missing or blank.
 */
class header_enricher {
public:
    using header_map = std::unordered_map<std::string, std::string>;

    header_enricher(std::vector<std::string> header_names,
                    std::vector<std::string> skip_path_prefixes);

    explicit header_enricher(const tracing_config& config);

    bool should_skip(std::string_view path) const;

    /**
     * @brief Attributes that enrich() would write for these headers
     */
    attribute_map collect(const header_map& headers) const;

    /**
     * @brief Write the configured headers onto the active span
     * @return Number of header attributes written
     */
    std::size_t enrich(std::string_view path, const header_map& headers) const;

    const std::vector<std::string>& header_names() const { return header_names_; }

private:
    std::vector<std::string> header_names_;
    std::vector<std::string> skip_path_prefixes_;
};

} } // namespace kcenon::tracing
