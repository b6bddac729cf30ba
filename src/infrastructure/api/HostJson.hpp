/**
 * @file HostJson.hpp
 * @brief Wire format for host records exchanged between peers.
 *
 * Records are JSON objects with the canonical snake_case field names; a
 * roster is a JSON array of records in roster order.
 */

#pragma once

#include "core/types/Host.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace signfleet::infra {

/**
 * @brief Serializes a host to its wire representation.
 * @param host Host to serialize.
 * @return JSON object with every canonical field present.
 */
nlohmann::json hostToJson(const core::Host& host);

/**
 * @brief Parses a host from its wire representation.
 *
 * Missing fields keep the defaults of a never-probed record; unknown
 * fields are ignored.
 *
 * @param j JSON object to parse.
 * @return The parsed host.
 * @throws nlohmann::json::exception if a present field has the wrong type.
 */
core::Host hostFromJson(const nlohmann::json& j);

/**
 * @brief Serializes a roster as a JSON array.
 */
nlohmann::json hostsToJson(const std::vector<core::Host>& hosts);

/**
 * @brief Parses a JSON array of records.
 * @throws std::invalid_argument if the value is not an array.
 */
std::vector<core::Host> hostsFromJson(const nlohmann::json& j);

} // namespace signfleet::infra
