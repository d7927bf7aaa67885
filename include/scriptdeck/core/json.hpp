/*
 * scriptdeck C++ - JSON type alias
 *
 * All JSON documents (config file, worker request, result records) go
 * through nlohmann::json.
 */
#ifndef scriptdeck_CORE_JSON_HPP
#define scriptdeck_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace scriptdeck {

typedef nlohmann::json Json;

} // namespace scriptdeck

#endif // scriptdeck_CORE_JSON_HPP
