/**
 * @file ConfigStore.hpp
 * @brief Human-readable JSON persistence for EngineConfig.
 */

#ifndef TONEGEN_CONFIG_STORE_HPP
#define TONEGEN_CONFIG_STORE_HPP

#include "EngineConfig.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace tonegen {

using json = nlohmann::json;

void to_json(json& j, const EngineConfig& config);

/**
 * @brief Every key is optional; missing keys keep their default.
 *
 * @throws json::exception on a type mismatch.
 * @throws std::invalid_argument on an unknown enum name.
 */
void from_json(const json& j, EngineConfig& config);

/**
 * @brief Loads and saves EngineConfig.
 *
 * All entry points report failure through their return value and the logger;
 * none of them throw.
 */
class ConfigStore {
public:
    static bool save_to_file(const EngineConfig& config, const std::string& path);
    static bool load_from_file(EngineConfig& config, const std::string& path);

    static std::string serialize(const EngineConfig& config);

    /**
     * @brief Parse a JSON document into config.
     *
     * On failure config is left untouched.
     */
    static bool deserialize(EngineConfig& config, const std::string& data);

    /**
     * @brief Clamp every numeric field into its working range.
     */
    static void sanitize(EngineConfig& config);
};

} // namespace tonegen

#endif // TONEGEN_CONFIG_STORE_HPP
