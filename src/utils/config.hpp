#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace tinyboard::utils {

using json = nlohmann::json;

/**
 * Configuration management system
 * Flat JSON object of settings, loaded from a file or a string
 */
class Config {
public:
    Config() = default;

    /**
     * Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static Config load_from_file(const std::string& path);

    /**
     * Load configuration from JSON string
     * @throws std::runtime_error if the string is not a JSON object
     */
    static Config load_from_json(const std::string& json_str);

    /**
     * Save configuration to file
     */
    void save_to_file(const std::string& path) const;

    /**
     * Get a value from config; nullopt when missing or of the wrong type
     */
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        try {
            return it->get<T>();
        } catch (const json::type_error&) {
            return std::nullopt;
        }
    }

    /**
     * Get a value with default
     */
    template<typename T>
    T get_or(const std::string& key, const T& default_value) const {
        auto value = get<T>(key);
        return value.value_or(default_value);
    }

    /**
     * Set a value
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        data_[key] = value;
    }

    /**
     * Check if key exists
     */
    bool has(const std::string& key) const {
        return data_.contains(key);
    }

    /**
     * Get underlying JSON object
     */
    const json& data() const { return data_; }

private:
    json data_ = json::object();
};

} // namespace tinyboard::utils
