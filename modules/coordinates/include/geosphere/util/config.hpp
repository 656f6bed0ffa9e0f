#pragma once

#include <string>
#include <boost/property_tree/ptree.hpp>

#include <geosphere/errors.hpp>

namespace geosphere {

/**
 * @brief Read-only JSON configuration
 *
 * Parameters are addressed as module.key, e.g.
 * @code
 *   { "converter": { "radius": 6371000.0 } }
 * @endcode
 */
class Config {
public:
    /**
     * @brief Load a JSON config file
     * @param path Path to the file
     * @throw Error if the file cannot be read or parsed
     */
    explicit Config(const std::string& path);

    /**
     * @brief Parse a JSON document held in memory
     * @throw Error if the text is not valid JSON
     */
    static Config from_string(const std::string& json);

    /**
     * @brief Get a parameter, or a default value if it is absent
     * @param module Top-level section name
     * @param key Parameter name inside the section
     * @param default_value Returned when module.key does not exist
     * @throw Error if the parameter exists but cannot be converted to T
     */
    template <typename T>
    T param(const std::string& module, const std::string& key, const T& default_value) const {
        const std::string path = module + "." + key;
        const auto child = tree_.get_child_optional(path);
        if (!child) {
            return default_value;
        }

        try {
            return child->template get_value<T>();
        } catch (const boost::property_tree::ptree_error& e) {
            throw Error("config " + source_ + ": bad value for " + path + " (" + e.what() + ")");
        }
    }

    bool has(const std::string& module, const std::string& key) const;

    const std::string& source() const { return source_; }

private:
    Config() = default;

    std::string source_;
    boost::property_tree::ptree tree_;
};

}  // namespace geosphere
