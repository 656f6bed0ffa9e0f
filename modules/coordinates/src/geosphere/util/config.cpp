#include <geosphere/util/config.hpp>

#include <sstream>
#include <boost/property_tree/json_parser.hpp>

namespace geosphere {

Config::Config(const std::string& path) : source_(path) {
    try {
        boost::property_tree::read_json(path, tree_);
    } catch (const boost::property_tree::json_parser_error& e) {
        throw Error("failed to load config " + path + ": " + e.what());
    }
}

Config Config::from_string(const std::string& json) {
    Config config;
    config.source_ = "<string>";

    std::istringstream stream(json);
    try {
        boost::property_tree::read_json(stream, config.tree_);
    } catch (const boost::property_tree::json_parser_error& e) {
        throw Error(std::string("failed to parse config: ") + e.what());
    }
    return config;
}

bool Config::has(const std::string& module, const std::string& key) const {
    return static_cast<bool>(tree_.get_child_optional(module + "." + key));
}

}  // namespace geosphere
