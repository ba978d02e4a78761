#include "./to_json.hpp"

#include <urnkit/urn.hpp>

nlohmann::json urnkit::cli::to_json(const urn& u) {
    auto attrs = nlohmann::json::array();
    for (auto& [key, value] : u.attributes) {
        attrs.push_back(nlohmann::json{{"key", key}, {"value", value}});
    }
    return nlohmann::json{
        {"entity", u.entity},
        {"id", u.id},
        {"attributes", attrs},
    };
}

nlohmann::json urnkit::cli::to_json(const std::map<std::string, std::string>& attrs) {
    auto ret = nlohmann::json::object();
    for (auto& [key, value] : attrs) {
        ret[key] = value;
    }
    return ret;
}
