#include "latex_converter.hpp"

#include <nlohmann/json.hpp>

namespace mathwords::engine {

std::string LatexConfig::toJson() const {
    nlohmann::json j = {
        {"pretty_print", prettyPrint},
        {"xml_namespace", xmlNamespace},
        {"macros", nlohmann::json::object()}
    };
    for (const auto& [name, body] : macros) {
        j["macros"][name] = body;
    }
    return j.dump();
}

} // namespace mathwords::engine
