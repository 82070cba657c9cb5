#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sift::app {

using json = nlohmann::json;

using ModuleHandler = std::function<json(const json& request)>;

// Routes {"module": "<name>", "action": ..., "data": ..., "id": ...} to the handler
// registered under that module name.
class ModuleRouter {
public:
    // Replaces any handler already registered under `name`.
    void registerModule(std::string name, ModuleHandler handler);
    bool hasModule(std::string_view name) const;
    std::vector<std::string> modules() const;

    // Request envelope with a fresh UUID v4 id
    static json createRequest(std::string module, std::string action, json data);

    // Unknown or missing modules and handler failures come back as error responses that
    // echo the request id ("unknown" when it has none).
    json route(const json& request) const;

private:
    std::map<std::string, ModuleHandler, std::less<>> modules_;
};

} // namespace sift::app
