#include <sift/app/module_router.h>
#include <sift/core/types.h>
#include <sift/core/uuid.h>

#include <spdlog/spdlog.h>
#include <new>
#include <stdexcept>

namespace sift::app {

namespace {

json routeError(const json& request, std::string message, ErrorCode code) {
    json id = "unknown";
    if (request.is_object()) {
        if (auto it = request.find("id"); it != request.end() && !it->is_null())
            id = *it;
    }
    return json{{"success", false},
                {"data", nullptr},
                {"error", std::move(message)},
                {"error_code", errorKindName(code)},
                {"id", std::move(id)}};
}

} // namespace

void ModuleRouter::registerModule(std::string name, ModuleHandler handler) {
    spdlog::debug("[ModuleRouter] registered module '{}'", name);
    modules_[std::move(name)] = std::move(handler);
}

bool ModuleRouter::hasModule(std::string_view name) const {
    return modules_.find(name) != modules_.end();
}

std::vector<std::string> ModuleRouter::modules() const {
    std::vector<std::string> out;
    out.reserve(modules_.size());
    for (const auto& [name, _] : modules_)
        out.push_back(name);
    return out;
}

json ModuleRouter::createRequest(std::string module, std::string action, json data) {
    return json{{"module", std::move(module)},
                {"action", std::move(action)},
                {"data", std::move(data)},
                {"id", core::generateUUID()}};
}

json ModuleRouter::route(const json& request) const {
    if (!request.is_object())
        return routeError(request, "Request must be a JSON object", ErrorCode::InvalidRequest);

    auto moduleIt = request.find("module");
    if (moduleIt == request.end() || !moduleIt->is_string() ||
        moduleIt->get_ref<const std::string&>().empty()) {
        return routeError(request, "No module specified", ErrorCode::MissingParameter);
    }
    const auto& name = moduleIt->get_ref<const std::string&>();

    auto it = modules_.find(name);
    if (it == modules_.end())
        return routeError(request, "Module " + name + " not found", ErrorCode::NotFound);

    try {
        return it->second(request);
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::warn("[ModuleRouter] module '{}' failed: {}", name, e.what());
        return routeError(request, e.what(), ErrorCode::InternalError);
    }
}

} // namespace sift::app
