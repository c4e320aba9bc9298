#include "xray/core/config.h"

#include <stdexcept>

namespace xray {

namespace {

const nlohmann::json* findSection(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end()) return nullptr;
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("config section '") + key + "' must be an object");
    }
    return &*it;
}

template <typename T>
void readNumber(const nlohmann::json& section, const char* key, T& out, double minValue, double maxValue) {
    const auto it = section.find(key);
    if (it == section.end()) return;
    if (!it->is_number()) {
        throw std::invalid_argument(std::string("config key '") + key + "' must be a number");
    }
    const double v = it->get<double>();
    if (v < minValue || v > maxValue) {
        throw std::invalid_argument(std::string("config key '") + key + "' out of range");
    }
    out = static_cast<T>(v);
}

const char* policyName(UnterminatedPolicy policy) {
    return policy == UnterminatedPolicy::Emit ? "emit" : "drop";
}

} // namespace

XrayConfig configFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }

    XrayConfig config;

    if (const nlohmann::json* v = findSection(j, "visibility")) {
        readNumber(*v, "clipOverlapRatio", config.visibility.clipOverlapRatio, 0.0, 1.0);
        readNumber(*v, "cornerInsetPx", config.visibility.cornerInsetPx, 0.0, 1000.0);
    }

    if (const nlohmann::json* w = findSection(j, "walker")) {
        const auto it = w->find("unterminatedPolicy");
        if (it != w->end()) {
            if (!it->is_string()) {
                throw std::invalid_argument("config key 'unterminatedPolicy' must be a string");
            }
            const std::string policy = it->get<std::string>();
            if (policy == "drop") {
                config.walker.unterminatedPolicy = UnterminatedPolicy::Drop;
            } else if (policy == "emit") {
                config.walker.unterminatedPolicy = UnterminatedPolicy::Emit;
            } else {
                throw std::invalid_argument("config key 'unterminatedPolicy' must be 'drop' or 'emit'");
            }
        }
    }

    if (const nlohmann::json* o = findSection(j, "overlay")) {
        readNumber(*o, "padding", config.overlay.padding, 0.0, 1000.0);
        readNumber(*o, "minWidth", config.overlay.minWidth, 0.0, 10000.0);
        readNumber(*o, "minHeight", config.overlay.minHeight, 0.0, 10000.0);
        readNumber(*o, "tooltipTextLimit", config.overlay.tooltipTextLimit, 1.0, 100000.0);
        readNumber(*o, "tooltipValueLimit", config.overlay.tooltipValueLimit, 1.0, 100000.0);
        readNumber(*o, "tooltipFlipY", config.overlay.tooltipFlipY, -100000.0, 100000.0);
        readNumber(*o, "resizeDebounceMs", config.overlay.resizeDebounceMs, 0.0, 60000.0);
        const auto it = o->find("peekKey");
        if (it != o->end()) {
            if (!it->is_string() || it->get<std::string>().empty()) {
                throw std::invalid_argument("config key 'peekKey' must be a non-empty string");
            }
            config.overlay.peekKey = it->get<std::string>();
        }
    }

    return config;
}

nlohmann::json configToJson(const XrayConfig& config) {
    return nlohmann::json{
        {"visibility", {
            {"clipOverlapRatio", config.visibility.clipOverlapRatio},
            {"cornerInsetPx", config.visibility.cornerInsetPx},
        }},
        {"walker", {
            {"unterminatedPolicy", policyName(config.walker.unterminatedPolicy)},
        }},
        {"overlay", {
            {"padding", config.overlay.padding},
            {"minWidth", config.overlay.minWidth},
            {"minHeight", config.overlay.minHeight},
            {"tooltipTextLimit", config.overlay.tooltipTextLimit},
            {"tooltipValueLimit", config.overlay.tooltipValueLimit},
            {"tooltipFlipY", config.overlay.tooltipFlipY},
            {"resizeDebounceMs", config.overlay.resizeDebounceMs},
            {"peekKey", config.overlay.peekKey},
        }},
    };
}

} // namespace xray
