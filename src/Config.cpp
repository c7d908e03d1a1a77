#include "saxsred/Config.hpp"
#include "saxsred/Errors.hpp"
#include "saxsred/JsonUtils.hpp"

#include <unordered_map>

namespace saxsred {

namespace {

const std::unordered_map<std::string, TransMode> kModeMap = {
    {"external",       TransMode::External},
    {"beam_center",    TransMode::FromBeamCenter},
    {"waxs",           TransMode::FromWaxs}
};

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, T& out)
{
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfigurationError(std::string("config key '") + key +
                                        "': " + e.what());
    }
}

} // unnamed namespace

TransMode trans_mode_from_string(const std::string& name)
{
    auto it = kModeMap.find(name);
    if (it == kModeMap.end())
        throw InvalidConfigurationError("invalid trans mode: " + name);
    return it->second;
}

std::string to_string(TransMode mode)
{
    for (const auto& kv : kModeMap)
        if (kv.second == mode) return kv.first;
    throw InvalidConfigurationError("invalid trans mode: " +
                                    std::to_string(static_cast<int>(mode)));
}

ProcessingConfig config_from_json(const nlohmann::json& j)
{
    if (!j.is_object())
        throw InvalidConfigurationError("processing config must be a JSON object");

    ProcessingConfig cfg;

    if (j.contains("transMode")) {
        const auto& m = j.at("transMode");
        if (!m.is_string())
            throw InvalidConfigurationError("config key 'transMode' must be a string");
        cfg.trans_mode = trans_mode_from_string(m.get<std::string>());
    }
    read_optional(j, "beamHalfWidth",  cfg.beam_half_width);
    read_optional(j, "beamHalfHeight", cfg.beam_half_height);
    read_optional(j, "waxsThreshold",  cfg.waxs_threshold);
    read_optional(j, "waterPeakQmin",  cfg.water_peak_qmin);
    read_optional(j, "waterPeakQmax",  cfg.water_peak_qmax);
    read_optional(j, "plotOffset",     cfg.plot_offset);
    read_optional(j, "verbose",        cfg.verbose);

    if (cfg.beam_half_width < 1 || cfg.beam_half_height < 1)
        throw InvalidConfigurationError("beam half sizes must be >= 1");
    if (cfg.water_peak_qmax <= cfg.water_peak_qmin)
        throw InvalidConfigurationError("waterPeakQmax must exceed waterPeakQmin");

    return cfg;
}

nlohmann::json config_to_json(const ProcessingConfig& cfg)
{
    return {
        {"transMode",      to_string(cfg.trans_mode)},
        {"beamHalfWidth",  cfg.beam_half_width},
        {"beamHalfHeight", cfg.beam_half_height},
        {"waxsThreshold",  cfg.waxs_threshold},
        {"waterPeakQmin",  cfg.water_peak_qmin},
        {"waterPeakQmax",  cfg.water_peak_qmax},
        {"plotOffset",     cfg.plot_offset},
        {"verbose",        cfg.verbose}
    };
}

ProcessingConfig load_config(const std::string& path)
{
    auto j = load_json(path);
    expand_env(j);
    return config_from_json(j);
}

} // namespace saxsred
