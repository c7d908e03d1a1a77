#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace saxsred {

// How the transmitted beam intensity of a curve is obtained
enum class TransMode {
    External       = 0,    // supplied by the caller
    FromBeamCenter = 1,    // ROI sum through the semi-transparent beam stop
    FromWaxs       = 2     // water scattering near the WAXS peak
};

/*  All tunables of one batch run.  Built once before the run starts and
 *  passed by const reference into every pipeline entry point.           */
struct ProcessingConfig
{
    TransMode trans_mode       = TransMode::FromWaxs;

    int    beam_half_width     = 5;       // ROI half sizes around the beam centre
    int    beam_half_height    = 4;

    double waxs_threshold      = 300.0;   // minimum intensity for WAXS trans
    double water_peak_qmin     = 1.45;    // open window (qmin, qmax)
    double water_peak_qmax     = 3.45;

    double plot_offset         = 1.5;     // vertical offset between replicates
    bool   verbose             = true;
};

TransMode          trans_mode_from_string(const std::string& name);
std::string        to_string(TransMode mode);

/*  Keys that are absent keep their default value.  Unknown `transMode`
 *  strings and values of the wrong type raise InvalidConfigurationError. */
ProcessingConfig   config_from_json(const nlohmann::json& j);
nlohmann::json     config_to_json(const ProcessingConfig& cfg);

ProcessingConfig   load_config(const std::string& path);

} // namespace saxsred
