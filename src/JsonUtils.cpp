#include "saxsred/JsonUtils.hpp"
#include "saxsred/Errors.hpp"
#include <fstream>
#include <regex>
#include <cstdlib>

namespace saxsred {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw InvalidConfigurationError("Cannot open '" + path + "'");

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidConfigurationError("Error parsing JSON from " + path +
                                        ": " + e.what());
    }
    return j;
}

// ${NAME} -> value of the environment variable NAME; unset names are an error
static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");

    std::string out;
    auto last = input.cbegin();
    for (std::sregex_iterator it(input.begin(), input.end(), re), end; it != end; ++it) {
        const std::string name = (*it)[1];
        const char* value = std::getenv(name.c_str());
        if (!value)
            throw InvalidConfigurationError("environment variable '" + name +
                                            "' used in the configuration is not set");
        out.append(last, (*it)[0].first);
        out += value;
        last = (*it)[0].second;
    }
    out.append(last, input.cend());
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

} // namespace saxsred
