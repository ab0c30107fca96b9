#include "FilterConfig.hpp"

#include <fstream>

using json = nlohmann::json;

namespace PhotoCull
{

FilterConfig::FilterConfig() = default;

void FilterConfig::validate() const {
    if (dark_threshold < 0.0 || dark_threshold > 1.0) {
        throw ConfigurationError("dark_threshold must be between 0 and 1, got " + std::to_string(dark_threshold));
    }
    if (bright_threshold < 0.0 || bright_threshold > 1.0) {
        throw ConfigurationError("bright_threshold must be between 0 and 1, got " + std::to_string(bright_threshold));
    }
    if (min_width < 0 || min_height < 0) {
        throw ConfigurationError("min_width and min_height must not be negative");
    }
    if (duplicate_similarity < 0 || duplicate_similarity > 64) {
        throw ConfigurationError("duplicate_similarity must be between 0 and 64, got " + std::to_string(duplicate_similarity));
    }
    if (needsFaceDetector() && cascade_dir.empty()) {
        throw ConfigurationError("cascade_dir is required for face detection");
    }
}

json FilterConfig::enabledChecks() const {
    return {
        {"check_blur", check_blur},
        {"check_exposure", check_exposure},
        {"check_resolution", check_resolution},
        {"check_noise", check_noise},
        {"check_duplicates", check_duplicates},
        {"check_closed_eyes", check_closed_eyes},
        {"filter_no_people", filter_no_people}
    };
}

namespace {

template <typename T>
void overlay(const json& j, const char* key, T& field) {
    if (!j.contains(key)) return;
    try {
        field = j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

FilterConfig FilterConfig::fromJson(const json& j, FilterConfig base) {
    if (!j.is_object()) {
        throw ConfigurationError("configuration must be a JSON object");
    }
    overlay(j, "check_blur", base.check_blur);
    overlay(j, "blur_threshold", base.blur_threshold);
    overlay(j, "check_exposure", base.check_exposure);
    overlay(j, "dark_threshold", base.dark_threshold);
    overlay(j, "bright_threshold", base.bright_threshold);
    overlay(j, "check_resolution", base.check_resolution);
    overlay(j, "min_width", base.min_width);
    overlay(j, "min_height", base.min_height);
    overlay(j, "check_noise", base.check_noise);
    overlay(j, "noise_threshold", base.noise_threshold);
    overlay(j, "check_duplicates", base.check_duplicates);
    overlay(j, "duplicate_similarity", base.duplicate_similarity);
    overlay(j, "check_closed_eyes", base.check_closed_eyes);
    overlay(j, "filter_no_people", base.filter_no_people);
    overlay(j, "cascade_dir", base.cascade_dir);
    return base;
}

FilterConfig FilterConfig::loadFile(const fs::path& path, FilterConfig base) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigurationError("cannot open config file '" + path.string() + "'");
    }
    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("cannot parse config file '" + path.string() + "': " + e.what());
    }
    return fromJson(j, base);
}

} // namespace PhotoCull
