#include "core/job_settings.h"
#include <stdexcept>

namespace kerf {
namespace cam {

double calculateOffset(double toolRadius, const std::optional<OffsetInput>& offset,
                       double defaultMultiplier) {
    OffsetInput input = offset ? *offset : OffsetInput(defaultMultiplier);
    return toolRadius * input.multiplier + input.distance;
}

double JobSettings::getPlungeFeed() const {
    return plungeFeed ? *plungeFeed : feed;
}

double JobSettings::getRapidHeight() const {
    if (rapidHeight) {
        return *rapidHeight;
    }
    return unit == Unit::Metric ? 10.0 : 0.4;
}

double JobSettings::getOpSafeHeight() const {
    if (opSafeHeight) {
        return *opSafeHeight;
    }
    return unit == Unit::Metric ? 1.0 : 0.04;
}

double JobSettings::requireToolRadius(const std::string& operation) const {
    if (!toolDiameter) {
        throw std::invalid_argument(operation + " requires a tool diameter");
    }
    if (*toolDiameter <= 0.0) {
        throw std::invalid_argument(operation + " requires a positive tool diameter");
    }
    return *toolDiameter / 2.0;
}

std::string JobSettings::getUnitName() const {
    return unit == Unit::Metric ? "METRIC" : "IMPERIAL";
}

std::string JobSettings::getUnitCode() const {
    return unit == Unit::Metric ? "G21" : "G20";
}

} // namespace cam
} // namespace kerf
