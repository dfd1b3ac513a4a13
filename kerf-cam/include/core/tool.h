#ifndef KERF_CAM_TOOL_H
#define KERF_CAM_TOOL_H

#include <optional>

namespace kerf {
namespace cam {

/**
 * Cutting tool for an operation. Unset fields keep the job's current value.
 */
struct Tool {
    std::optional<double> diameter;     // Tool diameter in job units
    std::optional<int> number;          // Tool changer slot
    std::optional<double> feed;         // Feed rate for X/Y movement (units/min)
    std::optional<int> speed;           // Spindle speed (RPM)

    Tool() = default;
    Tool(std::optional<double> d, std::optional<int> n = std::nullopt,
         std::optional<double> f = std::nullopt, std::optional<int> s = std::nullopt)
        : diameter(d), number(n), feed(f), speed(s) {}

    std::optional<double> radius() const {
        if (!diameter) {
            return std::nullopt;
        }
        return *diameter / 2.0;
    }

    // Check the values that are set
    bool isValid() const {
        return (!diameter || *diameter > 0.0) &&
               (!number || *number >= 0) &&
               (!feed || *feed > 0.0) &&
               (!speed || *speed >= 0);
    }
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_TOOL_H
