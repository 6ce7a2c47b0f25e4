#include "TimeAxis.hpp"
#include <cmath>
#include <utility>

namespace PTAX {

TimeAxis::TimeAxis()
    : descriptor_(TimeUnitRegistry::defaultDescriptor()) {}

TimeAxis::TimeAxis(std::vector<double> values, const std::string& time_unit,
                   const TimeUnitRegistry& registry)
    : values_(std::move(values)),
      descriptor_(registry.resolve(time_unit)),
      time_unit_(time_unit) {}

TimeAxis::TimeAxis(std::vector<double> values, const UnitDescriptor& descriptor,
                   const std::string& time_unit)
    : values_(std::move(values)), descriptor_(descriptor), time_unit_(time_unit) {}

bool TimeAxis::isAscending() const {
    double previous = NAN;
    for (double value : values_) {
        if (std::isnan(value)) continue;
        if (!std::isnan(previous) && value < previous) {
            return false;
        }
        previous = value;
    }
    return true;
}

TimeAxisConversion TimeAxis::convertTo(const std::string& time_unit,
                                       const TimeUnitRegistry& registry) const {
    return convertTo(registry.resolve(time_unit), time_unit);
}

TimeAxisConversion TimeAxis::convertTo(const UnitDescriptor& descriptor,
                                       const std::string& time_unit) const {
    AxisConverter converter;
    AxisConversion converted = converter.convert(values_, descriptor_, descriptor);

    return TimeAxisConversion{TimeAxis(std::move(converted.values), descriptor, time_unit),
                              converted.reordered};
}

} // namespace PTAX
