#ifndef TIME_AXIS_HPP
#define TIME_AXIS_HPP

#include "TimeUnit.hpp"
#include "AxisConverter.hpp"
#include <string>
#include <vector>

namespace PTAX {

struct TimeAxisConversion;

/**
 * @brief Time values together with the convention they are expressed in
 *
 * The raw label is kept next to the resolved descriptor so that output
 * carries the label the caller asked for ("ka" stays "ka").
 */
class TimeAxis {
public:
    TimeAxis();

    /**
     * @brief Build an axis from values and a label
     * @param time_unit Unit label; blank selects years CE
     * @throws UnrecognizedUnitError if the label is unknown
     */
    TimeAxis(std::vector<double> values, const std::string& time_unit = "",
             const TimeUnitRegistry& registry = TimeUnitRegistryManager::getInstance());

    TimeAxis(std::vector<double> values, const UnitDescriptor& descriptor,
             const std::string& time_unit);

    const std::vector<double>& values() const { return values_; }
    const UnitDescriptor& descriptor() const { return descriptor_; }
    const std::string& timeUnit() const { return time_unit_; }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    // Non-decreasing, NaN entries ignored
    bool isAscending() const;

    // Axis title: "Age" or "Time"
    std::string timeName() const { return descriptor_.axisName(); }

    /**
     * @brief Re-express the axis under another label
     * @throws UnrecognizedUnitError if @p time_unit is unknown
     */
    TimeAxisConversion convertTo(const std::string& time_unit,
                                 const TimeUnitRegistry& registry =
                                     TimeUnitRegistryManager::getInstance()) const;

    TimeAxisConversion convertTo(const UnitDescriptor& descriptor,
                                 const std::string& time_unit) const;

private:
    std::vector<double> values_;
    UnitDescriptor descriptor_;
    std::string time_unit_;
};

struct TimeAxisConversion {
    TimeAxis axis;
    bool reordered;
};

} // namespace PTAX

#endif // TIME_AXIS_HPP
