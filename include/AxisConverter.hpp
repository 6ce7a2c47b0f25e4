#ifndef AXIS_CONVERTER_HPP
#define AXIS_CONVERTER_HPP

#include "TimeUnit.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstddef>
#include <utility>

namespace PTAX {

/**
 * @brief Thrown when a bound value array does not match its time axis
 */
class ShapeMismatchError : public std::runtime_error {
public:
    ShapeMismatchError(size_t axis_length, size_t value_length);

    size_t axisLength() const { return axis_length_; }
    size_t valueLength() const { return value_length_; }

private:
    size_t axis_length_;
    size_t value_length_;
};

/**
 * @brief Result of re-expressing an axis under another convention
 *
 * When @c reordered is set the values were reversed to keep the axis
 * ascending; arrays indexed like the input axis must be reversed too.
 */
struct AxisConversion {
    std::vector<double> values;
    bool reordered;

    AxisConversion() : reordered(false) {}
    AxisConversion(std::vector<double> v, bool r) : values(std::move(v)), reordered(r) {}
};

/**
 * @brief Linear re-projection of time axes between conventions
 *
 * Each value goes through absolute astronomical years:
 *   year  = datum_from + sign_from * value * 10^scale_from
 *   value = sign_to * (year - datum_to) / 10^scale_to
 *
 * Usage:
 * @code
 * AxisConverter converter;
 * AxisConversion bp = converter.convert(years_ce, "years", "yr BP");
 * std::vector<double> sst = reorderBoundValues(raw_sst, bp.values.size(), bp.reordered);
 * @endcode
 */
class AxisConverter {
public:
    explicit AxisConverter(const TimeUnitRegistry& registry = TimeUnitRegistryManager::getInstance())
        : registry_(registry) {}

    /**
     * @brief Convert an axis between two descriptors
     * @param values Axis values under @p from
     * @param from Current convention
     * @param to Target convention
     * @return Converted values, reversed if the transform made them descend
     */
    AxisConversion convert(const std::vector<double>& values,
                           const UnitDescriptor& from,
                           const UnitDescriptor& to) const;

    /**
     * @brief Convert an axis between two labels
     * @throws UnrecognizedUnitError if either label is unknown
     */
    AxisConversion convert(const std::vector<double>& values,
                           const std::string& from_unit,
                           const std::string& to_unit) const;

    const TimeUnitRegistry& registry() const { return registry_; }

    // Scalar transforms through the absolute-year frame
    static double toAbsoluteYear(double value, const UnitDescriptor& unit);
    static double fromAbsoluteYear(double year, const UnitDescriptor& unit);

    /**
     * @brief True if strictly decreasing steps outnumber increasing ones
     *
     * Steps are taken between consecutive non-NaN values; equal values
     * count as neither. Empty and single-element axes are never decreasing.
     */
    static bool isPredominantlyDecreasing(const std::vector<double>& values);

private:
    const TimeUnitRegistry& registry_;
};

/**
 * @brief Apply an axis reordering to a co-indexed value array
 * @param values Array bound one-to-one to the axis
 * @param axis_length Length of the converted axis
 * @param reordered Flag from the conversion
 * @return Copy of @p values, reversed when @p reordered is set
 * @throws ShapeMismatchError if values.size() != axis_length
 */
std::vector<double> reorderBoundValues(const std::vector<double>& values,
                                       size_t axis_length,
                                       bool reordered);

} // namespace PTAX

#endif // AXIS_CONVERTER_HPP
