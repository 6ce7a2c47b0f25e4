#include "AxisConverter.hpp"
#include <algorithm>
#include <cmath>

namespace PTAX {

ShapeMismatchError::ShapeMismatchError(size_t axis_length, size_t value_length)
    : std::runtime_error("Shape mismatch: time axis has " + std::to_string(axis_length) +
                         " values but bound array has " + std::to_string(value_length)),
      axis_length_(axis_length), value_length_(value_length) {}

// =============================================================================
// Scalar Transforms
// =============================================================================

double AxisConverter::toAbsoluteYear(double value, const UnitDescriptor& unit) {
    return unit.datum_offset + unit.sign() * value * unit.scaleFactor();
}

double AxisConverter::fromAbsoluteYear(double year, const UnitDescriptor& unit) {
    return unit.sign() * (year - unit.datum_offset) / unit.scaleFactor();
}

bool AxisConverter::isPredominantlyDecreasing(const std::vector<double>& values) {
    size_t increasing = 0;
    size_t decreasing = 0;
    bool have_previous = false;
    double previous = 0.0;

    // Steps between consecutive non-NaN values
    for (double value : values) {
        if (std::isnan(value)) continue;
        if (have_previous) {
            if (value > previous) {
                ++increasing;
            } else if (value < previous) {
                ++decreasing;
            }
        }
        previous = value;
        have_previous = true;
    }

    return decreasing > increasing;
}

// =============================================================================
// Axis Conversion
// =============================================================================

AxisConversion AxisConverter::convert(const std::vector<double>& values,
                                      const UnitDescriptor& from,
                                      const UnitDescriptor& to) const {
    if (from == to) {
        return AxisConversion(values, false);
    }

    std::vector<double> result;
    result.reserve(values.size());
    for (double value : values) {
        result.push_back(fromAbsoluteYear(toAbsoluteYear(value, from), to));
    }

    bool reordered = isPredominantlyDecreasing(result);
    if (reordered) {
        std::reverse(result.begin(), result.end());
    }

    return AxisConversion(std::move(result), reordered);
}

AxisConversion AxisConverter::convert(const std::vector<double>& values,
                                      const std::string& from_unit,
                                      const std::string& to_unit) const {
    UnitDescriptor from = registry_.resolve(from_unit);
    UnitDescriptor to = registry_.resolve(to_unit);
    return convert(values, from, to);
}

// =============================================================================
// Collaborator Boundary
// =============================================================================

std::vector<double> reorderBoundValues(const std::vector<double>& values,
                                       size_t axis_length,
                                       bool reordered) {
    if (values.size() != axis_length) {
        throw ShapeMismatchError(axis_length, values.size());
    }

    std::vector<double> result(values);
    if (reordered) {
        std::reverse(result.begin(), result.end());
    }
    return result;
}

} // namespace PTAX
