#ifndef PTAX_HPP
#define PTAX_HPP

// Paleo Time AXis conversion: labels -> descriptors -> converted axes

#include "TimeUnit.hpp"
#include "AxisConverter.hpp"
#include "TimeAxis.hpp"
#include "SeriesCollection.hpp"
#include "ConfigReader.hpp"

namespace PTAX {

constexpr const char* VERSION = "1.0.0";

} // namespace PTAX

#endif // PTAX_HPP
