#include "TimeUnit.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace PTAX {

// =============================================================================
// UnitDescriptor Implementation
// =============================================================================

std::string UnitDescriptor::axisName() const {
    return isRetrograde() ? "Age" : "Time";
}

std::string UnitDescriptor::toString() const {
    std::stringstream ss;
    ss << "{" << scale_exponent << ", "
       << (direction == TimeDirection::PROGRADE ? "PROGRADE" : "RETROGRADE")
       << ", " << datum_offset << "}";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const UnitDescriptor& descriptor) {
    return os << descriptor.toString();
}

UnrecognizedUnitError::UnrecognizedUnitError(const std::string& label)
    : std::runtime_error("Unrecognized time unit: '" + label + "'"),
      label_(label) {}

// =============================================================================
// TimeUnitRegistry Implementation
// =============================================================================

TimeUnitRegistry::TimeUnitRegistry() {
    initializeDatabase();
}

void TimeUnitRegistry::initializeDatabase() {
    // Registration order decides the canonical label of each descriptor
    addYearConventions();
    addBeforePresentConventions();
    addKiloyearConventions();
    addMegayearConventions();
    addGigayearConventions();
    addB2kConventions();
}

// =============================================================================
// Calendar Years
// =============================================================================

void TimeUnitRegistry::addYearConventions() {
    UnitDescriptor year_ce(0, TimeDirection::PROGRADE, 0.0);

    registerConvention(TimeConvention("years", year_ce, "years CE",
        {"year", "yr", "yrs", "y",
         "year CE", "years CE", "yr CE", "yrs CE",
         "year AD", "years AD", "yr AD", "yrs AD",
         "CE", "AD"}));
}

// =============================================================================
// Before Present (datum 1950)
// =============================================================================

void TimeUnitRegistry::addBeforePresentConventions() {
    UnitDescriptor year_bp(0, TimeDirection::RETROGRADE, 1950.0);

    registerConvention(TimeConvention("years BP", year_bp, "years before present",
        {"y BP", "yr BP", "yrs BP", "year BP", "BP"}));
}

void TimeUnitRegistry::addKiloyearConventions() {
    UnitDescriptor kyr_bp(3, TimeDirection::RETROGRADE, 1950.0);

    // Bare kilo-year labels are ages
    registerConvention(TimeConvention("ky BP", kyr_bp, "kiloyears before present",
        {"kyr BP", "kyrs BP", "ka BP", "ka", "ky", "kyr", "kyrs"}));
}

void TimeUnitRegistry::addMegayearConventions() {
    UnitDescriptor myr_bp(6, TimeDirection::RETROGRADE, 1950.0);

    registerConvention(TimeConvention("my BP", myr_bp, "megayears before present",
        {"myr BP", "myrs BP", "ma BP", "ma", "my", "myr", "myrs"}));
}

void TimeUnitRegistry::addGigayearConventions() {
    UnitDescriptor gyr_bp(9, TimeDirection::RETROGRADE, 1950.0);

    registerConvention(TimeConvention("Ga BP", gyr_bp, "gigayears before present",
        {"gy BP", "gyr BP", "gyrs BP", "ga", "gy", "gyr", "gyrs"}));
}

// =============================================================================
// Before 2000 CE (ice-core chronologies)
// =============================================================================

void TimeUnitRegistry::addB2kConventions() {
    UnitDescriptor year_b2k(0, TimeDirection::RETROGRADE, 2000.0);
    UnitDescriptor kyr_b2k(3, TimeDirection::RETROGRADE, 2000.0);

    registerConvention(TimeConvention("years b2k", year_b2k, "years before 2000",
        {"y b2k", "yr b2k", "yrs b2k", "year b2k", "b2k"}));
    registerConvention(TimeConvention("ky b2k", kyr_b2k, "kiloyears before 2000",
        {"kyr b2k", "ka b2k"}));
}

// =============================================================================
// Registration
// =============================================================================

void TimeUnitRegistry::registerConvention(const TimeConvention& convention) {
    std::vector<std::string> labels;
    labels.push_back(convention.name);
    labels.insert(labels.end(), convention.aliases.begin(), convention.aliases.end());

    // Validate every label before touching the table
    for (const auto& label : labels) {
        std::string key = normalize(label);
        if (key.empty()) {
            throw std::runtime_error("Empty label in time convention '" +
                                     convention.name + "'");
        }
        auto it = index_.find(key);
        if (it != index_.end() &&
            conventions_[it->second].descriptor != convention.descriptor) {
            throw std::runtime_error("Label '" + label + "' is already bound to '" +
                                     conventions_[it->second].name + "'");
        }
    }

    size_t row = conventions_.size();
    conventions_.push_back(convention);
    families_[convention.family].push_back(row);

    for (const auto& label : labels) {
        bindLabel(label, row);
    }
}

void TimeUnitRegistry::bindLabel(const std::string& label, size_t row) {
    // An earlier row with the same descriptor keeps the label
    index_.emplace(normalize(label), row);
}

void TimeUnitRegistry::addConvention(const TimeConvention& convention) {
    registerConvention(convention);
}

void TimeUnitRegistry::addAlias(const std::string& name, const std::string& alias) {
    auto it = index_.find(normalize(name));
    if (it == index_.end()) {
        throw UnrecognizedUnitError(name);
    }

    std::string key = normalize(alias);
    if (key.empty()) {
        throw std::runtime_error("Empty alias for time unit '" + name + "'");
    }

    TimeConvention& convention = conventions_[it->second];
    auto existing = index_.find(key);
    if (existing != index_.end()) {
        if (conventions_[existing->second].descriptor != convention.descriptor) {
            throw std::runtime_error("Label '" + alias + "' is already bound to '" +
                                     conventions_[existing->second].name + "'");
        }
        return;
    }

    convention.aliases.push_back(alias);
    bindLabel(alias, it->second);
}

// =============================================================================
// Resolution
// =============================================================================

std::string TimeUnitRegistry::normalize(const std::string& label) {
    std::string key;
    key.reserve(label.size());
    for (unsigned char c : label) {
        if (std::isspace(c) || c == '.') continue;
        key.push_back(static_cast<char>(std::tolower(c)));
    }
    return key;
}

UnitDescriptor TimeUnitRegistry::defaultDescriptor() {
    return UnitDescriptor(0, TimeDirection::PROGRADE, 0.0);
}

UnitDescriptor TimeUnitRegistry::resolve(const std::string& label) const {
    bool blank = std::all_of(label.begin(), label.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        return defaultDescriptor();
    }

    const TimeConvention* convention = getConvention(label);
    if (!convention) {
        throw UnrecognizedUnitError(label);
    }
    return convention->descriptor;
}

const TimeConvention* TimeUnitRegistry::getConvention(const std::string& label) const {
    auto it = index_.find(normalize(label));
    if (it == index_.end()) {
        return nullptr;
    }
    return &conventions_[it->second];
}

bool TimeUnitRegistry::hasUnit(const std::string& label) const {
    return getConvention(label) != nullptr;
}

std::string TimeUnitRegistry::canonicalLabel(const UnitDescriptor& descriptor) const {
    for (const auto& convention : conventions_) {
        if (convention.descriptor == descriptor) {
            return convention.name;
        }
    }
    throw UnrecognizedUnitError(descriptor.toString());
}

std::vector<const TimeConvention*> TimeUnitRegistry::getConventions() const {
    std::vector<const TimeConvention*> result;
    result.reserve(conventions_.size());
    for (const auto& convention : conventions_) {
        result.push_back(&convention);
    }
    return result;
}

std::vector<std::string> TimeUnitRegistry::getFamilies() const {
    std::vector<std::string> result;
    for (const auto& pair : families_) {
        result.push_back(pair.first);
    }
    return result;
}

std::vector<const TimeConvention*>
TimeUnitRegistry::getConventionsInFamily(const std::string& family) const {
    std::vector<const TimeConvention*> result;
    auto it = families_.find(family);
    if (it != families_.end()) {
        for (size_t row : it->second) {
            result.push_back(&conventions_[row]);
        }
    }
    return result;
}

// =============================================================================
// Utility Functions
// =============================================================================

void TimeUnitRegistry::printDatabase(std::ostream& os) const {
    os << "Time Convention Database\n";
    os << "========================\n\n";

    for (const auto& family_pair : families_) {
        os << "Family: " << family_pair.first << "\n";
        os << std::string(40, '-') << "\n";

        for (size_t row : family_pair.second) {
            const TimeConvention& c = conventions_[row];
            os << std::setw(12) << std::left << c.name
               << " " << std::setw(28) << c.descriptor.toString()
               << " " << c.descriptor.axisName() << "\n";
            if (!c.aliases.empty()) {
                os << "    aliases:";
                for (const auto& alias : c.aliases) {
                    os << " '" << alias << "'";
                }
                os << "\n";
            }
        }
        os << "\n";
    }
}

std::string TimeUnitRegistry::generateDocumentation() const {
    std::stringstream ss;

    ss << "# PTAX Time Conventions\n\n";
    ss << "Labels are matched ignoring case, whitespace and periods.\n";
    ss << "A missing label is read as years CE.\n\n";
    ss << "| Label | Scale exponent | Direction | Datum | Aliases |\n";
    ss << "|-------|----------------|-----------|-------|---------|\n";

    for (const auto& c : conventions_) {
        ss << "| " << c.name
           << " | " << c.descriptor.scale_exponent
           << " | " << (c.descriptor.isRetrograde() ? "retrograde" : "prograde")
           << " | " << c.descriptor.datum_offset
           << " | ";
        for (size_t i = 0; i < c.aliases.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << c.aliases[i];
        }
        ss << " |\n";
    }

    return ss.str();
}

} // namespace PTAX
