#ifndef TIME_UNIT_HPP
#define TIME_UNIT_HPP

#include <string>
#include <map>
#include <vector>
#include <iosfwd>
#include <stdexcept>
#include <cmath>

namespace PTAX {

/**
 * @brief Sense in which increasing label values move through time
 */
enum class TimeDirection {
    PROGRADE,     // values increase forward in time (years CE)
    RETROGRADE    // values count backward from the datum (ages, BP)
};

/**
 * @brief Fully resolved time convention
 *
 * A label value v maps to the absolute astronomical year
 *   datum_offset + sign * v * 10^scale_exponent
 * with sign = +1 for prograde and -1 for retrograde conventions.
 */
struct UnitDescriptor {
    int scale_exponent;        // Power of ten from the base unit to years
    TimeDirection direction;
    double datum_offset;       // Zero point in years (1950 for BP)

    UnitDescriptor()
        : scale_exponent(0), direction(TimeDirection::PROGRADE), datum_offset(0.0) {}

    explicit UnitDescriptor(int exponent,
                            TimeDirection dir = TimeDirection::PROGRADE,
                            double datum = 0.0)
        : scale_exponent(exponent), direction(dir), datum_offset(datum) {}

    bool operator==(const UnitDescriptor& other) const {
        return scale_exponent == other.scale_exponent &&
               direction == other.direction &&
               datum_offset == other.datum_offset;
    }

    bool operator!=(const UnitDescriptor& other) const {
        return !(*this == other);
    }

    double sign() const {
        return direction == TimeDirection::PROGRADE ? 1.0 : -1.0;
    }

    double scaleFactor() const {
        return std::pow(10.0, scale_exponent);
    }

    bool isRetrograde() const { return direction == TimeDirection::RETROGRADE; }

    // "Age" for retrograde conventions, "Time" otherwise
    std::string axisName() const;

    // e.g. "{3, RETROGRADE, 1950}"
    std::string toString() const;
};

std::ostream& operator<<(std::ostream& os, const UnitDescriptor& descriptor);

/**
 * @brief Thrown when a label matches none of the registered conventions
 */
class UnrecognizedUnitError : public std::runtime_error {
public:
    explicit UnrecognizedUnitError(const std::string& label);

    const std::string& label() const { return label_; }

private:
    std::string label_;
};

/**
 * @brief One row of the convention table
 */
struct TimeConvention {
    std::string name;                  // Canonical label (e.g., "ky BP")
    UnitDescriptor descriptor;
    std::string family;                // Family for organization
    std::vector<std::string> aliases;  // Alternative labels

    TimeConvention() = default;

    TimeConvention(const std::string& n, const UnitDescriptor& d,
                   const std::string& fam = "",
                   const std::vector<std::string>& alias_list = {})
        : name(n), descriptor(d), family(fam), aliases(alias_list) {}
};

/**
 * @brief Table-driven resolver from free-form labels to descriptors
 *
 * Labels are matched after normalization (lower case, whitespace and
 * periods removed), so "ky BP", "KY  bp" and "ky B.P." are one key.
 * A blank label resolves to the year-CE default.
 */
class TimeUnitRegistry {
public:
    TimeUnitRegistry();
    ~TimeUnitRegistry() = default;

    // =========================================================================
    // Resolution
    // =========================================================================

    /**
     * @brief Resolve a label to its descriptor
     * @param label Free-form unit label; blank means "not supplied"
     * @return Descriptor of the matching convention, or the default
     * @throws UnrecognizedUnitError if a non-blank label matches nothing
     */
    UnitDescriptor resolve(const std::string& label) const;

    /**
     * @brief Year-CE convention used when no label is supplied
     */
    static UnitDescriptor defaultDescriptor();

    /**
     * @brief Normalized lookup key for a label
     */
    static std::string normalize(const std::string& label);

    // =========================================================================
    // Table Access
    // =========================================================================

    /**
     * @brief Get convention by any of its labels
     * @return Pointer to the convention, or nullptr if not found
     */
    const TimeConvention* getConvention(const std::string& label) const;

    bool hasUnit(const std::string& label) const;

    /**
     * @brief Preferred display label for a descriptor
     * @throws UnrecognizedUnitError if no convention carries the descriptor
     */
    std::string canonicalLabel(const UnitDescriptor& descriptor) const;

    // Conventions in registration order
    std::vector<const TimeConvention*> getConventions() const;
    std::vector<std::string> getFamilies() const;
    std::vector<const TimeConvention*> getConventionsInFamily(const std::string& family) const;

    // =========================================================================
    // Extension
    // =========================================================================

    /**
     * @brief Add one row to the table
     * @throws std::runtime_error if a label is already bound to another descriptor
     */
    void addConvention(const TimeConvention& convention);

    /**
     * @brief Add an alternative label to an existing convention
     * @throws UnrecognizedUnitError if @p name is unknown
     */
    void addAlias(const std::string& name, const std::string& alias);

    // =========================================================================
    // Utility Functions
    // =========================================================================

    void printDatabase(std::ostream& os) const;
    std::string generateDocumentation() const;

private:
    // Normalized label -> index into conventions_
    std::map<std::string, size_t> index_;

    // Rows in registration order; the first row carrying a descriptor is
    // its canonical one
    std::vector<TimeConvention> conventions_;

    // Family -> row indices
    std::map<std::string, std::vector<size_t>> families_;

    void initializeDatabase();

    void addYearConventions();
    void addBeforePresentConventions();
    void addKiloyearConventions();
    void addMegayearConventions();
    void addGigayearConventions();
    void addB2kConventions();

    void registerConvention(const TimeConvention& convention);
    void bindLabel(const std::string& label, size_t row);
};

/**
 * @brief Shared immutable table with the standard conventions
 */
class TimeUnitRegistryManager {
public:
    static const TimeUnitRegistry& getInstance() {
        static const TimeUnitRegistry instance;
        return instance;
    }

private:
    TimeUnitRegistryManager() = default;
};

inline UnitDescriptor resolveTimeUnit(const std::string& label) {
    return TimeUnitRegistryManager::getInstance().resolve(label);
}

} // namespace PTAX

#endif // TIME_UNIT_HPP
