#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "TimeUnit.hpp"
#include "SeriesCollection.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace PTAX {

/**
 * @brief INI-style reader for conversion jobs
 *
 * A job names an optional shared target unit and any number of series:
 *
 * @code
 * [conversion]
 * target_unit = ky BP
 * num_threads = 2
 *
 * [series.ODP846]
 * time_unit = yr BP
 * time = 100, 200, 300
 * value = 3.1, 3.4, 3.2
 * @endcode
 */
class ConfigReader {
public:
    // =========================================================================
    // Nested Struct Definitions
    // =========================================================================

    struct ConversionConfig {
        std::string target_unit;   // Blank keeps member units
        int num_threads;
        bool verbose;

        ConversionConfig() : num_threads(1), verbose(false) {}

        ConversionOptions toOptions() const;
    };

    struct SeriesConfig {
        std::string name;               // Section suffix after "series."
        std::string time_unit;
        std::vector<double> time;
        std::vector<double> value;      // Optional, co-indexed with time
        std::vector<std::string> rejected;  // "time: token" entries that did not parse
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    static constexpr const char* CONVERSION_SECTION = "conversion";
    static constexpr const char* SERIES_PREFIX = "series.";

    // =========================================================================
    // Constructor/Destructor
    // =========================================================================

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Load configuration text (same syntax as a file)
    bool loadString(const std::string& text);

    // =========================================================================
    // Job Parsing
    // =========================================================================

    /**
     * @brief Parse the [conversion] section
     * @return false if the section is missing (config keeps its defaults)
     */
    bool parseConversionConfig(ConversionConfig& config) const;

    /**
     * @brief Parse every [series.*] section in file order
     */
    std::vector<SeriesConfig> parseSeries() const;

    static std::vector<SeriesRecord> toRecords(const std::vector<SeriesConfig>& series);

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
              int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;
    /**
     * @brief Parse a comma-separated list of numbers
     *
     * A token is accepted only if it parses completely ("19OO" is rejected,
     * not read as 19). Rejected tokens are skipped and appended to
     * @p rejected when given.
     */
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key,
                                       std::vector<std::string>* rejected = nullptr) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

    // =========================================================================
    // Utility Methods
    // =========================================================================

    std::map<std::string, std::string> getSectionData(const std::string& section) const;
    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;
    bool mergeFile(const std::string& filename);
    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    // Section names in first-seen order
    std::vector<std::string> section_order_;

    const TimeUnitRegistry& registry_;

    void parseStream(std::istream& input);

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace PTAX

#endif // CONFIG_READER_HPP
