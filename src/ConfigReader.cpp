#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace PTAX {

ConversionOptions ConfigReader::ConversionConfig::toOptions() const {
    ConversionOptions options;
    options.num_threads = num_threads > 1 ? static_cast<size_t>(num_threads) : 1;
    options.verbose = verbose;
    return options;
}

ConfigReader::ConfigReader()
    : registry_(TimeUnitRegistryManager::getInstance()) {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    parseStream(file);
    return true;
}

bool ConfigReader::loadString(const std::string& text) {
    std::istringstream input(text);
    parseStream(input);
    return true;
}

void ConfigReader::parseStream(std::istream& input) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            if (data.find(current_section) == data.end()) {
                section_order_.push_back(current_section);
                data[current_section];
            }
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                        int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse '" << val << "' as integer for ["
                  << section << "]:" << key << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse '" << val << "' as double for ["
                  << section << "]:" << key << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                          bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key,
                                                 std::vector<std::string>* rejected) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        size_t pos = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(token, &pos);
        } catch (const std::exception&) {
            pos = 0;
        }

        // Trailing characters mean the token was only partly a number
        if (pos != token.size()) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double for ["
                      << section << "]:" << key << std::endl;
            if (rejected) {
                rejected->push_back(token);
            }
            continue;
        }
        result.push_back(parsed);
    }

    return result;
}

// =============================================================================
// Job Parsing
// =============================================================================

bool ConfigReader::parseConversionConfig(ConversionConfig& config) const {
    if (!hasSection(CONVERSION_SECTION)) {
        return false;
    }

    config.target_unit = getString(CONVERSION_SECTION, "target_unit", "");
    config.num_threads = getInt(CONVERSION_SECTION, "num_threads", 1);
    config.verbose = getBool(CONVERSION_SECTION, "verbose", false);
    return true;
}

std::vector<ConfigReader::SeriesConfig> ConfigReader::parseSeries() const {
    std::vector<SeriesConfig> result;
    const std::string prefix = SERIES_PREFIX;

    for (const auto& section : section_order_) {
        if (section.compare(0, prefix.size(), prefix) != 0) continue;

        SeriesConfig series;
        series.name = section.substr(prefix.size());
        series.time_unit = getString(section, "time_unit", "");
        std::vector<std::string> bad_time;
        std::vector<std::string> bad_value;
        series.time = getDoubleArray(section, "time", &bad_time);
        series.value = getDoubleArray(section, "value", &bad_value);
        for (const auto& token : bad_time) {
            series.rejected.push_back("time: " + token);
        }
        for (const auto& token : bad_value) {
            series.rejected.push_back("value: " + token);
        }
        result.push_back(series);
    }

    return result;
}

std::vector<SeriesRecord> ConfigReader::toRecords(const std::vector<SeriesConfig>& series) {
    std::vector<SeriesRecord> records;
    records.reserve(series.size());
    for (const auto& s : series) {
        records.emplace_back(s.name, s.time, s.time_unit);
    }
    return records;
}

// =============================================================================
// Section/Key Query Methods
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    return section_order_;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write template file: " << filename << std::endl;
        return;
    }

    file << "# PTAX Conversion Job\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n";
    file << "# Unit labels ignore case, spaces and periods (\"ky BP\" == \"kyBP\")\n\n";

    file << "[conversion]\n";
    file << "target_unit = ky BP                  # blank keeps each series' unit\n";
    file << "num_threads = 1                      # > 1 converts series in parallel\n";
    file << "verbose = false                      # report reversed series\n\n";

    file << "# One section per series: [series.<name>]\n";
    file << "[series.example_core]\n";
    file << "time_unit = yr BP                    # years, yr BP, ky BP, ma, Ga BP, b2k, ...\n";
    file << "time = 100, 200, 300, 400\n";
    file << "value = 3.1, 3.4, 3.2, 2.9           # optional, one per time value\n";
}

// =============================================================================
// Utility Methods
// =============================================================================

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it != data.end()) {
        return it->second;
    }
    return {};
}

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& section : section_order_) {
        if (section.find(prefix) == 0) {
            result.push_back(section);
        }
    }
    return result;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Merge data - other file values override existing
    for (const auto& section : other.section_order_) {
        if (data.find(section) == data.end()) {
            section_order_.push_back(section);
        }
        for (const auto& key_val : other.data.at(section)) {
            data[section][key_val.first] = key_val.second;
        }
    }

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    if (!hasSection(CONVERSION_SECTION)) {
        result.warnings.push_back("No [conversion] section found - series keep their units");
    } else {
        std::string target = trim(getString(CONVERSION_SECTION, "target_unit", ""));
        if (!target.empty() && !registry_.hasUnit(target)) {
            result.errors.push_back("Unrecognized target_unit '" + target + "'");
            result.valid = false;
        }

        if (getInt(CONVERSION_SECTION, "num_threads", 1) < 1) {
            result.errors.push_back("num_threads must be at least 1");
            result.valid = false;
        }
    }

    auto series = parseSeries();
    if (series.empty()) {
        result.warnings.push_back("No series defined");
    }

    for (const auto& s : series) {
        std::string unit = trim(s.time_unit);
        if (unit.empty()) {
            result.warnings.push_back("Series '" + s.name + "' has no time_unit - using years CE");
        } else if (!registry_.hasUnit(unit)) {
            result.errors.push_back("Series '" + s.name + "' has unrecognized time_unit '" +
                                    unit + "'");
            result.valid = false;
        }

        for (const auto& entry : s.rejected) {
            result.errors.push_back("Series '" + s.name + "' has an unparsable number (" +
                                    entry + ")");
            result.valid = false;
        }

        if (s.time.empty()) {
            result.errors.push_back("Series '" + s.name + "' has an empty time axis");
            result.valid = false;
        }

        if (!s.value.empty() && s.value.size() != s.time.size()) {
            result.errors.push_back("Series '" + s.name + "' has " +
                                    std::to_string(s.time.size()) + " time values but " +
                                    std::to_string(s.value.size()) + " data values");
            result.valid = false;
        }
    }

    return result;
}

} // namespace PTAX
