/**
 * @file time_unit_converter.cpp
 * @brief Command-line front end for the PTAX time conventions
 *
 * Usage:
 *   ./time_unit_converter <from_unit> <to_unit> <v1> [v2 ...]
 *   ./time_unit_converter --list [family]
 *   ./time_unit_converter --config <file>
 *   ./time_unit_converter --help
 *
 * Examples:
 *   ./time_unit_converter years "yr BP" 1871 1950 2003
 *   ./time_unit_converter ka ma 21 126 800
 *   ./time_unit_converter --config collection.config
 */

#include "PTAX.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <cstring>

using namespace PTAX;

void printHelp() {
    std::cout << "\n";
    std::cout << "PTAX Time Unit Converter " << VERSION << "\n";
    std::cout << "==========================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  time_unit_converter <from_unit> <to_unit> <v1> [v2 ...]\n";
    std::cout << "  time_unit_converter --list [family]\n";
    std::cout << "  time_unit_converter --config <file>\n";
    std::cout << "  time_unit_converter --help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  time_unit_converter years \"yr BP\" 1871 1950 2003\n";
    std::cout << "  time_unit_converter ka ma 21 126 800\n";
    std::cout << "  time_unit_converter --list\n\n";
    std::cout << "Common Units:\n";
    std::cout << "  Calendar: years, yr, CE, AD\n";
    std::cout << "  Before present (1950): yr BP, ky BP, ka, ma, Ga BP\n";
    std::cout << "  Before 2000: b2k, ky b2k\n\n";
}

void listConventions(const TimeUnitRegistry& registry, const std::string& family = "") {
    std::cout << "\n";

    if (family.empty()) {
        registry.printDatabase(std::cout);
        return;
    }

    auto conventions = registry.getConventionsInFamily(family);
    if (conventions.empty()) {
        std::cout << "Family '" << family << "' not found.\n";
        std::cout << "Available families:\n";
        for (const auto& f : registry.getFamilies()) {
            std::cout << "  " << f << "\n";
        }
        std::cout << "\n";
        return;
    }

    for (const auto* c : conventions) {
        std::cout << std::setw(12) << std::left << c->name
                  << " " << c->descriptor.toString() << "\n";
    }
    std::cout << "\n";
}

void printAxis(const std::string& title, const std::vector<double>& values) {
    std::cout << "  " << title << ":";
    for (double v : values) {
        std::cout << " " << v;
    }
    std::cout << "\n";
}

int performConversion(const TimeUnitRegistry& registry,
                      const std::string& from_unit, const std::string& to_unit,
                      const std::vector<double>& values) {
    try {
        AxisConverter converter(registry);
        UnitDescriptor from = registry.resolve(from_unit);
        UnitDescriptor to = registry.resolve(to_unit);
        AxisConversion result = converter.convert(values, from, to);

        std::cout << "\n";
        std::cout << "Conversion Result:\n";
        std::cout << "==================\n\n";
        std::cout << std::setprecision(10);
        std::cout << "  From: " << from_unit << " " << from << "\n";
        std::cout << "  To:   " << to_unit << " " << to << "\n\n";
        printAxis("Input  (" + from.axisName() + ")", values);
        printAxis("Output (" + to.axisName() + ")", result.values);
        if (result.reordered) {
            std::cout << "\n  Note: output reversed to keep the axis ascending\n";
        }
        std::cout << "\n";
        return 0;
    } catch (const UnrecognizedUnitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --list to see available units\n";
        return 1;
    }
}

int runConfig(const std::string& filename) {
    ConfigReader reader;
    if (!reader.loadFile(filename)) {
        return 1;
    }

    auto validation = reader.validate();
    for (const auto& w : validation.warnings) {
        std::cerr << "Warning: " << w << "\n";
    }
    for (const auto& e : validation.errors) {
        std::cerr << "Error: " << e << "\n";
    }
    if (!validation.valid) {
        return 1;
    }

    ConfigReader::ConversionConfig job;
    reader.parseConversionConfig(job);
    auto series = reader.parseSeries();

    try {
        SeriesCollection collection(ConfigReader::toRecords(series));
        CollectionConversion result = collection.convertTimeUnit(job.target_unit, job.toOptions());

        std::cout << "\n";
        std::cout << "Collection Conversion (" << series.size() << " series)\n";
        std::cout << std::string(40, '=') << "\n\n";
        std::cout << std::setprecision(10);

        for (size_t i = 0; i < series.size(); ++i) {
            const SeriesRecord& member = result.collection.members()[i];
            const MemberStatus& status = result.status[i];

            std::cout << "[" << member.id << "] "
                      << (member.time_unit.empty() ? "years (default)" : member.time_unit);
            if (!status.ok) {
                std::cout << "  FAILED: " << status.error;
            } else if (status.reordered) {
                std::cout << "  (reversed)";
            }
            std::cout << "\n";

            printAxis("time ", member.time);
            if (!series[i].value.empty()) {
                printAxis("value", reorderBoundValues(series[i].value, member.time.size(),
                                                      status.reordered));
            }
            std::cout << "\n";
        }

        return result.allConverted() ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int main(int argc, char* argv[]) {
    const TimeUnitRegistry& registry = TimeUnitRegistryManager::getInstance();

    // Parse command line arguments
    if (argc == 1 || (argc == 2 && strcmp(argv[1], "--help") == 0)) {
        printHelp();
        return 0;
    }

    if (strcmp(argv[1], "--list") == 0) {
        listConventions(registry, argc > 2 ? argv[2] : "");
        return 0;
    }

    if (strcmp(argv[1], "--config") == 0) {
        if (argc != 3) {
            std::cerr << "Error: --config expects exactly one file\n";
            return 1;
        }
        return runConfig(argv[2]);
    }

    if (argc < 4) {
        std::cerr << "Error: Invalid number of arguments\n";
        printHelp();
        return 1;
    }

    std::vector<double> values;
    for (int i = 3; i < argc; ++i) {
        try {
            values.push_back(std::stod(argv[i]));
        } catch (const std::invalid_argument&) {
            std::cerr << "Error: Invalid value '" << argv[i] << "'\n";
            return 1;
        } catch (const std::out_of_range&) {
            std::cerr << "Error: Value out of range '" << argv[i] << "'\n";
            return 1;
        }
    }

    return performConversion(registry, argv[1], argv[2], values);
}
