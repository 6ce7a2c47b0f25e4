#ifndef SERIES_COLLECTION_HPP
#define SERIES_COLLECTION_HPP

#include "TimeUnit.hpp"
#include "TimeAxis.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstddef>
#include <utility>

namespace PTAX {

/**
 * @brief One member of a collection: identifier, time axis and its label
 *
 * Measured values stay with the caller; they follow the axis through
 * reorderBoundValues() using the member's status.
 */
struct SeriesRecord {
    std::string id;
    std::vector<double> time;
    std::string time_unit;     // Blank means years CE

    SeriesRecord() = default;
    SeriesRecord(const std::string& member_id, std::vector<double> values,
                 const std::string& unit = "")
        : id(member_id), time(std::move(values)), time_unit(unit) {}
};

/**
 * @brief Outcome of converting one member
 */
struct MemberStatus {
    std::string id;
    bool ok;              // false if the member kept its original axis
    bool reordered;       // axis (and bound values) reversed
    std::string error;    // reason when !ok

    MemberStatus() : ok(true), reordered(false) {}
};

struct ConversionOptions {
    size_t num_threads;   // > 1 converts members on a thread pool
    bool verbose;         // report reordered members on std::cerr

    ConversionOptions() : num_threads(1), verbose(false) {}
};

/**
 * @brief Aggregate failure naming every member that could not be converted
 */
class CollectionConversionError : public std::runtime_error {
public:
    explicit CollectionConversionError(const std::vector<MemberStatus>& failures);

    const std::vector<std::string>& failedMembers() const { return failed_; }

private:
    std::vector<std::string> failed_;

    static std::string buildMessage(const std::vector<MemberStatus>& failures);
};

struct CollectionConversion;

/**
 * @brief Set of independently labeled time axes sharing an optional unit
 *
 * Collections are values: converting one produces a new collection and
 * leaves the source untouched. Members keep their insertion order.
 */
class SeriesCollection {
public:
    SeriesCollection() = default;

    /**
     * @brief Build a collection, optionally converting every member
     * @param members Records with unique ids
     * @param time_unit Shared target unit; blank keeps member units as given
     * @throws UnrecognizedUnitError if @p time_unit is unknown
     * @throws std::runtime_error on duplicate ids
     */
    explicit SeriesCollection(std::vector<SeriesRecord> members,
                              const std::string& time_unit = "",
                              const ConversionOptions& options = ConversionOptions());

    /**
     * @brief Convert every member to one unit
     *
     * The target is resolved once. Each member is resolved and converted on
     * its own; a member that fails keeps its axis and is flagged in the
     * returned status instead of aborting the others.
     *
     * @param time_unit Target unit; blank returns an identical collection
     * @throws UnrecognizedUnitError if @p time_unit is unknown
     */
    CollectionConversion convertTimeUnit(const std::string& time_unit,
                                         const ConversionOptions& options = ConversionOptions(),
                                         const TimeUnitRegistry& registry =
                                             TimeUnitRegistryManager::getInstance()) const;

    size_t size() const { return members_.size(); }
    bool empty() const { return members_.empty(); }

    const std::vector<SeriesRecord>& members() const { return members_; }
    const SeriesRecord* find(const std::string& id) const;
    std::vector<std::string> ids() const;

    // Shared unit, blank if any member keeps its own label
    const std::string& timeUnit() const { return time_unit_; }

    // Status of the conversion that produced this collection
    const std::vector<MemberStatus>& status() const { return status_; }

private:
    std::vector<SeriesRecord> members_;
    std::string time_unit_;
    std::vector<MemberStatus> status_;

    static MemberStatus convertMember(const SeriesRecord& member,
                                      const UnitDescriptor& target,
                                      const std::string& time_unit,
                                      const TimeUnitRegistry& registry,
                                      SeriesRecord& converted);
};

struct CollectionConversion {
    SeriesCollection collection;
    std::vector<MemberStatus> status;   // one entry per member, in member order

    bool allConverted() const;
    std::vector<std::string> failedMembers() const;

    // @throws CollectionConversionError if any member failed
    void throwIfFailed() const;
};

} // namespace PTAX

#endif // SERIES_COLLECTION_HPP
