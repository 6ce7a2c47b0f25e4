#include "SeriesCollection.hpp"
#include "ThreadPool.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <set>
#include <cctype>

namespace PTAX {

namespace {

bool isBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

// =============================================================================
// CollectionConversionError
// =============================================================================

CollectionConversionError::CollectionConversionError(const std::vector<MemberStatus>& failures)
    : std::runtime_error(buildMessage(failures)) {
    for (const auto& failure : failures) {
        failed_.push_back(failure.id);
    }
}

std::string CollectionConversionError::buildMessage(const std::vector<MemberStatus>& failures) {
    std::stringstream ss;
    ss << failures.size() << " series could not be converted:";
    for (const auto& failure : failures) {
        ss << "\n  " << failure.id << ": " << failure.error;
    }
    return ss.str();
}

// =============================================================================
// SeriesCollection
// =============================================================================

SeriesCollection::SeriesCollection(std::vector<SeriesRecord> members,
                                   const std::string& time_unit,
                                   const ConversionOptions& options)
    : members_(std::move(members)) {
    std::set<std::string> seen;
    for (const auto& member : members_) {
        if (!seen.insert(member.id).second) {
            throw std::runtime_error("Duplicate series id: " + member.id);
        }
    }

    status_.resize(members_.size());
    for (size_t i = 0; i < members_.size(); ++i) {
        status_[i].id = members_[i].id;
    }

    if (!isBlank(time_unit)) {
        CollectionConversion result = convertTimeUnit(time_unit, options);
        *this = std::move(result.collection);
    }
}

const SeriesRecord* SeriesCollection::find(const std::string& id) const {
    for (const auto& member : members_) {
        if (member.id == id) {
            return &member;
        }
    }
    return nullptr;
}

std::vector<std::string> SeriesCollection::ids() const {
    std::vector<std::string> result;
    result.reserve(members_.size());
    for (const auto& member : members_) {
        result.push_back(member.id);
    }
    return result;
}

MemberStatus SeriesCollection::convertMember(const SeriesRecord& member,
                                             const UnitDescriptor& target,
                                             const std::string& time_unit,
                                             const TimeUnitRegistry& registry,
                                             SeriesRecord& converted) {
    MemberStatus status;
    status.id = member.id;

    try {
        TimeAxis axis(member.time, member.time_unit, registry);
        TimeAxisConversion result = axis.convertTo(target, time_unit);

        converted = SeriesRecord(member.id, result.axis.values(), time_unit);
        status.reordered = result.reordered;
    } catch (const std::exception& e) {
        // Member keeps its original axis and label
        converted = member;
        status.ok = false;
        status.error = e.what();
    }

    return status;
}

CollectionConversion SeriesCollection::convertTimeUnit(const std::string& time_unit,
                                                       const ConversionOptions& options,
                                                       const TimeUnitRegistry& registry) const {
    CollectionConversion result;

    if (isBlank(time_unit)) {
        result.collection = *this;
        result.status.resize(members_.size());
        for (size_t i = 0; i < members_.size(); ++i) {
            result.status[i].id = members_[i].id;
        }
        result.collection.status_ = result.status;
        return result;
    }

    UnitDescriptor target = registry.resolve(time_unit);

    std::vector<SeriesRecord> converted(members_.size());
    std::vector<MemberStatus> status(members_.size());

    auto convertRange = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            status[i] = convertMember(members_[i], target, time_unit, registry, converted[i]);
        }
    };

    if (options.num_threads > 1 && members_.size() > 1) {
        ThreadPool pool(std::min(options.num_threads, members_.size()));
        pool.parallelFor(0, members_.size(), convertRange);
    } else {
        convertRange(0, members_.size());
    }

    for (const auto& s : status) {
        if (!s.ok) {
            std::cerr << "Warning: Series '" << s.id << "' keeps its time axis - "
                      << s.error << std::endl;
        } else if (options.verbose && s.reordered) {
            std::cerr << "Note: Series '" << s.id << "' reversed to keep "
                      << time_unit << " ascending" << std::endl;
        }
    }

    result.collection.members_ = std::move(converted);
    result.collection.status_ = status;
    result.status = std::move(status);

    // A failed member keeps its own label, so there is no shared unit
    if (result.allConverted()) {
        result.collection.time_unit_ = time_unit;
    }
    return result;
}

// =============================================================================
// CollectionConversion
// =============================================================================

bool CollectionConversion::allConverted() const {
    return std::all_of(status.begin(), status.end(),
                       [](const MemberStatus& s) { return s.ok; });
}

std::vector<std::string> CollectionConversion::failedMembers() const {
    std::vector<std::string> result;
    for (const auto& s : status) {
        if (!s.ok) {
            result.push_back(s.id);
        }
    }
    return result;
}

void CollectionConversion::throwIfFailed() const {
    std::vector<MemberStatus> failures;
    for (const auto& s : status) {
        if (!s.ok) {
            failures.push_back(s);
        }
    }
    if (!failures.empty()) {
        throw CollectionConversionError(failures);
    }
}

} // namespace PTAX
