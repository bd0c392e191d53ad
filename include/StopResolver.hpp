#pragma once
#include <string>
#include <vector>
#include "Types.hpp"

// Child stop -> parent station lookups for one stop query.
class StopResolver
{
private:
    StopParentMap parentOf;

public:
    explicit StopResolver(StopParentMap sideloaded = {});

    // Vehicle stops and prediction target stops, i.e. everything proximity will look up.
    static std::vector<std::string> lookupIds(PredictionBatch const& batch);

    // Sorted, deduplicated ids that have no entry yet.
    std::vector<std::string> unresolved(std::vector<std::string> const& stopIds) const;

    void absorb(StopParentMap const& additions);

    // Ids still missing after the batch lookup map to themselves.
    void settle(std::vector<std::string> const& stopIds);

    bool exists(std::string const& stopId) const;
    std::string getParent(std::string const& stopId) const;
};
