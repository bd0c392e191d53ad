#include <algorithm>
#include "StopResolver.hpp"

StopResolver::StopResolver(StopParentMap sideloaded)
    : parentOf(std::move(sideloaded))
{
}

std::vector<std::string> StopResolver::lookupIds(PredictionBatch const& batch)
{
    std::vector<std::string> ids;
    ids.reserve(batch.vehicles.size() + batch.predictions.size());

    for (auto const& [vehicle, stopId] : batch.vehicles)
        ids.push_back(stopId);

    for (auto const& p : batch.predictions)
    {
        if (p.stopId)
            ids.push_back(*p.stopId);
    }

    return ids;
}

std::vector<std::string> StopResolver::unresolved(std::vector<std::string> const& stopIds) const
{
    std::vector<std::string> missing;
    for (auto const& id : stopIds)
    {
        if (!id.empty() && !exists(id))
            missing.push_back(id);
    }

    std::sort(missing.begin(), missing.end());
    missing.erase(std::unique(missing.begin(), missing.end()), missing.end());
    return missing;
}

void StopResolver::absorb(StopParentMap const& additions)
{
    for (auto const& [child, parent] : additions)
        parentOf.insert_or_assign(child, parent.empty() ? child : parent);
}

void StopResolver::settle(std::vector<std::string> const& stopIds)
{
    for (auto const& id : stopIds)
        parentOf.try_emplace(id, id);
}

bool StopResolver::exists(std::string const& stopId) const
{
    return parentOf.count(stopId) > 0;
}

std::string StopResolver::getParent(std::string const& stopId) const
{
    auto it = parentOf.find(stopId);
    if (it != parentOf.end())
        return it->second;

    return stopId;
}
