#include "core/duplicate_resolver.hpp"
#include "core/dedup_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <map>
#include <numeric>

namespace
{
    class UnionFind
    {
    public:
        explicit UnionFind(size_t n) : parent_(n), rank_(n, 0)
        {
            std::iota(parent_.begin(), parent_.end(), 0);
        }

        size_t find(size_t x)
        {
            while (parent_[x] != x)
            {
                parent_[x] = parent_[parent_[x]];
                x = parent_[x];
            }
            return x;
        }

        void unite(size_t a, size_t b)
        {
            size_t ra = find(a);
            size_t rb = find(b);
            if (ra == rb)
                return;
            if (rank_[ra] < rank_[rb])
                std::swap(ra, rb);
            parent_[rb] = ra;
            if (rank_[ra] == rank_[rb])
                ++rank_[ra];
        }

    private:
        std::vector<size_t> parent_;
        std::vector<int> rank_;
    };

    bool discoveredBefore(const VideoAsset &a, const VideoAsset &b)
    {
        if (a.discovery_index != b.discovery_index)
            return a.discovery_index < b.discovery_index;
        return a.id < b.id;
    }
}

std::vector<std::string> DuplicateGroup::duplicateIds() const
{
    std::vector<std::string> ids;
    for (const auto &id : member_ids)
    {
        if (id != canonical_id)
            ids.push_back(id);
    }
    return ids;
}

bool CanonicalPolicy::tieBreak(const VideoAsset &a, const VideoAsset &b)
{
    return discoveredBefore(a, b);
}

bool LargestFilePolicy::isPreferred(const VideoAsset &a, const VideoAsset &b) const
{
    if (a.size_bytes != b.size_bytes)
        return a.size_bytes > b.size_bytes;
    return tieBreak(a, b);
}

bool OldestFilePolicy::isPreferred(const VideoAsset &a, const VideoAsset &b) const
{
    // Unknown modification times sort after known ones
    bool a_known = a.modified_time > 0;
    bool b_known = b.modified_time > 0;
    if (a_known != b_known)
        return a_known;
    if (a.modified_time != b.modified_time)
        return a.modified_time < b.modified_time;
    if (a.size_bytes != b.size_bytes)
        return a.size_bytes > b.size_bytes;
    return tieBreak(a, b);
}

bool EarliestDiscoveredPolicy::isPreferred(const VideoAsset &a, const VideoAsset &b) const
{
    return tieBreak(a, b);
}

std::shared_ptr<const CanonicalPolicy> makeCanonicalPolicy(const std::string &name)
{
    if (name == "largest_file")
        return std::make_shared<LargestFilePolicy>();
    if (name == "oldest_file")
        return std::make_shared<OldestFilePolicy>();
    if (name == "earliest_discovered")
        return std::make_shared<EarliestDiscoveredPolicy>();
    throw ConfigError("Unknown canonical policy: " + name);
}

DuplicateResolver::DuplicateResolver(std::shared_ptr<const CanonicalPolicy> policy)
    : policy_(std::move(policy))
{
    if (!policy_)
    {
        policy_ = std::make_shared<LargestFilePolicy>();
    }
}

std::vector<DuplicateGroup> DuplicateResolver::resolve(const std::vector<VideoAsset> &assets,
                                                       const std::vector<ComparisonResult> &comparisons) const
{
    std::unordered_map<std::string, size_t> index_of;
    index_of.reserve(assets.size());
    for (size_t i = 0; i < assets.size(); ++i)
    {
        if (!index_of.emplace(assets[i].id, i).second)
        {
            Logger::warn("Duplicate asset id in input, later entry ignored: " + assets[i].id);
        }
    }

    UnionFind uf(assets.size());
    std::vector<bool> has_edge(assets.size(), false);
    std::vector<double> best_score(assets.size(), 0.0);
    size_t edge_count = 0;

    for (const auto &comparison : comparisons)
    {
        if (!comparison.success || !comparison.is_duplicate)
            continue;
        if (comparison.asset_a == comparison.asset_b)
            continue;

        auto it_a = index_of.find(comparison.asset_a);
        auto it_b = index_of.find(comparison.asset_b);
        if (it_a == index_of.end() || it_b == index_of.end())
        {
            Logger::warn("Ignoring duplicate edge with unknown asset: " + comparison.asset_a + " <-> " + comparison.asset_b);
            continue;
        }

        size_t a = it_a->second;
        size_t b = it_b->second;
        uf.unite(a, b);
        has_edge[a] = has_edge[b] = true;
        best_score[a] = std::max(best_score[a], comparison.score);
        best_score[b] = std::max(best_score[b], comparison.score);
        ++edge_count;
    }

    // root -> member indexes
    std::map<size_t, std::vector<size_t>> components;
    for (size_t i = 0; i < assets.size(); ++i)
    {
        if (has_edge[i])
            components[uf.find(i)].push_back(i);
    }

    std::vector<DuplicateGroup> groups;
    std::vector<size_t> canonical_index;
    for (auto &entry : components)
    {
        std::vector<size_t> &members = entry.second;
        if (members.size() < 2)
            continue;

        std::sort(members.begin(), members.end(), [&assets](size_t x, size_t y)
                  { return discoveredBefore(assets[x], assets[y]); });

        size_t canonical = members.front();
        for (size_t idx : members)
        {
            if (policy_->isPreferred(assets[idx], assets[canonical]))
                canonical = idx;
        }

        DuplicateGroup group;
        group.canonical_id = assets[canonical].id;
        for (size_t idx : members)
        {
            group.member_ids.push_back(assets[idx].id);
            group.link_scores[assets[idx].id] = best_score[idx];
        }
        groups.push_back(std::move(group));
        canonical_index.push_back(canonical);
    }

    std::vector<size_t> order(groups.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t x, size_t y)
              { return discoveredBefore(assets[canonical_index[x]], assets[canonical_index[y]]); });

    std::vector<DuplicateGroup> ordered;
    ordered.reserve(groups.size());
    for (size_t idx : order)
    {
        ordered.push_back(std::move(groups[idx]));
    }

    Logger::info("Resolved " + std::to_string(edge_count) + " duplicate edges into " + std::to_string(ordered.size()) +
                 " groups using policy " + policy_->name());
    return ordered;
}
