#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/signature_comparator.hpp"
#include "core/video_asset.hpp"

/**
 * @brief Connected component of the duplicate graph with one canonical member
 */
struct DuplicateGroup
{
    std::string canonical_id;
    std::vector<std::string> member_ids;                  // every member, canonical included, in discovery order
    std::unordered_map<std::string, double> link_scores; // best duplicate-edge score per member

    std::vector<std::string> duplicateIds() const;
    size_t size() const { return member_ids.size(); }
};

/**
 * @brief Strategy that decides which member of a group stays in place
 */
class CanonicalPolicy
{
public:
    virtual ~CanonicalPolicy() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Strict preference: true if a should be kept over b
     */
    virtual bool isPreferred(const VideoAsset &a, const VideoAsset &b) const = 0;

protected:
    // Earliest discovery, then lexicographically smallest id
    static bool tieBreak(const VideoAsset &a, const VideoAsset &b);
};

/**
 * @brief Largest file wins; the default policy
 */
class LargestFilePolicy : public CanonicalPolicy
{
public:
    std::string name() const override { return "largest_file"; }
    bool isPreferred(const VideoAsset &a, const VideoAsset &b) const override;
};

/**
 * @brief Oldest modification time wins, then the largest-file chain
 */
class OldestFilePolicy : public CanonicalPolicy
{
public:
    std::string name() const override { return "oldest_file"; }
    bool isPreferred(const VideoAsset &a, const VideoAsset &b) const override;
};

/**
 * @brief First asset in the caller's enumeration wins
 */
class EarliestDiscoveredPolicy : public CanonicalPolicy
{
public:
    std::string name() const override { return "earliest_discovered"; }
    bool isPreferred(const VideoAsset &a, const VideoAsset &b) const override;
};

/**
 * @brief Create a policy by its configuration name
 * @throws ConfigError for unknown names
 */
std::shared_ptr<const CanonicalPolicy> makeCanonicalPolicy(const std::string &name);

/**
 * @brief Partitions duplicate verdicts into disjoint groups
 *
 * Assets without a duplicate edge appear in no group. Output is deterministic:
 * groups are ordered by the discovery index of their canonical member.
 */
class DuplicateResolver
{
public:
    explicit DuplicateResolver(std::shared_ptr<const CanonicalPolicy> policy = std::make_shared<LargestFilePolicy>());

    std::vector<DuplicateGroup> resolve(const std::vector<VideoAsset> &assets,
                                        const std::vector<ComparisonResult> &comparisons) const;

    const CanonicalPolicy &policy() const { return *policy_; }

private:
    std::shared_ptr<const CanonicalPolicy> policy_;
};
