#include "ord_community.hpp"
#include <unordered_set>

namespace ord {

integer_t Community::richness() const {
    integer_t s = 0;
    for (integer_t a : abundance) {
        if (a > 0) s++;
    }
    return s;
}

count_t Community::total_abundance() const {
    count_t total = 0;
    for (integer_t a : abundance) {
        total += a;
    }
    return total;
}

InvalidCommunityError::InvalidCommunityError(size_t position, integer_t community_id, const std::string& reason)
    : std::invalid_argument("Invalid community at position " + std::to_string(position) +
                            " (id " + std::to_string(community_id) + "): " + reason),
      position_(position), community_id_(community_id) {}

void validate_community(const Community& community, size_t position) {
    if (community.species.size() != community.abundance.size()) {
        throw InvalidCommunityError(position, community.id,
            "species and abundance lengths differ (" + std::to_string(community.species.size()) +
            " vs " + std::to_string(community.abundance.size()) + ")");
    }

    std::unordered_set<integer_t> seen;
    count_t total = 0;
    for (size_t i = 0; i < community.species.size(); i++) {
        if (community.abundance[i] < 0) {
            throw InvalidCommunityError(position, community.id,
                "negative abundance " + std::to_string(community.abundance[i]) +
                " for species " + std::to_string(community.species[i]));
        }
        if (!seen.insert(community.species[i]).second) {
            throw InvalidCommunityError(position, community.id,
                "duplicate species id " + std::to_string(community.species[i]));
        }
        total += community.abundance[i];
    }

    if (total <= 0) {
        throw InvalidCommunityError(position, community.id, "community has no individuals");
    }
}

void validate_communities(const std::vector<Community>& communities) {
    if (communities.empty()) {
        throw std::invalid_argument("At least one community is required");
    }

    std::unordered_set<integer_t> ids;
    for (size_t c = 0; c < communities.size(); c++) {
        validate_community(communities[c], c);
        if (!ids.insert(communities[c].id).second) {
            throw InvalidCommunityError(c, communities[c].id, "duplicate community id");
        }
    }
}

} // namespace ord
