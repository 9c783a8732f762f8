#ifndef ORD_COMMUNITY_HPP
#define ORD_COMMUNITY_HPP

#include "ord_types.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace ord {

/**
 * @brief One sampled community: species ids with their individual counts.
 *
 * species[i] has abundance[i] individuals. Communities are created by the
 * caller (simulation or data import) and treated as immutable input.
 */
struct Community {
    integer_t id = 0;
    std::vector<integer_t> species;
    std::vector<integer_t> abundance;

    // Number of listed species with at least one individual
    integer_t richness() const;

    count_t total_abundance() const;
};

// Caller contract violation: the community set cannot be analysed at all
class InvalidCommunityError : public std::invalid_argument {
public:
    InvalidCommunityError(size_t position, integer_t community_id, const std::string& reason);

    size_t position() const { return position_; }
    integer_t community_id() const { return community_id_; }

private:
    size_t position_;
    integer_t community_id_;
};

// Throws InvalidCommunityError for mismatched lengths, negative abundance,
// duplicate species ids or a zero-total community.
void validate_community(const Community& community, size_t position);

// Validates every community, then rejects an empty set and duplicate ids
void validate_communities(const std::vector<Community>& communities);

} // namespace ord

#endif // ORD_COMMUNITY_HPP
