#ifndef ORD_ANALYSIS_HPP
#define ORD_ANALYSIS_HPP

#include "ord_types.hpp"
#include "ord_config.hpp"
#include "ord_community.hpp"
#include "ord_dissimilarity.hpp"
#include "ord_diversity.hpp"
#include "ord_nmds.hpp"
#include "ord_pcoa.hpp"
#include <vector>

namespace ord {

// One community placed on the ordination plane
struct OrdinationPoint {
    integer_t community_id = 0;
    dp_t axis1 = 0.0;
    dp_t axis2 = 0.0;
    integer_t richness = 0;
    count_t total_abundance = 0;
};

// Everything computed for one community set. Engines that were switched
// off in the config leave their members default-constructed.
struct OrdinationReport {
    DissimilarityMatrix matrix;

    std::vector<OrdinationPoint> pcoa_points;
    PCoAResult pcoa;

    std::vector<OrdinationPoint> nmds_points;
    NMDSResult nmds;

    std::vector<AlphaDiversity> alpha;
    BetaDiversity beta;
};

/**
 * @brief Attach community ids and summary statistics to a layout.
 *
 * coordinates[k] belongs to communities[k].
 *
 * @throws std::invalid_argument if the lengths differ
 */
std::vector<OrdinationPoint> annotate_embedding(const std::vector<Community>& communities,
                                                const std::vector<Point2>& coordinates);

/**
 * @brief Validate, build the Bray-Curtis matrix, then run PCoA, NMDS and
 *        the diversity summary as enabled in config.
 */
OrdinationReport analyze_communities(const std::vector<Community>& communities,
                                     const OrdinationConfig& config = OrdinationConfig());

} // namespace ord

#endif // ORD_ANALYSIS_HPP
