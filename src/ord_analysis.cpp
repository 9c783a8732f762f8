#include "ord_analysis.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace ord {

namespace {
    const char* status_name(FitStatus status) {
        switch (status) {
            case FitStatus::OK: return "ok";
            case FitStatus::DEGENERATE_INPUT: return "degenerate input";
            case FitStatus::NUMERIC_INSTABILITY: return "numeric instability";
        }
        return "unknown";
    }

    double elapsed_seconds(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }
}

std::vector<OrdinationPoint> annotate_embedding(const std::vector<Community>& communities,
                                                const std::vector<Point2>& coordinates) {
    if (communities.size() != coordinates.size()) {
        throw std::invalid_argument("annotate_embedding: " + std::to_string(coordinates.size()) +
                                    " coordinates for " + std::to_string(communities.size()) + " communities");
    }

    std::vector<OrdinationPoint> points(communities.size());
    for (size_t k = 0; k < communities.size(); k++) {
        points[k].community_id = communities[k].id;
        points[k].axis1 = coordinates[k].x;
        points[k].axis2 = coordinates[k].y;
        points[k].richness = communities[k].richness();
        points[k].total_abundance = communities[k].total_abundance();
    }
    return points;
}

OrdinationReport analyze_communities(const std::vector<Community>& communities,
                                     const OrdinationConfig& config) {
    config.validate();

    OrdinationReport report;
    auto start = std::chrono::steady_clock::now();

    // Validates the community set
    report.matrix = build_bray_curtis_matrix(communities);
    if (config.verbose) {
        std::cout << "Bray-Curtis matrix: " << report.matrix.size() << " communities, "
                  << report.matrix.pair_count() << " pairs (" << elapsed_seconds(start) << "s)\n";
    }

    if (config.compute_pcoa) {
        start = std::chrono::steady_clock::now();
        report.pcoa = compute_pcoa(report.matrix, config.pcoa);
        report.pcoa_points = annotate_embedding(communities, report.pcoa.coordinates);
        if (config.verbose) {
            std::cout << "PCoA: " << report.pcoa.variance_explained[0] << "% + "
                      << report.pcoa.variance_explained[1] << "% explained, status "
                      << status_name(report.pcoa.status) << " (" << elapsed_seconds(start) << "s)\n";
        }
    }

    if (config.compute_nmds) {
        start = std::chrono::steady_clock::now();
        report.nmds = compute_nmds(report.matrix, config.nmds);
        report.nmds_points = annotate_embedding(communities, report.nmds.coordinates);
        if (config.verbose) {
            std::cout << "NMDS: stress " << report.nmds.stress << " after " << report.nmds.attempts_run
                      << " attempts, status " << status_name(report.nmds.status)
                      << " (" << elapsed_seconds(start) << "s)\n";
        }
    }

    if (config.compute_diversity) {
        report.alpha.reserve(communities.size());
        for (const auto& community : communities) {
            report.alpha.push_back(compute_alpha_diversity(community));
        }
        report.beta = compute_beta_diversity(communities);
    }

    return report;
}

} // namespace ord
