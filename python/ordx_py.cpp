#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include "ord_types.hpp"
#include "ord_config.hpp"
#include "ord_community.hpp"
#include "ord_dissimilarity.hpp"
#include "ord_isotonic.hpp"
#include "ord_pcoa.hpp"
#include "ord_nmds.hpp"
#include "ord_diversity.hpp"
#include "ord_analysis.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

// (n, 2) float64 array of a layout
py::array_t<ord::dp_t> coordinates_to_numpy(const std::vector<ord::Point2>& points) {
    py::array_t<ord::dp_t> out({static_cast<py::ssize_t>(points.size()), static_cast<py::ssize_t>(2)});
    auto buf = out.mutable_unchecked<2>();
    for (size_t i = 0; i < points.size(); i++) {
        buf(i, 0) = points[i].x;
        buf(i, 1) = points[i].y;
    }
    return out;
}

py::array_t<ord::dp_t> matrix_to_numpy(const ord::DissimilarityMatrix& D) {
    const py::ssize_t n = static_cast<py::ssize_t>(D.size());
    py::array_t<ord::dp_t> out({n, n});
    auto buf = out.mutable_unchecked<2>();
    for (py::ssize_t i = 0; i < n; i++) {
        for (py::ssize_t j = 0; j < n; j++) {
            buf(i, j) = D(i, j);
        }
    }
    return out;
}

ord::DissimilarityMatrix matrix_from_numpy(py::array_t<ord::dp_t, py::array::c_style | py::array::forcecast> D) {
    auto buf = D.request();
    if (buf.ndim != 2 || buf.shape[0] != buf.shape[1]) {
        throw std::runtime_error("Dissimilarity matrix must be a square 2-dimensional array");
    }
    const size_t n = static_cast<size_t>(buf.shape[0]);
    const ord::dp_t* ptr = static_cast<const ord::dp_t*>(buf.ptr);
    return ord::DissimilarityMatrix::from_dense(std::vector<ord::dp_t>(ptr, ptr + n * n), n);
}

const char* status_name(ord::FitStatus status) {
    switch (status) {
        case ord::FitStatus::OK: return "OK";
        case ord::FitStatus::DEGENERATE_INPUT: return "DEGENERATE_INPUT";
        case ord::FitStatus::NUMERIC_INSTABILITY: return "NUMERIC_INSTABILITY";
    }
    return "UNKNOWN";
}

py::dict pcoa_to_dict(const ord::PCoAResult& result) {
    py::dict d;
    d["coordinates"] = coordinates_to_numpy(result.coordinates);
    d["variance_explained"] = py::make_tuple(result.variance_explained[0], result.variance_explained[1]);
    d["total_variance_explained"] = result.total_variance_explained;
    d["eigenvalues"] = py::make_tuple(result.eigenvalues[0], result.eigenvalues[1]);
    d["status"] = result.status;
    return d;
}

py::dict nmds_to_dict(const ord::NMDSResult& result) {
    py::dict d;
    d["coordinates"] = coordinates_to_numpy(result.coordinates);
    d["stress"] = result.stress;
    d["converged"] = result.converged;
    d["iterations"] = result.iterations;
    d["attempts_run"] = result.attempts_run;
    d["best_attempt"] = result.best_attempt;
    d["status"] = result.status;
    return d;
}

} // namespace

PYBIND11_MODULE(ORDX, m) {
    m.doc() = "Ecological ordination (Bray-Curtis, PCoA, NMDS) and diversity indices";

    py::enum_<ord::FitStatus>(m, "FitStatus")
        .value("OK", ord::FitStatus::OK)
        .value("DEGENERATE_INPUT", ord::FitStatus::DEGENERATE_INPUT)
        .value("NUMERIC_INSTABILITY", ord::FitStatus::NUMERIC_INSTABILITY)
        .def("__str__", [](ord::FitStatus s) { return std::string(status_name(s)); });

    py::register_exception<ord::InvalidCommunityError>(m, "InvalidCommunityError", PyExc_ValueError);

    py::class_<ord::Community>(m, "Community")
        .def(py::init<>())
        .def(py::init([](ord::integer_t id, std::vector<ord::integer_t> species, std::vector<ord::integer_t> abundance) {
                 ord::Community c;
                 c.id = id;
                 c.species = std::move(species);
                 c.abundance = std::move(abundance);
                 return c;
             }),
             py::arg("id"), py::arg("species"), py::arg("abundance"))
        .def_readwrite("id", &ord::Community::id, "Community identifier")
        .def_readwrite("species", &ord::Community::species, "Species ids")
        .def_readwrite("abundance", &ord::Community::abundance, "Individuals per species (parallel to species)")
        .def_property_readonly("richness", &ord::Community::richness)
        .def_property_readonly("total_abundance", &ord::Community::total_abundance);

    py::class_<ord::PCoAConfig>(m, "PCoAConfig")
        .def(py::init<>())
        .def_readwrite("max_iterations", &ord::PCoAConfig::max_iterations, "Power iteration cap per component")
        .def_readwrite("tolerance", &ord::PCoAConfig::tolerance, "Eigenvector convergence tolerance")
        .def_readwrite("seed", &ord::PCoAConfig::seed, "Seed for the power iteration start vectors")
        .def_readwrite("memory_check", &ord::PCoAConfig::memory_check, "Refuse matrices that do not fit in memory")
        .def_readwrite("verbose", &ord::PCoAConfig::verbose, "Print progress")
        .def("validate", &ord::PCoAConfig::validate);

    py::class_<ord::NMDSConfig>(m, "NMDSConfig")
        .def(py::init<>())
        .def_readwrite("seed", &ord::NMDSConfig::seed, "Random seed for the random starts")
        .def_readwrite("max_attempts", &ord::NMDSConfig::max_attempts, "Independent starts")
        .def_readwrite("max_iterations", &ord::NMDSConfig::max_iterations, "Gradient steps per attempt")
        .def_readwrite("tolerance", &ord::NMDSConfig::tolerance, "Stress change counted as stagnation")
        .def_readwrite("stagnation_limit", &ord::NMDSConfig::stagnation_limit, "Stagnant steps before an attempt stops")
        .def_readwrite("base_step", &ord::NMDSConfig::base_step, "Step size multiplier (1 = Guttman step)")
        .def_readwrite("min_step_fraction", &ord::NMDSConfig::min_step_fraction, "Floor of the step decay")
        .def_readwrite("step_decay", &ord::NMDSConfig::step_decay, "Step decay time constant in iterations")
        .def_readwrite("warmup_iterations", &ord::NMDSConfig::warmup_iterations, "Iterations before the degeneracy check")
        .def_readwrite("degeneracy_threshold", &ord::NMDSConfig::degeneracy_threshold, "Minimum axis range")
        .def_readwrite("good_enough_stress", &ord::NMDSConfig::good_enough_stress, "Stop launching attempts below this stress")
        .def_readwrite("convergence_stress", &ord::NMDSConfig::convergence_stress, "Converged flag threshold")
        .def_readwrite("display_bound", &ord::NMDSConfig::display_bound, "Max |coordinate| of the result")
        .def_readwrite("use_pcoa_start", &ord::NMDSConfig::use_pcoa_start, "Start attempt 2 from PCoA")
        .def_readwrite("n_threads_cpu", &ord::NMDSConfig::n_threads_cpu, "OpenMP threads (0 = default)")
        .def_readwrite("verbose", &ord::NMDSConfig::verbose, "Print progress")
        .def("validate", &ord::NMDSConfig::validate);

    py::class_<ord::OrdinationConfig>(m, "OrdinationConfig")
        .def(py::init<>())
        .def_readwrite("pcoa", &ord::OrdinationConfig::pcoa)
        .def_readwrite("nmds", &ord::OrdinationConfig::nmds)
        .def_readwrite("compute_pcoa", &ord::OrdinationConfig::compute_pcoa)
        .def_readwrite("compute_nmds", &ord::OrdinationConfig::compute_nmds)
        .def_readwrite("compute_diversity", &ord::OrdinationConfig::compute_diversity)
        .def_readwrite("verbose", &ord::OrdinationConfig::verbose)
        .def("validate", &ord::OrdinationConfig::validate);

    py::class_<ord::AlphaDiversity>(m, "AlphaDiversity")
        .def_readonly("richness", &ord::AlphaDiversity::richness)
        .def_readonly("total_abundance", &ord::AlphaDiversity::total_abundance)
        .def_readonly("shannon", &ord::AlphaDiversity::shannon)
        .def_readonly("simpson_diversity", &ord::AlphaDiversity::simpson_diversity)
        .def_readonly("inverse_simpson", &ord::AlphaDiversity::inverse_simpson)
        .def_readonly("pielou", &ord::AlphaDiversity::pielou)
        .def_readonly("berger_parker", &ord::AlphaDiversity::berger_parker)
        .def_readonly("margalef", &ord::AlphaDiversity::margalef)
        .def_readonly("menhinick", &ord::AlphaDiversity::menhinick);

    py::class_<ord::BetaDiversity>(m, "BetaDiversity")
        .def_readonly("gamma_richness", &ord::BetaDiversity::gamma_richness)
        .def_readonly("mean_alpha_richness", &ord::BetaDiversity::mean_alpha_richness)
        .def_readonly("whittaker", &ord::BetaDiversity::whittaker)
        .def_readonly("additive", &ord::BetaDiversity::additive)
        .def_readonly("harrison", &ord::BetaDiversity::harrison)
        .def_readonly("williams", &ord::BetaDiversity::williams)
        .def_readonly("routledge", &ord::BetaDiversity::routledge)
        .def_readonly("mean_jaccard_similarity", &ord::BetaDiversity::mean_jaccard_similarity)
        .def_readonly("mean_jaccard_dissimilarity", &ord::BetaDiversity::mean_jaccard_dissimilarity)
        .def_readonly("mean_sorensen_similarity", &ord::BetaDiversity::mean_sorensen_similarity)
        .def_readonly("mean_sorensen_dissimilarity", &ord::BetaDiversity::mean_sorensen_dissimilarity)
        .def_readonly("comparisons", &ord::BetaDiversity::comparisons);

    m.def("bray_curtis", [](const std::vector<ord::Community>& communities) {
        return matrix_to_numpy(ord::build_bray_curtis_matrix(communities));
    }, py::arg("communities"), "Bray-Curtis dissimilarity matrix (n, n)");

    m.def("jaccard", [](const std::vector<ord::Community>& communities) {
        return matrix_to_numpy(ord::build_jaccard_matrix(communities));
    }, py::arg("communities"), "Jaccard (presence/absence) dissimilarity matrix (n, n)");

    m.def("sorensen", [](const std::vector<ord::Community>& communities) {
        return matrix_to_numpy(ord::build_sorensen_matrix(communities));
    }, py::arg("communities"), "Sørensen (presence/absence) dissimilarity matrix (n, n)");

    m.def("pcoa", [](py::array_t<ord::dp_t, py::array::c_style | py::array::forcecast> D, const ord::PCoAConfig& config) {
        ord::DissimilarityMatrix matrix = matrix_from_numpy(D);
        ord::PCoAResult result;
        {
            py::gil_scoped_release release;
            result = ord::compute_pcoa(matrix, config);
        }
        return pcoa_to_dict(result);
    }, py::arg("D"), py::arg("config") = ord::PCoAConfig(), "Principal Coordinates Analysis onto two axes");

    m.def("nmds", [](py::array_t<ord::dp_t, py::array::c_style | py::array::forcecast> D, const ord::NMDSConfig& config) {
        ord::DissimilarityMatrix matrix = matrix_from_numpy(D);
        ord::NMDSResult result;
        {
            py::gil_scoped_release release;
            result = ord::compute_nmds(matrix, config);
        }
        return nmds_to_dict(result);
    }, py::arg("D"), py::arg("config") = ord::NMDSConfig(), "Non-metric MDS onto two axes");

    m.def("kruskal_stress", [](py::array_t<ord::dp_t, py::array::c_style | py::array::forcecast> points,
                               py::array_t<ord::dp_t, py::array::c_style | py::array::forcecast> D) {
        auto buf = points.request();
        if (buf.ndim != 2 || buf.shape[1] != 2) {
            throw std::runtime_error("points must have shape (n, 2)");
        }
        const ord::dp_t* ptr = static_cast<const ord::dp_t*>(buf.ptr);
        std::vector<ord::Point2> layout(static_cast<size_t>(buf.shape[0]));
        for (size_t i = 0; i < layout.size(); i++) {
            layout[i] = ord::Point2{ptr[2 * i], ptr[2 * i + 1]};
        }
        return ord::kruskal_stress(layout, matrix_from_numpy(D));
    }, py::arg("points"), py::arg("D"), "Kruskal stress-1 of a layout against D");

    m.def("isotonic_regression", &ord::isotonic_regression, py::arg("values"), py::arg("rank_order"),
          "Pool Adjacent Violators fit, non-decreasing along rank_order");

    m.def("alpha_diversity", &ord::compute_alpha_diversity, py::arg("community"));
    m.def("beta_diversity", &ord::compute_beta_diversity, py::arg("communities"));

    m.def("analyze", [](const std::vector<ord::Community>& communities, const ord::OrdinationConfig& config) {
        ord::OrdinationReport report;
        {
            py::gil_scoped_release release;
            report = ord::analyze_communities(communities, config);
        }

        auto points_to_list = [](const std::vector<ord::OrdinationPoint>& points) {
            py::list out;
            for (const auto& p : points) {
                py::dict d;
                d["community_id"] = p.community_id;
                d["axis1"] = p.axis1;
                d["axis2"] = p.axis2;
                d["richness"] = p.richness;
                d["total_abundance"] = p.total_abundance;
                out.append(d);
            }
            return out;
        };

        py::dict out;
        out["matrix"] = matrix_to_numpy(report.matrix);
        if (config.compute_pcoa) {
            py::dict pcoa = pcoa_to_dict(report.pcoa);
            pcoa["points"] = points_to_list(report.pcoa_points);
            out["pcoa"] = pcoa;
        }
        if (config.compute_nmds) {
            py::dict nmds = nmds_to_dict(report.nmds);
            nmds["points"] = points_to_list(report.nmds_points);
            out["nmds"] = nmds;
        }
        if (config.compute_diversity) {
            out["alpha"] = report.alpha;
            out["beta"] = report.beta;
        }
        return out;
    }, py::arg("communities"), py::arg("config") = ord::OrdinationConfig(),
       "Bray-Curtis matrix, PCoA, NMDS and diversity summary for a community set");
}
