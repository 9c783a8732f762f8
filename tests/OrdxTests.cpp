#include "ord_analysis.hpp"
#include "ord_community.hpp"
#include "ord_config.hpp"
#include "ord_dissimilarity.hpp"
#include "ord_diversity.hpp"
#include "ord_isotonic.hpp"
#include "ord_layout.hpp"
#include "ord_nmds.hpp"
#include "ord_pcoa.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const double _a = (a);                                                                                           \
    const double _b = (b);                                                                                           \
    if (!(std::fabs(_a - _b) <= (eps))) {                                                                            \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " (" << _a << ") vs " << #b     \
                << " (" << _b << ")\n";                                                                              \
    }                                                                                                                \
  } while (0)

#define EXPECT_THROW(stmt, ex_type)                                                                                  \
  do {                                                                                                               \
    bool _thrown = false;                                                                                            \
    try {                                                                                                            \
      stmt;                                                                                                          \
    } catch (const ex_type&) {                                                                                       \
      _thrown = true;                                                                                                \
    }                                                                                                                \
    if (!_thrown) {                                                                                                  \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_THROW failed: " << #stmt << " did not throw " << #ex_type \
                << "\n";                                                                                             \
    }                                                                                                                \
  } while (0)

namespace {

ord::Community MakeCommunity(int id, std::vector<int> species, std::vector<int> abundance)
{
  ord::Community c;
  c.id = id;
  c.species = std::move(species);
  c.abundance = std::move(abundance);
  return c;
}

// Four communities over two species: 0 and 1 identical, 2 and 3 disjoint
std::vector<ord::Community> TwoSpeciesScenario()
{
  return {MakeCommunity(1, {1, 2}, {10, 10}),
          MakeCommunity(2, {1, 2}, {10, 10}),
          MakeCommunity(3, {1, 2}, {0, 20}),
          MakeCommunity(4, {1, 2}, {20, 0})};
}

// Communities along an environmental gradient: each peaks on a different species
std::vector<ord::Community> GradientCommunities(int n)
{
  std::vector<ord::Community> out;
  for (int k = 0; k < n; ++k) {
    std::vector<int> species;
    std::vector<int> abundance;
    for (int s = 0; s < n + 2; ++s) {
      const double d = static_cast<double>(s - k - 1);
      const int count = static_cast<int>(std::lround(30.0 * std::exp(-0.5 * d * d)));
      if (count > 0) {
        species.push_back(s);
        abundance.push_back(count);
      }
    }
    out.push_back(MakeCommunity(100 + k, species, abundance));
  }
  return out;
}

ord::DissimilarityMatrix MatrixFromPoints(const std::vector<ord::Point2>& points)
{
  const size_t n = points.size();
  std::vector<double> values(n * n, 0.0);
  for (size_t i = 0; i < n; ++i) {
    for (size_t j = 0; j < n; ++j) {
      values[i * n + j] = ord::distance(points[i], points[j]);
    }
  }
  return ord::DissimilarityMatrix::from_dense(values, n);
}

bool IsNonDecreasingAlong(const std::vector<double>& v, const std::vector<int>& order)
{
  for (size_t k = 1; k < order.size(); ++k) {
    if (v[order[k]] < v[order[k - 1]] - 1e-12) return false;
  }
  return true;
}

} // namespace

static void TestBrayCurtisKnownValues()
{
  using namespace ord;

  const DissimilarityMatrix D = build_bray_curtis_matrix(TwoSpeciesScenario());
  EXPECT_EQ(D.size(), static_cast<size_t>(4));
  EXPECT_EQ(D.pair_count(), static_cast<size_t>(6));
  EXPECT_NEAR(D(0, 1), 0.0, 1e-12);
  EXPECT_NEAR(D(0, 2), 0.5, 1e-12);
  EXPECT_NEAR(D(0, 3), 0.5, 1e-12);
  EXPECT_NEAR(D(1, 2), 0.5, 1e-12);
  EXPECT_NEAR(D(2, 3), 1.0, 1e-12);
  EXPECT_NEAR(D.max_value(), 1.0, 1e-12);
  EXPECT_FALSE(D.is_all_zero());

  // 1 - 2 * (2 + 3) / (8 + 9)
  const DissimilarityMatrix E = build_bray_curtis_matrix({MakeCommunity(1, {7, 9}, {5, 3}),
                                                          MakeCommunity(2, {9, 7}, {7, 2})});
  EXPECT_NEAR(E(0, 1), 7.0 / 17.0, 1e-12);

  // Species absent from one community contribute only to the denominator
  const DissimilarityMatrix F = build_bray_curtis_matrix({MakeCommunity(1, {1, 2}, {4, 4}),
                                                          MakeCommunity(2, {3}, {8})});
  EXPECT_NEAR(F(0, 1), 1.0, 1e-12);
}

static void TestBrayCurtisInvariants()
{
  using namespace ord;

  const auto communities = GradientCommunities(9);
  const DissimilarityMatrix D = build_bray_curtis_matrix(communities);
  for (size_t i = 0; i < D.size(); ++i) {
    EXPECT_EQ(D(i, i), 0.0);
    for (size_t j = 0; j < D.size(); ++j) {
      EXPECT_EQ(D(i, j), D(j, i));
      EXPECT_TRUE(D(i, j) >= 0.0 && D(i, j) <= 1.0);
    }
  }

  // Order of the species listing does not matter
  const DissimilarityMatrix A = build_bray_curtis_matrix({MakeCommunity(1, {1, 2, 3}, {1, 2, 3}),
                                                          MakeCommunity(2, {1, 2, 3}, {3, 2, 1})});
  const DissimilarityMatrix B = build_bray_curtis_matrix({MakeCommunity(1, {3, 1, 2}, {3, 1, 2}),
                                                          MakeCommunity(2, {2, 3, 1}, {2, 1, 3})});
  EXPECT_NEAR(A(0, 1), B(0, 1), 1e-15);

  // Multiplying every community by the same constant leaves D unchanged
  std::vector<Community> scaled = communities;
  for (auto& c : scaled) {
    for (auto& a : c.abundance) a *= 7;
  }
  const DissimilarityMatrix S = build_bray_curtis_matrix(scaled);
  for (size_t i = 0; i < D.size(); ++i) {
    for (size_t j = 0; j < D.size(); ++j) {
      EXPECT_NEAR(S(i, j), D(i, j), 1e-12);
    }
  }

  // A single community is a 1x1 zero matrix
  const DissimilarityMatrix single = build_bray_curtis_matrix({MakeCommunity(1, {1}, {5})});
  EXPECT_EQ(single.size(), static_cast<size_t>(1));
  EXPECT_EQ(single(0, 0), 0.0);
}

static void TestPresenceMatrices()
{
  using namespace ord;

  const std::vector<Community> cs = {MakeCommunity(1, {1, 2}, {3, 1}), MakeCommunity(2, {2, 3}, {1, 9})};
  EXPECT_NEAR(build_jaccard_matrix(cs)(0, 1), 2.0 / 3.0, 1e-12);
  EXPECT_NEAR(build_sorensen_matrix(cs)(0, 1), 0.5, 1e-12);

  // Zero abundance means absent
  const std::vector<Community> zeros = {MakeCommunity(1, {1, 2}, {3, 0}), MakeCommunity(2, {1}, {9})};
  EXPECT_NEAR(build_jaccard_matrix(zeros)(0, 1), 0.0, 1e-12);
}

static void TestCommunityValidation()
{
  using namespace ord;

  EXPECT_THROW(build_bray_curtis_matrix({}), std::invalid_argument);
  EXPECT_THROW(build_bray_curtis_matrix({MakeCommunity(1, {1, 2}, {3})}), InvalidCommunityError);
  EXPECT_THROW(build_bray_curtis_matrix({MakeCommunity(1, {1}, {-2})}), InvalidCommunityError);
  EXPECT_THROW(build_bray_curtis_matrix({MakeCommunity(1, {1, 1}, {2, 3})}), InvalidCommunityError);
  EXPECT_THROW(build_bray_curtis_matrix({MakeCommunity(1, {1, 2}, {0, 0})}), InvalidCommunityError);
  EXPECT_THROW(build_bray_curtis_matrix({MakeCommunity(1, {1}, {2}), MakeCommunity(1, {2}, {3})}),
               InvalidCommunityError);

  // The error names the offending position
  try {
    build_bray_curtis_matrix({MakeCommunity(5, {1}, {2}), MakeCommunity(6, {2}, {-1})});
    EXPECT_TRUE(false);
  } catch (const InvalidCommunityError& e) {
    EXPECT_EQ(e.position(), static_cast<size_t>(1));
    EXPECT_EQ(e.community_id(), 6);
  }

  const Community c = MakeCommunity(1, {1, 2, 3}, {4, 0, 6});
  EXPECT_EQ(c.richness(), 2);
  EXPECT_EQ(c.total_abundance(), static_cast<count_t>(10));
}

static void TestFromDenseValidation()
{
  using namespace ord;

  EXPECT_THROW(DissimilarityMatrix::from_dense({0.0, 0.5, 0.5}, 2), std::invalid_argument);
  EXPECT_THROW(DissimilarityMatrix::from_dense({0.1, 0.5, 0.5, 0.0}, 2), std::invalid_argument);
  EXPECT_THROW(DissimilarityMatrix::from_dense({0.0, 0.5, 0.4, 0.0}, 2), std::invalid_argument);
  EXPECT_THROW(DissimilarityMatrix::from_dense({0.0, 1.5, 1.5, 0.0}, 2), std::invalid_argument);
  EXPECT_THROW(DissimilarityMatrix::from_dense({0.0, NAN, NAN, 0.0}, 2), std::invalid_argument);

  const DissimilarityMatrix ok = DissimilarityMatrix::from_dense({0.0, 0.25, 0.25, 0.0}, 2);
  EXPECT_NEAR(ok(1, 0), 0.25, 1e-15);
}

static void TestIsotonicRegression()
{
  using namespace ord;

  const std::vector<double> a = isotonic_regression({1.0, 3.0, 2.0, 0.0}, {0, 1, 2, 3});
  EXPECT_NEAR(a[0], 1.0, 1e-12);
  EXPECT_NEAR(a[1], 5.0 / 3.0, 1e-12);
  EXPECT_NEAR(a[2], 5.0 / 3.0, 1e-12);
  EXPECT_NEAR(a[3], 5.0 / 3.0, 1e-12);

  const std::vector<double> pooled = isotonic_regression({3.0, 1.0, 2.0}, {0, 1, 2});
  EXPECT_NEAR(pooled[0], 2.0, 1e-12);
  EXPECT_NEAR(pooled[1], 2.0, 1e-12);
  EXPECT_NEAR(pooled[2], 2.0, 1e-12);

  // Read in reverse, the increasing sequence is fully violating
  const std::vector<double> b = isotonic_regression({1.0, 2.0, 3.0}, {2, 1, 0});
  for (double v : b) EXPECT_NEAR(v, 2.0, 1e-12);

  // Already monotone input is returned unchanged
  const std::vector<double> c = isotonic_regression({0.5, 0.1, 0.9}, {1, 0, 2});
  EXPECT_NEAR(c[0], 0.5, 1e-15);
  EXPECT_NEAR(c[1], 0.1, 1e-15);
  EXPECT_NEAR(c[2], 0.9, 1e-15);

  EXPECT_TRUE(isotonic_regression({}, {}).empty());
  EXPECT_THROW(isotonic_regression({1.0, 2.0}, {0, 0}), std::invalid_argument);
  EXPECT_THROW(isotonic_regression({1.0, 2.0}, {0}), std::invalid_argument);
  EXPECT_THROW(isotonic_regression({1.0, 2.0}, {0, 2}), std::invalid_argument);
}

static void TestIsotonicProperties()
{
  using namespace ord;

  ord::MT19937 rng(77u);
  for (int trial = 0; trial < 20; ++trial) {
    const size_t n = 5 + static_cast<size_t>(trial);
    std::vector<double> values(n);
    std::vector<double> keys(n);
    for (size_t i = 0; i < n; ++i) {
      values[i] = rng.uniform(-3.0, 3.0);
      keys[i] = rng.uniform(0.0, 1.0);
    }
    const std::vector<int> order = rank_order_by(keys);
    const std::vector<double> fitted = isotonic_regression(values, order);

    EXPECT_TRUE(IsNonDecreasingAlong(fitted, order));

    // Least-squares pooling preserves the total
    double sum_in = 0.0, sum_out = 0.0;
    for (size_t i = 0; i < n; ++i) {
      sum_in += values[i];
      sum_out += fitted[i];
    }
    EXPECT_NEAR(sum_in, sum_out, 1e-9);

    // Idempotent
    const std::vector<double> again = isotonic_regression(fitted, order);
    for (size_t i = 0; i < n; ++i) EXPECT_NEAR(again[i], fitted[i], 1e-12);
  }

  // Ties on the primary key are broken by the secondary key
  const std::vector<int> order = rank_order_by({0.5, 0.2, 0.5}, {3.0, 1.0, 2.0});
  EXPECT_EQ(order[0], 1);
  EXPECT_EQ(order[1], 2);
  EXPECT_EQ(order[2], 0);
}

static void TestDoubleCentering()
{
  using namespace ord;

  const DissimilarityMatrix D = build_bray_curtis_matrix(GradientCommunities(6));
  const std::vector<double> G = double_center(D);
  const size_t n = D.size();
  for (size_t i = 0; i < n; ++i) {
    double row = 0.0;
    for (size_t j = 0; j < n; ++j) {
      row += G[i * n + j];
      EXPECT_NEAR(G[i * n + j], G[j * n + i], 1e-14);
    }
    EXPECT_NEAR(row, 0.0, 1e-12);
  }
}

static void TestPCoARecoversPlanarConfiguration()
{
  using namespace ord;

  const std::vector<Point2> truth = {{0.0, 0.0}, {0.4, 0.0}, {0.0, 0.3}, {0.4, 0.3}, {0.2, 0.15}, {0.1, 0.25}};
  const DissimilarityMatrix D = MatrixFromPoints(truth);

  PCoAConfig config;
  config.max_iterations = 2000;
  config.tolerance = 1e-12;
  const PCoAResult result = compute_pcoa(D, config);

  EXPECT_EQ(result.status, FitStatus::OK);
  EXPECT_EQ(result.coordinates.size(), truth.size());
  EXPECT_TRUE(result.eigenvalues[0] >= result.eigenvalues[1]);
  EXPECT_NEAR(result.total_variance_explained, 100.0, 1e-6);

  for (size_t i = 0; i < truth.size(); ++i) {
    for (size_t j = i + 1; j < truth.size(); ++j) {
      EXPECT_NEAR(distance(result.coordinates[i], result.coordinates[j]), D(i, j), 1e-6);
    }
  }
}

static void TestPCoAMatchesLapackSpectrum()
{
  using namespace ord;

  const DissimilarityMatrix D = build_bray_curtis_matrix(GradientCommunities(10));
  PCoAConfig config;
  config.max_iterations = 5000;
  config.tolerance = 1e-12;
  const PCoAResult result = compute_pcoa(D, config);
  const std::vector<double> spectrum = compute_pcoa_spectrum(D);

  EXPECT_EQ(spectrum.size(), D.size());
  for (size_t k = 1; k < spectrum.size(); ++k) {
    EXPECT_TRUE(spectrum[k] <= spectrum[k - 1]);
  }
  EXPECT_NEAR(result.eigenvalues[0], spectrum[0], 1e-6 * std::max(1.0, spectrum[0]));

  double positive = 0.0;
  for (double lambda : spectrum) {
    if (lambda > 0.0) positive += lambda;
  }
  EXPECT_NEAR(result.variance_explained[0], spectrum[0] / positive * 100.0, 1e-4);
  EXPECT_TRUE(result.total_variance_explained <= 100.0 + 1e-9);
  EXPECT_TRUE(result.variance_explained[0] >= result.variance_explained[1]);
}

static void TestPCoANegativeEigenvalueDoesNotTakeAxis1()
{
  using namespace ord;

  // Strongly non-Euclidean: the most negative eigenvalue of the centered
  // matrix outweighs the largest positive one
  const std::vector<double> upper = {0.8, 0.0, 0.3, 1.0, 0.0, 0.1, 1.0, 1.0, 0.0, 0.0};
  const size_t n = 5;
  std::vector<double> values(n * n, 0.0);
  size_t k = 0;
  for (size_t i = 0; i < n; ++i) {
    for (size_t j = i + 1; j < n; ++j) {
      values[i * n + j] = upper[k];
      values[j * n + i] = upper[k];
      ++k;
    }
  }
  const DissimilarityMatrix D = DissimilarityMatrix::from_dense(values, n);
  const std::vector<double> spectrum = compute_pcoa_spectrum(D);
  EXPECT_TRUE(-spectrum.back() > spectrum[0]);
  EXPECT_TRUE(spectrum[1] > 0.0);

  PCoAConfig config;
  config.max_iterations = 5000;
  config.tolerance = 1e-12;
  const PCoAResult tight = compute_pcoa(D, config);
  EXPECT_EQ(tight.status, FitStatus::OK);
  EXPECT_NEAR(tight.eigenvalues[0], spectrum[0], 1e-6);
  EXPECT_NEAR(tight.eigenvalues[1], spectrum[1], 1e-6);
  EXPECT_TRUE(tight.variance_explained[0] >= tight.variance_explained[1]);
  EXPECT_TRUE(tight.variance_explained[1] > 0.0);

  // Default settings also keep both axes on positive eigenvalues
  const PCoAResult result = compute_pcoa(D);
  EXPECT_EQ(result.status, FitStatus::OK);
  EXPECT_TRUE(result.eigenvalues[0] > 0.0 && result.eigenvalues[1] > 0.0);
  const Point2 ranges = axis_ranges(result.coordinates);
  EXPECT_TRUE(ranges.x > 0.0 && ranges.y > 0.0);
}

static void TestPCoADeterministic()
{
  using namespace ord;

  const DissimilarityMatrix D = build_bray_curtis_matrix(GradientCommunities(8));
  const PCoAResult a = compute_pcoa(D);
  const PCoAResult b = compute_pcoa(D);
  EXPECT_EQ(a.coordinates.size(), b.coordinates.size());
  for (size_t i = 0; i < a.coordinates.size(); ++i) {
    EXPECT_EQ(a.coordinates[i].x, b.coordinates[i].x);
    EXPECT_EQ(a.coordinates[i].y, b.coordinates[i].y);
  }
  EXPECT_EQ(a.variance_explained[0], b.variance_explained[0]);
}

static void TestPCoADegenerateInput()
{
  using namespace ord;

  const PCoAResult two = compute_pcoa(build_bray_curtis_matrix({MakeCommunity(1, {1}, {3}), MakeCommunity(2, {2}, {3})}));
  EXPECT_EQ(two.status, FitStatus::DEGENERATE_INPUT);
  EXPECT_EQ(two.coordinates.size(), static_cast<size_t>(2));
  EXPECT_NEAR(two.coordinates[0].x, 1.0, 1e-12);
  EXPECT_NEAR(two.coordinates[1].x, -1.0, 1e-12);
  EXPECT_NEAR(two.variance_explained[0], 50.0, 1e-12);
  EXPECT_NEAR(two.variance_explained[1], 30.0, 1e-12);

  // Identical counts, listed in different species order
  const std::vector<Community> same = {MakeCommunity(1, {1, 2}, {2, 3}), MakeCommunity(2, {2, 1}, {3, 2}),
                                       MakeCommunity(3, {1, 2}, {2, 3})};
  const DissimilarityMatrix Z = build_bray_curtis_matrix(same);
  EXPECT_TRUE(Z.is_all_zero());
  const PCoAResult zero = compute_pcoa(Z);
  EXPECT_EQ(zero.status, FitStatus::DEGENERATE_INPUT);
  EXPECT_TRUE(all_finite(zero.coordinates));
  EXPECT_NEAR(zero.variance_explained[0], 50.0, 1e-12);
  EXPECT_NEAR(zero.coordinates[0].x, 1.0, 1e-12);

  // Proportional but unequal counts are not identical under raw-count Bray-Curtis
  const DissimilarityMatrix P = build_bray_curtis_matrix({MakeCommunity(1, {1, 2}, {2, 3}),
                                                          MakeCommunity(2, {1, 2}, {4, 6})});
  EXPECT_NEAR(P(0, 1), 1.0 / 3.0, 1e-12);
  EXPECT_FALSE(P.is_all_zero());

  EXPECT_TRUE(fallback_circle_layout(1)[0].x == 0.0 && fallback_circle_layout(1)[0].y == 0.0);
  EXPECT_TRUE(fallback_circle_layout(0).empty());
}

static void TestPCoAMemoryCheck()
{
  using namespace ord;

  EXPECT_TRUE(estimate_pcoa_memory(1000) > estimate_pcoa_memory(100));
  const auto small = check_pcoa_memory(10, static_cast<size_t>(1) << 30);
  EXPECT_TRUE(small.first);
  const auto huge = check_pcoa_memory(200000, static_cast<size_t>(1) << 20);
  EXPECT_FALSE(huge.first);
  EXPECT_FALSE(huge.second.empty());
}

static void TestKruskalStress()
{
  using namespace ord;

  const std::vector<Point2> square = {{0.0, 0.0}, {0.5, 0.0}, {0.5, 0.5}, {0.0, 0.5}};
  const DissimilarityMatrix D = MatrixFromPoints(square);
  EXPECT_NEAR(kruskal_stress(square, D), 0.0, 1e-12);

  // Any monotone transform of the true distances also has zero stress
  std::vector<Point2> stretched = square;
  for (auto& p : stretched) {
    p.x *= 3.0;
    p.y *= 3.0;
  }
  EXPECT_NEAR(kruskal_stress(stretched, D), 0.0, 1e-12);

  // Swapping two corners breaks the rank order
  std::vector<Point2> swapped = square;
  std::swap(swapped[1], swapped[2]);
  EXPECT_TRUE(kruskal_stress(swapped, D) > 0.01);

  const std::vector<Point2> collapsed(4);
  EXPECT_TRUE(std::isnan(kruskal_stress(collapsed, D)));
  EXPECT_THROW(kruskal_stress(std::vector<Point2>(3), D), std::invalid_argument);
}

static void TestNMDSSquare()
{
  using namespace ord;

  const double diag = std::sqrt(0.5);
  const DissimilarityMatrix D = DissimilarityMatrix::from_dense({0.0, 0.5, diag, 0.5,
                                                                 0.5, 0.0, 0.5, diag,
                                                                 diag, 0.5, 0.0, 0.5,
                                                                 0.5, diag, 0.5, 0.0}, 4);
  const NMDSResult result = compute_nmds(D);
  EXPECT_EQ(result.status, FitStatus::OK);
  EXPECT_TRUE(result.stress >= 0.0);
  EXPECT_TRUE(result.stress < 0.05);
  EXPECT_TRUE(result.converged);
  EXPECT_TRUE(result.best_attempt >= 0);
  EXPECT_NEAR(kruskal_stress(result.coordinates, D), result.stress, 1e-9);

  // A square spans both axes; the layout must not collapse onto a line
  const Point2 ranges = axis_ranges(result.coordinates);
  NMDSConfig defaults;
  EXPECT_TRUE(ranges.x > defaults.degeneracy_threshold);
  EXPECT_TRUE(ranges.y > defaults.degeneracy_threshold);
}

static void TestNMDSGradient()
{
  using namespace ord;

  const DissimilarityMatrix D = build_bray_curtis_matrix(GradientCommunities(12));
  NMDSConfig config;
  config.seed = 4242;
  const NMDSResult result = compute_nmds(D, config);

  EXPECT_EQ(result.status, FitStatus::OK);
  EXPECT_EQ(result.coordinates.size(), D.size());
  EXPECT_TRUE(all_finite(result.coordinates));
  EXPECT_TRUE(result.stress >= 0.0 && result.stress < 1.0);
  EXPECT_TRUE(result.attempts_run >= 1 && result.attempts_run <= config.max_attempts);

  // Centered and scaled to the display bound, with both axes in use
  double max_abs = 0.0, sum_x = 0.0, sum_y = 0.0;
  for (const auto& p : result.coordinates) {
    max_abs = std::max(max_abs, std::max(std::fabs(p.x), std::fabs(p.y)));
    sum_x += p.x;
    sum_y += p.y;
  }
  EXPECT_NEAR(max_abs, config.display_bound, 1e-9);
  EXPECT_NEAR(sum_x, 0.0, 1e-9);
  EXPECT_NEAR(sum_y, 0.0, 1e-9);
  const Point2 ranges = axis_ranges(result.coordinates);
  EXPECT_TRUE(ranges.x > config.degeneracy_threshold);
  EXPECT_TRUE(ranges.y > config.degeneracy_threshold);
}

static void TestNMDSDeterministicAcrossThreads()
{
  using namespace ord;

  const DissimilarityMatrix D = build_bray_curtis_matrix(GradientCommunities(10));
  NMDSConfig config;
  config.seed = 99;
  config.good_enough_stress = 0.0;  // Run every attempt

  config.n_threads_cpu = 1;
  const NMDSResult a = compute_nmds(D, config);
  config.n_threads_cpu = 4;
  const NMDSResult b = compute_nmds(D, config);

  EXPECT_EQ(a.best_attempt, b.best_attempt);
  EXPECT_EQ(a.attempts_run, config.max_attempts);
  EXPECT_EQ(a.stress, b.stress);
  for (size_t i = 0; i < a.coordinates.size(); ++i) {
    EXPECT_EQ(a.coordinates[i].x, b.coordinates[i].x);
    EXPECT_EQ(a.coordinates[i].y, b.coordinates[i].y);
  }
}

static void TestNMDSInitialConfigurations()
{
  using namespace ord;

  MT19937 rng(derive_seed(1, 0));
  const std::vector<Point2> circle = initial_configuration(4, 0, rng, nullptr);
  EXPECT_NEAR(circle[0].x, 2.0, 1e-12);
  EXPECT_NEAR(circle[1].y, 2.0, 1e-12);

  const std::vector<Point2> grid = initial_configuration(4, 1, rng, nullptr);
  EXPECT_NEAR(grid[0].x, -1.5, 1e-12);
  EXPECT_NEAR(grid[3].x, 0.0, 1e-12);
  EXPECT_NEAR(grid[3].y, 0.0, 1e-12);

  const std::vector<Point2> start = {{1.0, 2.0}, {3.0, 4.0}};
  const std::vector<Point2> from_pcoa = initial_configuration(2, 2, rng, &start);
  EXPECT_EQ(from_pcoa[1].y, 4.0);

  // Random starts stay inside their scale and repeat for the same seed
  MT19937 r1(derive_seed(7, 5));
  MT19937 r2(derive_seed(7, 5));
  const std::vector<Point2> p1 = initial_configuration(20, 5, r1, nullptr);
  const std::vector<Point2> p2 = initial_configuration(20, 5, r2, nullptr);
  for (size_t i = 0; i < p1.size(); ++i) {
    EXPECT_EQ(p1[i].x, p2[i].x);
    EXPECT_TRUE(std::fabs(p1[i].x) <= 3.0 && std::fabs(p1[i].y) <= 3.0);
  }
  EXPECT_TRUE(derive_seed(7, 5) != derive_seed(7, 6));
}

static void TestNMDSSingleAttempt()
{
  using namespace ord;

  const std::vector<Point2> square = {{0.0, 0.0}, {0.5, 0.0}, {0.5, 0.5}, {0.0, 0.5}};
  const DissimilarityMatrix D = MatrixFromPoints(square);

  // A start that already has the right rank order stops at once with zero stress
  const NMDSAttempt exact = run_nmds_attempt(D, square, NMDSConfig());
  EXPECT_TRUE(exact.valid());
  EXPECT_NEAR(exact.stress, 0.0, 1e-9);
  EXPECT_EQ(exact.iterations, 1);

  // A scrambled start is improved
  std::vector<Point2> scrambled = square;
  std::swap(scrambled[1], scrambled[2]);
  const double before = kruskal_stress(scrambled, D);
  const NMDSAttempt improved = run_nmds_attempt(D, scrambled, NMDSConfig());
  EXPECT_TRUE(improved.finite);
  EXPECT_TRUE(improved.stress < before);

  // Coincident start points cannot be normalized
  const NMDSAttempt flat = run_nmds_attempt(D, std::vector<Point2>(4), NMDSConfig());
  EXPECT_FALSE(flat.finite);
  EXPECT_FALSE(flat.valid());

  EXPECT_THROW(run_nmds_attempt(D, std::vector<Point2>(3), NMDSConfig()), std::invalid_argument);
}

static void TestNMDSDegenerateInput()
{
  using namespace ord;

  const NMDSResult two = compute_nmds(build_bray_curtis_matrix({MakeCommunity(1, {1}, {3}), MakeCommunity(2, {2}, {3})}));
  EXPECT_EQ(two.status, FitStatus::DEGENERATE_INPUT);
  EXPECT_EQ(two.stress, 0.0);
  EXPECT_FALSE(two.converged);
  EXPECT_EQ(two.best_attempt, -1);
  EXPECT_EQ(two.coordinates.size(), static_cast<size_t>(2));

  const std::vector<Community> same = {MakeCommunity(1, {1, 2}, {5, 1}), MakeCommunity(2, {1, 2}, {5, 1}),
                                       MakeCommunity(3, {2, 1}, {1, 5}), MakeCommunity(4, {1, 2}, {5, 1})};
  EXPECT_TRUE(build_bray_curtis_matrix(same).is_all_zero());
  const NMDSResult zero = compute_nmds(build_bray_curtis_matrix(same));
  EXPECT_EQ(zero.status, FitStatus::DEGENERATE_INPUT);
  EXPECT_TRUE(all_finite(zero.coordinates));
  EXPECT_NEAR(zero.coordinates[1].y, 1.0, 1e-12);

  NMDSConfig bad;
  bad.max_attempts = 0;
  EXPECT_THROW(bad.validate(), std::invalid_argument);
  EXPECT_THROW(compute_nmds(build_bray_curtis_matrix(same), bad), std::invalid_argument);
}

static void TestEndToEndScenario()
{
  using namespace ord;

  const auto communities = TwoSpeciesScenario();
  const OrdinationReport report = analyze_communities(communities);

  EXPECT_EQ(report.matrix.size(), static_cast<size_t>(4));
  EXPECT_EQ(report.pcoa_points.size(), static_cast<size_t>(4));
  EXPECT_EQ(report.nmds_points.size(), static_cast<size_t>(4));
  EXPECT_EQ(report.pcoa_points[2].community_id, 3);
  EXPECT_EQ(report.nmds_points[3].richness, 1);
  EXPECT_EQ(report.nmds_points[0].total_abundance, static_cast<count_t>(20));

  // Identical communities coincide; the two opposite communities are furthest apart
  EXPECT_EQ(report.pcoa.status, FitStatus::OK);
  EXPECT_TRUE(distance(report.pcoa.coordinates[0], report.pcoa.coordinates[1]) < 0.05);
  EXPECT_TRUE(distance(report.pcoa.coordinates[2], report.pcoa.coordinates[3]) > 0.9);
  EXPECT_NEAR(report.pcoa.variance_explained[0], 100.0, 1e-6);

  EXPECT_EQ(report.nmds.status, FitStatus::OK);
  EXPECT_TRUE(distance(report.nmds.coordinates[0], report.nmds.coordinates[1]) < 0.05);
  EXPECT_TRUE(distance(report.nmds.coordinates[2], report.nmds.coordinates[3]) > 1.0);

  EXPECT_EQ(report.alpha.size(), static_cast<size_t>(4));
  EXPECT_EQ(report.beta.gamma_richness, 2);

  OrdinationConfig only_matrix;
  only_matrix.compute_pcoa = false;
  only_matrix.compute_nmds = false;
  only_matrix.compute_diversity = false;
  const OrdinationReport bare = analyze_communities(communities, only_matrix);
  EXPECT_TRUE(bare.pcoa_points.empty());
  EXPECT_TRUE(bare.nmds_points.empty());
  EXPECT_TRUE(bare.alpha.empty());

  EXPECT_THROW(annotate_embedding(communities, std::vector<Point2>(3)), std::invalid_argument);
}

static void TestDiversityIndices()
{
  using namespace ord;

  const AlphaDiversity even = compute_alpha_diversity(MakeCommunity(1, {1, 2}, {10, 10}));
  EXPECT_EQ(even.richness, 2);
  EXPECT_NEAR(even.shannon, std::log(2.0), 1e-12);
  EXPECT_NEAR(even.simpson_diversity, 0.5, 1e-12);
  EXPECT_NEAR(even.inverse_simpson, 2.0, 1e-12);
  EXPECT_NEAR(even.pielou, 1.0, 1e-12);
  EXPECT_NEAR(even.berger_parker, 0.5, 1e-12);
  EXPECT_NEAR(even.margalef, 1.0 / std::log(20.0), 1e-12);
  EXPECT_NEAR(even.menhinick, 2.0 / std::sqrt(20.0), 1e-12);

  const AlphaDiversity mono = compute_alpha_diversity(MakeCommunity(1, {1, 2}, {7, 0}));
  EXPECT_EQ(mono.richness, 1);
  EXPECT_NEAR(mono.shannon, 0.0, 1e-12);
  EXPECT_NEAR(mono.pielou, 0.0, 1e-12);
  EXPECT_NEAR(mono.berger_parker, 1.0, 1e-12);

  const BetaDiversity beta = compute_beta_diversity({MakeCommunity(1, {1, 2}, {3, 1}), MakeCommunity(2, {2, 3}, {1, 9})});
  EXPECT_EQ(beta.gamma_richness, 3);
  EXPECT_NEAR(beta.mean_alpha_richness, 2.0, 1e-12);
  EXPECT_NEAR(beta.whittaker, 1.5, 1e-12);
  EXPECT_NEAR(beta.additive, 1.0, 1e-12);
  EXPECT_NEAR(beta.harrison, 0.5, 1e-12);
  EXPECT_NEAR(beta.williams, 1.0 / 3.0, 1e-12);
  EXPECT_NEAR(beta.routledge, 1.0 / 12.0, 1e-12);
  EXPECT_NEAR(beta.mean_jaccard_similarity, 1.0 / 3.0, 1e-12);
  EXPECT_NEAR(beta.mean_sorensen_dissimilarity, 0.5, 1e-12);
  EXPECT_EQ(beta.comparisons, 1);

  const BetaDiversity lone = compute_beta_diversity({MakeCommunity(1, {1}, {3})});
  EXPECT_EQ(lone.comparisons, 0);
  EXPECT_NEAR(lone.routledge, 0.0, 1e-12);

  EXPECT_THROW(compute_alpha_diversity(MakeCommunity(1, {1}, {0})), InvalidCommunityError);
}

int main()
{
  TestBrayCurtisKnownValues();
  TestBrayCurtisInvariants();
  TestPresenceMatrices();
  TestCommunityValidation();
  TestFromDenseValidation();
  TestIsotonicRegression();
  TestIsotonicProperties();
  TestDoubleCentering();
  TestPCoARecoversPlanarConfiguration();
  TestPCoAMatchesLapackSpectrum();
  TestPCoANegativeEigenvalueDoesNotTakeAxis1();
  TestPCoADeterministic();
  TestPCoADegenerateInput();
  TestPCoAMemoryCheck();
  TestKruskalStress();
  TestNMDSSquare();
  TestNMDSGradient();
  TestNMDSDeterministicAcrossThreads();
  TestNMDSInitialConfigurations();
  TestNMDSSingleAttempt();
  TestNMDSDegenerateInput();
  TestEndToEndScenario();
  TestDiversityIndices();

  if (g_failures == 0) {
    std::cout << "ordx_tests: OK\n";
    return 0;
  }

  std::cerr << "ordx_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
