#pragma once

#include <vector>
#include <cmath>
#include <cstddef>
#include <optional>
#include <algorithm>
#include <stdexcept>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>

/**
 * @file PsychometricStats.h
 * @brief Statistical primitives shared by the measurement engine.
 *
 * Everything in this header operates on already-fetched in-memory vectors and
 * has no side effects. Degenerate inputs (too few observations, zero variance)
 * never produce NaN: correlations either return std::nullopt (Pearson) or the
 * conventional 0.0 (point-biserial), and alpha collapses to 0.0.
 */
namespace psychometrics
{
  namespace stats
  {
    /**
     * @brief Count, mean and unbiased (n-1) variance of a sample.
     */
    struct SampleMoments
    {
      std::size_t count = 0;
      double mean = 0.0;
      double variance = 0.0;   ///< sample variance, 0 when count < 2
    };

    inline double clampCorrelation(double r) noexcept
    {
      return std::max(-1.0, std::min(1.0, r));
    }

    /**
     * @brief Computes count, mean and sample variance with Boost.Accumulators.
     *
     * Boost's variance statistic is the population (divide-by-n) moment; it is
     * rescaled by n/(n-1) here because every psychometric formula in this
     * project (alpha, point-biserial SD, score-change SD) uses the sample form.
     */
    template <class Container>
    SampleMoments computeSampleMoments(const Container& values)
    {
      namespace acc_ns = boost::accumulators;
      acc_ns::accumulator_set<double,
                              acc_ns::stats<acc_ns::tag::count,
                                            acc_ns::tag::mean,
                                            acc_ns::tag::variance>> acc;

      for (const auto& v : values)
        acc(static_cast<double>(v));

      SampleMoments m;
      m.count = boost::accumulators::count(acc);
      if (m.count == 0)
        return m;

      m.mean = boost::accumulators::mean(acc);
      if (m.count >= 2)
      {
        const double n = static_cast<double>(m.count);
        // Guard tiny negative values from floating point cancellation
        m.variance = std::max(0.0, boost::accumulators::variance(acc) * n / (n - 1.0));
      }
      return m;
    }

    template <class Container>
    double sampleVariance(const Container& values)
    {
      return computeSampleMoments(values).variance;
    }

    template <class Container>
    double sampleStandardDeviation(const Container& values)
    {
      return std::sqrt(sampleVariance(values));
    }

    /**
     * @brief Pearson product-moment correlation.
     *
     *   r = sum((x - mx)(y - my)) / sqrt(sum((x - mx)^2) * sum((y - my)^2))
     *
     * @return r clamped to [-1, 1], or std::nullopt when the vectors differ in
     *         length, hold fewer than two pairs, or either has zero variance.
     */
    inline std::optional<double> pearsonCorrelation(const std::vector<double>& x,
                                                    const std::vector<double>& y)
    {
      if (x.size() != y.size() || x.size() < 2)
        return std::nullopt;

      const double mx = computeSampleMoments(x).mean;
      const double my = computeSampleMoments(y).mean;

      double sxy = 0.0, sxx = 0.0, syy = 0.0;
      for (std::size_t i = 0; i < x.size(); ++i)
      {
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
      }

      if (sxx == 0.0 || syy == 0.0)
        return std::nullopt;

      return clampCorrelation(sxy / std::sqrt(sxx * syy));
    }

    /**
     * @brief Point-biserial correlation between a 0/1 item vector and totals.
     *
     *   r_pb = (M1 - M0) / SD_total * sqrt(p * q)
     *
     * M1/M0 are the mean totals of the correct/incorrect groups, SD_total is
     * the sample SD of all totals and p is the proportion correct.
     *
     * @return r_pb clamped to [-1, 1]; 0.0 when the lengths differ, fewer than
     *         two observations exist, either group is empty, or the totals have
     *         no variance.
     */
    inline double pointBiserialCorrelation(const std::vector<int>& itemScores,
                                           const std::vector<double>& totalScores)
    {
      if (itemScores.size() != totalScores.size() || itemScores.size() < 2)
        return 0.0;

      std::vector<double> correctTotals;
      std::vector<double> incorrectTotals;
      correctTotals.reserve(itemScores.size());
      incorrectTotals.reserve(itemScores.size());

      for (std::size_t i = 0; i < itemScores.size(); ++i)
      {
        if (itemScores[i] != 0)
          correctTotals.push_back(totalScores[i]);
        else
          incorrectTotals.push_back(totalScores[i]);
      }

      if (correctTotals.empty() || incorrectTotals.empty())
        return 0.0;

      const double sdTotal = sampleStandardDeviation(totalScores);
      if (sdTotal == 0.0)
        return 0.0;

      const double m1 = computeSampleMoments(correctTotals).mean;
      const double m0 = computeSampleMoments(incorrectTotals).mean;
      const double p = static_cast<double>(correctTotals.size()) /
                       static_cast<double>(itemScores.size());
      const double q = 1.0 - p;

      return clampCorrelation(((m1 - m0) / sdTotal) * std::sqrt(p * q));
    }

    /**
     * @brief General Spearman-Brown prophecy for a test lengthened by a factor.
     *
     *   r_new = n r / (1 + (n - 1) r)
     *
     * @throws std::domain_error if lengthFactor is not positive
     */
    inline double spearmanBrownProphecy(double r, double lengthFactor)
    {
      if (!(lengthFactor > 0.0))
        throw std::domain_error("spearmanBrownProphecy: length factor must be positive");

      if (r <= -1.0)
        return -1.0;

      const double denom = 1.0 + (lengthFactor - 1.0) * r;
      if (denom <= 0.0)
        return -1.0;

      return clampCorrelation(lengthFactor * r / denom);
    }

    /**
     * @brief Split-half correction: r_full = 2 r_half / (1 + r_half).
     */
    inline double spearmanBrown(double rHalf)
    {
      return spearmanBrownProphecy(rHalf, 2.0);
    }

    /**
     * @brief Cronbach's alpha from its sufficient statistics.
     *
     *   alpha = k / (k - 1) * (1 - sum(item variances) / total variance)
     *
     * A total score with no variance carries no information about internal
     * consistency; the coefficient is reported as 0 rather than propagating a
     * division by zero. Result is clamped to [-1, 1].
     */
    inline double cronbachsAlpha(std::size_t k, double sumItemVariances, double totalVariance)
    {
      if (k < 2 || !(totalVariance > 0.0))
        return 0.0;

      const double kd = static_cast<double>(k);
      const double alpha = (kd / (kd - 1.0)) * (1.0 - sumItemVariances / totalVariance);
      return clampCorrelation(alpha);
    }

    /**
     * @brief Share of values strictly below x, as an integer percentile in [0, 100].
     *
     * Returns 50 for an empty reference set.
     */
    inline int percentileRank(const std::vector<double>& reference, double x)
    {
      if (reference.empty())
        return 50;

      const auto below = std::count_if(reference.begin(), reference.end(),
                                       [x](double v) { return v < x; });
      const int pct = static_cast<int>((static_cast<double>(below) /
                                        static_cast<double>(reference.size())) * 100.0);
      return std::max(0, std::min(100, pct));
    }

    inline double roundTo(double value, int decimals)
    {
      const double scale = std::pow(10.0, decimals);
      return std::round(value * scale) / scale;
    }
  } // namespace stats
} // namespace psychometrics
