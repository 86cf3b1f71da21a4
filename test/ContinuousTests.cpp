#include "Continuous.hpp"
#include "Numerics.hpp"
#include "RandomSource.hpp"
#include "SampleStatistics.hpp"
#include "Sampler.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

//-------------------------------------------------------------------------

using namespace probkit;
using namespace testing;

//-------------------------------------------------------------------------

namespace {

    //Composite Simpson's rule with n (even) intervals
    double IntegrateDensity(const CContinuous & dist, double lo, double hi, size_t n = 20000){
        double h = (hi - lo) / n;
        double sum = dist.pdf(lo) + dist.pdf(hi);
        for(size_t i = 1; i < n; i++){
            sum += ((i % 2) ? 4.0 : 2.0) * dist.pdf(lo + i * h);
        }
        return sum * h / 3.0;
    }

    template<typename Dist>
    void ExpectQuantileInvertsCumulative(const Dist & dist, double tolerance = 1e-12){
        double previous = -std::numeric_limits<double>::infinity();
        for(double p : {1e-6, 0.01, 0.1, 0.25, 0.5, 0.75, 0.9, 0.99, 1.0 - 1e-6}){
            double x = dist.quantile(p);
            EXPECT_GT(x, previous) << "p = " << p;
            EXPECT_NEAR(dist.cdf(x), p, tolerance) << "p = " << p;
            previous = x;
        }
        EXPECT_THROW(dist.quantile(-0.01), std::domain_error);
        EXPECT_THROW(dist.quantile(1.01), std::domain_error);
    }

}

//-------------------------------------------------------------------------

TEST(UniformTest, DensityAndCumulative)
{
    CUniform uniform(7.0, 42.0);
    EXPECT_EQ(uniform.pdf(6.0), 0.0);
    EXPECT_DOUBLE_EQ(uniform.pdf(7.0), 1.0 / 35.0);
    EXPECT_DOUBLE_EQ(uniform.pdf(20.0), 1.0 / 35.0);
    EXPECT_EQ(uniform.pdf(43.0), 0.0);

    EXPECT_EQ(uniform.cdf(0.0), 0.0);
    EXPECT_DOUBLE_EQ(uniform.cdf(24.5), 0.5);
    EXPECT_EQ(uniform.cdf(42.0), 1.0);
    EXPECT_EQ(uniform.cdf(100.0), 1.0);
}

//-------------------------------------------------------------------------

TEST(UniformTest, Quantile)
{
    CUniform uniform(7.0, 42.0);
    EXPECT_EQ(uniform.quantile(0.0), 7.0);
    EXPECT_EQ(uniform.quantile(1.0), 42.0);
    EXPECT_DOUBLE_EQ(uniform.quantile(0.2), 14.0);
    ExpectQuantileInvertsCumulative(uniform);
}

//-------------------------------------------------------------------------

TEST(UniformTest, Summaries)
{
    CUniform uniform(7.0, 42.0);
    EXPECT_EQ(uniform.mean(), 24.5);
    EXPECT_EQ(uniform.median(), 24.5);
    EXPECT_DOUBLE_EQ(uniform.variance(), 35.0 * 35.0 / 12.0);
    EXPECT_EQ(uniform.skewness(), 0.0);
    EXPECT_EQ(uniform.kurtosis(), -1.2);
    EXPECT_DOUBLE_EQ(uniform.entropy(), std::log(35.0));
}

//-------------------------------------------------------------------------

TEST(UniformTest, RejectsInvalidParameters)
{
    EXPECT_THROW(CUniform(1.0, 1.0), std::invalid_argument);
    EXPECT_THROW(CUniform(2.0, 1.0), std::invalid_argument);
    EXPECT_THROW(CUniform(std::nan(""), 1.0), std::invalid_argument);
    EXPECT_THROW(CUniform(0.0, inf), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(UniformTest, SamplingStaysInBounds)
{
    CUniform uniform(7.0, 42.0);
    CXorshift128Plus source(42, 69);
    std::vector<double> vDraws = CIndependentSampler<double>(uniform, source).take(100000);
    for(double x : vDraws){
        ASSERT_GE(x, 7.0);
        ASSERT_LT(x, 42.0);
    }
    EXPECT_NEAR(GetMean(vDraws), 24.5, 0.2);
    EXPECT_NEAR(GetStandardDeviation(vDraws), std::sqrt(uniform.variance()), 0.2);
}

//-------------------------------------------------------------------------

TEST(ExponentialTest, DensityAndCumulative)
{
    CExponential exponential(2.0);
    EXPECT_EQ(exponential.pdf(-1.0), 0.0);
    EXPECT_EQ(exponential.pdf(0.0), 2.0);
    EXPECT_DOUBLE_EQ(exponential.pdf(1.0), 2.0 * std::exp(-2.0));
    EXPECT_EQ(exponential.cdf(-1.0), 0.0);
    EXPECT_EQ(exponential.cdf(0.0), 0.0);
    EXPECT_DOUBLE_EQ(exponential.cdf(1.0), 1.0 - std::exp(-2.0));
    //No cancellation close to zero
    EXPECT_DOUBLE_EQ(exponential.cdf(1e-20), 2e-20);
    EXPECT_NEAR(IntegrateDensity(exponential, 0.0, 40.0), 1.0, 1e-9);
}

//-------------------------------------------------------------------------

TEST(ExponentialTest, Quantile)
{
    CExponential exponential(2.0);
    EXPECT_EQ(exponential.quantile(0.0), 0.0);
    EXPECT_EQ(exponential.quantile(1.0), inf);
    EXPECT_DOUBLE_EQ(exponential.quantile(0.5), std::log(2.0) / 2.0);
    EXPECT_DOUBLE_EQ(exponential.quantile(1e-20), 5e-21);
    ExpectQuantileInvertsCumulative(exponential);
}

//-------------------------------------------------------------------------

TEST(ExponentialTest, Summaries)
{
    CExponential exponential(2.0);
    EXPECT_EQ(exponential.mean(), 0.5);
    EXPECT_EQ(exponential.variance(), 0.25);
    EXPECT_EQ(exponential.deviation(), 0.5);
    EXPECT_EQ(exponential.skewness(), 2.0);
    EXPECT_EQ(exponential.kurtosis(), 6.0);
    EXPECT_DOUBLE_EQ(exponential.median(), std::log(2.0) / 2.0);
    EXPECT_THAT(exponential.modes(), ElementsAre(0.0));
    EXPECT_DOUBLE_EQ(exponential.entropy(), 1.0 - std::log(2.0));
}

//-------------------------------------------------------------------------

TEST(ExponentialTest, RejectsInvalidParameters)
{
    EXPECT_THROW(CExponential(0.0), std::invalid_argument);
    EXPECT_THROW(CExponential(-1.0), std::invalid_argument);
    EXPECT_THROW(CExponential{inf}, std::invalid_argument);
    EXPECT_THROW(CExponential(std::nan("")), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(ExponentialTest, SamplingMatchesMoments)
{
    CExponential exponential(2.0);
    CXorshift128Plus source(42, 69);
    std::vector<double> vDraws = CIndependentSampler<double>(exponential, source).take(100000);
    for(double x : vDraws){
        ASSERT_GE(x, 0.0);
    }
    EXPECT_NEAR(GetMean(vDraws), 0.5, 0.01);
    EXPECT_NEAR(GetMedian(vDraws), std::log(2.0) / 2.0, 0.01);
}

//-------------------------------------------------------------------------

TEST(CauchyTest, Density)
{
    CCauchy cauchy(2.0, 8.0);
    const std::vector<double> x = {-1, 0, 0.5, 1, 1.5, 2, 2.5, 3, 4, 6, 12};
    const std::vector<double> p = {
        0.03488327519822364, 0.03744822190397538, 0.03843742021842001,
        0.039176601376466544, 0.03963391578942141, 0.039788735772973836,
        0.03963391578942141, 0.039176601376466544, 0.03744822190397538,
        0.03183098861837907, 0.015527311521160521
    };
    for(size_t i = 0; i < x.size(); i++){
        EXPECT_NEAR(cauchy.pdf(x[i]), p[i], 1e-14) << "x = " << x[i];
    }
}

//-------------------------------------------------------------------------

TEST(CauchyTest, Cumulative)
{
    CCauchy cauchy(2.0, 8.0);
    const std::vector<double> x = {-1, 0, 0.01, 0.05, 0.1, 0.15, 0.25, 0.5, 1, 1.5, 2, 3, 4};
    const std::vector<double> p = {
        0.3857997487800918, 0.4220208696226307, 0.4223954618429798,
        0.4238960166273086, 0.4257765641957529, 0.42766240385764065,
        0.43144951512041, 0.44100191513247144, 0.46041657583943446,
        0.48013147569445913, 0.5, 0.5395834241605656, 0.5779791303773694
    };
    for(size_t i = 0; i < x.size(); i++){
        EXPECT_NEAR(cauchy.cdf(x[i]), p[i], 1e-14) << "x = " << x[i];
    }
}

//-------------------------------------------------------------------------

TEST(CauchyTest, Quantile)
{
    CCauchy cauchy(2.0, 3.0);
    const std::vector<double> p = {0.1, 0.25, 0.5, 0.75, 0.9};
    const std::vector<double> x = {
        -7.2330506115257585, -0.9999999999999996, 2.0, 5.0, 11.233050611525758
    };
    for(size_t i = 0; i < p.size(); i++){
        EXPECT_NEAR(cauchy.quantile(p[i]), x[i], 1e-13) << "p = " << p[i];
    }
    EXPECT_EQ(cauchy.quantile(0.0), -inf);
    EXPECT_EQ(cauchy.quantile(1.0), inf);
    ExpectQuantileInvertsCumulative(cauchy);
}

//-------------------------------------------------------------------------

TEST(CauchyTest, Summaries)
{
    CCauchy cauchy(3.0, 5.2);
    EXPECT_EQ(cauchy.median(), 3.0);
    EXPECT_THAT(cauchy.modes(), ElementsAre(3.0));
    EXPECT_NEAR(cauchy.entropy(), 4.1796828725566719243, 1e-14);
    EXPECT_NEAR(CCauchy(2.0, 1.0).entropy(), std::log(4.0 * pi), 1e-15);
}

//-------------------------------------------------------------------------

TEST(CauchyTest, RejectsInvalidParameters)
{
    EXPECT_THROW(CCauchy(0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(CCauchy(0.0, -2.0), std::invalid_argument);
    EXPECT_THROW(CCauchy(0.0, inf), std::invalid_argument);
    EXPECT_THROW(CCauchy(inf, 1.0), std::invalid_argument);
    EXPECT_THROW(CCauchy(std::nan(""), 1.0), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(CauchyTest, SamplingMatchesEntropy)
{
    //Monte Carlo estimate of the divergence of the sampled distribution from the density
    CCauchy cauchy(35.4, 12.3);
    CXorshift128Plus source(42, 69);
    std::vector<double> vDraws = CIndependentSampler<double>(cauchy, source).take(100000);
    double logLikelihood = 0.0;
    for(double x : vDraws){
        logLikelihood += std::log(cauchy.pdf(x));
    }
    double divergence = -logLikelihood / vDraws.size() - cauchy.entropy();
    EXPECT_LT(std::fabs(divergence), 0.01);
    EXPECT_NEAR(GetMedian(vDraws), 35.4, 0.5);
}

//-------------------------------------------------------------------------

TEST(LaplaceTest, DensityAndCumulative)
{
    CLaplace laplace(1.0, 2.0);
    EXPECT_DOUBLE_EQ(laplace.pdf(1.0), 0.25);
    EXPECT_DOUBLE_EQ(laplace.pdf(3.0), 0.25 * std::exp(-1.0));
    EXPECT_DOUBLE_EQ(laplace.pdf(-1.0), 0.25 * std::exp(-1.0));
    EXPECT_EQ(laplace.cdf(1.0), 0.5);
    EXPECT_DOUBLE_EQ(laplace.cdf(-1.0), 0.5 * std::exp(-1.0));
    EXPECT_DOUBLE_EQ(laplace.cdf(3.0), 1.0 - 0.5 * std::exp(-1.0));
    EXPECT_NEAR(IntegrateDensity(laplace, -79.0, 81.0), 1.0, 1e-6);
}

//-------------------------------------------------------------------------

TEST(LaplaceTest, Quantile)
{
    CLaplace laplace(1.0, 2.0);
    EXPECT_EQ(laplace.quantile(0.5), 1.0);
    EXPECT_EQ(laplace.quantile(0.0), -inf);
    EXPECT_EQ(laplace.quantile(1.0), inf);
    EXPECT_DOUBLE_EQ(laplace.quantile(0.5 * std::exp(-1.0)), -1.0);
    ExpectQuantileInvertsCumulative(laplace);
}

//-------------------------------------------------------------------------

TEST(LaplaceTest, Summaries)
{
    CLaplace laplace(1.0, 2.0);
    EXPECT_EQ(laplace.mean(), 1.0);
    EXPECT_EQ(laplace.median(), 1.0);
    EXPECT_THAT(laplace.modes(), ElementsAre(1.0));
    EXPECT_EQ(laplace.variance(), 8.0);
    EXPECT_EQ(laplace.skewness(), 0.0);
    EXPECT_EQ(laplace.kurtosis(), 3.0);
    EXPECT_DOUBLE_EQ(laplace.entropy(), 1.0 + std::log(4.0));
}

//-------------------------------------------------------------------------

TEST(LaplaceTest, RejectsInvalidParameters)
{
    EXPECT_THROW(CLaplace(0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(CLaplace(0.0, -1.0), std::invalid_argument);
    EXPECT_THROW(CLaplace(-inf, 1.0), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(LaplaceTest, SamplingMatchesMoments)
{
    CLaplace laplace(1.0, 2.0);
    CXorshift128Plus source(42, 69);
    std::vector<double> vDraws = CIndependentSampler<double>(laplace, source).take(100000);
    EXPECT_NEAR(GetMean(vDraws), 1.0, 0.05);
    EXPECT_NEAR(GetMedian(vDraws), 1.0, 0.05);
    //The mean absolute deviation about the median is the scale
    EXPECT_NEAR(GetMeanAbsoluteDeviation(vDraws), 2.0, 0.05);
}

//-------------------------------------------------------------------------

TEST(LogisticTest, DensityIsSymmetric)
{
    CLogistic logistic(0.5, 2.0);
    EXPECT_DOUBLE_EQ(logistic.pdf(0.5), 0.125);
    for(double d : {0.1, 1.0, 3.0, 10.0, 100.0}){
        EXPECT_DOUBLE_EQ(logistic.pdf(0.5 + d), logistic.pdf(0.5 - d)) << "d = " << d;
        EXPECT_GT(logistic.pdf(0.5 + d), 0.0);
    }
    //Far in either tail the density vanishes instead of overflowing
    EXPECT_EQ(logistic.pdf(1e6), 0.0);
    EXPECT_EQ(logistic.pdf(-1e6), 0.0);
    EXPECT_NEAR(IntegrateDensity(logistic, -79.5, 80.5), 1.0, 1e-9);
}

//-------------------------------------------------------------------------

TEST(LogisticTest, CumulativeAndQuantile)
{
    CLogistic logistic(0.5, 2.0);
    EXPECT_EQ(logistic.cdf(0.5), 0.5);
    EXPECT_DOUBLE_EQ(logistic.cdf(2.6972245773362196), 0.75);
    EXPECT_DOUBLE_EQ(logistic.cdf(0.5 - 2.0 * std::log(3.0)), 0.25);
    EXPECT_EQ(logistic.cdf(-1e6), 0.0);
    EXPECT_EQ(logistic.cdf(1e6), 1.0);

    EXPECT_EQ(logistic.quantile(0.5), 0.5);
    EXPECT_DOUBLE_EQ(logistic.quantile(0.75), 2.6972245773362196);
    EXPECT_EQ(logistic.quantile(0.0), -inf);
    EXPECT_EQ(logistic.quantile(1.0), inf);
    ExpectQuantileInvertsCumulative(logistic);
}

//-------------------------------------------------------------------------

TEST(LogisticTest, Summaries)
{
    CLogistic logistic(0.5, 2.0);
    EXPECT_EQ(logistic.mean(), 0.5);
    EXPECT_EQ(logistic.median(), 0.5);
    EXPECT_THAT(logistic.modes(), ElementsAre(0.5));
    EXPECT_DOUBLE_EQ(logistic.variance(), 4.0 * pi * pi / 3.0);
    EXPECT_EQ(logistic.skewness(), 0.0);
    EXPECT_EQ(logistic.kurtosis(), 1.2);
    EXPECT_DOUBLE_EQ(logistic.entropy(), std::log(2.0) + 2.0);
    EXPECT_THROW(CLogistic(0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(CLogistic(std::nan(""), 1.0), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(LogisticTest, SamplingMatchesMoments)
{
    CLogistic logistic(0.5, 2.0);
    CXorshift128Plus source(42, 69);
    std::vector<double> vDraws = CIndependentSampler<double>(logistic, source).take(100000);
    EXPECT_NEAR(GetMean(vDraws), 0.5, 0.05);
    EXPECT_NEAR(GetStandardDeviation(vDraws), logistic.deviation(), 0.05);
}

//-------------------------------------------------------------------------

TEST(LognormalTest, DensityAndCumulative)
{
    CLognormal lognormal(0.5, 0.75);
    EXPECT_EQ(lognormal.pdf(0.0), 0.0);
    EXPECT_EQ(lognormal.pdf(-1.0), 0.0);
    EXPECT_DOUBLE_EQ(lognormal.pdf(2.0), CGaussian(0.5, 0.75).pdf(std::log(2.0)) / 2.0);
    EXPECT_EQ(lognormal.cdf(0.0), 0.0);
    EXPECT_NEAR(lognormal.cdf(std::exp(0.5)), 0.5, 1e-15);
    EXPECT_NEAR(IntegrateDensity(lognormal, 0.0, 200.0, 200000), 1.0, 1e-9);
}

//-------------------------------------------------------------------------

TEST(LognormalTest, Quantile)
{
    CLognormal lognormal(0.5, 0.75);
    EXPECT_EQ(lognormal.quantile(0.0), 0.0);
    EXPECT_EQ(lognormal.quantile(1.0), inf);
    EXPECT_NEAR(lognormal.quantile(0.5), std::exp(0.5), 1e-14);
    ExpectQuantileInvertsCumulative(lognormal, 1e-10);
}

//-------------------------------------------------------------------------

TEST(LognormalTest, Summaries)
{
    CLognormal lognormal(0.5, 0.75);
    EXPECT_EQ(lognormal.getMu(), 0.5);
    EXPECT_EQ(lognormal.getSigma(), 0.75);
    EXPECT_NEAR(lognormal.mean(), 2.184200810815618, 1e-14);
    EXPECT_NEAR(lognormal.variance(), 3.6021643061596613, 1e-13);
    EXPECT_NEAR(lognormal.skewness(), 3.262912728207002, 1e-13);
    EXPECT_NEAR(lognormal.kurtosis(), 23.540284233394953, 1e-12);
    EXPECT_DOUBLE_EQ(lognormal.median(), std::exp(0.5));
    EXPECT_THAT(lognormal.modes(), ElementsAre(DoubleNear(0.9394130628134758, 1e-15)));
    EXPECT_NEAR(lognormal.entropy(), 1.6312564607528917, 1e-14);
    EXPECT_THROW(CLognormal(0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(CLognormal(0.0, -0.5), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(LognormalTest, SamplingMatchesMoments)
{
    CLognormal lognormal(0.5, 0.75);
    CXorshift128Plus source(42, 69);
    std::vector<double> vDraws = CIndependentSampler<double>(lognormal, source).take(100000);
    for(double x : vDraws){
        ASSERT_GT(x, 0.0);
    }
    EXPECT_NEAR(GetMean(vDraws), 2.184200810815618, 0.05);
    EXPECT_NEAR(GetMedian(vDraws), std::exp(0.5), 0.05);
}

//-------------------------------------------------------------------------

TEST(TriangularTest, DensityAndCumulative)
{
    CTriangular triangular(0.0, 4.0, 1.0);
    EXPECT_EQ(triangular.pdf(-1.0), 0.0);
    EXPECT_EQ(triangular.pdf(0.0), 0.0);
    EXPECT_DOUBLE_EQ(triangular.pdf(0.5), 0.25);
    EXPECT_DOUBLE_EQ(triangular.pdf(1.0), 0.5);
    EXPECT_DOUBLE_EQ(triangular.pdf(2.5), 0.25);
    EXPECT_EQ(triangular.pdf(4.0), 0.0);
    EXPECT_EQ(triangular.pdf(5.0), 0.0);

    EXPECT_EQ(triangular.cdf(0.0), 0.0);
    EXPECT_DOUBLE_EQ(triangular.cdf(0.5), 0.0625);
    EXPECT_DOUBLE_EQ(triangular.cdf(1.0), 0.25);
    EXPECT_DOUBLE_EQ(triangular.cdf(2.5), 0.8125);
    EXPECT_EQ(triangular.cdf(4.0), 1.0);
    EXPECT_NEAR(IntegrateDensity(triangular, 0.0, 4.0), 1.0, 1e-9);
}

//-------------------------------------------------------------------------

TEST(TriangularTest, Quantile)
{
    CTriangular triangular(0.0, 4.0, 1.0);
    EXPECT_EQ(triangular.quantile(0.0), 0.0);
    EXPECT_EQ(triangular.quantile(1.0), 4.0);
    EXPECT_DOUBLE_EQ(triangular.quantile(0.0625), 0.5);
    EXPECT_DOUBLE_EQ(triangular.quantile(0.25), 1.0);
    EXPECT_DOUBLE_EQ(triangular.quantile(0.8125), 2.5);
    ExpectQuantileInvertsCumulative(triangular);

    //Mode on a bound
    CTriangular right(0.0, 1.0, 0.0);
    EXPECT_EQ(right.pdf(0.0), 2.0);
    EXPECT_DOUBLE_EQ(right.cdf(0.5), 0.75);
    EXPECT_DOUBLE_EQ(right.quantile(0.75), 0.5);
    ExpectQuantileInvertsCumulative(right);
}

//-------------------------------------------------------------------------

TEST(TriangularTest, Summaries)
{
    CTriangular triangular(0.0, 4.0, 1.0);
    EXPECT_DOUBLE_EQ(triangular.mean(), 5.0 / 3.0);
    EXPECT_DOUBLE_EQ(triangular.variance(), 13.0 / 18.0);
    EXPECT_NEAR(triangular.skewness(), 0.4224039833745502, 1e-14);
    EXPECT_EQ(triangular.kurtosis(), -0.6);
    EXPECT_NEAR(triangular.median(), 1.5505102572168221, 1e-14);
    EXPECT_NEAR(triangular.cdf(triangular.median()), 0.5, 1e-14);
    EXPECT_THAT(triangular.modes(), ElementsAre(1.0));
    EXPECT_DOUBLE_EQ(triangular.entropy(), 0.5 + std::log(2.0));

    //Mirrored, the skew changes sign
    CTriangular mirrored(0.0, 4.0, 3.0);
    EXPECT_NEAR(mirrored.skewness(), -0.4224039833745502, 1e-14);
    EXPECT_NEAR(mirrored.median(), 4.0 - 1.5505102572168221, 1e-14);
}

//-------------------------------------------------------------------------

TEST(TriangularTest, RejectsInvalidParameters)
{
    EXPECT_THROW(CTriangular(0.0, 1.0, 2.0), std::invalid_argument);
    EXPECT_THROW(CTriangular(0.0, 1.0, -1.0), std::invalid_argument);
    EXPECT_THROW(CTriangular(1.0, 0.0, 0.5), std::invalid_argument);
    EXPECT_THROW(CTriangular(0.0, 0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(CTriangular(0.0, inf, 1.0), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(TriangularTest, SamplingStaysInBounds)
{
    CTriangular triangular(0.0, 4.0, 1.0);
    CXorshift128Plus source(42, 69);
    std::vector<double> vDraws = CIndependentSampler<double>(triangular, source).take(100000);
    for(double x : vDraws){
        ASSERT_GE(x, 0.0);
        ASSERT_LE(x, 4.0);
    }
    EXPECT_NEAR(GetMean(vDraws), 5.0 / 3.0, 0.02);
    EXPECT_NEAR(GetMedian(vDraws), 1.5505102572168221, 0.02);
}
