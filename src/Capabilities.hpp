#ifndef PROBKIT_CAPABILITIES_HPP
#define PROBKIT_CAPABILITIES_HPP

#include <cmath>
#include <cstddef>
#include <vector>

namespace probkit {

    class CRandomSource;

    //Every distribution can evaluate its cumulative probability P(X <= x)
    class CDistribution {
        //Con-/Destruction
        public:
            virtual ~CDistribution() = default;
        //Methods
        public:
            virtual double cdf(double x) const = 0;
    };

    //Probability density, zero outside the support
    class CContinuous : public virtual CDistribution {
        public:
            virtual double pdf(double x) const = 0;
    };

    //Probability mass over the outcome type
    template<typename T>
    class CDiscrete : public virtual CDistribution {
        public:
            virtual double pmf(T x) const = 0;
    };

    //Inverse of the cdf: smallest outcome whose cumulative probability reaches p
    //  p = 0 maps to the infimum of the support, p = 1 to its supremum
    //  p outside of [0,1] throws std::domain_error
    template<typename T>
    class CInverse : public virtual CDistribution {
        public:
            virtual T quantile(double p) const = 0;
    };

    //One draw, advancing the given source
    template<typename T>
    class CSample : public virtual CDistribution {
        public:
            virtual T sample(CRandomSource & source) const = 0;
    };

    //Summaries, only implemented where they are finite

    class CMean {
        public:
            virtual ~CMean() = default;
            virtual double mean() const = 0;
    };

    class CVariance {
        public:
            virtual ~CVariance() = default;
            virtual double variance() const = 0;
            virtual double deviation() const {return std::sqrt(this->variance());}
    };

    class CSkewness {
        public:
            virtual ~CSkewness() = default;
            virtual double skewness() const = 0;
    };

    //Excess kurtosis
    class CKurtosis {
        public:
            virtual ~CKurtosis() = default;
            virtual double kurtosis() const = 0;
    };

    class CMedian {
        public:
            virtual ~CMedian() = default;
            virtual double median() const = 0;
    };

    template<typename T>
    class CModes {
        public:
            virtual ~CModes() = default;
            virtual std::vector<T> modes() const = 0;
    };

    //In nats
    class CEntropy {
        public:
            virtual ~CEntropy() = default;
            virtual double entropy() const = 0;
    };

}

#endif //PROBKIT_CAPABILITIES_HPP
