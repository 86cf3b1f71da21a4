#ifndef PROBKIT_DISCRETE_HPP
#define PROBKIT_DISCRETE_HPP

#include <atomic>
#include "Capabilities.hpp"
#include <vector>

namespace probkit {

    //Outcome 1 with probability p, 0 with probability q = 1 - p
    class CBernoulli : public CDiscrete<size_t>, public CInverse<size_t>, public CSample<size_t>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<size_t>, public CEntropy {
        //Con-/Destruction
        public:
            explicit CBernoulli(double p);
            //Preferable when q is very small
            static CBernoulli WithFailure(double q);
        protected:
            CBernoulli(double p, double q);
        //Members
        protected:
            double p;
            double q;
            double pq;
        //Methods
        public:
            double getP() const {return this->p;}
            double getQ() const {return this->q;}
            double cdf(double x) const override;
            double pmf(size_t x) const override;
            size_t quantile(double p) const override;
            size_t sample(CRandomSource & source) const override;
            double mean() const override {return this->p;}
            double variance() const override {return this->pq;}
            double skewness() const override;
            double kurtosis() const override;
            double median() const override;
            std::vector<size_t> modes() const override;
            double entropy() const override;
    };

    //Number of successes in n independent trials with success probability p
    //  The mass is evaluated by Loader's saddle point expansion and the cdf by the
    //  regularized incomplete beta function, so neither cost grows with n
    class CBinomial : public CDiscrete<size_t>, public CInverse<size_t>, public CSample<size_t>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<size_t>, public CEntropy {
        //Con-/Destruction
        public:
            CBinomial(size_t n, double p);
            //Preferable when q is very small
            static CBinomial WithFailure(size_t n, double q);
        protected:
            CBinomial(size_t n, double p, double q, double lnP, double lnQ);
        //Static Members
        protected:
            static std::atomic<size_t> MaxNewtonIterations;
        //Static Methods
        public:
            static size_t GetMaxNewtonIterations() {return CBinomial::MaxNewtonIterations.load();}
            //Safe to call while other threads evaluate quantiles, each search reads the cap once
            static void TuneQuantileSearch(size_t maxNewtonIterations);
        //Members
        protected:
            size_t n;
            double p;
            double q;
            double lnP;
            double lnQ;
            double np;
            double nq;
            double npq;
        //Methods
        public:
            size_t getN() const {return this->n;}
            double getP() const {return this->p;}
            double getQ() const {return this->q;}
            double cdf(double x) const override;
            double pmf(size_t x) const override;
            size_t quantile(double p) const override;
            size_t sample(CRandomSource & source) const override;
            double mean() const override {return this->np;}
            double variance() const override {return this->npq;}
            double skewness() const override;
            double kurtosis() const override;
            double median() const override;
            std::vector<size_t> modes() const override;
            double entropy() const override;
        protected:
            size_t sumQuantile(double u) const;
            size_t normalQuantile(double u) const;
            size_t newtonQuantile(double u) const;
            size_t bisectQuantile(double u) const;
            size_t refineQuantile(size_t k, double u) const;
    };

    //Index i in [0,k) with probability p[i]
    class CCategorical : public CDiscrete<size_t>, public CInverse<size_t>, public CSample<size_t>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<size_t>, public CEntropy {
        //Con-/Destruction
        public:
            explicit CCategorical(const std::vector<double> & vP);
        //Members
        protected:
            std::vector<double> vP;
            std::vector<double> vCumSum;
        //Methods
        public:
            size_t getK() const {return this->vP.size();}
            const std::vector<double> & getP() const {return this->vP;}
            double cdf(double x) const override;
            double pmf(size_t x) const override;
            size_t quantile(double p) const override;
            size_t sample(CRandomSource & source) const override;
            double mean() const override;
            double variance() const override;
            double skewness() const override;
            double kurtosis() const override;
            double median() const override;
            std::vector<size_t> modes() const override;
            double entropy() const override;
        protected:
            double centralMoment(int order) const;
    };

}

#endif //PROBKIT_DISCRETE_HPP
