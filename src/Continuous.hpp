#ifndef PROBKIT_CONTINUOUS_HPP
#define PROBKIT_CONTINUOUS_HPP

#include "Capabilities.hpp"
#include <vector>

namespace probkit {

    //Uniform on [a,b]
    class CUniform : public CContinuous, public CInverse<double>, public CSample<double>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CEntropy {
        //Con-/Destruction
        public:
            CUniform(double a, double b);
        //Members
        protected:
            double a;
            double b;
        //Methods
        public:
            double getA() const {return this->a;}
            double getB() const {return this->b;}
            double cdf(double x) const override;
            double pdf(double x) const override;
            double quantile(double p) const override;
            double sample(CRandomSource & source) const override;
            double mean() const override {return (this->a + this->b) / 2.0;}
            double variance() const override;
            double skewness() const override {return 0.0;}
            double kurtosis() const override {return -1.2;}
            double median() const override {return this->mean();}
            double entropy() const override;
    };

    //Normal with mean mu and standard deviation sigma
    class CGaussian : public CContinuous, public CInverse<double>, public CSample<double>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<double>, public CEntropy {
        //Con-/Destruction
        public:
            CGaussian(double mu = 0.0, double sigma = 1.0);
        //Members
        protected:
            double mu;
            double sigma;
            double norm;
        //Methods
        public:
            double getMu() const {return this->mu;}
            double getSigma() const {return this->sigma;}
            double cdf(double x) const override;
            double pdf(double x) const override;
            double quantile(double p) const override;
            double sample(CRandomSource & source) const override;
            double mean() const override {return this->mu;}
            double variance() const override {return this->sigma * this->sigma;}
            double deviation() const override {return this->sigma;}
            double skewness() const override {return 0.0;}
            double kurtosis() const override {return 0.0;}
            double median() const override {return this->mu;}
            std::vector<double> modes() const override {return {this->mu};}
            double entropy() const override;
    };

    //Exponential with rate lambda
    class CExponential : public CContinuous, public CInverse<double>, public CSample<double>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<double>, public CEntropy {
        //Con-/Destruction
        public:
            explicit CExponential(double lambda);
        //Members
        protected:
            double lambda;
        //Methods
        public:
            double getLambda() const {return this->lambda;}
            double cdf(double x) const override;
            double pdf(double x) const override;
            double quantile(double p) const override;
            double sample(CRandomSource & source) const override;
            double mean() const override {return 1.0 / this->lambda;}
            double variance() const override {return 1.0 / (this->lambda * this->lambda);}
            double skewness() const override {return 2.0;}
            double kurtosis() const override {return 6.0;}
            double median() const override;
            std::vector<double> modes() const override {return {0.0};}
            double entropy() const override;
    };

    //Gamma with shape k and scale theta
    class CGamma : public CContinuous, public CInverse<double>, public CSample<double>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<double>, public CEntropy {
        //Con-/Destruction
        public:
            CGamma(double k, double theta);
        //Members
        protected:
            double k;
            double theta;
            //ln(Gamma(k) theta^k)
            double lnNorm;
        //Methods
        public:
            double getK() const {return this->k;}
            double getTheta() const {return this->theta;}
            double cdf(double x) const override;
            double pdf(double x) const override;
            double quantile(double p) const override;
            double sample(CRandomSource & source) const override;
            double mean() const override {return this->k * this->theta;}
            double variance() const override {return this->k * this->theta * this->theta;}
            double skewness() const override;
            double kurtosis() const override {return 6.0 / this->k;}
            double median() const override;
            std::vector<double> modes() const override;
            double entropy() const override;
    };

    //Beta with shapes alpha and beta, rescaled to [a,b]
    class CBeta : public CContinuous, public CInverse<double>, public CSample<double>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<double>, public CEntropy {
        //Con-/Destruction
        public:
            CBeta(double alpha, double beta, double a = 0.0, double b = 1.0);
        //Members
        protected:
            double alpha;
            double beta;
            double a;
            double b;
            double lnBeta;
        //Methods
        public:
            double getAlpha() const {return this->alpha;}
            double getBeta() const {return this->beta;}
            double getA() const {return this->a;}
            double getB() const {return this->b;}
            double cdf(double x) const override;
            double pdf(double x) const override;
            double quantile(double p) const override;
            double sample(CRandomSource & source) const override;
            double mean() const override;
            double variance() const override;
            double skewness() const override;
            double kurtosis() const override;
            double median() const override;
            std::vector<double> modes() const override;
            double entropy() const override;
    };

    //Cauchy with location x0 and scale gamma, its moments are undefined
    class CCauchy : public CContinuous, public CInverse<double>, public CSample<double>,
        public CMedian, public CModes<double>, public CEntropy {
        //Con-/Destruction
        public:
            CCauchy(double x0, double gamma);
        //Members
        protected:
            double x0;
            double gamma;
        //Methods
        public:
            double getX0() const {return this->x0;}
            double getGamma() const {return this->gamma;}
            double cdf(double x) const override;
            double pdf(double x) const override;
            double quantile(double p) const override;
            double sample(CRandomSource & source) const override;
            double median() const override {return this->x0;}
            std::vector<double> modes() const override {return {this->x0};}
            double entropy() const override;
    };

    //Laplace with location mu and scale b
    class CLaplace : public CContinuous, public CInverse<double>, public CSample<double>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<double>, public CEntropy {
        //Con-/Destruction
        public:
            CLaplace(double mu, double b);
        //Members
        protected:
            double mu;
            double b;
        //Methods
        public:
            double getMu() const {return this->mu;}
            double getB() const {return this->b;}
            double cdf(double x) const override;
            double pdf(double x) const override;
            double quantile(double p) const override;
            double sample(CRandomSource & source) const override;
            double mean() const override {return this->mu;}
            double variance() const override {return 2.0 * this->b * this->b;}
            double skewness() const override {return 0.0;}
            double kurtosis() const override {return 3.0;}
            double median() const override {return this->mu;}
            std::vector<double> modes() const override {return {this->mu};}
            double entropy() const override;
    };

    //Logistic with location mu and scale s
    class CLogistic : public CContinuous, public CInverse<double>, public CSample<double>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<double>, public CEntropy {
        //Con-/Destruction
        public:
            CLogistic(double mu, double s);
        //Members
        protected:
            double mu;
            double s;
        //Methods
        public:
            double getMu() const {return this->mu;}
            double getS() const {return this->s;}
            double cdf(double x) const override;
            double pdf(double x) const override;
            double quantile(double p) const override;
            double sample(CRandomSource & source) const override;
            double mean() const override {return this->mu;}
            double variance() const override;
            double skewness() const override {return 0.0;}
            double kurtosis() const override {return 1.2;}
            double median() const override {return this->mu;}
            std::vector<double> modes() const override {return {this->mu};}
            double entropy() const override;
    };

    //exp(X) for X normal with mean mu and standard deviation sigma
    class CLognormal : public CContinuous, public CInverse<double>, public CSample<double>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<double>, public CEntropy {
        //Con-/Destruction
        public:
            CLognormal(double mu, double sigma);
        //Members
        protected:
            CGaussian gaussian;
        //Methods
        public:
            double getMu() const {return this->gaussian.getMu();}
            double getSigma() const {return this->gaussian.getSigma();}
            double cdf(double x) const override;
            double pdf(double x) const override;
            double quantile(double p) const override;
            double sample(CRandomSource & source) const override;
            double mean() const override;
            double variance() const override;
            double skewness() const override;
            double kurtosis() const override;
            double median() const override;
            std::vector<double> modes() const override;
            double entropy() const override;
    };

    //PERT on [a,c] with mode b, a beta distribution with shapes fixed by the three points
    class CPert : public CContinuous, public CInverse<double>, public CSample<double>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<double>, public CEntropy {
        //Con-/Destruction
        public:
            CPert(double a, double b, double c);
        //Members
        protected:
            double a;
            double b;
            double c;
            CBeta beta;
        //Methods
        public:
            double getA() const {return this->a;}
            double getB() const {return this->b;}
            double getC() const {return this->c;}
            double getAlpha() const {return this->beta.getAlpha();}
            double getBeta() const {return this->beta.getBeta();}
            double cdf(double x) const override {return this->beta.cdf(x);}
            double pdf(double x) const override {return this->beta.pdf(x);}
            double quantile(double p) const override;
            double sample(CRandomSource & source) const override {return this->beta.sample(source);}
            double mean() const override {return (this->a + 4.0 * this->b + this->c) / 6.0;}
            double variance() const override;
            double skewness() const override {return this->beta.skewness();}
            double kurtosis() const override {return this->beta.kurtosis();}
            double median() const override {return this->quantile(0.5);}
            std::vector<double> modes() const override {return {this->b};}
            double entropy() const override {return this->beta.entropy();}
    };

    //Triangular on [a,b] with mode c
    class CTriangular : public CContinuous, public CInverse<double>, public CSample<double>,
        public CMean, public CVariance, public CSkewness, public CKurtosis,
        public CMedian, public CModes<double>, public CEntropy {
        //Con-/Destruction
        public:
            CTriangular(double a, double b, double c);
        //Members
        protected:
            double a;
            double b;
            double c;
        //Methods
        public:
            double getA() const {return this->a;}
            double getB() const {return this->b;}
            double getC() const {return this->c;}
            double cdf(double x) const override;
            double pdf(double x) const override;
            double quantile(double p) const override;
            double sample(CRandomSource & source) const override;
            double mean() const override {return (this->a + this->b + this->c) / 3.0;}
            double variance() const override;
            double skewness() const override;
            double kurtosis() const override {return -0.6;}
            double median() const override;
            std::vector<double> modes() const override {return {this->c};}
            double entropy() const override;
    };

}

#endif //PROBKIT_CONTINUOUS_HPP
