#include <cmath>
#include "Distributions.hpp"
#include <limits>
#include <stdexcept>

namespace probkit {

    DistributionType str2DistributionType(const std::string & str){
        DistributionType type;
        if(str == "Bernoulli"){
            type = Bernoulli;
        } else if(str == "Beta"){
            type = Beta;
        } else if(str == "Binomial"){
            type = Binomial;
        } else if(str == "Cauchy"){
            type = Cauchy;
        } else if(str == "Exponential"){
            type = Exponential;
        } else if(str == "Gamma"){
            type = Gamma;
        } else if(str == "Gaussian" || str == "Normal"){
            type = Gaussian;
        } else if(str == "Laplace"){
            type = Laplace;
        } else if(str == "Logistic"){
            type = Logistic;
        } else if(str == "Lognormal" || str == "LogNormal"){
            type = Lognormal;
        } else if(str == "Pert"){
            type = Pert;
        } else if(str == "Triangular"){
            type = Triangular;
        } else if(str == "Uniform"){
            type = Uniform;
        } else {
            throw std::invalid_argument("Attempt to convert unrecognized string to a DistributionType");
        }
        return type;
    }

    bool IsDiscrete(DistributionType distribution){
        return distribution == Bernoulli || distribution == Binomial;
    }

    //Trial counts arrive as doubles
    static size_t ParamToCount(double n){
        if(!(n >= 0.0) || n != std::floor(n) || n >= static_cast<double>(std::numeric_limits<size_t>::max())){
            throw std::invalid_argument("Attempt to use a non natural number of trials");
        }
        return static_cast<size_t>(n);
    }

    static double ParamOrDefault(const ParamMap & parameters, const std::string & name, double value){
        ParamMap::const_iterator it = parameters.find(name);
        return (it == parameters.end()) ? value : it->second;
    }

    std::unique_ptr<CDistribution> MakeDistribution(DistributionType distribution, const ParamMap & parameters){
        std::unique_ptr<CDistribution> pDist;
        try{
            switch(distribution){
                case(Bernoulli):
                    pDist.reset(new CBernoulli(parameters.at("p")));
                    break;
                case(Beta):
                    pDist.reset(new CBeta(parameters.at("alpha"),parameters.at("beta"),
                                ParamOrDefault(parameters,"a",0.0),ParamOrDefault(parameters,"b",1.0)));
                    break;
                case(Binomial):
                    pDist.reset(new CBinomial(ParamToCount(parameters.at("n")),parameters.at("p")));
                    break;
                case(Cauchy):
                    pDist.reset(new CCauchy(parameters.at("x0"),parameters.at("gamma")));
                    break;
                case(Exponential):
                    pDist.reset(new CExponential(parameters.at("lambda")));
                    break;
                case(Gamma):
                    pDist.reset(new CGamma(parameters.at("k"),parameters.at("theta")));
                    break;
                case(Gaussian):
                    pDist.reset(new CGaussian(parameters.at("mu"),parameters.at("sigma")));
                    break;
                case(Laplace):
                    pDist.reset(new CLaplace(parameters.at("mu"),parameters.at("b")));
                    break;
                case(Logistic):
                    pDist.reset(new CLogistic(parameters.at("mu"),parameters.at("s")));
                    break;
                case(Lognormal):
                    pDist.reset(new CLognormal(parameters.at("mu"),parameters.at("sigma")));
                    break;
                case(Pert):
                    pDist.reset(new CPert(parameters.at("a"),parameters.at("b"),parameters.at("c")));
                    break;
                case(Triangular):
                    pDist.reset(new CTriangular(parameters.at("a"),parameters.at("b"),parameters.at("c")));
                    break;
                case(Uniform):
                    pDist.reset(new CUniform(parameters.at("a"),parameters.at("b")));
                    break;
            }
        } catch (std::out_of_range & e){
            throw std::invalid_argument("Attempt to MakeDistribution with missing parameters");
        }
        if(!pDist){
            throw std::invalid_argument("Attempt to MakeDistribution of an unknown DistributionType");
        }
        return pDist;
    }

    SDomain GetSupport(DistributionType distribution, const ParamMap & parameters){
        SDomain domain;
        domain.min = -std::numeric_limits<double>::infinity();
        domain.max = std::numeric_limits<double>::infinity();
        try{
            switch(distribution){
                case(Bernoulli):
                    domain.min = 0;
                    domain.max = 1;
                    break;
                case(Binomial):
                    domain.min = 0;
                    domain.max = ParamToCount(parameters.at("n"));
                    break;
                case(Beta):
                    domain.min = ParamOrDefault(parameters,"a",0.0);
                    domain.max = ParamOrDefault(parameters,"b",1.0);
                    break;
                case(Exponential):
                case(Gamma):
                case(Lognormal):
                    domain.min = 0;
                    break;
                case(Pert):
                    domain.min = parameters.at("a");
                    domain.max = parameters.at("c");
                    break;
                case(Triangular):
                case(Uniform):
                    domain.min = parameters.at("a");
                    domain.max = parameters.at("b");
                    break;
                case(Cauchy):
                case(Gaussian):
                case(Laplace):
                case(Logistic):
                    break;
            }
        } catch (std::out_of_range & e){
            throw std::invalid_argument("Attempt to GetSupport with missing parameters");
        }
        return domain;
    }

    double GetPDF(double X, DistributionType distribution, const ParamMap & parameters){
        std::unique_ptr<CDistribution> pDist = MakeDistribution(distribution,parameters);
        if(const CContinuous * pContinuous = dynamic_cast<const CContinuous *>(pDist.get())){
            return pContinuous->pdf(X);
        }
        const CDiscrete<size_t> * pDiscrete = dynamic_cast<const CDiscrete<size_t> *>(pDist.get());
        if(pDiscrete == nullptr){
            throw std::invalid_argument("Attempt to GetPDF of a distribution without a density or mass");
        }
        if(X < 0 || X != std::floor(X) || X >= static_cast<double>(std::numeric_limits<size_t>::max())){
            return 0.0;
        }
        return pDiscrete->pmf(static_cast<size_t>(X));
    }

    double GetCDF(double X, DistributionType distribution, const ParamMap & parameters){
        return MakeDistribution(distribution,parameters)->cdf(X);
    }

    double GetQuantile(double p, DistributionType distribution, const ParamMap & parameters){
        std::unique_ptr<CDistribution> pDist = MakeDistribution(distribution,parameters);
        if(const CInverse<double> * pInverse = dynamic_cast<const CInverse<double> *>(pDist.get())){
            return pInverse->quantile(p);
        }
        const CInverse<size_t> * pDiscrete = dynamic_cast<const CInverse<size_t> *>(pDist.get());
        if(pDiscrete == nullptr){
            throw std::invalid_argument("Attempt to GetQuantile of a distribution without an inverse");
        }
        return static_cast<double>(pDiscrete->quantile(p));
    }

}
