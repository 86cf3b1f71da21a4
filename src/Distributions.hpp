#ifndef PROBKIT_DISTRIBUTIONS_HPP
#define PROBKIT_DISTRIBUTIONS_HPP

#include "Capabilities.hpp"
#include "Continuous.hpp"
#include "Discrete.hpp"
#include "RandomSource.hpp"
#include "Sampler.hpp"
#include <map>
#include <memory>
#include <string>

namespace probkit {

    enum DistributionType {Bernoulli, Beta, Binomial, Cauchy, Exponential, Gamma, Gaussian, Laplace, Logistic, Lognormal, Pert, Triangular, Uniform};

    struct SDomain{
        double min;
        double max;
    };

    //Parameters by their natural names, e.g. {"mu",0.0},{"sigma",1.0}
    typedef std::map<std::string,double> ParamMap;

    DistributionType str2DistributionType(const std::string & str);
    bool IsDiscrete(DistributionType distribution);

    //Missing parameters throw std::invalid_argument, as do invalid ones
    std::unique_ptr<CDistribution> MakeDistribution(DistributionType distribution, const ParamMap & parameters);

    SDomain GetSupport(DistributionType distribution, const ParamMap & parameters);
    //Density for continuous distributions, mass for discrete ones (zero off the integers)
    double GetPDF(double X, DistributionType distribution, const ParamMap & parameters);
    double GetCDF(double X, DistributionType distribution, const ParamMap & parameters);
    double GetQuantile(double p, DistributionType distribution, const ParamMap & parameters);

}

#endif //PROBKIT_DISTRIBUTIONS_HPP
