#ifndef PROBKIT_NUMERICS_HPP
#define PROBKIT_NUMERICS_HPP

#include <cmath>
#include <limits>
#include <string>

namespace probkit {

    class CRandomSource;

    const double pi = std::atan(1.0)*4;
    const double root2 = std::sqrt(2.0);
    const double inf = std::numeric_limits<double>::infinity();

    //Throws std::domain_error unless 0 <= p <= 1
    void CheckProportion(double p, const std::string & name);

    //ln(n!) - ln(sqrt(2 pi n) (n/e)^n), see Loader (2000)
    double StirlingError(double n);
    //x ln(x/np) + np - x, the deviance term of the saddle point expansion
    double BinomialDeviance(double x, double np);

    //Inverse of the standard normal cdf, Wichura's AS241 (PPND16)
    //  Exact infinities at p = 0 and p = 1
    double StandardGaussianQuantile(double p);

    //Box-Muller, two reads per draw (more if the first uniform is zero)
    double StandardGaussianSample(CRandomSource & source);
    //Gamma(k,1) by Marsaglia and Tsang (2000), variable number of reads
    double StandardGammaSample(double k, CRandomSource & source);
    //ln of a Gamma(k,1) draw, finite even where the draw itself underflows (small k)
    double LogStandardGammaSample(double k, CRandomSource & source);

}

#endif //PROBKIT_NUMERICS_HPP
