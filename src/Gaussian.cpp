#include <boost/math/special_functions/erf.hpp>
#include <cmath>
#include "Continuous.hpp"
#include "Numerics.hpp"
#include <stdexcept>

namespace probkit {

    CGaussian::CGaussian(double mu, double sigma) : mu(mu), sigma(sigma), norm(sigma * std::sqrt(2.0 * pi)) {
        if(!(sigma > 0.0) || std::isinf(sigma)){
            throw std::invalid_argument("Attempt to construct CGaussian with a non positive standard deviation");
        }
        if(!std::isfinite(mu)){
            throw std::invalid_argument("Attempt to construct CGaussian with a non finite mean");
        }
    }

    double CGaussian::pdf(double x) const {
        double z = (x - this->mu) / this->sigma;
        return std::exp(-0.5 * z * z) / this->norm;
    }

    //erfc keeps the lower tail accurate where 1 + erf(z) would cancel
    double CGaussian::cdf(double x) const {
        double z = (x - this->mu) / this->sigma;
        return 0.5 * boost::math::erfc(-z / root2);
    }

    double CGaussian::quantile(double p) const {
        CheckProportion(p,"gaussian");
        return this->mu + this->sigma * StandardGaussianQuantile(p);
    }

    double CGaussian::sample(CRandomSource & source) const {
        return this->mu + this->sigma * StandardGaussianSample(source);
    }

    double CGaussian::entropy() const {
        return 0.5 * std::log(2.0 * pi * std::exp(1.0) * this->sigma * this->sigma);
    }

}
