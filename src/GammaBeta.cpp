#include <boost/math/special_functions/beta.hpp>
#include <boost/math/special_functions/digamma.hpp>
#include <boost/math/special_functions/gamma.hpp>
#include <cmath>
#include "Continuous.hpp"
#include "Numerics.hpp"
#include <stdexcept>

namespace probkit {

    //Gamma

    CGamma::CGamma(double k, double theta) : k(k), theta(theta) {
        if(!(k > 0.0) || !(theta > 0.0) || std::isinf(k) || std::isinf(theta)){
            throw std::invalid_argument("Attempt to construct CGamma with a non positive shape or scale");
        }
        this->lnNorm = boost::math::lgamma(k) + k * std::log(theta);
    }

    double CGamma::pdf(double x) const {
        if(x < 0.0){
            return 0.0;
        }
        if(x == 0.0){
            if(this->k < 1.0){
                return inf;
            }
            return (this->k == 1.0) ? 1.0 / this->theta : 0.0;
        }
        return std::exp((this->k - 1.0) * std::log(x) - x / this->theta - this->lnNorm);
    }

    double CGamma::cdf(double x) const {
        if(x <= 0.0){
            return 0.0;
        }
        if(std::isinf(x)){
            return 1.0;
        }
        return boost::math::gamma_p(this->k, x / this->theta);
    }

    double CGamma::quantile(double p) const {
        CheckProportion(p,"gamma");
        if(p == 0.0){
            return 0.0;
        }
        if(p == 1.0){
            return inf;
        }
        return this->theta * boost::math::gamma_p_inv(this->k, p);
    }

    double CGamma::sample(CRandomSource & source) const {
        return this->theta * StandardGammaSample(this->k, source);
    }

    double CGamma::skewness() const {
        return 2.0 / std::sqrt(this->k);
    }

    double CGamma::median() const {
        return this->quantile(0.5);
    }

    //Below a unit shape the density diverges at the origin, which is reported as the mode
    std::vector<double> CGamma::modes() const {
        if(this->k >= 1.0){
            return {(this->k - 1.0) * this->theta};
        }
        return {0.0};
    }

    double CGamma::entropy() const {
        return this->k + std::log(this->theta) + boost::math::lgamma(this->k)
            + (1.0 - this->k) * boost::math::digamma(this->k);
    }

    //Beta

    CBeta::CBeta(double alpha, double beta, double a, double b) : alpha(alpha), beta(beta), a(a), b(b) {
        if(!(alpha > 0.0) || !(beta > 0.0) || std::isinf(alpha) || std::isinf(beta)){
            throw std::invalid_argument("Attempt to construct CBeta with a non positive shape");
        }
        if(!(a < b) || std::isinf(a) || std::isinf(b)){
            throw std::invalid_argument("Attempt to construct CBeta with inverted or infinite bounds");
        }
        this->lnBeta = boost::math::lgamma(alpha) + boost::math::lgamma(beta) - boost::math::lgamma(alpha + beta);
    }

    double CBeta::pdf(double x) const {
        if(x < this->a || x > this->b){
            return 0.0;
        }
        double scale = this->b - this->a;
        double z = (x - this->a) / scale;
        //A unit shape removes its factor entirely, including at the bounds
        double lower = (this->alpha == 1.0) ? 0.0 : (this->alpha - 1.0) * std::log(z);
        double upper = (this->beta == 1.0) ? 0.0 : (this->beta - 1.0) * std::log1p(-z);
        return std::exp(lower + upper - this->lnBeta) / scale;
    }

    double CBeta::cdf(double x) const {
        if(x <= this->a){
            return 0.0;
        }
        if(x >= this->b){
            return 1.0;
        }
        return boost::math::ibeta(this->alpha, this->beta, (x - this->a) / (this->b - this->a));
    }

    double CBeta::quantile(double p) const {
        CheckProportion(p,"beta");
        if(p == 0.0){
            return this->a;
        }
        if(p == 1.0){
            return this->b;
        }
        return this->a + (this->b - this->a) * boost::math::ibeta_inv(this->alpha, this->beta, p);
    }

    //X / (X + Y) for independent Gamma(alpha) and Gamma(beta) draws
    //  Formed as 1 / (1 + Y/X) in log space, both draws may underflow for small shapes
    double CBeta::sample(CRandomSource & source) const {
        double logX = LogStandardGammaSample(this->alpha, source);
        double logY = LogStandardGammaSample(this->beta, source);
        double fraction = 1.0 / (1.0 + std::exp(logY - logX));
        return this->a + (this->b - this->a) * fraction;
    }

    double CBeta::mean() const {
        return this->a + (this->b - this->a) * this->alpha / (this->alpha + this->beta);
    }

    double CBeta::variance() const {
        double scale = this->b - this->a;
        double sum = this->alpha + this->beta;
        return scale * scale * this->alpha * this->beta / (sum * sum * (sum + 1.0));
    }

    double CBeta::skewness() const {
        double sum = this->alpha + this->beta;
        return 2.0 * (this->beta - this->alpha) * std::sqrt(sum + 1.0)
            / ((sum + 2.0) * std::sqrt(this->alpha * this->beta));
    }

    double CBeta::kurtosis() const {
        double sum = this->alpha + this->beta;
        double delta = this->alpha - this->beta;
        double product = this->alpha * this->beta;
        return 6.0 * (delta * delta * (sum + 1.0) - product * (sum + 2.0))
            / (product * (sum + 2.0) * (sum + 3.0));
    }

    double CBeta::median() const {
        if(this->alpha == this->beta){
            return this->a + 0.5 * (this->b - this->a);
        }
        return this->quantile(0.5);
    }

    std::vector<double> CBeta::modes() const {
        double alpha = this->alpha;
        double beta = this->beta;
        if(alpha == 1.0 && beta == 1.0){
            //Flat, every point is a mode
            return {};
        } else if(alpha < 1.0 && beta < 1.0){
            return {this->a, this->b};
        } else if(alpha <= 1.0 && beta >= 1.0){
            return {this->a};
        } else if(alpha >= 1.0 && beta <= 1.0){
            return {this->b};
        }
        return {this->a + (this->b - this->a) * (alpha - 1.0) / (alpha + beta - 2.0)};
    }

    double CBeta::entropy() const {
        double sum = this->alpha + this->beta;
        return std::log(this->b - this->a) + this->lnBeta
            - (this->alpha - 1.0) * boost::math::digamma(this->alpha)
            - (this->beta - 1.0) * boost::math::digamma(this->beta)
            + (sum - 2.0) * boost::math::digamma(sum);
    }

    //Pert

    static double PertSpan(double a, double b, double c){
        if(!(a < b && b < c) || std::isinf(a) || std::isinf(c)){
            throw std::invalid_argument("Attempt to construct CPert with points not strictly increasing");
        }
        return c - a;
    }

    CPert::CPert(double a, double b, double c) : a(a), b(b), c(c),
        beta((4.0 * b + c - 5.0 * a) / PertSpan(a,b,c), (5.0 * c - a - 4.0 * b) / PertSpan(a,b,c), a, c) {}

    double CPert::quantile(double p) const {
        CheckProportion(p,"pert");
        return this->beta.quantile(p);
    }

    double CPert::variance() const {
        double mean = this->mean();
        return (mean - this->a) * (this->c - mean) / 7.0;
    }

}
