#include <cfloat>
#include <cmath>
#include "Continuous.hpp"
#include "Numerics.hpp"
#include "RandomSource.hpp"
#include <stdexcept>

namespace probkit {

    //Uniform

    CUniform::CUniform(double a, double b) : a(a), b(b) {
        if(!(a < b) || std::isinf(a) || std::isinf(b)){
            throw std::invalid_argument("Attempt to construct CUniform with inverted or infinite bounds");
        }
    }

    double CUniform::pdf(double x) const {
        if(x < this->a || x > this->b){
            return 0.0;
        }
        return 1.0 / (this->b - this->a);
    }

    double CUniform::cdf(double x) const {
        if(x <= this->a){
            return 0.0;
        }
        if(x >= this->b){
            return 1.0;
        }
        return (x - this->a) / (this->b - this->a);
    }

    double CUniform::quantile(double p) const {
        CheckProportion(p,"uniform");
        return this->a + (this->b - this->a) * p;
    }

    double CUniform::sample(CRandomSource & source) const {
        return this->a + (this->b - this->a) * source.readUniform();
    }

    double CUniform::variance() const {
        double width = this->b - this->a;
        return width * width / 12.0;
    }

    double CUniform::entropy() const {
        return std::log(this->b - this->a);
    }

    //Exponential

    CExponential::CExponential(double lambda) : lambda(lambda) {
        if(!(lambda > 0.0) || std::isinf(lambda)){
            throw std::invalid_argument("Attempt to construct CExponential with a non positive rate");
        }
    }

    double CExponential::pdf(double x) const {
        if(x < 0.0){
            return 0.0;
        }
        return this->lambda * std::exp(-this->lambda * x);
    }

    double CExponential::cdf(double x) const {
        if(x <= 0.0){
            return 0.0;
        }
        return -std::expm1(-this->lambda * x);
    }

    double CExponential::quantile(double p) const {
        CheckProportion(p,"exponential");
        return -std::log1p(-p) / this->lambda;
    }

    double CExponential::sample(CRandomSource & source) const {
        return -std::log1p(-source.readUniform()) / this->lambda;
    }

    double CExponential::median() const {
        return std::log(2.0) / this->lambda;
    }

    double CExponential::entropy() const {
        return 1.0 - std::log(this->lambda);
    }

    //Cauchy

    CCauchy::CCauchy(double x0, double gamma) : x0(x0), gamma(gamma) {
        if(!(gamma > 0.0) || std::isinf(gamma)){
            throw std::invalid_argument("Attempt to construct CCauchy with a non positive scale");
        }
        if(!std::isfinite(x0)){
            throw std::invalid_argument("Attempt to construct CCauchy with a non finite location");
        }
    }

    double CCauchy::pdf(double x) const {
        double deviation = x - this->x0;
        return this->gamma / (pi * (this->gamma * this->gamma + deviation * deviation));
    }

    double CCauchy::cdf(double x) const {
        return std::atan((x - this->x0) / this->gamma) / pi + 0.5;
    }

    double CCauchy::quantile(double p) const {
        CheckProportion(p,"cauchy");
        //tan only reaches a large finite value at the poles
        if(p == 0.0){
            return -inf;
        }
        if(p == 1.0){
            return inf;
        }
        return this->x0 + this->gamma * std::tan(pi * (p - 0.5));
    }

    //The ratio of two standard normals is standard cauchy
    double CCauchy::sample(CRandomSource & source) const {
        double a = StandardGaussianSample(source);
        double b = StandardGaussianSample(source);
        return this->x0 + this->gamma * a / (std::fabs(b) + DBL_EPSILON);
    }

    double CCauchy::entropy() const {
        return std::log(4.0 * pi * this->gamma);
    }

    //Laplace

    CLaplace::CLaplace(double mu, double b) : mu(mu), b(b) {
        if(!(b > 0.0) || std::isinf(b)){
            throw std::invalid_argument("Attempt to construct CLaplace with a non positive scale");
        }
        if(!std::isfinite(mu)){
            throw std::invalid_argument("Attempt to construct CLaplace with a non finite location");
        }
    }

    double CLaplace::pdf(double x) const {
        return std::exp(-std::fabs(x - this->mu) / this->b) / (2.0 * this->b);
    }

    double CLaplace::cdf(double x) const {
        double z = (x - this->mu) / this->b;
        if(x <= this->mu){
            return 0.5 * std::exp(z);
        }
        return 1.0 - 0.5 * std::exp(-z);
    }

    double CLaplace::quantile(double p) const {
        CheckProportion(p,"laplace");
        if(p == 0.0){
            return -inf;
        }
        if(p == 1.0){
            return inf;
        }
        if(p > 0.5){
            return this->mu - this->b * std::log(2.0 - 2.0 * p);
        }
        return this->mu + this->b * std::log(2.0 * p);
    }

    double CLaplace::sample(CRandomSource & source) const {
        return this->quantile(source.readUniform());
    }

    double CLaplace::entropy() const {
        return std::log(2.0 * std::exp(1.0) * this->b);
    }

    //Logistic

    CLogistic::CLogistic(double mu, double s) : mu(mu), s(s) {
        if(!(s > 0.0) || std::isinf(s)){
            throw std::invalid_argument("Attempt to construct CLogistic with a non positive scale");
        }
        if(!std::isfinite(mu)){
            throw std::invalid_argument("Attempt to construct CLogistic with a non finite location");
        }
    }

    //Symmetric in x - mu, evaluated on the side where the exponential cannot overflow
    double CLogistic::pdf(double x) const {
        double e = std::exp(-std::fabs(x - this->mu) / this->s);
        return e / (this->s * (1.0 + e) * (1.0 + e));
    }

    double CLogistic::cdf(double x) const {
        return 1.0 / (1.0 + std::exp(-(x - this->mu) / this->s));
    }

    double CLogistic::quantile(double p) const {
        CheckProportion(p,"logistic");
        if(p == 0.0){
            return -inf;
        }
        if(p == 1.0){
            return inf;
        }
        return this->mu + this->s * std::log(p / (1.0 - p));
    }

    double CLogistic::sample(CRandomSource & source) const {
        return this->quantile(source.readUniform());
    }

    double CLogistic::variance() const {
        double ps = pi * this->s;
        return ps * ps / 3.0;
    }

    double CLogistic::entropy() const {
        return std::log(this->s) + 2.0;
    }

    //Lognormal

    CLognormal::CLognormal(double mu, double sigma) : gaussian(mu, sigma) {}

    double CLognormal::pdf(double x) const {
        if(x <= 0.0){
            return 0.0;
        }
        return this->gaussian.pdf(std::log(x)) / x;
    }

    double CLognormal::cdf(double x) const {
        if(x <= 0.0){
            return 0.0;
        }
        return this->gaussian.cdf(std::log(x));
    }

    double CLognormal::quantile(double p) const {
        CheckProportion(p,"lognormal");
        return std::exp(this->gaussian.quantile(p));
    }

    double CLognormal::sample(CRandomSource & source) const {
        return std::exp(this->gaussian.sample(source));
    }

    double CLognormal::mean() const {
        double sigma = this->getSigma();
        return std::exp(this->getMu() + sigma * sigma / 2.0);
    }

    double CLognormal::variance() const {
        double s2 = this->getSigma() * this->getSigma();
        return std::expm1(s2) * std::exp(2.0 * this->getMu() + s2);
    }

    double CLognormal::skewness() const {
        double s2 = this->getSigma() * this->getSigma();
        return std::sqrt(std::expm1(s2)) * (2.0 + std::exp(s2));
    }

    double CLognormal::kurtosis() const {
        double s2 = this->getSigma() * this->getSigma();
        return std::exp(4.0 * s2) + 2.0 * std::exp(3.0 * s2) + 3.0 * std::exp(2.0 * s2) - 6.0;
    }

    double CLognormal::median() const {
        return std::exp(this->getMu());
    }

    std::vector<double> CLognormal::modes() const {
        double sigma = this->getSigma();
        return {std::exp(this->getMu() - sigma * sigma)};
    }

    double CLognormal::entropy() const {
        return this->getMu() + this->gaussian.entropy();
    }

    //Triangular

    CTriangular::CTriangular(double a, double b, double c) : a(a), b(b), c(c) {
        if(!(a < b && a <= c && c <= b) || std::isinf(a) || std::isinf(b)){
            throw std::invalid_argument("Attempt to construct CTriangular with a mode outside of its bounds");
        }
    }

    double CTriangular::pdf(double x) const {
        if(x < this->a || x > this->b){
            return 0.0;
        }
        double width = this->b - this->a;
        if(x < this->c){
            return 2.0 * (x - this->a) / (width * (this->c - this->a));
        } else if(x > this->c){
            return 2.0 * (this->b - x) / (width * (this->b - this->c));
        }
        return 2.0 / width;
    }

    double CTriangular::cdf(double x) const {
        if(x <= this->a){
            return 0.0;
        }
        if(x >= this->b){
            return 1.0;
        }
        double width = this->b - this->a;
        if(x <= this->c){
            return (x - this->a) * (x - this->a) / (width * (this->c - this->a));
        }
        return 1.0 - (this->b - x) * (this->b - x) / (width * (this->b - this->c));
    }

    double CTriangular::quantile(double p) const {
        CheckProportion(p,"triangular");
        if(p == 0.0){
            return this->a;
        }
        if(p == 1.0){
            return this->b;
        }
        double width = this->b - this->a;
        double p0 = (this->c - this->a) / width;
        if(p < p0){
            return this->a + std::sqrt(width * (this->c - this->a) * p);
        } else if(p > p0){
            return this->b - std::sqrt(width * (this->b - this->c) * (1.0 - p));
        }
        return this->c;
    }

    double CTriangular::sample(CRandomSource & source) const {
        return this->quantile(source.readUniform());
    }

    double CTriangular::variance() const {
        double a = this->a;
        double b = this->b;
        double c = this->c;
        return (a * a + b * b + c * c - a * b - a * c - b * c) / 18.0;
    }

    double CTriangular::skewness() const {
        double a = this->a;
        double b = this->b;
        double c = this->c;
        double numerator = (a + b - 2.0 * c) * (2.0 * a - b - c) * (a - 2.0 * b + c);
        double spread = a * a + b * b + c * c - a * b - a * c - b * c;
        return root2 * numerator / (5.0 * std::pow(spread, 1.5));
    }

    double CTriangular::median() const {
        if(this->c >= (this->a + this->b) / 2.0){
            return this->a + std::sqrt((this->b - this->a) * (this->c - this->a) / 2.0);
        }
        return this->b - std::sqrt((this->b - this->a) * (this->b - this->c) / 2.0);
    }

    double CTriangular::entropy() const {
        return 0.5 + std::log((this->b - this->a) / 2.0);
    }

}
