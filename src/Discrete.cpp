#include "Discrete.hpp"
#include "Numerics.hpp"
#include "RandomSource.hpp"
#include <cmath>
#include <stdexcept>

namespace probkit {

    //Bernoulli

    CBernoulli::CBernoulli(double p) : CBernoulli(p, 1.0 - p) {}

    //Only the generating probability is required to be inside (0,1), its complement may round to one
    CBernoulli::CBernoulli(double p, double q) : p(p), q(q), pq(p * q) {
        if(!(p > 0.0 && p <= 1.0 && q > 0.0 && q <= 1.0)){
            throw std::invalid_argument("Attempt to construct CBernoulli with a probability outside of (0,1)");
        }
    }

    CBernoulli CBernoulli::WithFailure(double q){
        return CBernoulli(1.0 - q, q);
    }

    double CBernoulli::cdf(double x) const {
        if(std::isnan(x)){
            return x;
        }
        if(x < 0.0){
            return 0.0;
        }
        if(x < 1.0){
            return this->q;
        }
        return 1.0;
    }

    double CBernoulli::pmf(size_t x) const {
        if(x == 0){
            return this->q;
        } else if(x == 1){
            return this->p;
        }
        return 0.0;
    }

    size_t CBernoulli::quantile(double p) const {
        CheckProportion(p,"bernoulli");
        return (p <= this->q) ? 0 : 1;
    }

    size_t CBernoulli::sample(CRandomSource & source) const {
        return (source.readUniform() < this->q) ? 0 : 1;
    }

    double CBernoulli::skewness() const {
        return (this->q - this->p) / std::sqrt(this->pq);
    }

    double CBernoulli::kurtosis() const {
        return (1.0 - 6.0 * this->pq) / this->pq;
    }

    double CBernoulli::median() const {
        if(this->p < this->q){
            return 0.0;
        } else if(this->p > this->q){
            return 1.0;
        }
        return 0.5;
    }

    std::vector<size_t> CBernoulli::modes() const {
        if(this->p < this->q){
            return {0};
        } else if(this->p > this->q){
            return {1};
        }
        return {0, 1};
    }

    double CBernoulli::entropy() const {
        return -this->q * std::log(this->q) - this->p * std::log(this->p);
    }

    //Categorical

    CCategorical::CCategorical(const std::vector<double> & vP) : vP(vP), vCumSum(vP) {
        static const double tolerance = 1e-12;
        if(vP.empty()){
            throw std::invalid_argument("Attempt to construct CCategorical without any categories");
        }
        double total = 0.0;
        for(double prob : vP){
            if(!(prob >= 0.0 && prob <= 1.0)){
                throw std::invalid_argument("Attempt to construct CCategorical with a probability outside of [0,1]");
            }
            total += prob;
        }
        if(std::fabs(total - 1.0) >= tolerance){
            throw std::invalid_argument("Attempt to construct CCategorical with probabilities not summing to one");
        }
        for(size_t i = 1; i < this->vCumSum.size(); i++){
            this->vCumSum[i] += this->vCumSum[i-1];
        }
        this->vCumSum.back() = 1.0;
    }

    double CCategorical::cdf(double x) const {
        if(std::isnan(x)){
            return x;
        }
        if(x < 0.0){
            return 0.0;
        }
        double i = std::floor(x);
        if(i >= static_cast<double>(this->vP.size())){
            return 1.0;
        }
        return this->vCumSum[static_cast<size_t>(i)];
    }

    double CCategorical::pmf(size_t x) const {
        if(x >= this->vP.size()){
            return 0.0;
        }
        return this->vP[x];
    }

    size_t CCategorical::quantile(double p) const {
        CheckProportion(p,"categorical");
        for(size_t i = 0; i < this->vCumSum.size(); i++){
            if(this->vCumSum[i] > 0.0 && this->vCumSum[i] >= p){
                return i;
            }
        }
        //Unreachable as the last cumulative sum is one
        return this->vCumSum.size() - 1;
    }

    size_t CCategorical::sample(CRandomSource & source) const {
        return this->quantile(source.readUniform());
    }

    double CCategorical::mean() const {
        double mean = 0.0;
        for(size_t i = 0; i < this->vP.size(); i++){
            mean += i * this->vP[i];
        }
        return mean;
    }

    double CCategorical::centralMoment(int order) const {
        double mean = this->mean();
        double moment = 0.0;
        for(size_t i = 0; i < this->vP.size(); i++){
            moment += std::pow(i - mean, order) * this->vP[i];
        }
        return moment;
    }

    double CCategorical::variance() const {
        return this->centralMoment(2);
    }

    //Undefined when all of the mass is on one category
    double CCategorical::skewness() const {
        double variance = this->variance();
        if(variance == 0.0){
            throw std::domain_error("Attempt to get skewness of CCategorical with zero variance");
        }
        return this->centralMoment(3) / (variance * std::sqrt(variance));
    }

    double CCategorical::kurtosis() const {
        double variance = this->variance();
        if(variance == 0.0){
            throw std::domain_error("Attempt to get kurtosis of CCategorical with zero variance");
        }
        return this->centralMoment(4) / (variance * variance) - 3.0;
    }

    double CCategorical::median() const {
        for(size_t i = 0; i < this->vCumSum.size(); i++){
            if(this->vCumSum[i] == 0.5){
                return i + 0.5;
            } else if(this->vCumSum[i] > 0.5){
                return i;
            }
        }
        return this->vCumSum.size() - 1;
    }

    std::vector<size_t> CCategorical::modes() const {
        std::vector<size_t> vModes;
        double max = 0.0;
        for(size_t i = 0; i < this->vP.size(); i++){
            if(this->vP[i] > max){
                max = this->vP[i];
                vModes.clear();
            }
            if(this->vP[i] == max){
                vModes.push_back(i);
            }
        }
        return vModes;
    }

    double CCategorical::entropy() const {
        double entropy = 0.0;
        for(double prob : this->vP){
            //0 ln 0 is taken as 0
            if(prob > 0.0){
                entropy -= prob * std::log(prob);
            }
        }
        return entropy;
    }

}
