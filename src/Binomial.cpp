#include <algorithm>
#include <boost/math/special_functions/beta.hpp>
#include <cmath>
#include "Discrete.hpp"
#include "Logging.h"
#include "Numerics.hpp"
#include "RandomSource.hpp"
#include <stdexcept>

namespace probkit {

    std::atomic<size_t> CBinomial::MaxNewtonIterations(100);

    void CBinomial::TuneQuantileSearch(size_t maxNewtonIterations){
        if(maxNewtonIterations == 0){
            throw std::invalid_argument("Attempt to tune the binomial quantile search without any newton iterations");
        }
        CBinomial::MaxNewtonIterations = maxNewtonIterations;
    }

    CBinomial::CBinomial(size_t n, double p) : CBinomial(n, p, 1.0 - p, std::log(p), std::log1p(-p)) {}

    //Only the generating probability is required to be inside (0,1), its complement may round to one
    CBinomial::CBinomial(size_t n, double p, double q, double lnP, double lnQ) :
        n(n), p(p), q(q), lnP(lnP), lnQ(lnQ), np(n * p), nq(n * q), npq(n * p * q) {
        if(n == 0){
            throw std::invalid_argument("Attempt to construct CBinomial without any trials");
        }
        if(!(p > 0.0 && p <= 1.0 && q > 0.0 && q <= 1.0)){
            throw std::invalid_argument("Attempt to construct CBinomial with a probability outside of (0,1)");
        }
    }

    CBinomial CBinomial::WithFailure(size_t n, double q){
        return CBinomial(n, 1.0 - q, q, std::log1p(-q), std::log(q));
    }

    double CBinomial::pmf(size_t x) const {
        if(x > this->n){
            return 0.0;
        }
        double n = this->n;
        if(x == 0){
            return std::exp(n * this->lnQ);
        } else if(x == this->n){
            return std::exp(n * this->lnP);
        }
        //Saddle point expansion, Loader (2000)
        double k = x;
        double nmk = n - k;
        double lnC = StirlingError(n) - StirlingError(k) - StirlingError(nmk)
            - BinomialDeviance(k, this->np) - BinomialDeviance(nmk, this->nq);
        return std::exp(lnC) * std::sqrt(n / (2.0 * pi * k * nmk));
    }

    double CBinomial::cdf(double x) const {
        if(std::isnan(x)){
            return x;
        }
        if(x < 0.0){
            return 0.0;
        }
        double k = std::floor(x);
        double n = this->n;
        if(k >= n){
            return 1.0;
        }
        if(k == 0.0){
            return std::exp(n * this->lnQ);
        }
        //P(X <= k) = I_q(n-k, k+1), expressed through whichever of p and q is the smaller
        if(this->p < 0.5){
            return boost::math::ibetac(k + 1.0, n - k, this->p);
        }
        return boost::math::ibeta(n - k, k + 1.0, this->q);
    }

    size_t CBinomial::quantile(double u) const {
        CheckProportion(u,"binomial");
        if(u == 0.0){
            return 0;
        }
        if(u == 1.0){
            return this->n;
        }
        size_t k;
        if(this->n < 1000){
            logger::Log("Binomial(%zu, %g) quantile of %g by summation",logger::DEBUG,this->n,this->p,u);
            k = this->sumQuantile(u);
        } else if(this->npq > 80.0){
            logger::Log("Binomial(%zu, %g) quantile of %g by normal expansion",logger::DEBUG,this->n,this->p,u);
            k = this->normalQuantile(u);
        } else {
            logger::Log("Binomial(%zu, %g) quantile of %g by newton search",logger::DEBUG,this->n,this->p,u);
            k = this->newtonQuantile(u);
        }
        return this->refineQuantile(k,u);
    }

    //Term by term from whichever end is closer to u
    size_t CBinomial::sumQuantile(double u) const {
        double n = this->n;
        if(u <= this->cdf(static_cast<double>(this->n / 2))){
            double ratio = this->p / this->q;
            double a = std::exp(n * this->lnQ);
            if(a == 0.0){
                return this->bisectQuantile(u);
            }
            double sum = a - u;
            size_t k = 1;
            while(sum < 0.0 && k <= this->n){
                a *= ratio * (n - k + 1) / k;
                sum += a;
                k++;
            }
            return k - 1;
        }
        double ratio = this->q / this->p;
        double a = std::exp(n * this->lnP);
        if(a == 0.0){
            return this->bisectQuantile(u);
        }
        double sum = (1.0 - u) - a;
        size_t k = 1;
        while(sum >= 0.0 && k <= this->n){
            a *= ratio * (n - k + 1) / k;
            sum -= a;
            k++;
        }
        return this->n - k + 1;
    }

    //Cornish-Fisher type expansion around the normal approximation, Moorhead (2013)
    size_t CBinomial::normalQuantile(double u) const {
        double w = StandardGaussianQuantile(u);
        double w2 = w * w;
        double w3 = w2 * w;
        double w4 = w3 * w;
        double w5 = w4 * w;
        double w6 = w5 * w;
        double p = this->p;
        double p2 = p * p;
        double p3 = p2 * p;
        double p4 = p2 * p2;
        double sd = std::sqrt(this->npq);
        double sdEm1 = 1.0 / sd;
        double sdEm2 = 1.0 / this->npq;
        double sdEm3 = sdEm1 * sdEm2;
        double sdEm4 = sdEm2 * sdEm2;

        double x = this->np + sd * w + ((p + 1.0) / 3.0 - (2.0 * p - 1.0) * w2 / 6.0)
            + sdEm1 * (w3 * (2.0 * p2 - 2.0 * p - 1.0) / 72.0 - w * (7.0 * p2 - 7.0 * p + 1.0) / 36.0)
            + sdEm2 * (2.0 * p - 1.0) * (p + 1.0) * (p - 2.0) * (3.0 * w4 + 7.0 * w2 - 16.0) / 1620.0
            + sdEm3 * (w5 * (4.0 * p4 - 8.0 * p3 - 48.0 * p2 + 52.0 * p - 23.0) / 17280.0
                    + w3 * (256.0 * p4 - 512.0 * p3 - 147.0 * p2 + 403.0 * p - 137.0) / 38880.0
                    - w * (433.0 * p4 - 866.0 * p3 - 921.0 * p2 + 1354.0 * p - 671.0) / 38880.0)
            + sdEm4 * (w6 * (2.0 * p - 1.0) * (p2 - p + 1.0) * (p2 - p + 19.0) / 34020.0
                    + w4 * (2.0 * p - 1.0) * (9.0 * p4 - 18.0 * p3 - 35.0 * p2 + 44.0 * p - 25.0) / 15120.0
                    + w2 * (2.0 * p - 1.0) * (923.0 * p4 - 1846.0 * p3 + 5271.0 * p2 - 4348.0 * p + 5189.0) / 408240.0
                    - 4.0 * (2.0 * p - 1.0) * (p + 1.0) * (p - 2.0) * (23.0 * p2 - 23.0 * p + 2.0) / 25515.0);

        x = std::floor(x);
        if(!(x > 0.0)){
            return 0;
        }
        if(x >= static_cast<double>(this->n)){
            return this->n;
        }
        return static_cast<size_t>(x);
    }

    //Damped newton iteration starting from the mode
    size_t CBinomial::newtonQuantile(double u) const {
        double n = this->n;
        double k = this->modes().front();
        double error = u - this->cdf(k);
        const size_t maxIterations = CBinomial::MaxNewtonIterations.load();
        for(size_t i = 0; i < maxIterations; i++){
            double mass = this->pmf(static_cast<size_t>(k));
            if(mass == 0.0){
                break;
            }
            double step = error / mass;
            logger::Log("Binomial newton iteration %zu at %.0f with step %g",logger::DEBUG,i,k,step);
            if(std::fabs(step) < 0.5){
                return static_cast<size_t>(k);
            }
            double next;
            double nextError;
            while(true){
                next = std::min(std::max(std::round(k + step), 0.0), n);
                if(next == k){
                    return static_cast<size_t>(k);
                }
                nextError = u - this->cdf(next);
                if(std::fabs(nextError) < std::fabs(error)){
                    break;
                }
                step /= 2.0;
            }
            k = next;
            error = nextError;
        }
        logger::Log("Binomial(%zu, %g) newton search for the quantile of %g did not converge, bisecting",
                logger::WARNING,this->n,this->p,u);
        return this->bisectQuantile(u);
    }

    //Smallest k with cdf(k) >= u
    size_t CBinomial::bisectQuantile(double u) const {
        size_t lo = 0;
        size_t hi = this->n;
        while(lo < hi){
            size_t mid = lo + (hi - lo) / 2;
            if(this->cdf(static_cast<double>(mid)) >= u){
                hi = mid;
            } else {
                lo = mid + 1;
            }
        }
        return lo;
    }

    //Walks an estimate onto the smallest k with cdf(k) >= u
    size_t CBinomial::refineQuantile(size_t k, double u) const {
        if(k > this->n){
            k = this->n;
        }
        while(k > 0 && this->cdf(static_cast<double>(k - 1)) >= u){
            k--;
        }
        while(k < this->n && this->cdf(static_cast<double>(k)) < u){
            k++;
        }
        return k;
    }

    size_t CBinomial::sample(CRandomSource & source) const {
        return this->quantile(source.readUniform());
    }

    double CBinomial::skewness() const {
        return (this->q - this->p) / std::sqrt(this->npq);
    }

    double CBinomial::kurtosis() const {
        return (1.0 - 6.0 * this->p * this->q) / this->npq;
    }

    double CBinomial::median() const {
        static const double ln2 = std::log(2.0);
        double np = this->np;
        double rounded = std::round(np);
        if(std::floor(np) == np || (this->p == 0.5 && this->n % 2 != 0)){
            return np;
        } else if(this->p <= 1.0 - ln2 || this->p >= ln2 || std::fabs(rounded - np) <= std::min(this->p,this->q)){
            return rounded;
        } else if(this->n > 1000 && this->npq > 80.0){
            return std::floor(np);
        }
        return this->quantile(0.5);
    }

    std::vector<size_t> CBinomial::modes() const {
        double r = this->p * (this->n + 1.0);
        double fr = std::floor(r);
        if(fr >= this->n + 1.0){
            return {this->n};
        } else if(r != fr){
            return {static_cast<size_t>(fr)};
        }
        size_t m = static_cast<size_t>(fr);
        if(m == 0){
            return {0};
        }
        return {m - 1, m};
    }

    double CBinomial::entropy() const {
        if(this->n > 10000 && this->npq > 80.0){
            //Normal approximation
            return 0.5 * (std::log(2.0 * pi * this->npq) + 1.0);
        }
        //Masses fall off monotonically on both sides of the mode, stop once they underflow
        size_t mode = this->modes().front();
        double entropy = 0.0;
        for(size_t k = mode; k <= this->n; k++){
            double mass = this->pmf(k);
            if(mass == 0.0){
                break;
            }
            entropy -= mass * std::log(mass);
        }
        for(size_t k = mode; k-- > 0;){
            double mass = this->pmf(k);
            if(mass == 0.0){
                break;
            }
            entropy -= mass * std::log(mass);
        }
        return entropy;
    }

}
