#include "Numerics.hpp"
#include "RandomSource.hpp"
#include <stdexcept>

namespace probkit {

    void CheckProportion(double p, const std::string & name){
        if(!(p >= 0.0 && p <= 1.0)){
            throw std::domain_error("Attempt to get " + name + " quantile of non proportion");
        }
    }

    //Stirling error

    double StirlingError(double n){
        static const double S0 = 1.0 / 12.0;
        static const double S1 = 1.0 / 360.0;
        static const double S2 = 1.0 / 1260.0;
        static const double S3 = 1.0 / 1680.0;
        static const double S4 = 1.0 / 1188.0;
        //Exact values for n = 0, ..., 15
        static const double SFE[16] = {
            0.000000000000000000e+00, 8.106146679532725822e-02,
            4.134069595540929409e-02, 2.767792568499833915e-02,
            2.079067210376509311e-02, 1.664469118982119216e-02,
            1.387612882307074800e-02, 1.189670994589177010e-02,
            1.041126526197209650e-02, 9.255462182712732918e-03,
            8.330563433362871256e-03, 7.573675487951840795e-03,
            6.942840107209529866e-03, 6.408994188004207068e-03,
            5.951370112758847736e-03, 5.554733551962801371e-03
        };
        if(n < 16.0){
            return SFE[static_cast<size_t>(n)];
        }
        //Fewer terms of the Stirling-De Moivre series as n grows
        double nn = n * n;
        if(n > 500.0){
            return (S0 - S1 / nn) / n;
        } else if(n > 80.0){
            return (S0 - (S1 - S2 / nn) / nn) / n;
        } else if(n > 35.0){
            return (S0 - (S1 - (S2 - S3 / nn) / nn) / nn) / n;
        }
        return (S0 - (S1 - (S2 - (S3 - S4 / nn) / nn) / nn) / nn) / n;
    }

    double BinomialDeviance(double x, double np){
        if(std::fabs(x - np) < 0.1 * (x + np)){
            //x/np is close to one, the direct form cancels
            double v = (x - np) / (x + np);
            double s = (x - np) * v;
            double ej = 2.0 * x * v;
            for(int j = 1; ; j++){
                ej *= v * v;
                double s1 = s + ej / (2 * j + 1);
                if(s1 == s){
                    return s1;
                }
                s = s1;
            }
        }
        return x * std::log(x / np) + np - x;
    }

    //Gaussian quantile

    static double Polynomial(const double (&c)[8], double x){
        return c[0] + x * (c[1] + x * (c[2] + x * (c[3] + x * (c[4] + x * (c[5] + x * (c[6] + x * c[7]))))));
    }

    double StandardGaussianQuantile(double p){
        static const double CONST1 = 0.180625;
        static const double CONST2 = 1.6;
        static const double SPLIT1 = 0.425;
        static const double SPLIT2 = 5.0;
        static const double A[8] = {
            3.3871328727963666080e+00, 1.3314166789178437745e+02,
            1.9715909503065514427e+03, 1.3731693765509461125e+04,
            4.5921953931549871457e+04, 6.7265770927008700853e+04,
            3.3430575583588128105e+04, 2.5090809287301226727e+03
        };
        static const double B[8] = {
            1.0000000000000000000e+00, 4.2313330701600911252e+01,
            6.8718700749205790830e+02, 5.3941960214247511077e+03,
            2.1213794301586595867e+04, 3.9307895800092710610e+04,
            2.8729085735721942674e+04, 5.2264952788528545610e+03
        };
        static const double C[8] = {
            1.42343711074968357734e+00, 4.63033784615654529590e+00,
            5.76949722146069140550e+00, 3.64784832476320460504e+00,
            1.27045825245236838258e+00, 2.41780725177450611770e-01,
            2.27238449892691845833e-02, 7.74545014278341407640e-04
        };
        static const double D[8] = {
            1.00000000000000000000e+00, 2.05319162663775882187e+00,
            1.67638483018380384940e+00, 6.89767334985100004550e-01,
            1.48103976427480074590e-01, 1.51986665636164571966e-02,
            5.47593808499534494600e-04, 1.05075007164441684324e-09
        };
        static const double E[8] = {
            6.65790464350110377720e+00, 5.46378491116411436990e+00,
            1.78482653991729133580e+00, 2.96560571828504891230e-01,
            2.65321895265761230930e-02, 1.24266094738807843860e-03,
            2.71155556874348757815e-05, 2.01033439929228813265e-07
        };
        static const double F[8] = {
            1.00000000000000000000e+00, 5.99832206555887937690e-01,
            1.36929880922735805310e-01, 1.48753612908506148525e-02,
            7.86869131145613259100e-04, 1.84631831751005468180e-05,
            1.42151175831644588870e-07, 2.04426310338993978564e-15
        };

        if(p <= 0.0){
            return -inf;
        }
        if(p >= 1.0){
            return inf;
        }
        double q = p - 0.5;
        if(std::fabs(q) <= SPLIT1){
            double x = CONST1 - q * q;
            return q * Polynomial(A,x) / Polynomial(B,x);
        }
        double r = std::sqrt(-std::log(q < 0.0 ? p : 1.0 - p));
        if(r <= SPLIT2){
            r -= CONST2;
            r = Polynomial(C,r) / Polynomial(D,r);
        } else {
            r -= SPLIT2;
            r = Polynomial(E,r) / Polynomial(F,r);
        }
        return (q < 0.0) ? -r : r;
    }

    //Sampling

    double StandardGaussianSample(CRandomSource & source){
        double u1;
        while((u1 = source.readUniform()) == 0.0);
        double u2 = source.readUniform();
        return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * pi * u2);
    }

    double StandardGammaSample(double k, CRandomSource & source){
        if(k < 1.0){
            double y = StandardGammaSample(1.0 + k, source);
            return y * std::pow(source.readUniform(), 1.0 / k);
        }
        const double d = k - 1.0 / 3.0;
        const double c = (1.0 / 3.0) / std::sqrt(d);
        while(true){
            double x = StandardGaussianSample(source);
            double v = 1.0 + c * x;
            if(v <= 0.0){
                continue;
            }
            x = x * x;
            v = v * v * v;
            double u;
            while((u = source.readUniform()) == 0.0);
            //Squeeze first, then the exact log test
            if(u < 1.0 - 0.0331 * x * x){
                return d * v;
            }
            if(std::log(u) < 0.5 * x + d * (1.0 - v + std::log(v))){
                return d * v;
            }
        }
    }

    double LogStandardGammaSample(double k, CRandomSource & source){
        if(k >= 1.0){
            return std::log(StandardGammaSample(k, source));
        }
        double y = StandardGammaSample(1.0 + k, source);
        double u;
        while((u = source.readUniform()) == 0.0);
        return std::log(y) + std::log(u) / k;
    }

}
