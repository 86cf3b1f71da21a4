#ifndef PROBKIT_SAMPLESTATISTICS_HPP
#define PROBKIT_SAMPLESTATISTICS_HPP

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace probkit {

    //Empirical summaries of a set of draws

    template<typename numericType>
    double GetMean(const std::vector<numericType> & vector){
        if(vector.empty()){
            throw std::invalid_argument("Attempt to get the mean of an empty sample");
        }
        double mean = 0;
        for(const auto & x : vector){
            mean += x;
        }
        return mean / vector.size();
    }

    //Unbiased (n - 1) estimate
    template<typename numericType>
    double GetStandardDeviation(const std::vector<numericType> & vector, double mean){
        if(vector.size() < 2){
            throw std::invalid_argument("Attempt to get the standard deviation of fewer than two draws");
        }
        double ss = 0;
        for(const numericType & x : vector){
            double res = x - mean;
            ss += res * res;
        }
        return std::sqrt(ss / (double)(vector.size() - 1));
    }

    template<typename numericType>
    double GetStandardDeviation(const std::vector<numericType> & vector){
        return GetStandardDeviation<numericType>(vector,GetMean<numericType>(vector));
    }

    //Takes a copy, partially sorted in place
    template<typename numericType>
    double GetMedian(std::vector<numericType> vector){
        if(vector.empty()){
            throw std::invalid_argument("Attempt to get the median of an empty sample");
        }
        size_t m = (vector.size() - 1) / 2;
        std::nth_element(vector.begin(), vector.begin() + m, vector.end());
        double median = vector[m];
        if(vector.size() % 2 == 0){
            //The upper middle is the smallest of the upper half
            median += *std::min_element(vector.begin() + m + 1, vector.end());
            median /= 2.0;
        }
        return median;
    }

    template<typename numericType>
    double GetMeanAbsoluteDeviation(const std::vector<numericType> & vector, double centre){
        if(vector.empty()){
            throw std::invalid_argument("Attempt to get the mean absolute deviation of an empty sample");
        }
        double mad = 0;
        for(const numericType & x : vector){
            mad += std::fabs((double) x - centre);
        }
        return mad / vector.size();
    }

    //About the median
    template<typename numericType>
    double GetMeanAbsoluteDeviation(const std::vector<numericType> & vector){
        return GetMeanAbsoluteDeviation<numericType>(vector,GetMedian<numericType>(vector));
    }

}

#endif //PROBKIT_SAMPLESTATISTICS_HPP
