#ifndef PROBKIT_SAMPLER_HPP
#define PROBKIT_SAMPLER_HPP

#include "Capabilities.hpp"
#include "RandomSource.hpp"
#include <vector>

namespace probkit {

    //An unbounded stream of independent draws from a distribution
    //  Both the distribution and the source are borrowed and must outlive the sampler
    //  Copies share the same source, so interleaving them interleaves one stream
    template<typename T>
    class CIndependentSampler {
        //Con-/Destruction
        public:
            CIndependentSampler(const CSample<T> & distribution, CRandomSource & source) :
                distribution(&distribution), source(&source) {}
        //Members
        protected:
            const CSample<T> * distribution;
            CRandomSource * source;
        //Methods
        public:
            T next() {return this->distribution->sample(*this->source);}
            T operator()() {return this->next();}
            std::vector<T> take(size_t n){
                std::vector<T> vDraws;
                vDraws.reserve(n);
                for(size_t i = 0; i < n; i++){
                    vDraws.push_back(this->next());
                }
                return vDraws;
            }
    };

    template<typename T>
    CIndependentSampler<T> MakeSampler(const CSample<T> & distribution, CRandomSource & source){
        return CIndependentSampler<T>(distribution,source);
    }

}

#endif //PROBKIT_SAMPLER_HPP
