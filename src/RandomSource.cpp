#include "Logging.h"
#include "RandomSource.hpp"
#include <stdexcept>

namespace probkit {

    const Seed DefaultSeed = {{42, 69}};

    //2^-53
    static const double UniformScale = 1.0 / 9007199254740992.0;

    double CRandomSource::readUniform(){
        return static_cast<double>(this->read() >> 11) * UniformScale;
    }

    //CXorshift128Plus

    CXorshift128Plus::CXorshift128Plus(uint64_t s0, uint64_t s1){
        this->seed(s0,s1);
    }

    void CXorshift128Plus::seed(uint64_t s0, uint64_t s1){
        //An all zero state is a fixed point of the recurrence
        if(s0 == 0 && s1 == 0){
            throw std::invalid_argument("Attempt to seed CXorshift128Plus with an all zero state");
        }
        this->state[0] = s0;
        this->state[1] = s1;
    }

    uint64_t CXorshift128Plus::read(){
        uint64_t x = this->state[0];
        const uint64_t y = this->state[1];
        this->state[0] = y;
        x ^= x << 23;
        x ^= x >> 17;
        x ^= y ^ (y >> 26);
        this->state[1] = x;
        return x + y;
    }

    //Default source

    static CXorshift128Plus & ThreadSource(){
        thread_local CXorshift128Plus source(DefaultSeed);
        return source;
    }

    CRandomSource & DefaultSource(){
        return ThreadSource();
    }

    void ReseedDefaultSource(uint64_t s0, uint64_t s1){
        logger::Log("Reseeding the default source of this thread",logger::DEBUG);
        ThreadSource().seed(s0,s1);
    }

}
