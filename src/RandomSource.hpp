#ifndef PROBKIT_RANDOMSOURCE_HPP
#define PROBKIT_RANDOMSOURCE_HPP

#include <array>
#include <cstdint>
#include <limits>
#include <random>

namespace probkit {

    typedef std::array<uint64_t,2> Seed;

    //Seed of every thread's default source
    extern const Seed DefaultSeed;

    //A stream of uniformly distributed 64 bit words
    //  A source is mutated by every read and must only be used by one caller at a time
    //  The class also satisfies the standard UniformRandomBitGenerator requirements
    class CRandomSource {
        //Con-/Destruction
        public:
            virtual ~CRandomSource() = default;
        //Methods
        public:
            virtual uint64_t read() = 0;
            //Uniform on [0,1), built from the top 53 bits of one word
            double readUniform();
        //UniformRandomBitGenerator
        public:
            typedef uint64_t result_type;
            static constexpr result_type min(){return 0;}
            static constexpr result_type max(){return std::numeric_limits<result_type>::max();}
            result_type operator()(){return this->read();}
    };

    //Xorshift128+ (Vigna, 2014), shift triple 23/17/26
    //  Period 2^128 - 1. Statistically good, but NOT suitable for cryptography:
    //  the state is trivially recovered from two consecutive outputs.
    class CXorshift128Plus : public CRandomSource {
        //Con-/Destruction
        public:
            CXorshift128Plus() : CXorshift128Plus(DefaultSeed) {}
            CXorshift128Plus(uint64_t s0, uint64_t s1);
            explicit CXorshift128Plus(const Seed & seed) : CXorshift128Plus(seed[0],seed[1]) {}
        //Members
        protected:
            Seed state;
        //Methods
        public:
            uint64_t read() override;
            const Seed & getState() const {return this->state;}
            void seed(uint64_t s0, uint64_t s1);
    };

    //Wraps a standard 64 bit engine (e.g. std::mt19937_64) as a random source
    template<class Engine>
    class CEngineSource : public CRandomSource {
        static_assert(Engine::min() == 0 && Engine::max() == std::numeric_limits<uint64_t>::max(),
                "CEngineSource requires an engine producing full 64 bit words");
        //Con-/Destruction
        public:
            CEngineSource() {}
            explicit CEngineSource(typename Engine::result_type seed) : engine(seed) {}
        //Members
        protected:
            Engine engine;
        //Methods
        public:
            uint64_t read() override {return this->engine();}
            Engine & getEngine() {return this->engine;}
    };

    //The calling thread's own source; every thread starts from DefaultSeed
    CRandomSource & DefaultSource();
    void ReseedDefaultSource(uint64_t s0, uint64_t s1);

}

#endif //PROBKIT_RANDOMSOURCE_HPP
