#include "benchmark/benchmark.h"

#include "../src/realfloat.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <random>
#include <string>
#include <utility>
#include <vector>

#define BENCH_SINGLE()          1
#define BENCH_DOUBLE()          1

//==================================================================================================
//
//==================================================================================================

class JenkinsRandom
{
    // A small noncryptographic PRNG
    // http://burtleburtle.net/bob/rand/smallprng.html

    uint32_t a;
    uint32_t b;
    uint32_t c;
    uint32_t d;

    static uint32_t Rotate(uint32_t value, int n) {
        return (value << n) | (value >> (32 - n));
    }

    uint32_t Gen() {
        const uint32_t e = a - Rotate(b, 27);
        a = b ^ Rotate(c, 17);
        b = c + d;
        c = d + e;
        d = e + a;
        return d;
    }

public:
    using result_type = uint32_t;

    static constexpr uint32_t min() { return 0; }
    static constexpr uint32_t max() { return UINT32_MAX; }

    explicit JenkinsRandom(uint32_t seed = 0) {
        a = 0xF1EA5EED;
        b = seed;
        c = seed;
        d = seed;
        for (int i = 0; i < 20; ++i) {
            static_cast<void>(Gen());
        }
    }

    uint32_t operator()() { return Gen(); }
};

static JenkinsRandom rng;

//==================================================================================================
//
//==================================================================================================

static constexpr int NumFloats = 1 << 13;

template <typename ...Args>
static inline char const* StrPrintf(char const* format, Args&&... args)
{
    char buf[1024];
    snprintf(buf, 1024, format, std::forward<Args>(args)...);
#ifdef _MSC_VER
    return _strdup(buf); // leak...
#else
    return strdup(buf); // leak...
#endif
}

struct ToDecimalOp
{
    template <typename Float>
    uint64_t operator()(std::string& /*out*/, Float value) const
    {
        return realfloat::ToDecimal(value).digits;
    }
};

template <realfloat::FloatFormat (*MakeFormat)()>
struct AppendOp
{
    const realfloat::FloatFormat format = MakeFormat();

    uint64_t operator()(std::string& out, float value) const
    {
        out.clear();
        realfloat::AppendFloat(out, format, value);
        return static_cast<unsigned char>(out[0]);
    }

    uint64_t operator()(std::string& out, double value) const
    {
        out.clear();
        realfloat::AppendDouble(out, format, value);
        return static_cast<unsigned char>(out[0]);
    }
};

static realfloat::FloatFormat MakeGeneric() { return realfloat::Generic(); }
static realfloat::FloatFormat MakeScientific() { return realfloat::Scientific(); }
static realfloat::FloatFormat MakeShortest() { return realfloat::Shortest(); }
static realfloat::FloatFormat MakeFixed6() { return realfloat::Fixed(6); }

template <typename Op, typename Float>
static inline void BenchIt(benchmark::State& state, std::vector<Float> const& numbers)
{
    Op op;
    std::string out;
    out.reserve(512);

    int index = 0;
    uint64_t sum = 0;
    for (auto _ : state)
    {
        sum += op(out, numbers[index]);
        index = (index + 1) & (NumFloats - 1);
    }

    if (sum == UINT64_MAX)
        abort();
}

template <typename Op, typename Float>
static inline void RegisterBenchmark(char const* op_name, char const* name, std::vector<Float> const& numbers)
{
    const char* float_name = sizeof(Float) == 4 ? "single" : "double";

    auto* bench = benchmark::RegisterBenchmark(StrPrintf("%s - %s - %s   ", float_name, op_name, name), BenchIt<Op, Float>, numbers);
    bench->ComputeStatistics("min", [](const std::vector<double>& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

template <typename Float>
static inline void RegisterBenchmarks(char const* name, std::vector<Float> const& numbers)
{
    RegisterBenchmark<ToDecimalOp>("to-decimal", name, numbers);
    RegisterBenchmark<AppendOp<MakeGeneric>>("generic", name, numbers);
    RegisterBenchmark<AppendOp<MakeScientific>>("scientific", name, numbers);
    RegisterBenchmark<AppendOp<MakeShortest>>("shortest", name, numbers);
    RegisterBenchmark<AppendOp<MakeFixed6>>("fixed(6)", name, numbers);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

static inline void Register_RandomBits_double()
{
    std::vector<double> numbers(NumFloats);

    std::uniform_int_distribution<uint64_t> gen(1, 0x7FF0000000000000ull - 1);
    std::generate(numbers.begin(), numbers.end(), [&] { return realfloat::ReinterpretBits<double>(gen(rng)); });

    RegisterBenchmarks("Random-bits", numbers);
}

static inline void Register_RandomBits_single()
{
    std::vector<float> numbers(NumFloats);

    std::uniform_int_distribution<uint32_t> gen(1, 0x7F800000u - 1);
    std::generate(numbers.begin(), numbers.end(), [&] { return realfloat::ReinterpretBits<float>(gen(rng)); });

    RegisterBenchmarks("Random-bits", numbers);
}

template <typename Float>
static inline void Register_Uniform(Float low, Float high)
{
    std::vector<Float> numbers(NumFloats);

    std::uniform_real_distribution<Float> gen(low, high);
    std::generate(numbers.begin(), numbers.end(), [&] { return gen(rng); });

    RegisterBenchmarks(StrPrintf("Uniform %.1g/%.1g", static_cast<double>(low), static_cast<double>(high)), numbers);
}

// Integers with the given number of decimal digits.
template <typename Float>
static inline void Register_Integers(int digits)
{
    assert(digits >= 1);
    assert(digits <= 7);

    int32_t low = 1;
    for (int i = 1; i < digits; ++i)
        low *= 10;

    std::vector<Float> numbers(NumFloats);

    std::uniform_int_distribution<int32_t> gen(low, 10 * low - 1);
    std::generate(numbers.begin(), numbers.end(), [&] { return static_cast<Float>(gen(rng)); });

    RegisterBenchmarks(StrPrintf("Integers %d digits", digits), numbers);
}

//==================================================================================================
//
//==================================================================================================

int main(int argc, char** argv)
{
#if BENCH_SINGLE()
    Register_RandomBits_single();
    Register_Uniform(0.0f, 1.0f);
    Register_Integers<float>(3);
    Register_Integers<float>(7);
#endif

#if BENCH_DOUBLE()
    Register_RandomBits_double();
    Register_Uniform(0.0, 1.0);
    Register_Uniform(0.0, 1.0e+10);
    Register_Integers<double>(3);
    Register_Integers<double>(7);
#endif

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
