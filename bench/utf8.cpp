#include "nanobench.h"
#include "runerip/utf8.h"
#include "runerip/view.h"

#include <codecvt>
#include <cuchar>
#include <cwchar>
#include <locale>
#include <string>
#include <string_view>
#include <vector>

using namespace runerip;

extern const char* sample_text;

namespace {

// sample text repeated to a size worth timing
const std::string& corpus()
{
    static const std::string text = [] {
        std::string s;
        while (s.size() < 256 * 1024)
            s += sample_text;
        return s;
    }();
    return text;
}

template <typename T>
void run_count(ankerl::nanobench::Config& cfg)
{
    std::string_view v = corpus();
    std::size_t n = 0;
    cfg.minEpochIterations(10).run("count " + std::string(T::name), [&] {
        n += count<T>(v);
    }).doNotOptimizeAway(&n);
}

template <typename T>
void run_validate(ankerl::nanobench::Config& cfg)
{
    std::string_view v = corpus();
    int ok = 0;
    cfg.minEpochIterations(10).run("validate " + std::string(T::name), [&] {
        ok += validate<T>(v);
    }).doNotOptimizeAway(&ok);
}

template <typename T>
void run_sum(ankerl::nanobench::Config& cfg)
{
    std::string_view v = corpus();
    uint64_t sum = 0;
    cfg.minEpochIterations(10).run("sum " + std::string(T::name), [&] {
        auto it = View<T>::fromTrusted(v).iterator();
        while (auto cp = it.next())
            sum += *cp;
    }).doNotOptimizeAway(&sum);
}

template <typename T>
void run_transcode(ankerl::nanobench::Config& cfg)
{
    std::string_view v = corpus();
    std::vector<char16_t> dest(utf16_capacity(v.size()));
    std::size_t n = 0;
    cfg.minEpochIterations(10).run("transcode " + std::string(T::name), [&] {
        n += transcode_utf16<T>(dest.data(), v);
    }).doNotOptimizeAway(&n);
}

// decodes v with the c library, calling f for each code point. returns
// false on malformed input.
template <typename F>
bool mb_decode(std::string_view v, F&& f)
{
    std::mbstate_t mb = std::mbstate_t();
    const char* p = v.data();
    const char* end = p + v.size();
    while (p < end) {
        char32_t c32;
        std::size_t rc = std::mbrtoc32(&c32, p, end - p, &mb);
        if (rc == static_cast<std::size_t>(-1) || rc == static_cast<std::size_t>(-2))
            return false;
        f(c32);
        p += rc ? rc : 1;
    }
    return true;
}

} // namespace

void bench_count(ankerl::nanobench::Config& cfg)
{
    run_count<tables::utf8>(cfg);
    run_count<tables::wtf8>(cfg);
    run_count<tables::text>(cfg);

    std::string_view v = corpus();
    std::size_t n = 0;
    cfg.minEpochIterations(10).run("count mbrtoc32", [&] {
        mb_decode(v, [&](char32_t) { n++; });
    }).doNotOptimizeAway(&n);
}

void bench_validate(ankerl::nanobench::Config& cfg)
{
    run_validate<tables::utf8>(cfg);
    run_validate<tables::wtf8>(cfg);
    run_validate<tables::text>(cfg);

    std::string_view v = corpus();
    int ok = 0;
    cfg.minEpochIterations(10).run("validate mbrtoc32", [&] {
        ok += mb_decode(v, [](char32_t) {});
    }).doNotOptimizeAway(&ok);
}

void bench_sum(ankerl::nanobench::Config& cfg)
{
    run_sum<tables::utf8>(cfg);
    run_sum<tables::wtf8>(cfg);
    run_sum<tables::text>(cfg);

    std::string_view v = corpus();
    uint64_t sum = 0;
    cfg.minEpochIterations(10).run("sum mbrtoc32", [&] {
        mb_decode(v, [&](char32_t cp) { sum += cp; });
    }).doNotOptimizeAway(&sum);
}

void bench_transcode(ankerl::nanobench::Config& cfg)
{
    run_transcode<tables::utf8>(cfg);
    run_transcode<tables::wtf8>(cfg);
    run_transcode<tables::text>(cfg);

    std::string_view v = corpus();
    std::size_t n = 0;
    cfg.minEpochIterations(10).run("transcode wstring_convert", [&] {
        std::wstring_convert<std::codecvt_utf8_utf16<char16_t>, char16_t> cvt;
        n += cvt.from_bytes(v.data(), v.data() + v.size()).size();
    }).doNotOptimizeAway(&n);
}
