#define ANKERL_NANOBENCH_IMPLEMENT
#include "nanobench.h"

#include "runerip/logging.h"

#include <clocale>

#define LOGGER() (runerip::logging::get("runerip-bench"))

void bench_count(ankerl::nanobench::Config& cfg);
void bench_validate(ankerl::nanobench::Config& cfg);
void bench_sum(ankerl::nanobench::Config& cfg);
void bench_transcode(ankerl::nanobench::Config& cfg);

int main()
{
    // the mbrtoc32 baselines need a utf-8 locale
    if (!std::setlocale(LC_CTYPE, "C.UTF-8") && !std::setlocale(LC_CTYPE, "en_US.UTF-8"))
        LOGGER()->warn("no utf-8 locale, mbrtoc32 baselines will fail");

    auto cfg = ankerl::nanobench::Config();

    bench_count(cfg);
    bench_validate(cfg);
    bench_sum(cfg);
    bench_transcode(cfg);
}
