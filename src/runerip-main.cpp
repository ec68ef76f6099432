#include "lua/logging.h"
#include "lua/state.h"
#include "runerip/commands.h"
#include "runerip/error.h"
#include "runerip/logging.h"
#include "runerip/options.h"
#include "runerip/version.h"

#include <basedir.h>
#include <basedir_fs.h>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <optional>
#include <unistd.h>
#include <wordexp.h>

#define LOGGER() (runerip::logging::get("runerip-main"))

using namespace std::literals;
using namespace runerip;

// exit codes
constexpr int exit_ok = 0;
constexpr int exit_malformed = 1;
constexpr int exit_usage = 2;

static bool run_file(lua::State* L, const char* path)
{
    if (L->loadfile(path) || L->pcall(0, 0, 0)) {
        LOGGER()->error("lua config error: {}", L->tostring(-1));
        L->pop(1);
        return false;
    } else
        return true;
}

// runs the first config found. a missing config is fine, the defaults
// stand; returns false only if a config was found and failed.
static bool run_config(lua::State* L, xdgHandle* xdg,
        const char* confpatharg)
{
    // try specified path first
    if (confpatharg) {
        if (run_file(L, confpatharg))
            return true;
        LOGGER()->warn("unable to run specified config ({})", confpatharg);
        return false;
    }

    // try paths from xdgConfigFind. they are null-terminated, with an
    // empty string at the end (double null)
    char* paths = xdgConfigFind("runerip/config.lua", xdg);
    if (paths) {
        const char* found = nullptr;
        for (char* tmp = paths; *tmp; tmp += std::strlen(tmp) + 1) {
            if (access(tmp, R_OK) == 0) {
                found = tmp;
                break;
            }
        }

        bool result = found ? run_file(L, found) : true;
        std::free(paths);
        if (found)
            return result;
    }

    // finally try CONFIG_FILE, using wordexp to expand ~
    wordexp_t exp_result;
    if (wordexp(CONFIG_FILE, &exp_result, 0) != 0)
        return true;

    bool result = true;
    if (exp_result.we_wordc > 0 && access(exp_result.we_wordv[0], R_OK) == 0)
        result = run_file(L, exp_result.we_wordv[0]);
    wordfree(&exp_result);

    return result;
}

auto usage = std::string_view(R"(
Usage: runerip [options] COMMAND [FILE]
Reads FILE, or stdin if FILE is missing or "-".

Commands:
  count                 print the number of code points
  sum                   print the sum of all code point values
  validate              print "valid", or the offset of the first
                        malformed byte
  transcode             write the input as UTF-16LE
  stream                validate and count, reading the input a
                        chunk at a time

Options:
  -c, --config FILE     overrides config file
  -e, --encoding ENC    utf8 (the default), wtf8 or text
  -r, --repeat N        run the command N times, logging the time
                        taken
  -s, --chunk N         bytes per read for stream
  -o, --out FILE        output for transcode; "-" means stdout
                        (the default)
  -h, --help            show help
  -v, --version         show version and exit
)");

static void exit_help(int code)
{
    fmt::print(code == exit_ok ? stdout : stderr, "{}", usage);
    std::exit(code);
}

static void exit_version()
{
    fmt::print("runerip {}\n", version_string());
    std::exit(exit_ok);
}

static std::optional<int> parse_positive(const char* s)
{
    char* end = nullptr;
    errno = 0;
    long val = std::strtol(s, &end, 10);
    if (errno || end == s || *end != 0 || val <= 0 || val > INT32_MAX)
        return std::nullopt;
    return static_cast<int>(val);
}

// runs fn options.repeat_count times, logging the average time
template <typename F>
static auto repeat(const char* name, const Options& options, F&& fn)
{
    auto start = std::chrono::steady_clock::now();
    auto result = fn();
    for (int i = 1; i < options.repeat_count; i++)
        result = fn();

    auto ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start);
    LOGGER()->info("{}: {:0.3f}ms, {}x", name,
            ms.count() / options.repeat_count, options.repeat_count);
    return result;
}

static int run_command(std::string_view command, const std::string& path,
        const Options& options)
{
    LOGGER()->debug("{} {} as {}", command, path.empty() ? "-"s : path,
            encoding_name(options.enc));

    if (command == "stream") {
        auto totals = stream_count(options.enc, path, options.chunk_size);
        fmt::print("{} runes in {} bytes\n", totals.runes, totals.bytes);
        return exit_ok;
    }

    auto input = read_input(path);

    if (command == "count") {
        auto n = repeat("count", options, [&] {
            return count_runes(options.enc, input);
        });
        fmt::print("{}\n", n);
    } else if (command == "sum") {
        auto sum = repeat("sum", options, [&] {
            return sum_runes(options.enc, input);
        });
        fmt::print("{}\n", sum);
    } else if (command == "validate") {
        auto bad = repeat("validate", options, [&] {
            return find_malformed(options.enc, input);
        });
        if (bad) {
            fmt::print("invalid at byte {}\n", *bad);
            return exit_malformed;
        }
        fmt::print("valid\n");
    } else if (command == "transcode") {
        auto units = repeat("transcode", options, [&] {
            return transcode(options.enc, input);
        });
        write_output(options.out, {reinterpret_cast<const char*>(units.data()),
                                          units.size() * sizeof(char16_t)});
        LOGGER()->info("wrote {} utf-16 units", units.size());
    }

    return exit_ok;
}

int main(int argc, char* argv[])
{
    lua::State L;
    L.openlibs();

    // register internal modules
    lua::register_lualogging(&L);

    const char* confpath = nullptr;
    std::optional<encoding> enc;
    std::optional<int> repeat_count;
    std::optional<int> chunk_size;
    std::optional<std::string> out;

    static const struct option long_options[] = {
            {"config", required_argument, nullptr, 'c'},
            {"encoding", required_argument, nullptr, 'e'},
            {"repeat", required_argument, nullptr, 'r'},
            {"chunk", required_argument, nullptr, 's'},
            {"out", required_argument, nullptr, 'o'},
            {"help", no_argument, nullptr, 'h'},
            {"version", no_argument, nullptr, 'v'},
            {nullptr, 0, nullptr, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, "c:e:r:s:o:hv", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                confpath = optarg;
                break;
            case 'e':
                enc = parse_encoding(optarg);
                if (!enc) {
                    LOGGER()->error("unknown encoding '{}'", optarg);
                    exit_help(exit_usage);
                }
                break;
            case 'r':
                repeat_count = parse_positive(optarg);
                if (!repeat_count) {
                    LOGGER()->error("invalid repeat count '{}'", optarg);
                    exit_help(exit_usage);
                }
                break;
            case 's':
                chunk_size = parse_positive(optarg);
                if (!chunk_size) {
                    LOGGER()->error("invalid chunk size '{}'", optarg);
                    exit_help(exit_usage);
                }
                break;
            case 'o':
                out = optarg;
                break;
            case 'h':
                exit_help(exit_ok);
                break;
            case 'v':
                exit_version();
                break;
            default:
                exit_help(exit_usage);
        }
    }

    if (optind >= argc) {
        LOGGER()->error("missing command");
        exit_help(exit_usage);
    }

    std::string_view command = argv[optind];
    if (!is_command(command)) {
        LOGGER()->error("unknown command '{}'", command);
        exit_help(exit_usage);
    }

    std::string path = optind + 1 < argc ? argv[optind + 1] : "";

    Options options;
    {
        xdgHandle xdg;
        if (!xdgInitHandle(&xdg))
            LOGGER()->fatal("unable to read xdg base directories");

        // find and run configuration file
        if (!run_config(&L, &xdg, confpath))
            LOGGER()->warn("config failed, using defaults");

        xdgWipeHandle(&xdg);
    }

    load_config(&L, &options);

    // command line wins over config
    if (enc)
        options.enc = *enc;
    if (repeat_count)
        options.repeat_count = *repeat_count;
    if (chunk_size)
        options.chunk_size = static_cast<std::size_t>(*chunk_size);
    if (out)
        options.out = *out;

    logging::set_level(options.log_level);

    try {
        return run_command(command, path, options);
    } catch (const MalformedEncoding& e) {
        LOGGER()->error("{}: {}", path.empty() ? "stdin"s : path, e.what());
        return exit_malformed;
    } catch (const IoError& e) {
        LOGGER()->error(e.what());
        return exit_usage;
    }
}
