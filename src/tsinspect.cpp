#include <string>
#include <getopt.h>
#include <cstdlib>
#include <iostream>
#include <cerrno>
#include <optional>
#include <algorithm>
#include <vector>
#include <chrono>
#include <exception>
#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/filesystem.hpp>

#include "inspector/inspector.hpp"
#include "inspector/rollup.hpp"

struct Config {
    std::string dir;
    std::optional<double> start;
    std::optional<double> end;
    std::optional<double> window;
    bool rollup = false;
    bool quiet = false;
};

void print_help_and_exit() {
    std::cout <<
        "Usage:\n"
        "  tsinspect [options]\n\n"
        "Options:\n"
        "  -h, --help\n"
        "      Show this help and exit\n"
        "  -d, --dir\n"
        "      Directory to walk\n"
        "  -s, --start <epoch>\n"
        "      Start of the time frame, unix time (fractions allowed)\n"
        "  -e, --end <epoch>\n"
        "      End of the time frame, unix time (fractions allowed)\n"
        "  -w, --window <sec>\n"
        "      Length of the time frame. Combine with --start or --end\n"
        "      and the other end is worked out from it\n"
        "  -r, --rollup\n"
        "      Also list every directory with the newest stamp found below it\n"
        "  -q, --quiet\n"
        "      Don't print files that couldn't be stat'ed\n";
    std::exit(0);
}

double parse_seconds_or_exit(const char* opt, const char* arg) {
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(arg, &end);
    if (errno != 0 || end == arg || *end != '\0') {
        std::cerr << "Error: " << opt << " expects a number of seconds, got '" << arg << "'" << std::endl;
        std::exit(EINVAL);
    }
    return v;
}

void validate_dir(const std::string& dir) {

    if (dir.empty()) {
        std::cerr << "Error: must specify --dir/-d" << std::endl;
        std::exit(EINVAL);
    }

    // the inspector checks this too, this just gives a nicer message up front
    boost::system::error_code ec;
    if (!boost::filesystem::is_directory(dir, ec)) {
        std::cerr << "Error: " << dir << " is not a directory." << std::endl;
        std::exit(ec ? ec.value() : EINVAL);
    }
}

Config parse_args(int argc, char** argv) {
    Config cfg;

    static option long_opts[] = {
        {"help",    no_argument,       nullptr, 'h'},
        {"dir",     required_argument, nullptr, 'd'},
        {"start",   required_argument, nullptr, 's'},
        {"end",     required_argument, nullptr, 'e'},
        {"window",  required_argument, nullptr, 'w'},
        {"rollup",  no_argument,       nullptr, 'r'},
        {"quiet",   no_argument,       nullptr, 'q'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "hd:s:e:w:rq", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                print_help_and_exit();
                break;
            case 'd':
                cfg.dir = std::string(optarg);
                break;
            case 's':
                cfg.start = parse_seconds_or_exit("--start", optarg);
                break;
            case 'e':
                cfg.end = parse_seconds_or_exit("--end", optarg);
                break;
            case 'w':
                cfg.window = parse_seconds_or_exit("--window", optarg);
                break;
            case 'r':
                cfg.rollup = true;
                break;
            case 'q':
                cfg.quiet = true;
                break;
            default:
                print_help_and_exit();
        }
    }
    validate_dir(cfg.dir);

    return cfg;
}

TimeFrame frame_from_config(const Config& cfg) {
    std::optional<Timestamp> start, end;
    std::optional<Window> window;

    try {
        if (cfg.start)
            start = timestamp_from_seconds(*cfg.start);
        if (cfg.end)
            end = timestamp_from_seconds(*cfg.end);
        if (cfg.window)
            window = window_from_seconds(*cfg.window);
        return TimeFrame::resolve(start, end, window);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::exit(EINVAL);
    }
}

// oldest first
void dump(const char* title, const Hits& hits) {
    std::vector<std::pair<std::string, Timestamp>> sorted(hits.begin(), hits.end());
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });

    std::cout << "#### " << title << ":" << std::endl;
    std::cout << "#" << std::endl;
    for (const auto& [path, stamp] : sorted)
        std::cout << path << " : " << format_stamp(stamp) << std::endl;
    std::cout << std::endl;
}

int main(int argc, char **argv) {

    Config cfg = parse_args(argc, argv);
    TimeFrame frame = frame_from_config(cfg);

    std::cout << "====== OPTIONS ======== " << std::endl;
    std::cout << "dir=" << cfg.dir << std::endl;
    std::cout << "start=" << format_stamp(frame.start()) << std::endl;
    std::cout << "end=" << format_stamp(frame.end()) << std::endl;
    std::cout << "window=" << std::chrono::duration<double>(frame.length()).count() << "s" << std::endl;
    std::cout << "rollup=" << cfg.rollup << std::endl;
    std::cout << "======================= " << std::endl;

    ErrorHandler on_error;
    if (!cfg.quiet) {
        on_error = [](const std::string& path, const boost::system::error_code& ec) {
            std::cerr << ec.message() << " " << path << std::endl;
        };
    }
    Inspector inspector(cfg.dir, frame, on_error);

    int rc = 0;
    auto start = std::chrono::steady_clock::now();
    std::cout << "- Running " << inspector.root() << std::endl;

    net::io_context ioc;
    net::co_spawn(ioc, inspector.inspect(), [&rc](std::exception_ptr e) {
        if (e) {
            try { std::rethrow_exception(e); }
            catch (const ScanInitiationError& ex) {
                std::cerr << "Error: " << ex.what() << std::endl;
                rc = ex.code().value();
            }
            catch (const std::exception& ex) {
                std::cerr << "Error: " << ex.what() << std::endl;
                rc = EXIT_FAILURE;
            }
        }
    });
    ioc.run();

    if (rc != 0)
        return rc;

    auto end = std::chrono::steady_clock::now();
    std::chrono::duration<double> elapsed_seconds = end - start;
    std::cout << "- Done in " << elapsed_seconds.count() << " seconds, "
              << inspector.errors().size() << " errors" << std::endl;
    std::cout << std::endl;

    dump("Created", inspector.created());
    dump("Accessed", inspector.accessed());
    dump("Modified", inspector.modified());

    if (cfg.rollup) {
        dump("Created (by directory)", rollup(inspector.created(), inspector.root()));
        dump("Accessed (by directory)", rollup(inspector.accessed(), inspector.root()));
        dump("Modified (by directory)", rollup(inspector.modified(), inspector.root()));
    }
}
