/**
 * @file solartrack.cpp
 * @brief SolarTrack console driver
 *
 * Loads the ephemeris once, then runs one command as a background job while
 * the main thread drains the notification channel and prints results.
 *
 *   solartrack [--config file.json] [--ephemeris file.bsp] [--frame ecliptic|equatorial]
 *              [--verbose] <command> ...
 */

#include "solartrack/config/SolarTrackConfig.hpp"
#include "solartrack/core/Errors.hpp"
#include "solartrack/ephemeris/EphemerisStore.hpp"
#include "solartrack/ephemeris/PositionCalculator.hpp"
#include "solartrack/events/EventDetector.hpp"
#include "solartrack/io/OrbitExport.hpp"
#include "solartrack/orbits/ElementExtractor.hpp"
#include "solartrack/orbits/OrbitSampler.hpp"
#include "solartrack/scheduler/TaskScheduler.hpp"
#include "solartrack/time/TimeUtils.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace solartrack;

namespace {

void printUsage() {
    std::cerr <<
        "Usage: solartrack [--config file.json] [--ephemeris file.bsp]\n"
        "                  [--frame ecliptic|equatorial] [--verbose] <command> ...\n"
        "\n"
        "Commands:\n"
        "  positions DATE TIME [BODY...]      Heliocentric positions\n"
        "  orbit BODY START END [N] [--csv]   Sampled orbit (START/END: YYYY-MM-DD)\n"
        "  elements BODY DATE TIME            Osculating a and e\n"
        "  events DATE TIME                   Conjunctions/oppositions in progress\n"
        "  search START END [BODY...]         Timed events in an interval\n"
        "  upcoming [BODY...]                 Timed events in the next 365 days\n"
        "  snapshot DATE TIME                 Positions, one-year orbits and events\n"
        "\n"
        "DATE is YYYY-MM-DD, TIME is HH:MM[:SS] (UTC).\n";
}

struct CommandLine {
    std::string config_file;
    std::string ephemeris_file;
    std::string frame;
    bool verbose = false;
    bool csv = false;
    std::string command;
    std::vector<std::string> args;
};

bool parseCommandLine(int argc, char** argv, CommandLine& cl) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--ephemeris" || arg == "--frame") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--config") cl.config_file = value;
            else if (arg == "--ephemeris") cl.ephemeris_file = value;
            else cl.frame = value;
        } else if (arg == "--verbose" || arg == "-v") {
            cl.verbose = true;
        } else if (arg == "--csv") {
            cl.csv = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (cl.command.empty()) {
            cl.command = arg;
        } else {
            cl.args.push_back(arg);
        }
    }
    return !cl.command.empty();
}

/// Core components built over the one shared ephemeris
struct Services {
    config::SolarTrackConfig config;
    std::shared_ptr<const ephemeris::EphemerisStore> store;
    std::unique_ptr<ephemeris::PositionCalculator> calculator;
    std::unique_ptr<orbits::OrbitSampler> sampler;
    std::unique_ptr<orbits::ElementExtractor> extractor;
    std::unique_ptr<events::EventDetector> detector;
};

std::vector<std::string> bodiesFrom(const std::vector<std::string>& args, std::size_t first,
                                    const std::vector<std::string>& fallback) {
    if (args.size() <= first) return fallback;
    return std::vector<std::string>(args.begin() + first, args.end());
}

void requireArgs(const std::vector<std::string>& args, std::size_t n, const std::string& command) {
    if (args.size() < n) {
        throw std::invalid_argument("'" + command + "' needs at least " + std::to_string(n) + " argument(s)");
    }
}

void printPositions(const ephemeris::PositionMap& positions, ephemeris::ReferenceFrame frame) {
    std::cout << "Heliocentric positions (" << ephemeris::frameName(frame) << " J2000, AU)\n";
    std::cout << std::fixed << std::setprecision(6);
    for (const auto& [name, p] : positions) {
        std::cout << "  " << std::left << std::setw(8) << name << std::right
                  << std::setw(13) << p.x() << std::setw(13) << p.y() << std::setw(13) << p.z()
                  << "   r=" << p.norm() << "\n";
    }
}

void printEvents(const std::vector<events::Event>& found) {
    if (found.empty()) {
        std::cout << "No events found.\n";
        return;
    }
    std::cout << std::fixed << std::setprecision(2);
    for (const auto& e : found) {
        std::cout << "  - " << e.body << ": " << events::eventKindName(e.kind);
        if (e.time) std::cout << " on " << time::formatUtc(*e.time);
        std::cout << " (elongation " << e.elongation_deg << " deg)\n";
    }
}

void printOrbitSummary(const orbits::OrbitPath& path) {
    if (path.empty()) {
        std::cout << path.body << ": no samples (window outside ephemeris range)\n";
        return;
    }
    double r_min = path.positions.front().norm();
    double r_max = r_min;
    for (const auto& p : path.positions) {
        r_min = std::min(r_min, p.norm());
        r_max = std::max(r_max, p.norm());
    }
    std::cout << std::fixed << std::setprecision(6);
    std::cout << path.body << ": " << path.size() << " samples, "
              << time::formatUtcDate(path.epochs.front()) << " to " << time::formatUtcDate(path.epochs.back())
              << ", r " << r_min << " - " << r_max << " AU\n";
}

// Runs on the worker thread; output is handed back with ctx.deliver
void runCommand(const Services& s, const CommandLine& cl, scheduler::JobContext& ctx) {
    const auto& args = cl.args;
    const auto frame = s.config.frame;
    const auto& cmd = cl.command;

    if (cmd == "positions") {
        requireArgs(args, 2, cmd);
        auto at = time::parse(args[0], args[1]);
        auto positions = s.calculator->positions(bodiesFrom(args, 2, s.config.bodies), at, frame);
        ctx.deliver([positions, frame]() { printPositions(positions, frame); });

    } else if (cmd == "orbit") {
        requireArgs(args, 3, cmd);
        auto start = time::parse(args[1], "00:00");
        auto end = time::parse(args[2], "00:00");
        int n = args.size() > 3 ? orbits::parseSampleCount(args[3]) : s.config.orbit_sample_count;
        ctx.setStatus("sampling " + args[0]);
        auto path = s.sampler->orbit(args[0], start, end, n, frame);
        const bool csv = cl.csv;
        ctx.deliver([path, csv]() {
            if (csv) {
                orbits::OrbitSet set;
                if (!path->empty()) set[path->body] = path;
                io::writeOrbitCsv(std::cout, set);
            } else {
                printOrbitSummary(*path);
            }
        });

    } else if (cmd == "elements") {
        requireArgs(args, 3, cmd);
        auto at = time::parse(args[1], args[2]);
        auto el = s.extractor->elements(args[0], at);
        std::string body = args[0];
        ctx.deliver([el, body]() {
            std::cout << std::fixed;
            std::cout << body << " at " << time::formatUtc(el.epoch) << "\n";
            if (!el.isAvailable()) {
                std::cout << "  elements unavailable\n";
                return;
            }
            std::cout << "  Semi-major axis: " << std::setprecision(6) << el.semi_major_axis << " AU\n";
            std::cout << "  Eccentricity:    " << std::setprecision(6) << el.eccentricity << "\n";
        });

    } else if (cmd == "events") {
        requireArgs(args, 2, cmd);
        auto at = time::parse(args[0], args[1]);
        time::validateWithinEphemeris(at, *s.store);
        auto found = s.detector->checkAt(s.config.bodies, at);
        ctx.deliver([found]() { printEvents(found); });

    } else if (cmd == "search" || cmd == "upcoming") {
        time::Instant start;
        time::Instant end;
        std::vector<std::string> bodies;
        if (cmd == "search") {
            requireArgs(args, 2, cmd);
            start = time::parse(args[0], "00:00");
            end = time::parse(args[1], "00:00");
            bodies = bodiesFrom(args, 2, s.config.bodies);
        } else {
            start = time::now();
            end = start.plusDays(365.0);
            bodies = bodiesFrom(args, 0, s.config.bodies);
        }
        ctx.setStatus("searching " + time::formatUtcDate(start) + " to " + time::formatUtcDate(end));
        auto found = s.detector->search(bodies, start, end);
        ctx.deliver([found]() { printEvents(found); });

    } else if (cmd == "snapshot") {
        requireArgs(args, 2, cmd);
        auto at = time::parse(args[0], args[1]);
        auto positions = s.calculator->positions(s.config.bodies, at, frame);
        ctx.setStatus("sampling orbits");
        auto set = s.sampler->orbits(s.config.bodies, at, at.plusDays(365.0), s.config.orbit_sample_count, frame);
        auto found = s.detector->checkAt(s.config.bodies, at);
        ctx.deliver([positions, set, found, frame, at]() {
            std::cout << "Snapshot " << time::formatUtc(at) << "\n\n";
            printPositions(positions, frame);
            std::cout << "\nOrbits (next 365 days)\n";
            for (const auto& [name, path] : set) printOrbitSummary(*path);
            std::cout << "\nEvents\n";
            printEvents(found);
        });

    } else {
        throw std::invalid_argument("Unknown command '" + cmd + "'");
    }
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cl;
    if (!parseCommandLine(argc, argv, cl)) {
        printUsage();
        return 1;
    }

    Services services;
    try {
        if (!cl.config_file.empty()) services.config = config::loadConfig(cl.config_file);
        if (!cl.ephemeris_file.empty()) services.config.ephemeris_file = cl.ephemeris_file;
        if (!cl.frame.empty()) services.config.frame = ephemeris::frameFromName(cl.frame);
        if (cl.verbose) services.config.verbose = true;
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    const auto& cfg = services.config;
    try {
        services.store = ephemeris::EphemerisStore::load(cfg.ephemeris_file, cfg.ephemeris_margin_days, cfg.verbose);
    } catch (const EphemerisLoadError& e) {
        std::cerr << "CRITICAL ERROR loading ephemeris: " << e.what() << "\n";
        return 1;
    }

    events::EventDetectorOptions event_options;
    event_options.approximate_threshold_deg = cfg.approximate_threshold_deg;
    event_options.precise_threshold_deg = cfg.precise_threshold_deg;
    event_options.step_days = cfg.search_step_days;

    services.calculator = std::make_unique<ephemeris::PositionCalculator>(services.store, cfg.verbose);
    services.sampler = std::make_unique<orbits::OrbitSampler>(
        services.store, static_cast<std::size_t>(cfg.orbit_cache_capacity), cfg.verbose);
    services.extractor = std::make_unique<orbits::ElementExtractor>(services.store, cfg.verbose);
    services.detector = std::make_unique<events::EventDetector>(services.store, event_options, cfg.verbose);

    scheduler::NotificationChannel channel;
    bool finished = false;
    int exit_code = 0;

    auto listener = [&](const scheduler::JobNotification& n) {
        switch (n.status) {
            case scheduler::JobStatus::Started:
                if (cfg.verbose) std::cout << "[" << n.job_name << "] started\n";
                break;
            case scheduler::JobStatus::Progress:
                std::cout << "[" << n.job_name << "] " << n.message << "\n";
                break;
            case scheduler::JobStatus::Succeeded:
                finished = true;
                break;
            case scheduler::JobStatus::Failed:
                std::cerr << "Error: " << n.message << "\n";
                exit_code = 1;
                finished = true;
                break;
        }
    };

    scheduler::TaskScheduler tasks(channel, listener, cfg.verbose);
    auto submitted = tasks.submit(cl.command, [&services, &cl](scheduler::JobContext& ctx) {
        runCommand(services, cl, ctx);
    });
    if (submitted != scheduler::SubmitResult::Accepted) {
        std::cerr << "Error: scheduler busy\n";
        return 1;
    }

    while (!finished) {
        channel.waitAndRunPending(std::chrono::milliseconds(100));
    }
    tasks.waitIdle();
    channel.runPending();

    return exit_code;
}
