#include <tasksched/core/error.hpp>
#include <tasksched/core/types.hpp>

#include <tasksched/algo/algo.hpp>
#include <tasksched/io/io.hpp>

#include <cxxopts.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

namespace core = tasksched::core;
namespace algo = tasksched::algo;
namespace io = tasksched::io;

struct Config {
    std::string scenario_file;
    std::optional<std::size_t> capacity;  // overrides the scenario
    std::string value_function;           // empty = from scenario
    std::string time_advance;             // empty = from scenario
    std::size_t max_steps{100000};
    std::string output_file{"-"};
    std::string format{"json"};
    std::string report_file;
    bool metrics{false};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("tasksched", "Incremental capacity-constrained task scheduler");

    options.add_options()
        ("i,input", "Scenario file (JSON)", cxxopts::value<std::string>())
        ("c,capacity", "Override the scenario worker capacity", cxxopts::value<std::size_t>())
        ("value", "Value function: priority|priority_per_unit (default: from scenario)",
            cxxopts::value<std::string>())
        ("advance", "Time advance: unit|next_event (default: from scenario)", cxxopts::value<std::string>())
        ("max-steps", "Step limit (default: 100000)", cxxopts::value<std::size_t>()->default_value("100000"))
        ("o,output", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("r,report", "Write a JSON run report to this file ('-' for stdout)", cxxopts::value<std::string>())
        ("metrics", "Print metrics to stderr")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.scenario_file = result["input"].as<std::string>();
    if (result.count("capacity") != 0U) {
        config.capacity = result["capacity"].as<std::size_t>();
    }
    if (result.count("value") != 0U) {
        config.value_function = result["value"].as<std::string>();
    }
    if (result.count("advance") != 0U) {
        config.time_advance = result["advance"].as<std::string>();
    }
    config.max_steps = result["max-steps"].as<std::size_t>();
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    if (result.count("report") != 0U) {
        config.report_file = result["report"].as<std::string>();
    }
    config.metrics = result.count("metrics") != 0U;
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "json" && config.format != "text" && config.format != "null") {
        std::cerr << "Error: unknown format '" << config.format << "' (expected json, text or null)" << std::endl;
        std::exit(64);
    }

    return config;
}

void print_metrics(const io::RunMetrics& metrics) {
    std::cerr << "steps:               " << metrics.steps << "\n"
              << "makespan:            " << metrics.makespan << "\n"
              << "tasks started:       " << metrics.tasks_started << "\n"
              << "tasks completed:     " << metrics.tasks_completed << "\n"
              << "deadlines met:       " << metrics.deadlines_met << "\n"
              << "deadlines missed:    " << metrics.deadlines_missed << "\n"
              << "mutations applied:   " << metrics.mutations_applied << "\n"
              << "mutations rejected:  " << metrics.mutations_rejected << "\n"
              << "capacity violations: " << metrics.capacity_violations << "\n"
              << "average utilization: " << metrics.average_utilization << std::endl;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading scenario from: " << config.scenario_file << std::endl;
        }

        // 1. Load scenario and apply command-line overrides
        auto scenario = io::load_scenario(config.scenario_file);
        if (config.capacity) {
            scenario.config.capacity = *config.capacity;
        }
        if (!config.value_function.empty()) {
            scenario.config.value_function = io::parse_value_function(config.value_function);
        }
        if (!config.time_advance.empty()) {
            scenario.config.time_advance = io::parse_time_advance(config.time_advance);
        }

        // 2. Setup trace writer; metrics tee through a memory writer
        std::unique_ptr<core::TraceWriter> writer;
        std::ofstream outfile;
        std::ostream* out = &std::cout;

        if (config.format != "null" && config.output_file != "-") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            out = &outfile;
        }

        if (config.format == "null") {
            writer = std::make_unique<io::NullTraceWriter>();
        } else if (config.format == "text") {
            writer = std::make_unique<io::TextualTraceWriter>(*out, out == &std::cout);
        } else {
            writer = std::make_unique<io::JsonTraceWriter>(*out);
        }

        io::MemoryTraceWriter memory;
        io::TeeTraceWriter tee(*writer, memory);
        core::TraceWriter* active = config.metrics ? static_cast<core::TraceWriter*>(&tee) : writer.get();

        // 3. Create engine and command queue
        if (config.verbose) {
            std::cerr << "Capacity " << scenario.config.capacity << ", "
                      << scenario.tasks.size() << " tasks, "
                      << scenario.commands.size() << " commands" << std::endl;
        }
        algo::SchedulerEngine engine(scenario.config, scenario.tasks, active);
        auto queue = io::make_command_queue(scenario);

        // 4. Run
        algo::Driver driver(engine, &queue, algo::RunOptions{config.max_steps, true});
        auto summary = driver.run();

        // 5. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        if (!config.report_file.empty()) {
            if (config.report_file == "-") {
                io::write_report(engine, std::cout, &summary);
            } else {
                io::write_report(engine, std::filesystem::path{config.report_file}, &summary);
            }
        }

        if (config.metrics) {
            print_metrics(io::compute_metrics(memory.records()));
        }

        if (config.verbose) {
            std::cerr << "Run " << algo::to_string(summary.status) << " after " << summary.steps
                      << " steps at time " << core::time_to_units(engine.time()) << " ("
                      << summary.mutations_applied << " mutations applied, "
                      << summary.mutations_rejected << " rejected)" << std::endl;
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const core::SchedulerError& e) {
        std::cerr << "Scheduler error: " << e.what() << std::endl;
        return 2;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
