#include <eonsim/algo/algo.hpp>
#include <eonsim/core/core.hpp>
#include <eonsim/io/io.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace {

namespace fs = std::filesystem;
namespace core = eonsim::core;
namespace algo = eonsim::algo;
namespace io = eonsim::io;

constexpr int EXIT_USAGE = 64;

struct AppConfig {
    std::optional<fs::path> topology_file;   // built-in NSFNET when unset
    std::optional<fs::path> demands_file;
    std::optional<fs::path> config_file;
    std::optional<fs::path> output_file;
    std::optional<fs::path> trace_file;
    std::size_t num_demands{100};
    uint32_t seed{0};
    std::string algorithm{"adaptive"};
    bool experiment{false};
    std::vector<std::size_t> loads{50, 100, 150, 200};
    std::size_t runs{5};
};

AppConfig parse_args(int argc, char** argv) {
    cxxopts::Options options("eonsim", "Routing and spectrum assignment for elastic optical networks");

    // clang-format off
    options.add_options()
        ("t,topology", "Topology JSON file (default: built-in NSFNET)", cxxopts::value<std::string>())
        ("d,demands", "Demand JSON file (default: generate --num-demands)", cxxopts::value<std::string>())
        ("n,num-demands", "Number of generated demands", cxxopts::value<std::size_t>()->default_value("100"))
        ("seed", "Seed of the demand generator", cxxopts::value<uint32_t>()->default_value("0"))
        ("a,algorithm", "Allocator: spff, ksp-mw, adaptive, or compare",
            cxxopts::value<std::string>()->default_value("adaptive"))
        ("c,config", "Configuration JSON file", cxxopts::value<std::string>())
        ("o,output", "Write the result JSON to this file", cxxopts::value<std::string>())
        ("trace", "Write the allocation trace JSON to this file", cxxopts::value<std::string>())
        ("experiment", "Run the load sweep comparing spff and adaptive")
        ("loads", "Demand loads of the sweep", cxxopts::value<std::vector<std::size_t>>()->default_value("50,100,150,200"))
        ("runs", "Seeds per load in the sweep", cxxopts::value<std::size_t>()->default_value("5"))
        ("algorithms", "List the available allocators")
        ("v,version", "Show the version")
        ("h,help", "Show help");
    // clang-format on

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(EXIT_SUCCESS);
    }
    if (result.count("version") != 0U) {
        std::cout << "eonsim " << EONSIM_VERSION << std::endl;
        std::exit(EXIT_SUCCESS);
    }
    if (result.count("algorithms") != 0U) {
        std::cout << "Available allocators:\n";
        for (auto name : algo::allocator_names()) {
            std::cout << '\t' << name << '\n';
        }
        std::cout << "\tcompare (spff vs adaptive)" << std::endl;
        std::exit(EXIT_SUCCESS);
    }

    AppConfig config;
    if (result.count("topology") != 0U) {
        config.topology_file = result["topology"].as<std::string>();
    }
    if (result.count("demands") != 0U) {
        config.demands_file = result["demands"].as<std::string>();
    }
    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
    }
    if (result.count("output") != 0U) {
        config.output_file = result["output"].as<std::string>();
    }
    if (result.count("trace") != 0U) {
        config.trace_file = result["trace"].as<std::string>();
    }
    config.num_demands = result["num-demands"].as<std::size_t>();
    config.seed = result["seed"].as<uint32_t>();
    config.algorithm = result["algorithm"].as<std::string>();
    config.experiment = result.count("experiment") != 0U;
    config.loads = result["loads"].as<std::vector<std::size_t>>();
    config.runs = result["runs"].as<std::size_t>();

    if (config.experiment && (config.demands_file || config.trace_file)) {
        std::cerr << "Error: --experiment generates its own demands and cannot be traced"
                  << std::endl;
        std::exit(EXIT_USAGE);
    }
    if (config.algorithm == "compare" && config.trace_file) {
        std::cerr << "Error: --trace needs a single allocator" << std::endl;
        std::exit(EXIT_USAGE);
    }

    return config;
}

std::ofstream open_output(const fs::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw io::LoaderError("cannot open file for writing", path.string());
    }
    return file;
}

int run_experiment(const AppConfig& app, const core::Topology& topology,
                   const core::EonConfig& config) {
    io::ExperimentParams params;
    params.loads = app.loads;
    params.runs = app.runs;

    auto result = io::run_experiment(topology, config, params,
                                     [&params](std::size_t load, std::size_t run) {
                                         std::cerr << "load " << load << ": run " << run + 1
                                                   << "/" << params.runs << "\n";
                                     });

    io::print_experiment_summary(result, std::cout);
    if (app.output_file) {
        auto file = open_output(*app.output_file);
        io::write_experiment_json(result, file);
    }
    return EXIT_SUCCESS;
}

int run_single(const AppConfig& app, const core::Topology& topology,
               const core::EonConfig& config) {
    std::vector<core::Demand> demands;
    if (app.demands_file) {
        demands = io::load_demands(*app.demands_file);
    } else {
        io::DemandGenerationParams generation;
        generation.count = app.num_demands;
        demands = io::generate_demands(topology.node_count(), generation, app.seed);
    }
    io::validate_demands(demands, topology);

    if (app.algorithm == "compare") {
        auto comparison = algo::compare_algorithms(topology, demands, config);
        io::print_comparison_summary(comparison, std::cout);
        if (app.output_file) {
            auto file = open_output(*app.output_file);
            io::write_comparison_json(comparison, file);
        }
        return EXIT_SUCCESS;
    }

    std::ofstream trace_file;
    std::unique_ptr<io::JsonTraceWriter> trace;
    if (app.trace_file) {
        trace_file = open_output(*app.trace_file);
        trace = std::make_unique<io::JsonTraceWriter>(trace_file);
    }

    auto result = algo::run_batch(app.algorithm, topology, demands, config, trace.get());
    if (trace) {
        trace->finalize();
    }

    io::print_batch_summary(result, std::cout);
    if (app.output_file) {
        auto file = open_output(*app.output_file);
        io::write_batch_result_json(result, file);
    }
    return EXIT_SUCCESS;
}

} // anonymous namespace

int main(int argc, char** argv) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif

    try {
        auto app = parse_args(argc, argv);

        auto topology = app.topology_file ? io::load_topology(*app.topology_file)
                                          : io::nsfnet_topology();
        auto config = app.config_file ? io::load_config(*app.config_file) : core::default_config();
        core::validate(config);

        return app.experiment ? run_experiment(app, topology, config)
                              : run_single(app, topology, config);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const io::LoaderError& e) {
        std::cerr << "Input error: " << e.what() << std::endl;
    } catch (const core::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return EXIT_FAILURE;
}
