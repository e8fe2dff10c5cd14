#include "./include/flatprof.hpp"
#include "./include/parallel_flatprof.hpp"
#include <boost/program_options.hpp>
#include <iostream>
#include <stdexcept>

namespace po = boost::program_options;
using namespace flatprof;

namespace {
const char* const summary = "-t <trace> [options]";
const char* const description =
    "Summarize folded callstack samples into a flat profile.\n"
    "With --second-trace, combine two traces of the same run (instructions + cycles)\n"
    "into one table with per-symbol IPC and CPI.\n\n";

template <typename T>
std::optional<T> optional_arg(const po::variables_map& opts, const char* name) {
    if (opts.count(name)) return opts[name].as<T>();
    return std::nullopt;
}
} // namespace

int main(int argc, char* argv[]) {
    po::options_description normal("Options");
    normal.add_options()
        ("help,h", "Print this help message.")
        ("trace,t", po::value<std::string>()->value_name("<path>"),
            "Folded callstack trace path (required).")
        ("event,e", po::value<std::string>()->value_name("<label>")->default_value("inst"),
            "Label only (e.g. inst/cycle/branch). Affects titles, not parsing.")
        ("top,p", po::value<long long>()->value_name("<n>"),
            "Keep only top N rows by self count.")
        ("thr", po::value<double>()->value_name("<percent>"),
            "Keep only rows with self% >= thr (e.g. 1.0).")
        ("clk-mhz", po::value<double>()->value_name("<mhz>"),
            "Compute time assuming counts are cycles at this clock (MHz).")
        ("csv", po::value<std::string>()->value_name("<path>"),
            "Write the flat summary as CSV to this path.")
        ("plot", po::bool_switch(),
            "Save a bar chart of self% per symbol.")
        ("chart", po::value<std::string>()->value_name("<path>"),
            "Chart output path, .svg or .html (used only with --plot). Default: alongside trace.")
        ("png", po::value<std::string>()->value_name("<path>"),
            "Same as --chart.")
        ("chart-colors", po::value<std::string>()->value_name("<scheme>")->default_value("mint"),
            "Chart color scheme (mint, hot).")
        ("second-trace,s", po::value<std::string>()->value_name("<path>"),
            "Optional second trace to combine (typically cycles).")
        ("second-clk-mhz", po::value<double>()->value_name("<mhz>"),
            "Clock (MHz) for the second trace.")
        ("thr-cycle", po::value<double>()->value_name("<percent>"),
            "When combining, keep only rows with cycle% >= thr.")
        ("parallel,j", po::bool_switch(),
            "Accumulate large traces with multiple threads.")
    ;

    FlatProfileConfig config;
    bool parallel = false;
    try {
        po::variables_map opts;
        po::store(po::command_line_parser(argc, argv).options(normal).run(), opts);
        po::notify(opts);

        if (opts.count("help")) {
            std::filesystem::path arg0(argv[0]);
            std::cout << "Usage: " << arg0.filename().string() << " " << summary << "\n"
                      << description << normal;
            return 0;
        }
        if (! opts.count("trace")) {
            throw std::invalid_argument("--trace is required (see --help)");
        }

        config.trace = opts["trace"].as<std::string>();
        config.event = opts["event"].as<std::string>();
        config.top = optional_arg<long long>(opts, "top");
        config.min_percent = optional_arg<double>(opts, "thr");
        config.clk_mhz = optional_arg<double>(opts, "clk-mhz");
        config.csv_path = optional_arg<std::string>(opts, "csv").value_or("");
        config.plot = opts["plot"].as<bool>();
        if (opts.count("chart") && opts.count("png")) {
            throw std::invalid_argument("--chart and --png cannot both be specified");
        }
        config.chart_path = optional_arg<std::string>(opts, "chart")
                                .value_or(optional_arg<std::string>(opts, "png").value_or(""));
        config.chart.colors = opts["chart-colors"].as<std::string>();
        config.second_trace = optional_arg<std::string>(opts, "second-trace").value_or("");
        config.second_clk_mhz = optional_arg<double>(opts, "second-clk-mhz");
        config.min_secondary_percent = optional_arg<double>(opts, "thr-cycle");
        parallel = opts["parallel"].as<bool>();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        FlatProfileGenerator generator(config);
        if (parallel) {
            generator.set_accumulator(std::make_unique<ParallelFoldedTraceAccumulator>());
        }
        generator.run(std::cout);
    } catch (const FileNotFoundException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
