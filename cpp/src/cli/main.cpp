// =============================================================================
// fedrelay CLI - Federated Aggregation Command-Line Interface
// =============================================================================
//
// Usage:
//   fedrelay [global options] <command> [options]
//
// Commands:
//   submit      Merge a local weight file into the model's global state
//   privatize   Write a differentially private copy of a weight file
//   cost        Estimate the composed privacy cost over several rounds
//   config      Show the effective configuration
//   version     Show version information
//
// Examples:
//   fedrelay submit -m "digit classifier" -r 3 -u alice localWeights.bin
//   fedrelay submit -m digits -r 3 -u alice --privacy --epsilon 0.5 localWeights.bin
//   fedrelay privatize --epsilon 1.0 -o dp_weights.bin localWeights.bin
//   fedrelay cost --epsilon 1.0 --delta 1e-5 --iterations 100 --sample-rate 0.01
//
// =============================================================================

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "fedrelay/codec.hpp"
#include "fedrelay/config.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/logging.hpp"
#include "fedrelay/noise_calibrator.hpp"
#include "fedrelay/persistence_coordinator.hpp"
#include "fedrelay/store/store_factory.hpp"
#include "fedrelay/submission.hpp"

namespace fedrelay::cli {
    int cmd_submit(int argc, char* argv[]);
    int cmd_privatize(int argc, char* argv[]);
    int cmd_cost(int argc, char* argv[]);
    int cmd_config(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define FEDRELAY_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"submit",    "Merge a local weight file into the global model", fedrelay::cli::cmd_submit},
    {"privatize", "Write a differentially private copy of a weight file", fedrelay::cli::cmd_privatize},
    {"cost",      "Estimate composed privacy cost (heuristic)", fedrelay::cli::cmd_cost},
    {"config",    "Show the effective configuration", fedrelay::cli::cmd_config},
    {"version",   "Show version information", fedrelay::cli::cmd_version},
    {"help",      "Show this help message", fedrelay::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "fedrelay.yaml";
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

static fedrelay::Config load_effective_config() {
    fedrelay::Config config = fedrelay::load_config(g_options.config_file);
    if (g_options.verbose) {
        config.logging.level = "debug";
    } else if (g_options.quiet) {
        config.logging.level = "warn";
    }
    fedrelay::apply_logging(config.logging);
    return config;
}

// Privacy flags shared by submit, privatize and cost. Returns false on a
// malformed value; `consumed` is set when argv[i] was a privacy flag.
static bool parse_privacy_flag(int argc, char* argv[], int& i, fedrelay::PrivacyParameters& params,
                               bool& consumed) {
    consumed = false;
    const std::string arg = argv[i];
    double* target = nullptr;
    if (arg == "--epsilon") target = &params.epsilon;
    else if (arg == "--delta") target = &params.delta;
    else if (arg == "--clip") target = &params.l2_norm_clip;
    else if (arg == "--sample-rate") target = &params.sample_rate;
    else return true;

    if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << "\n";
        return false;
    }
    try {
        *target = std::stod(argv[++i]);
    } catch (const std::exception&) {
        std::cerr << "Invalid value for " << arg << ": " << argv[i] << "\n";
        return false;
    }
    consumed = true;
    return true;
}

// =============================================================================
// Help Command
// =============================================================================

namespace fedrelay::cli {

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "FedRelay - Asynchronous Federated Aggregation\n";
    std::cout << "Version " << FEDRELAY_VERSION_STRING << "\n\n";
    std::cout << "Usage: fedrelay [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Configuration file (default: fedrelay.yaml)\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Warnings and errors only\n";
    std::cout << "\nPrivacy Options (submit, privatize, cost):\n";
    std::cout << "  --epsilon <e>           Privacy budget (> 0)\n";
    std::cout << "  --delta <d>             Failure probability, in (0,1)\n";
    std::cout << "  --clip <c>              L2 norm clipping threshold (> 0)\n";
    std::cout << "  --sample-rate <q>       Sampling rate, in (0,1]\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  FEDRELAY_*              Override configuration values (see fedrelay.yaml)\n";
    std::cout << "\nExamples:\n";
    std::cout << "  fedrelay submit -m digits -r 1 -u alice localWeights.bin\n";
    std::cout << "  fedrelay privatize -o dp_weights.bin localWeights.bin\n";
    std::cout << "  fedrelay cost --iterations 100\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "FedRelay " << FEDRELAY_VERSION_STRING << "\n";
    std::cout << "Wire format: little-endian float32, " << codec::kBytesPerWeight << " bytes/weight\n";
    std::cout << "Aggregation: asynchronous FedAvg (equal weight per update)\n";
    std::cout << "Noise: Gaussian mechanism, Box-Muller over OpenSSL RAND_bytes\n";
    return 0;
}

// =============================================================================
// Config Command
// =============================================================================

int cmd_config([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    Config config = load_effective_config();
    std::cout << config_summary(config);
    return 0;
}

// =============================================================================
// Submit Command
// =============================================================================

int cmd_submit(int argc, char* argv[]) {
    std::string model_id;
    std::string contributor_id;
    std::string weights_path;
    int64_t round = 0;
    bool use_privacy = false;

    Config config = load_effective_config();
    PrivacyParameters privacy = config.privacy;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        bool consumed = false;
        if (!parse_privacy_flag(argc, argv, i, privacy, consumed)) {
            return 1;
        }
        if (consumed) {
            use_privacy = true;
            continue;
        }
        if ((arg == "-m" || arg == "--model") && i + 1 < argc) {
            model_id = argv[++i];
        } else if ((arg == "-r" || arg == "--round") && i + 1 < argc) {
            try {
                round = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid round: " << argv[i] << "\n";
                return 1;
            }
        } else if ((arg == "-u" || arg == "--contributor") && i + 1 < argc) {
            contributor_id = argv[++i];
        } else if (arg == "--privacy") {
            use_privacy = true;
        } else if (arg[0] != '-' && weights_path.empty()) {
            weights_path = arg;
        }
    }

    if (model_id.empty() || contributor_id.empty() || round < 1 || weights_path.empty()) {
        std::cerr << "Usage: fedrelay submit -m <model> -r <round> -u <contributor> [--privacy] <weights_file>\n";
        std::cerr << "Options:\n";
        std::cerr << "  -m, --model <name>         Model name\n";
        std::cerr << "  -r, --round <n>            Aggregation round (>= 1)\n";
        std::cerr << "  -u, --contributor <id>     Contributor identifier\n";
        std::cerr << "  --privacy                  Apply differential privacy with configured defaults\n";
        return 1;
    }

    auto store = store::make_store(config.storage);

    CoordinatorOptions options;
    options.learning_rate = config.aggregation.learning_rate;
    options.retry = RetryPolicy::linear_backoff(config.aggregation.max_retries,
                                                Millis(config.aggregation.retry_base_delay_ms));
    options.persist_deadline = Millis(config.aggregation.persist_deadline_ms);

    std::shared_ptr<HistorySink> history;
    std::shared_ptr<BackupWriter> backups;
    if (config.history.enabled) {
        history = std::make_shared<FileHistorySink>(config.history.dir);
    }
    if (config.history.backup_enabled) {
        backups = std::make_shared<BackupWriter>(config.history.dir,
                                                 static_cast<size_t>(config.history.max_backups));
    }

    auto coordinator = std::make_shared<PersistenceCoordinator>(
        store, options, AggregationEngine(config.aggregation.baseline_mismatch), history, backups);
    SubmissionService service(coordinator);

    const WeightVector weights = codec::read_weights_file(weights_path);
    const Bytes bytes = codec::encode_weights(weights);

    std::optional<PrivacyParameters> requested;
    if (use_privacy) {
        requested = privacy;
    }

    SubmitResult result = service.submit_update(model_id, round, contributor_id, bytes, requested);
    std::cout << "Global model updated: " << result.location << "\n";
    return 0;
}

// =============================================================================
// Privatize Command
// =============================================================================

int cmd_privatize(int argc, char* argv[]) {
    std::string input_path;
    std::string output_path = "dp_weights.bin";

    Config config = load_effective_config();
    PrivacyParameters privacy = config.privacy;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        bool consumed = false;
        if (!parse_privacy_flag(argc, argv, i, privacy, consumed)) {
            return 1;
        }
        if (consumed) continue;
        if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg[0] != '-' && input_path.empty()) {
            input_path = arg;
        }
    }

    if (input_path.empty()) {
        std::cerr << "Usage: fedrelay privatize [options] <weights_file>\n";
        std::cerr << "Options:\n";
        std::cerr << "  -o, --output <file>     Output file (default: dp_weights.bin)\n";
        return 1;
    }

    const WeightVector weights = codec::read_weights_file(input_path);
    NoiseCalibrator calibrator;
    const double norm_before = NoiseCalibrator::l2_norm(weights);
    const WeightVector noisy = calibrator.apply_privacy(weights, privacy);
    codec::write_weights_file(output_path, noisy);

    const double stddev = NoiseCalibrator::noise_scale(
        privacy.epsilon, privacy.delta, NoiseCalibrator::sensitivity(privacy.l2_norm_clip));
    std::cout << "Weights:      " << weights.size() << "\n";
    std::cout << "L2 norm:      " << norm_before << (norm_before > privacy.l2_norm_clip ? " (clipped)" : "") << "\n";
    std::cout << "Noise stddev: " << stddev << "\n";
    std::cout << "Written to:   " << output_path << "\n";
    return 0;
}

// =============================================================================
// Cost Command
// =============================================================================

int cmd_cost(int argc, char* argv[]) {
    Config config = load_effective_config();
    PrivacyParameters privacy = config.privacy;
    int64_t iterations = 1;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        bool consumed = false;
        if (!parse_privacy_flag(argc, argv, i, privacy, consumed)) {
            return 1;
        }
        if (consumed) continue;
        if ((arg == "-n" || arg == "--iterations") && i + 1 < argc) {
            try {
                iterations = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid iteration count: " << argv[i] << "\n";
                return 1;
            }
        }
    }

    PrivacyCost cost = NoiseCalibrator::estimate_privacy_cost(
        privacy.epsilon, privacy.delta, iterations, privacy.sample_rate);
    std::cout << "Iterations:  " << iterations << "\n";
    std::cout << "Epsilon:     " << cost.epsilon << "\n";
    std::cout << "Delta:       " << cost.delta << "\n";
    std::cout << "Note: heuristic estimate, not a tight privacy accounting bound.\n";
    return 0;
}

}  // namespace fedrelay::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    if (const char* path = std::getenv("FEDRELAY_CONFIG")) {
        g_options.config_file = path;
    }

    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        fedrelay::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const fedrelay::StorageWriteError& e) {
                LOG_ERROR("{}: {}", fedrelay::error_code_name(e.code()), e.what());
                std::cerr << "Global model was not updated after " << e.attempts()
                          << " attempts; retry the submission later.\n";
                return 2;
            } catch (const fedrelay::FedRelayException& e) {
                LOG_ERROR("{}: {}", fedrelay::error_code_name(e.code()), e.what());
                return 1;
            } catch (const std::exception& e) {
                LOG_CRITICAL("Unexpected error: {}", e.what());
                return 1;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'fedrelay help' for usage.\n";
    return 1;
}
