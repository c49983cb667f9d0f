/**
 * Debate delivery analyzer
 *
 * Runs the full batch pipeline over one recording and its diarization output and writes
 * the per-role delivery report plus JSON artifacts into the work directory.
 *
 * Usage:
 *   podium_analyze --audio debate.wav --diarization utterances.json --first Aff
 */

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "logging/logger.h"
#include "pipeline/delivery_pipeline.h"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Args {
    std::string audioPath;
    std::string diarizationPath;
    std::string workDir = ".";
    std::string configPath;
    std::string firstTeam;
    std::optional<std::string> team1;
    std::optional<std::string> team2;
    std::optional<int> workers;
    std::optional<int> topSpeakers;
    std::optional<int> segmentsPerSpeaker;
    std::optional<double> minMergedSec;
    std::optional<std::string> timeline;
    std::optional<std::string> logLevel;
    bool noClips = false;
};

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --audio <path>              Mono WAV at the configured rate (required)\n"
              << "  --diarization <path>        Diarization JSON (required)\n"
              << "  --first <team>              Team that speaks first (required)\n"
              << "  --team1 <label>             First team label (default: Aff)\n"
              << "  --team2 <label>             Second team label (default: Neg)\n"
              << "  --work-dir <dir>            Output directory (default: .)\n"
              << "  --config <path>             JSON config (default: podium.json if present)\n"
              << "  --workers <n>               Feature workers (default: 0 = all cores)\n"
              << "  --top-speakers <n>          Speakers to analyse (default: 4)\n"
              << "  --segments-per-speaker <n>  Segments per speaker (default: 2)\n"
              << "  --min-merged-sec <sec>      Minimum merged turn length (default: 60)\n"
              << "  --timeline <trimmed|original> Audio the diarization refers to\n"
              << "  --no-clips                  Do not write per-segment clips\n"
              << "  --log-level <level>         trace, debug, info, warn, error\n";
}

bool parseArgs(int argc, char** argv, Args& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--audio" && i + 1 < argc) {
            args.audioPath = argv[++i];
        } else if (arg == "--diarization" && i + 1 < argc) {
            args.diarizationPath = argv[++i];
        } else if (arg == "--first" && i + 1 < argc) {
            args.firstTeam = argv[++i];
        } else if (arg == "--team1" && i + 1 < argc) {
            args.team1 = argv[++i];
        } else if (arg == "--team2" && i + 1 < argc) {
            args.team2 = argv[++i];
        } else if (arg == "--work-dir" && i + 1 < argc) {
            args.workDir = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.configPath = argv[++i];
        } else if (arg == "--workers" && i + 1 < argc) {
            args.workers = std::stoi(argv[++i]);
        } else if (arg == "--top-speakers" && i + 1 < argc) {
            args.topSpeakers = std::stoi(argv[++i]);
        } else if (arg == "--segments-per-speaker" && i + 1 < argc) {
            args.segmentsPerSpeaker = std::stoi(argv[++i]);
        } else if (arg == "--min-merged-sec" && i + 1 < argc) {
            args.minMergedSec = std::stod(argv[++i]);
        } else if (arg == "--timeline" && i + 1 < argc) {
            args.timeline = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.logLevel = argv[++i];
        } else if (arg == "--no-clips") {
            args.noClips = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }

    if (args.audioPath.empty() || args.diarizationPath.empty() || args.firstTeam.empty()) {
        std::cerr << "Error: --audio, --diarization, and --first are required\n";
        return false;
    }
    return true;
}

std::string trimmed(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

}  // namespace

int main(int argc, char** argv) {
    using podium::ErrorCode;

    podium::logging::initializeEarly();

    Args args;
    bool parsed = false;
    try {
        parsed = parseArgs(argc, argv, args);
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
    }
    if (!parsed) {
        printUsage(argv[0]);
        return podium::toExitCode(ErrorCode::VALIDATION_INVALID_ARGUMENT);
    }

    // Config file: explicit path, or podium.json in the working directory when present
    std::string configPath = args.configPath;
    std::error_code ec;
    if (configPath.empty() && std::filesystem::exists(podium::DEFAULT_CONFIG_FILE, ec)) {
        configPath = podium::DEFAULT_CONFIG_FILE;
    }

    podium::AnalysisConfig config;
    if (!configPath.empty()) {
        podium::logging::initializeFromConfig(configPath);
        if (!podium::loadAnalysisConfig(configPath, config) && !args.configPath.empty()) {
            LOG_ERROR("Config: cannot use {}", configPath);
            return podium::toExitCode(ErrorCode::VALIDATION_INVALID_CONFIG);
        }
    }
    if (args.logLevel) {
        podium::logging::setLevel(podium::logging::stringToLevel(*args.logLevel));
    }

    // Command line overrides
    if (args.team1) {
        config.roles.team1 = trimmed(*args.team1).empty() ? "Aff" : trimmed(*args.team1);
    }
    if (args.team2) {
        config.roles.team2 = trimmed(*args.team2).empty() ? "Neg" : trimmed(*args.team2);
    }
    config.roles.firstTeam = trimmed(args.firstTeam);
    if (args.workers) {
        config.pipeline.workers = *args.workers;
    }
    if (args.topSpeakers) {
        config.segmentation.topSpeakers = *args.topSpeakers;
    }
    if (args.segmentsPerSpeaker) {
        config.segmentation.segmentsPerSpeaker = *args.segmentsPerSpeaker;
    }
    if (args.minMergedSec) {
        config.segmentation.minMergedSec = *args.minMergedSec;
    }
    if (args.timeline) {
        config.pipeline.timeline = podium::parseDiarizationTimeline(*args.timeline);
    }
    if (args.noClips) {
        config.pipeline.writeClips = false;
    }

    std::string error;
    if (!podium::validateAnalysisConfig(config, error)) {
        const bool teamError = error.find("team") != std::string::npos;
        LOG_ERROR("Invalid options: {}", error);
        return podium::toExitCode(teamError ? ErrorCode::VALIDATION_INVALID_TEAM
                                            : ErrorCode::VALIDATION_INVALID_ARGUMENT);
    }

    podium::PipelineRequest request;
    request.audioPath = args.audioPath;
    request.diarizationPath = args.diarizationPath;
    request.workDir = args.workDir;
    request.program = "podium_analyze";
    request.arguments.assign(argv + 1, argv + argc);

    podium::DeliveryPipeline pipeline(config);
    podium::PipelineOutcome outcome = pipeline.run(request);

    if (!outcome.reportText.empty()) {
        std::cout << outcome.reportText;
        if (outcome.reportText.back() != '\n') {
            std::cout << '\n';
        }
    }
    if (!outcome.ok() && !outcome.insufficientData()) {
        std::cerr << "Error: " << podium::errorCodeToString(outcome.code) << ": "
                  << outcome.message << "\n";
    }

    podium::logging::shutdown();
    return podium::toExitCode(outcome.code);
}
