/**
 * Standalone silence trimmer
 *
 * Same trimming stage the analyzer runs before segmentation, for checking thresholds
 * on a recording by ear.
 *
 * Usage:
 *   podium_trim in.wav out.wav [--mode adaptive|absolute] [--rel-drop-db 35]
 */

#include "audio/audio_io.h"
#include "audio/silence_trimmer.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <iomanip>
#include <iostream>
#include <string>

namespace {

struct Args {
    std::string inputPath;
    std::string outputPath;
    podium::AnalysisConfig::TrimmerConfig trimmer;
    int sampleRate = 0;  // 0 = accept the file's rate
    bool verbose = false;
};

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <input.wav> <output.wav> [options]\n"
              << "Options:\n"
              << "  --mode <adaptive|absolute> Threshold mode (default: adaptive)\n"
              << "  --rel-drop-db <dB>         Adaptive: dB below the 95th percentile (default: 35)\n"
              << "  --floor-db <dBFS>          Absolute: speech floor (default: -35)\n"
              << "  --min-pause <sec>          Bridge pauses shorter than this (default: 0.20)\n"
              << "  --min-speech <sec>         Drop speech shorter than this (default: 0.05)\n"
              << "  --frame-ms <ms>            RMS frame length (default: 25)\n"
              << "  --hop-ms <ms>              RMS hop (default: 10)\n"
              << "  --sample-rate <Hz>         Require this input rate (default: any)\n"
              << "  --verbose                  Debug logging\n";
}

bool parseArgs(int argc, char** argv, Args& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--mode" && i + 1 < argc) {
            args.trimmer.mode = podium::parseThresholdMode(argv[++i]);
        } else if (arg == "--rel-drop-db" && i + 1 < argc) {
            args.trimmer.relativeDropDb = std::stof(argv[++i]);
        } else if (arg == "--floor-db" && i + 1 < argc) {
            args.trimmer.absoluteFloorDb = std::stof(argv[++i]);
        } else if (arg == "--min-pause" && i + 1 < argc) {
            args.trimmer.minPauseSec = std::stof(argv[++i]);
        } else if (arg == "--min-speech" && i + 1 < argc) {
            args.trimmer.minSpeechSec = std::stof(argv[++i]);
        } else if (arg == "--frame-ms" && i + 1 < argc) {
            args.trimmer.frameMs = std::stof(argv[++i]);
        } else if (arg == "--hop-ms" && i + 1 < argc) {
            args.trimmer.hopMs = std::stof(argv[++i]);
        } else if (arg == "--sample-rate" && i + 1 < argc) {
            args.sampleRate = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg[0] != '-' && args.inputPath.empty()) {
            args.inputPath = arg;
        } else if (!arg.empty() && arg[0] != '-' && args.outputPath.empty()) {
            args.outputPath = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }

    if (args.inputPath.empty() || args.outputPath.empty()) {
        std::cerr << "Error: input and output paths are required\n";
        return false;
    }
    if (args.trimmer.frameMs <= 0.0f || args.trimmer.hopMs <= 0.0f) {
        std::cerr << "Error: --frame-ms and --hop-ms must be positive\n";
        return false;
    }
    return true;
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
    if (args.verbose) {
        podium::logging::setLevel(podium::logging::LogLevel::Debug);
    }

    podium::audio::Waveform input;
    std::string error;
    ErrorCode code = podium::audio::loadMono(args.inputPath, args.sampleRate, input, error);
    if (code != ErrorCode::OK) {
        std::cerr << "Error: " << error << "\n";
        return podium::toExitCode(code);
    }

    podium::audio::SilenceTrimmer trimmer(args.trimmer);
    podium::audio::TrimResult result = trimmer.trim(input);

    if (!podium::audio::writeMono(args.outputPath, result.audio)) {
        std::cerr << "Error: failed to write " << args.outputPath << "\n";
        return podium::toExitCode(ErrorCode::OUTPUT_WRITE_FAILED);
    }

    std::cout << std::fixed << std::setprecision(2) << "Trimmed " << args.inputPath << " ("
              << input.durationSec() << " s) -> " << args.outputPath << " ("
              << result.audio.durationSec() << " s)"
              << (result.unchanged ? ", unchanged" : "") << "\n";

    podium::logging::shutdown();
    return 0;
}
