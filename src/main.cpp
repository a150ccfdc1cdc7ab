#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "audio/AudioDecoder.h"
#include "audio/LiveAudioRedactor.h"
#include "audio/WavWriter.h"
#include "audio/WhisperTranscriber.h"
#include "audit/AuditSink.h"
#include "audit/SqliteAuditSink.h"
#include "core/ConfigManager.h"
#include "core/LLMClient.h"
#include "generator/ToolGenerator.h"
#include "pipeline/Executor.h"
#include "planner/Planner.h"
#include "tools/BuiltinTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"
#include "video/FrameIO.h"
#include "video/LiveVideoPipeline.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string GREEN = "\033[38;5;46m";
const std::string RED = "\033[38;5;196m";
const std::string GRAY = "\033[38;5;242m";
const std::string CYAN = "\033[38;5;51m";

namespace {

CancellationToken* g_cancel = nullptr;

void onInterrupt(int) {
    if (g_cancel) g_cancel->cancel();
}

void printUsage() {
    std::cout << BOLD << "wordshield" << RESET << " - privacy requests in plain words\n\n"
              << "  wordshield run <input> \"<request>\" [config.json]\n"
              << "  wordshield live-video <source> <output.mp4> [config.json]\n"
              << "  wordshield live-audio <input> \"<phrase>[,<phrase>...]\" <output.wav> [config.json]\n"
              << GRAY << "\n  <source> may be a file or a camera index such as 0.\n" << RESET;
}

// Explicit argument, then ./config.json, then ../config.json; defaults otherwise.
Config loadConfig(const std::string& explicitPath) {
    if (!explicitPath.empty()) return Config::load(explicitPath);
    for (const char* candidate : {"config.json", "../config.json"}) {
        if (fs::exists(candidate)) return Config::load(candidate);
    }
    Logger::getInstance().warn("No config.json found, using defaults");
    return Config::fromJson(nlohmann::json::object());
}

std::unique_ptr<AuditSink> makeAuditSink(const Config::Audit& cfg) {
    if (cfg.sink == "sqlite") return std::make_unique<SqliteAuditSink>(cfg.path);
    return std::make_unique<JsonlAuditSink>(cfg.path);
}

std::vector<std::string> splitPhrases(const std::string& list) {
    std::vector<std::string> phrases;
    std::stringstream in(list);
    std::string item;
    while (std::getline(in, item, ',')) {
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b != std::string::npos) phrases.push_back(item.substr(b, e - b + 1));
    }
    return phrases;
}

int runJob(const Config& config, const std::string& input, const std::string& request) {
    auto llm = std::make_shared<LLMClient>(config.llm);
    std::unique_ptr<AuditSink> audit = makeAuditSink(config.audit);

    ToolServices services;
    services.config = config;
    services.llm = llm;
    services.detectorFactory = [video = config.video] { return makeFaceDetector(video); };
    services.transcriber = std::make_shared<WhisperTranscriber>(config.audio);

    ToolRegistry registry;
    registerBuiltinTools(registry, services);
    ToolGenerator generator(llm, registry, config.pipeline, audit.get());
    generator.loadGeneratedTools();
    Planner planner(llm, registry, generator, audit.get());
    Executor executor(planner, registry, *audit, ExecutorOptions::fromConfig(config.pipeline));

    auto cancel = std::make_shared<CancellationToken>();
    g_cancel = cancel.get();
    JobResult result = executor.run(request, input, cancel);
    g_cancel = nullptr;

    std::cout << result.toJson().dump(2) << std::endl;
    if (result.success) {
        std::cout << GREEN << "✔ " << result.outputPath << RESET << std::endl;
        return 0;
    }
    std::cout << RED << "✘ " << result.failure->stage << ": " << categoryName(result.failure->category) << " - "
              << result.failure->message << RESET << std::endl;
    return 1;
}

int runLiveVideo(const Config& config, const std::string& source, const std::string& output) {
    std::unique_ptr<IFaceDetector> detector = makeFaceDetector(config.video);
    VideoFileSource in(source);
    VideoFileSink out(output, in.fps(), in.frameSize());

    BlurParams blur;
    blur.kernel = config.video.blurKernel;
    blur.scale = config.video.blurScale;
    LiveVideoPipeline pipeline(*detector, TrackingParams::fromConfig(config.video), blur,
                               static_cast<size_t>(config.video.liveQueueDepth), config.audio.playbackDelaySec);

    CancellationToken cancel;
    g_cancel = &cancel;
    LiveVideoStats stats = pipeline.run(in, out, &cancel);
    g_cancel = nullptr;

    std::cout << CYAN << stats.framesReleased << "/" << stats.framesRead << " frames released, "
              << stats.regionsBlurred << " regions blurred" << RESET << std::endl;
    return 0;
}

int runLiveAudio(const Config& config, const std::string& input, const std::string& phraseList,
                 const std::string& output) {
    std::vector<std::string> phrases = splitPhrases(phraseList);
    if (phrases.empty()) {
        std::cerr << "No phrases given" << std::endl;
        return 2;
    }

    AudioBuffer audio = AudioDecoder::convert(AudioDecoder::decodeFile(input), 16000, 1);
    WhisperTranscriber whisper(config.audio);
    LiveAudioParams params = LiveAudioParams::fromConfig(config.audio);
    WindowedStreamingTranscriber streaming(whisper, config.audio.streamWindowSec, config.audio.streamStepSec,
                                           config.audio.streamMarginSec);
    params.pace = true;
    LiveAudioRedactor redactor(streaming, phrases, params);

    CancellationToken cancel;
    g_cancel = &cancel;
    LiveAudioStats stats;
    AudioBuffer released = redactor.run(audio, &stats, &cancel);
    g_cancel = nullptr;

    WavWriter::write(output, released);
    std::cout << CYAN << stats.chunks << " chunks, " << stats.chunksRedacted << " redacted, "
              << stats.chunksFailClosed << " released silent" << RESET << std::endl;
    return 0;
}

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 2;
    }
    const std::string command = argv[1];
    std::signal(SIGINT, onInterrupt);

    try {
        if (command == "run" && argc >= 4) {
            Config config = loadConfig(argc >= 5 ? argv[4] : "");
            Logger::getInstance().setLogFile(config.logFile);
            return runJob(config, argv[2], argv[3]);
        }
        if (command == "live-video" && argc >= 4) {
            Config config = loadConfig(argc >= 5 ? argv[4] : "");
            Logger::getInstance().setLogFile(config.logFile);
            return runLiveVideo(config, argv[2], argv[3]);
        }
        if (command == "live-audio" && argc >= 5) {
            Config config = loadConfig(argc >= 6 ? argv[5] : "");
            Logger::getInstance().setLogFile(config.logFile);
            return runLiveAudio(config, argv[2], argv[3], argv[4]);
        }
        printUsage();
        return 2;
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Fatal: ") + e.what());
        return 1;
    }
}
