#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    struct LLM {
        std::string apiKey;
        std::string baseUrl = "https://api.openai.com/v1";
        std::string model = "gpt-4o-mini";
        double temperature = 0.1;
        int connectTimeoutSec = 10;
        int readTimeoutSec = 60;
        int maxRetries = 3;
    } llm;

    struct Pipeline {
        int maxLocalRetries = 2;
        int maxReplans = 2;
        double stepTimeoutSec = 600.0;
        double abandonedGraceSec = 30.0;  // wait for timed-out phases before commit or abort
        std::string outputDir = "data/results";
        std::string generatedToolsDir = "tools";
        std::string python = "python3";
        int generatedToolTimeoutSec = 300;
        std::vector<std::string> allowedImports = {
            "cv2", "numpy", "os.path", "time", "json", "pathlib", "math", "argparse",
            "sys", "typing", "dataclasses", "collections", "itertools",
            "soundfile", "librosa", "pydub", "scipy", "whisper"};
    } pipeline;

    struct Video {
        std::string detectorBackend = "haar";  // haar | dnn
        std::string haarCascadePath = "/usr/share/opencv4/haarcascades/haarcascade_frontalface_default.xml";
        std::string dnnConfigPath = "models/deploy.prototxt";
        std::string dnnModelPath = "models/res10_300x300_ssd_iter_140000.caffemodel";
        int detectEvery = 3;
        float scoreThreshold = 0.5f;
        float nmsThreshold = 0.3f;
        float iouMatchThreshold = 0.3f;
        double trackerMinCorrelation = 0.5;
        int maxPredictedFrames = 60;
        double claheClipLimit = 4.0;
        int claheTileSize = 6;
        double lowContrastStdDev = 40.0;
        double blurScale = 2.0;
        int blurKernel = 31;
        std::vector<int> retryKernels = {51, 121};
        int liveQueueDepth = 8;
    } video;

    struct Audio {
        std::string whisperBinary = "whisper-cli";
        std::string whisperModel = "models/ggml-base.en.bin";
        std::string language = "en";
        std::string mode = "silence";  // silence | beep
        double tailPadSec = 0.15;
        double playbackDelaySec = 3.0;
        double chunkSec = 0.25;
        size_t bufferDepth = 64;
        std::string behindPolicy = "silence";  // silence | delay
        double maxExtraDelaySec = 1.0;
        double lookaheadSec = 1.0;
        double streamWindowSec = 5.0;
        double streamStepSec = 0.5;
        double streamMarginSec = 0.5;
    } audio;

    struct Audit {
        std::string sink = "jsonl";  // jsonl | sqlite
        std::string path = "data/audit/audit.jsonl";
    } audit;

    std::string logFile = "wordshield.log";

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (j.contains("llm")) {
            const auto& l = j.at("llm");
            cfg.llm.apiKey = l.value("api_key", cfg.llm.apiKey);
            cfg.llm.baseUrl = l.value("base_url", cfg.llm.baseUrl);
            cfg.llm.model = l.value("model", cfg.llm.model);
            cfg.llm.temperature = l.value("temperature", cfg.llm.temperature);
            cfg.llm.connectTimeoutSec = l.value("connect_timeout_sec", cfg.llm.connectTimeoutSec);
            cfg.llm.readTimeoutSec = l.value("read_timeout_sec", cfg.llm.readTimeoutSec);
            cfg.llm.maxRetries = l.value("max_retries", cfg.llm.maxRetries);
        }
        if (const char* env = std::getenv("WORDSHIELD_API_KEY")) {
            if (cfg.llm.apiKey.empty()) cfg.llm.apiKey = env;
        }

        if (j.contains("pipeline")) {
            const auto& p = j.at("pipeline");
            cfg.pipeline.maxLocalRetries = p.value("max_local_retries", cfg.pipeline.maxLocalRetries);
            cfg.pipeline.maxReplans = p.value("max_replans", cfg.pipeline.maxReplans);
            cfg.pipeline.stepTimeoutSec = p.value("step_timeout_sec", cfg.pipeline.stepTimeoutSec);
            cfg.pipeline.abandonedGraceSec = p.value("abandoned_grace_sec", cfg.pipeline.abandonedGraceSec);
            cfg.pipeline.outputDir = p.value("output_dir", cfg.pipeline.outputDir);
            cfg.pipeline.generatedToolsDir = p.value("generated_tools_dir", cfg.pipeline.generatedToolsDir);
            cfg.pipeline.python = p.value("python", cfg.pipeline.python);
            cfg.pipeline.generatedToolTimeoutSec =
                p.value("generated_tool_timeout_sec", cfg.pipeline.generatedToolTimeoutSec);
            if (p.contains("allowed_imports")) {
                cfg.pipeline.allowedImports = p["allowed_imports"].get<std::vector<std::string>>();
            }
        }

        if (j.contains("video")) {
            const auto& v = j.at("video");
            cfg.video.detectorBackend = v.value("detector_backend", cfg.video.detectorBackend);
            cfg.video.haarCascadePath = v.value("haar_cascade_path", cfg.video.haarCascadePath);
            cfg.video.dnnConfigPath = v.value("dnn_config_path", cfg.video.dnnConfigPath);
            cfg.video.dnnModelPath = v.value("dnn_model_path", cfg.video.dnnModelPath);
            cfg.video.detectEvery = v.value("detect_every", cfg.video.detectEvery);
            cfg.video.scoreThreshold = v.value("score_threshold", cfg.video.scoreThreshold);
            cfg.video.nmsThreshold = v.value("nms_threshold", cfg.video.nmsThreshold);
            cfg.video.iouMatchThreshold = v.value("iou_match_threshold", cfg.video.iouMatchThreshold);
            cfg.video.trackerMinCorrelation = v.value("tracker_min_correlation", cfg.video.trackerMinCorrelation);
            cfg.video.maxPredictedFrames = v.value("max_predicted_frames", cfg.video.maxPredictedFrames);
            cfg.video.claheClipLimit = v.value("clahe_clip_limit", cfg.video.claheClipLimit);
            cfg.video.claheTileSize = v.value("clahe_tile_size", cfg.video.claheTileSize);
            cfg.video.lowContrastStdDev = v.value("low_contrast_stddev", cfg.video.lowContrastStdDev);
            cfg.video.blurScale = v.value("blur_scale", cfg.video.blurScale);
            cfg.video.blurKernel = v.value("blur_kernel", cfg.video.blurKernel);
            if (v.contains("retry_kernels")) {
                cfg.video.retryKernels = v["retry_kernels"].get<std::vector<int>>();
            }
            cfg.video.liveQueueDepth = v.value("live_queue_depth", cfg.video.liveQueueDepth);
        }

        if (j.contains("audio")) {
            const auto& a = j.at("audio");
            cfg.audio.whisperBinary = a.value("whisper_binary", cfg.audio.whisperBinary);
            cfg.audio.whisperModel = a.value("whisper_model", cfg.audio.whisperModel);
            cfg.audio.language = a.value("language", cfg.audio.language);
            cfg.audio.mode = a.value("mode", cfg.audio.mode);
            cfg.audio.tailPadSec = a.value("tail_pad_sec", cfg.audio.tailPadSec);
            cfg.audio.playbackDelaySec = a.value("playback_delay_sec", cfg.audio.playbackDelaySec);
            cfg.audio.chunkSec = a.value("chunk_sec", cfg.audio.chunkSec);
            cfg.audio.bufferDepth = a.value("buffer_depth", cfg.audio.bufferDepth);
            cfg.audio.behindPolicy = a.value("behind_policy", cfg.audio.behindPolicy);
            cfg.audio.maxExtraDelaySec = a.value("max_extra_delay_sec", cfg.audio.maxExtraDelaySec);
            cfg.audio.lookaheadSec = a.value("lookahead_sec", cfg.audio.lookaheadSec);
            cfg.audio.streamWindowSec = a.value("stream_window_sec", cfg.audio.streamWindowSec);
            cfg.audio.streamStepSec = a.value("stream_step_sec", cfg.audio.streamStepSec);
            cfg.audio.streamMarginSec = a.value("stream_margin_sec", cfg.audio.streamMarginSec);
        }

        if (j.contains("audit")) {
            cfg.audit.sink = j["audit"].value("sink", cfg.audit.sink);
            cfg.audit.path = j["audit"].value("path", cfg.audit.path);
        }
        cfg.logFile = j.value("log_file", cfg.logFile);
        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config value in " + path.string() + ": " + e.what());
        }
    }
};
