#include "stt/whisper_stt.hpp"

#include "audio/silence_trim.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "stt/segment_text.hpp"

#include <whisper.h>
#include <stdexcept>
#include <string>
#include <utility>

static const char* kTag = "Whisper STT";

// Constructor
WhisperSTT::WhisperSTT(const std::string& modelPath, Params params) : params_(params) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = params_.useGpu;

    context_ = whisper_init_from_file_with_params(modelPath.c_str(), cparams);
    if (!context_) throw EngineInitError("whisper_init_from_file_with_params failed: " + modelPath);

    logInfo(kTag, "Model loaded: " + modelPath + (params_.useGpu ? " (gpu)" : " (cpu)"));
}

// Destructor
WhisperSTT::~WhisperSTT() {
    if (context_) whisper_free(context_);
}

// Converts one utterance into timestamped text segments
std::vector<TranscriptEntry> WhisperSTT::transcribe(const AudioSegment& segment,
                                                    const DecodeOptions& options) {
    std::vector<TranscriptEntry> out;
    if (segment.pcm.empty()) return out;

    size_t begin = 0;
    size_t end = segment.pcm.size();
    if (options.vadFilter) {
        const VoicedRange voiced = findVoicedRange(segment.pcm, segment.sampleRate, params_.silenceRms);
        if (voiced.empty()) {
            logDebug(kTag, "segment #" + std::to_string(segment.sequence) + " is silent, skipped");
            return out;
        }
        begin = voiced.begin;
        end = voiced.end;
    }
    const double offset = segment.sampleRate > 0 ? (double)begin / segment.sampleRate : 0.0;

    std::lock_guard<std::mutex> lock(mutex_);

    whisper_full_params params = whisper_full_default_params(
        options.beamSize > 1 ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY);

    params.n_threads = params_.threads;
    params.language = options.language.empty() ? nullptr : options.language.c_str();
    params.translate = false;
    params.beam_search.beam_size = options.beamSize;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;

    params.no_context = true;
    params.no_speech_thold = params_.noSpeechThreshold;

    const int rc = whisper_full(context_, params, segment.pcm.data() + begin, (int)(end - begin));
    if (rc != 0) throw std::runtime_error("whisper_full failed (" + std::to_string(rc) + ")");

    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) {
        TranscriptEntry entry;
        if (!makeTranscriptEntry(whisper_full_get_segment_text(context_, i),
                                 whisper_full_get_segment_t0(context_, i),
                                 whisper_full_get_segment_t1(context_, i),
                                 offset, entry)) {
            continue;
        }
        out.push_back(std::move(entry));
    }
    return out;
}
