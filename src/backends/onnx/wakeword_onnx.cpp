/**
 * @file wakeword_onnx.cpp
 * @brief ONNX Backend for Wake Word Detection using openWakeWord
 *
 * Reference: https://github.com/dscripka/openWakeWord
 */

#include "rey/backends/rey_wakeword_onnx.h"
#include "rey/core/rey_logger.h"

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace rey {
namespace backends {
namespace onnx {

// =============================================================================
// CONSTANTS (from openWakeWord)
// =============================================================================

static const char* LOG_TAG = "WakeWordONNX";

static constexpr int FRAME_SIZE = 1280;  // 80ms @ 16kHz

static constexpr int MELSPEC_BINS = 32;
static constexpr int MELSPEC_WINDOW_SIZE = 76;  // Frames needed for one embedding
static constexpr int MELSPEC_STRIDE = 8;

static constexpr int EMBEDDING_DIM = 96;

static constexpr size_t MAX_MELSPEC_FRAMES = 970;    // ~10 seconds of audio
static constexpr size_t MAX_EMBEDDING_HISTORY = 120; // ~10 seconds of embeddings
static constexpr int DEFAULT_CLASSIFIER_EMBEDDINGS = 16;

// 480 samples (30ms) of the previous chunk are prepended for frame continuity
static constexpr int MELSPEC_CONTEXT_SAMPLES = 160 * 3;

// The melspectrogram model is trained on int16-range input
static constexpr float INT16_SCALE = 32767.0f;

std::string wake_label_from_path(const std::string& path) {
    size_t start = path.find_last_of("/\\");
    start = (start == std::string::npos) ? 0 : start + 1;
    std::string name = path.substr(start);
    const std::string ext = ".onnx";
    if (name.size() > ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0) {
        name.erase(name.size() - ext.size());
    }
    return name;
}

// =============================================================================
// INTERNAL STATE
// =============================================================================

struct OnnxWakeClassifier::Impl {
    std::mutex mutex;
    std::string label;
    bool ready = false;

    std::unique_ptr<Ort::Env> env;
    std::unique_ptr<Ort::SessionOptions> session_options;
    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    Ort::AllocatorWithDefaultOptions allocator;

    // Stage 1
    std::unique_ptr<Ort::Session> melspec_session;
    std::string melspec_input_name;
    std::string melspec_output_name;

    // Stage 2
    std::unique_ptr<Ort::Session> embedding_session;
    std::string embedding_input_name;
    std::string embedding_output_name;

    // Stage 3
    std::unique_ptr<Ort::Session> classifier_session;
    std::string classifier_input_name;
    std::string classifier_output_name;
    int num_embeddings = DEFAULT_CLASSIFIER_EMBEDDINGS;

    // Streaming buffers
    std::vector<float> audio_buffer;
    std::vector<float> audio_context_buffer;
    std::deque<std::vector<float>> melspec_buffer;
    std::deque<std::vector<float>> embedding_buffer;
    size_t last_melspec_embedding_index = 0;
    bool buffers_initialized = false;
    float last_score = 0.0f;

    void initialize_streaming_buffers();
    void clear_streaming_buffers();
    bool compute_melspectrogram(const std::vector<float>& audio,
                                std::vector<std::vector<float>>& out_melspec);
    bool compute_single_embedding(const float* melspec_window, std::vector<float>& out_embedding);
    void generate_embeddings_from_melspec();
    float run_classifier();
    void process_chunk();
};

static Ort::SessionOptions create_session_options(int num_threads, bool optimize) {
    Ort::SessionOptions options;
    if (num_threads > 0) {
        options.SetIntraOpNumThreads(num_threads);
        options.SetInterOpNumThreads(num_threads);
    }
    if (optimize) {
        options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    }
    return options;
}

/**
 * Pre-fill the melspectrogram buffer with 76 frames of ones so the embedding
 * model has context from the first chunk onward.
 */
void OnnxWakeClassifier::Impl::initialize_streaming_buffers() {
    if (buffers_initialized) {
        return;
    }
    for (int i = 0; i < MELSPEC_WINDOW_SIZE; ++i) {
        melspec_buffer.emplace_back(MELSPEC_BINS, 1.0f);
    }
    audio_context_buffer.clear();
    audio_context_buffer.reserve(MELSPEC_CONTEXT_SAMPLES);
    last_melspec_embedding_index = 0;
    buffers_initialized = true;
}

void OnnxWakeClassifier::Impl::clear_streaming_buffers() {
    audio_buffer.clear();
    audio_context_buffer.clear();
    melspec_buffer.clear();
    embedding_buffer.clear();
    last_melspec_embedding_index = 0;
    buffers_initialized = false;
    last_score = 0.0f;
}

// =============================================================================
// STAGE 1: MELSPECTROGRAM
// =============================================================================

bool OnnxWakeClassifier::Impl::compute_melspectrogram(const std::vector<float>& audio,
                                                      std::vector<std::vector<float>>& out_melspec) {
    if (!melspec_session || audio.empty()) {
        return false;
    }

    try {
        std::vector<int64_t> input_shape = {1, static_cast<int64_t>(audio.size())};
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            memory_info, const_cast<float*>(audio.data()), audio.size(), input_shape.data(),
            input_shape.size());

        const char* input_names[] = {melspec_input_name.c_str()};
        const char* output_names[] = {melspec_output_name.c_str()};
        auto outputs = melspec_session->Run(Ort::RunOptions{nullptr}, input_names, &input_tensor,
                                            1, output_names, 1);

        auto& output_tensor = outputs[0];
        auto shape_info = output_tensor.GetTensorTypeAndShapeInfo();
        auto shape = shape_info.GetShape();
        const float* output_data = output_tensor.GetTensorData<float>();

        // Output is [frames, 32], [1, frames, 32] or [1, 1, frames, 32]
        int num_bins = MELSPEC_BINS;
        int num_frames = 0;
        if (shape.size() >= 2) {
            num_bins = static_cast<int>(shape.back());
            num_frames = static_cast<int>(shape[shape.size() - 2]);
        } else {
            num_frames = static_cast<int>(shape_info.GetElementCount() / MELSPEC_BINS);
        }

        out_melspec.clear();
        out_melspec.reserve(num_frames);
        for (int f = 0; f < num_frames; ++f) {
            std::vector<float> frame(num_bins);
            for (int b = 0; b < num_bins; ++b) {
                // openWakeWord transform
                frame[b] = (output_data[f * num_bins + b] / 10.0f) + 2.0f;
            }
            out_melspec.push_back(std::move(frame));
        }
        return true;

    } catch (const Ort::Exception& e) {
        REY_LOG_ERROR(LOG_TAG, "Melspectrogram error: %s", e.what());
        return false;
    }
}

// =============================================================================
// STAGE 2: EMBEDDINGS
// =============================================================================

/// Input [1, 76, 32, 1], output [96].
bool OnnxWakeClassifier::Impl::compute_single_embedding(const float* melspec_window,
                                                        std::vector<float>& out_embedding) {
    try {
        std::vector<int64_t> input_shape = {1, MELSPEC_WINDOW_SIZE, MELSPEC_BINS, 1};
        const size_t input_size = MELSPEC_WINDOW_SIZE * MELSPEC_BINS;

        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            memory_info, const_cast<float*>(melspec_window), input_size, input_shape.data(),
            input_shape.size());

        const char* input_names[] = {embedding_input_name.c_str()};
        const char* output_names[] = {embedding_output_name.c_str()};
        auto outputs = embedding_session->Run(Ort::RunOptions{nullptr}, input_names,
                                              &input_tensor, 1, output_names, 1);

        const float* output_data = outputs[0].GetTensorData<float>();
        const size_t output_size = outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();
        const size_t dim = std::min(output_size, static_cast<size_t>(EMBEDDING_DIM));
        out_embedding.assign(output_data, output_data + dim);
        out_embedding.resize(EMBEDDING_DIM, 0.0f);
        return true;

    } catch (const Ort::Exception& e) {
        REY_LOG_ERROR(LOG_TAG, "Embedding error: %s", e.what());
        return false;
    }
}

void OnnxWakeClassifier::Impl::generate_embeddings_from_melspec() {
    const size_t melspec_size = melspec_buffer.size();
    if (melspec_size < MELSPEC_WINDOW_SIZE) {
        return;
    }

    std::vector<float> window_data(MELSPEC_WINDOW_SIZE * MELSPEC_BINS, 0.0f);
    size_t start_index = last_melspec_embedding_index;

    while (start_index + MELSPEC_WINDOW_SIZE <= melspec_size) {
        for (int i = 0; i < MELSPEC_WINDOW_SIZE; ++i) {
            const auto& frame = melspec_buffer[start_index + i];
            const int bins = std::min(MELSPEC_BINS, static_cast<int>(frame.size()));
            std::copy(frame.begin(), frame.begin() + bins, window_data.begin() + i * MELSPEC_BINS);
        }

        std::vector<float> embedding;
        if (compute_single_embedding(window_data.data(), embedding)) {
            embedding_buffer.push_back(std::move(embedding));
            while (embedding_buffer.size() > MAX_EMBEDDING_HISTORY) {
                embedding_buffer.pop_front();
            }
        }
        start_index += MELSPEC_STRIDE;
    }

    last_melspec_embedding_index = start_index;
}

// =============================================================================
// STAGE 3: CLASSIFICATION
// =============================================================================

/// Input [1, num_embeddings, 96], output a single probability.
float OnnxWakeClassifier::Impl::run_classifier() {
    const int available = static_cast<int>(embedding_buffer.size());
    if (available < num_embeddings) {
        return 0.0f;
    }

    try {
        std::vector<float> input_data;
        input_data.reserve(static_cast<size_t>(num_embeddings) * EMBEDDING_DIM);
        for (int i = available - num_embeddings; i < available; ++i) {
            const auto& emb = embedding_buffer[i];
            input_data.insert(input_data.end(), emb.begin(), emb.end());
        }

        std::vector<int64_t> input_shape = {1, static_cast<int64_t>(num_embeddings), EMBEDDING_DIM};
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            memory_info, input_data.data(), input_data.size(), input_shape.data(),
            input_shape.size());

        const char* input_names[] = {classifier_input_name.c_str()};
        const char* output_names[] = {classifier_output_name.c_str()};
        auto outputs = classifier_session->Run(Ort::RunOptions{nullptr}, input_names,
                                               &input_tensor, 1, output_names, 1);

        return *outputs[0].GetTensorData<float>();

    } catch (const Ort::Exception& e) {
        REY_LOG_ERROR(LOG_TAG, "Classifier error for %s: %s", label.c_str(), e.what());
        return 0.0f;
    }
}

void OnnxWakeClassifier::Impl::process_chunk() {
    std::vector<float> frame_with_context;
    frame_with_context.reserve(MELSPEC_CONTEXT_SAMPLES + FRAME_SIZE);
    for (float s : audio_context_buffer) {
        frame_with_context.push_back(s * INT16_SCALE);
    }
    for (int i = 0; i < FRAME_SIZE; ++i) {
        frame_with_context.push_back(audio_buffer[i] * INT16_SCALE);
    }

    audio_context_buffer.assign(audio_buffer.begin() + (FRAME_SIZE - MELSPEC_CONTEXT_SAMPLES),
                                audio_buffer.begin() + FRAME_SIZE);
    audio_buffer.erase(audio_buffer.begin(), audio_buffer.begin() + FRAME_SIZE);

    std::vector<std::vector<float>> melspec_frames;
    if (!compute_melspectrogram(frame_with_context, melspec_frames)) {
        return;
    }
    for (auto& mf : melspec_frames) {
        melspec_buffer.push_back(std::move(mf));
    }
    while (melspec_buffer.size() > MAX_MELSPEC_FRAMES) {
        melspec_buffer.pop_front();
        if (last_melspec_embedding_index > 0) {
            last_melspec_embedding_index--;
        }
    }

    generate_embeddings_from_melspec();
}

// =============================================================================
// PUBLIC API
// =============================================================================

OnnxWakeClassifier::OnnxWakeClassifier() : impl_(std::make_unique<Impl>()) {}

OnnxWakeClassifier::~OnnxWakeClassifier() = default;

ErrorCode OnnxWakeClassifier::load(const OnnxWakeConfig& config) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->ready = false;
    impl_->label =
        config.label.empty() ? wake_label_from_path(config.wake_model_path) : config.label;

    try {
        impl_->env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "WakeWord");
        impl_->session_options = std::make_unique<Ort::SessionOptions>(
            create_session_options(config.num_threads, config.enable_optimization));

        impl_->melspec_session = std::make_unique<Ort::Session>(
            *impl_->env, config.melspec_model_path.c_str(), *impl_->session_options);
        impl_->melspec_input_name =
            impl_->melspec_session->GetInputNameAllocated(0, impl_->allocator).get();
        impl_->melspec_output_name =
            impl_->melspec_session->GetOutputNameAllocated(0, impl_->allocator).get();
        REY_LOG_INFO(LOG_TAG, "Loaded melspectrogram model: %s",
                     config.melspec_model_path.c_str());

        impl_->embedding_session = std::make_unique<Ort::Session>(
            *impl_->env, config.embedding_model_path.c_str(), *impl_->session_options);
        impl_->embedding_input_name =
            impl_->embedding_session->GetInputNameAllocated(0, impl_->allocator).get();
        impl_->embedding_output_name =
            impl_->embedding_session->GetOutputNameAllocated(0, impl_->allocator).get();
        REY_LOG_INFO(LOG_TAG, "Loaded embedding model: %s", config.embedding_model_path.c_str());

        impl_->classifier_session = std::make_unique<Ort::Session>(
            *impl_->env, config.wake_model_path.c_str(), *impl_->session_options);
        impl_->classifier_input_name =
            impl_->classifier_session->GetInputNameAllocated(0, impl_->allocator).get();
        impl_->classifier_output_name =
            impl_->classifier_session->GetOutputNameAllocated(0, impl_->allocator).get();

        // Shape is typically [1, num_embeddings, 96]
        auto shape = impl_->classifier_session->GetInputTypeInfo(0)
                         .GetTensorTypeAndShapeInfo()
                         .GetShape();
        impl_->num_embeddings = (shape.size() >= 2 && shape[1] > 0)
                                    ? static_cast<int>(shape[1])
                                    : DEFAULT_CLASSIFIER_EMBEDDINGS;

        REY_LOG_INFO(LOG_TAG, "Loaded wake word model: %s ('%s') - requires %d embeddings",
                     config.wake_model_path.c_str(), impl_->label.c_str(),
                     impl_->num_embeddings);

    } catch (const Ort::Exception& e) {
        REY_LOG_ERROR(LOG_TAG, "Failed to load wake word models: %s", e.what());
        impl_->melspec_session.reset();
        impl_->embedding_session.reset();
        impl_->classifier_session.reset();
        return ErrorCode::ClassifierUnavailable;
    }

    impl_->clear_streaming_buffers();
    impl_->ready = true;
    return ErrorCode::Ok;
}

bool OnnxWakeClassifier::is_ready() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->ready;
}

void OnnxWakeClassifier::reset() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->clear_streaming_buffers();
    REY_LOG_DEBUG(LOG_TAG, "Reset buffers");
}

const std::string& OnnxWakeClassifier::label() const {
    return impl_->label;
}

WakeScores OnnxWakeClassifier::predict(const AudioFrame& frame) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    WakeScores scores;
    if (!impl_->ready) {
        return scores;
    }

    impl_->initialize_streaming_buffers();
    impl_->audio_buffer.insert(impl_->audio_buffer.end(), frame.begin(), frame.end());

    bool processed = false;
    while (impl_->audio_buffer.size() >= static_cast<size_t>(FRAME_SIZE)) {
        impl_->process_chunk();
        processed = true;
    }

    // Score only changes when a new chunk has been embedded
    if (processed) {
        impl_->last_score = impl_->run_classifier();
    }
    scores[impl_->label] = impl_->last_score;
    return scores;
}

}  // namespace onnx
}  // namespace backends
}  // namespace rey
