#include "audio/audio_device.hpp"
#include "logger.hpp"

#include <portaudio.h>
#include <thread>
#include <algorithm>

// Keep the next silent frame on the period grid. If we fell behind by more
// than a period (debugger, suspend) restart the grid instead of bursting.
static void paceOnGrid(std::chrono::steady_clock::time_point& deadline,
                       std::chrono::microseconds period) {
    auto now = std::chrono::steady_clock::now();
    if (deadline.time_since_epoch().count() == 0 || deadline + period < now) {
        deadline = now;
    }
    std::this_thread::sleep_until(deadline);
    deadline += period;
}

// ============================================================
// AudioFrameSource
// ============================================================
AudioFrameSource::AudioFrameSource(const FrameFormat& fmt, int retryLimit)
    : fmt_(fmt), retryLimit_(std::max(0, retryLimit)) {}

AudioFrame AudioFrameSource::capture() {
    AudioFrame frame;
    frame.sequence = sequence_++;

    if (!degraded_) {
        std::string err;
        for (int attempt = 0; attempt <= retryLimit_; ++attempt) {
            frame.samples.clear();
            if (readDevice(frame.samples, err)) {
                frame.timestamp = std::chrono::steady_clock::now();
                conformFrame(frame, fmt_);
                return frame;
            }
            LOG_WARN("Audio", name() + " read failed (attempt " +
                     std::to_string(attempt + 1) + "/" +
                     std::to_string(retryLimit_ + 1) + "): " + err);
        }

        ErrorManager::reportTo(errorSink_, ErrorKind::Device, "ERR_DEVICE_CAPTURE", err);
        ErrorManager::reportTo(errorSink_, ErrorKind::Device, "ERR_DEVICE_DEGRADED", name());
        degraded_ = true;
    }

    paceSilence();
    frame.samples.assign(fmt_.samples, 0.0f);
    frame.timestamp = std::chrono::steady_clock::now();
    return frame;
}

void AudioFrameSource::paceSilence() {
    paceOnGrid(nextDeadline_, fmt_.period());
}

// ============================================================
// AudioFrameSink
// ============================================================
AudioFrameSink::AudioFrameSink(const FrameFormat& fmt, int retryLimit)
    : fmt_(fmt), retryLimit_(std::max(0, retryLimit)), silenceBuffer_(fmt.samples, 0.0f) {}

void AudioFrameSink::play(const AudioFrame& frame) {
    ++played_;

    if (degraded_) {
        paceSilence();
        return;
    }

    const std::vector<float>* samples = &frame.samples;
    std::vector<float> conformed;
    if (frame.samples.size() != fmt_.samples) {
        conformed = frame.samples;
        conformed.resize(fmt_.samples, 0.0f);
        samples = &conformed;
    }

    std::string err;
    for (int attempt = 0; attempt <= retryLimit_; ++attempt) {
        if (writeDevice(*samples, err)) return;
        LOG_WARN("Audio", name() + " write failed (attempt " +
                 std::to_string(attempt + 1) + "/" +
                 std::to_string(retryLimit_ + 1) + "): " + err);
    }

    ErrorManager::reportTo(errorSink_, ErrorKind::Device, "ERR_DEVICE_PLAYBACK", err);
    ErrorManager::reportTo(errorSink_, ErrorKind::Device, "ERR_DEVICE_DEGRADED", name());
    degraded_ = true;
    paceSilence();
}

void AudioFrameSink::playSilence() {
    ++silence_;
    AudioFrame frame;
    frame.samples = silenceBuffer_;
    frame.timestamp = std::chrono::steady_clock::now();
    play(frame);
}

void AudioFrameSink::paceSilence() {
    paceOnGrid(nextDeadline_, fmt_.period());
}

// ============================================================
// PortAudio helpers
// ============================================================
static bool openPaStream(PaStream** stream, bool input, int requested,
                         const FrameFormat& fmt, std::string& err) {
    int deviceIndex = (requested >= 0) ? requested
                                       : (input ? Pa_GetDefaultInputDevice()
                                                : Pa_GetDefaultOutputDevice());
    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        err = std::string("no valid ") + (input ? "input" : "output") + " device";
        return false;
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
    if (!devInfo) {
        err = "device info unavailable for index " + std::to_string(deviceIndex);
        return false;
    }

    PaStreamParameters params;
    params.device = deviceIndex;
    params.channelCount = 1;
    params.sampleFormat = paFloat32;
    params.suggestedLatency = input ? devInfo->defaultLowInputLatency
                                    : devInfo->defaultLowOutputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    PaError pe = Pa_OpenStream(stream,
                               input ? &params : nullptr,
                               input ? nullptr : &params,
                               fmt.sampleRate,
                               static_cast<unsigned long>(fmt.samples),
                               paNoFlag,
                               nullptr,      // blocking read/write
                               nullptr);
    if (pe != paNoError || !*stream) {
        err = std::string("Pa_OpenStream: ") + Pa_GetErrorText(pe);
        *stream = nullptr;
        return false;
    }

    pe = Pa_StartStream(*stream);
    if (pe != paNoError) {
        err = std::string("Pa_StartStream: ") + Pa_GetErrorText(pe);
        Pa_CloseStream(*stream);
        *stream = nullptr;
        return false;
    }

    LOG_DEBUG("Audio", std::string(input ? "Input" : "Output") + " device #" +
              std::to_string(deviceIndex) + ": " + devInfo->name);
    return true;
}

static void closePaStream(PaStream*& stream, bool& initialized) {
    if (stream) {
        Pa_StopStream(stream);
        Pa_CloseStream(stream);
        stream = nullptr;
    }
    if (initialized) {
        Pa_Terminate();
        initialized = false;
    }
}

// ============================================================
// PortAudioSource
// ============================================================
PortAudioSource::PortAudioSource(const FrameFormat& fmt, int retryLimit, int deviceIndex)
    : AudioFrameSource(fmt, retryLimit), deviceIndex_(deviceIndex) {}

PortAudioSource::~PortAudioSource() {
    close();
}

bool PortAudioSource::open(EngineError* err) {
    if (stream_) return true;

    PaError pe = Pa_Initialize();
    if (pe != paNoError) {
        EngineError e = ErrorManager::report(ErrorKind::Device, "ERR_DEVICE_UNAVAILABLE",
                                             std::string("Pa_Initialize: ") + Pa_GetErrorText(pe));
        if (err) *err = e;
        return false;
    }
    initialized_ = true;

    std::string detail;
    if (!openPaStream(&stream_, true, deviceIndex_, fmt_, detail)) {
        closePaStream(stream_, initialized_);
        EngineError e = ErrorManager::report(ErrorKind::Device, "ERR_DEVICE_UNAVAILABLE", detail);
        if (err) *err = e;
        return false;
    }

    LOG_PHASE("PortAudio input stream open", true);
    return true;
}

void PortAudioSource::close() {
    bool wasOpen = stream_ != nullptr;
    closePaStream(stream_, initialized_);
    if (wasOpen) LOG_DEBUG("Audio", "Input stream closed");
}

bool PortAudioSource::readDevice(std::vector<float>& out, std::string& err) {
    if (!stream_) {
        err = "stream not open";
        return false;
    }

    out.resize(fmt_.samples);
    PaError pe = Pa_ReadStream(stream_, out.data(), static_cast<unsigned long>(fmt_.samples));
    if (pe == paInputOverflowed) {
        // Data is still valid, we just lost some samples before it.
        LOG_TRACE("Audio", "Input overflow");
        return true;
    }
    if (pe != paNoError) {
        err = Pa_GetErrorText(pe);
        return false;
    }
    return true;
}

// ============================================================
// PortAudioSink
// ============================================================
PortAudioSink::PortAudioSink(const FrameFormat& fmt, int retryLimit, int deviceIndex)
    : AudioFrameSink(fmt, retryLimit), deviceIndex_(deviceIndex) {}

PortAudioSink::~PortAudioSink() {
    close();
}

bool PortAudioSink::open(EngineError* err) {
    if (stream_) return true;

    PaError pe = Pa_Initialize();
    if (pe != paNoError) {
        EngineError e = ErrorManager::report(ErrorKind::Device, "ERR_DEVICE_UNAVAILABLE",
                                             std::string("Pa_Initialize: ") + Pa_GetErrorText(pe));
        if (err) *err = e;
        return false;
    }
    initialized_ = true;

    std::string detail;
    if (!openPaStream(&stream_, false, deviceIndex_, fmt_, detail)) {
        closePaStream(stream_, initialized_);
        EngineError e = ErrorManager::report(ErrorKind::Device, "ERR_DEVICE_UNAVAILABLE", detail);
        if (err) *err = e;
        return false;
    }

    LOG_PHASE("PortAudio output stream open", true);
    return true;
}

void PortAudioSink::close() {
    bool wasOpen = stream_ != nullptr;
    closePaStream(stream_, initialized_);
    if (wasOpen) LOG_DEBUG("Audio", "Output stream closed");
}

bool PortAudioSink::writeDevice(const std::vector<float>& samples, std::string& err) {
    if (!stream_) {
        err = "stream not open";
        return false;
    }

    PaError pe = Pa_WriteStream(stream_, samples.data(), static_cast<unsigned long>(samples.size()));
    if (pe == paOutputUnderflowed) {
        LOG_TRACE("Audio", "Output underflow");
        return true;
    }
    if (pe != paNoError) {
        err = Pa_GetErrorText(pe);
        return false;
    }
    return true;
}

// ============================================================
// Device listing
// ============================================================
namespace Audio {

std::vector<DeviceInfo> listDevices() {
    std::vector<DeviceInfo> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("Audio", std::string("PortAudio error: ") + Pa_GetErrorText(err));
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        LOG_ERROR("Audio", "Pa_GetDeviceCount returned " + std::to_string(numDevices));
        Pa_Terminate();
        return devices;
    }

    int defIn  = Pa_GetDefaultInputDevice();
    int defOut = Pa_GetDefaultOutputDevice();

    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (!deviceInfo) continue;

        const PaHostApiInfo* hostApiInfo = Pa_GetHostApiInfo(deviceInfo->hostApi);

        DeviceInfo info;
        info.index = i;
        info.name = deviceInfo->name ? deviceInfo->name : "";
        info.hostApi = (hostApiInfo && hostApiInfo->name) ? hostApiInfo->name : "";
        info.maxInputChannels = deviceInfo->maxInputChannels;
        info.maxOutputChannels = deviceInfo->maxOutputChannels;
        info.defaultSampleRate = deviceInfo->defaultSampleRate;
        info.isDefaultInput = (i == defIn);
        info.isDefaultOutput = (i == defOut);
        devices.push_back(info);
    }

    Pa_Terminate();
    return devices;
}

void logDevices() {
    auto devices = listDevices();
    LOG_DEBUG("Audio", "Found " + std::to_string(devices.size()) + " audio devices");

    for (const auto& d : devices) {
        std::string line = "#" + std::to_string(d.index) + ": " + d.name +
                           " (" + d.hostApi + ") in=" + std::to_string(d.maxInputChannels) +
                           " out=" + std::to_string(d.maxOutputChannels);
        if (d.isDefaultInput)  line += " [default input]";
        if (d.isDefaultOutput) line += " [default output]";
        LOG_TRACE("Audio", line);
    }
}

} // namespace Audio
