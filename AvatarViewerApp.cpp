#include "AvatarViewerApp.hpp"

#include <iomanip>
#include <iostream>
#include <vector>

namespace AVATAR {

    namespace {
        const double kPrintInterval = 0.5;
        // Keep idling a little after the last scripted event.
        const double kTailSeconds = 1.5;
        // Analysis ticks allowed per frame before the backlog is dropped.
        const int kMaxAnalysisCatchUp = 8;
    }

    AvatarViewerApp::AvatarViewerApp(const std::string& app_name,
        const AvatarConfig& config,
        const std::string& rig_path,
        const std::string& script_path,
        bool use_microphone)
        : app_name_(app_name),
        config_(config),
        rig_path_(rig_path),
        script_path_(script_path),
        use_microphone_(use_microphone) {
    }

    AvatarViewerApp::~AvatarViewerApp() {
        if (bus_) {
            bus_->Teardown();
        }
        if (animator_) {
            animator_->Dispose();
        }
        StopAudio();
        if (audio_clip_ != nullptr) {
            Mix_FreeChunk(audio_clip_);
            audio_clip_ = nullptr;
        }
        if (audio_open_) {
            Mix_CloseAudio();
        }
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
    }

    bool AvatarViewerApp::SetupScene() {
        std::cout << "== " << app_name_ << " ==\n";

        animator_ = std::make_unique<AvatarAnimator>(backend_, config_);
        if (animator_->Initialize(rig_path_) != LoadStatus::Ready) {
            std::cerr << "ERROR: avatar " << config_.avatar_id << " failed to load ("
                << ToString(animator_->GetStatus()) << ")\n";
            return false;
        }

        controller_ = std::make_unique<AvatarController>(*animator_, config_.avatar_id);
        bus_ = std::make_unique<CommandBus>(controller_->AsInvoker());

        extractor_ = std::make_shared<EnvelopeExtractor>(config_.envelope, config_.allow_local_audio);
        animator_->BindEnvelope(extractor_);

        if (!script_path_.empty()) {
            script_loaded_ = script_.Load(script_path_);
        }

        // Audio init
        if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
            std::cerr << "SDL_InitSubSystem(SDL_INIT_AUDIO) failed: "
                << SDL_GetError() << "\n";
        }
        else if (Mix_OpenAudio(44100, MIX_DEFAULT_FORMAT, 2, 2048) < 0) {
            std::cerr << "Mix_OpenAudio failed: " << Mix_GetError() << "\n";
        }
        else {
            audio_open_ = true;
        }

        StartAudio();
        return true;
    }

    void AvatarViewerApp::StartAudio() {
        if (use_microphone_) {
            mic_track_ = std::make_shared<CaptureDeviceTrack>("local-microphone");
            if (!mic_track_->Open()) {
                mic_track_.reset();
            }
            EnvelopeStatus status = extractor_->Attach(mic_track_);
            std::cout << "[Viewer] lip sync source: " << ToString(status) << "\n";
            return;
        }

        if (!audio_open_ || !script_loaded_ || script_.GetAudioPath().empty()) {
            std::cout << "[Viewer] no speech clip, idling without lip sync\n";
            return;
        }

        const std::string& audio_path = script_.GetAudioPath();
        std::cout << "Loading audio: " << audio_path << "\n";
        audio_clip_ = Mix_LoadWAV(audio_path.c_str());
        if (!audio_clip_) {
            std::cerr << "Mix_LoadWAV failed for " << audio_path
                << ": " << Mix_GetError() << "\n";
            return;
        }

        audio_channel_ = Mix_PlayChannel(-1, audio_clip_, 0);
        if (audio_channel_ < 0) {
            std::cerr << "Mix_PlayChannel failed: " << Mix_GetError() << "\n";
            return;
        }

        // Without a tap the clip still plays; the avatar just idles.
        speech_track_ = std::make_shared<MixerChannelTrack>(config_.avatar_id);
        if (!speech_track_->Register(audio_channel_)) {
            speech_track_.reset();
        }
        EnvelopeStatus status = extractor_->Attach(speech_track_);
        std::cout << "[Viewer] lip sync source: " << ToString(status) << "\n";
    }

    void AvatarViewerApp::StopAudio() {
        // The extractor lets go of the stream before the tap goes away.
        if (extractor_) {
            extractor_->Detach();
        }
        if (speech_track_) {
            speech_track_->Unregister();
            speech_track_.reset();
        }
        if (mic_track_) {
            mic_track_->Close();
            mic_track_.reset();
        }
        if (audio_channel_ >= 0) {
            Mix_HaltChannel(audio_channel_);
            audio_channel_ = -1;
        }
    }

    void AvatarViewerApp::DriveAnalysis(double delta_time) {
        analysis_accumulator_ += delta_time;
        int ticks = 0;
        while (analysis_accumulator_ >= EnvelopeExtractor::kTickSeconds) {
            analysis_accumulator_ -= EnvelopeExtractor::kTickSeconds;
            if (++ticks > kMaxAnalysisCatchUp) {
                analysis_accumulator_ = 0.0;
                break;
            }
            extractor_->Tick();
        }
    }

    void AvatarViewerApp::DeliverScript(double total_elapsed_time) {
        if (!script_loaded_) {
            return;
        }

        std::vector<TranscriptEvent> transcript;
        std::vector<CommandEvent> commands;
        script_.PopDue(total_elapsed_time, transcript, commands);

        for (const TranscriptEvent& ev : transcript) {
            animator_->OnTranscript(ev.text, ev.is_local, total_elapsed_time);
        }
        for (const CommandEvent& ev : commands) {
            bus_->Process(ev.payload);
        }
    }

    void AvatarViewerApp::PrintLevel(double total_elapsed_time) {
        if (total_elapsed_time - last_print_time_ < kPrintInterval) {
            return;
        }
        last_print_time_ = total_elapsed_time;
        std::cout << "[Viewer] t=" << std::fixed << std::setprecision(2) << total_elapsed_time
            << "  mouth=" << std::setprecision(3) << animator_->GetMouth()
            << "  envelope=" << extractor_->GetEnvelope()
            << "  viseme=" << ToString(animator_->GetVisemeHinter().ActiveShape(total_elapsed_time))
            << "  audio=" << ToString(extractor_->GetStatus()) << "\n";
    }

    void AvatarViewerApp::Tick(double delta_time, double total_elapsed_time) {
        if (finished_ || !animator_) {
            return;
        }

        DriveAnalysis(delta_time);
        DeliverScript(total_elapsed_time);
        animator_->Tick(delta_time, total_elapsed_time);
        PrintLevel(total_elapsed_time);

        // End of speech: release the channel, and the tap if one was registered.
        const bool speech_playing = audio_channel_ >= 0 && Mix_Playing(audio_channel_) != 0;
        if (audio_channel_ >= 0 && !speech_playing) {
            std::cout << "[Viewer] speech finished\n";
            StopAudio();
        }

        if (!use_microphone_ && script_.IsFinished(total_elapsed_time, speech_playing, kTailSeconds)) {
            finished_ = true;
        }
    }

}  // namespace AVATAR
