#ifndef AVATAR_VIEWER_APP_H_
#define AVATAR_VIEWER_APP_H_

#include <memory>
#include <string>

#include <SDL.h>
#include <SDL_mixer.h>

#include "AvatarAnimator.hpp"
#include "AvatarConfig.hpp"
#include "AvatarController.hpp"
#include "CommandBus.hpp"
#include "EnvelopeExtractor.hpp"
#include "JsonRig.hpp"
#include "SdlAudioSources.hpp"
#include "SessionScript.hpp"

namespace AVATAR {

    // Headless host: replays a session script against one avatar, with
    // the speech clip played through SDL_mixer and tapped for lip sync.
    class AvatarViewerApp {
    public:
        AvatarViewerApp(const std::string& app_name,
            const AvatarConfig& config,
            const std::string& rig_path,
            const std::string& script_path,
            bool use_microphone);
        ~AvatarViewerApp();

        AvatarViewerApp(const AvatarViewerApp&) = delete;
        AvatarViewerApp& operator=(const AvatarViewerApp&) = delete;

        // false when the character cannot be loaded.
        bool SetupScene();
        void Tick(double delta_time, double total_elapsed_time);
        bool IsFinished() const { return finished_; }

    private:
        void StartAudio();
        void StopAudio();
        void DriveAnalysis(double delta_time);
        void DeliverScript(double total_elapsed_time);
        void PrintLevel(double total_elapsed_time);

        std::string app_name_;
        AvatarConfig config_;
        std::string rig_path_;
        std::string script_path_;
        bool use_microphone_ = false;

        bool audio_open_ = false;
        Mix_Chunk* audio_clip_ = nullptr;
        int audio_channel_ = -1;
        std::shared_ptr<MixerChannelTrack> speech_track_;
        std::shared_ptr<CaptureDeviceTrack> mic_track_;

        JsonRigBackend backend_;
        std::unique_ptr<AvatarAnimator> animator_;
        std::unique_ptr<CommandBus> bus_;
        std::unique_ptr<AvatarController> controller_;
        std::shared_ptr<EnvelopeExtractor> extractor_;
        SessionScript script_;
        bool script_loaded_ = false;

        // 60 Hz analysis driver, decoupled from the frame rate.
        double analysis_accumulator_ = 0.0;
        double last_print_time_ = 0.0;
        bool finished_ = false;
    };

}  // namespace AVATAR

#endif
