#ifndef SESSION_SCRIPT_H_
#define SESSION_SCRIPT_H_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace AVATAR {

    struct TranscriptEvent {
        double at = 0.0;  // seconds from session start
        std::string text;
        bool is_local = false;
    };

    struct CommandEvent {
        double at = 0.0;
        nlohmann::json payload;  // any accepted command wire shape
    };

    // Timed replay of what a live session would deliver:
    //
    //   { "audio": "speech.wav", "duration": 12.0,
    //     "transcript": [ { "at": 0.4, "text": "hello", "local": false }, ... ],
    //     "commands":   [ { "at": 1.0, "payload": { "type": "playEmote", ... } }, ... ] }
    class SessionScript {
    public:
        bool Load(const std::string& path);
        bool LoadFromJson(const nlohmann::json& j);

        // Moves every event with at <= now into the output lists.
        void PopDue(double now, std::vector<TranscriptEvent>& transcript,
            std::vector<CommandEvent>& commands);

        bool IsDrained() const;
        // Drained, past duration + tail, and no speech clip still playing.
        bool IsFinished(double now, bool speech_playing, double tail) const;
        void Rewind();

        const std::string& GetAudioPath() const { return audio_path_; }
        double GetDuration() const { return duration_; }
        std::size_t GetTranscriptCount() const { return transcript_.size(); }
        std::size_t GetCommandCount() const { return commands_.size(); }

    private:
        std::string audio_path_;
        double duration_ = 0.0;
        std::vector<TranscriptEvent> transcript_;
        std::vector<CommandEvent> commands_;
        std::size_t next_transcript_ = 0;
        std::size_t next_command_ = 0;
    };

}  // namespace AVATAR

#endif
