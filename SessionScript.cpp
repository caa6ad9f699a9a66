#include "SessionScript.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

namespace AVATAR {

    using json = nlohmann::json;

    namespace {
        bool ReadTime(const json& entry, double& at) {
            if (!entry.is_object() || !entry.contains("at") || !entry["at"].is_number()) {
                return false;
            }
            at = entry["at"].get<double>();
            return at >= 0.0;
        }
    }  // namespace

    bool SessionScript::Load(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "[Script] ERROR: could not open session script " << path << "\n";
            return false;
        }

        json j;
        try {
            file >> j;
        }
        catch (const std::exception& e) {
            std::cerr << "[Script] ERROR: failed to parse session script (" << path << "): "
                << e.what() << "\n";
            return false;
        }
        return LoadFromJson(j);
    }

    bool SessionScript::LoadFromJson(const json& j) {
        if (!j.is_object()) {
            std::cerr << "[Script] ERROR: session script must be an object\n";
            return false;
        }

        audio_path_.clear();
        duration_ = 0.0;
        transcript_.clear();
        commands_.clear();
        Rewind();

        if (j.contains("audio") && j["audio"].is_string()) {
            audio_path_ = j["audio"].get<std::string>();
        }

        if (j.contains("transcript") && j["transcript"].is_array()) {
            for (const json& entry : j["transcript"]) {
                TranscriptEvent ev;
                if (!ReadTime(entry, ev.at) || !entry.contains("text") || !entry["text"].is_string()) {
                    std::cerr << "[Script] WARNING: skipping transcript entry " << entry.dump() << "\n";
                    continue;
                }
                ev.text = entry["text"].get<std::string>();
                if (entry.contains("local") && entry["local"].is_boolean()) {
                    ev.is_local = entry["local"].get<bool>();
                }
                transcript_.push_back(ev);
                duration_ = std::max(duration_, ev.at);
            }
        }

        if (j.contains("commands") && j["commands"].is_array()) {
            for (const json& entry : j["commands"]) {
                CommandEvent ev;
                if (!ReadTime(entry, ev.at) || !entry.contains("payload")) {
                    std::cerr << "[Script] WARNING: skipping command entry " << entry.dump() << "\n";
                    continue;
                }
                ev.payload = entry["payload"];
                commands_.push_back(ev);
                duration_ = std::max(duration_, ev.at);
            }
        }

        // Stable: events sharing a timestamp keep file order.
        std::stable_sort(transcript_.begin(), transcript_.end(),
            [](const TranscriptEvent& a, const TranscriptEvent& b) { return a.at < b.at; });
        std::stable_sort(commands_.begin(), commands_.end(),
            [](const CommandEvent& a, const CommandEvent& b) { return a.at < b.at; });

        if (j.contains("duration") && j["duration"].is_number()) {
            duration_ = std::max(duration_, j["duration"].get<double>());
        }

        std::cout << "[Script] loaded " << transcript_.size() << " transcript fragments, "
            << commands_.size() << " commands, " << duration_ << " s\n";
        return true;
    }

    void SessionScript::PopDue(double now, std::vector<TranscriptEvent>& transcript,
        std::vector<CommandEvent>& commands) {
        while (next_transcript_ < transcript_.size() && transcript_[next_transcript_].at <= now) {
            transcript.push_back(transcript_[next_transcript_++]);
        }
        while (next_command_ < commands_.size() && commands_[next_command_].at <= now) {
            commands.push_back(commands_[next_command_++]);
        }
    }

    bool SessionScript::IsDrained() const {
        return next_transcript_ >= transcript_.size() && next_command_ >= commands_.size();
    }

    bool SessionScript::IsFinished(double now, bool speech_playing, double tail) const {
        return !speech_playing && IsDrained() && now > duration_ + tail;
    }

    void SessionScript::Rewind() {
        next_transcript_ = 0;
        next_command_ = 0;
    }

}  // namespace AVATAR
