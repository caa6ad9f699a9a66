#include "VisemeHinter.hpp"

#include <cctype>

namespace AVATAR {

    constexpr double VisemeHinter::kDefaultWindow;

    const char* ToString(VisemeShape shape) {
        switch (shape) {
        case VisemeShape::NeutralOpen: return "open";
        case VisemeShape::Narrow:      return "narrow";
        case VisemeShape::Round:       return "round";
        }
        return "open";
    }

    VisemeHinter::VisemeHinter(double window_sec)
        : window_sec_(window_sec) {
    }

    bool VisemeHinter::OnTranscript(const std::string& text, bool is_local, double now) {
        // Only the agent's speech shapes the mouth.
        if (is_local || text.empty()) {
            return false;
        }

        VisemeShape shape;
        if (!ShapeForText(text, shape)) {
            return false;
        }

        hint_.shape = shape;
        hint_.expires_at = now + window_sec_;
        has_hint_ = true;
        return true;
    }

    VisemeShape VisemeHinter::ActiveShape(double now) const {
        return HasLiveHint(now) ? hint_.shape : VisemeShape::NeutralOpen;
    }

    bool VisemeHinter::HasLiveHint(double now) const {
        return has_hint_ && now < hint_.expires_at;
    }

    bool VisemeHinter::ShapeForText(const std::string& text, VisemeShape& shape) {
        for (auto it = text.rbegin(); it != text.rend(); ++it) {
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(*it)));
            switch (c) {
            case 'u':
                shape = VisemeShape::Round;
                return true;
            case 'i':
            case 'e':
                shape = VisemeShape::Narrow;
                return true;
            case 'a':
            case 'o':
                shape = VisemeShape::NeutralOpen;
                return true;
            default:
                break;
            }
        }
        return false;
    }

}  // namespace AVATAR
