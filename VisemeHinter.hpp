#ifndef VISEME_HINTER_H_
#define VISEME_HINTER_H_

#include <string>

namespace AVATAR {

    enum class VisemeShape {
        NeutralOpen,
        Narrow,
        Round
    };

    const char* ToString(VisemeShape shape);

    struct VisemeHint {
        VisemeShape shape = VisemeShape::NeutralOpen;
        double expires_at = 0.0;  // seconds, same clock as the frame driver
    };

    // Picks a coarse mouth shape from the last vowel of a transcript
    // fragment and holds it for a short window. A newer hint replaces the
    // live one.
    class VisemeHinter {
    public:
        static constexpr double kDefaultWindow = 0.180;

        explicit VisemeHinter(double window_sec = kDefaultWindow);

        // Returns true when the fragment produced a new hint.
        bool OnTranscript(const std::string& text, bool is_local, double now);

        VisemeShape ActiveShape(double now) const;
        bool HasLiveHint(double now) const;
        void Clear() { has_hint_ = false; }

        double GetWindow() const { return window_sec_; }
        void SetWindow(double window_sec) { window_sec_ = window_sec; }

        // false when `text` holds no vowel.
        static bool ShapeForText(const std::string& text, VisemeShape& shape);

    private:
        double window_sec_;
        bool has_hint_ = false;
        VisemeHint hint_;
    };

}  // namespace AVATAR

#endif
