#include <unity.h>

#include "VisemeHinter.hpp"

using namespace AVATAR;

void setUp(void) {
}

void tearDown(void) {
}

static int Shape(VisemeShape s) {
    return static_cast<int>(s);
}

void test_last_vowel_picks_the_shape(void) {
    VisemeShape shape = VisemeShape::NeutralOpen;

    TEST_ASSERT_TRUE(VisemeHinter::ShapeForText("thank you", shape));
    TEST_ASSERT_EQUAL_INT(Shape(VisemeShape::Round), Shape(shape));

    TEST_ASSERT_TRUE(VisemeHinter::ShapeForText("I see", shape));
    TEST_ASSERT_EQUAL_INT(Shape(VisemeShape::Narrow), Shape(shape));

    TEST_ASSERT_TRUE(VisemeHinter::ShapeForText("Hi", shape));
    TEST_ASSERT_EQUAL_INT(Shape(VisemeShape::Narrow), Shape(shape));

    TEST_ASSERT_TRUE(VisemeHinter::ShapeForText("hello!", shape));
    TEST_ASSERT_EQUAL_INT(Shape(VisemeShape::NeutralOpen), Shape(shape));

    TEST_ASSERT_TRUE(VisemeHinter::ShapeForText("GOTCHA", shape));
    TEST_ASSERT_EQUAL_INT(Shape(VisemeShape::NeutralOpen), Shape(shape));

    TEST_ASSERT_FALSE(VisemeHinter::ShapeForText("hmm... shh", shape));
}

void test_local_and_empty_fragments_are_ignored(void) {
    VisemeHinter hinter;
    TEST_ASSERT_FALSE(hinter.OnTranscript("you", true, 1.0));
    TEST_ASSERT_FALSE(hinter.OnTranscript("", false, 1.0));
    TEST_ASSERT_FALSE(hinter.HasLiveHint(1.0));
}

void test_hint_expires_after_window(void) {
    VisemeHinter hinter;
    const double t = 2.0;
    TEST_ASSERT_TRUE(hinter.OnTranscript("you", false, t));

    TEST_ASSERT_EQUAL_INT(Shape(VisemeShape::Round), Shape(hinter.ActiveShape(t)));
    TEST_ASSERT_EQUAL_INT(Shape(VisemeShape::Round), Shape(hinter.ActiveShape(t + 0.1)));
    TEST_ASSERT_EQUAL_INT(Shape(VisemeShape::NeutralOpen), Shape(hinter.ActiveShape(t + 0.2)));
    TEST_ASSERT_FALSE(hinter.HasLiveHint(t + 0.2));
}

void test_last_hint_wins(void) {
    VisemeHinter hinter;
    hinter.OnTranscript("you", false, 1.00);
    hinter.OnTranscript("see", false, 1.05);
    TEST_ASSERT_EQUAL_INT(Shape(VisemeShape::Narrow), Shape(hinter.ActiveShape(1.10)));

    // A vowel-less fragment leaves the live hint alone.
    TEST_ASSERT_FALSE(hinter.OnTranscript("hmm", false, 1.10));
    TEST_ASSERT_EQUAL_INT(Shape(VisemeShape::Narrow), Shape(hinter.ActiveShape(1.15)));

    // The newer hint also restarts the window.
    TEST_ASSERT_TRUE(hinter.ActiveShape(1.22) == VisemeShape::Narrow);
    TEST_ASSERT_TRUE(hinter.ActiveShape(1.24) == VisemeShape::NeutralOpen);
}

void test_window_is_configurable(void) {
    VisemeHinter hinter(0.5);
    hinter.OnTranscript("ooh", false, 0.0);
    TEST_ASSERT_TRUE(hinter.HasLiveHint(0.4));
    hinter.Clear();
    TEST_ASSERT_FALSE(hinter.HasLiveHint(0.4));
}

int main(void) {
    UNITY_BEGIN();
    RUN_TEST(test_last_vowel_picks_the_shape);
    RUN_TEST(test_local_and_empty_fragments_are_ignored);
    RUN_TEST(test_hint_expires_after_window);
    RUN_TEST(test_last_hint_wins);
    RUN_TEST(test_window_is_configurable);
    return UNITY_END();
}
