/*
    tests/ProfileTest.h
    Signature matching and the per controller tables.
*/
#pragma once
#include <string.h>
#include "dpad.h"
#include "joy_profile.h"

struct ProfileTest {
  /** Names as the kernel reports them, any case. */
  static bool runSignatures() {
    return joy_match_model("HORI CO.,LTD. HORIPAD S") == JOY_HORIPAD &&
           joy_match_model("DragonRise Inc.   Generic   USB  Joystick  ") == JOY_DRAGONRISE &&
           joy_match_model("Logitech Logitech Extreme 3D") == JOY_LE3DP &&
           joy_match_model("Thrustmaster T.16000M") == JOY_T16K &&
           joy_match_model("Microsoft X-Box One S pad") == JOY_XBOX1 &&
           joy_match_model("Sony Interactive Entertainment Wireless Controller") == JOY_PS4 &&
           joy_match_model("Generic X-Box pad") == JOY_HORI_WHEEL &&
           joy_match_model("Some Other Gamepad") == -1 &&
           joy_match_model("") == -1;
  }

  /** The first signature in the list wins when a name carries two. */
  static bool runPriority() {
    return joy_match_model("HORIPAD GENERIC X-BOX PAD") == JOY_HORIPAD &&
           joy_match_model("generic x-box pad microsoft x-box one") == JOY_XBOX1;
  }

  /** Arcade sticks: left half drives the left stick, right half the right one. */
  static bool runDragonRiseHalves() {
    const joy_profile_t *left = joy_get_profile(JOY_DRAGONRISE, JOY_ROLE_LEFT);
    const joy_profile_t *right = joy_get_profile(JOY_DRAGONRISE, JOY_ROLE_RIGHT);
    if (!left || !right || left == right) return false;

    const joy_axis_t *lx = joy_profile_axis(left, 0);
    const joy_axis_t *rx = joy_profile_axis(right, 0);
    if (!lx || lx->type != JA_AXIS || lx->code != NS_AXIS_LX) return false;
    if (!rx || rx->type != JA_AXIS || rx->code != NS_AXIS_RX) return false;

    const joy_button_t *up = joy_profile_button(left, 3);
    if (!up || up->type != JB_DPAD || up->code != DPAD_BIT_UP) return false;

    const joy_button_t *a = joy_profile_button(right, 3);
    return a && a->type == JB_BUTTON && a->code == NS_BTN_A;
  }

  /** Indices past the table and reserved codes read as unmapped. */
  static bool runOutOfRange() {
    const joy_profile_t *xbox = joy_get_profile(JOY_XBOX1, JOY_ROLE_NONE);
    const joy_profile_t *t16k = joy_get_profile(JOY_T16K, JOY_ROLE_NONE);
    const joy_profile_t *ps4 = joy_get_profile(JOY_PS4, JOY_ROLE_NONE);

    return joy_profile_button(xbox, 11) == NULL &&
           joy_profile_button(xbox, -1) == NULL &&
           joy_profile_axis(xbox, 8) == NULL &&
           joy_profile_axis(xbox, 200) == NULL &&
           joy_profile_button(t16k, 13) != NULL &&
           joy_profile_button(t16k, 14) == NULL &&
           joy_profile_button(t16k, 15) == NULL &&
           joy_profile_axis(ps4, 2) == NULL &&
           joy_get_profile(JOY_MODEL_NUM, JOY_ROLE_NONE) == NULL;
  }

  /** Only the two T.16000M base buttons without a Switch counterpart are flagged. */
  static bool runValidation() {
    return joy_profiles_validate() == 2;
  }

  static bool runModelNames() {
    return !strcmp(joy_model_name(JOY_HORI_WHEEL), "Hori Mario Wheel") &&
           !strcmp(joy_model_name(JOY_PS4), "Sony PS4DS") &&
           !strcmp(joy_model_name(-1), "unknown");
  }
};
