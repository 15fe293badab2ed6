/*
    tests/DPadCombinerTest.h
    Four direction bits to one of nine hat positions.
*/
#pragma once
#include "dpad.h"

struct DPadCombinerTest {
  /** All 16 masks, bit order L D R U. */
  static bool runTable() {
    static const NSDPad expected[16] = {
        NS_DPAD_CENTERED,   NS_DPAD_UP,         NS_DPAD_RIGHT,
        NS_DPAD_UP_RIGHT,   NS_DPAD_DOWN,       NS_DPAD_CENTERED,
        NS_DPAD_DOWN_RIGHT, NS_DPAD_CENTERED,   NS_DPAD_LEFT,
        NS_DPAD_UP_LEFT,    NS_DPAD_CENTERED,   NS_DPAD_CENTERED,
        NS_DPAD_DOWN_LEFT,  NS_DPAD_CENTERED,   NS_DPAD_CENTERED,
        NS_DPAD_CENTERED};

    for (int mask = 0; mask < 16; mask++) {
      if (dpad_combine((uint8_t)mask) != expected[mask]) return false;
    }
    return true;
  }

  /** Up with down, or left with right, is centered whatever else is held. */
  static bool runOppositesCancel() {
    const uint8_t up_down = (1 << DPAD_BIT_UP) | (1 << DPAD_BIT_DOWN);
    const uint8_t left_right = (1 << DPAD_BIT_LEFT) | (1 << DPAD_BIT_RIGHT);

    for (int mask = 0; mask < 16; mask++) {
      bool opposite = (mask & up_down) == up_down || (mask & left_right) == left_right;
      if (opposite && dpad_combine((uint8_t)mask) != NS_DPAD_CENTERED) return false;
    }
    return true;
  }

  /** Buttons held and let go one at a time. */
  static bool runBits() {
    DPadBits bits;
    if (bits.update(DPAD_BIT_UP, 1) != NS_DPAD_UP) return false;
    if (bits.update(DPAD_BIT_LEFT, 1) != NS_DPAD_UP_LEFT) return false;
    if (bits.update(DPAD_BIT_RIGHT, 1) != NS_DPAD_CENTERED) return false;
    if (bits.update(DPAD_BIT_LEFT, 0) != NS_DPAD_UP_RIGHT) return false;
    if (bits.update(DPAD_BIT_UP, 0) != NS_DPAD_RIGHT) return false;
    if (bits.update(DPAD_BIT_RIGHT, 0) != NS_DPAD_CENTERED) return false;
    return bits.mask == 0;
  }
};
