#ifndef DPAD_H
#define DPAD_H

#include <inttypes.h>
#include "nsgamepad.h"

// bit positions in the 4 bit direction mask, LDRU from msb to lsb
#define DPAD_BIT_UP     0
#define DPAD_BIT_RIGHT  1
#define DPAD_BIT_DOWN   2
#define DPAD_BIT_LEFT   3

NSDPad dpad_combine(uint8_t mask);

// Direction pad synthesized from 4 discrete buttons
struct DPadBits
{
	uint8_t mask;

	DPadBits() : mask(0) {}

	NSDPad update(int bit, int pressed)
	{
		if (pressed) mask |= (uint8_t)(1 << bit);
		else mask &= (uint8_t)~(1 << bit);
		return dpad_combine(mask);
	}
};

#endif // DPAD_H
