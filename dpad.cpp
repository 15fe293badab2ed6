#include "dpad.h"

// Opposite directions cancel out, whatever else is held.
static const uint8_t dpad_map[16] =
{
	//                        LDRU
	NS_DPAD_CENTERED,     //  0000
	NS_DPAD_UP,           //  0001
	NS_DPAD_RIGHT,        //  0010
	NS_DPAD_UP_RIGHT,     //  0011
	NS_DPAD_DOWN,         //  0100
	NS_DPAD_CENTERED,     //  0101
	NS_DPAD_DOWN_RIGHT,   //  0110
	NS_DPAD_CENTERED,     //  0111
	NS_DPAD_LEFT,         //  1000
	NS_DPAD_UP_LEFT,      //  1001
	NS_DPAD_CENTERED,     //  1010
	NS_DPAD_CENTERED,     //  1011
	NS_DPAD_DOWN_LEFT,    //  1100
	NS_DPAD_CENTERED,     //  1101
	NS_DPAD_CENTERED,     //  1110
	NS_DPAD_CENTERED      //  1111
};

NSDPad dpad_combine(uint8_t mask)
{
	return (NSDPad)dpad_map[mask & 0xF];
}
