/*
This file contains lookup information on known controllers
*/

#include <stdio.h>
#include <string.h>

#include "joy_profile.h"
#include "dpad.h"
#include "str_util.h"

#define BTN(b)            { JB_BUTTON, NS_BTN_##b }
#define DPAD(d)           { JB_DPAD, DPAD_BIT_##d }

#define AXIS(a)           { JA_AXIS, NS_AXIS_##a, 0, 0 }
#define AXIS_DEDUPE(a)    { JA_AXIS, NS_AXIS_##a, 0, 1 }
#define THROTTLE(b, t)    { JA_BUTTON, NS_BTN_##b, t, 0 }
#define THROTTLE_DEDUPE(b, t) { JA_BUTTON, NS_BTN_##b, t, 1 }
#define HAT_X             { JA_HAT_X, 0, 0, 0 }
#define HAT_Y             { JA_HAT_Y, 0, 0, 0 }
#define NOAXIS            { JA_IGNORE, 0, 0, 0 }

#define ARRAY_NUM(a)      ((int)(sizeof(a) / sizeof((a)[0])))
#define PROFILE(n, b, a)  { n, b, ARRAY_NUM(b), a, ARRAY_NUM(a) }

/*****************************************************************************/
// Hori HoriPad, a Switch compatible gamepad: buttons and axes map straight through.

static const joy_button_t horipad_buttons[] =
{
	BTN(Y), BTN(B), BTN(A), BTN(X),
	BTN(LEFT_TRIGGER), BTN(RIGHT_TRIGGER), BTN(LEFT_THROTTLE), BTN(RIGHT_THROTTLE),
	BTN(MINUS), BTN(PLUS), BTN(LEFT_STICK), BTN(RIGHT_STICK),
	BTN(HOME), BTN(CAPTURE)
};

static const joy_axis_t horipad_axes[] =
{
	AXIS(LX), AXIS(LY),
	AXIS(RX), AXIS(RY),
	HAT_X, HAT_Y
};

/*****************************************************************************/
// Hori Mario Kart racing wheel. The pedals are analog throttles, the wheel
// resends its position constantly so repeats are dropped.

static const joy_button_t hori_wheel_buttons[] =
{
	BTN(A), BTN(B), BTN(X), BTN(Y),
	BTN(LEFT_TRIGGER), BTN(RIGHT_TRIGGER),
	BTN(MINUS), BTN(PLUS), BTN(HOME),
	BTN(LEFT_STICK), BTN(RIGHT_STICK)
};

static const joy_axis_t hori_wheel_axes[] =
{
	AXIS_DEDUPE(LX),
	AXIS(LY),
	THROTTLE_DEDUPE(LEFT_THROTTLE, 64),
	AXIS(RX),
	AXIS(RY),
	THROTTLE_DEDUPE(RIGHT_THROTTLE, 64),
	HAT_X, HAT_Y
};

/*****************************************************************************/
// Xbox One gamepad. Face buttons follow position, not label:
//
//         Y                 X
//     X       B   ->    Y       A
//         A                 B
//
// Throttles are analog, the console only knows on/off.

static const joy_button_t xbox1_buttons[] =
{
	BTN(B), BTN(A), BTN(Y), BTN(X),
	BTN(LEFT_TRIGGER), BTN(RIGHT_TRIGGER),
	BTN(MINUS),          // windows
	BTN(PLUS),           // lines
	BTN(HOME),           // logo
	BTN(LEFT_STICK), BTN(RIGHT_STICK)
};

static const joy_axis_t xbox1_axes[] =
{
	AXIS(LX), AXIS(LY),
	THROTTLE(LEFT_THROTTLE, 128),
	AXIS(RX), AXIS(RY),
	THROTTLE(RIGHT_THROTTLE, 128),
	HAT_X, HAT_Y
};

/*****************************************************************************/
// Sony PS4 DualShock. Throttles show up both as axes and as buttons, the
// buttons are used.

static const joy_button_t ps4_buttons[] =
{
	BTN(B),              // cross
	BTN(A),              // circle
	BTN(Y),              // triangle
	BTN(X),              // square
	BTN(LEFT_TRIGGER), BTN(RIGHT_TRIGGER),
	BTN(LEFT_THROTTLE), BTN(RIGHT_THROTTLE),
	BTN(MINUS),          // share
	BTN(PLUS),           // options
	BTN(HOME),
	BTN(LEFT_STICK), BTN(RIGHT_STICK)
};

static const joy_axis_t ps4_axes[] =
{
	AXIS(LX), AXIS(LY),
	NOAXIS,
	AXIS(RX), AXIS(RY),
	NOAXIS,
	HAT_X, HAT_Y
};

/*****************************************************************************/
// DragonRise arcade stick: 1 stick and up to 12 buttons. Two of them make one
// gamepad, the left one also emulates the direction pad with 4 buttons.

static const joy_button_t dragonrise_left_buttons[] =
{
	BTN(LEFT_THROTTLE), BTN(LEFT_TRIGGER), BTN(MINUS),
	DPAD(UP), DPAD(RIGHT), DPAD(DOWN), DPAD(LEFT),
	BTN(LEFT_STICK),
	BTN(CAPTURE), BTN(CAPTURE), BTN(CAPTURE), BTN(CAPTURE)
};

static const joy_axis_t dragonrise_left_axes[] =
{
	AXIS(LX), AXIS(LY)
};

static const joy_button_t dragonrise_right_buttons[] =
{
	BTN(RIGHT_THROTTLE), BTN(RIGHT_TRIGGER), BTN(PLUS),
	BTN(A), BTN(B), BTN(X), BTN(Y),
	BTN(RIGHT_STICK),
	BTN(HOME), BTN(HOME), BTN(HOME), BTN(HOME)
};

static const joy_axis_t dragonrise_right_axes[] =
{
	AXIS(RX), AXIS(RY)
};

/*****************************************************************************/
// Logitech Extreme 3D Pro flight stick. Stick X,Y drive the left thumbstick,
// the hat switch drives the right one. Twist and throttle lever are unused.
//
// 0 front trigger, 1 side thumb, 2/3 top large left/right, 4/5 top small
// left/right, base:  7 9 11
//                    6 8 10

static const joy_button_t le3dp_buttons[] =
{
	BTN(A), BTN(B), BTN(X), BTN(Y),
	BTN(LEFT_TRIGGER), BTN(RIGHT_TRIGGER),
	BTN(MINUS), BTN(PLUS), BTN(CAPTURE), BTN(HOME),
	BTN(LEFT_THROTTLE), BTN(RIGHT_THROTTLE)
};

static const joy_axis_t le3dp_axes[] =
{
	AXIS(LX), AXIS(LY),
	NOAXIS,              // twist
	NOAXIS,              // throttle lever
	AXIS(RX), AXIS(RY)
};

/*****************************************************************************/
// Thrustmaster T.16000M flight stick, same axis layout as the Logitech.
//
// 0 trigger, 1 top center, 2 top left, 3 top right
// base left:  4          base right:    10
//             9 5                    11 15
//               8 6               12 14
//                 7               13

static const joy_button_t t16k_buttons[] =
{
	BTN(A), BTN(B), BTN(X), BTN(Y),
	BTN(LEFT_TRIGGER), BTN(RIGHT_TRIGGER),
	BTN(MINUS), BTN(PLUS), BTN(CAPTURE), BTN(HOME),
	BTN(LEFT_STICK), BTN(RIGHT_STICK),
	BTN(LEFT_THROTTLE), BTN(RIGHT_THROTTLE),
	// base right 14/15 have no Switch button, validation reports them
	BTN(RESERVED1), BTN(RESERVED2)
};

static const joy_axis_t t16k_axes[] =
{
	AXIS(LX), AXIS(LY),
	NOAXIS,              // twist
	NOAXIS,              // throttle lever
	AXIS(RX), AXIS(RY)
};

/*****************************************************************************/

static const joy_profile_t profiles[] =
{
	PROFILE("HoriPad", horipad_buttons, horipad_axes),
	PROFILE("Dragon Rise (left)", dragonrise_left_buttons, dragonrise_left_axes),
	PROFILE("Dragon Rise (right)", dragonrise_right_buttons, dragonrise_right_axes),
	PROFILE("Logitech Extreme 3D Pro", le3dp_buttons, le3dp_axes),
	PROFILE("Thrustmaster T.16000M", t16k_buttons, t16k_axes),
	PROFILE("Xbox One", xbox1_buttons, xbox1_axes),
	PROFILE("Sony PS4DS", ps4_buttons, ps4_axes),
	PROFILE("Hori Mario Wheel", hori_wheel_buttons, hori_wheel_axes),
};

enum
{
	PRF_HORIPAD = 0,
	PRF_DRAGONRISE_LEFT,
	PRF_DRAGONRISE_RIGHT,
	PRF_LE3DP,
	PRF_T16K,
	PRF_XBOX1,
	PRF_PS4,
	PRF_HORI_WHEEL
};

// matched in this order against the upper-cased device name
static const struct
{
	const char *signature;
	int model;
	const char *name;
} signatures[] =
{
	{ "HORIPAD", JOY_HORIPAD, "HoriPad" },
	{ "DRAGONRISE INC.", JOY_DRAGONRISE, "Dragon Rise" },
	{ "LOGITECH EXTREME 3D", JOY_LE3DP, "Logitech Extreme 3D Pro" },
	{ "THRUSTMASTER T.16000M", JOY_T16K, "Thrustmaster T.16000M" },
	{ "MICROSOFT X-BOX ONE", JOY_XBOX1, "Xbox One" },
	{ "SONY INTERACTIVE ENTERTAINMENT WIRELESS CONTROLLER", JOY_PS4, "Sony PS4DS" },
	{ "GENERIC X-BOX PAD", JOY_HORI_WHEEL, "Hori Mario Wheel" },
};

uint8_t joy_quantize(int16_t raw)
{
	return (uint8_t)(((int32_t)raw + 32768) >> 8);
}

int joy_match_model(const char *name)
{
	char upper[256];
	strcpyz(upper, name);
	str_toupper(upper);

	for (int i = 0; i < ARRAY_NUM(signatures); i++)
	{
		if (strstr(upper, signatures[i].signature)) return signatures[i].model;
	}

	return -1;
}

const char *joy_model_name(int model)
{
	for (int i = 0; i < ARRAY_NUM(signatures); i++)
	{
		if (signatures[i].model == model) return signatures[i].name;
	}

	return "unknown";
}

const joy_profile_t *joy_get_profile(int model, int role)
{
	switch (model)
	{
	case JOY_HORIPAD:    return &profiles[PRF_HORIPAD];
	case JOY_DRAGONRISE: return &profiles[(role == JOY_ROLE_RIGHT) ? PRF_DRAGONRISE_RIGHT : PRF_DRAGONRISE_LEFT];
	case JOY_LE3DP:      return &profiles[PRF_LE3DP];
	case JOY_T16K:       return &profiles[PRF_T16K];
	case JOY_XBOX1:      return &profiles[PRF_XBOX1];
	case JOY_PS4:        return &profiles[PRF_PS4];
	case JOY_HORI_WHEEL: return &profiles[PRF_HORI_WHEEL];
	}

	return NULL;
}

static bool button_valid(const joy_button_t *b)
{
	switch (b->type)
	{
	case JB_BUTTON: return b->code < NS_BTN_NUM;
	case JB_DPAD:   return b->code <= DPAD_BIT_LEFT;
	}
	return false;
}

static bool axis_valid(const joy_axis_t *a)
{
	switch (a->type)
	{
	case JA_AXIS:   return a->code < NS_AXIS_NUM;
	case JA_BUTTON: return a->code < NS_BTN_NUM;
	case JA_HAT_X:
	case JA_HAT_Y:  return true;
	}
	return false;
}

const joy_button_t *joy_profile_button(const joy_profile_t *profile, int index)
{
	if (index < 0 || index >= profile->nbuttons) return NULL;

	const joy_button_t *b = &profile->buttons[index];
	return button_valid(b) ? b : NULL;
}

const joy_axis_t *joy_profile_axis(const joy_profile_t *profile, int index)
{
	if (index < 0 || index >= profile->naxes || index >= JOY_MAX_AXES) return NULL;

	const joy_axis_t *a = &profile->axes[index];
	return axis_valid(a) ? a : NULL;
}

int joy_profiles_validate()
{
	int flagged = 0;

	for (int n = 0; n < ARRAY_NUM(profiles); n++)
	{
		const joy_profile_t *p = &profiles[n];

		for (int i = 0; i < p->nbuttons; i++)
		{
			const joy_button_t *b = &p->buttons[i];
			if (b->type != JB_UNMAPPED && !button_valid(b))
			{
				printf("Profile %s: button %d maps to undefined code %d, left unmapped.\n", p->name, i, b->code);
				flagged++;
			}
		}

		if (p->naxes > JOY_MAX_AXES)
		{
			printf("Profile %s: %d axes, only %d used.\n", p->name, p->naxes, JOY_MAX_AXES);
			flagged++;
		}

		for (int i = 0; i < p->naxes; i++)
		{
			const joy_axis_t *a = &p->axes[i];
			if (a->type != JA_IGNORE && !axis_valid(a))
			{
				printf("Profile %s: axis %d maps to undefined code %d, ignored.\n", p->name, i, a->code);
				flagged++;
			}
		}
	}

	return flagged;
}
