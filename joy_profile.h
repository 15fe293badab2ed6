/*****************************************************************************/
// Button and axis layouts of the supported controllers
/*****************************************************************************/

#ifndef JOY_PROFILE_H
#define JOY_PROFILE_H

#include <inttypes.h>
#include "nsgamepad.h"

#define JOY_MAX_AXES 16

enum JoyButtonType
{
	JB_UNMAPPED = 0,
	JB_BUTTON,        // code is a NSButton
	JB_DPAD           // code is a DPAD_BIT_*
};

typedef struct
{
	uint8_t type;
	uint8_t code;
} joy_button_t;

enum JoyAxisType
{
	JA_IGNORE = 0,
	JA_AXIS,          // code is a NSAxis
	JA_BUTTON,        // code is a NSButton, pressed while value > threshold
	JA_HAT_X,         // left/right half of a hat switch reported as axis
	JA_HAT_Y          // up/down half
};

typedef struct
{
	uint8_t type;
	uint8_t code;
	uint8_t threshold;
	uint8_t dedupe;   // drop calls that repeat the previous value/state
} joy_axis_t;

typedef struct
{
	const char *name;
	const joy_button_t *buttons;
	int nbuttons;
	const joy_axis_t *axes;
	int naxes;
} joy_profile_t;

enum JoyModel
{
	JOY_HORIPAD = 0,
	JOY_DRAGONRISE,
	JOY_LE3DP,
	JOY_T16K,
	JOY_XBOX1,
	JOY_PS4,
	JOY_HORI_WHEEL,
	JOY_MODEL_NUM
};

// Arcade sticks only supply half a gamepad each
enum JoyRole
{
	JOY_ROLE_NONE = 0,
	JOY_ROLE_LEFT,
	JOY_ROLE_RIGHT
};

uint8_t joy_quantize(int16_t raw);

int joy_match_model(const char *name);
const char *joy_model_name(int model);
const joy_profile_t *joy_get_profile(int model, int role);

const joy_button_t *joy_profile_button(const joy_profile_t *profile, int index);
const joy_axis_t *joy_profile_axis(const joy_profile_t *profile, int index);

int joy_profiles_validate();

#endif // JOY_PROFILE_H
