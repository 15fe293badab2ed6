#include <stdio.h>
#include <string.h>

#include "nsgamepad.h"
#include "debug.h"

static const char *button_names[] = {
	"Y", "B", "A", "X", "L", "R", "ZL", "ZR", "Minus", "Plus",
	"LStick", "RStick", "Home", "Capture", "Reserved1", "Reserved2"
};

static const char *dpad_names[] = {
	"U", "UR", "R", "DR", "D", "DL", "L", "UL",
	"?", "?", "?", "?", "?", "?", "?", "0"
};

static const char *axis_names[] = { "LX", "LY", "RX", "RY" };

void ns_report_reset(ns_report_t *report)
{
	report->buttons = 0;
	report->dpad = NS_DPAD_CENTERED;
	for (int i = 0; i < NS_AXIS_NUM; i++) report->axis[i] = NS_AXIS_CENTER;
}

const char *ns_button_name(int button)
{
	if (button < 0 || button >= (int)(sizeof(button_names) / sizeof(button_names[0]))) return "?";
	return button_names[button];
}

const char *ns_dpad_name(int direction)
{
	if (direction < 0 || direction > NS_DPAD_CENTERED) return "?";
	return dpad_names[direction];
}

SharedGamepad::SharedGamepad(GamepadWire *wire)
	: wire(wire)
{
	pthread_mutex_init(&lock, nullptr);
	ns_report_reset(&report);
}

SharedGamepad::~SharedGamepad()
{
	pthread_mutex_destroy(&lock);
}

// lock must be held
void SharedGamepad::commit()
{
	if (wire) wire->send(&report);
}

void SharedGamepad::press(NSButton button)
{
	if ((int)button < 0 || button >= NS_BTN_NUM)
	{
		printf("PAD: press of invalid button %d ignored\n", (int)button);
		return;
	}

	pthread_mutex_lock(&lock);
	pad_debugf("press %s", ns_button_name(button));
	report.buttons |= (uint16_t)(1 << button);
	commit();
	pthread_mutex_unlock(&lock);
}

void SharedGamepad::release(NSButton button)
{
	if ((int)button < 0 || button >= NS_BTN_NUM)
	{
		printf("PAD: release of invalid button %d ignored\n", (int)button);
		return;
	}

	pthread_mutex_lock(&lock);
	pad_debugf("release %s", ns_button_name(button));
	report.buttons &= (uint16_t)~(1 << button);
	commit();
	pthread_mutex_unlock(&lock);
}

void SharedGamepad::set_axis(NSAxis axis, uint8_t value)
{
	if ((int)axis < 0 || axis >= NS_AXIS_NUM) return;

	pthread_mutex_lock(&lock);
	pad_debugf("axis %s = %u", axis_names[axis], value);
	report.axis[axis] = value;
	commit();
	pthread_mutex_unlock(&lock);
}

void SharedGamepad::set_left_axis(uint8_t x, uint8_t y)
{
	pthread_mutex_lock(&lock);
	pad_debugf("left axis x: %u / y: %u", x, y);
	report.axis[NS_AXIS_LX] = x;
	report.axis[NS_AXIS_LY] = y;
	commit();
	pthread_mutex_unlock(&lock);
}

void SharedGamepad::set_right_axis(uint8_t x, uint8_t y)
{
	pthread_mutex_lock(&lock);
	pad_debugf("right axis x: %u / y: %u", x, y);
	report.axis[NS_AXIS_RX] = x;
	report.axis[NS_AXIS_RY] = y;
	commit();
	pthread_mutex_unlock(&lock);
}

void SharedGamepad::set_dpad(NSDPad direction)
{
	if ((int)direction < 0 || (direction > NS_DPAD_UP_LEFT && direction != NS_DPAD_CENTERED))
	{
		printf("PAD: invalid dpad direction %d ignored\n", (int)direction);
		return;
	}

	pthread_mutex_lock(&lock);
	pad_debugf("dpad [%s]", ns_dpad_name(direction));
	report.dpad = direction;
	commit();
	pthread_mutex_unlock(&lock);
}

void SharedGamepad::release_all()
{
	pthread_mutex_lock(&lock);
	pad_debugf("release all");
	ns_report_reset(&report);
	commit();
	pthread_mutex_unlock(&lock);
}

void SharedGamepad::snapshot(ns_report_t *out)
{
	pthread_mutex_lock(&lock);
	memcpy(out, &report, sizeof(report));
	pthread_mutex_unlock(&lock);
}
