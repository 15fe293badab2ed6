#ifndef JOY_DECODER_H
#define JOY_DECODER_H

#include <inttypes.h>
#include <sys/types.h>
#include <linux/joystick.h>
#include <atomic>

#include "joy_profile.h"
#include "joy_host.h"
#include "dpad.h"

// false for anything but one complete record
bool js_parse_record(const void *buf, ssize_t len, struct js_event *ev);

// Turns the event stream of one device into gamepad calls. Owned by the
// thread reading that device, nothing in here is shared.
class JoyDecoder
{
public:
	JoyDecoder(const joy_profile_t *profile, GamepadSink *sink);

	void handle(const struct js_event *ev);

	// Reads until the device goes away or stop is raised, then closes fd.
	// Returns the number of events handled.
	int run(JoyHost *host, int fd, const std::atomic<bool> *stop = NULL);

private:
	void handle_button(int index, int16_t value);
	void handle_axis(int index, int16_t value);
	void handle_hat(int neg_bit, int pos_bit, uint8_t q);

	const joy_profile_t *profile;
	GamepadSink *sink;

	DPadBits dpad;
	int last_value[JOY_MAX_AXES];
	int last_pressed[JOY_MAX_AXES];
};

#endif // JOY_DECODER_H
