#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <poll.h>

#include "joy_decoder.h"
#include "debug.h"

bool js_parse_record(const void *buf, ssize_t len, struct js_event *ev)
{
	if (len != (ssize_t)sizeof(struct js_event)) return false;
	memcpy(ev, buf, sizeof(struct js_event));
	return true;
}

JoyDecoder::JoyDecoder(const joy_profile_t *profile, GamepadSink *sink)
	: profile(profile), sink(sink)
{
	for (int i = 0; i < JOY_MAX_AXES; i++)
	{
		last_value[i] = -1;
		last_pressed[i] = -1;
	}
}

void JoyDecoder::handle(const struct js_event *ev)
{
	// synthetic state dump sent right after open
	if (ev->type & JS_EVENT_INIT) return;

	switch (ev->type)
	{
	case JS_EVENT_BUTTON:
		handle_button(ev->number, ev->value);
		break;

	case JS_EVENT_AXIS:
		handle_axis(ev->number, ev->value);
		break;

	default:
		joy_debugf("%s: unknown event type 0x%02X", profile->name, ev->type);
		break;
	}
}

void JoyDecoder::handle_button(int index, int16_t value)
{
	const joy_button_t *b = joy_profile_button(profile, index);
	if (!b)
	{
		joy_debugf("%s: button %d not mapped", profile->name, index);
		return;
	}

	if (b->type == JB_DPAD)
	{
		sink->set_dpad(dpad.update(b->code, value));
		return;
	}

	if (value) sink->press((NSButton)b->code);
	else sink->release((NSButton)b->code);
}

void JoyDecoder::handle_hat(int neg_bit, int pos_bit, uint8_t q)
{
	dpad.mask &= (uint8_t)~((1 << neg_bit) | (1 << pos_bit));
	if (q < 64) dpad.mask |= (uint8_t)(1 << neg_bit);
	else if (q > 192) dpad.mask |= (uint8_t)(1 << pos_bit);

	sink->set_dpad(dpad_combine(dpad.mask));
}

void JoyDecoder::handle_axis(int index, int16_t value)
{
	const joy_axis_t *a = joy_profile_axis(profile, index);
	if (!a) return;

	uint8_t q = joy_quantize(value);
	joy_debugf("%s: axis %d = %d (%u)", profile->name, index, value, q);

	switch (a->type)
	{
	case JA_AXIS:
		if (a->dedupe && last_value[index] == q) return;
		last_value[index] = q;
		sink->set_axis((NSAxis)a->code, q);
		break;

	case JA_BUTTON:
		{
			int pressed = (q > a->threshold);
			if (a->dedupe && last_pressed[index] == pressed) return;
			last_pressed[index] = pressed;

			if (pressed) sink->press((NSButton)a->code);
			else sink->release((NSButton)a->code);
		}
		break;

	case JA_HAT_X:
		handle_hat(DPAD_BIT_LEFT, DPAD_BIT_RIGHT, q);
		break;

	case JA_HAT_Y:
		handle_hat(DPAD_BIT_UP, DPAD_BIT_DOWN, q);
		break;
	}
}

int JoyDecoder::run(JoyHost *host, int fd, const std::atomic<bool> *stop)
{
	int count = 0;
	uint8_t buf[sizeof(struct js_event)];
	struct js_event ev;

	while (!stop || !*stop)
	{
		struct pollfd pfd = { fd, POLLIN, 0 };
		int r = poll(&pfd, 1, 100);
		if (r < 0)
		{
			if (errno == EINTR) continue;
			joy_debugf("%s: poll: %s", profile->name, strerror(errno));
			break;
		}
		if (!r) continue;

		ssize_t ret = host->read_dev(fd, buf, sizeof(buf));
		if (ret < 0 && errno == EINTR) continue;
		if (ret <= 0)
		{
			if (ret < 0) joy_debugf("%s: read: %s", profile->name, strerror(errno));
			break;
		}

		if (!js_parse_record(buf, ret, &ev))
		{
			joy_debugf("%s: short record (%d bytes) skipped", profile->name, (int)ret);
			continue;
		}

		handle(&ev);
		count++;
	}

	host->close_dev(fd);
	return count;
}
