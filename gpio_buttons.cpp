#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/gpio.h>

#include "gpio_buttons.h"
#include "debug.h"

#define GPIO_DPAD 0x80

// BCM line numbers on the 40 pin header
static const struct
{
	unsigned line;
	uint8_t code;  // NSButton, or GPIO_DPAD | DPAD_BIT_*
} gpio_map[] =
{
	// left joy-con half
	{ 4,  NS_BTN_LEFT_THROTTLE },
	{ 17, NS_BTN_LEFT_TRIGGER },
	{ 27, NS_BTN_MINUS },
	{ 22, NS_BTN_CAPTURE },
	{ 5,  GPIO_DPAD | DPAD_BIT_UP },
	{ 6,  GPIO_DPAD | DPAD_BIT_RIGHT },
	{ 13, GPIO_DPAD | DPAD_BIT_DOWN },
	{ 19, GPIO_DPAD | DPAD_BIT_LEFT },
	{ 26, NS_BTN_LEFT_STICK },

	// right joy-con half
	{ 23, NS_BTN_RIGHT_THROTTLE },
	{ 24, NS_BTN_RIGHT_TRIGGER },
	{ 25, NS_BTN_PLUS },
	{ 8,  NS_BTN_HOME },
	{ 7,  NS_BTN_A },
	{ 12, NS_BTN_B },
	{ 16, NS_BTN_X },
	{ 20, NS_BTN_Y },
	{ 21, NS_BTN_RIGHT_STICK },
};

#define GPIO_MAP_NUM ((int)(sizeof(gpio_map) / sizeof(gpio_map[0])))

int GpioButtons::line_count()
{
	return GPIO_MAP_NUM;
}

GpioButtons::GpioButtons(GamepadSink *sink)
	: sink(sink), fd(-1), thread(), running(false), quit(false)
{
}

GpioButtons::~GpioButtons()
{
	stop();
}

bool GpioButtons::handle_edge(unsigned line, bool press)
{
	for (int i = 0; i < GPIO_MAP_NUM; i++)
	{
		if (gpio_map[i].line != line) continue;

		uint8_t code = gpio_map[i].code;
		gpio_debugf("line %u %s", line, press ? "pressed" : "released");

		if (code & GPIO_DPAD)
		{
			sink->set_dpad(dpad.update(code & ~GPIO_DPAD, press));
		}
		else
		{
			if (press) sink->press((NSButton)code);
			else sink->release((NSButton)code);
		}
		return true;
	}

	printf("GPIO: invalid button on line %u\n", line);
	return false;
}

bool GpioButtons::start(const char *chip, uint32_t debounce_us)
{
	if (running) return true;

	int chip_fd = open(chip, O_RDONLY | O_CLOEXEC);
	if (chip_fd < 0)
	{
		printf("GPIO: could not open %s: %s\n", chip, strerror(errno));
		return false;
	}

	struct gpio_v2_line_request req;
	memset(&req, 0, sizeof(req));
	for (int i = 0; i < GPIO_MAP_NUM; i++) req.offsets[i] = gpio_map[i].line;
	req.num_lines = GPIO_MAP_NUM;
	snprintf(req.consumer, sizeof(req.consumer), "nsadapter");

	req.config.flags = GPIO_V2_LINE_FLAG_INPUT |
		GPIO_V2_LINE_FLAG_BIAS_PULL_UP |
		GPIO_V2_LINE_FLAG_EDGE_RISING |
		GPIO_V2_LINE_FLAG_EDGE_FALLING;

	if (debounce_us)
	{
		req.config.num_attrs = 1;
		req.config.attrs[0].attr.id = GPIO_V2_LINE_ATTR_ID_DEBOUNCE;
		req.config.attrs[0].attr.debounce_period_us = debounce_us;
		req.config.attrs[0].mask = (1ULL << GPIO_MAP_NUM) - 1;
	}

	int ret = ioctl(chip_fd, GPIO_V2_GET_LINE_IOCTL, &req);
	close(chip_fd);
	if (ret < 0 || req.fd < 0)
	{
		printf("GPIO: line request on %s failed: %s\n", chip, strerror(errno));
		return false;
	}

	fd = req.fd;
	quit = false;

	ret = pthread_create(&thread, NULL, thread_proc, this);
	if (ret)
	{
		printf("GPIO: failed to start thread: %s\n", strerror(ret));
		close(fd);
		fd = -1;
		return false;
	}

	running = true;
	printf("GPIO: %d buttons on %s\n", GPIO_MAP_NUM, chip);
	return true;
}

void GpioButtons::stop()
{
	if (!running) return;

	quit = true;
	pthread_join(thread, NULL);
	running = false;

	close(fd);
	fd = -1;
}

void *GpioButtons::thread_proc(void *arg)
{
	((GpioButtons *)arg)->loop();
	return NULL;
}

void GpioButtons::loop()
{
	struct gpio_v2_line_event events[16];

	while (!quit)
	{
		struct pollfd pfd = { fd, POLLIN, 0 };
		int r = poll(&pfd, 1, 100);
		if (r < 0)
		{
			if (errno == EINTR) continue;
			printf("GPIO: poll: %s\n", strerror(errno));
			break;
		}
		if (!r) continue;

		ssize_t n = read(fd, events, sizeof(events));
		if (n < 0)
		{
			if (errno == EINTR || errno == EAGAIN) continue;
			printf("GPIO: read: %s\n", strerror(errno));
			break;
		}

		int cnt = n / sizeof(events[0]);
		for (int i = 0; i < cnt; i++)
		{
			// pulled up, the button shorts the line to ground
			if (events[i].id == GPIO_V2_LINE_EVENT_FALLING_EDGE) handle_edge(events[i].offset, true);
			else if (events[i].id == GPIO_V2_LINE_EVENT_RISING_EDGE) handle_edge(events[i].offset, false);
		}
	}
}
