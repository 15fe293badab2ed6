#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <termios.h>

#include "ns_serial.h"
#include "hardware.h"
#include "cfg.h"
#include "debug.h"

static const struct
{
	uint32_t baud;
	speed_t speed;
} baud_rates[] =
{
	{ 9600, B9600 },
	{ 19200, B19200 },
	{ 38400, B38400 },
	{ 57600, B57600 },
	{ 115200, B115200 },
	{ 230400, B230400 },
	{ 460800, B460800 },
	{ 921600, B921600 },
	{ 1000000, B1000000 },
	{ 1500000, B1500000 },
	{ 2000000, B2000000 },
	{ 3000000, B3000000 },
};

static bool get_speed(uint32_t baud, speed_t *speed)
{
	for (size_t i = 0; i < sizeof(baud_rates) / sizeof(baud_rates[0]); i++)
	{
		if (baud_rates[i].baud == baud)
		{
			*speed = baud_rates[i].speed;
			return true;
		}
	}
	return false;
}

int ns_frame_encode(const ns_report_t *report, uint8_t *frame)
{
	int n = 0;
	frame[n++] = NS_FRAME_STX;
	frame[n++] = 8;
	frame[n++] = (uint8_t)report->buttons;
	frame[n++] = (uint8_t)(report->buttons >> 8);
	frame[n++] = report->dpad;
	frame[n++] = report->axis[NS_AXIS_LX];
	frame[n++] = report->axis[NS_AXIS_LY];
	frame[n++] = report->axis[NS_AXIS_RX];
	frame[n++] = report->axis[NS_AXIS_RY];
	frame[n++] = 0;  // vendor specific
	frame[n++] = NS_FRAME_ETX;
	return n;
}

NSSerial::NSSerial() : fd(-1), sent(0)
{
}

NSSerial::~NSSerial()
{
	close();
}

bool NSSerial::open(const char *name, uint32_t baud)
{
	speed_t speed;
	if (!get_speed(baud, &speed))
	{
		printf("NSGadget: unsupported baud rate %u\n", baud);
		return false;
	}

	close();

	int dev = ::open(name, O_RDWR | O_NOCTTY | O_CLOEXEC);
	if (dev < 0)
	{
		printf("NSGadget: could not open %s: %s\n", name, strerror(errno));
		return false;
	}

	struct termios state;
	if (tcgetattr(dev, &state) < 0)
	{
		printf("NSGadget: %s is not a tty: %s\n", name, strerror(errno));
		::close(dev);
		return false;
	}

	// 8N1, no flow control
	cfmakeraw(&state);
	state.c_cflag |= CLOCAL | CREAD;
	state.c_cflag &= ~(CRTSCTS | CSTOPB | PARENB);
	cfsetispeed(&state, speed);
	cfsetospeed(&state, speed);

	if (tcsetattr(dev, TCSAFLUSH, &state) < 0)
	{
		printf("NSGadget: failed to configure %s: %s\n", name, strerror(errno));
		::close(dev);
		return false;
	}

	printf("NSGadget on %s (%u baud)\n", name, baud);
	fd = dev;
	return true;
}

bool NSSerial::open_any(const char (*names)[256], int count, uint32_t baud)
{
	for (int i = 0; i < count; i++)
	{
		if (!names[i][0]) continue;
		if (open(names[i], baud)) return true;
	}
	return false;
}

void NSSerial::attach(int dev)
{
	close();
	fd = dev;
}

void NSSerial::close()
{
	if (fd >= 0)
	{
		::close(fd);
		fd = -1;
	}
}

void NSSerial::send(const ns_report_t *report)
{
	if (fd < 0) return;

	uint8_t frame[NS_FRAME_SIZE];
	int len = ns_frame_encode(report, frame);

	serial_debugf("frame %lu", sent);
	if (cfg.debug) hexdump(frame, len);

	int pos = 0;
	while (pos < len)
	{
		ssize_t ret = write(fd, frame + pos, len - pos);
		if (ret < 0)
		{
			if (errno == EINTR) continue;
			printf("NSGadget: write failed: %s, frame dropped\n", strerror(errno));
			return;
		}
		pos += ret;
	}

	sent++;
}
