#ifndef GPIO_BUTTONS_H
#define GPIO_BUTTONS_H

#include <inttypes.h>
#include <pthread.h>
#include <atomic>

#include "nsgamepad.h"
#include "dpad.h"

// Buttons wired straight to the GPIO header, active low.
class GpioButtons
{
public:
	explicit GpioButtons(GamepadSink *sink);
	~GpioButtons();

	// requests all mapped lines and starts the reader thread
	bool start(const char *chip, uint32_t debounce_us);
	void stop();

	// false for a line without a button
	bool handle_edge(unsigned line, bool press);

	static int line_count();

private:
	GpioButtons(const GpioButtons &);
	GpioButtons &operator=(const GpioButtons &);

	static void *thread_proc(void *arg);
	void loop();

	GamepadSink *sink;
	DPadBits dpad;

	int fd;
	pthread_t thread;
	bool running;
	std::atomic<bool> quit;
};

#endif // GPIO_BUTTONS_H
