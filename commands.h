#ifndef COMMANDS_H
#define COMMANDS_H

#include <inttypes.h>
#include <pthread.h>
#include <atomic>

#include "nsgamepad.h"

#define CMD_MAX_BUTTONS 3

typedef struct
{
	const char *phrase;
	int nbuttons;
	NSButton buttons[CMD_MAX_BUTTONS];
	NSDPad dpad;  // NS_DPAD_CENTERED if the command has no direction
} command_t;

const command_t *command_find(const char *phrase);
const command_t *command_get(int index);
int command_count();

// Press, hold and release of one command. line may carry trailing
// whitespace. Returns false for an unknown phrase.
bool command_execute(GamepadSink *sink, char *line, unsigned long hold_ms);

// Phrases from a speech to text engine, one per line.
class CommandSource
{
public:
	CommandSource(GamepadSink *sink, unsigned long hold_ms);
	~CommandSource();

	bool start(int fd);
	void stop();

	// Executes lines from fd until end of input or stop.
	// Returns the number of recognized commands.
	int run(int fd);

private:
	CommandSource(const CommandSource &);
	CommandSource &operator=(const CommandSource &);

	static void *thread_proc(void *arg);

	GamepadSink *sink;
	unsigned long hold_ms;

	int fd;
	pthread_t thread;
	bool running;
	std::atomic<bool> quit;
};

#endif // COMMANDS_H
