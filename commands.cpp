#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include "commands.h"
#include "hardware.h"
#include "str_util.h"
#include "debug.h"

#define B1(a)        1, { NS_BTN_##a }
#define B2(a, b)     2, { NS_BTN_##a, NS_BTN_##b }
#define B3(a, b, c)  3, { NS_BTN_##a, NS_BTN_##b, NS_BTN_##c }
#define B0           0, { }

static const command_t commands[] =
{
	{ "left and right",  B2(LEFT_TRIGGER, RIGHT_TRIGGER), NS_DPAD_CENTERED },
	{ "left trigger",    B1(LEFT_TRIGGER),   NS_DPAD_CENTERED },
	{ "left button",     B1(LEFT_TRIGGER),   NS_DPAD_CENTERED },
	{ "right trigger",   B1(RIGHT_TRIGGER),  NS_DPAD_CENTERED },
	{ "right button",    B1(RIGHT_TRIGGER),  NS_DPAD_CENTERED },
	{ "left throttle",   B1(LEFT_THROTTLE),  NS_DPAD_CENTERED },
	{ "right throttle",  B1(RIGHT_THROTTLE), NS_DPAD_CENTERED },
	{ "plus",            B1(PLUS),           NS_DPAD_CENTERED },
	{ "options",         B1(PLUS),           NS_DPAD_CENTERED },
	{ "minus",           B1(MINUS),          NS_DPAD_CENTERED },
	{ "capture",         B1(CAPTURE),        NS_DPAD_CENTERED },
	{ "go home",         B1(HOME),           NS_DPAD_CENTERED },
	{ "home",            B1(HOME),           NS_DPAD_CENTERED },
	{ "okay",            B1(A),              NS_DPAD_CENTERED },
	{ "continue",        B1(A),              NS_DPAD_CENTERED },
	{ "confirm",         B1(A),              NS_DPAD_CENTERED },
	{ "start",           B1(A),              NS_DPAD_CENTERED },
	{ "back",            B1(B),              NS_DPAD_CENTERED },
	{ "go back",         B1(B),              NS_DPAD_CENTERED },
	{ "baker",           B1(B),              NS_DPAD_CENTERED },
	{ "cancel",          B1(X),              NS_DPAD_CENTERED },
	{ "close",           B1(X),              NS_DPAD_CENTERED },
	{ "direction up",    B0,                 NS_DPAD_UP },
	{ "direction down",  B0,                 NS_DPAD_DOWN },
	{ "direction left",  B0,                 NS_DPAD_LEFT },
	{ "direction right", B0,                 NS_DPAD_RIGHT },
	{ "move up",         B0,                 NS_DPAD_UP },
	{ "move down",       B0,                 NS_DPAD_DOWN },
	{ "move left",       B0,                 NS_DPAD_LEFT },
	{ "move right",      B0,                 NS_DPAD_RIGHT },

	// pinball
	{ "launch ball",     B1(A),              NS_DPAD_CENTERED },

	// Zelda BOTW
	{ "jump",            B1(X),              NS_DPAD_CENTERED },
	{ "climb",           B1(X),              NS_DPAD_CENTERED },
	{ "attack",          B1(Y),              NS_DPAD_CENTERED },
	{ "fight",           B1(Y),              NS_DPAD_CENTERED },
	{ "take",            B1(A),              NS_DPAD_CENTERED },
	{ "crouch",          B1(LEFT_STICK),     NS_DPAD_CENTERED },
	{ "crunch",          B1(LEFT_STICK),     NS_DPAD_CENTERED },
	{ "zoom",            B1(RIGHT_STICK),    NS_DPAD_CENTERED },
	{ "long distance",   B1(RIGHT_STICK),    NS_DPAD_CENTERED },
	{ "look far",        B1(RIGHT_STICK),    NS_DPAD_CENTERED },
	{ "use rune",        B1(LEFT_TRIGGER),   NS_DPAD_CENTERED },
	{ "use spell",       B1(LEFT_TRIGGER),   NS_DPAD_CENTERED },
	{ "use magic",       B1(LEFT_TRIGGER),   NS_DPAD_CENTERED },
	{ "throw",           B1(RIGHT_TRIGGER),  NS_DPAD_CENTERED },
	{ "switch shield",   B1(RIGHT_TRIGGER),  NS_DPAD_LEFT },
	{ "switch weapon",   B1(RIGHT_TRIGGER),  NS_DPAD_RIGHT },
	{ "switch magic",    B1(RIGHT_TRIGGER),  NS_DPAD_UP },
	{ "which shield",    B1(RIGHT_TRIGGER),  NS_DPAD_LEFT },
	{ "which weapon",    B1(RIGHT_TRIGGER),  NS_DPAD_RIGHT },
	{ "which magic",     B1(RIGHT_TRIGGER),  NS_DPAD_UP },
	{ "change shield",   B1(RIGHT_TRIGGER),  NS_DPAD_LEFT },
	{ "change weapon",   B1(RIGHT_TRIGGER),  NS_DPAD_RIGHT },
	{ "change magic",    B1(RIGHT_TRIGGER),  NS_DPAD_UP },
	{ "center camera",   B1(LEFT_THROTTLE),  NS_DPAD_CENTERED },
	{ "enter camera",    B1(LEFT_THROTTLE),  NS_DPAD_CENTERED },
	{ "centre camera",   B1(LEFT_THROTTLE),  NS_DPAD_CENTERED },
	{ "camera",          B1(LEFT_THROTTLE),  NS_DPAD_CENTERED },
	{ "lock on",         B1(LEFT_THROTTLE),  NS_DPAD_CENTERED },
	{ "raise shield",    B1(LEFT_THROTTLE),  NS_DPAD_CENTERED },
	{ "parry",           B2(LEFT_THROTTLE, A), NS_DPAD_CENTERED },
	{ "perry",           B2(LEFT_THROTTLE, A), NS_DPAD_CENTERED },
	{ "block",           B2(LEFT_THROTTLE, A), NS_DPAD_CENTERED },
	{ "back flip",       B3(LEFT_THROTTLE, X, LEFT_TRIGGER), NS_DPAD_CENTERED },
	{ "shield surf",     B3(LEFT_THROTTLE, X, A), NS_DPAD_CENTERED },
	{ "use bow",         B1(RIGHT_THROTTLE), NS_DPAD_CENTERED },
	{ "whistle",         B0,                 NS_DPAD_DOWN },
	{ "call horse",      B0,                 NS_DPAD_DOWN },
	{ "called horse",    B0,                 NS_DPAD_DOWN },
	{ "all horse",       B0,                 NS_DPAD_DOWN },
	{ "horse",           B0,                 NS_DPAD_DOWN },
	{ "a horse",         B0,                 NS_DPAD_DOWN },
	{ "get horse",       B0,                 NS_DPAD_DOWN },
	{ "get a horse",     B0,                 NS_DPAD_DOWN },
	{ "open slate",      B1(MINUS),          NS_DPAD_CENTERED },
	{ "pause",           B1(PLUS),           NS_DPAD_CENTERED },
};

#define CMD_NUM ((int)(sizeof(commands) / sizeof(commands[0])))

int command_count()
{
	return CMD_NUM;
}

const command_t *command_get(int index)
{
	if (index < 0 || index >= CMD_NUM) return NULL;
	return &commands[index];
}

const command_t *command_find(const char *phrase)
{
	for (int i = 0; i < CMD_NUM; i++)
	{
		if (!strcmp(commands[i].phrase, phrase)) return &commands[i];
	}
	return NULL;
}

bool command_execute(GamepadSink *sink, char *line, unsigned long hold_ms)
{
	str_rtrim(line);
	if (!line[0]) return false;

	const command_t *cmd = command_find(line);
	if (!cmd)
	{
		printf("CMD: unknown command \"%s\"\n", line);
		return false;
	}

	cmd_debugf("%s", cmd->phrase);

	for (int i = 0; i < cmd->nbuttons; i++) sink->press(cmd->buttons[i]);
	if (cmd->dpad != NS_DPAD_CENTERED) sink->set_dpad(cmd->dpad);

	WaitTimer(hold_ms);

	if (cmd->dpad != NS_DPAD_CENTERED) sink->set_dpad(NS_DPAD_CENTERED);
	for (int i = cmd->nbuttons - 1; i >= 0; i--) sink->release(cmd->buttons[i]);

	return true;
}

CommandSource::CommandSource(GamepadSink *sink, unsigned long hold_ms)
	: sink(sink), hold_ms(hold_ms), fd(-1), thread(), running(false), quit(false)
{
}

CommandSource::~CommandSource()
{
	stop();
}

int CommandSource::run(int fd)
{
	char line[256];
	size_t len = 0;
	bool discarding = false;
	int executed = 0;

	while (!quit)
	{
		struct pollfd pfd = { fd, POLLIN, 0 };
		int r = poll(&pfd, 1, 100);
		if (r < 0)
		{
			if (errno == EINTR) continue;
			printf("CMD: poll: %s\n", strerror(errno));
			break;
		}
		if (!r) continue;

		ssize_t n = read(fd, line + len, sizeof(line) - 1 - len);
		if (n < 0)
		{
			if (errno == EINTR || errno == EAGAIN) continue;
			printf("CMD: read: %s\n", strerror(errno));
			break;
		}

		if (!n)
		{
			// last line without newline
			if (len)
			{
				line[len] = 0;
				if (command_execute(sink, line, hold_ms)) executed++;
			}
			break;
		}

		len += n;
		line[len] = 0;

		char *start = line;
		char *nl;

		// rest of an over-long line, up to and including its newline
		if (discarding)
		{
			nl = strchr(start, '\n');
			if (!nl)
			{
				len = 0;
				continue;
			}
			start = nl + 1;
			discarding = false;
		}

		while ((nl = strchr(start, '\n')))
		{
			*nl = 0;
			if (command_execute(sink, start, hold_ms)) executed++;
			start = nl + 1;
		}

		len -= start - line;
		memmove(line, start, len);

		if (len == sizeof(line) - 1)
		{
			printf("CMD: line too long, dropped\n");
			len = 0;
			discarding = true;
		}
	}

	cmd_debugf("end of input");
	return executed;
}

void *CommandSource::thread_proc(void *arg)
{
	CommandSource *src = (CommandSource *)arg;
	src->run(src->fd);
	return NULL;
}

bool CommandSource::start(int input)
{
	if (running) return true;

	fd = input;
	quit = false;

	int ret = pthread_create(&thread, NULL, thread_proc, this);
	if (ret)
	{
		printf("CMD: failed to start thread: %s\n", strerror(ret));
		return false;
	}

	running = true;
	return true;
}

void CommandSource::stop()
{
	if (!running) return;

	quit = true;
	pthread_join(thread, NULL);
	running = false;
}
