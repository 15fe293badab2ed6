/*
Copyright 2005, 2006, 2007 Dennis van Weeren
Copyright 2008, 2009 Jakub Bednarski
Copyright 2012 Till Harbaum

This file is part of NSAdapter, derived from Minimig.

NSAdapter is free software; you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation; either version 3 of the License, or
(at your option) any later version.

NSAdapter is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include <inttypes.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <atomic>

#include "cfg.h"
#include "commands.h"
#include "gpio_buttons.h"
#include "joy_host.h"
#include "joy_profile.h"
#include "joy_registry.h"
#include "ns_serial.h"
#include "nsgamepad.h"

const char *version = "$VER:" VDATE;

static std::atomic<bool> quit(false);

static void INThandler(int)
{
	quit = true;
}

int main(int argc, char *argv[])
{
	cfg_parse((argc > 1) ? argv[1] : NULL);

	if (cfg.log_file[0])
	{
		FILE *log_file = freopen(cfg.log_file, "a+", stdout);
		if (log_file)
		{
			setvbuf(stdout, NULL, _IONBF, 0);
			dup2(fileno(stdout), fileno(stderr));
			setvbuf(stderr, NULL, _IONBF, 0);
		}
		else
		{
			fprintf(stderr, "Failed to open log file %s, using console.\n", cfg.log_file);
		}
	}
	else
	{
		setvbuf(stdout, NULL, _IONBF, 0);
	}

	printf("\nNSAdapter, USB joysticks to Nintendo Switch\n");
	printf("Version %s\n\n", version + 5);

	char msg[1024];
	if (cfg_check_errors(msg, sizeof(msg))) printf("%s\n\n", msg);
	cfg_print();

	NSSerial serial;
	if (!serial.open_any(cfg.serial_port, CFG_SERIAL_PORTS, cfg.serial_baud))
	{
		printf("NSGadget serial port not found.\n");
		return 1;
	}

	SharedGamepad gamepad(&serial);
	gamepad.release_all();

	int flagged = joy_profiles_validate();
	if (flagged) printf("%d controller mapping entries left unmapped.\n", flagged);

	signal(SIGINT, INThandler);
	signal(SIGTERM, INThandler);

	GpioButtons gpio(&gamepad);
	if (cfg.gpio_enabled && !gpio.start(cfg.gpio_chip, cfg.gpio_debounce_us))
	{
		printf("GPIO buttons disabled.\n");
	}

	CommandSource commands(&gamepad, cfg.command_hold_ms);
	if (cfg.commands_enabled) commands.start(STDIN_FILENO);

	{
		LinuxJoyHost host;
		JoyRegistry registry(&host, &gamepad, cfg.joystick_dir);
		registry.run(cfg.poll_interval, quit);
	}

	commands.stop();
	gpio.stop();

	gamepad.release_all();
	printf("Bye bye...\n");
	return 0;
}
