// cfg.c
// 2015, rok.krajnc@gmail.com
// 2017+, Sorgelig

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <string.h>
#include <strings.h>
#include <inttypes.h>
#include <ctype.h>
#include "cfg.h"
#include "debug.h"

cfg_t cfg;

typedef enum
{
	UINT8 = 0, UINT16, UINT32, STRING, STRINGARR
} ini_vartypes_t;

typedef struct
{
	const char* name;
	void* var;
	ini_vartypes_t type;
	int64_t min;
	int64_t max;
} ini_var_t;

static const ini_var_t ini_vars[] =
{
	{ "SERIAL_PORT", (void*)(&(cfg.serial_port)), STRINGARR, sizeof(cfg.serial_port) / sizeof(*cfg.serial_port), sizeof(*cfg.serial_port) },
	{ "SERIAL_BAUD", (void*)(&(cfg.serial_baud)), UINT32, 9600, 4000000 },
	{ "JOYSTICK_DIR", (void*)(&(cfg.joystick_dir)), STRING, 0, sizeof(cfg.joystick_dir) - 1 },
	{ "POLL_INTERVAL", (void*)(&(cfg.poll_interval)), UINT16, 10, 5000 },
	{ "GPIO_ENABLED", (void*)(&(cfg.gpio_enabled)), UINT8, 0, 1 },
	{ "GPIO_CHIP", (void*)(&(cfg.gpio_chip)), STRING, 0, sizeof(cfg.gpio_chip) - 1 },
	{ "GPIO_DEBOUNCE_US", (void*)(&(cfg.gpio_debounce_us)), UINT32, 0, 100000 },
	{ "COMMANDS_ENABLED", (void*)(&(cfg.commands_enabled)), UINT8, 0, 1 },
	{ "COMMAND_HOLD_MS", (void*)(&(cfg.command_hold_ms)), UINT16, 10, 2000 },
	{ "DEBUG", (void*)(&(cfg.debug)), UINT8, 0, 1 },
	{ "LOG_FILE", (void*)(&(cfg.log_file)), STRING, 0, sizeof(cfg.log_file) - 1 },
};

static const int nvars = (int)(sizeof(ini_vars) / sizeof(ini_var_t));

#define INI_LINE_SIZE           1024

#define INI_SECTION_START       '['
#define INI_SECTION_END         ']'

#define CHAR_IS_NUM(c)          (((c) >= '0') && ((c) <= '9'))
#define CHAR_IS_ALPHA_LOWER(c)  (((c) >= 'a') && ((c) <= 'z'))
#define CHAR_IS_ALPHA_UPPER(c)  (((c) >= 'A') && ((c) <= 'Z'))
#define CHAR_IS_ALPHANUM(c)     (CHAR_IS_ALPHA_LOWER(c) || CHAR_IS_ALPHA_UPPER(c) || CHAR_IS_NUM(c))
#define CHAR_IS_SPECIAL(c)      (((c) == '[') || ((c) == ']') || ((c) == '(') || ((c) == ')') || \
                                 ((c) == '-') || ((c) == '+') || ((c) == '/') || ((c) == '=') || \
                                 ((c) == '#') || ((c) == '$') || ((c) == '@') || ((c) == '_') || \
                                 ((c) == ',') || ((c) == '.') || ((c) == '!') || ((c) == '*') || \
                                 ((c) == ':') || ((c) == '~'))

#define CHAR_IS_VALID(c)        (CHAR_IS_ALPHANUM(c) || CHAR_IS_SPECIAL(c))
#define CHAR_IS_SPACE(c)        (((c) == ' ') || ((c) == '\t'))
#define CHAR_IS_LINEEND(c)      (((c) == '\n'))
#define CHAR_IS_COMMENT(c)      (((c) == ';'))

static FILE *ini_file = NULL;

static int ini_getline(char* line)
{
	int c;
	char ignore = 0, skip = 1;
	int i = 0;

	while ((c = fgetc(ini_file)) != EOF)
	{
		if (!CHAR_IS_SPACE(c)) skip = 0;
		if (i >= (INI_LINE_SIZE - 1) || CHAR_IS_COMMENT(c)) ignore = 1;

		if (CHAR_IS_LINEEND(c)) break;
		if ((CHAR_IS_SPACE(c) || CHAR_IS_VALID(c)) && !ignore && !skip) line[i++] = c;
	}
	line[i] = 0;
	while (i > 0 && CHAR_IS_SPACE(line[i - 1])) line[--i] = 0;
	return c == EOF;
}

static int ini_get_section(char* buf)
{
	int i = 0;

	// get section start marker
	if (buf[0] != INI_SECTION_START) return 0;
	else buf++;

	// get section stop marker
	while (buf[i])
	{
		if (buf[i] == INI_SECTION_END)
		{
			buf[i] = 0;
			break;
		}

		i++;
		if (i >= INI_LINE_SIZE) return 0;
	}

	if (!strcasecmp(buf, "NSAdapter"))
	{
		ini_parser_debugf("Got SECTION '%s'", buf);
		return 1;
	}

	return 0;
}

static void ini_parse_numeric(const ini_var_t *var, const char *text, void *out)
{
	char *endptr = nullptr;
	bool out_of_range = true;

	int64_t v = strtoll(text, &endptr, 0);
	if (v < var->min) v = var->min;
	else if (v > var->max) v = var->max;
	else out_of_range = false;

	if (endptr == text || *endptr)
	{
		cfg_error("%s: \'%s\' not a number", var->name, text);
		return;
	}
	else if (out_of_range) cfg_error("%s: \'%s\' out of range", var->name, text);

	switch (var->type)
	{
	case UINT8: *(uint8_t*)out = (uint8_t)v; break;
	case UINT16: *(uint16_t*)out = (uint16_t)v; break;
	case UINT32: *(uint32_t*)out = (uint32_t)v; break;
	default: break;
	}
}

// Used to determine if an array variable should be appended or restarted.
static bool var_array_append[sizeof(ini_vars) / sizeof(ini_var_t)] = {};

static void ini_parse_var(char* buf)
{
	// find var
	int i = 0;
	while (1)
	{
		if (buf[i] == '=' || CHAR_IS_SPACE(buf[i]))
		{
			buf[i] = 0;
			break;
		}
		else if (!buf[i]) return;
		i++;
	}

	// parse var
	int var_id = -1;
	for (int j = 0; j < nvars; j++)
	{
		if (!strcasecmp(buf, ini_vars[j].name)) var_id = j;
	}

	if (var_id == -1)
	{
		cfg_error("%s: unknown option", buf);
		return;
	}

	i++;
	while (buf[i] == '=' || CHAR_IS_SPACE(buf[i])) i++;
	ini_parser_debugf("Got VAR '%s' with VALUE %s", buf, buf + i);

	const ini_var_t *var = &ini_vars[var_id];

	switch (var->type)
	{
	case STRING:
		memset(var->var, 0, var->max);
		snprintf((char*)(var->var), var->max, "%s", buf + i);
		break;

	case STRINGARR:
		{
			int item_sz = var->max;

			// first occurrence replaces the defaults
			if (!var_array_append[var_id])
			{
				var_array_append[var_id] = true;

				for (int n = 0; n < var->min; n++)
				{
					char *str = ((char*)var->var) + (n * item_sz);
					str[0] = 0;
				}
			}

			int stored = 0;
			for (int n = 0; n < var->min; n++)
			{
				char *str = ((char*)var->var) + (n * item_sz);
				if (!strlen(str))
				{
					snprintf(str, item_sz, "%s", buf + i);
					stored = 1;
					break;
				}
			}

			if (!stored) cfg_error("%s: too many entries", var->name);
		}
		break;

	default:
		ini_parse_numeric(var, buf + i, var->var);
		break;
	}
}

static void ini_parse(const char *name)
{
	static char line[INI_LINE_SIZE];
	int section = 0;
	int eof;

	memset(line, 0, sizeof(line));
	memset(var_array_append, 0, sizeof(var_array_append));

	ini_file = fopen(name, "r");
	if (!ini_file)
	{
		printf("No config file %s, using defaults.\n", name);
		return;
	}

	ini_parser_debugf("Opened file %s.", name);

	// parse ini
	while (1)
	{
		// get line
		eof = ini_getline(line);
		ini_parser_debugf("line(%d): \"%s\".", section, line);

		if (line[0] == INI_SECTION_START)
		{
			// if first char in line is INI_SECTION_START, get section
			section = ini_get_section(line);
		}
		else if (section && line[0])
		{
			// otherwise this is a variable, get it
			ini_parse_var(line);
		}

		// if end of file, stop
		if (eof) break;
	}

	fclose(ini_file);
	ini_file = NULL;
}

static constexpr int CFG_ERRORS_MAX = 4;
static constexpr int CFG_ERRORS_STRLEN = 128;
static char cfg_errors[CFG_ERRORS_MAX][CFG_ERRORS_STRLEN];
static int cfg_errors_num = 0;

void cfg_defaults()
{
	memset(&cfg, 0, sizeof(cfg));
	strcpy(cfg.serial_port[0], "/dev/ttyAMA0");
	strcpy(cfg.serial_port[1], "/dev/ttyUSB0");
	cfg.serial_baud = 2000000;
	strcpy(cfg.joystick_dir, "/dev/input");
	cfg.poll_interval = 100;
	cfg.gpio_enabled = 1;
	strcpy(cfg.gpio_chip, "/dev/gpiochip0");
	cfg.gpio_debounce_us = 10000;
	cfg.commands_enabled = 1;
	cfg.command_hold_ms = 75;
}

void cfg_parse(const char *name)
{
	cfg_defaults();
	cfg_errors_num = 0;
	ini_parse(name ? name : CFG_DEFAULT_NAME);
}

void cfg_error(const char *fmt, ...)
{
	if (cfg_errors_num >= CFG_ERRORS_MAX) return;

	va_list args;
	va_start(args, fmt);
	vsnprintf(cfg_errors[cfg_errors_num], CFG_ERRORS_STRLEN, fmt, args);
	va_end(args);

	printf("ERROR CFG: %s\n", cfg_errors[cfg_errors_num]);

	cfg_errors_num += 1;
}

int cfg_error_count()
{
	return cfg_errors_num;
}

bool cfg_check_errors(char *msg, size_t max_len)
{
	msg[0] = '\0';

	if (cfg_errors_num == 0) return false;

	int pos = snprintf(msg, max_len, "%d INI Error%s\n---", cfg_errors_num, cfg_errors_num > 1 ? "s" : "");

	for (int i = 0; i < cfg_errors_num && pos < (int)max_len; i++)
	{
		pos += snprintf(msg + pos, max_len - pos, "\n%s\n", cfg_errors[i]);
	}

	return true;
}

void cfg_print()
{
	printf("Loaded config:\n--------------\n");
	for (int i = 0; i < nvars; i++)
	{
		switch (ini_vars[i].type)
		{
		case UINT8:
			printf("  %s=%u\n", ini_vars[i].name, *(uint8_t*)ini_vars[i].var);
			break;

		case UINT16:
			printf("  %s=%u\n", ini_vars[i].name, *(uint16_t*)ini_vars[i].var);
			break;

		case UINT32:
			printf("  %s=%u\n", ini_vars[i].name, *(uint32_t*)ini_vars[i].var);
			break;

		case STRING:
			if (*(char*)ini_vars[i].var) printf("  %s=%s\n", ini_vars[i].name, (char*)ini_vars[i].var);
			break;

		case STRINGARR:
			for (int n = 0; n < ini_vars[i].min; n++)
			{
				char *str = ((char*)ini_vars[i].var) + (n * ini_vars[i].max);
				if (*str) printf("  %s=%s\n", ini_vars[i].name, str);
			}
			break;
		}
	}
	printf("\n");
}
