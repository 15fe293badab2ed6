// cfg.h
// 2015, rok.krajnc@gmail.com
// 2017+, Sorgelig

#ifndef __CFG_H__
#define __CFG_H__

#include <inttypes.h>
#include <stddef.h>

#define CFG_DEFAULT_NAME "/etc/nsadapter.ini"
#define CFG_SERIAL_PORTS 4

//// type definitions ////
typedef struct {
	char serial_port[CFG_SERIAL_PORTS][256];
	uint32_t serial_baud;
	char joystick_dir[256];
	uint16_t poll_interval;
	uint8_t gpio_enabled;
	char gpio_chip[256];
	uint32_t gpio_debounce_us;
	uint8_t commands_enabled;
	uint16_t command_hold_ms;
	uint8_t debug;
	char log_file[1024];
} cfg_t;

extern cfg_t cfg;

//// functions ////
void cfg_defaults();
void cfg_parse(const char *name);
void cfg_print();

void cfg_error(const char *fmt, ...);
bool cfg_check_errors(char *msg, size_t max_len);
int cfg_error_count();

#endif // __CFG_H__
