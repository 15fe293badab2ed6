// this file allows to enable and disable debug output on a detailed basis
#ifndef DEBUG_H
#define DEBUG_H

#include <stdio.h>
#include "cfg.h"

// Per-event tracing is always compiled in and gated by DEBUG=1 in the ini,
// lifecycle messages use plain printf.

// ------------ joystick decoding -----------
#if 1
#define joy_debugf(a, ...) do { if (cfg.debug) printf("\033[1;34mJOY: " a "\033[0m\n", ##__VA_ARGS__); } while (0)
#else
#define joy_debugf(...)
#endif

#if 1
#define registry_debugf(a, ...) do { if (cfg.debug) printf("\033[1;36mREGISTRY: " a "\033[0m\n", ##__VA_ARGS__); } while (0)
#else
#define registry_debugf(...)
#endif

// ------------ gamepad output -------------
#if 1
#define pad_debugf(a, ...) do { if (cfg.debug) printf("\033[1;33mPAD: " a "\033[0m\n", ##__VA_ARGS__); } while (0)
#else
#define pad_debugf(...)
#endif

#if 0
// dumps every frame, very noisy at 2Mbit
#define serial_debugf(a, ...) printf("\033[1;35mSERIAL: " a "\033[0m\n", ##__VA_ARGS__)
#else
#define serial_debugf(...)
#endif

// ------------ other sources --------------
#if 1
#define gpio_debugf(a, ...) do { if (cfg.debug) printf("\033[1;32mGPIO: " a "\033[0m\n", ##__VA_ARGS__); } while (0)
#else
#define gpio_debugf(...)
#endif

#if 1
#define cmd_debugf(a, ...) do { if (cfg.debug) printf("\033[1;32mCMD: " a "\033[0m\n", ##__VA_ARGS__); } while (0)
#else
#define cmd_debugf(...)
#endif

#if 1
// ini_parser debug output
#define ini_parser_debugf(a, ...) do { if (cfg.debug) printf("\033[1;32mINI_PARSER : " a "\033[0m\n", ##__VA_ARGS__); } while (0)
#else
#define ini_parser_debugf(...)
#endif

#endif // DEBUG_H
