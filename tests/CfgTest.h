/*
    tests/CfgTest.h
    INI parsing into the global cfg.
*/
#pragma once
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include "cfg.h"

struct CfgTest {
  /** Writes text to a temporary file, parses it and removes it again. */
  static bool parse(const char *text) {
    char path[] = "/tmp/nsadapter_cfg_XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) return false;

    size_t len = strlen(text);
    bool ok = write(fd, text, len) == (ssize_t)len;
    close(fd);

    if (ok) cfg_parse(path);
    unlink(path);
    return ok;
  }

  static bool runDefaults() {
    cfg_parse("/nonexistent/nsadapter.ini");
    return cfg_error_count() == 0 && !strcmp(cfg.serial_port[0], "/dev/ttyAMA0") &&
           !strcmp(cfg.serial_port[1], "/dev/ttyUSB0") && !cfg.serial_port[2][0] &&
           cfg.serial_baud == 2000000 && cfg.poll_interval == 100 &&
           !strcmp(cfg.joystick_dir, "/dev/input") && cfg.gpio_enabled == 1 &&
           cfg.gpio_debounce_us == 10000 && cfg.command_hold_ms == 75 &&
           cfg.debug == 0 && !cfg.log_file[0];
  }

  static bool runValues() {
    bool ok = parse(
        "; adapter settings\n"
        "[NSAdapter]\n"
        "serial_port=/dev/ttyS1\n"
        "SERIAL_PORT = /dev/ttyS2 ; second choice\n"
        "POLL_INTERVAL=0x32\n"
        "gpio_enabled=0\n"
        "JOYSTICK_DIR=/tmp/input\n"
        "\n"
        "[Other]\n"
        "POLL_INTERVAL=500\n");

    return ok && cfg_error_count() == 0 && !strcmp(cfg.serial_port[0], "/dev/ttyS1") &&
           !strcmp(cfg.serial_port[1], "/dev/ttyS2") && !cfg.serial_port[2][0] &&
           cfg.poll_interval == 50 && cfg.gpio_enabled == 0 &&
           !strcmp(cfg.joystick_dir, "/tmp/input") && cfg.serial_baud == 2000000;
  }

  /** Bad values are reported, out of range ones clamped. */
  static bool runErrors() {
    bool ok = parse(
        "[NSAdapter]\n"
        "POLL_INTERVAL=1\n"
        "COMMAND_HOLD_MS=fast\n"
        "NO_SUCH_KEY=1\n");

    char msg[512];
    return ok && cfg_error_count() == 3 && cfg.poll_interval == 10 &&
           cfg.command_hold_ms == 75 && cfg_check_errors(msg, sizeof(msg)) &&
           strstr(msg, "3 INI Errors") && strstr(msg, "NO_SUCH_KEY");
  }

  static bool runTooManyPorts() {
    bool ok = parse(
        "[NSAdapter]\n"
        "SERIAL_PORT=/dev/a\n"
        "SERIAL_PORT=/dev/b\n"
        "SERIAL_PORT=/dev/c\n"
        "SERIAL_PORT=/dev/d\n"
        "SERIAL_PORT=/dev/e\n");

    return ok && cfg_error_count() == 1 && !strcmp(cfg.serial_port[3], "/dev/d");
  }
};
