/*
    tests/SerialFrameTest.h
    Report framing for the NSGadget UART link.
*/
#pragma once
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>
#include "cfg.h"
#include "ns_serial.h"

struct SerialFrameTest {
  static bool runLayout() {
    ns_report_t r;
    ns_report_reset(&r);
    r.buttons = (1 << NS_BTN_A) | (1 << NS_BTN_HOME);
    r.dpad = NS_DPAD_LEFT;
    r.axis[NS_AXIS_LX] = 1;
    r.axis[NS_AXIS_LY] = 2;
    r.axis[NS_AXIS_RX] = 3;
    r.axis[NS_AXIS_RY] = 4;

    static const uint8_t want[NS_FRAME_SIZE] = {0x02, 0x08, 0x04, 0x10, 0x06, 1,
                                                2,    3,    4,    0x00, 0x03};
    uint8_t frame[NS_FRAME_SIZE];
    return ns_frame_encode(&r, frame) == NS_FRAME_SIZE &&
           !memcmp(frame, want, NS_FRAME_SIZE);
  }

  /** Neutral report: nothing pressed, hat centered, sticks at 128. */
  static bool runNeutral() {
    ns_report_t r;
    ns_report_reset(&r);
    uint8_t frame[NS_FRAME_SIZE];
    ns_frame_encode(&r, frame);
    return frame[2] == 0 && frame[3] == 0 && frame[4] == 0x0F &&
           frame[5] == 128 && frame[8] == 128;
  }

  /** Through the gamepad onto a descriptor, one frame per change. */
  static bool runSendThroughPad() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) return false;

    NSSerial serial;
    serial.attach(fds[1]);
    {
      SharedGamepad pad(&serial);
      pad.press(NS_BTN_PLUS);
      pad.release(NS_BTN_PLUS);
    }

    uint8_t buf[NS_FRAME_SIZE * 2];
    ssize_t n = read(fds[0], buf, sizeof(buf));
    close(fds[0]);

    return n == (ssize_t)sizeof(buf) && serial.frames() == 2 &&
           buf[0] == NS_FRAME_STX && buf[3] == 0x02 &&
           buf[NS_FRAME_SIZE - 1] == NS_FRAME_ETX && buf[NS_FRAME_SIZE + 3] == 0;
  }

  /** Write errors drop the frame, the caller never sees a failure. */
  static bool runWriteError() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) return false;
    close(fds[0]);

    signal(SIGPIPE, SIG_IGN);
    NSSerial serial;
    serial.attach(fds[1]);

    ns_report_t r;
    ns_report_reset(&r);
    serial.send(&r);
    return serial.frames() == 0 && serial.is_open();
  }

  /** Debug dump of frames whose stick bytes have the high bit set. */
  static bool runDebugDump() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) return false;

    NSSerial serial;
    serial.attach(fds[1]);

    ns_report_t r;
    ns_report_reset(&r);
    r.axis[NS_AXIS_LX] = 0xFF;
    r.axis[NS_AXIS_RY] = 0x80;

    uint8_t debug = cfg.debug;
    cfg.debug = 1;
    serial.send(&r);
    cfg.debug = debug;

    uint8_t buf[NS_FRAME_SIZE];
    ssize_t n = read(fds[0], buf, sizeof(buf));
    close(fds[0]);
    return n == NS_FRAME_SIZE && serial.frames() == 1 && buf[5] == 0xFF && buf[8] == 0x80;
  }

  static bool runUnsupportedBaud() {
    NSSerial serial;
    return !serial.open("/dev/null", 12345) && !serial.is_open();
  }
};
