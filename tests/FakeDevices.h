/*
    tests/FakeDevices.h
    Recording sink and wire, and a joystick host backed by pipes.
*/
#pragma once

#include <errno.h>
#include <fcntl.h>
#include <pthread.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <linux/joystick.h>

#include <algorithm>
#include <atomic>
#include <map>
#include <string>
#include <vector>

#include "hardware.h"
#include "joy_host.h"
#include "nsgamepad.h"

// Every sink call as text, e.g. "press A", "axis LX 128", "dpad UR".
struct RecordingSink : public GamepadSink {
  std::vector<std::string> calls;
  pthread_mutex_t lock;

  RecordingSink() { pthread_mutex_init(&lock, NULL); }
  ~RecordingSink() { pthread_mutex_destroy(&lock); }

  void add(const char *fmt, ...) {
    char buf[64];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    pthread_mutex_lock(&lock);
    calls.push_back(buf);
    pthread_mutex_unlock(&lock);
  }

  void press(NSButton b) { add("press %s", ns_button_name(b)); }
  void release(NSButton b) { add("release %s", ns_button_name(b)); }
  void set_axis(NSAxis a, uint8_t v) {
    static const char *names[] = {"LX", "LY", "RX", "RY"};
    add("axis %s %u", names[a], v);
  }
  void set_left_axis(uint8_t x, uint8_t y) { add("left %u %u", x, y); }
  void set_right_axis(uint8_t x, uint8_t y) { add("right %u %u", x, y); }
  void set_dpad(NSDPad d) { add("dpad %s", ns_dpad_name(d)); }
  void release_all() { add("release all"); }

  std::vector<std::string> take() {
    pthread_mutex_lock(&lock);
    std::vector<std::string> out;
    out.swap(calls);
    pthread_mutex_unlock(&lock);
    return out;
  }

  size_t size() {
    pthread_mutex_lock(&lock);
    size_t n = calls.size();
    pthread_mutex_unlock(&lock);
    return n;
  }

  int count(const char *call) {
    pthread_mutex_lock(&lock);
    int n = (int)std::count(calls.begin(), calls.end(), std::string(call));
    pthread_mutex_unlock(&lock);
    return n;
  }
};

// Keeps the reports it is sent and notices when send() is entered twice at once.
struct RecordingWire : public GamepadWire {
  std::vector<ns_report_t> reports;
  std::atomic<int> inside;
  std::atomic<bool> overlapped;
  unsigned hold_us;

  explicit RecordingWire(unsigned hold_us = 0)
      : inside(0), overlapped(false), hold_us(hold_us) {}

  void send(const ns_report_t *report) {
    if (inside++) overlapped = true;
    reports.push_back(*report);
    if (hold_us) usleep(hold_us);
    inside--;
  }
};

static inline struct js_event make_js_event(uint8_t type, uint8_t number,
                                            int16_t value) {
  struct js_event ev;
  memset(&ev, 0, sizeof(ev));
  ev.type = type;
  ev.number = number;
  ev.value = value;
  return ev;
}

static inline struct js_event js_button(uint8_t number, int16_t value) {
  return make_js_event(JS_EVENT_BUTTON, number, value);
}

static inline struct js_event js_axis(uint8_t number, int16_t value) {
  return make_js_event(JS_EVENT_AXIS, number, value);
}

// Joystick namespace in memory. Opening a device creates a pipe, the test
// keeps the write end and feeds records into it.
struct FakeJoyHost : public JoyHost {
  struct Device {
    std::string name;
    bool fail_open;
    int writer;  // write end of the currently open pipe, -1 if none
  };

  std::map<std::string, Device> devices;
  std::map<int, std::string> open_names;
  pthread_mutex_t lock;
  int opens;

  FakeJoyHost() : opens(0) { pthread_mutex_init(&lock, NULL); }

  ~FakeJoyHost() {
    for (std::map<std::string, Device>::iterator it = devices.begin();
         it != devices.end(); ++it) {
      if (it->second.writer >= 0) close(it->second.writer);
    }
    pthread_mutex_destroy(&lock);
  }

  void plug(const std::string &path, const char *name, bool fail_open = false) {
    pthread_mutex_lock(&lock);
    Device dev;
    dev.name = name;
    dev.fail_open = fail_open;
    dev.writer = -1;
    devices[path] = dev;
    pthread_mutex_unlock(&lock);
  }

  // Removes the file and makes the open reader see end of file.
  void unplug(const std::string &path) {
    pthread_mutex_lock(&lock);
    std::map<std::string, Device>::iterator it = devices.find(path);
    if (it != devices.end()) {
      if (it->second.writer >= 0) close(it->second.writer);
      devices.erase(it);
    }
    pthread_mutex_unlock(&lock);
  }

  // Read error on the open handle, the file itself stays.
  void disconnect(const std::string &path) {
    pthread_mutex_lock(&lock);
    std::map<std::string, Device>::iterator it = devices.find(path);
    if (it != devices.end() && it->second.writer >= 0) {
      close(it->second.writer);
      it->second.writer = -1;
    }
    pthread_mutex_unlock(&lock);
  }

  bool feed(const std::string &path, const void *data, size_t len) {
    pthread_mutex_lock(&lock);
    int fd = devices.count(path) ? devices[path].writer : -1;
    pthread_mutex_unlock(&lock);
    if (fd < 0) return false;
    return write(fd, data, len) == (ssize_t)len;
  }

  bool feed(const std::string &path, const struct js_event &ev) {
    return feed(path, &ev, sizeof(ev));
  }

  std::vector<std::string> list(const char *dir) {
    std::vector<std::string> paths;
    std::string prefix = std::string(dir) + "/js";
    pthread_mutex_lock(&lock);
    for (std::map<std::string, Device>::iterator it = devices.begin();
         it != devices.end(); ++it) {
      if (it->first.compare(0, prefix.size(), prefix) == 0) paths.push_back(it->first);
    }
    pthread_mutex_unlock(&lock);
    return paths;
  }

  int open_dev(const char *path) {
    pthread_mutex_lock(&lock);
    std::map<std::string, Device>::iterator it = devices.find(path);
    if (it == devices.end() || it->second.fail_open) {
      pthread_mutex_unlock(&lock);
      errno = ENOENT;
      return -1;
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
      pthread_mutex_unlock(&lock);
      return -1;
    }

    if (it->second.writer >= 0) close(it->second.writer);
    it->second.writer = fds[1];
    open_names[fds[0]] = it->second.name;
    opens++;
    pthread_mutex_unlock(&lock);
    return fds[0];
  }

  bool get_name(int fd, char *name, size_t size) {
    pthread_mutex_lock(&lock);
    std::map<int, std::string>::iterator it = open_names.find(fd);
    bool found = (it != open_names.end());
    if (found) snprintf(name, size, "%s", it->second.c_str());
    pthread_mutex_unlock(&lock);
    return found;
  }

  ssize_t read_dev(int fd, void *buf, size_t size) { return read(fd, buf, size); }

  void close_dev(int fd) {
    pthread_mutex_lock(&lock);
    open_names.erase(fd);
    pthread_mutex_unlock(&lock);
    close(fd);
  }
};

// Polls cond every millisecond for up to ms milliseconds.
template <typename F>
static bool wait_for(F cond, unsigned long ms = 2000) {
  unsigned long timeout = GetTimer(ms);
  while (!cond()) {
    if (CheckTimer(timeout)) return cond();
    WaitTimer(1);
  }
  return true;
}
