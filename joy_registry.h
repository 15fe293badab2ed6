#ifndef JOY_REGISTRY_H
#define JOY_REGISTRY_H

#include <atomic>
#include <string>
#include <vector>

#include "joy_host.h"
#include "nsgamepad.h"

#define JOY_MAX_DEVICES 32

struct JoyDevice;

// Discovers joysticks, runs one decoder thread per supported device and
// reaps the threads whose device went away.
class JoyRegistry
{
public:
	JoyRegistry(JoyHost *host, GamepadSink *sink, const char *dir);
	virtual ~JoyRegistry();

	// one reap and discovery pass
	void poll();

	// poll every interval ms until quit is raised
	void run(unsigned long interval, const std::atomic<bool> &quit);

	int count() const;
	bool tracked(const char *path) const;

	// -1 if the path is not tracked
	int model(const char *path) const;
	int role(const char *path) const;
	int generation(const char *path) const;

	// decoder has exited but the device was not reaped yet
	bool finished(const char *path) const;

protected:
	// starts the decoder thread, pthread_create error code on failure
	virtual int start_decoder(JoyDevice *dev);

private:
	JoyRegistry(const JoyRegistry &);
	JoyRegistry &operator=(const JoyRegistry &);

	JoyDevice *find(const char *path) const;
	void reap();
	void attach(const std::string &path);

	JoyHost *host;
	GamepadSink *sink;
	std::string dir;

	std::vector<JoyDevice *> devices;
	unsigned dr_count;
	int attach_count;
};

#endif // JOY_REGISTRY_H
