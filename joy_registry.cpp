#include <stdio.h>
#include <string.h>
#include <pthread.h>

#include "joy_registry.h"
#include "joy_decoder.h"
#include "joy_profile.h"
#include "hardware.h"
#include "debug.h"

struct JoyDevice
{
	std::string path;
	int fd;
	int model;
	int role;
	int generation;

	JoyHost *host;
	JoyDecoder decoder;

	pthread_t thread;
	std::atomic<bool> stop;
	std::atomic<bool> done;

	JoyDevice(const std::string &path, int fd, int model, int role, const joy_profile_t *profile, JoyHost *host, GamepadSink *sink)
		: path(path), fd(fd), model(model), role(role), generation(0), host(host),
		decoder(profile, sink), thread(), stop(false), done(false)
	{
	}
};

static void *joy_thread(void *arg)
{
	JoyDevice *dev = (JoyDevice *)arg;

	int events = dev->decoder.run(dev->host, dev->fd, &dev->stop);
	registry_debugf("%s: decoder exit after %d events", dev->path.c_str(), events);

	dev->done = true;
	return NULL;
}

JoyRegistry::JoyRegistry(JoyHost *host, GamepadSink *sink, const char *dir)
	: host(host), sink(sink), dir(dir), dr_count(0), attach_count(0)
{
}

JoyRegistry::~JoyRegistry()
{
	for (size_t i = 0; i < devices.size(); i++) devices[i]->stop = true;

	for (size_t i = 0; i < devices.size(); i++)
	{
		pthread_join(devices[i]->thread, NULL);
		delete devices[i];
	}
	devices.clear();
}

JoyDevice *JoyRegistry::find(const char *path) const
{
	for (size_t i = 0; i < devices.size(); i++)
	{
		if (devices[i]->path == path) return devices[i];
	}
	return NULL;
}

void JoyRegistry::reap()
{
	for (size_t i = 0; i < devices.size();)
	{
		JoyDevice *dev = devices[i];
		if (!dev->done)
		{
			i++;
			continue;
		}

		pthread_join(dev->thread, NULL);
		printf("joystick %s removed\n", dev->path.c_str());

		delete dev;
		devices.erase(devices.begin() + i);
	}
}

int JoyRegistry::start_decoder(JoyDevice *dev)
{
	return pthread_create(&dev->thread, NULL, joy_thread, dev);
}

void JoyRegistry::attach(const std::string &path)
{
	if (devices.size() >= JOY_MAX_DEVICES)
	{
		registry_debugf("%s: too many devices, ignored", path.c_str());
		return;
	}

	int fd = host->open_dev(path.c_str());
	if (fd < 0) return;

	char name[128];
	if (!host->get_name(fd, name, sizeof(name)))
	{
		host->close_dev(fd);
		return;
	}

	int model = joy_match_model(name);
	if (model < 0)
	{
		registry_debugf("%s: unsupported device \"%s\"", path.c_str(), name);
		host->close_dev(fd);
		return;
	}

	int role = JOY_ROLE_NONE;
	if (model == JOY_DRAGONRISE) role = (dr_count & 1) ? JOY_ROLE_RIGHT : JOY_ROLE_LEFT;

	const joy_profile_t *profile = joy_get_profile(model, role);
	JoyDevice *dev = new JoyDevice(path, fd, model, role, profile, host, sink);
	dev->generation = ++attach_count;

	int ret = start_decoder(dev);
	if (ret)
	{
		printf("%s: failed to start decoder: %s\n", path.c_str(), strerror(ret));
		host->close_dev(fd);
		delete dev;
		return;
	}

	if (model == JOY_DRAGONRISE) dr_count++;
	devices.push_back(dev);
	printf("Found %s on %s (%s)\n", profile->name, path.c_str(), name);
}

void JoyRegistry::poll()
{
	reap();

	std::vector<std::string> paths = host->list(dir.c_str());
	for (size_t i = 0; i < paths.size(); i++)
	{
		if (!find(paths[i].c_str())) attach(paths[i]);
	}
}

void JoyRegistry::run(unsigned long interval, const std::atomic<bool> &quit)
{
	while (!quit)
	{
		poll();
		WaitTimer(interval);
	}
}

int JoyRegistry::count() const
{
	return (int)devices.size();
}

bool JoyRegistry::tracked(const char *path) const
{
	return find(path) != NULL;
}

int JoyRegistry::model(const char *path) const
{
	JoyDevice *dev = find(path);
	return dev ? dev->model : -1;
}

int JoyRegistry::role(const char *path) const
{
	JoyDevice *dev = find(path);
	return dev ? dev->role : -1;
}

int JoyRegistry::generation(const char *path) const
{
	JoyDevice *dev = find(path);
	return dev ? dev->generation : -1;
}

bool JoyRegistry::finished(const char *path) const
{
	JoyDevice *dev = find(path);
	return dev && dev->done;
}
