#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <dirent.h>
#include <sys/ioctl.h>
#include <linux/joystick.h>
#include <algorithm>

#include "joy_host.h"
#include "debug.h"

std::vector<std::string> LinuxJoyHost::list(const char *dir)
{
	std::vector<std::string> names;

	DIR *d = opendir(dir);
	if (!d)
	{
		registry_debugf("opendir(%s): %s", dir, strerror(errno));
		return names;
	}

	struct dirent *de;
	while ((de = readdir(d)))
	{
		if (strncmp(de->d_name, "js", 2)) continue;

		std::string path(dir);
		path += '/';
		path += de->d_name;
		names.push_back(path);
	}
	closedir(d);

	// readdir order is arbitrary, keep role assignment stable across runs
	std::sort(names.begin(), names.end());
	return names;
}

int LinuxJoyHost::open_dev(const char *path)
{
	int fd = open(path, O_RDONLY | O_CLOEXEC);
	if (fd < 0) registry_debugf("open(%s): %s", path, strerror(errno));
	return fd;
}

bool LinuxJoyHost::get_name(int fd, char *name, size_t size)
{
	memset(name, 0, size);
	if (ioctl(fd, JSIOCGNAME(size - 1), name) < 0)
	{
		registry_debugf("JSIOCGNAME failed: %s", strerror(errno));
		return false;
	}
	return true;
}

ssize_t LinuxJoyHost::read_dev(int fd, void *buf, size_t size)
{
	return read(fd, buf, size);
}

void LinuxJoyHost::close_dev(int fd)
{
	close(fd);
}
