#ifndef JOY_HOST_H
#define JOY_HOST_H

#include <stddef.h>
#include <sys/types.h>
#include <string>
#include <vector>

// Access to the host joystick namespace. The registry and decoders only talk
// to devices through this, tests substitute pipes for device files.
struct JoyHost
{
	virtual ~JoyHost() {}

	// paths of all joystick device files currently present
	virtual std::vector<std::string> list(const char *dir) = 0;

	// -1 on failure
	virtual int open_dev(const char *path) = 0;
	virtual bool get_name(int fd, char *name, size_t size) = 0;
	virtual ssize_t read_dev(int fd, void *buf, size_t size) = 0;
	virtual void close_dev(int fd) = 0;
};

// /dev/input/js* through the Linux joystick API
class LinuxJoyHost : public JoyHost
{
public:
	std::vector<std::string> list(const char *dir);
	int open_dev(const char *path);
	bool get_name(int fd, char *name, size_t size);
	ssize_t read_dev(int fd, void *buf, size_t size);
	void close_dev(int fd);
};

#endif // JOY_HOST_H
