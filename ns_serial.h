#ifndef NS_SERIAL_H
#define NS_SERIAL_H

#include <inttypes.h>
#include "nsgamepad.h"

// STX, length, 8 byte payload, ETX
#define NS_FRAME_SIZE  11
#define NS_FRAME_STX   0x02
#define NS_FRAME_ETX   0x03

int ns_frame_encode(const ns_report_t *report, uint8_t *frame);

// UART link to the NSGadget board emulating the Switch controller
class NSSerial : public GamepadWire
{
public:
	NSSerial();
	~NSSerial();

	bool open(const char *name, uint32_t baud);

	// first of names that opens, empty entries are skipped
	bool open_any(const char (*names)[256], int count, uint32_t baud);

	// use an already configured descriptor, ownership passes to this object
	void attach(int fd);
	void close();
	bool is_open() const { return fd >= 0; }

	void send(const ns_report_t *report);

	unsigned long frames() const { return sent; }

private:
	NSSerial(const NSSerial &);
	NSSerial &operator=(const NSSerial &);

	int fd;
	unsigned long sent;
};

#endif // NS_SERIAL_H
