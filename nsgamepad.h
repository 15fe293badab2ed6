/*****************************************************************************/
// Virtual Nintendo Switch gamepad as seen by the console
/*****************************************************************************/

#ifndef NSGAMEPAD_H
#define NSGAMEPAD_H

#include <inttypes.h>
#include <pthread.h>

// Button codes are the bit positions in the report.
enum NSButton
{
	NS_BTN_Y = 0,
	NS_BTN_B,
	NS_BTN_A,
	NS_BTN_X,
	NS_BTN_LEFT_TRIGGER,
	NS_BTN_RIGHT_TRIGGER,
	NS_BTN_LEFT_THROTTLE,
	NS_BTN_RIGHT_THROTTLE,
	NS_BTN_MINUS,
	NS_BTN_PLUS,
	NS_BTN_LEFT_STICK,
	NS_BTN_RIGHT_STICK,
	NS_BTN_HOME,
	NS_BTN_CAPTURE,
	NS_BTN_RESERVED1,
	NS_BTN_RESERVED2
};

#define NS_BTN_NUM 14 // usable buttons, reserved codes are never sent

enum NSDPad
{
	NS_DPAD_UP = 0,
	NS_DPAD_UP_RIGHT,
	NS_DPAD_RIGHT,
	NS_DPAD_DOWN_RIGHT,
	NS_DPAD_DOWN,
	NS_DPAD_DOWN_LEFT,
	NS_DPAD_LEFT,
	NS_DPAD_UP_LEFT,
	NS_DPAD_CENTERED = 0xF
};

enum NSAxis
{
	NS_AXIS_LX = 0,
	NS_AXIS_LY,
	NS_AXIS_RX,
	NS_AXIS_RY
};

#define NS_AXIS_NUM    4
#define NS_AXIS_CENTER 128

typedef struct
{
	uint16_t buttons;
	uint8_t  dpad;
	uint8_t  axis[NS_AXIS_NUM];
} ns_report_t;

void ns_report_reset(ns_report_t *report);
const char *ns_button_name(int button);
const char *ns_dpad_name(int direction);

// Capability every input source writes into.
struct GamepadSink
{
	virtual ~GamepadSink() {}

	virtual void press(NSButton button) = 0;
	virtual void release(NSButton button) = 0;
	virtual void set_axis(NSAxis axis, uint8_t value) = 0;
	virtual void set_left_axis(uint8_t x, uint8_t y) = 0;
	virtual void set_right_axis(uint8_t x, uint8_t y) = 0;
	virtual void set_dpad(NSDPad direction) = 0;
	virtual void release_all() = 0;
};

// Downstream of the shared gamepad, receives every committed report.
struct GamepadWire
{
	virtual ~GamepadWire() {}
	virtual void send(const ns_report_t *report) = 0;
};

// The one gamepad state shared by all input threads. Every mutation and the
// wire write it triggers happen under one lock, so reports leave in the
// order the mutations were applied and frames are never interleaved.
class SharedGamepad : public GamepadSink
{
public:
	explicit SharedGamepad(GamepadWire *wire);
	~SharedGamepad();

	void press(NSButton button);
	void release(NSButton button);
	void set_axis(NSAxis axis, uint8_t value);
	void set_left_axis(uint8_t x, uint8_t y);
	void set_right_axis(uint8_t x, uint8_t y);
	void set_dpad(NSDPad direction);
	void release_all();

	void snapshot(ns_report_t *out);

private:
	SharedGamepad(const SharedGamepad &);
	SharedGamepad &operator=(const SharedGamepad &);

	void commit();

	pthread_mutex_t lock;
	ns_report_t report;
	GamepadWire *wire;
};

#endif // NSGAMEPAD_H
