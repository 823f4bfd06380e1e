/*
* @license
* (C) zachbabanov
*
*/

#include <input.hpp>
#include <logger.hpp>

using namespace gamecast::common;

namespace gamecast::input {

    const char *input_device_name(InputDevice d) {
        switch (d) {
            case InputDevice::KEYBOARD: return "keyboard";
            case InputDevice::MOUSE_BUTTON: return "mouse-button";
            case InputDevice::MOUSE_MOVE: return "mouse-move";
            case InputDevice::MOUSE_WHEEL: return "mouse-wheel";
            case InputDevice::GAMEPAD: return "gamepad";
        }
        return "unknown";
    }

    void encode_input(const InputEvent &ev, std::vector<uint8_t> &out) {
        ByteWriter w(out);
        w.u32(ev.seq);
        w.u16((uint16_t)ev.device);
        w.u16(ev.code);
        w.u32((uint32_t)ev.value);
    }

    bool decode_input(const uint8_t *data, size_t len, InputEvent &out) {
        ByteReader r(data, len);
        InputEvent ev;
        ev.seq = r.u32();
        uint16_t dev = r.u16();
        ev.code = r.u16();
        ev.value = (int32_t)r.u32();
        if (!r.ok()) return false;
        if (dev < (uint16_t)InputDevice::KEYBOARD || dev > (uint16_t)InputDevice::GAMEPAD) return false;
        ev.device = (InputDevice)dev;
        out = ev;
        return true;
    }

    void LoggingInputSink::on_input(SessionToken token, const InputEvent &ev) {
        ++received_;
        last_ = ev;
        LOG_SESSION_DEBUG("input session={:016x} seq={} {} code={} value={}",
                          token, ev.seq, input_device_name(ev.device), ev.code, ev.value);
    }

} // namespace gamecast::input
