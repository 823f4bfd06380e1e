/*
* @license
* (C) zachbabanov
*
*/

#ifndef GAMECAST_INPUT_HPP
#define GAMECAST_INPUT_HPP

#pragma once

#include <common.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gamecast::input {

    enum class InputDevice : uint16_t {
        KEYBOARD = 1,
        MOUSE_BUTTON = 2,
        MOUSE_MOVE = 3,
        MOUSE_WHEEL = 4,
        GAMEPAD = 5
    };

    const char *input_device_name(InputDevice d);

/**
 * @brief One decoded input event from the client.
 *
 * Wire body (network byte order, 12 bytes):
 *   uint32_t seq; uint16_t device; uint16_t code; int32_t value;
 */
    struct InputEvent {
        uint32_t seq = 0;
        InputDevice device = InputDevice::KEYBOARD;
        uint16_t code = 0;
        int32_t value = 0;
    };

    constexpr size_t INPUT_BODY_SIZE = 12;

    void encode_input(const InputEvent &ev, std::vector<uint8_t> &out);
    bool decode_input(const uint8_t *data, size_t len, InputEvent &out);

/**
 * @brief Ordered consumer of input events. Nothing is acknowledged.
 */
    class IInputSink {
    public:
        virtual ~IInputSink() = default;
        virtual void on_input(common::SessionToken token, const InputEvent &ev) = 0;
    };

    /// Logs every event at DEBUG. Stands in for a platform injector.
    class LoggingInputSink : public IInputSink {
    public:
        void on_input(common::SessionToken token, const InputEvent &ev) override;

        uint64_t received() const { return received_; }
        const InputEvent &last() const { return last_; }

    private:
        uint64_t received_ = 0;
        InputEvent last_;
    };

} // namespace gamecast::input

#endif // GAMECAST_INPUT_HPP
