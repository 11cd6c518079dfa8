/**
 * @file app.cpp
 * @brief Pulse generator example application
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include <FreeRTOS.h>
#include <task.h>

#include <hardware/adc.h>
#include <hardware/gpio.h>
#include <pico/status_led.h>

#include "app.hpp"


using namespace Forge;
using namespace Forge::Instruments;

using Forge::Shim::HandshakeState;

const char* App::getComponentName() const {
    return "PulseGenerator";
}

bool App::_activateHardware() {
    gpio_init(OUTPUT_PIN);
    gpio_set_dir(OUTPUT_PIN, GPIO_OUT);
    gpio_put(OUTPUT_PIN, false);

    adc_init();
    adc_gpio_init(ADC_PIN);
    adc_select_input(ADC_CHANNEL);

    return true;
}

App::External App::_sampleInputs() {
    External external;

    // 12-bit conversion, same range as the threshold field
    external.inputLevel = adc_read();

    return external;
}

void App::_applyOutputs(const Outputs &outputs) {
    gpio_put(OUTPUT_PIN, outputs.app.output);
}

void App::_makeOutputsSafe() {
    gpio_put(OUTPUT_PIN, false);
}

void App::_initCore0() {
    xTaskCreate(
        [](void *param) {
            static_cast<App*>(param)->_statusTask();
        },
        "status",
        1024,
        this,
        2,
        NULL
    );

    xTaskCreate(
        [](void *param) {
            static_cast<App*>(param)->_demoHostTask();
        },
        "host",
        1024,
        this,
        3,
        NULL
    );
}

void App::_statusTask() {
    while (true) {
        const auto view = Runner::Pipeline::Shim::decodeStatus(_runner.registers().snapshotStatus());

        status_led_set_state(view.app.state == Forge::Fsm::StateCode::Active ||
                             view.app.state == Forge::Fsm::StateCode::Armed);

        printf("state=%s fault=%s handshake=%s enable=%d gen=%u pulses=%u level>=%u missed=%lu (last +%lu us)\n",
               Forge::Fsm::stateName(view.app.state),
               Forge::Fsm::faultCodeName(view.app.fault),
               Forge::Shim::handshakeStateName(view.shim.handshake),
               view.shim.appEnable ? 1 : 0,
               static_cast<unsigned>(view.shim.configGeneration),
               static_cast<unsigned>(view.app.pulseCount),
               static_cast<unsigned>(view.app.threshold),
               static_cast<unsigned long>(_runner.scheduler().missedDeadlines()),
               static_cast<unsigned long>(_runner.scheduler().lastOverrunUs()));

        vTaskDelay(pdMS_TO_TICKS(1000));
    }
}

void App::_demoHostTask() {
    const auto &bits = PulseInstrument::layout.controlBits;

    _setControlBit(bits.forgeReady, true);
    _setControlBit(bits.userEnable, true);
    _setControlBit(bits.clkEnable, true);

    // Pulse 5 ms long whenever the input is above mid-scale, 20 ms apart
    _setControlField(PulseFields::Threshold, 2048);
    _setControlField(PulseFields::Source, static_cast<uint32_t>(TriggerSource::Level));
    _setControlField(PulseFields::Mode, static_cast<uint32_t>(PulseMode::Continuous));
    _setControlField(PulseFields::Duration, 5);
    _setControlField(PulseFields::Settle, 20);

    const uint16_t generationBefore = Runner::Pipeline::Shim::decodeStatus(_runner.registers().snapshotStatus()).shim.configGeneration;

    _setControlBit(bits.commit, true);
    vTaskDelay(pdMS_TO_TICKS(5));
    _setControlBit(bits.commit, false);

    if (_waitForHandshakeIdle(generationBefore)) {
        _setControlField(PulseFields::Arm, 1);
        printf("Demo host: configuration applied, instrument armed\n");
    } else {
        printf("Demo host: configuration was not applied\n");
    }

    vTaskDelete(NULL);
}

bool App::_waitForHandshakeIdle(uint16_t generationBefore) {
    for (int i = 0; i < 100; i++) {
        const auto view = Runner::Pipeline::Shim::decodeStatus(_runner.registers().snapshotStatus());

        if (view.shim.configGeneration != generationBefore && view.shim.handshake == HandshakeState::Idle) {
            return true;
        }

        vTaskDelay(pdMS_TO_TICKS(1));
    }

    return false;
}

void App::_setControlBit(const Forge::Registers::BitPosition &position, bool value) {
    const uint32_t mask = Forge::Registers::bitMask(position);
    _runner.registers().modifyControl(position.reg, value ? mask : 0, value ? 0 : mask);
}

void App::_setControlField(const Forge::Registers::FieldDescriptor &field, uint32_t value) {
    const uint32_t mask = Forge::Registers::placedMask(field);
    const uint32_t placed = Forge::Registers::insertField(field, 0, value);
    _runner.registers().modifyControl(field.reg, placed, mask & ~placed);
}
