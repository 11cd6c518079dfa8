/**
 * @file layout_test.cpp
 * @brief Tests for register layout validation, field helpers and the register file.
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 */

#include "test_check.hpp"

#include <iostream>

#include <forge/pulse_instrument.hpp>
#include <forge/register_file.hpp>
#include <forge/register_layout.hpp>

using namespace Forge::Registers;

namespace {

    using SmallLayout = RegisterLayout<1, 1, 1>;

    constexpr ShimStatusMap goodShimMap = {
        .handshakeState   = {"handshake_state",   Bank::Status, 0, 0,  2, 2},
        .appEnable        = {"app_enable",        Bank::Status, 0, 2,  1, 1},
        .requestUpdate    = {"request_update",    Bank::Status, 0, 3,  1, 1},
        .readyForUpdates  = {"ready_for_updates", Bank::Status, 0, 4,  1, 1},
        .configGeneration = {"config_generation", Bank::Status, 0, 8,  8, 8},
        .layoutVersion    = {"layout_version",    Bank::Status, 0, 16, 8, 8},
    };

    constexpr ControlBitMap goodControlBits = {
        .forgeReady = {0, 0},
        .userEnable = {0, 1},
        .clkEnable  = {0, 2},
        .commit     = {0, 3},
        .faultClear = {0, 4},
    };

    constexpr SmallLayout makeLayout(FieldDescriptor field) {
        return SmallLayout{
            .version = 1,
            .controlBits = goodControlBits,
            .shimStatus = goodShimMap,
            .fields = {{field}},
        };
    }

    // Compile-time checks on the shipped layout and on a few broken ones
    static_assert(validateLayout(Forge::Instruments::PulseInstrument::layout) == LayoutError::None);
    static_assert(validateLayout(makeLayout({"ok", Bank::Control, 0, 8, 8, 8})) == LayoutError::None);
    static_assert(validateLayout(makeLayout({"wide", Bank::Status, 0, 24, 4, 5})) == LayoutError::ValueWiderThanSlot);

}

int main() {
    std::cout << "=== Register Layout Test ===" << std::endl;

    test_section("Field helpers");
    {
        const FieldDescriptor field{"f", Bank::Control, 0, 4, 4, 4};
        test_check(extractField(field, 0x000000A0u) == 0xA, "extract reads the slot");
        test_check(insertField(field, 0xFFFFFFFFu, 0x0) == 0xFFFFFF0Fu, "insert clears only the slot");
        test_check(insertField(field, 0x0, 0x1F) == 0xF0u, "insert masks values wider than the slot");

        const FieldDescriptor full{"full", Bank::Control, 0, 0, 32, 32};
        test_check(extractField(full, 0xDEADBEEFu) == 0xDEADBEEFu, "32-bit slot reads the whole word");
        test_check(insertField(full, 0, 0xCAFEF00Du) == 0xCAFEF00Du, "32-bit slot writes the whole word");

        std::array<uint32_t, 2> words{};
        const FieldDescriptor second{"s", Bank::Control, 1, 16, 16, 16};
        writeField(second, words, 0x1234);
        test_check(words[0] == 0 && words[1] == 0x12340000u, "writeField targets the right register");
        test_check(readField(second, words) == 0x1234, "readField reads it back");

        const FieldDescriptor outside{"o", Bank::Control, 5, 0, 8, 8};
        writeField(outside, words, 0xFF);
        test_check(readField(outside, words) == 0 && words[0] == 0, "out-of-range register reads zero and ignores writes");
    }

    test_section("Layout validation");
    {
        const char *failing = nullptr;

        test_check(validateLayout(Forge::Instruments::PulseInstrument::layout, &failing) == LayoutError::None && failing == nullptr,
                   "pulse generator layout is valid");

        test_check(validateLayout(makeLayout({"far", Bank::Control, 1, 8, 8, 8}), &failing) == LayoutError::RegisterOutOfRange,
                   "field in a missing register is rejected");
        test_check(failing != nullptr && std::string(failing) == "far", "failing field is named");

        test_check(validateLayout(makeLayout({"empty", Bank::Control, 0, 8, 0, 0})) == LayoutError::ZeroWidth,
                   "zero-width field is rejected");

        test_check(validateLayout(makeLayout({"spill", Bank::Control, 0, 28, 8, 8})) == LayoutError::SlotOverflow,
                   "field past bit 31 is rejected");

        test_check(validateLayout(makeLayout({"wide", Bank::Status, 0, 24, 4, 5})) == LayoutError::ValueWiderThanSlot,
                   "value wider than its slot is rejected");

        test_check(validateLayout(makeLayout({"clash", Bank::Status, 0, 4, 2, 2})) == LayoutError::FieldOverlap,
                   "field overlapping a shim status field is rejected");

        test_check(validateLayout(makeLayout({"onCommit", Bank::Control, 0, 3, 1, 1})) == LayoutError::ReservedBitOverlap,
                   "field covering a reserved control bit is rejected");

        SmallLayout duplicateBits = makeLayout({"ok", Bank::Control, 0, 8, 8, 8});
        duplicateBits.controlBits.faultClear = duplicateBits.controlBits.commit;
        test_check(validateLayout(duplicateBits) == LayoutError::ReservedBitOverlap,
                   "two reserved bits at the same position are rejected");

        SmallLayout missingReserved = makeLayout({"ok", Bank::Control, 0, 8, 8, 8});
        missingReserved.controlBits.clkEnable = {3, 0};
        test_check(validateLayout(missingReserved) == LayoutError::RegisterOutOfRange,
                   "reserved bit outside the control bank is rejected");

        SmallLayout shimInControl = makeLayout({"ok", Bank::Control, 0, 8, 8, 8});
        shimInControl.shimStatus.appEnable.bank = Bank::Control;
        test_check(validateLayout(shimInControl) == LayoutError::RegisterOutOfRange,
                   "shim status field in the control bank is rejected");

        test_check(std::string(layoutErrorName(LayoutError::FieldOverlap)) == "field overlap", "errors have names");
    }

    test_section("Register file partition");
    {
        RegisterFile<2, 3> file;
        uint32_t value = 1;

        test_check(file.readControl(0, value) && value == 0, "control bank starts cleared");
        test_check(file.readStatus(2, value) && value == 0, "status bank starts cleared");

        test_check(file.writeControl(1, 0xABCD0000u), "host writes a control word");
        test_check(!file.writeControl(2, 1), "host write past the control bank is rejected");
        test_check(!file.readStatus(3, value), "host read past the status bank is rejected");

        test_check(file.modifyControl(0, 0x5, 0) && file.readControl(0, value) && value == 0x5, "modify sets bits");
        test_check(file.modifyControl(0, 0, 0x1) && file.readControl(0, value) && value == 0x4, "modify clears bits");

        const auto control = file.snapshotControl();
        test_check(control[0] == 0x4 && control[1] == 0xABCD0000u, "device snapshot sees host writes");

        file.publishStatus({1, 2, 3});
        test_check(file.readStatus(1, value) && value == 2, "host reads published status");

        const auto unchanged = file.snapshotControl();
        test_check(unchanged == control, "publishing status leaves the control bank alone");

        file.clear();
        test_check(file.snapshotStatus() == (std::array<uint32_t, 3>{0, 0, 0}), "clear zeroes the status bank");
    }

    return test_summary();
}
