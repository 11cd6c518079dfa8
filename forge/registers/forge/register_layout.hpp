/**
 * @file register_layout.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Compile-time description of an instrument's register map.
 *
 * Every instrument declares exactly one RegisterLayout. The layout names the
 * number of control and status words, the position of the reserved control
 * bits that the shim interprets itself (enable inputs, commit, fault clear),
 * the position of the shim's own status fields, and a table of instrument
 * fields.
 *
 * All helpers in this file are constexpr so that a layout can be validated
 * with a static_assert at the point where it is declared. The same validation
 * is repeated at component activation on the target, so that a layout that
 * somehow escapes the compile-time check still cannot run.
 *
 * Any edit to a layout is a breaking change for host software. Bump the
 * layout version whenever a field moves, changes width or changes meaning.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>


namespace Forge::Registers {

    /**
     * @brief Register bank a field lives in
     */
    enum class Bank : uint8_t {
        Control,    ///< Host-writable, device-read
        Status,     ///< Device-writable, host-read
    };

    /**
     * @brief Position and width of a single field inside a register bank
     *
     * The slot width is the number of bits reserved for the field in the
     * register. The value width is the number of significant bits of the
     * typed value the field carries. A value wider than its slot cannot be
     * encoded losslessly and is rejected by validateLayout().
     */
    struct FieldDescriptor {
        const char *name;       ///< Human-readable name, used in diagnostics
        Bank bank;              ///< Bank the field lives in
        uint8_t reg;            ///< Register index within the bank
        uint8_t offset;         ///< Bit offset of the least significant bit
        uint8_t slotWidth;      ///< Bits reserved in the register
        uint8_t valueBits;      ///< Significant bits of the typed value
    };

    /**
     * @brief Location of a single reserved control bit
     */
    struct BitPosition {
        uint8_t reg;
        uint8_t bit;
    };

    /**
     * @brief Reserved control bits interpreted by the shim
     *
     * These bits are not part of any instrument configuration. They are
     * carried explicitly by the layout and handed to the decoder, rather than
     * being implied by a convention shared between host and device.
     */
    struct ControlBitMap {
        BitPosition forgeReady;     ///< Platform bring-up complete
        BitPosition userEnable;     ///< Host intent to run
        BitPosition clkEnable;      ///< Clock domain gating
        BitPosition commit;         ///< Configuration commit, edge-triggered
        BitPosition faultClear;     ///< Explicit fault reset, edge-triggered
    };

    /**
     * @brief Status fields owned by the shim itself
     */
    struct ShimStatusMap {
        FieldDescriptor handshakeState;
        FieldDescriptor appEnable;
        FieldDescriptor requestUpdate;
        FieldDescriptor readyForUpdates;
        FieldDescriptor configGeneration;
        FieldDescriptor layoutVersion;
    };

    /**
     * @brief Result of validating a register layout
     */
    enum class LayoutError : uint8_t {
        None = 0,
        RegisterOutOfRange,     ///< Field or bit references a register the bank does not have
        ZeroWidth,              ///< Field has a zero-width slot or value
        SlotOverflow,           ///< Field extends past bit 31
        ValueWiderThanSlot,     ///< Typed value cannot be encoded losslessly
        FieldOverlap,           ///< Two fields share bits in the same register
        ReservedBitOverlap,     ///< A field or reserved bit collides with a reserved control bit
    };

    /**
     * @brief Return a printable name for a layout error
     */
    const char *layoutErrorName(LayoutError error);

    /**
     * @brief Complete register map for one instrument
     *
     * @tparam ControlCount Number of 32-bit control words
     * @tparam StatusCount Number of 32-bit status words
     * @tparam FieldCount Number of instrument-specific fields
     */
    template<std::size_t ControlCount, std::size_t StatusCount, std::size_t FieldCount>
    struct RegisterLayout {
        static constexpr std::size_t controlCount = ControlCount;
        static constexpr std::size_t statusCount = StatusCount;
        static constexpr std::size_t fieldCount = FieldCount;

        using ControlWords = std::array<uint32_t, ControlCount>;
        using StatusWords = std::array<uint32_t, StatusCount>;

        uint16_t version;
        ControlBitMap controlBits;
        ShimStatusMap shimStatus;
        std::array<FieldDescriptor, FieldCount> fields;
    };

    // Field access helpers

    constexpr uint32_t slotMask(const FieldDescriptor &field) {
        return field.slotWidth >= 32 ? 0xFFFFFFFFu : ((1u << field.slotWidth) - 1u);
    }

    constexpr uint32_t valueMask(const FieldDescriptor &field) {
        return field.valueBits >= 32 ? 0xFFFFFFFFu : ((1u << field.valueBits) - 1u);
    }

    constexpr uint32_t placedMask(const FieldDescriptor &field) {
        return slotMask(field) << field.offset;
    }

    constexpr uint32_t extractField(const FieldDescriptor &field, uint32_t word) {
        return (word >> field.offset) & slotMask(field);
    }

    constexpr uint32_t insertField(const FieldDescriptor &field, uint32_t word, uint32_t value) {
        const uint32_t mask = placedMask(field);
        return (word & ~mask) | ((value << field.offset) & mask);
    }

    constexpr uint32_t bitMask(const BitPosition &position) {
        return 1u << position.bit;
    }

    constexpr bool testBit(const BitPosition &position, uint32_t word) {
        return (word & bitMask(position)) != 0;
    }

    /**
     * @brief Read a field out of a bank snapshot
     *
     * Out-of-range register indices read as zero. A validated layout never
     * produces one.
     */
    template<std::size_t N>
    constexpr uint32_t readField(const FieldDescriptor &field, const std::array<uint32_t, N> &words) {
        return field.reg < N ? extractField(field, words[field.reg]) : 0;
    }

    /**
     * @brief Write a field into a bank image
     */
    template<std::size_t N>
    constexpr void writeField(const FieldDescriptor &field, std::array<uint32_t, N> &words, uint32_t value) {
        if (field.reg < N) {
            words[field.reg] = insertField(field, words[field.reg], value);
        }
    }

    template<std::size_t N>
    constexpr bool readBit(const BitPosition &position, const std::array<uint32_t, N> &words) {
        return position.reg < N && testBit(position, words[position.reg]);
    }

    namespace Detail {

        constexpr LayoutError checkField(const FieldDescriptor &field,
                                         std::size_t controlCount,
                                         std::size_t statusCount) {
            const std::size_t bankSize = field.bank == Bank::Control ? controlCount : statusCount;

            if (field.reg >= bankSize) {
                return LayoutError::RegisterOutOfRange;
            }

            if (field.slotWidth == 0 || field.valueBits == 0) {
                return LayoutError::ZeroWidth;
            }

            if (static_cast<uint32_t>(field.offset) + field.slotWidth > 32) {
                return LayoutError::SlotOverflow;
            }

            if (field.valueBits > field.slotWidth) {
                return LayoutError::ValueWiderThanSlot;
            }

            return LayoutError::None;
        }

        constexpr bool overlaps(const FieldDescriptor &a, const FieldDescriptor &b) {
            return a.bank == b.bank && a.reg == b.reg && (placedMask(a) & placedMask(b)) != 0;
        }

        constexpr FieldDescriptor reservedAsField(const BitPosition &position) {
            return FieldDescriptor{"reserved", Bank::Control, position.reg, position.bit, 1, 1};
        }

    } // namespace Detail

    /**
     * @brief Validate a register layout
     *
     * Checks, in order: every reserved control bit is inside the control
     * bank and distinct from the others; every shim and instrument field is
     * inside its bank, non-empty, fits within 32 bits and carries a value no
     * wider than its slot; no two fields share a bit; no field covers a
     * reserved control bit.
     *
     * @param layout The layout to validate
     * @param failingField Optional output receiving the name of the first
     *                     offending field, or nullptr if the layout is valid
     * @return LayoutError::None if the layout is valid, otherwise the first error found
     */
    template<std::size_t C, std::size_t S, std::size_t F>
    constexpr LayoutError validateLayout(const RegisterLayout<C, S, F> &layout,
                                         const char **failingField = nullptr) {
        if (failingField != nullptr) {
            *failingField = nullptr;
        }

        const std::array<BitPosition, 5> reserved = {
            layout.controlBits.forgeReady,
            layout.controlBits.userEnable,
            layout.controlBits.clkEnable,
            layout.controlBits.commit,
            layout.controlBits.faultClear,
        };

        for (std::size_t i = 0; i < reserved.size(); i++) {
            if (reserved[i].reg >= C) {
                if (failingField != nullptr) *failingField = "reserved";
                return LayoutError::RegisterOutOfRange;
            }

            if (reserved[i].bit > 31) {
                if (failingField != nullptr) *failingField = "reserved";
                return LayoutError::SlotOverflow;
            }

            for (std::size_t j = i + 1; j < reserved.size(); j++) {
                if (reserved[i].reg == reserved[j].reg && reserved[i].bit == reserved[j].bit) {
                    if (failingField != nullptr) *failingField = "reserved";
                    return LayoutError::ReservedBitOverlap;
                }
            }
        }

        std::array<FieldDescriptor, F + 6> all{};
        all[0] = layout.shimStatus.handshakeState;
        all[1] = layout.shimStatus.appEnable;
        all[2] = layout.shimStatus.requestUpdate;
        all[3] = layout.shimStatus.readyForUpdates;
        all[4] = layout.shimStatus.configGeneration;
        all[5] = layout.shimStatus.layoutVersion;

        for (std::size_t i = 0; i < F; i++) {
            all[i + 6] = layout.fields[i];
        }

        for (std::size_t i = 0; i < 6; i++) {
            if (all[i].bank != Bank::Status) {
                if (failingField != nullptr) *failingField = all[i].name;
                return LayoutError::RegisterOutOfRange;
            }
        }

        for (std::size_t i = 0; i < all.size(); i++) {
            const LayoutError error = Detail::checkField(all[i], C, S);

            if (error != LayoutError::None) {
                if (failingField != nullptr) *failingField = all[i].name;
                return error;
            }
        }

        for (std::size_t i = 0; i < all.size(); i++) {
            for (std::size_t j = i + 1; j < all.size(); j++) {
                if (Detail::overlaps(all[i], all[j])) {
                    if (failingField != nullptr) *failingField = all[j].name;
                    return LayoutError::FieldOverlap;
                }
            }

            for (const auto &position : reserved) {
                if (Detail::overlaps(all[i], Detail::reservedAsField(position))) {
                    if (failingField != nullptr) *failingField = all[i].name;
                    return LayoutError::ReservedBitOverlap;
                }
            }
        }

        return LayoutError::None;
    }

} // namespace Forge::Registers
