/**
 * @file register_layout.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 */

#include "forge/register_layout.hpp"


namespace Forge::Registers {

    const char *layoutErrorName(LayoutError error) {
        switch (error) {
            case LayoutError::None:
                return "none";
            case LayoutError::RegisterOutOfRange:
                return "register out of range";
            case LayoutError::ZeroWidth:
                return "zero width";
            case LayoutError::SlotOverflow:
                return "slot extends past bit 31";
            case LayoutError::ValueWiderThanSlot:
                return "value wider than slot";
            case LayoutError::FieldOverlap:
                return "field overlap";
            case LayoutError::ReservedBitOverlap:
                return "reserved control bit overlap";
        }

        return "unknown";
    }

} // namespace Forge::Registers
