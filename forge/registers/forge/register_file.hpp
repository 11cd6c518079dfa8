/**
 * @file register_file.hpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * Raw register file shared between the host transport and the device.
 *
 * The register file is split into two banks of 32-bit words. The control
 * bank is written by the host and read by the device; the status bank is
 * written by the device and read by the host. The split is enforced by the
 * API: there is no device-side method that writes a control word and no
 * host-side method that writes a status word.
 *
 * Each word is an independent std::atomic<uint32_t>, so a word is never
 * observed half-written, even when the host transport runs on Core 0 and the
 * tick loop runs on Core 1. There is no cross-word atomicity: the device
 * takes one snapshot of the control bank at the start of each tick, and the
 * commit protocol is what guarantees that a multi-word configuration is
 * observed consistently.
 */

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>


namespace Forge::Registers {

    template<std::size_t ControlCount, std::size_t StatusCount>
    class RegisterFile {
    public:
        using ControlWords = std::array<uint32_t, ControlCount>;
        using StatusWords = std::array<uint32_t, StatusCount>;

        RegisterFile() {
            clear();
        }

        RegisterFile(const RegisterFile &) = delete;
        RegisterFile &operator=(const RegisterFile &) = delete;

        /**
         * @brief Zero every word in both banks (power-on state)
         */
        void clear() {
            for (auto &word : _control) {
                word.store(0, std::memory_order_relaxed);
            }

            for (auto &word : _status) {
                word.store(0, std::memory_order_relaxed);
            }

            std::atomic_thread_fence(std::memory_order_release);
        }

        // Host side

        /**
         * @brief Write a full control word
         *
         * @param index Control register index
         * @param value New register value
         * @return true on success, false if the index is out of range
         */
        bool writeControl(std::size_t index, uint32_t value) {
            if (index >= ControlCount) {
                return false;
            }

            _control[index].store(value, std::memory_order_release);
            return true;
        }

        /**
         * @brief Atomically set and clear bits in a control word
         *
         * Bits in setMask are set first, then bits in clearMask are cleared.
         *
         * @return true on success, false if the index is out of range
         */
        bool modifyControl(std::size_t index, uint32_t setMask, uint32_t clearMask) {
            if (index >= ControlCount) {
                return false;
            }

            if (setMask != 0) {
                _control[index].fetch_or(setMask, std::memory_order_acq_rel);
            }

            if (clearMask != 0) {
                _control[index].fetch_and(~clearMask, std::memory_order_acq_rel);
            }

            return true;
        }

        bool readControl(std::size_t index, uint32_t &value) const {
            if (index >= ControlCount) {
                return false;
            }

            value = _control[index].load(std::memory_order_acquire);
            return true;
        }

        bool readStatus(std::size_t index, uint32_t &value) const {
            if (index >= StatusCount) {
                return false;
            }

            value = _status[index].load(std::memory_order_acquire);
            return true;
        }

        /**
         * @brief Read the whole status bank, as a host driver would
         */
        StatusWords snapshotStatus() const {
            StatusWords words{};

            for (std::size_t i = 0; i < StatusCount; i++) {
                words[i] = _status[i].load(std::memory_order_acquire);
            }

            return words;
        }

        // Device side

        /**
         * @brief Capture the control bank at the start of a tick
         */
        ControlWords snapshotControl() const {
            ControlWords words{};

            for (std::size_t i = 0; i < ControlCount; i++) {
                words[i] = _control[i].load(std::memory_order_acquire);
            }

            return words;
        }

        /**
         * @brief Publish the status bank at the end of a tick
         */
        void publishStatus(const StatusWords &words) {
            for (std::size_t i = 0; i < StatusCount; i++) {
                _status[i].store(words[i], std::memory_order_release);
            }
        }

        static constexpr std::size_t controlCount() { return ControlCount; }
        static constexpr std::size_t statusCount() { return StatusCount; }

    protected:
        std::array<std::atomic<uint32_t>, ControlCount> _control;
        std::array<std::atomic<uint32_t>, StatusCount> _status;
    };

} // namespace Forge::Registers
