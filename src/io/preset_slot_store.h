#pragma once

// ==============================================================================
// Preset Slot Stores
// ==============================================================================
// A slot holds one full formant parameter set, addressed by number. The
// engine only reads and writes whole vectors; the on-device byte layout
// belongs to the librarian.
//
// Thread Safety: stores are used from the control thread only.
// ==============================================================================

#include "model/errors.h"
#include "model/formant_vector.h"

#include <filesystem>
#include <map>

namespace VoiceShaper {

using SlotId = int;

class IPresetSlotStore {
public:
    virtual ~IPresetSlotStore() = default;

    /// SlotUnavailable when the slot is empty or unreadable
    [[nodiscard]] virtual Result<FormantVector> readSlot(SlotId id) = 0;

    [[nodiscard]] virtual Status writeSlot(SlotId id, const FormantVector& vector) = 0;
};

/// Copy one slot to another through the store's own read/write
[[nodiscard]] Status copySlot(IPresetSlotStore& store, SlotId source, SlotId target);

// ==============================================================================
// MemorySlotStore
// ==============================================================================

class MemorySlotStore : public IPresetSlotStore {
public:
    [[nodiscard]] Result<FormantVector> readSlot(SlotId id) override;
    [[nodiscard]] Status writeSlot(SlotId id, const FormantVector& vector) override;

    [[nodiscard]] bool contains(SlotId id) const { return slots_.count(id) != 0; }

private:
    std::map<SlotId, FormantVector> slots_;
};

// ==============================================================================
// DirectorySlotStore
// ==============================================================================
// One "slot<id>.knobs" text file per slot, "NAME=value" per line in field
// order. Unknown names and blank lines are ignored; every field must appear.

class DirectorySlotStore : public IPresetSlotStore {
public:
    explicit DirectorySlotStore(std::filesystem::path directory);

    [[nodiscard]] Result<FormantVector> readSlot(SlotId id) override;
    [[nodiscard]] Status writeSlot(SlotId id, const FormantVector& vector) override;

    [[nodiscard]] std::filesystem::path slotPath(SlotId id) const;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    std::filesystem::path directory_;
};

} // namespace VoiceShaper
