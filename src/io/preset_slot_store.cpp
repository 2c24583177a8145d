#include "io/preset_slot_store.h"

#include <array>
#include <charconv>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace VoiceShaper {

Status copySlot(IPresetSlotStore& store, SlotId source, SlotId target) {
    auto read = store.readSlot(source);
    if (!read) {
        return read.status();
    }
    return store.writeSlot(target, read.value);
}

// =============================================================================
// MemorySlotStore
// =============================================================================

Result<FormantVector> MemorySlotStore::readSlot(SlotId id) {
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        return Result<FormantVector>::failure(ErrorCode::SlotUnavailable,
                                              "slot " + std::to_string(id) + " is empty");
    }
    return Result<FormantVector>::success(it->second);
}

Status MemorySlotStore::writeSlot(SlotId id, const FormantVector& vector) {
    slots_.insert_or_assign(id, vector);
    return Status::ok();
}

// =============================================================================
// DirectorySlotStore
// =============================================================================

DirectorySlotStore::DirectorySlotStore(std::filesystem::path directory)
    : directory_(std::move(directory))
{
}

std::filesystem::path DirectorySlotStore::slotPath(SlotId id) const {
    return directory_ / ("slot" + std::to_string(id) + ".knobs");
}

Result<FormantVector> DirectorySlotStore::readSlot(SlotId id) {
    using R = Result<FormantVector>;
    const auto path = slotPath(id);

    std::ifstream file(path);
    if (!file) {
        return R::failure(ErrorCode::SlotUnavailable, "cannot open " + path.string());
    }

    FormantVector vector;
    std::array<bool, kNumFormantFields> seen{};

    std::string line;
    while (std::getline(file, line)) {
        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const auto field = fieldFromName(std::string_view(line).substr(0, eq));
        if (!field) continue;

        const char* first = line.data() + eq + 1;
        const char* last = line.data() + line.size();
        if (last != first && *(last - 1) == '\r') --last;

        float value = 0.0f;
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            return R::failure(ErrorCode::SlotUnavailable,
                              path.string() + ": bad value for " + std::string(fieldName(*field)));
        }
        vector = vector.withValue(*field, value);
        seen[static_cast<size_t>(*field)] = true;
    }

    for (FormantField field : kDispatchOrder) {
        if (!seen[static_cast<size_t>(field)]) {
            return R::failure(ErrorCode::SlotUnavailable,
                              path.string() + ": missing " + std::string(fieldName(field)));
        }
    }
    return R::success(vector);
}

Status DirectorySlotStore::writeSlot(SlotId id, const FormantVector& vector) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return Status::failure(ErrorCode::IoError,
                               "cannot create " + directory_.string() + ": " + ec.message());
    }

    const auto path = slotPath(id);
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return Status::failure(ErrorCode::IoError, "cannot write " + path.string());
    }

    // Shortest text that reads back to the same float
    char buffer[32];
    for (FormantField field : kDispatchOrder) {
        const auto [end, err] = std::to_chars(buffer, buffer + sizeof(buffer), vector.value(field));
        if (err != std::errc()) {
            return Status::failure(ErrorCode::IoError, "cannot format " + std::string(fieldName(field)));
        }
        file << fieldName(field) << '=' << std::string_view(buffer, static_cast<size_t>(end - buffer)) << '\n';
    }
    file.flush();
    if (!file) {
        return Status::failure(ErrorCode::IoError, "write failed for " + path.string());
    }
    return Status::ok();
}

} // namespace VoiceShaper
