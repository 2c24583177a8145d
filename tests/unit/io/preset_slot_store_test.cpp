// ==============================================================================
// IO Tests - Preset Slot Stores
// ==============================================================================
// Tests for: src/io/preset_slot_store.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "io/preset_slot_store.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

using namespace VoiceShaper;

namespace {

const FormantVector kVoiced({612.5f, 1180.25f, 2495.0f, 3333.3333f},
                            {47.0f, 39.5f, 21.0f, 12.0f},
                            {4.1f, 5.0f, 5.9f, 6.7f});

/// Fresh directory under the system temp path, removed on scope exit
struct TempDirectory {
    std::filesystem::path path;

    explicit TempDirectory(const std::string& name)
        : path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(path);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
};

void writeText(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

} // namespace

// ==============================================================================
// MemorySlotStore
// ==============================================================================

TEST_CASE("Memory store keeps whole vectors per slot", "[slot]") {
    MemorySlotStore store;

    REQUIRE_FALSE(store.contains(3));
    REQUIRE(store.readSlot(3).error == ErrorCode::SlotUnavailable);

    REQUIRE(store.writeSlot(3, kVoiced));
    REQUIRE(store.contains(3));

    const auto read = store.readSlot(3);
    REQUIRE(read);
    REQUIRE(read.value == kVoiced);

    SECTION("overwrite replaces the vector") {
        const FormantVector quieter = kVoiced.withValue(FormantField::L1, 10.0f);
        REQUIRE(store.writeSlot(3, quieter));
        REQUIRE(store.readSlot(3).value == quieter);
    }
}

TEST_CASE("copySlot duplicates through the store", "[slot]") {
    MemorySlotStore store;
    REQUIRE(store.writeSlot(1, kVoiced));

    REQUIRE(copySlot(store, 1, 7));
    REQUIRE(store.readSlot(7).value == kVoiced);

    SECTION("empty source leaves the target alone") {
        const Status status = copySlot(store, 2, 8);
        REQUIRE(status.error == ErrorCode::SlotUnavailable);
        REQUIRE_FALSE(store.contains(8));
    }
}

// ==============================================================================
// DirectorySlotStore
// ==============================================================================

TEST_CASE("Directory store round-trips exactly", "[slot]") {
    TempDirectory dir("voiceshaper_slot_roundtrip");
    DirectorySlotStore store(dir.path / "slots");

    REQUIRE(store.writeSlot(12, kVoiced));
    REQUIRE(std::filesystem::exists(store.slotPath(12)));
    REQUIRE(store.slotPath(12).filename().string() == "slot12.knobs");

    const auto read = store.readSlot(12);
    REQUIRE(read);
    REQUIRE(read.value == kVoiced);

    SECTION("a second store on the same directory sees the slot") {
        DirectorySlotStore other(dir.path / "slots");
        REQUIRE(other.readSlot(12).value == kVoiced);
    }

    SECTION("copy between files") {
        REQUIRE(copySlot(store, 12, 13));
        REQUIRE(store.readSlot(13).value == kVoiced);
    }
}

TEST_CASE("Directory store file format", "[slot]") {
    TempDirectory dir("voiceshaper_slot_format");
    DirectorySlotStore store(dir.path);

    SECTION("hand-written file with CRLF, blanks and unknown keys") {
        writeText(store.slotPath(1),
                  "# exported\r\n"
                  "F1=500\r\nF2=1500\r\nF3=2500\r\nF4=3500\r\n"
                  "\r\n"
                  "VOLUME=12\r\n"
                  "L1=40\r\nL2=30\r\nL3=20\r\nL4=10\r\n"
                  "R1=4\r\nR2=5\r\nR3=6\r\nR4=7\r\n");

        const auto read = store.readSlot(1);
        REQUIRE(read);
        REQUIRE(read.value.value(FormantField::F2) == 1500.0f);
        REQUIRE(read.value.value(FormantField::L4) == 10.0f);
        REQUIRE(read.value.value(FormantField::R4) == 7.0f);
    }

    SECTION("a missing field makes the slot unavailable") {
        writeText(store.slotPath(2),
                  "F1=500\nF2=1500\nF3=2500\nF4=3500\n"
                  "L1=40\nL2=30\nL3=20\nL4=10\n"
                  "R1=4\nR2=5\nR3=6\n");

        const auto read = store.readSlot(2);
        REQUIRE(read.error == ErrorCode::SlotUnavailable);
        REQUIRE(read.message.find("R4") != std::string::npos);
    }

    SECTION("a malformed value makes the slot unavailable") {
        writeText(store.slotPath(3), "F1=five hundred\n");
        REQUIRE(store.readSlot(3).error == ErrorCode::SlotUnavailable);
    }

    SECTION("no file at all") {
        REQUIRE(store.readSlot(99).error == ErrorCode::SlotUnavailable);
    }
}

TEST_CASE("Unwritable directory is an IoError", "[slot]") {
    TempDirectory dir("voiceshaper_slot_blocked");
    writeText(dir.path / "blocker", "not a directory");

    DirectorySlotStore store(dir.path / "blocker" / "slots");
    REQUIRE(store.writeSlot(1, kVoiced).error == ErrorCode::IoError);
}
