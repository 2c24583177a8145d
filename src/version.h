#pragma once

// ==============================================================================
// Version Information
// ==============================================================================
// Keep in sync with CMakeLists.txt project version.
// ==============================================================================

#define VOICESHAPER_MAJOR_VERSION_STR "0"
#define VOICESHAPER_MAJOR_VERSION_INT 0

#define VOICESHAPER_SUB_VERSION_STR "3"
#define VOICESHAPER_SUB_VERSION_INT 3

#define VOICESHAPER_RELEASE_NUMBER_STR "0"
#define VOICESHAPER_RELEASE_NUMBER_INT 0

#define VOICESHAPER_VERSION_STR VOICESHAPER_MAJOR_VERSION_STR "." VOICESHAPER_SUB_VERSION_STR "." VOICESHAPER_RELEASE_NUMBER_STR

#define VOICESHAPER_PROGRAM_NAME "voiceshaper"
#define VOICESHAPER_DESCRIPTION "D-Lev formant pad mapper and voice fingerprinter"
