#pragma once

/// @file notescribe.h
/// @brief Main header for notescribe - Audio to notation transcription library.
/// @details Include this file to access all notescribe functionality.

// Version information
#define NOTESCRIBE_VERSION_MAJOR 1
#define NOTESCRIBE_VERSION_MINOR 0
#define NOTESCRIBE_VERSION_PATCH 0
#define NOTESCRIBE_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/json_writer.h"
#include "util/math_utils.h"
#include "util/types.h"

// Core
#include "core/convert.h"
#include "core/downmix.h"
#include "core/sample_buffer.h"
#include "core/segmenter.h"
#include "core/window.h"

// Features
#include "feature/pitch.h"

// Analysis
#include "analysis/chord_analyzer.h"
#include "analysis/chord_templates.h"
#include "analysis/key_analyzer.h"
#include "analysis/key_profiles.h"
#include "analysis/note_consolidator.h"
#include "analysis/note_mapper.h"
#include "analysis/sheet_music.h"
#include "analysis/tempo_estimator.h"
#include "analysis/transcriber.h"
#include "analysis/transcription_json.h"

namespace notescribe {

/// @brief Returns the library version string.
/// @return Version string (e.g., "1.0.0")
inline const char* version() { return NOTESCRIBE_VERSION_STRING; }

/// @brief Returns the major version number.
inline int version_major() { return NOTESCRIBE_VERSION_MAJOR; }

/// @brief Returns the minor version number.
inline int version_minor() { return NOTESCRIBE_VERSION_MINOR; }

/// @brief Returns the patch version number.
inline int version_patch() { return NOTESCRIBE_VERSION_PATCH; }

}  // namespace notescribe
