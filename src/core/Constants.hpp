#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief Constants used throughout the codebase
 *
 * Centralizes magic numbers and reserved names.
 */
namespace monosync {

namespace Constants {
    // Id lengths
    constexpr size_t CHANGESET_ID_HEX_LENGTH = 64;  // SHA-256 native changeset / content ids
    constexpr size_t HG_ID_HEX_LENGTH = 40;         // SHA-1 alternate changeset ids
    constexpr size_t SHORT_ID_LENGTH = 12;          // Abbreviated ids in CLI output

    // Blob storage structure
    constexpr size_t OBJECT_DIR_LENGTH = 2;         // First 2 chars of the id form the fan-out directory

    // Blobstore key prefixes ("<kind>.<hex>")
    constexpr const char* KEY_CHANGESET = "changeset";
    constexpr const char* KEY_CONTENT = "content";
    constexpr const char* KEY_GENERATION = "generation";
    constexpr const char* KEY_MANIFEST = "manifest";

    // Changeset extras written by the commit rewriter
    constexpr const char* EXTRA_SYNC_PREFIX = "sync.";
    constexpr const char* EXTRA_SYNC_SOURCE_REPO = "sync.source-repo";
    constexpr const char* EXTRA_SYNC_SOURCE_ID = "sync.source-id";

    // Pushrebase
    constexpr int DEFAULT_PUSHREBASE_RETRIES = 5;

    // Log limits
    constexpr size_t MAX_COMMIT_LOG = 10;

    // On-disk layout
    constexpr const char* STATE_DIR = ".monosync";
    constexpr const char* CONFIG_FILE = "config";
    constexpr const char* MAPPING_FILE = "synced_commit_mapping";
    constexpr const char* GLOBALREV_FILE = "globalrevs";
    constexpr const char* HG_MAPPING_FILE = "hg_mapping";
}
}
