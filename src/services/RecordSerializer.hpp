/**
 * @file RecordSerializer.hpp
 * @brief JSON rendering of sealed wipe records
 */

#pragma once

#include "models/WipeTypes.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <string>

/**
 * @class RecordSerializer
 * @brief Writes a WipeRecord in the record_version 1 JSON layout
 */
class RecordSerializer {
public:
    static constexpr int RECORD_VERSION = 1;

    /**
     * @brief Pretty-printed JSON document for @p record
     *
     * Bytes of a path or detail that are not valid UTF-8 are written as U+FFFD.
     */
    [[nodiscard]] static auto to_json(const WipeRecord& record) -> std::string;

    /**
     * @brief Write the JSON form of @p record to @p path atomically
     * @return IO_ERROR if the temporary file cannot be written or renamed
     */
    [[nodiscard]] static auto write_file(const WipeRecord& record,
                                         const std::filesystem::path& path)
        -> std::expected<void, util::Error>;
};
