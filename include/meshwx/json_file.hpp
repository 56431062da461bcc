/**
 * @file json_file.hpp
 * @brief Whole-file JSON read and crash-safe JSON write.
 *
 * Writes go to `<path>.tmp` and are renamed over `<path>`, so a reader sees
 * either the previous document or the new one, never half of one.
 */
#ifndef MESHWX_JSON_FILE_HPP
#define MESHWX_JSON_FILE_HPP

#include <string>

#include <nlohmann/json.hpp>

namespace meshwx {

/**
 * @brief Read and parse a JSON document.
 * @return false if the file does not exist (@p out untouched).
 * @throws PersistenceError if the file exists but cannot be read or parsed.
 */
bool read_json_file(const std::string& path, nlohmann::json& out);

/**
 * @brief Write @p doc to @p path via a temporary file and rename.
 * Parent directories are created as needed.
 * @throws PersistenceError on any filesystem failure.
 */
void atomic_write_json(const std::string& path, const nlohmann::json& doc, int indent = 2);

} // namespace meshwx

#endif // MESHWX_JSON_FILE_HPP
