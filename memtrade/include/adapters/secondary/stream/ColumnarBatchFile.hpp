#pragma once

#include "ColumnarCodec.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace memtrade::adapters::secondary {

/**
 * @brief Пакетный файл выгрузки в формате MessagePack
 *
 * Структура документа:
 * ```
 * { "schema": "ticker", "version": 1, "rows": N, "created_at_ms": ...,
 *   "columns": { "symbol": [...], "timestamp": [...], ... } }
 * ```
 * Файл пишется во временный *.tmp и переименовывается, поэтому читатели
 * никогда не видят недописанный файл.
 */
class ColumnarBatchFile {
public:
    static constexpr const char* EXTENSION = ".msgpack";

    /**
     * @throws std::runtime_error / std::filesystem::filesystem_error при ошибке записи
     */
    template <typename Observation>
    static void write(const std::filesystem::path& path,
                      const std::vector<Observation>& rows,
                      int64_t createdAtMs)
    {
        using Codec = ColumnarCodec<Observation>;

        nlohmann::json document{
            {"schema", Codec::SCHEMA},
            {"version", Codec::VERSION},
            {"rows", rows.size()},
            {"created_at_ms", createdAtMs},
            {"columns", Codec::encode(rows)}
        };

        std::vector<std::uint8_t> bytes = nlohmann::json::to_msgpack(document);

        std::filesystem::create_directories(path.parent_path());
        std::filesystem::path tmp = path;
        tmp += ".tmp";

        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw std::runtime_error("Cannot open batch file for writing: " + tmp.string());
            }
            out.write(reinterpret_cast<const char*>(bytes.data()),
                      static_cast<std::streamsize>(bytes.size()));
            if (!out.good()) {
                throw std::runtime_error("Failed to write batch file: " + tmp.string());
            }
        }

        std::filesystem::rename(tmp, path);
    }

    /**
     * @brief Прочитать файл выгрузки (офлайн-анализ, тесты)
     * @throws std::runtime_error если файл не читается или схема не совпадает
     */
    template <typename Observation>
    static std::vector<Observation> read(const std::filesystem::path& path) {
        using Codec = ColumnarCodec<Observation>;

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            throw std::runtime_error("Cannot open batch file: " + path.string());
        }
        std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                        std::istreambuf_iterator<char>());

        nlohmann::json document;
        try {
            document = nlohmann::json::from_msgpack(bytes);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Corrupt batch file " + path.string() + ": " + e.what());
        }

        if (document.value("schema", "") != Codec::SCHEMA) {
            throw std::runtime_error("Batch file " + path.string() + " has schema '" +
                                     document.value("schema", "") + "', expected '" + Codec::SCHEMA + "'");
        }

        size_t rowCount = document.at("rows").get<size_t>();
        return Codec::decode(document.at("columns"), rowCount);
    }
};

} // namespace memtrade::adapters::secondary
