/*!
 * @file        upload_utils.cppm
 * @brief       Common utility helpers for upload payloads, chunks, and sizes.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across upload core components. These utilities handle common
 *              tasks such as path normalization, content type detection,
 *              chunk arithmetic, payload slice reads, and task id generation.
 *
 *              All helpers are designed to be side-effect free (apart from
 *              reading files) and safe for use in both core upload logic and
 *              front-end code.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ersal/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module ersal.utils.upload_utils;
#endif

#ifdef Q_MOC_RUN
#define ERSAL_MODULE_EXPORT
#else
#define ERSAL_MODULE_EXPORT export
#endif

ERSAL_MODULE_EXPORT namespace ersal::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and ensures a consistent representation
 * suitable for filesystem operations.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Checks whether a normalized path exists and refers to a regular file.
 *
 * @param path Normalized filesystem path.
 * @return true if the path exists and is a file, false otherwise.
 */
bool fileExistsPath(const QString& path);

/**
 * @brief Detects the MIME content type for a file name.
 *
 * Uses the shared MIME database, matching by name first and by content when
 * the file exists on disk.
 *
 * @param fileName File name or path.
 * @return MIME type name, "application/octet-stream" when unknown.
 */
QString contentTypeForFile(const QString& fileName);

/**
 * @brief Number of chunks needed to carry a payload.
 *
 * Computes ceil(size / chunkSize). A non-positive size yields zero chunks.
 *
 * @param size Payload size in bytes.
 * @param chunkSize Chunk size in bytes (must be positive).
 * @return Chunk count.
 */
qint64 chunkCount(qint64 size, qint64 chunkSize);

/**
 * @brief Reads a byte range from a file.
 *
 * @param filePath Source file path.
 * @param offset Start offset in bytes.
 * @param length Number of bytes to read.
 * @param out Receives the bytes read.
 * @param errorString Receives a reason on failure (optional).
 * @return true if exactly @p length bytes were read.
 */
bool readFileSlice(const QString& filePath, qint64 offset, qint64 length, QByteArray* out, QString* errorString = nullptr);

/**
 * @brief Converts a part/total pair into a percentage.
 *
 * @param part Completed amount.
 * @param total Total amount.
 * @return Percentage in [0, 100]; 0 when total is unknown.
 */
double percentOf(qint64 part, qint64 total);

/**
 * @brief Generates a new unique task identifier.
 * @return Identifier of the form "upload-<uuid>".
 */
QString generateTaskId();

/**
 * @brief Formats a byte count for display (B, KiB, MiB, GiB).
 * @param bytes Byte count.
 * @return Human-readable size.
 */
QString formatBytes(qint64 bytes);

} // namespace ersal::utils
