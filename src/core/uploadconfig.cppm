/*!
 * @file        uploadconfig.cppm
 * @brief       Upload manager configuration values and loaders.
 * @details     Holds every tunable recognized by the upload core together with
 *              its default. Values can be read from an option map (the same
 *              QVariantMap style used for per-call options) or from a JSON
 *              file, and are always normalized into a valid range before use.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ersal/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QVariantMap>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module ersal.core.uploadconfig;
export import ersal.core.retrypolicy;
#endif

#ifdef Q_MOC_RUN
#define ERSAL_MODULE_EXPORT
#else
#define ERSAL_MODULE_EXPORT export
#endif

/**
 * @brief Runtime configuration of the upload manager.
 *
 * Recognized option keys match the member names.
 */
ERSAL_MODULE_EXPORT struct UploadConfig {
    int maxConcurrent = 3;                      //!< Concurrency ceiling.
    int maxRetries = 3;                         //!< Retry limit per task.
    qint64 retryBaseDelayMs = 1000;             //!< First retry delay.
    qint64 retryMaxDelayMs = 300000;            //!< Cap for a single retry delay.
    double retryJitterRatio = 0.25;             //!< Random jitter fraction added to delays.
    qint64 chunkSizeBytes = 1024 * 1024;        //!< Chunk size for chunked transfers.
    int chunkThresholdMultiplier = 5;           //!< Chunk when size > chunkSize * multiplier.
    int completedRetentionMs = 5000;            //!< Delay before a completed task is removed.

    //!< @brief Payload size above which transfers are chunked.
    qint64 chunkThreshold() const;

    //!< @brief Return a copy with every value clamped into its valid range.
    UploadConfig normalized() const;

    //!< @brief Build the retry policy described by this configuration.
    RetryPolicy retryPolicy() const;

    //!< @brief Serialize to an option map.
    QVariantMap toVariantMap() const;

    /**
     * @brief Build a configuration from an option map.
     *
     * Missing or malformed keys keep their defaults (taken from @p base).
     *
     * @param options Option map.
     * @param base Configuration supplying values for absent keys.
     * @return Normalized configuration.
     */
    static UploadConfig fromVariantMap(const QVariantMap& options, const UploadConfig& base = UploadConfig());

    /**
     * @brief Load a configuration from a JSON object file.
     * @param path JSON file path.
     * @param ok Receives true on success (optional).
     * @param errorString Receives a reason on failure (optional).
     * @param base Configuration supplying values for absent keys.
     * @return Loaded configuration, or @p base on failure.
     */
    static UploadConfig fromJsonFile(const QString& path, bool* ok = nullptr, QString* errorString = nullptr,
                                     const UploadConfig& base = UploadConfig());
};
