/*!
 * @file        retrypolicy.cppm
 * @brief       Exponential backoff and retryable-error classification.
 * @details     The retry policy answers two questions for the dispatcher:
 *              whether a failed transfer may be attempted again, and how long
 *              to wait before it becomes eligible. The delay follows
 *              baseDelay * 2^(attempt - 1), capped, with optional random
 *              jitter so that many tasks failing together do not retry in
 *              lock-step.
 *
 *              Classification is a replaceable function object; the default
 *              treats network, timeout and server errors as transient.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/ersal/blob/main/LICENSE.md
 */

module;
#include <QRandomGenerator>
#include <QtGlobal>

#include <functional>

#ifndef Q_MOC_RUN
export module ersal.core.retrypolicy;
export import ersal.core.uploadtask;
#endif

#ifdef Q_MOC_RUN
#define ERSAL_MODULE_EXPORT
#else
#define ERSAL_MODULE_EXPORT export
#endif

/**
 * @brief Backoff schedule plus retryable-error classifier.
 */
ERSAL_MODULE_EXPORT class RetryPolicy {
public:
    //!< @brief Decides whether an error is transient.
    using Classifier = std::function<bool(const TransferError&)>;

    //!< @brief Construct with defaults (3 retries, 1000 ms base, no jitter).
    RetryPolicy();

    /**
     * @brief Construct a policy.
     * @param maxRetries Maximum retry attempts per task.
     * @param baseDelayMs Delay before the first retry.
     * @param maxDelayMs Upper bound for any single delay (0 = uncapped).
     * @param jitterRatio Fraction of the delay added as random jitter.
     */
    RetryPolicy(int maxRetries, qint64 baseDelayMs, qint64 maxDelayMs = 0, double jitterRatio = 0.0);

    //!< @brief Return the retry limit.
    int maxRetries() const { return m_maxRetries; }

    //!< @brief Return the base delay in ms.
    qint64 baseDelayMs() const { return m_baseDelayMs; }

    //!< @brief Return the delay cap in ms.
    qint64 maxDelayMs() const { return m_maxDelayMs; }

    //!< @brief Return the jitter ratio.
    double jitterRatio() const { return m_jitterRatio; }

    /**
     * @brief Replace the retryable-error classifier.
     * @param classifier New classifier; an empty function restores the default.
     */
    void setClassifier(Classifier classifier);

    /**
     * @brief Check whether an error is transient.
     * @param error Transfer error.
     * @return True if the error may be retried.
     */
    bool isRetryable(const TransferError& error) const;

    /**
     * @brief Check whether a task with @p retryCount retries may retry again.
     * @param error Error of the failed attempt.
     * @param retryCount Retries already performed.
     * @return True when retryable and under the limit.
     */
    bool shouldRetry(const TransferError& error, int retryCount) const;

    /**
     * @brief Deterministic backoff delay.
     * @param attempt Retry attempt, starting at 1.
     * @return baseDelay * 2^(attempt - 1), capped at maxDelayMs.
     */
    qint64 delayForAttempt(int attempt) const;

    /**
     * @brief Backoff delay with random jitter added.
     * @param attempt Retry attempt, starting at 1.
     * @param generator Random source, the global generator when null.
     * @return Delay in ms within [delay, delay * (1 + jitterRatio)].
     */
    qint64 jitteredDelay(int attempt, QRandomGenerator* generator = nullptr) const;

    /**
     * @brief Default classifier.
     * @param error Transfer error.
     * @return True for Network, Timeout and Server errors.
     */
    static bool isTransientError(const TransferError& error);

private:
    int m_maxRetries = 3;           //!< Retry limit.
    qint64 m_baseDelayMs = 1000;    //!< First retry delay.
    qint64 m_maxDelayMs = 0;        //!< Delay cap, 0 = uncapped.
    double m_jitterRatio = 0.0;     //!< Jitter fraction.
    Classifier m_classifier;        //!< Retryable-error classifier.
};
