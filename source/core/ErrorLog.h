#pragma once

// ============================================================================
// ErrorLog - Diagnostic log for failed engine operations
// ============================================================================
// Each failure is appended as a plain-text block to tekastory-errors.log:
//
//   -----------------------------------------
//   Timestamp: 2026-01-18T10:42:07.113Z
//   Context: Failed to export PDF
//   Error: Failed at Panel Page 2 step: ...
//   Stack: <root cause or "No stack available">
//   -----------------------------------------
//
// Writing the log never throws and never terminates the process; if the file
// cannot be written the block is sent to qWarning() instead.
// ============================================================================

#include <QDateTime>
#include <QMutex>
#include <QString>

class ErrorLog {
public:
    static constexpr const char* FileName = "tekastory-errors.log";

    /**
     * @param logDir Directory receiving the log file (created on first write).
     *               Empty means "log to qWarning() only".
     */
    explicit ErrorLog(const QString& logDir = QString());

    void setLogDir(const QString& logDir);
    QString logDir() const;

    /// Full path of the log file, or empty when no directory is configured.
    QString logFilePath() const;

    /**
     * @brief Append one failure block.
     * @param context What the user was doing, e.g. "Failed to save project"
     * @param message Error message shown to the user
     * @param rootCause Underlying cause (library message, file error); may be empty
     * @return true if the block reached the log file.
     */
    bool record(const QString& context, const QString& message,
                const QString& rootCause = QString());

    /**
     * @brief Format a block without writing it.
     */
    static QString formatEntry(const QDateTime& timestampUtc, const QString& context,
                               const QString& message, const QString& rootCause);

    /**
     * @brief Plain-language notice for the user after a failure.
     */
    QString userNotice(const QString& context, const QString& message) const;

private:
    mutable QMutex m_mutex;
    QString m_logDir;
};
