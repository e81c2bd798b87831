// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/FileSystemUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QSaveFile>
#include <QtCore/QThread>

#include <algorithm>

Q_LOGGING_CATEGORY(utilslog, "qalam.utils")

namespace Utils::FileSystemUtils {

namespace {

bool isTransient(WriteFailure failure)
{
    return failure == WriteFailure::Open || failure == WriteFailure::Commit;
}

WriteResult writeOnce(const QString& path, const QByteArray& bytes, const CommitGate& gate)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return WriteResult::failure(WriteFailure::Open,
                                    QStringLiteral("Failed to open file for writing: %1 (%2)")
                                        .arg(path, file.errorString()));
    }

    const qint64 written = file.write(bytes);
    if (written != bytes.size()) {
        file.cancelWriting();
        return WriteResult::failure(WriteFailure::Write,
                                    QStringLiteral("Failed to write file: %1 (%2)").arg(path, file.errorString()));
    }

    if (gate && !gate(path)) {
        file.cancelWriting();
        return WriteResult::failure(WriteFailure::Interrupted,
                                    QStringLiteral("Write interrupted before replacing: %1").arg(path));
    }

    if (!file.commit()) {
        return WriteResult::failure(WriteFailure::Commit,
                                    QStringLiteral("Failed to commit file write: %1 (%2)")
                                        .arg(path, file.errorString()));
    }

    return WriteResult::success();
}

} // namespace

ReadResult readFileBytes(const QString& path, QByteArray& outBytes, quint64 maxBytes)
{
    outBytes.clear();

    const QFileInfo info(path);
    if (!info.exists())
        return ReadResult::failure(ReadFailure::NotFound, QStringLiteral("File does not exist: %1").arg(path));
    if (!info.isFile())
        return ReadResult::failure(ReadFailure::NotAFile, QStringLiteral("Not a regular file: %1").arg(path));

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return ReadResult::failure(ReadFailure::Open,
                                   QStringLiteral("Failed to open file: %1 (%2)").arg(path, file.errorString()));
    }

    if (maxBytes > 0) {
        const qint64 size = file.size();
        if (size >= 0 && static_cast<quint64>(size) > maxBytes) {
            return ReadResult::failure(
                ReadFailure::TooLarge,
                QStringLiteral("File exceeds supported size (%1 bytes): %2").arg(maxBytes).arg(path));
        }
    }

    outBytes = maxBytes > 0 ? file.read(static_cast<qint64>(maxBytes) + 1) : file.readAll();
    if (file.error() != QFileDevice::NoError) {
        outBytes.clear();
        return ReadResult::failure(ReadFailure::Read,
                                   QStringLiteral("Failed to read file: %1 (%2)").arg(path, file.errorString()));
    }

    if (maxBytes > 0 && static_cast<quint64>(outBytes.size()) > maxBytes) {
        outBytes.clear();
        return ReadResult::failure(
            ReadFailure::TooLarge,
            QStringLiteral("File exceeds supported size (%1 bytes): %2").arg(maxBytes).arg(path));
    }

    return ReadResult::success();
}

WriteResult ensureParentDirectory(const QString& path)
{
    const QFileInfo fi(path);
    const QString parent = fi.absolutePath();
    QDir dir(parent);
    if (dir.exists())
        return WriteResult::success();

    if (!dir.mkpath(QStringLiteral("."))) {
        return WriteResult::failure(WriteFailure::Directory,
                                    QStringLiteral("Failed to create directory: %1").arg(parent));
    }
    return WriteResult::success();
}

WriteResult writeFileAtomically(const QString& path, const QByteArray& bytes, const AtomicWriteOptions& options)
{
    if (path.isEmpty())
        return WriteResult::failure(WriteFailure::Open, QStringLiteral("Cannot write: file path is empty."));

    if (options.createParentDirs) {
        const WriteResult dirResult = ensureParentDirectory(path);
        if (!dirResult)
            return dirResult;
    }

    const int attempts = std::max(1, options.maxAttempts);
    WriteResult result;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (options.onAttempt)
            options.onAttempt(path, attempt);

        result = writeOnce(path, bytes, options.commitGate);
        if (result || !isTransient(result.kind))
            return result;

        if (attempt < attempts) {
            qCWarning(utilslog).noquote() << QStringLiteral("Retrying write of '%1' after: %2")
                                                 .arg(path, result.message());
            QThread::msleep(static_cast<unsigned long>(std::max(0, options.retryDelayMs)));
        }
    }

    return result;
}

} // namespace Utils::FileSystemUtils
