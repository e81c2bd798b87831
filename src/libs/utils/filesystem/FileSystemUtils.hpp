// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <functional>

namespace Utils::FileSystemUtils {

enum class ReadFailure : unsigned char {
    None,
    NotFound,
    NotAFile,
    Open,
    TooLarge,
    Read
};

enum class WriteFailure : unsigned char {
    None,
    Directory,
    Open,
    Write,
    Interrupted,
    Commit
};

using ReadResult = BasicResult<ReadFailure>;
using WriteResult = BasicResult<WriteFailure>;

// Consulted after the temporary file is fully written and before it replaces the
// target. Returning false abandons the write, leaving the target untouched.
using CommitGate = std::function<bool(const QString& targetPath)>;

// Called before each write attempt, numbered from 1.
using AttemptObserver = std::function<void(const QString& targetPath, int attempt)>;

struct AtomicWriteOptions final {
    bool createParentDirs = true;
    int maxAttempts = 2;
    int retryDelayMs = 25;
    CommitGate commitGate;
    AttemptObserver onAttempt;
};

UTILS_EXPORT ReadResult readFileBytes(const QString& path, QByteArray& outBytes, quint64 maxBytes = 0);

UTILS_EXPORT WriteResult ensureParentDirectory(const QString& path);

// Writes to a temporary file beside `path` and renames it over the target, so the
// target is always either the old or the new content. Open and commit failures are
// retried up to options.maxAttempts times in total.
UTILS_EXPORT WriteResult writeFileAtomically(const QString& path,
                                             const QByteArray& bytes,
                                             const AtomicWriteOptions& options = AtomicWriteOptions{});

} // namespace Utils::FileSystemUtils
