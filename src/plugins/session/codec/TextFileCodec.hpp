// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "session/SessionGlobal.hpp"
#include "session/api/SessionTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringView>

namespace Session::TextCodec {

enum class CodecError : unsigned char {
    None,
    Binary,
    Undecodable,
    UnsupportedEncoding,
    Unencodable
};

using CodecResult = Utils::BasicResult<CodecError>;

struct DecodedText final {
    QString text;
    Api::TextEncoding encoding;
    Api::LineEnding lineEnding = Api::LineEnding::Lf;
};

// Byte-order mark first, then strict UTF-8, then `fallbackEncoding`.
// Content with NUL bytes and no UTF-16/32 byte-order mark is rejected as binary.
SESSION_EXPORT CodecResult decode(const QByteArray& bytes, const QString& fallbackEncoding, DecodedText& out);

SESSION_EXPORT CodecResult encode(const QString& text, const Api::TextEncoding& encoding, QByteArray& out);

SESSION_EXPORT Api::LineEnding detectLineEnding(QStringView text);

} // namespace Session::TextCodec
