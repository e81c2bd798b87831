// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "session/codec/TextFileCodec.hpp"

#include <QtCore/QStringConverter>
#include <QtCore/QStringDecoder>
#include <QtCore/QStringEncoder>

#include <optional>

namespace Session::TextCodec {

namespace {

struct ByteOrderMark final {
    const char* bytes;
    qsizetype size;
    QStringConverter::Encoding encoding;
};

// UTF-32LE must be tested before UTF-16LE, they share a prefix.
constexpr ByteOrderMark kByteOrderMarks[] = {
    {"\xEF\xBB\xBF", 3, QStringConverter::Utf8},
    {"\xFF\xFE\x00\x00", 4, QStringConverter::Utf32LE},
    {"\x00\x00\xFE\xFF", 4, QStringConverter::Utf32BE},
    {"\xFF\xFE", 2, QStringConverter::Utf16LE},
    {"\xFE\xFF", 2, QStringConverter::Utf16BE},
};

std::optional<QStringConverter::Encoding> byteOrderMarkEncoding(const QByteArray& bytes)
{
    for (const ByteOrderMark& bom : kByteOrderMarks) {
        if (bytes.startsWith(QByteArray::fromRawData(bom.bytes, bom.size)))
            return bom.encoding;
    }
    return std::nullopt;
}

QString encodingName(QStringConverter::Encoding encoding)
{
    return QString::fromLatin1(QStringConverter::nameForEncoding(encoding));
}

} // namespace

CodecResult decode(const QByteArray& bytes, const QString& fallbackEncoding, DecodedText& out)
{
    out = {};

    if (const auto bomEncoding = byteOrderMarkEncoding(bytes)) {
        QStringDecoder decoder(*bomEncoding);
        QString text = decoder.decode(bytes);
        if (decoder.hasError()) {
            return CodecResult::failure(CodecError::Undecodable,
                                        QStringLiteral("Invalid %1 sequence after byte-order mark.")
                                            .arg(encodingName(*bomEncoding)));
        }

        out.text = std::move(text);
        out.encoding.name = encodingName(*bomEncoding);
        out.encoding.byteOrderMark = true;
        out.lineEnding = detectLineEnding(out.text);
        return CodecResult::success();
    }

    if (bytes.contains('\0'))
        return CodecResult::failure(CodecError::Binary, QStringLiteral("Content appears to be binary."));

    QStringDecoder utf8(QStringConverter::Utf8);
    QString text = utf8.decode(bytes);
    if (!utf8.hasError()) {
        out.text = std::move(text);
        out.encoding.name = encodingName(QStringConverter::Utf8);
        out.lineEnding = detectLineEnding(out.text);
        return CodecResult::success();
    }

    const QString fallback = fallbackEncoding.trimmed();
    if (fallback.isEmpty()) {
        return CodecResult::failure(CodecError::Undecodable,
                                    QStringLiteral("Content is not valid UTF-8 and no fallback encoding is set."));
    }

    const QByteArray fallbackName = fallback.toLatin1();
    QStringDecoder fallbackDecoder(fallbackName.constData());
    if (!fallbackDecoder.isValid()) {
        return CodecResult::failure(CodecError::UnsupportedEncoding,
                                    QStringLiteral("Unsupported fallback encoding: %1").arg(fallback));
    }

    text = fallbackDecoder.decode(bytes);
    if (fallbackDecoder.hasError()) {
        return CodecResult::failure(CodecError::Undecodable,
                                    QStringLiteral("Content is neither valid UTF-8 nor valid %1.").arg(fallback));
    }

    out.text = std::move(text);
    out.encoding.name = fallback;
    out.lineEnding = detectLineEnding(out.text);
    return CodecResult::success();
}

CodecResult encode(const QString& text, const Api::TextEncoding& encoding, QByteArray& out)
{
    out.clear();

    const QByteArray name = encoding.name.trimmed().toLatin1();
    const QStringConverter::Flags flags = encoding.byteOrderMark ? QStringConverter::Flag::WriteBom
                                                                 : QStringConverter::Flag::Default;
    QStringEncoder encoder(name.constData(), flags);
    if (!encoder.isValid()) {
        return CodecResult::failure(CodecError::UnsupportedEncoding,
                                    QStringLiteral("Unsupported encoding: %1").arg(encoding.name));
    }

    QByteArray bytes = encoder.encode(text);
    if (encoder.hasError()) {
        return CodecResult::failure(CodecError::Unencodable,
                                    QStringLiteral("Text contains characters that cannot be encoded as %1.")
                                        .arg(encoding.name));
    }

    out = std::move(bytes);
    return CodecResult::success();
}

Api::LineEnding detectLineEnding(QStringView text)
{
    if (text.contains(u"\r\n"))
        return Api::LineEnding::CrLf;
    if (text.contains(u'\r'))
        return Api::LineEnding::Cr;
    return Api::LineEnding::Lf;
}

} // namespace Session::TextCodec
