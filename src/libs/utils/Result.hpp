// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QString>
#include <QStringList>

#include <utility>

namespace Utils {

// Value-type outcome of a fallible operation. The kind of the first error is kept,
// later messages are appended so callers can show everything that went wrong.
template <typename ErrorKind>
struct BasicResult {
	bool ok = true;
	ErrorKind kind{};
	QStringList errors;

	static BasicResult success() { return BasicResult{}; }

	static BasicResult failure(ErrorKind k, const QString& msg)
	{
		BasicResult r;
		r.ok = false;
		r.kind = k;
		r.errors.push_back(msg);
		return r;
	}

	static BasicResult failure(ErrorKind k, QStringList msgs)
	{
		BasicResult r;
		r.ok = false;
		r.kind = k;
		r.errors = std::move(msgs);
		return r;
	}

	void addError(ErrorKind k, const QString& msg)
	{
		if (ok)
			kind = k;
		ok = false;
		errors.push_back(msg);
	}

	void merge(const BasicResult& other)
	{
		if (other.ok)
			return;
		if (ok)
			kind = other.kind;
		ok = false;
		errors.append(other.errors);
	}

	QString message() const { return errors.join(QStringLiteral("; ")); }

	explicit operator bool() const { return ok; }
};

} // namespace Utils
