// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/UtilsGlobal.hpp"

#include <QtCore/QMetaObject>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QThreadPool>
#include <QtCore/Qt>

#include <type_traits>
#include <utility>

namespace Utils::Async {

// Runs `work` on `pool` and delivers its return value to `done` on the thread that
// owns `context`, through that thread's event queue. If `context` is destroyed
// before delivery, `done` is never called. `work` must report failure through its
// return value rather than by throwing.
template <typename Result, typename Work, typename Done>
void run(QObject* context, Work&& work, Done&& done, QThreadPool* pool = QThreadPool::globalInstance())
{
    using WorkFn = std::decay_t<Work>;
    using DoneFn = std::decay_t<Done>;

    if (!context || !pool)
        return;

    QPointer<QObject> guard(context);
    pool->start([guard, work = WorkFn(std::forward<Work>(work)), done = DoneFn(std::forward<Done>(done))]() mutable {
        if constexpr (std::is_void_v<Result>) {
            work();
            if (!guard)
                return;
            QMetaObject::invokeMethod(guard.data(), [guard, done]() mutable {
                if (guard)
                    done();
            }, Qt::QueuedConnection);
        } else {
            Result result = work();
            if (!guard)
                return;
            QMetaObject::invokeMethod(guard.data(), [guard, done, result = std::move(result)]() mutable {
                if (guard)
                    done(std::move(result));
            }, Qt::QueuedConnection);
        }
    });
}

} // namespace Utils::Async
