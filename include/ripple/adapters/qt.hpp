#pragma once

#include <QObject>
#include <QCoreApplication>
#include <QThread>
#include <QTimer>
#include <QPointer>
#include <QMetaObject>

#include <chrono>
#include <functional>
#include <memory>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include <ripple/core/log.hpp>
#include <ripple/core/observable.hpp>
#include <ripple/core/pipeline.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/core/timer_queue.hpp>
#include <ripple/core/timeout_scheduler.hpp>
#include <ripple/ops/map.hpp>

namespace ripple {
namespace qt {

// ====================================================================================
// 1) qt_timer_queue - timer_queue on the Qt event loop (one single-shot QTimer per call)
// ====================================================================================
class qt_timer_queue final : public timer_queue {
public:
  explicit qt_timer_queue(QObject* context = QCoreApplication::instance())
  : context_(context ? context : QCoreApplication::instance()) {}

  ~qt_timer_queue() override {
    for (auto& [h, t] : timers_) {
      if (t) { t->stop(); t->deleteLater(); }
    }
  }

  qt_timer_queue(const qt_timer_queue&) = delete;
  qt_timer_queue& operator=(const qt_timer_queue&) = delete;

  handle call_delayed(duration delay, std::function<void()> action) override {
    const handle h = next_++;
    auto* timer = new QTimer(context_.data());
    timer->setSingleShot(true);
    timers_.emplace(h, QPointer<QTimer>(timer));

    QObject::connect(timer, &QTimer::timeout, timer, [this, h, timer, action = std::move(action)]{
      timers_.erase(h);
      timer->deleteLater();
      action();
    });

    if (timer->thread() != QThread::currentThread()) {
      QMetaObject::invokeMethod(timer, "start", Qt::QueuedConnection,
                                Q_ARG(int, static_cast<int>(delay.count())));
    } else {
      timer->start(static_cast<int>(delay.count()));
    }
    log(log_level::trace, "qt timer #{} armed for {}ms", h, delay.count());
    return h;
  }

  void cancel(handle h) override {
    auto it = timers_.find(h);
    if (it == timers_.end()) return;
    QPointer<QTimer> t = it->second;
    timers_.erase(it);
    if (t) { t->stop(); t->deleteLater(); }
  }

  QObject* context() const { return context_.data(); }

private:
  QPointer<QObject> context_;
  std::unordered_map<handle, QPointer<QTimer>> timers_;
  handle next_{1};
};

// timeout_scheduler whose timers run on `context`'s event loop.
inline std::unique_ptr<timeout_scheduler>
make_scheduler(QObject* context = QCoreApplication::instance(),
               duration default_delay = duration::zero())
{
  return std::make_unique<timeout_scheduler>(std::make_shared<qt_timer_queue>(context), default_delay);
}

// ====================================================================================
// 2) QTimer-based sources: qt_interval
// ====================================================================================
template <class Rep, class Period>
inline observable<int> qt_interval(std::chrono::duration<Rep, Period> period,
                                   QObject* target = QCoreApplication::instance())
{
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(period).count();

  return observable<int>::create([ms, target](observer<int> o) {
    QPointer<QObject> guard(target ? target : QCoreApplication::instance());

    auto timer = std::make_shared<QTimer>();
    timer->setInterval(static_cast<int>(ms));
    timer->setSingleShot(false);

    auto tick = std::make_shared<int>(0);

    auto unsub = [timer]{
      if (timer && timer->isActive()) timer->stop();
      if (timer && timer->thread() != QThread::currentThread()) {
        QMetaObject::invokeMethod(timer.get(), "stop", Qt::QueuedConnection);
      }
    };

    QObject::connect(timer.get(), &QTimer::timeout, timer.get(), [o, tick]{
      o.on_next((*tick)++);
    });

    if (guard) {
      QObject::connect(guard, &QObject::destroyed, timer.get(), [o, unsub]{
        unsub();
        o.on_completed();
      });
    }

    if (guard && guard->thread() && guard->thread() != QThread::currentThread()) {
      timer->moveToThread(guard->thread());
      QMetaObject::invokeMethod(timer.get(), "start", Qt::QueuedConnection);
    } else {
      timer->start();
    }

    return subscription(unsub);
  });
}

// ====================================================================================
// 3) from_signal / from_signal1 - Qt signal -> observable
// ====================================================================================
template <typename Sender, typename... Args>
inline observable<std::tuple<std::decay_t<Args>...>>
from_signal(Sender* sender, void (Sender::*signal)(Args...)) {
  using Tup = std::tuple<std::decay_t<Args>...>;
  return observable<Tup>::create([sender, signal](observer<Tup> o) {
    QPointer<Sender> guard(sender);
    if (!guard) {
      o.on_completed();
      return subscription{};
    }

    auto connection = std::make_shared<QMetaObject::Connection>();
    *connection = QObject::connect(
      guard,
      signal,
      guard,
      [guard, o](Args... args){
        if (!guard) return;
        o.on_next(Tup(std::forward<Args>(args)...));
      },
      Qt::QueuedConnection
    );

    // the sender going away completes the stream
    auto destroyed = std::make_shared<QMetaObject::Connection>(
      QObject::connect(guard, &QObject::destroyed, [o]{ o.on_completed(); }));

    return subscription([connection, destroyed]{
      if (*connection) QObject::disconnect(*connection);
      if (*destroyed) QObject::disconnect(*destroyed);
    });
  });
}

// Signal with one argument -> observable<T>
template <typename Sender, typename T>
inline observable<std::decay_t<T>>
from_signal1(Sender* sender, void (Sender::*signal)(T)) {
  using U = std::decay_t<T>;
  return from_signal(sender, signal) | map([](const std::tuple<U>& tup) -> U {
    return std::get<0>(tup);
  });
}

} // namespace qt
} // namespace ripple
