#include <QApplication>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QWidget>

#include <ripple/ripple.hpp>
#include <ripple/adapters/qt.hpp>

#include <chrono>
#include <string>

using namespace ripple;
using namespace std::chrono_literals;

// Two line edits feed a greeting that settles 300ms after the last keystroke,
// and a status line re-samples the greeting once per second.
int main(int argc, char** argv) {
  QApplication app(argc, argv);

  QWidget window;
  window.setWindowTitle("ripple / Qt");

  auto* first    = new QLineEdit;
  auto* last     = new QLineEdit;
  auto* greeting = new QLabel("-");
  auto* status   = new QLabel("idle");

  auto* form = new QFormLayout(&window);
  form->addRow("First name", first);
  form->addRow("Last name", last);
  form->addRow("Greeting", greeting);
  form->addRow("Sampled", status);
  window.resize(320, 140);
  window.show();

  // every timer below runs on the window's event loop
  auto sched = ripple::qt::make_scheduler(&window);

  auto text_of = [](QLineEdit* edit) {
    return ripple::qt::from_signal1(edit, &QLineEdit::textChanged)
      | map([](const QString& s){ return s.trimmed().toStdString(); })
      | start_with(std::string{});
  };

  auto greetings = combine_latest(text_of(first), text_of(last),
      [](const std::string& f, const std::string& l){
        if (f.empty() && l.empty()) return std::string("-");
        return "Hello, " + f + (l.empty() ? "" : " " + l) + "!";
      })
    | distinct_until_changed()
    | debounce(300ms, *sched);

  auto sub_greeting = greetings.subscribe([=](const std::string& g){
    greeting->setText(QString::fromStdString(g));
  });

  int seconds = 0;
  auto sub_status = (greetings | sample(ripple::qt::qt_interval(1s, &window)))
    .subscribe([=, &seconds](const std::string& g){
      ++seconds;
      status->setText(QString("%1s: %2").arg(seconds).arg(QString::fromStdString(g)));
    });

  return app.exec();
}
