#include <iostream>
#include <memory>

#include "cornell/engine/engine.hh"
#include "cornell/box/settings.hh"
#include "cornell/box/activity.hh"

int main(int argc, const char *argv[]) {
  auto settings = cornell::Settings::parseCliArgs(argc, argv);
  if (settings.help_text.has_value()) {
    std::cout << settings.help_text.value() << std::endl;
    return 0;
  }

  cornell::Engine engine{settings.window_size, "cornell"};
  engine.run([settings] (cornell::Engine &engine) -> std::unique_ptr<cornell::Activity> {
    return std::make_unique<cornell::CornellActivity>(engine, settings);
  });
  return 0;
}
