#include <cstring>
#include <functional>
#include <iostream>
#include <span>
#include <string>
#include <pthread.h>
#include <config.hpp>
#include <repl.hpp>

using std::string;
using std::cin, std::cout, std::cerr, std::endl;
using namespace crisp;

auto parseOptions(std::span<char*> args) -> Options {
  auto res = Options();
  for (auto i = 1uz; i < args.size(); i++) {
    auto const arg = string(args[i]);
    if (arg == "--config") {
      if (i + 1 == args.size()) throw ConfigError("missing file name after --config");
      res.configPath = args[++i];
    } else {
      res.files.push_back(arg);
    }
  }
  return res;
}

struct Task {
  std::function<int()> f;
  int result = 0;
};

// Evaluation recurses on the native stack, so it runs on a thread whose stack size is configurable.
auto runWithStack(size_t stackSize, std::function<int()> f) -> int {
  auto task = Task{std::move(f)};
  auto attr = pthread_attr_t();
  if (auto const err = pthread_attr_init(&attr); err != 0) {
    cerr << "pthread_attr_init: " << std::strerror(err) << endl;
    return 1;
  }
  if (auto const err = pthread_attr_setstacksize(&attr, stackSize); err != 0) {
    cerr << "Invalid stack size " << stackSize << ": " << std::strerror(err) << endl;
    pthread_attr_destroy(&attr);
    return 1;
  }
  auto thread = pthread_t();
  auto const err = pthread_create(
    &thread,
    &attr,
    [](void* p) -> void* {
      auto& task = *static_cast<Task*>(p);
      task.result = task.f();
      return nullptr;
    },
    &task
  );
  pthread_attr_destroy(&attr);
  if (err != 0) {
    cerr << "pthread_create: " << std::strerror(err) << endl;
    return 1;
  }
  pthread_join(thread, nullptr);
  return task.result;
}

auto main(int argc, char* argv[]) -> int {
  try {
    auto const options = parseOptions(std::span(argv, static_cast<size_t>(argc)));
    auto const config = options.configPath ? Config::fromFile(*options.configPath) : Config();
    return runWithStack(config.stackSize, [&] { return run(options, config, cin, cout, cerr); });
  } catch (ConfigError& ex) {
    cerr << ex.what() << endl;
    return 1;
  }
}
