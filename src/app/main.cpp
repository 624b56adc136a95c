#include <iostream>
#include <string>
#include <vector>

#include "app/Application.h"

int main(int argc, char** argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  jpegicc::app::Application application(std::cout, std::cerr);
  return application.run(args);
}
