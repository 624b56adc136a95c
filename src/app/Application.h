#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "config/Settings.h"
#include "services/editor/ProfileEditor.h"

namespace jpegicc::app {

constexpr int kExitSuccess = 0;
constexpr int kExitProfileNotFound = 1;
constexpr int kExitFailure = 2;

class Application {
public:
  Application(std::ostream& out, std::ostream& err);

  // `args` excludes the program name.
  int run(const std::vector<std::string>& args);

private:
  void bootstrap();
  int dispatch(const std::string& command,
               const std::vector<std::string>& operands,
               services::editor::ProfileEditor& editor);
  int extract(const std::vector<std::string>& operands,
              services::editor::ProfileEditor& editor);
  int embed(const std::vector<std::string>& operands,
            services::editor::ProfileEditor& editor);
  int strip(const std::vector<std::string>& operands,
            services::editor::ProfileEditor& editor);
  int info(const std::vector<std::string>& operands,
           services::editor::ProfileEditor& editor);
  void printUsage() const;

  std::ostream& out_;
  std::ostream& err_;
  config::Settings settings_;
};

}  // namespace jpegicc::app
