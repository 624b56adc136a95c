#include "Application.h"

#include <ostream>
#include <stdexcept>

#include "codec/CodecError.h"
#include "diagnostics/ScanEventLogger.h"
#include "profile/ProfileInspector.h"

namespace jpegicc::app {

namespace {

void requireOperands(const std::vector<std::string>& operands,
                     std::size_t count,
                     const std::string& command) {
  if (operands.size() != count) {
    throw std::invalid_argument(command + " expects " + std::to_string(count) +
                                " arguments");
  }
}

}  // namespace

Application::Application(std::ostream& out, std::ostream& err)
    : out_(out), err_(err) {}

void Application::bootstrap() {
  settings_.loadDefaults();
  settings_.loadFromEnvironment();
}

void Application::printUsage() const {
  err_ << "usage: jpegicc <command> [options]\n"
       << "  extract <image.jpg> <profile.icc>\n"
       << "  embed <profile.icc> <image.jpg>\n"
       << "  strip <input.jpg> <output.jpg>\n"
       << "  info <image.jpg>\n"
       << "options: --force --verbose --segment-limit <n> --intent <0-3|name>\n";
}

int Application::run(const std::vector<std::string>& args) {
  try {
    bootstrap();
    const auto positional = settings_.loadFromArguments(args);
    if (positional.empty()) {
      printUsage();
      return kExitFailure;
    }

    diagnostics::ScanEventLogger logger(out_, err_, settings_.verbose());
    services::editor::ProfileEditor editor(settings_.segmentLimit());
    editor.setEventSink(logger.sink());

    const std::vector<std::string> operands(positional.begin() + 1,
                                            positional.end());
    const auto code = dispatch(positional.front(), operands, editor);
    if (settings_.verbose()) {
      logger.renderSummary();
    }
    return code;
  } catch (const codec::CodecError& error) {
    err_ << "[jpegicc] " << codec::errorKindName(error.kind()) << ": "
         << error.what() << std::endl;
  } catch (const std::invalid_argument& error) {
    err_ << "[jpegicc] " << error.what() << std::endl;
    printUsage();
  } catch (const std::exception& error) {
    err_ << "[jpegicc] " << error.what() << std::endl;
  }
  return kExitFailure;
}

int Application::dispatch(const std::string& command,
                          const std::vector<std::string>& operands,
                          services::editor::ProfileEditor& editor) {
  if (command == "extract") {
    return extract(operands, editor);
  }
  if (command == "embed") {
    return embed(operands, editor);
  }
  if (command == "strip") {
    return strip(operands, editor);
  }
  if (command == "info") {
    return info(operands, editor);
  }
  throw std::invalid_argument("Unknown command " + command);
}

int Application::extract(const std::vector<std::string>& operands,
                         services::editor::ProfileEditor& editor) {
  requireOperands(operands, 2, "extract");
  if (!editor.loadFromJpeg(operands[0])) {
    err_ << "[jpegicc] no ICC profile found in " << operands[0] << std::endl;
    return kExitProfileNotFound;
  }
  editor.saveToIcc(operands[1], settings_.forceOverwrite());
  out_ << "[jpegicc] extracted " << editor.profile().size() << " bytes to "
       << operands[1] << std::endl;
  return kExitSuccess;
}

int Application::embed(const std::vector<std::string>& operands,
                       services::editor::ProfileEditor& editor) {
  requireOperands(operands, 2, "embed");
  editor.loadFromIcc(operands[0]);
  if (const auto& intent = settings_.renderingIntent()) {
    editor.setRenderingIntent(*intent);
  }
  editor.saveToJpeg(operands[1]);
  out_ << "[jpegicc] embedded " << editor.profile().size() << " bytes in "
       << editor.profile().chunkCount() << " segment(s) into " << operands[1]
       << std::endl;
  return kExitSuccess;
}

int Application::strip(const std::vector<std::string>& operands,
                       services::editor::ProfileEditor& editor) {
  requireOperands(operands, 2, "strip");
  editor.removeFromJpeg(operands[0], operands[1], settings_.forceOverwrite());
  out_ << "[jpegicc] wrote " << operands[1] << std::endl;
  return kExitSuccess;
}

int Application::info(const std::vector<std::string>& operands,
                      services::editor::ProfileEditor& editor) {
  requireOperands(operands, 1, "info");
  if (!editor.loadFromJpeg(operands[0])) {
    out_ << "[jpegicc] " << operands[0] << ": no ICC profile" << std::endl;
    return kExitProfileNotFound;
  }
  const profile::ProfileInspector inspector;
  const auto summary = inspector.summarize(editor.profile());
  out_ << "[jpegicc] " << operands[0] << ": " << summary.size << " bytes, "
       << summary.chunk_count << " segment(s), intent=";
  if (summary.rendering_intent) {
    out_ << profile::renderingIntentName(*summary.rendering_intent);
  } else {
    out_ << "unavailable";
  }
  out_ << ", description=\"" << summary.description << "\"" << std::endl;
  return kExitSuccess;
}

}  // namespace jpegicc::app
