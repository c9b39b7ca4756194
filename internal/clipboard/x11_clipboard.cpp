#include "x11_clipboard.hpp"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include "internal/clipboard/uri_list.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tierbridge::clipboard {

using observability::IntField;
using observability::StringField;

namespace {

const char* ReadCommand(X11Clipboard::Tool tool) {
  return tool == X11Clipboard::Tool::Xsel ? "xsel --clipboard --output 2>/dev/null"
                                          : "xclip -selection clipboard -o -t text/uri-list 2>/dev/null";
}

const char* WriteCommand(X11Clipboard::Tool tool) {
  return tool == X11Clipboard::Tool::Xsel ? "xsel --clipboard --input 2>/dev/null"
                                          : "xclip -selection clipboard -i -t text/uri-list 2>/dev/null";
}

const char* ToolName(X11Clipboard::Tool tool) {
  return tool == X11Clipboard::Tool::Xsel ? "xsel" : "xclip";
}

int ExitCode(int raw) {
  if (raw != -1 && WIFEXITED(raw)) return WEXITSTATUS(raw);
  return -1;
}

// Exit code of the command, with stdout collected into output.
int RunRead(const char* command, std::string* output) {
  FILE* pipe = popen(command, "r");
  if (!pipe) return -1;

  std::array<char, 4096> buf{};
  size_t                 n = 0;
  while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
    output->append(buf.data(), n);
  }
  return ExitCode(pclose(pipe));
}

int RunWrite(const char* command, const std::string& input) {
  FILE* pipe = popen(command, "w");
  if (!pipe) return -1;

  const size_t written = std::fwrite(input.data(), 1, input.size(), pipe);
  const int    code    = ExitCode(pclose(pipe));
  return written == input.size() ? code : -1;
}

} // namespace

// ---------------------------------------------------------------------------
// NullNativeClipboard
// ---------------------------------------------------------------------------

bool NullNativeClipboard::Available() const {
  return false;
}

std::vector<std::string> NullNativeClipboard::ReadFiles() {
  return {};
}

void NullNativeClipboard::WriteFiles(const std::vector<std::string>&) {
  throw util::InvalidState("native clipboard is not available on this host");
}

std::shared_ptr<NativeClipboard> MakeNativeClipboard(tierbridge::runtime::config::NativeClipboardBackend backend) {
  switch (backend) {
    case tierbridge::runtime::config::NATIVE_CLIPBOARD_BACKEND_NONE:
      return std::make_shared<NullNativeClipboard>();
    case tierbridge::runtime::config::NATIVE_CLIPBOARD_BACKEND_XCLIP:
      return std::make_shared<X11Clipboard>(X11Clipboard::Tool::Xclip);
    case tierbridge::runtime::config::NATIVE_CLIPBOARD_BACKEND_XSEL:
      return std::make_shared<X11Clipboard>(X11Clipboard::Tool::Xsel);
    default:
      return std::make_shared<X11Clipboard>(X11Clipboard::Tool::Auto);
  }
}

// ---------------------------------------------------------------------------
// X11Clipboard
// ---------------------------------------------------------------------------

X11Clipboard::X11Clipboard(Tool tool) : tool_(tool) {
}

bool X11Clipboard::Available() const {
  const char* display = std::getenv("DISPLAY");
  return display != nullptr && *display != '\0';
}

std::vector<X11Clipboard::Tool> X11Clipboard::Candidates() const {
  if (tool_ == Tool::Auto) return {Tool::Xclip, Tool::Xsel};
  return {tool_};
}

std::vector<std::string> X11Clipboard::ReadFiles() {
  if (!Available()) return {};

  for (auto tool : Candidates()) {
    std::string output;
    const int   code = RunRead(ReadCommand(tool), &output);
    if (code == 0) {
      return DecodeUriList(output);
    }
    TIERBRIDGE_LOG_DEBUG("native clipboard read failed", {StringField("tool", ToolName(tool)), IntField("exit_code", code)});
  }
  return {};
}

void X11Clipboard::WriteFiles(const std::vector<std::string>& paths) {
  if (!Available()) {
    throw util::InvalidState("native clipboard needs an X11 display (DISPLAY is not set)");
  }
  if (paths.empty()) return;

  const auto payload = EncodeUriList(paths);
  for (auto tool : Candidates()) {
    const int code = RunWrite(WriteCommand(tool), payload);
    if (code == 0) {
      TIERBRIDGE_LOG_INFO("native clipboard written", {StringField("tool", ToolName(tool)), IntField("paths", static_cast<int64_t>(paths.size()))});
      return;
    }
    TIERBRIDGE_LOG_WARN("native clipboard write failed", {StringField("tool", ToolName(tool)), IntField("exit_code", code)});
  }
  throw std::runtime_error("failed to write the native clipboard (install xclip or xsel)");
}

} // namespace tierbridge::clipboard
