#include "internal/clipboard/clipboard_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/unit/test_stack.hpp"

namespace {

using namespace tierbridge::vfs::core::v1;
using tierbridge::clipboard::ClipboardManager;
using tierbridge::clipboard::NativeClipboard;
using tierbridge::testing::Put;
using tierbridge::testing::Slurp;
using tierbridge::testing::Stack;

class FakeNativeClipboard final : public NativeClipboard {
 public:
  bool Available() const override {
    return true;
  }

  std::vector<std::string> ReadFiles() override {
    return files;
  }

  void WriteFiles(const std::vector<std::string>& paths) override {
    files = paths;
    ++writes;
  }

  std::vector<std::string> files;
  int                      writes = 0;
};

// A host without a clipboard service; the Null backend behaves the same.
class BrokenNativeClipboard final : public NativeClipboard {
 public:
  bool Available() const override {
    return false;
  }

  std::vector<std::string> ReadFiles() override {
    return {};
  }

  void WriteFiles(const std::vector<std::string>&) override {
    throw tierbridge::util::InvalidState("native clipboard is not available on this host");
  }
};

struct Fixture {
  Fixture() {
    native = std::make_shared<FakeNativeClipboard>();
    tierbridge::runtime::config::ClipboardConfig config;
    config.set_export_dir(s.dir / "exports");
    clipboard = std::make_unique<ClipboardManager>(s.registry, s.files, native, s.host, config);
  }

  Stack                                s;
  std::shared_ptr<FakeNativeClipboard> native;
  std::unique_ptr<ClipboardManager>    clipboard;
};

void TestCopyOverwritesAndDedupsPaths() {
  Fixture f;
  assert(!f.clipboard->Get().has_value());

  f.clipboard->Copy("disk", {"/a.txt", "a.txt", "/b.txt"});
  auto payload = f.clipboard->Get();
  assert(payload.has_value());
  assert(payload->operation() == CLIPBOARD_OPERATION_COPY);
  assert(payload->paths_size() == 2);

  f.clipboard->Cut("bucket", {"/c.txt"});
  payload = f.clipboard->Get();
  assert(payload->operation() == CLIPBOARD_OPERATION_CUT);
  assert(payload->source_id() == "bucket");
  assert(payload->paths_size() == 1);

  f.clipboard->Clear();
  assert(!f.clipboard->HasFiles());

  bool threw = false;
  try {
    f.clipboard->Copy("nowhere", {"/a"});
  } catch (const tierbridge::util::SourceNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestCopyPasteKeepsPayloadAndPicksFreeNames() {
  Fixture f;
  Put(*f.s.disk, "/docs/x.txt", "x");

  f.clipboard->Copy("disk", {"/docs/x.txt"});
  auto result = f.clipboard->Paste("disk", "/docs");
  assert(result.files_pasted() == 1);
  assert(result.pasted_paths(0) == "/docs/x copy.txt");

  // A copy stays on the clipboard for the next paste.
  assert(f.clipboard->HasFiles());
  result = f.clipboard->Paste("disk", "/docs");
  assert(result.pasted_paths(0) == "/docs/x copy 2.txt");
  assert(Slurp(*f.s.disk, "/docs/x copy 2.txt") == "x");
}

void TestCutPasteAcrossSourcesClearsClipboard() {
  Fixture f;
  Put(*f.s.disk, "/clip.mp4", "moving pictures");
  f.s.bucket->Mkdir("/media");

  f.clipboard->Cut("disk", {"/clip.mp4"});
  const auto result = f.clipboard->Paste("bucket", "/media");
  assert(result.files_pasted() == 1);
  assert(result.files_failed() == 0);
  assert(Slurp(*f.s.bucket, "/media/clip.mp4") == "moving pictures");
  assert(!f.s.disk->Exists("/clip.mp4"));
  assert(!f.clipboard->HasFiles());
}

void TestCutKeepsOnlyFailedPaths() {
  Fixture f;
  Put(*f.s.disk, "/folder/inner.txt", "i");
  Put(*f.s.disk, "/loose.txt", "l");

  f.clipboard->Cut("disk", {"/folder", "/loose.txt", "/gone.txt"});
  const auto result = f.clipboard->Paste("disk", "/folder");
  assert(result.files_pasted() == 1);
  assert(result.files_failed() == 2);
  assert(result.errors(0) == "/folder: cannot paste a folder into itself");
  assert(f.s.disk->Exists("/folder/loose.txt"));

  const auto left = f.clipboard->Get();
  assert(left.has_value());
  assert(left->operation() == CLIPBOARD_OPERATION_CUT);
  assert(left->paths_size() == 2);
  assert(left->paths(0) == "/folder");
  assert(left->paths(1) == "/gone.txt");
}

void TestPasteEmptyClipboard() {
  Fixture f;
  bool    threw = false;
  try {
    f.clipboard->Paste("disk", "/");
  } catch (const tierbridge::util::ClipboardEmpty&) {
    threw = true;
  }
  assert(threw);
}

void TestHostClipboardFallback() {
  Fixture f;
  Put(*f.s.host, f.s.dir / "host/photo.jpg", "jpeg");
  f.native->files = {f.s.dir / "host/photo.jpg", f.s.dir / "host/vanished.jpg"};

  // Only host files that still exist are offered.
  const auto payload = f.clipboard->Get();
  assert(payload.has_value());
  assert(payload->source_id() == tierbridge::source::kNativeSourceId);
  assert(payload->paths_size() == 1);
  assert(!f.clipboard->HasFiles());

  const auto result = f.clipboard->Paste("bucket", "/");
  assert(result.files_pasted() == 1);
  assert(Slurp(*f.s.bucket, "/photo.jpg") == "jpeg");

  // The host file is untouched and still on the host clipboard.
  assert(f.s.host->Exists(f.s.dir / "host/photo.jpg"));
  assert(f.clipboard->ReadNative().size() == 1);
}

void TestCopyForNativeExportsRemoteFiles() {
  Fixture f;
  Put(*f.s.bucket, "/remote.txt", "far away");
  Put(*f.s.disk, "/near.txt", "close by");

  auto out = f.clipboard->CopyForNative("bucket", {"/remote.txt", "/missing.txt"});
  assert(out.exported_paths.size() == 1);
  assert(out.exported_paths[0] == f.clipboard->ExportRoot() + "/remote.txt");
  assert(out.errors.size() == 1);
  assert(Slurp(*f.s.host, out.exported_paths[0]) == "far away");
  assert(f.native->files == out.exported_paths);

  // Local sources hand out the host path itself.
  out = f.clipboard->CopyForNative("disk", {"/near.txt"});
  assert(out.exported_paths.size() == 1);
  assert(out.exported_paths[0] == f.s.dir / "disk/near.txt");
  assert(out.errors.empty());
}

void TestCopyForNativeReportsUnavailableClipboard() {
  Stack s;
  tierbridge::runtime::config::ClipboardConfig config;
  config.set_export_dir(s.dir / "exports");
  ClipboardManager clipboard(s.registry, s.files, std::make_shared<BrokenNativeClipboard>(), s.host, config);
  Put(*s.bucket, "/remote.txt", "far away");

  const auto out = clipboard.CopyForNative("bucket", {"/remote.txt"});
  assert(out.exported_paths.size() == 1);
  // The export itself is kept.
  assert(Slurp(*s.host, out.exported_paths[0]) == "far away");
  assert(out.errors.size() == 1);
  assert(out.errors[0].find("system clipboard: native clipboard is not available") == 0);
  assert(out.status.find("system clipboard is unavailable") != std::string::npos);
}

void TestPasteNativeIntoVfs() {
  Fixture f;
  Put(*f.s.host, f.s.dir / "host/a.txt", "a");
  Put(*f.s.host, f.s.dir / "host/b.txt", "b");

  bool threw = false;
  try {
    f.clipboard->PasteNativeIntoVfs({}, "bucket", "/");
  } catch (const tierbridge::util::ClipboardEmpty&) {
    threw = true;
  }
  assert(threw);

  f.native->files = {f.s.dir / "host/a.txt"};
  auto result     = f.clipboard->PasteNativeIntoVfs({}, "bucket", "/");
  assert(result.files_pasted() == 1);
  assert(Slurp(*f.s.bucket, "/a.txt") == "a");

  result = f.clipboard->PasteNativeIntoVfs({f.s.dir / "host/b.txt"}, "disk", "/");
  assert(result.files_pasted() == 1);
  assert(Slurp(*f.s.disk, "/b.txt") == "b");
}

void TestPasteToNativeUpdatesHostClipboard() {
  Fixture f;
  Put(*f.s.bucket, "/song.flac", "audio");
  Put(*f.s.host, f.s.dir / "desktop/.keep", "");

  f.clipboard->Copy("bucket", {"/song.flac"});
  const auto result = f.clipboard->PasteToNative(f.s.dir / "desktop");
  assert(result.files_pasted() == 1);
  assert(Slurp(*f.s.host, f.s.dir / "desktop/song.flac") == "audio");
  assert(f.native->files.size() == 1);
  assert(f.native->files[0] == f.s.dir / "desktop/song.flac");
}

} // namespace

int main() {
  TestCopyOverwritesAndDedupsPaths();
  TestCopyPasteKeepsPayloadAndPicksFreeNames();
  TestCutPasteAcrossSourcesClearsClipboard();
  TestCutKeepsOnlyFailedPaths();
  TestPasteEmptyClipboard();
  TestHostClipboardFallback();
  TestCopyForNativeExportsRemoteFiles();
  TestCopyForNativeReportsUnavailableClipboard();
  TestPasteNativeIntoVfs();
  TestPasteToNativeUpdatesHostClipboard();

  std::cout << "tierbridge_unit_clipboard_manager: pass\n";
  return 0;
}
