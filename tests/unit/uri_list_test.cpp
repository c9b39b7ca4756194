#include "internal/clipboard/uri_list.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace tierbridge::clipboard;

void TestEncodeEscapesReservedCharacters() {
  assert(PercentEncodePath("/home/me/My File.txt") == "/home/me/My%20File.txt");
  assert(PercentEncodePath("/a/b-c_d.e~f") == "/a/b-c_d.e~f");
  assert(PercentEncodePath("/x#1%") == "/x%231%25");

  assert(EncodeUriList({"/a b", "/c"}) == "file:///a%20b\r\nfile:///c\r\n");
  assert(EncodeUriList({}).empty());
}

void TestDecodeAcceptsFileUris() {
  const auto paths = DecodeUriList(
      "# copied from a file manager\r\n"
      "file:///home/me/My%20File.txt\r\n"
      "\r\n"
      "file://localhost/tmp/x\r\n"
      "file://otherhost/tmp/y\r\n"
      "https://example.com/z\r\n"
      "/plain/path\n");

  assert(paths.size() == 3);
  assert(paths[0] == "/home/me/My File.txt");
  assert(paths[1] == "/tmp/x");
  assert(paths[2] == "/plain/path");
}

void TestMalformedEscapesAreKept() {
  assert(PercentDecode("/a%2") == "/a%2");
  assert(PercentDecode("/a%zz") == "/a%zz");
  assert(PercentDecode("/a%41") == "/aA");
}

void TestRoundTripUtf8() {
  const std::string path = "/home/me/r\xC3\xA9sum\xC3\xA9 (final).pdf";
  const auto        back = DecodeUriList(EncodeUriList({path}));
  assert(back.size() == 1);
  assert(back[0] == path);
}

} // namespace

int main() {
  TestEncodeEscapesReservedCharacters();
  TestDecodeAcceptsFileUris();
  TestMalformedEscapesAreKept();
  TestRoundTripUtf8();

  std::cout << "tierbridge_unit_uri_list: pass\n";
  return 0;
}
