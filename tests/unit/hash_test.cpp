#include "internal/util/hash.hpp"

#include <cassert>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using runlens::util::ContentHashFromHex;
using runlens::util::HashBytes;
using runlens::util::HashFile;
using runlens::util::ToHex;

void TestKnownDigest() {
  assert(ToHex(HashBytes("abc")) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(ToHex(HashBytes("")) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

void TestFileDigestMatchesBytes() {
  const auto dir = std::filesystem::temp_directory_path() / "runlens_hash_tests";
  std::filesystem::create_directories(dir);

  // larger than one read chunk
  std::string content(200 * 1024, 'x');
  content += "tail";

  const auto    path = dir / "activity.fit";
  std::ofstream out(path, std::ios::binary);
  out << content;
  out.close();

  assert(HashFile(path.string()) == HashBytes(content));

  bool threw = false;
  try {
    (void)HashFile((dir / "missing.fit").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(dir);
}

void TestHexParsing() {
  auto hash = HashBytes("runlens");
  auto hex  = ToHex(hash);
  assert(hex.size() == 64);

  std::string upper;
  for (char c : hex) upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  assert(ContentHashFromHex(upper) == hash);

  assert(!ContentHashFromHex(hex.substr(1)).has_value());
  assert(!ContentHashFromHex(std::string(64, 'g')).has_value());
}

} // namespace

int main() {
  TestKnownDigest();
  TestFileDigestMatchesBytes();
  TestHexParsing();

  std::cout << "runlens_unit_hash: pass\n";
  return 0;
}
