#include "internal/util/content_hash.hpp"
#include "internal/util/uuid.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

namespace {

using storykb::util::ContentHash;
using storykb::util::IsCanonicalUUID;
using storykb::util::IsContentHash;
using storykb::util::NewId;

void TestKnownDigests() {
  assert(ContentHash("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(ContentHash("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

void TestHashIsStableAndContentSensitive() {
  const std::string text = "Sarah is a 28-year-old software engineer";
  assert(ContentHash(text) == ContentHash(std::string(text)));
  assert(ContentHash(text) != ContentHash(text + " "));
  assert(IsContentHash(ContentHash(text)));
}

void TestMultiByteContentHashesBytes() {
  // U+00E9 precomposed vs e + combining acute: different bytes, different hash
  assert(ContentHash("caf\xC3\xA9") != ContentHash("cafe\xCC\x81"));
}

void TestIsContentHashRejectsMalformed() {
  assert(!IsContentHash(""));
  assert(!IsContentHash("abc"));
  assert(!IsContentHash(std::string(64, 'g')));
  assert(!IsContentHash("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
}

void TestGeneratedIdsAreCanonicalAndDistinct() {
  std::set<std::string> seen;
  for (int i = 0; i < 256; ++i) {
    const auto id = NewId();
    assert(IsCanonicalUUID(id));
    assert(seen.insert(id).second);
  }
  assert(!IsCanonicalUUID("sarah"));
  assert(!IsCanonicalUUID("123e4567-e89b-12d3-a456-42661417400"));
}

} // namespace

int main() {
  TestKnownDigests();
  TestHashIsStableAndContentSensitive();
  TestMultiByteContentHashesBytes();
  TestIsContentHashRejectsMalformed();
  TestGeneratedIdsAreCanonicalAndDistinct();

  std::cout << "storykb_unit_content_hash: pass\n";
  return 0;
}
