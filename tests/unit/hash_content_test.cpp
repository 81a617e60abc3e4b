#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/content.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace {

using activity::util::CanonicalJson;
using activity::util::CommitHash;
using activity::util::ContentHash;
using activity::util::ParseContent;
using activity::util::ShallowMerge;

void TestCanonicalJsonSortsKeysAtEveryLevel() {
  auto a = ParseContent(R"({"b":1,"a":{"z":true,"y":[3,"x",null]},"c":"q\"uote"})");
  assert(CanonicalJson(a) == R"({"a":{"y":[3,"x",null],"z":true},"b":1,"c":"q\"uote"})");
}

void TestEqualDocumentsHashEqual() {
  auto a = ParseContent(R"({"title":"Intro","blocks":[{"kind":"text","body":"hi"}]})");
  auto b = ParseContent(R"({"blocks":[{"body":"hi","kind":"text"}],"title":"Intro"})");
  assert(ContentHash(a) == ContentHash(b));

  auto c = ParseContent(R"({"title":"Intro","blocks":[]})");
  assert(ContentHash(a) != ContentHash(c));
  assert(ContentHash(a).size() == 64);
}

void TestKnownDigest() {
  // sha256("abc")
  assert(activity::util::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

void TestCommitHashCoversEveryField() {
  auto content = ParseContent(R"({"body":"x"})");
  const auto base = CommitHash(content, "msg", 7, 1000);

  assert(base == CommitHash(content, "msg", 7, 1000));
  assert(base != CommitHash(content, "msg", 7, 1001));
  assert(base != CommitHash(content, "msg2", 7, 1000));
  assert(base != CommitHash(content, "msg", 8, 1000));
  assert(base != CommitHash(ParseContent(R"({"body":"y"})"), "msg", 7, 1000));
  assert(base != CommitHash(content, "msg", 7, 1000, base));
  assert(CommitHash(content, "msg", 7, 1000, base) == CommitHash(content, "msg", 7, 1000, base));
}

void TestCommitHashFieldsAreDelimited() {
  auto content = ParseContent("{}");
  assert(CommitHash(content, "ab", 1, 23) != CommitHash(content, "a", 1, 23));
  assert(CommitHash(content, "m1", 2, 3) != CommitHash(content, "m", 12, 3));
}

void TestShallowMergeKeepsUntouchedFields() {
  auto base   = ParseContent(R"({"title":"Old","body":{"a":1,"b":2},"tags":["x"]})");
  auto patch  = ParseContent(R"({"title":"New","body":{"a":9}})");
  auto merged = ShallowMerge(base, patch);

  // nested objects are replaced, not merged
  assert(CanonicalJson(merged) == R"({"body":{"a":9},"tags":["x"],"title":"New"})");
}

void TestParseContentRejectsNonObjects() {
  for (const char* bad : {"[1,2]", "42", "not json", "\"text\""}) {
    bool threw = false;
    try {
      (void)ParseContent(bad);
    } catch (const activity::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestCanonicalJsonSortsKeysAtEveryLevel();
  TestEqualDocumentsHashEqual();
  TestKnownDigest();
  TestCommitHashCoversEveryField();
  TestCommitHashFieldsAreDelimited();
  TestShallowMergeKeepsUntouchedFields();
  TestParseContentRejectsNonObjects();

  std::cout << "activity_history_unit_hash_content: pass\n";
  return 0;
}
