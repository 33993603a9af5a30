#include "test_support.hh"

namespace {
  std::string digest_of(const std::string& dir, const std::string& name,
                        const std::string& content) {
    std::string path = dir + "/" + name;
    write_file(path, content);
    sha256_digest_provider digester;
    std::string sum;
    assert(digester.digest(path, sum));
    return sum;
  }
}

int main() {
  temp_dir scratch;
  const std::string& dir = scratch.path;
  assert(digest_of(dir, "hello", "hello") == hello_sha256);
  assert(digest_of(dir, "abc", "abc")
         == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(digest_of(dir, "empty", "")
         == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  // spans many read() calls
  assert(digest_of(dir, "million", std::string(1000000, 'a'))
         == "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
  assert(is_valid_digest(digest_of(dir, "binary", std::string("\0\1\2", 3))));

  sha256_digest_provider digester;
  std::string sum = "untouched";
  assert(!digester.digest(dir + "/does-not-exist", sum));
  assert(!digester.digest(dir, sum)); // a directory has no content to hash

  std::cout << "✓ sha256 digests\n";
  return 0;
}
