#ifndef CSUMATTR_TEST_SUPPORTHH
#define CSUMATTR_TEST_SUPPORTHH

#include "csumattr.hh"

#include <cassert>
#include <cstdlib>
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <ftw.h>
#include <unistd.h>

/* attribute store kept in memory, keyed by path */
class fake_attribute_store : public attribute_store {
public:
  std::map<std::string, std::string> values;
  bool fail_reads = false, fail_writes = false;
  int writes = 0, removes = 0;
  status get(const std::string& path, std::string& value) override {
    if(fail_reads) return status::failed;
    auto it = values.find(path);
    if(it == values.end()) return status::absent;
    value = it->second;
    return status::present;
  }
  bool set(const std::string& path, const std::string& value,
           bool create_only) override {
    ++writes;
    if(fail_writes) return false;
    if(create_only && values.count(path)) return false;
    values[path] = value;
    return true;
  }
  bool remove(const std::string& path) override {
    ++removes;
    values.erase(path);
    return true;
  }
};

/* digests handed out from a table; unknown paths are unreadable */
class fake_digest_provider : public digest_provider {
public:
  std::map<std::string, std::string> digests;
  int calls = 0;
  bool digest(const std::string& path, std::string& out) override {
    ++calls;
    auto it = digests.find(path);
    if(it == digests.end()) return false;
    out = it->second;
    return true;
  }
};

/* run_context writing into string streams */
struct captured_context {
  std::ostringstream out, err;
  run_context ctx;
  explicit captured_context(bool verbose = false, bool dry_run = false)
    : ctx{out, err, verbose, dry_run} {}
};

/* a scratch directory, removed with everything in it on destruction */
class temp_dir {
  static int remove_entry(const char* path, const struct stat*, int,
                          struct FTW*) {
    if(remove(path)) perror(path);
    return 0;
  }
public:
  std::string path;
  temp_dir() {
    const char* tmp = getenv("TMPDIR");
    path = std::string(tmp && *tmp ? tmp : "/tmp") + "/csumattr-test-XXXXXX";
    char* made = mkdtemp(&path[0]);
    assert(made != nullptr);
    (void)made;
  }
  ~temp_dir() {
    // depth first, without following links out of the tree
    if(nftw(path.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS))
      perror(path.c_str());
  }
  temp_dir(const temp_dir&) = delete;
  temp_dir& operator=(const temp_dir&) = delete;
};

inline void write_file(const std::string& path, const std::string& content) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file << content;
  assert(file.good());
}

inline bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

const std::string hello_sha256 =
  "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";

#endif
